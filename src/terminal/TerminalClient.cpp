#include "TerminalClient.hpp"

namespace tt {
TerminalClient::TerminalClient(shared_ptr<Console> _console,
                               shared_ptr<EventQueue> _eventQueue,
                               shared_ptr<ReconnectionEngine> _engine)
    : console(_console),
      eventQueue(_eventQueue),
      engine(_engine),
      shuttingDown(false),
      exitCode(0) {
  EngineListener listener;
  listener.onData = [this](const string& data) { console->write(data); };
  listener.onExit = [this](int code) { exitCode = code; };
  listener.onError = [this](const string& message) {
    errorMessage = message;
  };
  listener.onSessionReady = [](const string& sessionId) {
    LOG(INFO) << "Attached to " << sessionId;
  };
  engine->setListener(listener);
}

TerminalClient::~TerminalClient() {}

int TerminalClient::run() {
  console->setup();

#define BUF_SIZE (16 * 1024)
  char b[BUF_SIZE];

  TerminalSize initialSize = console->getTerminalSize();
  engine->sendResize(initialSize.cols(), initialSize.rows());
  engine->connect();

  while (!isShuttingDown()) {
    eventQueue->runReady();
    EngineState state = engine->getState();
    if (state == EngineState::EXITED || state == EngineState::FAILED) {
      break;
    }

    fd_set rfd;
    timeval tv;
    FD_ZERO(&rfd);
    int consoleFd = console->getInputFd();
    FD_SET(consoleFd, &rfd);
    int maxfd = consoleFd;
    int transportFd = engine->getFd();
    if (transportFd >= 0) {
      FD_SET(transportFd, &rfd);
      maxfd = max(maxfd, transportFd);
    }
    int64_t waitMs = eventQueue->msUntilNextTimer();
    if (waitMs < 0 || waitMs > 10) {
      waitMs = 10;
    }
    tv.tv_sec = 0;
    tv.tv_usec = waitMs * 1000;
    int numFdsSet = select(maxfd + 1, &rfd, NULL, NULL, &tv);
    if (numFdsSet < 0) {
      if (errno == EINTR) {
        continue;
      }
      FATAL_FAIL(numFdsSet);
    }

    if (FD_ISSET(consoleFd, &rfd)) {
      int rc = ::read(consoleFd, b, BUF_SIZE);
      FATAL_FAIL(rc);
      if (rc == 0) {
        LOG(INFO) << "Console closed";
        break;
      }
      engine->sendInput(string(b, rc));
    }
    if (transportFd >= 0 && FD_ISSET(transportFd, &rfd)) {
      engine->poll();
    }

    TerminalSize size = console->getTerminalSize();
    engine->sendResize(size.cols(), size.rows());
  }
  eventQueue->runReady();

  console->teardown();
  EngineState state = engine->getState();
  if (state == EngineState::FAILED) {
    CLOG(INFO, "stdout") << endl << errorMessage << endl;
    return 1;
  }
  if (state == EngineState::EXITED) {
    CLOG(INFO, "stdout") << endl
                         << "Session exited with code " << exitCode << endl;
    return exitCode;
  }
  engine->disconnect();
  return 0;
}
}  // namespace tt
