#include "TerminalSession.hpp"

#define BUF_SIZE (16 * 1024)

namespace tt {
TerminalSession::TerminalSession(const SessionConfig& _config,
                                 shared_ptr<TerminalProcess> _process)
    : config(_config),
      process(_process),
      spawned(false),
      closed(false),
      halt(false) {}

TerminalSession::~TerminalSession() {
  // The pump holds a reference to the session, so this only runs on the
  // pump thread itself or after the pump has returned.
  lock_guard<mutex> guard(threadMutex);
  if (pumpThread && pumpThread->joinable()) {
    if (pumpThread->get_id() == this_thread::get_id()) {
      pumpThread->detach();
    } else {
      pumpThread->join();
    }
  }
}

bool TerminalSession::isSpawned() {
  lock_guard<recursive_mutex> guard(sessionMutex);
  return spawned;
}

bool TerminalSession::ensureSpawned(const string& shell,
                                    function<void(int)> onExit) {
  lock_guard<recursive_mutex> guard(sessionMutex);
  if (spawned) {
    return true;
  }
  if (closed) {
    VLOG(1) << "Not spawning " << config.id << ": already shut down";
    return false;
  }
  SpawnOptions options;
  options.shell = shell;
  options.workingDirectory = config.workingDirectory;
  options.startupCommand = config.startupCommand;
  options.cols = config.cols;
  options.rows = config.rows;
  process->spawn(options);
  spawned = true;

  auto self = shared_from_this();
  lock_guard<mutex> threadGuard(threadMutex);
  pumpThread.reset(new thread([self, onExit]() { self->pump(onExit); }));
  return true;
}

bool TerminalSession::attachConnection(shared_ptr<TerminalConnection> conn) {
  lock_guard<recursive_mutex> guard(sessionMutex);
  if (closed && !exitCode) {
    VLOG(1) << "Not attaching to " << config.id << ": destroyed";
    return false;
  }
  if (connection) {
    // Only shuts the socket down; the pump may still be selecting on it
    LOG(INFO) << "Session " << config.id
              << " replacing its attached connection";
    connection->close();
    connection.reset();
  }
  try {
    conn->accept();
    if (!outputBuffer.empty()) {
      conn->writeData(outputBuffer.contents());
    }
    if (exitCode) {
      // The process ended while this attach was in flight
      conn->writeControl(ControlFrame::exit(*exitCode));
      conn->close();
      return true;
    }
  } catch (const std::runtime_error& re) {
    conn->close();
    throw;
  }
  connection = conn;
  return true;
}

bool TerminalSession::hasConnection() {
  lock_guard<recursive_mutex> guard(sessionMutex);
  return connection.get() != nullptr;
}

void TerminalSession::resize(int cols, int rows) {
  lock_guard<recursive_mutex> guard(sessionMutex);
  config.cols = cols;
  config.rows = rows;
  if (spawned) {
    process->resize(cols, rows);
  }
}

void TerminalSession::pump(function<void(int)> onExit) {
  el::Helpers::setThreadName(config.id);
  char buf[BUF_SIZE];
  int processFd = process->getFd();

  while (!halt) {
    shared_ptr<TerminalConnection> conn;
    {
      lock_guard<recursive_mutex> guard(sessionMutex);
      conn = connection;
    }
    int connFd = conn ? conn->getSocketFd() : -1;

    fd_set rfd;
    FD_ZERO(&rfd);
    FD_SET(processFd, &rfd);
    int maxfd = processFd;
    if (connFd >= 0) {
      FD_SET(connFd, &rfd);
      maxfd = max(maxfd, connFd);
    }
    timeval tv;
    tv.tv_sec = 0;
    tv.tv_usec = 10000;
    int rc = select(maxfd + 1, &rfd, NULL, NULL, &tv);
    if (rc < 0) {
      if (errno == EINTR || errno == EBADF) {
        continue;
      }
      FATAL_FAIL(rc);
    }
    if (halt) {
      break;
    }

    if (FD_ISSET(processFd, &rfd) && !drainProcess(buf, BUF_SIZE)) {
      int processExitCode = process->waitForExit();
      LOG(INFO) << "Session " << config.id << " process exited with code "
                << processExitCode;
      onExit(processExitCode);
      releasePumpThread();
      return;
    }
    if (connFd >= 0 && FD_ISSET(connFd, &rfd)) {
      drainConnection(conn);
    }
  }
}

bool TerminalSession::drainProcess(char* buf, size_t bufSize) {
  ssize_t rc = ::read(process->getFd(), buf, bufSize);
  if (rc < 0) {
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
      return true;
    }
    // EIO from a pty master means the child side is gone
    VLOG(1) << "Process read ended for " << config.id << ": " << strerror(errno);
    return false;
  }
  if (rc == 0) {
    return false;
  }
  string data(buf, rc);
  lock_guard<recursive_mutex> guard(sessionMutex);
  outputBuffer.append(data);
  if (connection) {
    try {
      connection->writeData(data);
    } catch (const std::runtime_error& re) {
      LOG(INFO) << "Dropping connection for " << config.id << ": " << re.what();
      detachConnection(connection);
    }
  }
  return true;
}

void TerminalSession::drainConnection(shared_ptr<TerminalConnection> conn) {
  vector<Packet> packets;
  try {
    conn->readPackets(&packets);
  } catch (const std::runtime_error& re) {
    LOG(INFO) << "Connection for " << config.id << " went away: " << re.what();
    detachConnection(conn);
  }
  for (const auto& packet : packets) {
    handlePacket(conn, packet);
  }
}

void TerminalSession::handlePacket(shared_ptr<TerminalConnection> conn,
                                   const Packet& packet) {
  try {
    switch (packet.getHeader()) {
      case TerminalPacketType::TERMINAL_DATA:
        process->write(packet.getPayload());
        break;
      case TerminalPacketType::CONTROL: {
        auto frame = ControlFrame::parse(packet.getPayload());
        if (!frame) {
          LOG(WARNING) << "Ignoring malformed control frame on " << config.id;
          break;
        }
        if (frame->type == ControlType::RESIZE) {
          resize(frame->cols, frame->rows);
        } else if (frame->type == ControlType::PING) {
          conn->writeControl(ControlFrame::pong());
        } else {
          VLOG(1) << "Ignoring " << controlTypeName(frame->type)
                  << " frame from client";
        }
        break;
      }
      default:
        LOG(WARNING) << "Unknown packet type " << int(packet.getHeader())
                     << " on " << config.id;
    }
  } catch (const std::runtime_error& re) {
    LOG(INFO) << "Connection for " << config.id << " went away: " << re.what();
    detachConnection(conn);
  }
}

void TerminalSession::detachConnection(shared_ptr<TerminalConnection> conn) {
  lock_guard<recursive_mutex> guard(sessionMutex);
  conn->close();
  if (connection == conn) {
    connection.reset();
  }
}

void TerminalSession::finishWithExit(int _exitCode) {
  {
    lock_guard<recursive_mutex> guard(sessionMutex);
    closed = true;
    exitCode = _exitCode;
    if (connection) {
      try {
        connection->writeControl(ControlFrame::exit(_exitCode));
      } catch (const std::runtime_error& re) {
        VLOG(1) << "Could not deliver exit frame for " << config.id << ": "
                << re.what();
      }
      connection->close();
      connection.reset();
    }
  }
  process->terminate();
}

void TerminalSession::shutdown() {
  {
    // Orders this against ensureSpawned(): either the pump thread exists
    // and is joined below, or it is never started.
    lock_guard<recursive_mutex> guard(sessionMutex);
    closed = true;
  }
  halt = true;
  shared_ptr<thread> t;
  {
    lock_guard<mutex> guard(threadMutex);
    t = pumpThread;
    pumpThread.reset();
  }
  if (t && t->joinable()) {
    if (t->get_id() == this_thread::get_id()) {
      t->detach();
    } else {
      t->join();
    }
  }
  {
    lock_guard<recursive_mutex> guard(sessionMutex);
    if (connection) {
      connection->close();
      connection.reset();
    }
  }
  process->terminate();
}

void TerminalSession::releasePumpThread() {
  shared_ptr<thread> t;
  {
    lock_guard<mutex> guard(threadMutex);
    t = pumpThread;
    pumpThread.reset();
  }
  if (t && t->joinable()) {
    t->detach();
  }
}

string TerminalSession::getBufferContents() {
  lock_guard<recursive_mutex> guard(sessionMutex);
  return outputBuffer.contents();
}

SessionInfo TerminalSession::getInfo() {
  lock_guard<recursive_mutex> guard(sessionMutex);
  SessionInfo info;
  info.set_id(config.id);
  info.set_worktreeid(config.worktreeId);
  info.set_scope(config.scope);
  info.set_workingdirectory(config.workingDirectory);
  info.set_startupcommand(config.startupCommand);
  info.mutable_size()->set_cols(config.cols);
  info.mutable_size()->set_rows(config.rows);
  info.set_spawned(spawned);
  info.set_attached(connection.get() != nullptr);
  info.set_buffered(outputBuffer.size());
  return info;
}
}  // namespace tt
