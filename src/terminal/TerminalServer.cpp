#include "TerminalServer.hpp"

#include "AgentCommand.hpp"

namespace tt {
TerminalServer::TerminalServer(shared_ptr<SocketHandler> _socketHandler,
                               const SocketEndpoint& _serverEndpoint,
                               shared_ptr<SessionRegistry> _registry,
                               shared_ptr<TokenAuthority> _tokenAuthority,
                               const string& _projectId)
    : socketHandler(_socketHandler),
      serverEndpoint(_serverEndpoint),
      registry(_registry),
      tokenAuthority(_tokenAuthority),
      projectId(_projectId),
      clientHandlerThreadPool(new ThreadPool(8)),
      halt(false) {
  socketHandler->listen(serverEndpoint);
}

TerminalServer::~TerminalServer() { shutdown(); }

void TerminalServer::run() {
  LOG(INFO) << "Accepting attach connections on " << serverEndpoint;
  set<int> serverPortFds = socketHandler->getEndpointFds(serverEndpoint);
  fd_set coreFds;
  FD_ZERO(&coreFds);
  int maxCoreFd = 0;
  for (int i : serverPortFds) {
    FD_SET(i, &coreFds);
    maxCoreFd = max(maxCoreFd, i);
  }

  while (true) {
    {
      lock_guard<mutex> guard(haltMutex);
      if (halt) {
        break;
      }
    }
    fd_set rfds = coreFds;
    timeval tv;
    tv.tv_sec = 0;
    tv.tv_usec = 10000;
    int numFdsSet = select(maxCoreFd + 1, &rfds, NULL, NULL, &tv);
    if (numFdsSet < 0 && errno == EINTR) {
      continue;
    }
    if (numFdsSet < 0) {
      // shutdown() closes the listening sockets under us
      lock_guard<mutex> guard(haltMutex);
      if (halt) {
        break;
      }
    }
    FATAL_FAIL(numFdsSet);
    if (numFdsSet == 0) {
      continue;
    }
    for (int i : serverPortFds) {
      if (FD_ISSET(i, &rfds)) {
        acceptNewConnection(i);
      }
    }
  }
}

void TerminalServer::shutdown() {
  {
    lock_guard<mutex> guard(haltMutex);
    if (halt) {
      return;
    }
    halt = true;
  }
  socketHandler->stopListening(serverEndpoint);
  // Drains in-flight handshakes
  lock_guard<mutex> guard(haltMutex);
  clientHandlerThreadPool.reset();
}

bool TerminalServer::acceptNewConnection(int fd) {
  int clientSocketFd = socketHandler->accept(fd);
  if (clientSocketFd < 0) {
    return false;
  }
  VLOG(1) << "Accepted attach socket " << clientSocketFd;
  lock_guard<mutex> guard(haltMutex);
  if (halt) {
    socketHandler->close(clientSocketFd);
    return false;
  }
  clientHandlerThreadPool->enqueue(
      [this, clientSocketFd]() { this->clientHandler(clientSocketFd); });
  return true;
}

AttachStatus TerminalServer::authorize(const AttachRequest& request,
                                       string* error) {
  if (request.version() != PROTOCOL_VERSION) {
    std::ostringstream errorStream;
    errorStream << "Mismatched protocol versions.  Client: "
                << request.version() << " != Server: " << PROTOCOL_VERSION;
    *error = errorStream.str();
    return MISMATCHED_PROTOCOL;
  }
  if (tokenAuthority) {
    switch (tokenAuthority->validate(request.accesstoken(), projectId)) {
      case TokenCheck::OK:
        break;
      case TokenCheck::UNAUTHENTICATED:
        *error = "No valid access token";
        return UNAUTHENTICATED;
      case TokenCheck::PROJECT_FORBIDDEN:
        *error = "Token does not allow access to this project";
        return PROJECT_FORBIDDEN;
    }
  }
  auto info = registry->getSessionInfo(request.sessionid());
  if (!info) {
    *error = "Session not found: " + request.sessionid();
    return SESSION_NOT_FOUND;
  }
  if (request.agentonly() && !isAgentScope(info->scope())) {
    *error = "Session is not an agent session";
    return SCOPE_FORBIDDEN;
  }
  return ATTACHED;
}

void TerminalServer::clientHandler(int clientSocketFd) {
  el::Helpers::setThreadName("attach-handler");
  shared_ptr<TerminalConnection> conn(
      new TerminalConnection(socketHandler, clientSocketFd));
  try {
    AttachRequest request =
        socketHandler->readProto<AttachRequest>(clientSocketFd, true);
    string error;
    AttachStatus status = authorize(request, &error);
    if (status != ATTACHED) {
      LOG(INFO) << "Rejecting attach to " << request.sessionid() << ": "
                << closeReasonForStatus(status);
      conn->reject(status, error);
      return;
    }
    LOG(INFO) << "Got attach request for " << request.sessionid();
    AttachResult result = registry->attach(request.sessionid(), conn);
    if (result != AttachResult::ATTACHED) {
      VLOG(1) << "Attach to " << request.sessionid() << " did not complete";
      conn->close();
    }
  } catch (const std::runtime_error& err) {
    LOG(WARNING) << "Error handling new attach connection: " << err.what();
    conn->close();
  }
}
}  // namespace tt
