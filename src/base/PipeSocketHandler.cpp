#include "PipeSocketHandler.hpp"

namespace tt {
namespace {
sockaddr_un makeAddress(const string& pipePath) {
  sockaddr_un address;
  memset(&address, 0, sizeof(sockaddr_un));
  if (pipePath.length() >= sizeof(address.sun_path)) {
    throw std::runtime_error("Socket path is too long: " + pipePath);
  }
  address.sun_family = AF_UNIX;
  strncpy(address.sun_path, pipePath.c_str(), sizeof(address.sun_path) - 1);
  return address;
}
}  // namespace

int PipeSocketHandler::connect(const SocketEndpoint& endpoint) {
  lock_guard<recursive_mutex> mutexGuard(globalMutex);

  sockaddr_un remote = makeAddress(endpoint.name());
  int sockFd = ::socket(AF_UNIX, SOCK_STREAM, 0);
  FATAL_FAIL(sockFd);
  VLOG(3) << "Connecting to " << endpoint << " with fd " << sockFd;
  if (::connect(sockFd, (struct sockaddr*)&remote, sizeof(sockaddr_un)) < 0) {
    auto localErrno = GetErrno();
    LOG(INFO) << "Error connecting to " << endpoint << ": " << localErrno
              << " " << strerror(localErrno);
    FATAL_FAIL(::close(sockFd));
    SetErrno(localErrno);
    return -1;
  }
  initSocket(sockFd);
  addToActiveSockets(sockFd);
  LOG(INFO) << "Connected to endpoint " << endpoint << " using fd " << sockFd;
  return sockFd;
}

set<int> PipeSocketHandler::listen(const SocketEndpoint& endpoint) {
  lock_guard<recursive_mutex> guard(globalMutex);

  string pipePath = endpoint.name();
  if (pipeServerSockets.find(pipePath) != pipeServerSockets.end()) {
    throw runtime_error("Tried to listen twice on the same path");
  }

  sockaddr_un local = makeAddress(pipePath);
  int fd = socket(AF_UNIX, SOCK_STREAM, 0);
  FATAL_FAIL(fd);
  initServerSocket(fd);
  unlink(local.sun_path);

  FATAL_FAIL(::bind(fd, (struct sockaddr*)&local, sizeof(sockaddr_un)));
  FATAL_FAIL(::listen(fd, 32));
  FATAL_FAIL(::chmod(local.sun_path, S_IRUSR | S_IWUSR | S_IXUSR));
  LOG(INFO) << "Listening on " << pipePath;

  pipeServerSockets[pipePath] = set<int>({fd});
  return pipeServerSockets[pipePath];
}

set<int> PipeSocketHandler::getEndpointFds(const SocketEndpoint& endpoint) {
  lock_guard<recursive_mutex> guard(globalMutex);

  auto it = pipeServerSockets.find(endpoint.name());
  if (it == pipeServerSockets.end()) {
    STFATAL << "Tried to getEndpointFds on a pipe without calling listen() "
               "first: "
            << endpoint.name();
  }
  return it->second;
}

void PipeSocketHandler::stopListening(const SocketEndpoint& endpoint) {
  lock_guard<recursive_mutex> guard(globalMutex);

  auto it = pipeServerSockets.find(endpoint.name());
  if (it == pipeServerSockets.end()) {
    LOG(WARNING) << "Not listening on " << endpoint.name();
    return;
  }
  for (int sockFd : it->second) {
    FATAL_FAIL(::close(sockFd));
  }
  unlink(endpoint.name().c_str());
  pipeServerSockets.erase(it);
}
}  // namespace tt
