#include "TcpSocketHandler.hpp"

namespace tt {
int TcpSocketHandler::connect(const SocketEndpoint &endpoint) {
  lock_guard<recursive_mutex> guard(globalMutex);
  int sockFd = -1;
  addrinfo *results = NULL;
  addrinfo hints;
  memset(&hints, 0, sizeof(addrinfo));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = (AI_CANONNAME | AI_V4MAPPED | AI_ADDRCONFIG);
  std::string portname = std::to_string(endpoint.port());
  std::string hostname = endpoint.name();

  // (re)initialize the DNS system
  ::res_init();
  int rc = getaddrinfo(hostname.c_str(), portname.c_str(), &hints, &results);
  if (rc != 0) {
    LOG(WARNING) << "Error getting address info for " << endpoint << ": "
                 << rc << " (" << gai_strerror(rc) << ")";
    if (results) {
      freeaddrinfo(results);
    }
    return -1;
  }

  for (addrinfo *p = results; p != NULL; p = p->ai_next) {
    if ((sockFd = socket(p->ai_family, p->ai_socktype, p->ai_protocol)) == -1) {
      LOG(INFO) << "Error creating socket: " << errno << " " << strerror(errno);
      continue;
    }

    // Nonblocking for the connect phase so we can bound the wait
    int opts = fcntl(sockFd, F_GETFL);
    FATAL_FAIL(opts);
    FATAL_FAIL(fcntl(sockFd, F_SETFL, opts | O_NONBLOCK));

    if (::connect(sockFd, p->ai_addr, p->ai_addrlen) == -1 &&
        errno != EINPROGRESS) {
      LOG(INFO) << "Error connecting to " << endpoint << ": " << errno << " "
                << strerror(errno);
      ::close(sockFd);
      sockFd = -1;
      continue;
    }
    fd_set fdset;
    FD_ZERO(&fdset);
    FD_SET(sockFd, &fdset);
    timeval tv;
    tv.tv_sec = 3;
    tv.tv_usec = 0;
    select(sockFd + 1, NULL, &fdset, NULL, &tv);

    int so_error = ETIMEDOUT;
    if (FD_ISSET(sockFd, &fdset)) {
      socklen_t len = sizeof so_error;
      FATAL_FAIL(::getsockopt(sockFd, SOL_SOCKET, SO_ERROR, &so_error, &len));
    }
    if (so_error == 0) {
      LOG(INFO) << "Connected to " << endpoint << " using fd " << sockFd;
      break;
    }
    LOG(INFO) << "Error connecting to " << endpoint << ": " << so_error << " "
              << strerror(so_error);
    ::close(sockFd);
    sockFd = -1;
  }
  freeaddrinfo(results);

  if (sockFd == -1) {
    LOG(WARNING) << "Could not connect to " << endpoint;
    return -1;
  }
  addToActiveSockets(sockFd);
  initSocket(sockFd);
  return sockFd;
}

set<int> TcpSocketHandler::listen(const SocketEndpoint &endpoint) {
  lock_guard<recursive_mutex> guard(globalMutex);

  int port = endpoint.port();
  if (portServerSockets.find(port) != portServerSockets.end()) {
    throw std::runtime_error("Tried to listen twice on the same port");
  }

  addrinfo hints, *servinfo;
  memset(&hints, 0, sizeof hints);
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = AI_PASSIVE;

  std::string portname = std::to_string(port);
  const char *bindName =
      (endpoint.has_name() && !endpoint.name().empty()) ? endpoint.name().c_str()
                                                        : NULL;
  int rc = getaddrinfo(bindName, portname.c_str(), &hints, &servinfo);
  if (rc != 0) {
    throw std::runtime_error(string("Error getting address info: ") +
                             gai_strerror(rc));
  }

  set<int> serverSockets;
  for (addrinfo *p = servinfo; p != NULL; p = p->ai_next) {
    int sockFd = socket(p->ai_family, p->ai_socktype, p->ai_protocol);
    if (sockFd == -1) {
      LOG(INFO) << "Error creating socket " << p->ai_family << "/"
                << p->ai_socktype << "/" << p->ai_protocol << ": " << errno
                << " " << strerror(errno);
      continue;
    }
    initServerSocket(sockFd);

    if (p->ai_family == AF_INET6) {
      // IPv4 gets its own socket from the next addrinfo entry
      int flag = 1;
      FATAL_FAIL(setsockopt(sockFd, IPPROTO_IPV6, IPV6_V6ONLY, (char *)&flag,
                            sizeof(int)));
    }

    if (::bind(sockFd, p->ai_addr, p->ai_addrlen) == -1) {
      stringstream oss;
      oss << "Error binding port " << port << ": " << errno << " "
          << strerror(errno);
      ::close(sockFd);
      for (int fd : serverSockets) {
        ::close(fd);
      }
      freeaddrinfo(servinfo);
      throw std::runtime_error(oss.str());
    }

    FATAL_FAIL(::listen(sockFd, 32));
    LOG(INFO) << "Listening on port " << port << "/" << p->ai_family;
    serverSockets.insert(sockFd);
  }
  freeaddrinfo(servinfo);

  if (serverSockets.empty()) {
    throw std::runtime_error("Could not bind to any interface");
  }

  portServerSockets[port] = serverSockets;
  return serverSockets;
}

set<int> TcpSocketHandler::getEndpointFds(const SocketEndpoint &endpoint) {
  lock_guard<recursive_mutex> guard(globalMutex);

  auto it = portServerSockets.find(endpoint.port());
  if (it == portServerSockets.end()) {
    STFATAL << "Tried to getEndpointFds on a port without calling listen() "
               "first";
  }
  return it->second;
}

void TcpSocketHandler::stopListening(const SocketEndpoint &endpoint) {
  lock_guard<recursive_mutex> guard(globalMutex);

  auto it = portServerSockets.find(endpoint.port());
  if (it == portServerSockets.end()) {
    LOG(WARNING) << "Not listening on port " << endpoint.port();
    return;
  }
  for (int sockFd : it->second) {
    FATAL_FAIL(::close(sockFd));
  }
  portServerSockets.erase(it);
}

void TcpSocketHandler::initSocket(int fd) {
  UnixSocketHandler::initSocket(fd);
  int flag = 1;
  FATAL_FAIL_UNLESS_EINVAL(
      setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, (char *)&flag, sizeof(int)));
}
}  // namespace tt
