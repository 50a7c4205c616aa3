#include "SocketTransport.hpp"

namespace tt {
SocketTransport::SocketTransport(shared_ptr<SocketHandler> _socketHandler,
                                 const SocketEndpoint& _endpoint,
                                 shared_ptr<EventQueue> _eventQueue,
                                 shared_ptr<ThreadPool> _connectPool)
    : socketHandler(_socketHandler),
      endpoint(_endpoint),
      eventQueue(_eventQueue),
      connectPool(_connectPool),
      socketFd(-1),
      failed(false),
      closed(new atomic<bool>(false)) {
  if (!connectPool) {
    connectPool.reset(new ThreadPool(1));
  }
}

SocketTransport::~SocketTransport() { close(); }

void SocketTransport::dispatch(function<void()> task) {
  auto closedFlag = closed;
  eventQueue->post([closedFlag, task]() {
    if (!*closedFlag) {
      task();
    }
  });
}

AttachOutcome SocketTransport::attach(shared_ptr<SocketHandler> socketHandler,
                                      const SocketEndpoint& endpoint,
                                      const AttachRequest& request) {
  AttachOutcome outcome;
  int fd = socketHandler->connect(endpoint);
  if (fd < 0) {
    VLOG(1) << "Could not connect to " << endpoint;
    outcome.closeReason = CLOSE_CONNECTION_FAILED;
    return outcome;
  }

  AttachResponse response;
  try {
    socketHandler->writeProto(fd, request, true);
    response = socketHandler->readProto<AttachResponse>(fd, true);
  } catch (const std::runtime_error& re) {
    LOG(WARNING) << "Attach handshake with " << endpoint
                 << " failed: " << re.what();
    socketHandler->close(fd);
    outcome.closeReason = CLOSE_CONNECTION_FAILED;
    return outcome;
  }

  if (response.status() != ATTACHED) {
    LOG(INFO) << "Attach to " << request.sessionid()
              << " rejected: " << response.error();
    socketHandler->close(fd);
    outcome.closeReason = closeReasonForStatus(response.status());
    return outcome;
  }
  outcome.socketFd = fd;
  return outcome;
}

void SocketTransport::open(const string& sessionId, const string& accessToken,
                           bool agentOnly, const TransportHandlers& _handlers) {
  handlers = _handlers;

  AttachRequest request;
  request.set_version(PROTOCOL_VERSION);
  request.set_sessionid(sessionId);
  request.set_accesstoken(accessToken);
  request.set_agentonly(agentOnly);

  auto handler = socketHandler;
  auto target = endpoint;
  auto queue = eventQueue;
  auto closedFlag = closed;
  // Only dereferenced on the event queue, after checking closedFlag, and
  // close() runs on that same thread.
  SocketTransport* self = this;
  connectPool->enqueue([handler, target, request, queue, closedFlag, self]() {
    AttachOutcome outcome;
    try {
      outcome = SocketTransport::attach(handler, target, request);
    } catch (const std::exception& e) {
      // A throw here would otherwise vanish into the pool's future
      LOG(WARNING) << "Attach to " << target << " failed: " << e.what();
      outcome.closeReason = CLOSE_CONNECTION_FAILED;
    }
    queue->post([handler, closedFlag, self, outcome]() {
      if (*closedFlag) {
        if (outcome.socketFd >= 0) {
          handler->close(outcome.socketFd);
        }
        return;
      }
      self->finishOpen(outcome);
    });
  });
}

void SocketTransport::finishOpen(const AttachOutcome& outcome) {
  if (!outcome.closeReason.empty()) {
    fail(outcome.closeReason);
    return;
  }
  socketFd = outcome.socketFd;
  VLOG(1) << "Attached on fd " << socketFd;
  if (handlers.onOpen) {
    handlers.onOpen();
  }
}

void SocketTransport::write(const Packet& packet) {
  if (!isOpen()) {
    return;
  }
  try {
    socketHandler->writePacket(socketFd, packet, true);
  } catch (const std::runtime_error& re) {
    LOG(INFO) << "Write failed: " << re.what();
    fail(CLOSE_CONNECTION_LOST);
  }
}

void SocketTransport::sendData(const string& data) { write(dataPacket(data)); }

void SocketTransport::sendControl(const ControlFrame& frame) {
  write(controlPacket(frame));
}

void SocketTransport::fail(const string& reason) {
  if (socketFd >= 0) {
    socketHandler->close(socketFd);
    socketFd = -1;
  }
  if (*closed || failed) {
    return;
  }
  failed = true;
  TransportHandlers h = handlers;
  dispatch([h, reason]() {
    if (h.onClose) h.onClose(reason);
  });
}

void SocketTransport::close() {
  *closed = true;
  if (socketFd >= 0) {
    socketHandler->close(socketFd);
    socketFd = -1;
  }
}

bool SocketTransport::isOpen() {
  return !*closed && !failed && socketFd >= 0;
}

int SocketTransport::getFd() { return isOpen() ? socketFd : -1; }

void SocketTransport::poll() {
  while (isOpen() && socketHandler->hasData(socketFd)) {
    vector<string> frames;
    bool peerOpen;
    try {
      peerOpen = socketHandler->readAvailableFrames(socketFd, &pending, &frames);
    } catch (const std::runtime_error& re) {
      VLOG(1) << "Connection closed: " << re.what();
      fail(CLOSE_CONNECTION_LOST);
      return;
    }
    for (const auto& frame : frames) {
      handlePacket(Packet(frame));
    }
    if (!peerOpen) {
      VLOG(1) << "Server closed the connection";
      fail(CLOSE_CONNECTION_LOST);
      return;
    }
  }
}

void SocketTransport::handlePacket(const Packet& packet) {
  TransportHandlers h = handlers;
  switch (packet.getHeader()) {
    case TerminalPacketType::TERMINAL_DATA: {
      string data = packet.getPayload();
      dispatch([h, data]() {
        if (h.onData) h.onData(data);
      });
      break;
    }
    case TerminalPacketType::CONTROL: {
      auto frame = ControlFrame::parse(packet.getPayload());
      if (!frame) {
        LOG(WARNING) << "Dropping malformed control frame";
        break;
      }
      ControlFrame parsed = *frame;
      dispatch([h, parsed]() {
        if (h.onControl) h.onControl(parsed);
      });
      break;
    }
    default:
      LOG(WARNING) << "Dropping packet with unknown type "
                   << int(packet.getHeader());
  }
}
}  // namespace tt
