#include "TerminalConnection.hpp"

namespace tt {
TerminalConnection::TerminalConnection(
    shared_ptr<SocketHandler> _socketHandler, int _socketFd)
    : socketHandler(_socketHandler), socketFd(_socketFd), closed(false) {}

TerminalConnection::~TerminalConnection() { socketHandler->close(socketFd); }

void TerminalConnection::accept() {
  AttachResponse response;
  response.set_status(ATTACHED);
  lock_guard<recursive_mutex> guard(connectionMutex);
  if (closed) {
    throw std::runtime_error("Connection closed before attach completed");
  }
  socketHandler->writeProto(socketFd, response, true);
}

void TerminalConnection::reject(AttachStatus status, const string& error) {
  AttachResponse response;
  response.set_status(status);
  response.set_error(error);
  {
    lock_guard<recursive_mutex> guard(connectionMutex);
    if (!closed) {
      try {
        socketHandler->writeProto(socketFd, response, true);
      } catch (const std::runtime_error& re) {
        VLOG(1) << "Could not deliver attach rejection: " << re.what();
      }
    }
  }
  close();
}

void TerminalConnection::writeData(const string& data) {
  lock_guard<recursive_mutex> guard(connectionMutex);
  if (closed) {
    throw std::runtime_error("Write on a closed connection");
  }
  socketHandler->writePacket(socketFd, dataPacket(data), true);
}

void TerminalConnection::writeControl(const ControlFrame& frame) {
  lock_guard<recursive_mutex> guard(connectionMutex);
  if (closed) {
    throw std::runtime_error("Write on a closed connection");
  }
  socketHandler->writePacket(socketFd, controlPacket(frame), true);
}

void TerminalConnection::readPackets(vector<Packet>* packets) {
  vector<string> frames;
  {
    lock_guard<recursive_mutex> guard(connectionMutex);
    if (closed) {
      throw std::runtime_error("Read on a closed connection");
    }
    if (!socketHandler->readAvailableFrames(socketFd, &pending, &frames)) {
      throw std::runtime_error("Peer closed the connection");
    }
  }
  for (const auto& frame : frames) {
    packets->push_back(Packet(frame));
  }
}

bool TerminalConnection::hasData() {
  lock_guard<recursive_mutex> guard(connectionMutex);
  if (closed) {
    return false;
  }
  return socketHandler->hasData(socketFd);
}

void TerminalConnection::close() {
  lock_guard<recursive_mutex> guard(connectionMutex);
  if (closed) {
    return;
  }
  closed = true;
  socketHandler->shutdownSocket(socketFd);
}

bool TerminalConnection::isClosed() {
  lock_guard<recursive_mutex> guard(connectionMutex);
  return closed;
}

int TerminalConnection::getSocketFd() {
  lock_guard<recursive_mutex> guard(connectionMutex);
  return closed ? -1 : socketFd;
}
}  // namespace tt
