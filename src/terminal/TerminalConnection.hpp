#ifndef __TT_TERMINAL_CONNECTION_HPP__
#define __TT_TERMINAL_CONNECTION_HPP__

#include "ControlFrame.hpp"
#include "Headers.hpp"
#include "SocketHandler.hpp"

namespace tt {
/**
 * @brief Server side of one attached client stream.
 *
 * Owns its socket. Created by the attach listener after the handshake
 * request was read; the registry answers the handshake with accept() or
 * reject().
 */
class TerminalConnection {
 public:
  TerminalConnection(shared_ptr<SocketHandler> _socketHandler, int _socketFd);
  virtual ~TerminalConnection();

  /** @brief Confirms the attach. Must precede any data frame. */
  virtual void accept();
  /** @brief Answers the handshake with a failure status and closes. */
  virtual void reject(AttachStatus status, const string& error);

  /** @throws std::runtime_error if the peer is gone. */
  virtual void writeData(const string& data);
  /** @throws std::runtime_error if the peer is gone. */
  virtual void writeControl(const ControlFrame& frame);
  /**
   * @brief Appends every packet completed by the bytes ready on the socket.
   * A partial frame is kept for the next call.
   * @throws std::runtime_error if the peer is gone or the stream is corrupt.
   */
  virtual void readPackets(vector<Packet>* packets);
  virtual bool hasData();

  /**
   * @brief Shuts the socket down. Idempotent and safe while another thread
   * is reading it: the descriptor itself is released by the destructor.
   */
  virtual void close();
  bool isClosed();
  int getSocketFd();

 protected:
  shared_ptr<SocketHandler> socketHandler;
  int socketFd;
  bool closed;
  // Bytes of a frame that has not fully arrived yet
  string pending;
  recursive_mutex connectionMutex;
};
}  // namespace tt

#endif
