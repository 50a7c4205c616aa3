#ifndef __TT_SOCKET_TRANSPORT_HPP__
#define __TT_SOCKET_TRANSPORT_HPP__

#include "EventQueue.hpp"
#include "Headers.hpp"
#include "SocketHandler.hpp"
#include "Transport.hpp"

namespace tt {
/** @brief Result of a connect and handshake run off the event queue. */
struct AttachOutcome {
  int socketFd = -1;
  /** @brief Empty when attached; otherwise one of the CLOSE_* strings. */
  string closeReason;
};

/**
 * @brief Transport over a SocketHandler: the AttachRequest handshake
 * followed by tagged packets.
 *
 * The connect and handshake block, so open() runs them on connectPool and
 * reports the outcome through the event queue.
 */
class SocketTransport : public Transport {
 public:
  /** @param _connectPool Shared worker pool; a private one when null. */
  SocketTransport(shared_ptr<SocketHandler> _socketHandler,
                  const SocketEndpoint& _endpoint,
                  shared_ptr<EventQueue> _eventQueue,
                  shared_ptr<ThreadPool> _connectPool = nullptr);
  virtual ~SocketTransport();

  virtual void open(const string& sessionId, const string& accessToken,
                    bool agentOnly, const TransportHandlers& _handlers);
  virtual void sendData(const string& data);
  virtual void sendControl(const ControlFrame& frame);
  virtual void close();
  virtual bool isOpen();
  virtual int getFd();
  virtual void poll();

  /** @brief Connects and runs the handshake. Blocks; any thread. */
  static AttachOutcome attach(shared_ptr<SocketHandler> socketHandler,
                              const SocketEndpoint& endpoint,
                              const AttachRequest& request);

 protected:
  void finishOpen(const AttachOutcome& outcome);
  void handlePacket(const Packet& packet);
  void write(const Packet& packet);
  /** @brief Closes the socket and reports reason once. */
  void fail(const string& reason);
  /** @brief Posts task unless this transport has been closed since. */
  void dispatch(function<void()> task);

  shared_ptr<SocketHandler> socketHandler;
  SocketEndpoint endpoint;
  shared_ptr<EventQueue> eventQueue;
  shared_ptr<ThreadPool> connectPool;
  TransportHandlers handlers;
  int socketFd;
  bool failed;
  // Bytes of an inbound frame that has not fully arrived yet
  string pending;
  // Set by close(); shared with queued callbacks so they can be dropped
  shared_ptr<atomic<bool>> closed;
};

class SocketTransportFactory : public TransportFactory {
 public:
  SocketTransportFactory(shared_ptr<SocketHandler> _socketHandler,
                         const SocketEndpoint& _endpoint,
                         shared_ptr<EventQueue> _eventQueue)
      : socketHandler(_socketHandler),
        endpoint(_endpoint),
        eventQueue(_eventQueue),
        connectPool(new ThreadPool(2)) {}

  virtual shared_ptr<Transport> create() {
    return shared_ptr<Transport>(new SocketTransport(
        socketHandler, endpoint, eventQueue, connectPool));
  }

 protected:
  shared_ptr<SocketHandler> socketHandler;
  SocketEndpoint endpoint;
  shared_ptr<EventQueue> eventQueue;
  shared_ptr<ThreadPool> connectPool;
};
}  // namespace tt

#endif  // __TT_SOCKET_TRANSPORT_HPP__
