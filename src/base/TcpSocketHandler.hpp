#ifndef __TT_TCP_SOCKET_HANDLER__
#define __TT_TCP_SOCKET_HANDLER__

#include "UnixSocketHandler.hpp"

namespace tt {
/**
 * @brief IPv4/IPv6 transport for remote attach.
 */
class TcpSocketHandler : public UnixSocketHandler {
 public:
  TcpSocketHandler() {}
  virtual ~TcpSocketHandler() {}

  /**
   * @brief Resolves name:port and connects, waiting up to three seconds.
   */
  virtual int connect(const SocketEndpoint& endpoint);
  /**
   * @brief Binds the port on endpoint.name() if set, else on every
   * interface.
   * @throws std::runtime_error if the port is in use.
   */
  virtual set<int> listen(const SocketEndpoint& endpoint);
  virtual set<int> getEndpointFds(const SocketEndpoint& endpoint);
  virtual void stopListening(const SocketEndpoint& endpoint);

 protected:
  map<int, set<int>> portServerSockets;

  virtual void initSocket(int fd);
};
}  // namespace tt

#endif  // __TT_TCP_SOCKET_HANDLER__
