#ifndef __TT_PIPE_SOCKET_HANDLER__
#define __TT_PIPE_SOCKET_HANDLER__

#include "UnixSocketHandler.hpp"

namespace tt {
/**
 * @brief UNIX domain socket transport. The endpoint name is the socket path.
 * Used for local attach and for tests.
 */
class PipeSocketHandler : public UnixSocketHandler {
 public:
  PipeSocketHandler() {}
  virtual ~PipeSocketHandler() {}

  virtual int connect(const SocketEndpoint& endpoint);
  virtual set<int> listen(const SocketEndpoint& endpoint);
  virtual set<int> getEndpointFds(const SocketEndpoint& endpoint);
  virtual void stopListening(const SocketEndpoint& endpoint);

 protected:
  map<string, set<int>> pipeServerSockets;
};
}  // namespace tt

#endif  // __TT_PIPE_SOCKET_HANDLER__
