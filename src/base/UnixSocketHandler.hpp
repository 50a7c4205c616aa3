#ifndef __TT_UNIX_SOCKET_HANDLER__
#define __TT_UNIX_SOCKET_HANDLER__

#include "SocketHandler.hpp"

namespace tt {
/**
 * @brief POSIX SocketHandler with one mutex per tracked socket so that a
 * session's pump thread and an attach handshake never interleave writes.
 */
class UnixSocketHandler : public SocketHandler {
 public:
  UnixSocketHandler() {}
  virtual ~UnixSocketHandler() {}

  /** @brief select() on fd for at most sec/usec. */
  virtual bool waitForData(int fd, int64_t sec, int64_t usec);
  virtual bool hasData(int fd);
  virtual ssize_t read(int fd, void* buf, size_t count);
  virtual ssize_t write(int fd, const void* buf, size_t count);
  virtual int accept(int fd);
  /** @brief Closes fd if it is still tracked. Closing twice is a no-op. */
  virtual void close(int fd);
  virtual void shutdownSocket(int fd);
  virtual vector<int> getActiveSockets();

 protected:
  void addToActiveSockets(int fd);
  shared_ptr<recursive_mutex> getSocketMutex(int fd);
  /** @brief Non-blocking mode and SIGPIPE suppression. */
  virtual void initSocket(int fd);
  virtual void initServerSocket(int fd);

  map<int, shared_ptr<recursive_mutex>> activeSocketMutexes;
  recursive_mutex globalMutex;
};
}  // namespace tt

#endif  // __TT_UNIX_SOCKET_HANDLER__
