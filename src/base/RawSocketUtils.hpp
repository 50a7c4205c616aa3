#ifndef __TT_RAW_SOCKET_UTILS__
#define __TT_RAW_SOCKET_UTILS__

#include "Headers.hpp"

namespace tt {
/**
 * @brief Blocking write loop for descriptors that are not managed by a
 * SocketHandler (pty masters, stdout).
 */
class RawSocketUtils {
 public:
  /**
   * @brief Writes the whole buffer, retrying on EAGAIN and EINTR.
   * @throws std::runtime_error if the descriptor is closed or fails.
   */
  static void writeAll(int fd, const char* buf, size_t count);
};
}  // namespace tt
#endif  // __TT_RAW_SOCKET_UTILS__
