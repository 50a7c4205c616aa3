#ifndef __TT_DAEMON_CREATOR_H__
#define __TT_DAEMON_CREATOR_H__

#include "Headers.hpp"

namespace tt {
/**
 * @brief Detaches ttserver from its controlling terminal.
 */
class DaemonCreator {
 public:
  /**
   * @brief Double-forks into a new session and points stdio at /dev/null.
   * @param terminateParent Exit the original process once the first fork
   * succeeds.
   * @param childPidFile When non-empty, the daemon writes its pid here.
   * @return PARENT in the original process, CHILD in the daemon, -1 on
   * failure.
   */
  static int create(bool terminateParent, const string& childPidFile);

  static const int PARENT = 1;
  static const int CHILD = 2;
};
}  // namespace tt

#endif  // __TT_DAEMON_CREATOR_H__
