#ifndef __TT_CLOCK__
#define __TT_CLOCK__

#include "Headers.hpp"

namespace tt {
/**
 * @brief Millisecond time source. Tests substitute a manually advanced clock.
 */
class Clock {
 public:
  virtual ~Clock() {}
  virtual int64_t nowMs() = 0;
};

class SteadyClock : public Clock {
 public:
  virtual int64_t nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
  }
};

/** @brief Wall clock, used for token expiry that crosses process restarts. */
class SystemClock : public Clock {
 public:
  virtual int64_t nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
  }
};
}  // namespace tt

#endif  // __TT_CLOCK__
