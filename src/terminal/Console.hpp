#ifndef __TT_CONSOLE_HPP__
#define __TT_CONSOLE_HPP__

#include "Headers.hpp"
#include "RawSocketUtils.hpp"

namespace tt {
/**
 * @brief The local terminal ttclient draws into.
 */
class Console {
 public:
  virtual ~Console() {}

  /** @brief Current window size in character cells. */
  virtual TerminalSize getTerminalSize() = 0;
  /** @brief Puts the console in raw mode. */
  virtual void setup() = 0;
  /** @brief Restores the mode saved by setup(). */
  virtual void teardown() = 0;
  /** @brief Descriptor that receives terminal output. */
  virtual int getFd() = 0;
  /** @brief Descriptor keystrokes are read from. */
  virtual int getInputFd() = 0;

  virtual void write(const string& s) {
    if (s.empty()) {
      return;
    }
    RawSocketUtils::writeAll(getFd(), &s[0], s.length());
  }
};
}  // namespace tt

#endif  // __TT_CONSOLE_HPP__
