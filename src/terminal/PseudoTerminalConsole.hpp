#ifndef __TT_PSEUDO_TERMINAL_CONSOLE_HPP__
#define __TT_PSEUDO_TERMINAL_CONSOLE_HPP__

#include "Console.hpp"

namespace tt {
/**
 * @brief Console backed by the process's own stdin/stdout tty.
 */
class PseudoTerminalConsole : public Console {
 public:
  PseudoTerminalConsole() {
    termios terminal_local;
    tcgetattr(STDIN_FILENO, &terminal_local);
    memcpy(&terminal_backup, &terminal_local, sizeof(struct termios));
  }

  virtual ~PseudoTerminalConsole() {}

  virtual void setup() {
    termios terminal_local;
    tcgetattr(STDIN_FILENO, &terminal_local);
    memcpy(&terminal_backup, &terminal_local, sizeof(struct termios));
    cfmakeraw(&terminal_local);
    tcsetattr(STDIN_FILENO, TCSANOW, &terminal_local);
  }

  virtual void teardown() { tcsetattr(STDIN_FILENO, TCSANOW, &terminal_backup); }

  virtual TerminalSize getTerminalSize() {
    winsize win;
    TerminalSize size;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &win) == -1 || win.ws_col == 0) {
      // Not a tty (e.g. output is piped)
      size.set_cols(80);
      size.set_rows(24);
      return size;
    }
    size.set_cols(win.ws_col);
    size.set_rows(win.ws_row);
    return size;
  }

  virtual int getFd() { return STDOUT_FILENO; }
  virtual int getInputFd() { return STDIN_FILENO; }

 protected:
  termios terminal_backup;
};
}  // namespace tt

#endif  // __TT_PSEUDO_TERMINAL_CONSOLE_HPP__
