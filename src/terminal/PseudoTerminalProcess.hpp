#ifndef __TT_PSEUDO_TERMINAL_PROCESS_HPP__
#define __TT_PSEUDO_TERMINAL_PROCESS_HPP__

#include "TerminalProcess.hpp"

namespace tt {
/**
 * @brief Forks a pseudo-terminal and execs the login shell in it.
 */
class PseudoTerminalProcess : public TerminalProcess {
 public:
  PseudoTerminalProcess() : pid(-1), masterFd(-1), reaped(false) {}
  virtual ~PseudoTerminalProcess() { terminate(); }

  virtual void spawn(const SpawnOptions& options);
  virtual int getFd() { return masterFd; }
  virtual void write(const string& data);
  virtual void resize(int cols, int rows);
  virtual int waitForExit();
  virtual void terminate();

  pid_t getPid() { return pid; }

 protected:
  /** @brief Runs in the forked child. Never returns. */
  void execShell(const SpawnOptions& options);

  pid_t pid;
  int masterFd;
  bool reaped;
  recursive_mutex processMutex;
};

class PseudoTerminalProcessFactory : public TerminalProcessFactory {
 public:
  virtual shared_ptr<TerminalProcess> create() {
    return shared_ptr<TerminalProcess>(new PseudoTerminalProcess());
  }
};
}  // namespace tt

#endif
