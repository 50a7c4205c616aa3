#ifndef __TT_TERMINAL_PROCESS_HPP__
#define __TT_TERMINAL_PROCESS_HPP__

#include "Headers.hpp"

namespace tt {
/**
 * @brief Everything needed to launch a session's child process.
 */
struct SpawnOptions {
  string shell;
  string workingDirectory;
  /** @brief Run as `shell -lc startupCommand` when set, else `shell -l`. */
  string startupCommand;
  int cols = 80;
  int rows = 24;
};

/**
 * @brief A child process behind a pseudo-terminal.
 *
 * The session pump selects on getFd(): reads return process output and a
 * read of 0 (or EIO) means the process has exited.
 */
class TerminalProcess {
 public:
  virtual ~TerminalProcess() {}

  /**
   * @brief Starts the child.
   * @throws std::runtime_error if the shell or working directory is missing
   * or the fork fails.
   */
  virtual void spawn(const SpawnOptions& options) = 0;
  /** @brief Descriptor carrying process output (the pty master). */
  virtual int getFd() = 0;
  /** @brief Forwards keyboard input to the process. */
  virtual void write(const string& data) = 0;
  virtual void resize(int cols, int rows) = 0;
  /**
   * @brief Reaps the child after its output reached EOF.
   * @return The exit code, or 128+signal if it was killed.
   */
  virtual int waitForExit() = 0;
  /** @brief Kills the child and releases the pty. Safe to call twice. */
  virtual void terminate() = 0;
};

/**
 * @brief Creates TerminalProcess instances so tests can inject fakes.
 */
class TerminalProcessFactory {
 public:
  virtual ~TerminalProcessFactory() {}
  virtual shared_ptr<TerminalProcess> create() = 0;
};
}  // namespace tt

#endif
