#ifndef __TT_TERMINAL_CLIENT__
#define __TT_TERMINAL_CLIENT__

#include "Console.hpp"
#include "EventQueue.hpp"
#include "Headers.hpp"
#include "ReconnectionEngine.hpp"

namespace tt {
/**
 * @brief Pumps the local console to and from a reconnection engine.
 */
class TerminalClient {
 public:
  TerminalClient(shared_ptr<Console> _console,
                 shared_ptr<EventQueue> _eventQueue,
                 shared_ptr<ReconnectionEngine> _engine);
  virtual ~TerminalClient();

  /**
   * @brief Connects and runs until the session exits, recovery gives up, or
   * shutdown() is called.
   * @return The session's exit code, 1 on failure, 0 after shutdown().
   */
  int run();

  /** @brief Flags the client loop to exit on its next iteration. */
  void shutdown() {
    lock_guard<recursive_mutex> guard(shutdownMutex);
    shuttingDown = true;
  }

 protected:
  bool isShuttingDown() {
    lock_guard<recursive_mutex> guard(shutdownMutex);
    return shuttingDown;
  }

  shared_ptr<Console> console;
  shared_ptr<EventQueue> eventQueue;
  shared_ptr<ReconnectionEngine> engine;
  bool shuttingDown;
  recursive_mutex shutdownMutex;
  int exitCode;
  string errorMessage;
};
}  // namespace tt

#endif  // __TT_TERMINAL_CLIENT__
