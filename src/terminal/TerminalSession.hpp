#ifndef __TT_TERMINAL_SESSION_HPP__
#define __TT_TERMINAL_SESSION_HPP__

#include "Headers.hpp"
#include "OutputBuffer.hpp"
#include "TerminalConnection.hpp"
#include "TerminalProcess.hpp"

namespace tt {
/**
 * @brief Description of a session. Everything but cols/rows is fixed at
 * creation.
 */
struct SessionConfig {
  string id;
  string worktreeId;
  /** @brief Launch profile; empty for an unscoped shell. */
  string scope;
  string workingDirectory;
  string startupCommand;
  int cols = 80;
  int rows = 24;
  int64_t sequence = 0;
};

/**
 * @brief One pty-backed process plus at most one attached connection.
 *
 * A pump thread, started with the process, selects on the pty and on the
 * attached connection. Output is appended to the trailing buffer and
 * forwarded to the connection under sessionMutex; attachConnection() takes
 * the same mutex, so a replay is always delivered as one prefix ahead of
 * live output.
 */
class TerminalSession : public enable_shared_from_this<TerminalSession> {
 public:
  TerminalSession(const SessionConfig& _config,
                  shared_ptr<TerminalProcess> _process);
  virtual ~TerminalSession();

  const SessionConfig& getConfig() const { return config; }
  const string& getId() const { return config.id; }

  /**
   * @brief Spawns the process and starts the pump, unless already running.
   * @param onExit Called once on the pump thread with the exit code when
   * the process ends.
   * @return false if the session was shut down before it ever spawned.
   * @throws std::runtime_error if the process cannot be started.
   */
  bool ensureSpawned(const string& shell, function<void(int)> onExit);
  bool isSpawned();

  /**
   * @brief Last attach wins: closes any current connection, confirms the
   * handshake, replays the buffer, then takes ownership of conn. After the
   * process has exited, conn gets the replay and the exit frame instead.
   * @return false (conn untouched) if the session was destroyed.
   * @throws std::runtime_error if conn fails during the handshake or replay.
   */
  bool attachConnection(shared_ptr<TerminalConnection> conn);
  bool hasConnection();

  void resize(int cols, int rows);

  /**
   * @brief Sends the exit frame to the attached connection (if any), then
   * closes it. Called once the session has left the registry.
   */
  void finishWithExit(int _exitCode);

  /**
   * @brief Stops the pump, closes the connection and kills the process.
   */
  void shutdown();

  string getBufferContents();
  SessionInfo getInfo();

 protected:
  void pump(function<void(int)> onExit);
  /** @return false once the process has ended. */
  bool drainProcess(char* buf, size_t bufSize);
  void drainConnection(shared_ptr<TerminalConnection> conn);
  void handlePacket(shared_ptr<TerminalConnection> conn, const Packet& packet);
  void detachConnection(shared_ptr<TerminalConnection> conn);
  void releasePumpThread();

  SessionConfig config;
  shared_ptr<TerminalProcess> process;
  shared_ptr<TerminalConnection> connection;
  OutputBuffer outputBuffer;
  bool spawned;
  // Set once by shutdown() or finishWithExit()
  bool closed;
  optional<int> exitCode;
  atomic<bool> halt;
  recursive_mutex sessionMutex;
  mutex threadMutex;
  shared_ptr<thread> pumpThread;
};
}  // namespace tt

#endif
