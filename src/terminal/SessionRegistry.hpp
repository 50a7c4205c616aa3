#ifndef __TT_SESSION_REGISTRY_HPP__
#define __TT_SESSION_REGISTRY_HPP__

#include "Headers.hpp"
#include "TerminalConnection.hpp"
#include "TerminalProcess.hpp"
#include "TerminalSession.hpp"

namespace tt {
/**
 * @brief Thrown by SessionRegistry::create when a session cannot be set up
 * (missing working directory or shell, or an eager spawn failed).
 */
class SessionSetupError : public std::runtime_error {
 public:
  explicit SessionSetupError(const string& what) : std::runtime_error(what) {}
};

enum class SessionCloseReason { DESTROYED, EXITED, SPAWN_FAILED };

string sessionCloseReasonName(SessionCloseReason reason);

/**
 * @brief Emitted when a session is registered ("created") or leaves the
 * registry ("closed"). A closed/EXITED event carries the exit code and is
 * what post-exit automation listens for.
 */
struct SessionLifecycleEvent {
  bool created = false;
  string sessionId;
  string worktreeId;
  string scope;
  SessionCloseReason reason = SessionCloseReason::DESTROYED;
  optional<int> exitCode;
};

enum class AttachResult { ATTACHED, SESSION_NOT_FOUND, SPAWN_FAILED, CONNECTION_FAILED };

struct CreateSessionOptions {
  string worktreeId;
  string workingDirectory;
  string scope;
  int cols = 80;
  int rows = 24;
  /** @brief Empty for an interactive login shell. */
  string startupCommand;
  /** @brief Spawn now instead of on first attach. */
  bool spawnImmediately = false;
};

/**
 * @brief In-memory table of terminal sessions.
 *
 * Sessions are created without a process; the process is spawned on first
 * attach, or at creation when CreateSessionOptions::spawnImmediately is set.
 * A session leaves the table exactly once, through destroy() or through its
 * process exiting. An attach racing a destroy that completed first is
 * answered with SESSION_NOT_FOUND.
 */
class SessionRegistry {
 public:
  typedef function<void(const SessionLifecycleEvent&)> LifecycleListener;

  SessionRegistry(shared_ptr<TerminalProcessFactory> _processFactory,
                  const string& _shell);
  virtual ~SessionRegistry();

  /** @brief $SHELL, falling back to /bin/zsh. */
  static string defaultShell();

  /**
   * @brief Registers a session and returns its id. A scoped session that is
   * still live for the same worktree is returned instead of a new one.
   * @throws SessionSetupError on setup failure; nothing is registered then.
   */
  string create(const CreateSessionOptions& options);

  /**
   * @brief Hands conn to the session, spawning the process on first attach.
   * Any previously attached connection is closed first.
   */
  AttachResult attach(const string& sessionId,
                      shared_ptr<TerminalConnection> conn);

  bool resize(const string& sessionId, int cols, int rows);

  /**
   * @brief Kills the process, closes the connection and forgets the session.
   * @return false if the session was already gone.
   */
  bool destroy(const string& sessionId);

  /** @return Number of sessions destroyed. */
  int destroyAllFor(const string& worktreeId);
  void destroyAll();

  bool hasSession(const string& sessionId);
  optional<string> getSessionIdForScope(const string& worktreeId,
                                        const string& scope);
  optional<SessionInfo> getSessionInfo(const string& sessionId);
  /** @brief Sessions for a worktree, newest first. */
  vector<SessionInfo> listSessions(const string& worktreeId);
  string getBufferContents(const string& sessionId);
  int size();

  int64_t subscribe(LifecycleListener listener);
  void unsubscribe(int64_t listenerId);

 protected:
  shared_ptr<TerminalSession> getSession(const string& sessionId);
  /** @brief Removes the session from the tables; null if already gone. */
  shared_ptr<TerminalSession> removeSession(const string& sessionId);
  void handleProcessExit(const string& sessionId, int exitCode);
  void emit(const SessionLifecycleEvent& event);
  SessionLifecycleEvent closedEvent(const SessionConfig& config,
                                    SessionCloseReason reason);
  static string scopeKey(const string& worktreeId, const string& scope);

  shared_ptr<TerminalProcessFactory> processFactory;
  string shell;
  recursive_mutex registryMutex;
  map<string, shared_ptr<TerminalSession>> sessions;
  map<string, string> sessionsByScope;
  int64_t nextSequence;
  map<int64_t, LifecycleListener> listeners;
  int64_t nextListenerId;
};
}  // namespace tt

#endif
