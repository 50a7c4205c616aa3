#ifndef __TT_RECONNECTION_ENGINE_HPP__
#define __TT_RECONNECTION_ENGINE_HPP__

#include "EventQueue.hpp"
#include "Headers.hpp"
#include "SessionApi.hpp"
#include "SessionCache.hpp"
#include "Transport.hpp"

namespace tt {
enum class EngineState {
  IDLE,
  CONNECTING,
  OPEN,
  WAITING_TO_RETRY,
  FAILED,
  EXITED
};

string engineStateName(EngineState state);

/**
 * @brief The logical terminal an engine keeps connected.
 */
struct EngineTarget {
  /** @brief Server identity used in the cache key, e.g. "host:port". */
  string endpoint;
  string worktreeId;
  string scope;
  int cols = 80;
  int rows = 24;
  string startupCommand;
};

struct EngineListener {
  function<void(const string& data)> onData;
  function<void(EngineState state)> onStateChange;
  /** @brief A connection outlived the stability window. */
  function<void(const string& sessionId)> onSessionReady;
  function<void(int exitCode)> onExit;
  /** @brief Recovery stopped; the message tells the user what to do. */
  function<void(const string& message)> onError;
};

/**
 * @brief Keeps one logical terminal attached across drops and restarts.
 *
 * All methods and callbacks run on the thread driving the EventQueue. Every
 * connect(), disconnect() and destroy() bumps the generation; callbacks
 * carry the generation they were issued under and are ignored once it is
 * stale, which is how overlapping attempts are abandoned. The engine must
 * outlive the tasks it leaves on the queue.
 */
class ReconnectionEngine {
 public:
  static constexpr int64_t STABILITY_WINDOW_MS = 180;
  static constexpr int64_t HEARTBEAT_INTERVAL_MS = 8000;
  static constexpr int64_t HEARTBEAT_TIMEOUT_MS = 25000;
  static constexpr int64_t RETRY_DELAY_MS = 1200;
  static constexpr int MAX_RECONNECT_ATTEMPTS = 8;

  ReconnectionEngine(shared_ptr<EventQueue> _eventQueue,
                     shared_ptr<SessionApi> _sessionApi,
                     shared_ptr<TransportFactory> _transportFactory,
                     shared_ptr<SessionCache> _sessionCache,
                     const EngineTarget& _target);
  virtual ~ReconnectionEngine();

  void setListener(const EngineListener& _listener) { listener = _listener; }
  /** @brief Bearer token for attach handshakes and API calls. */
  void setAccessToken(const string& token);

  /** @brief Reattaches to the cached session, or creates one. */
  void connect();
  /** @brief Drops the connection but keeps the session for later. */
  void disconnect();
  /** @brief Ends the session server-side and forgets it. */
  void destroy();

  void sendInput(const string& data);
  /** @brief Sends a resize unless it matches the last size sent. */
  void sendResize(int cols, int rows);

  /** @brief Reads ready inbound traffic on the current transport. */
  void poll();
  /** @brief Transport descriptor to wait on, or -1. */
  int getFd();

  EngineState getState() { return state; }
  int64_t getGeneration() { return generation; }
  int getReconnectAttempt() { return reconnectAttempt; }
  const string& getLastFailureReason() { return lastFailureReason; }
  const string& getActiveSessionId() { return activeSessionId; }
  const EngineTarget& getTarget() { return target; }
  SessionCacheKey getCacheKey();

 protected:
  /**
   * REUSE: first attach to a cached id. FRESH: attach right after creation.
   * RETRY: reattach to a session that was working before.
   */
  enum class AttachMode { REUSE, FRESH, RETRY };

  struct Attempt {
    int64_t generation;
    string sessionId;
    AttachMode mode;
    shared_ptr<Transport> transport;
    bool opened = false;
    bool stable = false;
  };

  /** @brief Runs next once credentials are usable (immediately here). */
  virtual void withFreshCredentials(int64_t g, function<void()> next);
  virtual string currentAccessToken() { return accessToken; }
  virtual bool agentOnly() { return false; }
  virtual void createFresh(int64_t g);
  /** @brief Server says the session is gone after it had been working. */
  virtual void recoverMissingSession(int64_t g, const string& failedSessionId);
  /** @brief Discovery found no live session for the scope. */
  virtual void onNoLatestSession(int64_t g);
  virtual void recoverUnauthenticated(int64_t g);
  virtual void onStable(int64_t g);

  bool isCurrent(int64_t g) { return g == generation; }
  int64_t nextGeneration();
  void attachTo(int64_t g, const string& sessionId, AttachMode mode);
  void handleOpen(weak_ptr<Attempt> weakAttempt);
  void handleData(weak_ptr<Attempt> weakAttempt, const string& data);
  void handleControl(weak_ptr<Attempt> weakAttempt, const ControlFrame& frame);
  void handleClose(weak_ptr<Attempt> weakAttempt, const string& reason);
  /** @brief The attempt if it is still the live one, else null. */
  shared_ptr<Attempt> live(weak_ptr<Attempt> weakAttempt);
  /** @brief Policy for a close once the session has been working. */
  void classifyClose(int64_t g, const string& reason);
  void handleExit(int exitCode);
  void scheduleRetry(int64_t g, const string& reason);
  /** @brief Drops the cache entry and the server session, then creates anew. */
  void replaceSession(int64_t g, const string& staleSessionId);
  void heartbeatTick(int64_t g);
  void fail(const string& reason, const string& message);
  void setState(EngineState newState);
  void cancelTimers();
  void dropTransport();
  bool isForbidden(const string& reason);

  shared_ptr<EventQueue> eventQueue;
  shared_ptr<SessionApi> sessionApi;
  shared_ptr<TransportFactory> transportFactory;
  shared_ptr<SessionCache> sessionCache;
  EngineTarget target;
  EngineListener listener;
  string accessToken;

  EngineState state;
  int64_t generation;
  int reconnectAttempt;
  int64_t lastHeartbeatAt;
  string lastFailureReason;
  string activeSessionId;
  shared_ptr<Attempt> current;
  optional<pair<int, int>> lastSentSize;
  int64_t stabilityTimer;
  int64_t heartbeatTimer;
  int64_t retryTimer;
};
}  // namespace tt

#endif  // __TT_RECONNECTION_ENGINE_HPP__
