#ifndef __TT_MOBILE_RECONNECTION_ENGINE_HPP__
#define __TT_MOBILE_RECONNECTION_ENGINE_HPP__

#include "Headers.hpp"
#include "ReconnectionEngine.hpp"
#include "TokenAuthority.hpp"

namespace tt {
/**
 * @brief Engine for paired clients that hold an expiring gateway session.
 *
 * Only agent sessions may be attached. Credentials are refreshed ahead of
 * expiry and after an "unauthenticated" close. A session that disappears
 * after it was attached is replaced by the latest live session for the same
 * scope, never by a new one. A cached session that cannot be reused on
 * connect() is dropped and the scope is connected afresh, which starts its
 * agent only if none is running.
 */
class MobileReconnectionEngine : public ReconnectionEngine {
 public:
  static constexpr int64_t GATEWAY_REFRESH_WINDOW_MS = 60 * 1000;

  /**
   * @param _wallClock Compared against GatewaySession::expiresAtMs.
   */
  MobileReconnectionEngine(shared_ptr<EventQueue> _eventQueue,
                           shared_ptr<SessionApi> _sessionApi,
                           shared_ptr<TransportFactory> _transportFactory,
                           shared_ptr<SessionCache> _sessionCache,
                           const EngineTarget& _target,
                           const GatewaySession& _gatewaySession,
                           shared_ptr<Clock> _wallClock);

  const GatewaySession& getGatewaySession() { return gatewaySession; }
  /** @brief Called with every rotated gateway session so it can be persisted. */
  void setGatewaySessionListener(
      function<void(const GatewaySession&)> _gatewaySessionListener) {
    gatewaySessionListener = _gatewaySessionListener;
  }

 protected:
  virtual void withFreshCredentials(int64_t g, function<void()> next);
  virtual string currentAccessToken() { return gatewaySession.accessToken; }
  virtual bool agentOnly() { return true; }
  virtual void onNoLatestSession(int64_t g);
  virtual void recoverUnauthenticated(int64_t g);
  virtual void onStable(int64_t g);

  void refreshGatewaySession(int64_t g, function<void()> next);

  GatewaySession gatewaySession;
  shared_ptr<Clock> wallClock;
  function<void(const GatewaySession&)> gatewaySessionListener;
  /** @brief A forced refresh already failed to fix an unauthenticated close. */
  bool refreshedSinceStable;
};
}  // namespace tt

#endif  // __TT_MOBILE_RECONNECTION_ENGINE_HPP__
