#include "MobileReconnectionEngine.hpp"

namespace tt {
MobileReconnectionEngine::MobileReconnectionEngine(
    shared_ptr<EventQueue> _eventQueue, shared_ptr<SessionApi> _sessionApi,
    shared_ptr<TransportFactory> _transportFactory,
    shared_ptr<SessionCache> _sessionCache, const EngineTarget& _target,
    const GatewaySession& _gatewaySession, shared_ptr<Clock> _wallClock)
    : ReconnectionEngine(_eventQueue, _sessionApi, _transportFactory,
                         _sessionCache, _target),
      gatewaySession(_gatewaySession),
      wallClock(_wallClock),
      refreshedSinceStable(false) {
  sessionApi->setAccessToken(gatewaySession.accessToken);
}

void MobileReconnectionEngine::withFreshCredentials(int64_t g,
                                                    function<void()> next) {
  int64_t remaining = gatewaySession.expiresAtMs - wallClock->nowMs();
  if (remaining > GATEWAY_REFRESH_WINDOW_MS) {
    next();
    return;
  }
  VLOG(1) << "Gateway session expires in " << remaining << "ms, refreshing";
  refreshGatewaySession(g, next);
}

void MobileReconnectionEngine::refreshGatewaySession(int64_t g,
                                                     function<void()> next) {
  sessionApi->refreshGatewaySession(
      gatewaySession.refreshToken,
      [this, g, next](const optional<GatewaySession>& refreshed) {
        if (!isCurrent(g)) {
          return;
        }
        if (!refreshed) {
          fail(CLOSE_UNAUTHENTICATED,
               "The gateway session expired. Pair this device again.");
          return;
        }
        LOG(INFO) << "Refreshed gateway session";
        gatewaySession = *refreshed;
        sessionApi->setAccessToken(gatewaySession.accessToken);
        if (gatewaySessionListener) {
          gatewaySessionListener(gatewaySession);
        }
        next();
      });
}

void MobileReconnectionEngine::recoverUnauthenticated(int64_t g) {
  if (refreshedSinceStable) {
    fail(CLOSE_UNAUTHENTICATED,
         "The server keeps rejecting this device. Pair it again.");
    return;
  }
  refreshedSinceStable = true;
  setState(EngineState::CONNECTING);
  refreshGatewaySession(g, [this, g]() {
    if (!isCurrent(g)) {
      return;
    }
    if (activeSessionId.empty()) {
      createFresh(g);
    } else {
      attachTo(g, activeSessionId, AttachMode::RETRY);
    }
  });
}

void MobileReconnectionEngine::onNoLatestSession(int64_t g) {
  activeSessionId.clear();
  fail(CLOSE_SESSION_NOT_FOUND, "No active " + target.scope +
                                    " session. Start a new session.");
}

void MobileReconnectionEngine::onStable(int64_t g) {
  refreshedSinceStable = false;
  ReconnectionEngine::onStable(g);
}
}  // namespace tt
