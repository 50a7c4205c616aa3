#include "ReconnectionEngine.hpp"

namespace tt {
string engineStateName(EngineState state) {
  switch (state) {
    case EngineState::IDLE:
      return "idle";
    case EngineState::CONNECTING:
      return "connecting";
    case EngineState::OPEN:
      return "open";
    case EngineState::WAITING_TO_RETRY:
      return "waiting-to-retry";
    case EngineState::FAILED:
      return "failed";
    case EngineState::EXITED:
      return "exited";
  }
  return "unknown";
}

ReconnectionEngine::ReconnectionEngine(
    shared_ptr<EventQueue> _eventQueue, shared_ptr<SessionApi> _sessionApi,
    shared_ptr<TransportFactory> _transportFactory,
    shared_ptr<SessionCache> _sessionCache, const EngineTarget& _target)
    : eventQueue(_eventQueue),
      sessionApi(_sessionApi),
      transportFactory(_transportFactory),
      sessionCache(_sessionCache),
      target(_target),
      state(EngineState::IDLE),
      generation(0),
      reconnectAttempt(0),
      lastHeartbeatAt(0),
      stabilityTimer(0),
      heartbeatTimer(0),
      retryTimer(0) {}

ReconnectionEngine::~ReconnectionEngine() {
  cancelTimers();
  dropTransport();
}

void ReconnectionEngine::setAccessToken(const string& token) {
  accessToken = token;
  sessionApi->setAccessToken(token);
}

SessionCacheKey ReconnectionEngine::getCacheKey() {
  SessionCacheKey key;
  key.endpoint = target.endpoint;
  key.target = target.worktreeId;
  key.scope = target.scope;
  return key;
}

int64_t ReconnectionEngine::nextGeneration() {
  cancelTimers();
  dropTransport();
  return ++generation;
}

void ReconnectionEngine::cancelTimers() {
  for (int64_t* timer : {&stabilityTimer, &heartbeatTimer, &retryTimer}) {
    if (*timer) {
      eventQueue->cancel(*timer);
      *timer = 0;
    }
  }
}

void ReconnectionEngine::dropTransport() {
  if (current) {
    current->transport->close();
    current.reset();
  }
}

void ReconnectionEngine::setState(EngineState newState) {
  if (state == newState) {
    return;
  }
  VLOG(1) << "Engine " << engineStateName(state) << " -> "
          << engineStateName(newState);
  state = newState;
  if (listener.onStateChange) {
    listener.onStateChange(newState);
  }
}

void ReconnectionEngine::connect() {
  int64_t g = nextGeneration();
  reconnectAttempt = 0;
  lastFailureReason.clear();
  setState(EngineState::CONNECTING);
  withFreshCredentials(g, [this, g]() {
    if (!isCurrent(g)) {
      return;
    }
    auto cached = sessionCache->get(getCacheKey());
    if (cached) {
      LOG(INFO) << "Trying cached session " << *cached;
      attachTo(g, *cached, AttachMode::REUSE);
    } else {
      createFresh(g);
    }
  });
}

void ReconnectionEngine::disconnect() {
  nextGeneration();
  setState(EngineState::IDLE);
}

void ReconnectionEngine::destroy() {
  string sessionId = activeSessionId;
  if (sessionId.empty()) {
    auto cached = sessionCache->get(getCacheKey());
    if (cached) {
      sessionId = *cached;
    }
  }
  nextGeneration();
  sessionCache->erase(getCacheKey());
  activeSessionId.clear();
  if (!sessionId.empty()) {
    sessionApi->destroySession(sessionId, [sessionId](bool destroyed) {
      VLOG(1) << "Destroy " << sessionId << ": " << destroyed;
    });
  }
  setState(EngineState::IDLE);
}

void ReconnectionEngine::withFreshCredentials(int64_t g,
                                              function<void()> next) {
  next();
}

void ReconnectionEngine::createFresh(int64_t g) {
  CreateSessionRequest request;
  request.worktreeId = target.worktreeId;
  request.scope = target.scope;
  request.cols = target.cols;
  request.rows = target.rows;
  request.startupCommand = target.startupCommand;
  sessionApi->createSession(request, [this, g](
                                         const optional<string>& sessionId,
                                         const string& error) {
    if (!isCurrent(g)) {
      // Superseded while in flight; nobody will ever attach to it
      if (sessionId) {
        LOG(INFO) << "Destroying superseded session " << *sessionId;
        sessionApi->destroySession(*sessionId, [](bool) {});
      }
      return;
    }
    if (!sessionId) {
      fail(CLOSE_CONNECTION_FAILED, "Could not start a session: " + error);
      return;
    }
    LOG(INFO) << "Created session " << *sessionId;
    sessionCache->set(getCacheKey(), *sessionId);
    attachTo(g, *sessionId, AttachMode::FRESH);
  });
}

void ReconnectionEngine::attachTo(int64_t g, const string& sessionId,
                                  AttachMode mode) {
  dropTransport();
  activeSessionId = sessionId;
  lastSentSize.reset();
  setState(EngineState::CONNECTING);

  shared_ptr<Attempt> attempt(new Attempt());
  attempt->generation = g;
  attempt->sessionId = sessionId;
  attempt->mode = mode;
  attempt->transport = transportFactory->create();
  current = attempt;

  weak_ptr<Attempt> weakAttempt = attempt;
  TransportHandlers handlers;
  handlers.onOpen = [this, weakAttempt]() { handleOpen(weakAttempt); };
  handlers.onData = [this, weakAttempt](const string& data) {
    handleData(weakAttempt, data);
  };
  handlers.onControl = [this, weakAttempt](const ControlFrame& frame) {
    handleControl(weakAttempt, frame);
  };
  handlers.onClose = [this, weakAttempt](const string& reason) {
    handleClose(weakAttempt, reason);
  };
  attempt->transport->open(sessionId, currentAccessToken(), agentOnly(),
                           handlers);
}

shared_ptr<ReconnectionEngine::Attempt> ReconnectionEngine::live(
    weak_ptr<Attempt> weakAttempt) {
  auto attempt = weakAttempt.lock();
  if (!attempt || attempt != current || !isCurrent(attempt->generation)) {
    return nullptr;
  }
  return attempt;
}

void ReconnectionEngine::handleOpen(weak_ptr<Attempt> weakAttempt) {
  auto attempt = live(weakAttempt);
  if (!attempt) {
    return;
  }
  attempt->opened = true;
  lastHeartbeatAt = eventQueue->getClock()->nowMs();
  stabilityTimer =
      eventQueue->schedule(STABILITY_WINDOW_MS, [this, weakAttempt]() {
        auto attempt = live(weakAttempt);
        if (!attempt) {
          return;
        }
        stabilityTimer = 0;
        attempt->stable = true;
        onStable(attempt->generation);
      });
}

void ReconnectionEngine::onStable(int64_t g) {
  LOG(INFO) << "Session " << activeSessionId << " is stable";
  reconnectAttempt = 0;
  lastFailureReason.clear();
  heartbeatTimer = eventQueue->schedule(
      HEARTBEAT_INTERVAL_MS, [this, g]() { heartbeatTick(g); });
  sendResize(target.cols, target.rows);
  setState(EngineState::OPEN);
  if (isCurrent(g) && listener.onSessionReady) {
    listener.onSessionReady(activeSessionId);
  }
}

void ReconnectionEngine::handleData(weak_ptr<Attempt> weakAttempt,
                                    const string& data) {
  if (!live(weakAttempt)) {
    return;
  }
  lastHeartbeatAt = eventQueue->getClock()->nowMs();
  if (listener.onData) {
    listener.onData(data);
  }
}

void ReconnectionEngine::handleControl(weak_ptr<Attempt> weakAttempt,
                                       const ControlFrame& frame) {
  auto attempt = live(weakAttempt);
  if (!attempt) {
    return;
  }
  lastHeartbeatAt = eventQueue->getClock()->nowMs();
  switch (frame.type) {
    case ControlType::EXIT:
      handleExit(frame.exitCode);
      break;
    case ControlType::PING:
      attempt->transport->sendControl(ControlFrame::pong());
      break;
    case ControlType::PONG:
      break;
    case ControlType::RESIZE:
      VLOG(1) << "Ignoring resize from server";
      break;
  }
}

void ReconnectionEngine::handleClose(weak_ptr<Attempt> weakAttempt,
                                     const string& reason) {
  auto attempt = live(weakAttempt);
  if (!attempt) {
    return;
  }
  int64_t g = attempt->generation;
  if (stabilityTimer) {
    eventQueue->cancel(stabilityTimer);
    stabilityTimer = 0;
  }
  if (heartbeatTimer) {
    eventQueue->cancel(heartbeatTimer);
    heartbeatTimer = 0;
  }
  dropTransport();
  lastFailureReason = reason;
  LOG(INFO) << "Connection to " << attempt->sessionId << " closed (" << reason
            << ") opened=" << attempt->opened << " stable=" << attempt->stable;

  if (!attempt->stable) {
    bool policyFailure = isForbidden(reason) || reason == CLOSE_UNAUTHENTICATED;
    if (attempt->mode == AttachMode::REUSE && !policyFailure) {
      if (reason == CLOSE_CONNECTION_FAILED) {
        // The server is unreachable, which says nothing about the session
        scheduleRetry(g, reason);
      } else {
        replaceSession(g, attempt->sessionId);
      }
      return;
    }
    if (attempt->mode == AttachMode::FRESH && !policyFailure) {
      sessionCache->erase(getCacheKey());
      sessionApi->destroySession(attempt->sessionId, [](bool) {});
      activeSessionId.clear();
      fail(reason, "The new terminal session closed immediately (" + reason +
                       "). Try again.");
      return;
    }
  }
  classifyClose(g, reason);
}

bool ReconnectionEngine::isForbidden(const string& reason) {
  return reason == CLOSE_PROJECT_FORBIDDEN || reason == CLOSE_SCOPE_FORBIDDEN ||
         reason == CLOSE_PROTOCOL_MISMATCH;
}

void ReconnectionEngine::classifyClose(int64_t g, const string& reason) {
  if (isForbidden(reason)) {
    string message;
    if (reason == CLOSE_PROJECT_FORBIDDEN) {
      message = "This client is not allowed to access the project.";
    } else if (reason == CLOSE_SCOPE_FORBIDDEN) {
      message = "This client may only open agent sessions.";
    } else {
      message = "Client and server versions do not match.";
    }
    fail(reason, message);
  } else if (reason == CLOSE_SESSION_NOT_FOUND || reason == CLOSE_SPAWN_FAILED) {
    recoverMissingSession(g, activeSessionId);
  } else if (reason == CLOSE_UNAUTHENTICATED) {
    recoverUnauthenticated(g);
  } else {
    scheduleRetry(g, reason);
  }
}

void ReconnectionEngine::recoverMissingSession(int64_t g,
                                               const string& failedSessionId) {
  sessionCache->erase(getCacheKey());
  setState(EngineState::CONNECTING);
  sessionApi->findLatestSession(
      target.worktreeId, target.scope,
      [this, g, failedSessionId](const optional<string>& sessionId) {
        // Something newer may have taken over while we were asking
        if (!isCurrent(g) || activeSessionId != failedSessionId) {
          return;
        }
        if (sessionId && *sessionId != failedSessionId) {
          LOG(INFO) << "Switching to latest session " << *sessionId;
          sessionCache->set(getCacheKey(), *sessionId);
          attachTo(g, *sessionId, AttachMode::RETRY);
          return;
        }
        onNoLatestSession(g);
      });
}

void ReconnectionEngine::onNoLatestSession(int64_t g) {
  activeSessionId.clear();
  createFresh(g);
}

void ReconnectionEngine::recoverUnauthenticated(int64_t g) {
  fail(CLOSE_UNAUTHENTICATED,
       "The server rejected the access token. Pair this client again.");
}

void ReconnectionEngine::replaceSession(int64_t g,
                                        const string& staleSessionId) {
  LOG(INFO) << "Cached session " << staleSessionId
            << " is unusable, starting a new one";
  sessionCache->erase(getCacheKey());
  activeSessionId.clear();
  setState(EngineState::CONNECTING);
  // Wait for the destroy so a scoped create cannot hand the stale id back
  sessionApi->destroySession(staleSessionId, [this, g](bool) {
    if (!isCurrent(g)) {
      return;
    }
    createFresh(g);
  });
}

void ReconnectionEngine::scheduleRetry(int64_t g, const string& reason) {
  if (!isCurrent(g)) {
    return;
  }
  reconnectAttempt++;
  if (reconnectAttempt > MAX_RECONNECT_ATTEMPTS) {
    fail(reason, "Connection lost and " + to_string(MAX_RECONNECT_ATTEMPTS) +
                     " reconnect attempts failed. Reconnect manually.");
    return;
  }
  int64_t delay = RETRY_DELAY_MS * reconnectAttempt;
  LOG(INFO) << "Reconnect attempt " << reconnectAttempt << " in " << delay
            << "ms (" << reason << ")";
  setState(EngineState::WAITING_TO_RETRY);
  retryTimer = eventQueue->schedule(delay, [this, g]() {
    if (!isCurrent(g)) {
      return;
    }
    retryTimer = 0;
    setState(EngineState::CONNECTING);
    withFreshCredentials(g, [this, g]() {
      if (!isCurrent(g)) {
        return;
      }
      string sessionId = activeSessionId;
      if (sessionId.empty()) {
        auto cached = sessionCache->get(getCacheKey());
        if (!cached) {
          createFresh(g);
          return;
        }
        sessionId = *cached;
      }
      attachTo(g, sessionId, AttachMode::RETRY);
    });
  });
}

void ReconnectionEngine::handleExit(int exitCode) {
  LOG(INFO) << "Session " << activeSessionId << " exited with " << exitCode;
  sessionCache->erase(getCacheKey());
  nextGeneration();
  activeSessionId.clear();
  setState(EngineState::EXITED);
  if (listener.onExit) {
    listener.onExit(exitCode);
  }
}

void ReconnectionEngine::heartbeatTick(int64_t g) {
  if (!isCurrent(g) || !current || !current->stable) {
    return;
  }
  heartbeatTimer = 0;
  int64_t now = eventQueue->getClock()->nowMs();
  if (now - lastHeartbeatAt > HEARTBEAT_TIMEOUT_MS) {
    LOG(WARNING) << "No traffic for " << (now - lastHeartbeatAt)
                 << "ms, dropping connection";
    handleClose(current, CLOSE_HEARTBEAT_TIMEOUT);
    return;
  }
  current->transport->sendControl(ControlFrame::ping());
  heartbeatTimer = eventQueue->schedule(HEARTBEAT_INTERVAL_MS,
                                        [this, g]() { heartbeatTick(g); });
}

void ReconnectionEngine::fail(const string& reason, const string& message) {
  LOG(WARNING) << "Giving up (" << reason << "): " << message;
  nextGeneration();
  lastFailureReason = reason;
  setState(EngineState::FAILED);
  if (listener.onError) {
    listener.onError(message);
  }
}

void ReconnectionEngine::sendInput(const string& data) {
  if (current && current->opened && current->transport->isOpen()) {
    current->transport->sendData(data);
  }
}

void ReconnectionEngine::sendResize(int cols, int rows) {
  target.cols = cols;
  target.rows = rows;
  if (lastSentSize && lastSentSize->first == cols &&
      lastSentSize->second == rows) {
    return;
  }
  if (current && current->opened && current->transport->isOpen()) {
    current->transport->sendControl(ControlFrame::resize(cols, rows));
    lastSentSize = make_pair(cols, rows);
  }
}

void ReconnectionEngine::poll() {
  if (current) {
    current->transport->poll();
  }
}

int ReconnectionEngine::getFd() {
  return current ? current->transport->getFd() : -1;
}
}  // namespace tt
