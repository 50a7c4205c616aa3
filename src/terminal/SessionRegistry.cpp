#include "SessionRegistry.hpp"

namespace tt {
string sessionCloseReasonName(SessionCloseReason reason) {
  switch (reason) {
    case SessionCloseReason::DESTROYED:
      return "destroyed";
    case SessionCloseReason::EXITED:
      return "exited";
    case SessionCloseReason::SPAWN_FAILED:
      return "spawn-failed";
  }
  return "unknown";
}

SessionRegistry::SessionRegistry(
    shared_ptr<TerminalProcessFactory> _processFactory, const string& _shell)
    : processFactory(_processFactory),
      shell(_shell),
      nextSequence(0),
      nextListenerId(1) {}

SessionRegistry::~SessionRegistry() { destroyAll(); }

string SessionRegistry::defaultShell() {
  const char* envShell = ::getenv("SHELL");
  if (envShell && *envShell) {
    return string(envShell);
  }
  return "/bin/zsh";
}

string SessionRegistry::scopeKey(const string& worktreeId,
                                 const string& scope) {
  return worktreeId + "::" + scope;
}

string SessionRegistry::create(const CreateSessionOptions& options) {
  if (!fs::is_directory(options.workingDirectory)) {
    throw SessionSetupError("Worktree path does not exist: " +
                            options.workingDirectory);
  }
  if (!fs::exists(shell)) {
    throw SessionSetupError("Shell not found: " + shell);
  }

  shared_ptr<TerminalSession> session;
  {
    lock_guard<recursive_mutex> guard(registryMutex);
    if (!options.scope.empty()) {
      auto it = sessionsByScope.find(scopeKey(options.worktreeId, options.scope));
      if (it != sessionsByScope.end()) {
        if (sessions.find(it->second) != sessions.end()) {
          VLOG(1) << "Reusing " << it->second << " for scope "
                  << options.scope;
          return it->second;
        }
        sessionsByScope.erase(it);
      }
    }

    SessionConfig config;
    config.id = "term-" + sole::uuid4().str();
    config.worktreeId = options.worktreeId;
    config.scope = options.scope;
    config.workingDirectory = options.workingDirectory;
    config.startupCommand = options.startupCommand;
    config.cols = options.cols;
    config.rows = options.rows;
    config.sequence = ++nextSequence;
    session.reset(new TerminalSession(config, processFactory->create()));

    if (options.spawnImmediately) {
      // Nothing else can see the session yet, so a failure leaves no trace
      string sessionId = config.id;
      try {
        if (!session->ensureSpawned(shell, [this, sessionId](int exitCode) {
              handleProcessExit(sessionId, exitCode);
            })) {
          throw std::runtime_error("Session closed before it spawned");
        }
      } catch (const std::runtime_error& re) {
        LOG(ERROR) << "Failed to spawn " << sessionId << ": " << re.what();
        throw SessionSetupError("Failed to start terminal session");
      }
    }

    sessions[config.id] = session;
    if (!config.scope.empty()) {
      sessionsByScope[scopeKey(config.worktreeId, config.scope)] = config.id;
    }
  }

  const SessionConfig& config = session->getConfig();
  LOG(INFO) << "Created session " << config.id << " worktree=" << config.worktreeId
            << " scope=" << config.scope << " size=" << config.cols << "x"
            << config.rows << " startupCommand=" << !config.startupCommand.empty();
  SessionLifecycleEvent event;
  event.created = true;
  event.sessionId = config.id;
  event.worktreeId = config.worktreeId;
  event.scope = config.scope;
  emit(event);
  return config.id;
}

AttachResult SessionRegistry::attach(const string& sessionId,
                                     shared_ptr<TerminalConnection> conn) {
  auto session = getSession(sessionId);
  if (!session) {
    conn->reject(SESSION_NOT_FOUND, "Session not found: " + sessionId);
    return AttachResult::SESSION_NOT_FOUND;
  }

  try {
    if (!session->ensureSpawned(shell, [this, sessionId](int exitCode) {
          handleProcessExit(sessionId, exitCode);
        })) {
      // destroy() finished between the lookup and the spawn
      conn->reject(SESSION_NOT_FOUND, "Session not found: " + sessionId);
      return AttachResult::SESSION_NOT_FOUND;
    }
  } catch (const std::runtime_error& re) {
    LOG(ERROR) << "Failed to spawn " << sessionId << ": " << re.what();
    conn->reject(SPAWN_FAILED, "Failed to start terminal session");
    auto removed = removeSession(sessionId);
    if (removed) {
      removed->shutdown();
      emit(closedEvent(removed->getConfig(), SessionCloseReason::SPAWN_FAILED));
    }
    return AttachResult::SPAWN_FAILED;
  }

  try {
    if (!session->attachConnection(conn)) {
      conn->reject(SESSION_NOT_FOUND, "Session not found: " + sessionId);
      return AttachResult::SESSION_NOT_FOUND;
    }
  } catch (const std::runtime_error& re) {
    LOG(WARNING) << "Attach to " << sessionId << " failed: " << re.what();
    return AttachResult::CONNECTION_FAILED;
  }
  LOG(INFO) << "Attached connection " << conn->getSocketFd() << " to "
            << sessionId;
  return AttachResult::ATTACHED;
}

bool SessionRegistry::resize(const string& sessionId, int cols, int rows) {
  auto session = getSession(sessionId);
  if (!session) {
    return false;
  }
  session->resize(cols, rows);
  return true;
}

bool SessionRegistry::destroy(const string& sessionId) {
  auto session = removeSession(sessionId);
  if (!session) {
    return false;
  }
  LOG(INFO) << "Destroying session " << sessionId;
  session->shutdown();
  emit(closedEvent(session->getConfig(), SessionCloseReason::DESTROYED));
  return true;
}

int SessionRegistry::destroyAllFor(const string& worktreeId) {
  vector<string> ids;
  {
    lock_guard<recursive_mutex> guard(registryMutex);
    for (const auto& it : sessions) {
      if (it.second->getConfig().worktreeId == worktreeId) {
        ids.push_back(it.first);
      }
    }
  }
  int destroyed = 0;
  for (const auto& id : ids) {
    if (destroy(id)) {
      destroyed++;
    }
  }
  return destroyed;
}

void SessionRegistry::destroyAll() {
  vector<string> ids;
  {
    lock_guard<recursive_mutex> guard(registryMutex);
    for (const auto& it : sessions) {
      ids.push_back(it.first);
    }
  }
  for (const auto& id : ids) {
    destroy(id);
  }
}

void SessionRegistry::handleProcessExit(const string& sessionId,
                                        int exitCode) {
  auto session = removeSession(sessionId);
  if (!session) {
    // destroy() got there first
    return;
  }
  session->finishWithExit(exitCode);
  SessionLifecycleEvent event =
      closedEvent(session->getConfig(), SessionCloseReason::EXITED);
  event.exitCode = exitCode;
  emit(event);
}

shared_ptr<TerminalSession> SessionRegistry::getSession(
    const string& sessionId) {
  lock_guard<recursive_mutex> guard(registryMutex);
  auto it = sessions.find(sessionId);
  if (it == sessions.end()) {
    return nullptr;
  }
  return it->second;
}

shared_ptr<TerminalSession> SessionRegistry::removeSession(
    const string& sessionId) {
  lock_guard<recursive_mutex> guard(registryMutex);
  auto it = sessions.find(sessionId);
  if (it == sessions.end()) {
    return nullptr;
  }
  auto session = it->second;
  sessions.erase(it);
  const SessionConfig& config = session->getConfig();
  if (!config.scope.empty()) {
    auto key = scopeKey(config.worktreeId, config.scope);
    auto scopeIt = sessionsByScope.find(key);
    if (scopeIt != sessionsByScope.end() && scopeIt->second == sessionId) {
      sessionsByScope.erase(scopeIt);
    }
  }
  return session;
}

bool SessionRegistry::hasSession(const string& sessionId) {
  return getSession(sessionId) != nullptr;
}

optional<string> SessionRegistry::getSessionIdForScope(const string& worktreeId,
                                                       const string& scope) {
  lock_guard<recursive_mutex> guard(registryMutex);
  auto it = sessionsByScope.find(scopeKey(worktreeId, scope));
  if (it == sessionsByScope.end() ||
      sessions.find(it->second) == sessions.end()) {
    return nullopt;
  }
  return it->second;
}

optional<SessionInfo> SessionRegistry::getSessionInfo(
    const string& sessionId) {
  auto session = getSession(sessionId);
  if (!session) {
    return nullopt;
  }
  return session->getInfo();
}

vector<SessionInfo> SessionRegistry::listSessions(const string& worktreeId) {
  vector<shared_ptr<TerminalSession>> matching;
  {
    lock_guard<recursive_mutex> guard(registryMutex);
    for (const auto& it : sessions) {
      if (it.second->getConfig().worktreeId == worktreeId) {
        matching.push_back(it.second);
      }
    }
  }
  sort(matching.begin(), matching.end(),
       [](const shared_ptr<TerminalSession>& a,
          const shared_ptr<TerminalSession>& b) {
         return a->getConfig().sequence > b->getConfig().sequence;
       });
  vector<SessionInfo> infos;
  for (const auto& session : matching) {
    infos.push_back(session->getInfo());
  }
  return infos;
}

string SessionRegistry::getBufferContents(const string& sessionId) {
  auto session = getSession(sessionId);
  return session ? session->getBufferContents() : "";
}

int SessionRegistry::size() {
  lock_guard<recursive_mutex> guard(registryMutex);
  return int(sessions.size());
}

int64_t SessionRegistry::subscribe(LifecycleListener listener) {
  lock_guard<recursive_mutex> guard(registryMutex);
  int64_t id = nextListenerId++;
  listeners[id] = listener;
  return id;
}

void SessionRegistry::unsubscribe(int64_t listenerId) {
  lock_guard<recursive_mutex> guard(registryMutex);
  listeners.erase(listenerId);
}

SessionLifecycleEvent SessionRegistry::closedEvent(const SessionConfig& config,
                                                   SessionCloseReason reason) {
  SessionLifecycleEvent event;
  event.created = false;
  event.sessionId = config.id;
  event.worktreeId = config.worktreeId;
  event.scope = config.scope;
  event.reason = reason;
  return event;
}

void SessionRegistry::emit(const SessionLifecycleEvent& event) {
  vector<LifecycleListener> toNotify;
  {
    lock_guard<recursive_mutex> guard(registryMutex);
    for (const auto& it : listeners) {
      toNotify.push_back(it.second);
    }
  }
  if (event.created) {
    VLOG(1) << "session-created " << event.sessionId;
  } else {
    LOG(INFO) << "session-closed " << event.sessionId << " reason="
              << sessionCloseReasonName(event.reason)
              << (event.exitCode ? " exitCode=" + to_string(*event.exitCode)
                                 : string(""));
  }
  for (const auto& listener : toNotify) {
    try {
      listener(event);
    } catch (const std::exception& e) {
      LOG(WARNING) << "Session lifecycle listener failed: " << e.what();
    }
  }
}
}  // namespace tt
