#include "TerminalApi.hpp"

#include "AgentCommand.hpp"

namespace tt {
namespace {
const string BEARER_PREFIX = "Bearer ";

ApiResponse ok(json body) {
  body["success"] = true;
  return ApiResponse{200, body};
}

ApiResponse failure(int status, const string& message) {
  return ApiResponse{status, json{{"success", false}, {"error", message}}};
}

ApiResponse mobileFailure(int status, const string& code,
                          const string& message) {
  return ApiResponse{
      status, json{{"success", false},
                   {"error", json{{"code", code}, {"message", message}}}}};
}

// Empty or malformed bodies read as an empty object
json parseBody(const string& body) {
  if (body.empty()) {
    return json::object();
  }
  json parsed = json::parse(body, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    return json::object();
  }
  return parsed;
}

string trimmed(const string& s) {
  size_t start = s.find_first_not_of(" \t\r\n");
  if (start == string::npos) {
    return "";
  }
  size_t end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}
}  // namespace

TerminalApi::TerminalApi(shared_ptr<SessionRegistry> _registry,
                         const map<string, string>& _worktrees,
                         shared_ptr<TokenAuthority> _tokenAuthority,
                         const string& _projectId)
    : registry(_registry),
      worktrees(_worktrees),
      tokenAuthority(_tokenAuthority),
      projectId(_projectId) {}

optional<string> TerminalApi::getWorktreePath(const string& worktreeId) {
  auto it = worktrees.find(worktreeId);
  if (it == worktrees.end()) {
    return nullopt;
  }
  return it->second;
}

optional<ApiResponse> TerminalApi::authorize(
    const string& authorizationHeader) {
  if (!tokenAuthority) {
    return nullopt;
  }
  string token;
  if (authorizationHeader.compare(0, BEARER_PREFIX.size(), BEARER_PREFIX) ==
      0) {
    token = trimmed(authorizationHeader.substr(BEARER_PREFIX.size()));
  }
  switch (tokenAuthority->validate(token, projectId)) {
    case TokenCheck::OK:
      return nullopt;
    case TokenCheck::PROJECT_FORBIDDEN:
      return mobileFailure(403, "project_forbidden",
                           "Session does not allow access to this project.");
    case TokenCheck::UNAUTHENTICATED:
      break;
  }
  return mobileFailure(401, "unauthenticated", "No active gateway session.");
}

ApiResponse TerminalApi::createTerminal(const string& worktreeId,
                                        const string& body) {
  auto path = getWorktreePath(worktreeId);
  if (!path) {
    return failure(404, "Worktree not found");
  }
  json request = parseBody(body);

  CreateSessionOptions options;
  options.worktreeId = worktreeId;
  options.workingDirectory = *path;
  options.cols = normalizeTerminalDimension(request.value("cols", json()), 80,
                                            1, 1000);
  options.rows = normalizeTerminalDimension(request.value("rows", json()), 24,
                                            1, 1000);
  if (request.contains("scope") && request["scope"].is_string() &&
      isKnownScope(request["scope"].get<string>())) {
    options.scope = request["scope"].get<string>();
  }
  if (request.contains("startupCommand") &&
      request["startupCommand"].is_string() &&
      !trimmed(request["startupCommand"].get<string>()).empty()) {
    options.startupCommand = request["startupCommand"].get<string>();
  }

  // Resuming an agent without a launch command only makes sense if one runs
  if (isAgentScope(options.scope) && options.startupCommand.empty()) {
    auto active = registry->getSessionIdForScope(worktreeId, options.scope);
    if (active) {
      return ok(json{{"sessionId", *active}});
    }
    return failure(404, "No active " + options.scope +
                            " session to resume. Start a new " +
                            options.scope + " session first.");
  }

  try {
    string sessionId = registry->create(options);
    return ok(json{{"sessionId", sessionId}});
  } catch (const SessionSetupError& sse) {
    LOG(ERROR) << "Failed to create session: " << sse.what();
    return failure(500, sse.what());
  }
}

ApiResponse TerminalApi::activeTerminal(const string& worktreeId,
                                        const string& scope) {
  if (!isKnownScope(scope)) {
    return failure(400,
                   "scope is required (\"terminal\", \"claude\", \"codex\", "
                   "\"gemini\", or \"opencode\")");
  }
  auto sessionId = registry->getSessionIdForScope(worktreeId, scope);
  if (!sessionId) {
    return ApiResponse{404, json{{"success", false},
                                 {"sessionId", nullptr},
                                 {"error", "No active session"}}};
  }
  return ok(json{{"sessionId", *sessionId}});
}

ApiResponse TerminalApi::resizeTerminal(const string& sessionId,
                                        const string& body) {
  json request = parseBody(body);
  if (!request.contains("cols") || !request["cols"].is_number() ||
      !request.contains("rows") || !request["rows"].is_number()) {
    return failure(400, "cols and rows are required");
  }
  int cols = normalizeTerminalDimension(request["cols"], 80, 1, 1000);
  int rows = normalizeTerminalDimension(request["rows"], 24, 1, 1000);
  if (!registry->resize(sessionId, cols, rows)) {
    return failure(404, "Session not found");
  }
  return ok(json::object());
}

ApiResponse TerminalApi::destroyTerminal(const string& sessionId) {
  if (!registry->destroy(sessionId)) {
    return failure(404, "Session not found");
  }
  return ok(json::object());
}

ApiResponse TerminalApi::destroyWorktreeTerminals(const string& worktreeId) {
  int destroyed = registry->destroyAllFor(worktreeId);
  return ok(json{{"destroyed", destroyed}});
}

ApiResponse TerminalApi::listAgentSessions(const string& worktreeId,
                                           const string& scope) {
  string id = trimmed(worktreeId);
  if (id.empty()) {
    return mobileFailure(400, "invalid_payload", "worktreeId is required.");
  }
  if (!getWorktreePath(id)) {
    return mobileFailure(404, "worktree_not_found", "Worktree not found.");
  }
  if (!scope.empty() && !isAgentScope(scope)) {
    return mobileFailure(400, "invalid_payload",
                         "scope must be one of \"claude\", \"codex\", "
                         "\"gemini\", or \"opencode\".");
  }

  json sessions = json::array();
  for (const auto& agentScope : AGENT_SCOPES) {
    if (!scope.empty() && agentScope != scope) {
      continue;
    }
    auto sessionId = registry->getSessionIdForScope(id, agentScope);
    json entry = {{"scope", agentScope}, {"active", bool(sessionId)}};
    entry["sessionId"] = sessionId ? json(*sessionId) : json(nullptr);
    sessions.push_back(entry);
  }
  return ok(json{{"worktree", json{{"id", id}}}, {"sessions", sessions}});
}

ApiResponse TerminalApi::connectAgentSession(const string& body) {
  json request = parseBody(body);
  static const set<string> allowedKeys = {
      "worktreeId", "scope", "startIfMissing", "prompt",
      "skipPermissions", "cols", "rows"};
  vector<string> unknownKeys;
  for (auto it = request.begin(); it != request.end(); ++it) {
    if (allowedKeys.find(it.key()) == allowedKeys.end()) {
      unknownKeys.push_back(it.key());
    }
  }
  if (!unknownKeys.empty()) {
    string joined;
    for (const auto& key : unknownKeys) {
      joined += (joined.empty() ? "" : ", ") + key;
    }
    return mobileFailure(400, "invalid_payload",
                         "Unknown field(s): " + joined + ".");
  }

  string worktreeId;
  if (request.contains("worktreeId") && request["worktreeId"].is_string()) {
    worktreeId = trimmed(request["worktreeId"].get<string>());
  }
  if (worktreeId.empty()) {
    return mobileFailure(400, "invalid_payload", "worktreeId is required.");
  }
  if (!request.contains("scope") || !request["scope"].is_string() ||
      !isAgentScope(request["scope"].get<string>())) {
    return mobileFailure(400, "invalid_payload",
                         "scope must be one of \"claude\", \"codex\", "
                         "\"gemini\", or \"opencode\".");
  }
  string scope = request["scope"].get<string>();
  for (const string& key : {string("startIfMissing"), string("skipPermissions")}) {
    if (request.contains(key) && !request[key].is_boolean()) {
      return mobileFailure(400, "invalid_payload",
                           key + " must be a boolean when provided.");
    }
  }
  if (request.contains("prompt") && !request["prompt"].is_string()) {
    return mobileFailure(400, "invalid_payload",
                         "prompt must be a string when provided.");
  }
  for (const string& key : {string("cols"), string("rows")}) {
    if (request.contains(key) && !request[key].is_number()) {
      return mobileFailure(400, "invalid_payload",
                           key + " must be a number when provided.");
    }
  }

  auto path = getWorktreePath(worktreeId);
  if (!path) {
    return mobileFailure(404, "worktree_not_found", "Worktree not found.");
  }

  auto existing = registry->getSessionIdForScope(worktreeId, scope);
  if (existing) {
    return ok(json{{"sessionId", *existing}, {"created", false}});
  }
  if (request.value("startIfMissing", false) != true) {
    return mobileFailure(404, "session_not_found",
                         "No active session for this worktree and scope.");
  }

  AgentLaunch launch;
  if (request.contains("prompt")) {
    launch.prompt = trimmed(request["prompt"].get<string>());
    if (launch.prompt.size() > MAX_AGENT_PROMPT_CHARS) {
      return mobileFailure(400, "invalid_payload",
                           "prompt must be <= " +
                               to_string(MAX_AGENT_PROMPT_CHARS) +
                               " characters.");
    }
  }
  launch.skipPermissions = request.value("skipPermissions", false);

  CreateSessionOptions options;
  options.worktreeId = worktreeId;
  options.workingDirectory = *path;
  options.scope = scope;
  options.cols =
      normalizeTerminalDimension(request.value("cols", json()), 120, 40, 320);
  options.rows =
      normalizeTerminalDimension(request.value("rows", json()), 30, 10, 120);
  options.startupCommand = buildAgentStartupCommand(scope, launch);
  options.spawnImmediately = true;
  try {
    string sessionId = registry->create(options);
    return ok(json{{"sessionId", sessionId}, {"created", true}});
  } catch (const SessionSetupError& sse) {
    LOG(ERROR) << "Failed to create agent session: " << sse.what();
    return mobileFailure(500, "session_create_failed", sse.what());
  }
}

ApiResponse TerminalApi::refreshGatewaySession(const string& body) {
  if (!tokenAuthority) {
    return mobileFailure(404, "auth_disabled",
                         "This server does not issue gateway sessions.");
  }
  json request = parseBody(body);
  if (!request.contains("refreshToken") ||
      !request["refreshToken"].is_string()) {
    return mobileFailure(400, "invalid_payload", "refreshToken is required.");
  }
  auto session = tokenAuthority->refresh(request["refreshToken"].get<string>());
  if (!session) {
    return mobileFailure(401, "unauthenticated",
                         "Refresh token is not recognized.");
  }
  if (!projectId.empty() && session->projectId != projectId) {
    tokenAuthority->revoke(session->accessToken);
    return mobileFailure(403, "project_forbidden",
                         "Session does not allow access to this project.");
  }
  return ok(json{{"session", session->toJson()}});
}
}  // namespace tt
