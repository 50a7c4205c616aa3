#include "AgentCommand.hpp"

namespace tt {
namespace {
string trim(const string& s) {
  const char* whitespace = " \t\r\n";
  auto begin = s.find_first_not_of(whitespace);
  if (begin == string::npos) {
    return "";
  }
  auto end = s.find_last_not_of(whitespace);
  return s.substr(begin, end - begin + 1);
}

string joinInvocation(const string& program, const vector<string>& args) {
  string invocation = program;
  for (const auto& arg : args) {
    invocation += " " + arg;
  }
  return "exec " + invocation;
}
}  // namespace

bool isAgentScope(const string& scope) {
  return find(AGENT_SCOPES.begin(), AGENT_SCOPES.end(), scope) !=
         AGENT_SCOPES.end();
}

bool isKnownScope(const string& scope) {
  return scope == SCOPE_TERMINAL || isAgentScope(scope);
}

string shellQuoteSingle(const string& value) {
  if (value.empty()) {
    return "''";
  }
  string quoted = value;
  replaceAll(quoted, "'", "'\\''");
  return "'" + quoted + "'";
}

string buildAgentStartupCommand(const string& scope,
                                const AgentLaunch& launch) {
  string prompt = trim(launch.prompt);
  vector<string> args;
  if (scope == "claude") {
    if (launch.skipPermissions) args.push_back("--dangerously-skip-permissions");
    if (!prompt.empty()) args.push_back(shellQuoteSingle(prompt));
    return joinInvocation("claude", args);
  }
  if (scope == "codex") {
    if (launch.skipPermissions)
      args.push_back("--dangerously-bypass-approvals-and-sandbox");
    if (!prompt.empty()) args.push_back(shellQuoteSingle(prompt));
    return joinInvocation("codex", args);
  }
  if (scope == "gemini") {
    if (launch.skipPermissions) args.push_back("--yolo");
    if (!prompt.empty()) {
      args.push_back("-i");
      args.push_back(shellQuoteSingle(prompt));
    }
    return joinInvocation("gemini", args);
  }
  if (scope == "opencode") {
    if (!prompt.empty()) {
      args.push_back("--prompt");
      args.push_back(shellQuoteSingle(prompt));
    }
    string program = launch.skipPermissions
                         ? "OPENCODE_PERMISSION='{\"*\":\"allow\"}' opencode"
                         : "opencode";
    return joinInvocation(program, args);
  }
  throw std::invalid_argument("Not an agent scope: " + scope);
}

int normalizeTerminalDimension(const json& value, int fallback, int minValue,
                               int maxValue) {
  if (!value.is_number()) {
    return fallback;
  }
  double d = value.get<double>();
  if (!std::isfinite(d)) {
    return fallback;
  }
  d = max(double(minValue), min(double(maxValue), std::floor(d)));
  return int(d);
}
}  // namespace tt
