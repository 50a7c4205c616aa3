#ifndef __TT_AGENT_COMMAND_HPP__
#define __TT_AGENT_COMMAND_HPP__

#include "Headers.hpp"

namespace tt {
const string SCOPE_TERMINAL = "terminal";
const vector<string> AGENT_SCOPES = {"claude", "codex", "gemini", "opencode"};
const size_t MAX_AGENT_PROMPT_CHARS = 4000;

/** @brief True for the coding-agent launch profiles. */
bool isAgentScope(const string& scope);
/** @brief True for "terminal" and every agent scope. */
bool isKnownScope(const string& scope);

/** @brief Quotes a value for a POSIX shell: a'b becomes 'a'\''b'. */
string shellQuoteSingle(const string& value);

struct AgentLaunch {
  string prompt;
  bool skipPermissions = false;
};

/**
 * @brief The `exec <agent> ...` line a login shell runs for an agent scope.
 *
 * `exec` replaces the shell so the pty's exit code is the agent's.
 * @throws std::invalid_argument for a non-agent scope.
 */
string buildAgentStartupCommand(const string& scope, const AgentLaunch& launch);

/**
 * @brief Clamps a client-supplied dimension. Non-numbers yield fallback.
 */
int normalizeTerminalDimension(const json& value, int fallback, int minValue,
                               int maxValue);
}  // namespace tt

#endif
