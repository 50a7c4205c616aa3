#ifndef __TT_TERMINAL_API_HPP__
#define __TT_TERMINAL_API_HPP__

#include "Headers.hpp"
#include "SessionRegistry.hpp"
#include "TokenAuthority.hpp"

namespace tt {
struct ApiResponse {
  int status;
  json body;
};

/**
 * @brief The session lifecycle operations behind the HTTP routes.
 *
 * Every method takes already-extracted path/query values plus the raw
 * request body and returns the status code and JSON body to send, so the
 * logic is usable without a listening server.
 */
class TerminalApi {
 public:
  /**
   * @param _worktrees Worktree id to absolute path.
   * @param _tokenAuthority Null when auth is disabled.
   */
  TerminalApi(shared_ptr<SessionRegistry> _registry,
              const map<string, string>& _worktrees,
              shared_ptr<TokenAuthority> _tokenAuthority,
              const string& _projectId);

  /**
   * @brief Checks an Authorization header value.
   * @return The error response to send, or nullopt if the caller may proceed.
   */
  optional<ApiResponse> authorize(const string& authorizationHeader);

  ApiResponse createTerminal(const string& worktreeId, const string& body);
  ApiResponse activeTerminal(const string& worktreeId, const string& scope);
  ApiResponse resizeTerminal(const string& sessionId, const string& body);
  ApiResponse destroyTerminal(const string& sessionId);
  ApiResponse destroyWorktreeTerminals(const string& worktreeId);

  /** @brief One entry per agent scope, optionally filtered to one scope. */
  ApiResponse listAgentSessions(const string& worktreeId, const string& scope);
  ApiResponse connectAgentSession(const string& body);
  ApiResponse refreshGatewaySession(const string& body);

  optional<string> getWorktreePath(const string& worktreeId);

 protected:
  shared_ptr<SessionRegistry> registry;
  map<string, string> worktrees;
  shared_ptr<TokenAuthority> tokenAuthority;
  string projectId;
};
}  // namespace tt

#endif  // __TT_TERMINAL_API_HPP__
