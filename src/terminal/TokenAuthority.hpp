#ifndef __TT_TOKEN_AUTHORITY_HPP__
#define __TT_TOKEN_AUTHORITY_HPP__

#include "Clock.hpp"
#include "Headers.hpp"

namespace tt {
/**
 * @brief Bearer credentials handed to a paired client.
 */
struct GatewaySession {
  string accessToken;
  string refreshToken;
  /** @brief Wall-clock expiry of accessToken, in ms since the epoch. */
  int64_t expiresAtMs = 0;
  string projectId;

  json toJson() const;
  /** @throws json::exception when a field is missing or mistyped. */
  static GatewaySession fromJson(const json& j);
};

enum class TokenCheck { OK, UNAUTHENTICATED, PROJECT_FORBIDDEN };

/**
 * @brief Issues, validates and rotates access tokens for one server.
 */
class TokenAuthority {
 public:
  static constexpr int64_t DEFAULT_LIFETIME_MS = 15 * 60 * 1000;
  static constexpr int TOKEN_LENGTH = 48;

  TokenAuthority(shared_ptr<Clock> _clock, int64_t _lifetimeMs);

  GatewaySession issue(const string& projectId);

  /**
   * @param projectId When non-empty, the token must have been issued for
   * this project.
   */
  TokenCheck validate(const string& accessToken, const string& projectId);

  /**
   * @brief Rotates both tokens. The old access token stops working.
   * @return nullopt if the refresh token is unknown.
   */
  optional<GatewaySession> refresh(const string& refreshToken);

  void revoke(const string& accessToken);

 protected:
  struct Grant {
    string refreshToken;
    string projectId;
    int64_t expiresAtMs;
  };

  /** @brief Constant-time lookup so token probing leaks no timing. */
  map<string, Grant>::iterator findAccessToken(const string& accessToken);

  shared_ptr<Clock> clock;
  int64_t lifetimeMs;
  recursive_mutex authMutex;
  map<string, Grant> grants;
  map<string, string> accessTokenForRefresh;
};
}  // namespace tt

#endif
