#include "TokenAuthority.hpp"

namespace tt {
json GatewaySession::toJson() const {
  json j;
  j["accessToken"] = accessToken;
  j["refreshToken"] = refreshToken;
  j["expiresAt"] = expiresAtMs;
  j["projectId"] = projectId;
  return j;
}

GatewaySession GatewaySession::fromJson(const json& j) {
  GatewaySession session;
  session.accessToken = j.at("accessToken").get<string>();
  session.refreshToken = j.at("refreshToken").get<string>();
  session.expiresAtMs = j.at("expiresAt").get<int64_t>();
  session.projectId = j.value("projectId", string());
  return session;
}

TokenAuthority::TokenAuthority(shared_ptr<Clock> _clock, int64_t _lifetimeMs)
    : clock(_clock), lifetimeMs(_lifetimeMs) {
  if (sodium_init() == -1) {
    STFATAL << "libsodium failed to initialize";
  }
}

GatewaySession TokenAuthority::issue(const string& projectId) {
  lock_guard<recursive_mutex> guard(authMutex);
  GatewaySession session;
  session.accessToken = genRandomAlphaNum(TOKEN_LENGTH);
  session.refreshToken = genRandomAlphaNum(TOKEN_LENGTH);
  session.expiresAtMs = clock->nowMs() + lifetimeMs;
  session.projectId = projectId;
  grants[session.accessToken] =
      Grant{session.refreshToken, projectId, session.expiresAtMs};
  accessTokenForRefresh[session.refreshToken] = session.accessToken;
  VLOG(1) << "Issued token for project " << projectId;
  return session;
}

map<string, TokenAuthority::Grant>::iterator TokenAuthority::findAccessToken(
    const string& accessToken) {
  auto found = grants.end();
  for (auto it = grants.begin(); it != grants.end(); ++it) {
    if (it->first.length() == accessToken.length() &&
        sodium_memcmp(it->first.data(), accessToken.data(),
                      accessToken.length()) == 0) {
      found = it;
    }
  }
  return found;
}

TokenCheck TokenAuthority::validate(const string& accessToken,
                                    const string& projectId) {
  lock_guard<recursive_mutex> guard(authMutex);
  if (accessToken.empty()) {
    return TokenCheck::UNAUTHENTICATED;
  }
  auto it = findAccessToken(accessToken);
  if (it == grants.end()) {
    return TokenCheck::UNAUTHENTICATED;
  }
  if (it->second.expiresAtMs <= clock->nowMs()) {
    VLOG(1) << "Rejecting expired token";
    return TokenCheck::UNAUTHENTICATED;
  }
  if (!projectId.empty() && it->second.projectId != projectId) {
    return TokenCheck::PROJECT_FORBIDDEN;
  }
  return TokenCheck::OK;
}

optional<GatewaySession> TokenAuthority::refresh(const string& refreshToken) {
  lock_guard<recursive_mutex> guard(authMutex);
  auto it = accessTokenForRefresh.find(refreshToken);
  if (refreshToken.empty() || it == accessTokenForRefresh.end()) {
    return nullopt;
  }
  string projectId;
  auto grantIt = grants.find(it->second);
  if (grantIt != grants.end()) {
    projectId = grantIt->second.projectId;
    grants.erase(grantIt);
  }
  accessTokenForRefresh.erase(it);
  LOG(INFO) << "Refreshed gateway session for project " << projectId;
  return issue(projectId);
}

void TokenAuthority::revoke(const string& accessToken) {
  lock_guard<recursive_mutex> guard(authMutex);
  auto it = grants.find(accessToken);
  if (it == grants.end()) {
    return;
  }
  accessTokenForRefresh.erase(it->second.refreshToken);
  grants.erase(it);
}
}  // namespace tt
