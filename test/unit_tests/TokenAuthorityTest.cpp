#include "TokenAuthority.hpp"

#include "ManualClock.hpp"
#include "TestHeaders.hpp"

using namespace tt;

TEST_CASE("TokenAuthority validates issued tokens", "[TokenAuthority]") {
  shared_ptr<ManualClock> clock(new ManualClock());
  TokenAuthority authority(clock, TokenAuthority::DEFAULT_LIFETIME_MS);
  GatewaySession session = authority.issue("proj");

  REQUIRE(session.accessToken.length() == TokenAuthority::TOKEN_LENGTH);
  REQUIRE(session.accessToken != session.refreshToken);
  REQUIRE(session.expiresAtMs == clock->nowMs() + 15 * 60 * 1000);

  SECTION("Valid for its own project") {
    REQUIRE(authority.validate(session.accessToken, "proj") == TokenCheck::OK);
    REQUIRE(authority.validate(session.accessToken, "") == TokenCheck::OK);
  }

  SECTION("Forbidden for another project") {
    REQUIRE(authority.validate(session.accessToken, "other") ==
            TokenCheck::PROJECT_FORBIDDEN);
  }

  SECTION("Unknown or empty tokens") {
    REQUIRE(authority.validate("", "proj") == TokenCheck::UNAUTHENTICATED);
    REQUIRE(authority.validate(session.refreshToken, "proj") ==
            TokenCheck::UNAUTHENTICATED);
  }

  SECTION("Expiry") {
    clock->advance(TokenAuthority::DEFAULT_LIFETIME_MS - 1);
    REQUIRE(authority.validate(session.accessToken, "proj") == TokenCheck::OK);
    clock->advance(1);
    REQUIRE(authority.validate(session.accessToken, "proj") ==
            TokenCheck::UNAUTHENTICATED);
  }

  SECTION("Refresh rotates both tokens") {
    clock->advance(TokenAuthority::DEFAULT_LIFETIME_MS * 2);
    auto refreshed = authority.refresh(session.refreshToken);
    REQUIRE(refreshed);
    REQUIRE(refreshed->projectId == "proj");
    REQUIRE(authority.validate(refreshed->accessToken, "proj") ==
            TokenCheck::OK);
    REQUIRE(authority.validate(session.accessToken, "proj") ==
            TokenCheck::UNAUTHENTICATED);
    // A refresh token is single use
    REQUIRE_FALSE(authority.refresh(session.refreshToken));
  }

  SECTION("Revoke") {
    authority.revoke(session.accessToken);
    REQUIRE(authority.validate(session.accessToken, "proj") ==
            TokenCheck::UNAUTHENTICATED);
    REQUIRE_FALSE(authority.refresh(session.refreshToken));
  }
}

TEST_CASE("GatewaySession JSON", "[TokenAuthority]") {
  GatewaySession session;
  session.accessToken = "a";
  session.refreshToken = "r";
  session.expiresAtMs = 1234;
  session.projectId = "p";
  json j = session.toJson();
  REQUIRE(j["accessToken"] == "a");
  REQUIRE(j["expiresAt"] == 1234);

  GatewaySession parsed = GatewaySession::fromJson(j);
  REQUIRE(parsed.refreshToken == "r");
  REQUIRE(parsed.projectId == "p");

  REQUIRE_THROWS(GatewaySession::fromJson(json{{"accessToken", 5}}));
}
