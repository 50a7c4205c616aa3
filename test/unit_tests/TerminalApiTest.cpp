#include "TerminalApi.hpp"

#include "AgentCommand.hpp"
#include "FakeTerminalProcess.hpp"
#include "ManualClock.hpp"
#include "TestHeaders.hpp"

using namespace tt;

namespace {
class ApiFixture {
 public:
  explicit ApiFixture(bool withAuth = false)
      : factory(new FakeTerminalProcessFactory()),
        registry(new SessionRegistry(factory, "/bin/sh")),
        clock(new ManualClock()) {
    worktreeDir = makeTempDirectory("tt_api");
    if (withAuth) {
      authority.reset(
          new TokenAuthority(clock, TokenAuthority::DEFAULT_LIFETIME_MS));
    }
    map<string, string> worktrees = {{"wt-1", worktreeDir},
                                     {"wt-gone", worktreeDir + "/gone"}};
    api.reset(new TerminalApi(registry, worktrees, authority, "proj"));
  }

  ~ApiFixture() {
    api.reset();
    registry.reset();
    std::error_code ec;
    fs::remove_all(worktreeDir, ec);
  }

  shared_ptr<FakeTerminalProcessFactory> factory;
  shared_ptr<SessionRegistry> registry;
  shared_ptr<ManualClock> clock;
  shared_ptr<TokenAuthority> authority;
  shared_ptr<TerminalApi> api;
  string worktreeDir;
};
}  // namespace

TEST_CASE("Creating terminals", "[TerminalApi]") {
  ApiFixture fixture;

  SECTION("Plain shell with defaults") {
    ApiResponse response = fixture.api->createTerminal("wt-1", "");
    REQUIRE(response.status == 200);
    REQUIRE(response.body["success"] == true);
    string id = response.body["sessionId"];
    auto info = fixture.registry->getSessionInfo(id);
    REQUIRE(info->size().cols() == 80);
    REQUIRE(info->size().rows() == 24);
    REQUIRE_FALSE(info->spawned());
  }

  SECTION("Dimensions are clamped") {
    ApiResponse response =
        fixture.api->createTerminal("wt-1", R"({"cols":5000,"rows":0})");
    auto info = fixture.registry->getSessionInfo(response.body["sessionId"].get<string>());
    REQUIRE(info->size().cols() == 1000);
    REQUIRE(info->size().rows() == 1);
  }

  SECTION("Unknown worktree") {
    ApiResponse response = fixture.api->createTerminal("nope", "{}");
    REQUIRE(response.status == 404);
    REQUIRE(response.body["success"] == false);
  }

  SECTION("Worktree directory missing on disk") {
    ApiResponse response = fixture.api->createTerminal("wt-gone", "{}");
    REQUIRE(response.status == 500);
    REQUIRE(fixture.registry->size() == 0);
  }

  SECTION("Resuming an agent needs a running session") {
    ApiResponse response =
        fixture.api->createTerminal("wt-1", R"({"scope":"claude"})");
    REQUIRE(response.status == 404);
    REQUIRE(response.body["error"].get<string>().find("No active claude") == 0);

    string started = fixture.api
                         ->createTerminal("wt-1", R"({"scope":"claude",
                              "startupCommand":"exec claude"})")
                         .body["sessionId"];
    ApiResponse resumed =
        fixture.api->createTerminal("wt-1", R"({"scope":"claude"})");
    REQUIRE(resumed.status == 200);
    REQUIRE(resumed.body["sessionId"] == started);
  }

  SECTION("Malformed bodies fall back to defaults") {
    REQUIRE(fixture.api->createTerminal("wt-1", "{garbage").status == 200);
  }
}

TEST_CASE("Active terminal lookup", "[TerminalApi]") {
  ApiFixture fixture;
  REQUIRE(fixture.api->activeTerminal("wt-1", "bogus").status == 400);

  ApiResponse missing = fixture.api->activeTerminal("wt-1", "terminal");
  REQUIRE(missing.status == 404);
  REQUIRE(missing.body["sessionId"].is_null());

  string id = fixture.api
                  ->createTerminal("wt-1", R"({"scope":"terminal"})")
                  .body["sessionId"];
  ApiResponse found = fixture.api->activeTerminal("wt-1", "terminal");
  REQUIRE(found.status == 200);
  REQUIRE(found.body["sessionId"] == id);
}

TEST_CASE("Resizing and destroying", "[TerminalApi]") {
  ApiFixture fixture;
  string id = fixture.api->createTerminal("wt-1", "").body["sessionId"];

  REQUIRE(fixture.api->resizeTerminal(id, R"({"cols":100})").status == 400);
  REQUIRE(fixture.api->resizeTerminal(id, R"({"cols":"1","rows":2})").status ==
          400);
  REQUIRE(fixture.api->resizeTerminal(id, R"({"cols":100,"rows":40})").status ==
          200);
  REQUIRE(fixture.registry->getSessionInfo(id)->size().cols() == 100);
  REQUIRE(fixture.api->resizeTerminal("term-x", R"({"cols":1,"rows":1})")
              .status == 404);

  REQUIRE(fixture.api->destroyTerminal(id).status == 200);
  REQUIRE(fixture.api->destroyTerminal(id).status == 404);

  fixture.api->createTerminal("wt-1", "");
  fixture.api->createTerminal("wt-1", "");
  ApiResponse bulk = fixture.api->destroyWorktreeTerminals("wt-1");
  REQUIRE(bulk.status == 200);
  REQUIRE(bulk.body["destroyed"] == 2);
}

TEST_CASE("Agent session listing", "[TerminalApi]") {
  ApiFixture fixture;
  fixture.api->createTerminal(
      "wt-1", R"({"scope":"codex","startupCommand":"exec codex"})");

  ApiResponse all = fixture.api->listAgentSessions("wt-1", "");
  REQUIRE(all.status == 200);
  REQUIRE(all.body["worktree"]["id"] == "wt-1");
  REQUIRE(all.body["sessions"].size() == AGENT_SCOPES.size());
  for (const auto& entry : all.body["sessions"]) {
    REQUIRE(entry["active"] == (entry["scope"] == "codex"));
  }

  ApiResponse one = fixture.api->listAgentSessions("wt-1", "codex");
  REQUIRE(one.body["sessions"].size() == 1);
  REQUIRE(one.body["sessions"][0]["sessionId"].is_string());

  REQUIRE(fixture.api->listAgentSessions(" ", "").status == 400);
  REQUIRE(fixture.api->listAgentSessions("nope", "").status == 404);
  ApiResponse badScope = fixture.api->listAgentSessions("wt-1", "terminal");
  REQUIRE(badScope.status == 400);
  REQUIRE(badScope.body["error"]["code"] == "invalid_payload");
}

TEST_CASE("Agent session connect", "[TerminalApi]") {
  ApiFixture fixture;

  SECTION("Payload validation") {
    REQUIRE(fixture.api
                ->connectAgentSession(
                    R"({"worktreeId":"wt-1","scope":"claude","color":"red"})")
                .body["error"]["message"] == "Unknown field(s): color.");
    REQUIRE(fixture.api->connectAgentSession(R"({"scope":"claude"})").status ==
            400);
    REQUIRE(fixture.api
                ->connectAgentSession(
                    R"({"worktreeId":"wt-1","scope":"terminal"})")
                .status == 400);
    REQUIRE(fixture.api
                ->connectAgentSession(R"({"worktreeId":"wt-1","scope":"claude",
                    "startIfMissing":"yes"})")
                .status == 400);
    REQUIRE(fixture.api
                ->connectAgentSession(
                    R"({"worktreeId":"wt-1","scope":"claude","cols":"80"})")
                .status == 400);
    REQUIRE(fixture.api
                ->connectAgentSession(R"({"worktreeId":"nope","scope":"claude"})")
                .status == 404);
    json longPrompt = {{"worktreeId", "wt-1"},
                       {"scope", "claude"},
                       {"startIfMissing", true},
                       {"prompt", string(MAX_AGENT_PROMPT_CHARS + 1, 'x')}};
    REQUIRE(fixture.api->connectAgentSession(longPrompt.dump()).status == 400);
    REQUIRE(fixture.registry->size() == 0);
  }

  SECTION("Missing session without startIfMissing") {
    ApiResponse response = fixture.api->connectAgentSession(
        R"({"worktreeId":"wt-1","scope":"gemini"})");
    REQUIRE(response.status == 404);
    REQUIRE(response.body["error"]["code"] == "session_not_found");
  }

  SECTION("Start, then reuse") {
    ApiResponse started = fixture.api->connectAgentSession(
        R"({"worktreeId":"wt-1","scope":"claude","startIfMissing":true,
            "prompt":"fix tests","skipPermissions":true,"cols":10})");
    REQUIRE(started.status == 200);
    REQUIRE(started.body["created"] == true);
    auto process = fixture.factory->get(0);
    // Agent sessions start right away
    REQUIRE(process->spawnCount == 1);
    SpawnOptions options = process->getSpawnOptions();
    REQUIRE(options.startupCommand ==
            "exec claude --dangerously-skip-permissions 'fix tests'");
    REQUIRE(options.cols == 40);
    REQUIRE(options.rows == 30);

    ApiResponse reused = fixture.api->connectAgentSession(
        R"({"worktreeId":"wt-1","scope":"claude","startIfMissing":true})");
    REQUIRE(reused.body["created"] == false);
    REQUIRE(reused.body["sessionId"] == started.body["sessionId"]);
    REQUIRE(fixture.factory->count() == 1);
  }
}

TEST_CASE("Bearer authorization", "[TerminalApi]") {
  SECTION("Disabled auth lets everything through") {
    ApiFixture fixture;
    REQUIRE_FALSE(fixture.api->authorize(""));
    REQUIRE(fixture.api->refreshGatewaySession("{}").status == 404);
  }

  SECTION("Enabled auth") {
    ApiFixture fixture(true);
    GatewaySession session = fixture.authority->issue("proj");

    REQUIRE_FALSE(fixture.api->authorize("Bearer " + session.accessToken));
    auto missing = fixture.api->authorize("");
    REQUIRE(missing->status == 401);
    REQUIRE(missing->body["error"]["code"] == "unauthenticated");
    REQUIRE(fixture.api->authorize(session.accessToken)->status == 401);

    GatewaySession other = fixture.authority->issue("elsewhere");
    auto forbidden = fixture.api->authorize("Bearer " + other.accessToken);
    REQUIRE(forbidden->status == 403);
    REQUIRE(forbidden->body["error"]["code"] == "project_forbidden");

    fixture.clock->advance(TokenAuthority::DEFAULT_LIFETIME_MS);
    REQUIRE(fixture.api->authorize("Bearer " + session.accessToken)->status ==
            401);
  }

  SECTION("Refreshing a gateway session") {
    ApiFixture fixture(true);
    GatewaySession session = fixture.authority->issue("proj");

    REQUIRE(fixture.api->refreshGatewaySession("{}").status == 400);
    REQUIRE(fixture.api->refreshGatewaySession(R"({"refreshToken":"nope"})")
                .status == 401);

    json request = {{"refreshToken", session.refreshToken}};
    ApiResponse refreshed = fixture.api->refreshGatewaySession(request.dump());
    REQUIRE(refreshed.status == 200);
    GatewaySession rotated =
        GatewaySession::fromJson(refreshed.body["session"]);
    REQUIRE_FALSE(fixture.api->authorize("Bearer " + rotated.accessToken));
    REQUIRE(fixture.api->authorize("Bearer " + session.accessToken)->status ==
            401);

    GatewaySession other = fixture.authority->issue("elsewhere");
    request["refreshToken"] = other.refreshToken;
    REQUIRE(fixture.api->refreshGatewaySession(request.dump()).status == 403);
  }
}
