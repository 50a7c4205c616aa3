#include "ReconnectionEngine.hpp"
#include "ServerFixture.hpp"
#include "SessionApi.hpp"
#include "SocketTransport.hpp"

using namespace tt;

namespace {
json getJson(httplib::Client& client, const string& path,
             const httplib::Headers& headers, int* status) {
  auto response = client.Get(path.c_str(), headers);
  REQUIRE(response);
  *status = response->status;
  return json::parse(response->body);
}

json postJson(httplib::Client& client, const string& path,
              const httplib::Headers& headers, const json& body, int* status) {
  auto response =
      client.Post(path.c_str(), headers, body.dump(), "application/json");
  REQUIRE(response);
  *status = response->status;
  return json::parse(response->body);
}
}  // namespace

TEST_CASE("HTTP routes", "[EndToEnd]") {
  ServerFixture fixture;
  httplib::Client client("127.0.0.1", fixture.httpPort);
  httplib::Headers noHeaders;
  int status = 0;

  json created = postJson(client, "/api/worktrees/wt-1/terminals", noHeaders,
                          json{{"scope", "terminal"}, {"cols", 90}}, &status);
  REQUIRE(status == 200);
  string sessionId = created["sessionId"];
  REQUIRE(fixture.registry->getSessionInfo(sessionId)->size().cols() == 90);

  json active = getJson(client, "/api/worktrees/wt-1/terminals/active?scope=terminal",
                        noHeaders, &status);
  REQUIRE(status == 200);
  REQUIRE(active["sessionId"] == sessionId);

  getJson(client, "/api/worktrees/wt-1/terminals/active?scope=nope", noHeaders,
          &status);
  REQUIRE(status == 400);

  postJson(client, "/api/terminals/" + sessionId + "/resize", noHeaders,
           json{{"cols", 70}, {"rows", 20}}, &status);
  REQUIRE(status == 200);
  REQUIRE(fixture.registry->getSessionInfo(sessionId)->size().rows() == 20);

  postJson(client, "/api/worktrees/missing/terminals", noHeaders, json::object(),
           &status);
  REQUIRE(status == 404);

  auto destroyed = client.Delete(("/api/terminals/" + sessionId).c_str());
  REQUIRE(destroyed);
  REQUIRE(destroyed->status == 200);
  destroyed = client.Delete(("/api/terminals/" + sessionId).c_str());
  REQUIRE(destroyed->status == 404);

  fixture.createSession();
  fixture.createSession();
  auto bulk = client.Delete("/api/worktrees/wt-1/terminals");
  REQUIRE(bulk);
  REQUIRE(json::parse(bulk->body)["destroyed"] == 2);
}

TEST_CASE("HTTP routes require a bearer token when auth is on", "[EndToEnd]") {
  ServerFixture fixture(true);
  httplib::Client client("127.0.0.1", fixture.httpPort);
  int status = 0;

  json rejected =
      getJson(client, "/mobile/v1/agent-sessions?worktreeId=wt-1",
              httplib::Headers(), &status);
  REQUIRE(status == 401);
  REQUIRE(rejected["error"]["code"] == "unauthenticated");

  GatewaySession session = fixture.authority->issue("proj");
  httplib::Headers headers = {
      {"Authorization", "Bearer " + session.accessToken}};
  json listed = getJson(client, "/mobile/v1/agent-sessions?worktreeId=wt-1",
                        headers, &status);
  REQUIRE(status == 200);
  REQUIRE(listed["sessions"].size() == 4);

  postJson(client, "/mobile/v1/agent-sessions/connect", headers,
           json{{"worktreeId", "wt-1"}, {"scope", "claude"}}, &status);
  REQUIRE(status == 404);

  // Refresh needs no access token
  json refreshed = postJson(client, "/auth/refresh", httplib::Headers(),
                            json{{"refreshToken", session.refreshToken}},
                            &status);
  REQUIRE(status == 200);
  string rotated = refreshed["session"]["accessToken"];
  getJson(client, "/mobile/v1/agent-sessions?worktreeId=wt-1", headers,
          &status);
  REQUIRE(status == 401);
  getJson(client, "/mobile/v1/agent-sessions?worktreeId=wt-1",
          httplib::Headers{{"Authorization", "Bearer " + rotated}}, &status);
  REQUIRE(status == 200);
}

TEST_CASE("The engine keeps a terminal across server-side loss",
          "[EndToEnd]") {
  ServerFixture fixture;
  shared_ptr<SessionApi> api(
      new HttpSessionApi("127.0.0.1", fixture.httpPort, fixture.queue, false));
  shared_ptr<TransportFactory> transports(new SocketTransportFactory(
      fixture.clientSocketHandler, fixture.endpoint, fixture.queue));
  shared_ptr<SessionCache> cache(new MemorySessionCache());
  EngineTarget target;
  target.endpoint = fixture.endpoint.name();
  target.worktreeId = "wt-1";
  target.scope = "terminal";

  ReconnectionEngine engine(fixture.queue, api, transports, cache, target);
  string output;
  vector<string> ready;
  vector<int> exitCodes;
  EngineListener listener;
  listener.onData = [&output](const string& data) { output += data; };
  listener.onSessionReady = [&ready](const string& id) { ready.push_back(id); };
  listener.onExit = [&exitCodes](int code) { exitCodes.push_back(code); };
  engine.setListener(listener);

  auto poll = [&engine]() { engine.poll(); };
  engine.connect();
  REQUIRE(fixture.pumpUntil(
      [&]() { return engine.getState() == EngineState::OPEN; }, poll));
  string first = engine.getActiveSessionId();
  REQUIRE(*cache->get(engine.getCacheKey()) == first);
  REQUIRE(fixture.registry->getSessionInfo(first)->size().cols() == 80);

  engine.sendInput("echo h\"\"i\n");
  REQUIRE(fixture.pumpUntil(
      [&]() { return output.find("hi\r\n") != string::npos; }, poll));

  SECTION("Server-side destroy leads to a new shell") {
    fixture.registry->destroy(first);
    REQUIRE(fixture.pumpUntil(
        [&]() {
          return ready.size() == 2 && engine.getState() == EngineState::OPEN;
        },
        poll));
    string second = engine.getActiveSessionId();
    REQUIRE(second != first);
    REQUIRE(fixture.registry->hasSession(second));
    REQUIRE(*cache->get(engine.getCacheKey()) == second);
  }

  SECTION("Shell exit ends the engine") {
    engine.sendInput("exit 5\n");
    REQUIRE(fixture.pumpUntil(
        [&]() { return engine.getState() == EngineState::EXITED; }, poll));
    REQUIRE(exitCodes == vector<int>{5});
    REQUIRE_FALSE(cache->get(engine.getCacheKey()));
  }

  SECTION("Destroy removes the server session") {
    engine.destroy();
    REQUIRE(waitFor([&]() {
      fixture.queue->runReady();
      return !fixture.registry->hasSession(first);
    }));
  }

  engine.disconnect();
}
