#include "EngineFixture.hpp"

using namespace tt;

TEST_CASE("Fresh sessions become ready after the stability window",
          "[ReconnectionEngine]") {
  EngineFixture fixture;
  fixture.target.cols = 120;
  fixture.target.rows = 40;
  fixture.target.startupCommand = "htop";
  fixture.useBaseEngine();

  fixture.engine->connect();
  REQUIRE(fixture.engine->getState() == EngineState::CONNECTING);
  fixture.run();

  REQUIRE(fixture.api->createRequests.size() == 1);
  CreateSessionRequest request = fixture.api->createRequests[0];
  REQUIRE(request.worktreeId == "wt-1");
  REQUIRE(request.scope == "terminal");
  REQUIRE(request.cols == 120);
  REQUIRE(request.startupCommand == "htop");
  REQUIRE(*fixture.cached() == "session-1");

  auto transport = fixture.transports->last();
  REQUIRE(transport->sessionId == "session-1");
  REQUIRE_FALSE(transport->agentOnly);

  transport->fireOpen();
  fixture.advance(ReconnectionEngine::STABILITY_WINDOW_MS - 10);
  REQUIRE(fixture.engine->getState() == EngineState::CONNECTING);
  REQUIRE(fixture.readySessions.empty());

  fixture.advance(10);
  REQUIRE(fixture.engine->getState() == EngineState::OPEN);
  REQUIRE(fixture.readySessions == vector<string>{"session-1"});
  REQUIRE(transport->countControls(ControlType::RESIZE) == 1);
  REQUIRE(transport->sentControls[0] == ControlFrame::resize(120, 40));
}

TEST_CASE("Data flows both ways once attached", "[ReconnectionEngine]") {
  EngineFixture fixture;
  fixture.useBaseEngine();
  fixture.connectStable();
  auto transport = fixture.transports->last();

  transport->fireData("prompt$ ");
  REQUIRE(fixture.output == "prompt$ ");
  fixture.engine->sendInput("ls\n");
  REQUIRE(transport->sentData == vector<string>{"ls\n"});
}

TEST_CASE("Cached sessions are reattached", "[ReconnectionEngine]") {
  EngineFixture fixture;
  fixture.useBaseEngine();
  fixture.cache->set(fixture.engine->getCacheKey(), "cached-1");

  fixture.engine->connect();
  fixture.run();
  REQUIRE(fixture.api->createRequests.empty());
  REQUIRE(fixture.transports->last()->sessionId == "cached-1");

  SECTION("Stable reuse") {
    fixture.openStable();
    REQUIRE(fixture.readySessions == vector<string>{"cached-1"});
  }

  SECTION("A stale cached session is destroyed and replaced") {
    fixture.transports->last()->fireClose(CLOSE_SESSION_NOT_FOUND);
    REQUIRE_FALSE(fixture.cached());
    fixture.run();
    REQUIRE(fixture.api->destroyed == vector<string>{"cached-1"});
    fixture.run();
    REQUIRE(fixture.api->createRequests.size() == 1);
    REQUIRE(*fixture.cached() == "session-1");
    REQUIRE(fixture.transports->last()->sessionId == "session-1");
    fixture.openStable();
  }

  SECTION("An unreachable server keeps the cached session") {
    fixture.transports->last()->fireClose(CLOSE_CONNECTION_FAILED);
    REQUIRE(fixture.engine->getState() == EngineState::WAITING_TO_RETRY);
    REQUIRE(*fixture.cached() == "cached-1");
    fixture.advance(ReconnectionEngine::RETRY_DELAY_MS);
    REQUIRE(fixture.transports->count() == 2);
    REQUIRE(fixture.transports->last()->sessionId == "cached-1");
    REQUIRE(fixture.api->destroyed.empty());
  }

  SECTION("A cached session that drops before it settles is replaced") {
    fixture.transports->last()->fireOpen();
    fixture.advance(50);
    fixture.transports->last()->fireClose(CLOSE_CONNECTION_LOST);
    fixture.run();
    REQUIRE(fixture.api->destroyed == vector<string>{"cached-1"});
    REQUIRE(fixture.api->createRequests.size() == 1);
  }
}

TEST_CASE("A fresh session that never settles is an error",
          "[ReconnectionEngine]") {
  EngineFixture fixture;
  fixture.useBaseEngine();
  fixture.engine->connect();
  fixture.run();
  fixture.transports->last()->fireOpen();
  fixture.advance(100);
  fixture.transports->last()->fireClose(CLOSE_CONNECTION_LOST);
  fixture.advance(10 * ReconnectionEngine::RETRY_DELAY_MS);

  REQUIRE(fixture.engine->getState() == EngineState::FAILED);
  REQUIRE(fixture.errors.size() == 1);
  REQUIRE(fixture.api->createRequests.size() == 1);
  REQUIRE(fixture.api->destroyed == vector<string>{"session-1"});
  REQUIRE_FALSE(fixture.cached());
  REQUIRE(fixture.transports->count() == 1);
}

TEST_CASE("Create failures are reported", "[ReconnectionEngine]") {
  EngineFixture fixture;
  fixture.useBaseEngine();
  fixture.api->createResults.push_back(nullopt);
  fixture.engine->connect();
  fixture.run();
  REQUIRE(fixture.engine->getState() == EngineState::FAILED);
  REQUIRE(fixture.errors[0].find("create refused") != string::npos);
  REQUIRE(fixture.transports->count() == 0);
}

TEST_CASE("Superseded creates are cleaned up", "[ReconnectionEngine]") {
  EngineFixture fixture;
  fixture.useBaseEngine();
  fixture.api->holdCreates = true;

  fixture.engine->connect();
  fixture.run();
  fixture.engine->connect();
  fixture.run();
  REQUIRE(fixture.api->heldCreates.size() == 2);

  string stale = fixture.api->completeHeldCreate(0);
  fixture.run();
  REQUIRE(fixture.api->destroyed == vector<string>{stale});
  REQUIRE(fixture.transports->count() == 0);
  REQUIRE_FALSE(fixture.cached());

  string winner = fixture.api->completeHeldCreate(1);
  fixture.run();
  REQUIRE(fixture.transports->count() == 1);
  REQUIRE(fixture.transports->last()->sessionId == winner);
  REQUIRE(*fixture.cached() == winner);
}

TEST_CASE("Dropped connections retry with linear backoff",
          "[ReconnectionEngine]") {
  EngineFixture fixture;
  fixture.useBaseEngine();
  string sessionId = fixture.connectStable();

  fixture.transports->last()->fireClose(CLOSE_CONNECTION_LOST);
  for (int attempt = 1; attempt <= ReconnectionEngine::MAX_RECONNECT_ATTEMPTS;
       attempt++) {
    REQUIRE(fixture.engine->getState() == EngineState::WAITING_TO_RETRY);
    REQUIRE(fixture.engine->getReconnectAttempt() == attempt);
    int before = fixture.transports->count();
    fixture.advance(ReconnectionEngine::RETRY_DELAY_MS * attempt - 10);
    REQUIRE(fixture.transports->count() == before);
    fixture.advance(10);
    REQUIRE(fixture.transports->count() == before + 1);
    REQUIRE(fixture.transports->last()->sessionId == sessionId);
    fixture.transports->last()->fireClose(CLOSE_CONNECTION_FAILED);
  }

  REQUIRE(fixture.engine->getState() == EngineState::FAILED);
  REQUIRE(fixture.engine->getLastFailureReason() == CLOSE_CONNECTION_FAILED);
  REQUIRE(fixture.errors.size() == 1);
  // The session may still be alive, so it stays cached
  REQUIRE(*fixture.cached() == sessionId);
  REQUIRE(fixture.api->createRequests.size() == 1);
}

TEST_CASE("A successful retry resets the attempt counter",
          "[ReconnectionEngine]") {
  EngineFixture fixture;
  fixture.useBaseEngine();
  fixture.connectStable();

  fixture.transports->last()->fireClose(CLOSE_CONNECTION_LOST);
  fixture.advance(ReconnectionEngine::RETRY_DELAY_MS);
  fixture.transports->last()->fireClose(CLOSE_CONNECTION_FAILED);
  REQUIRE(fixture.engine->getReconnectAttempt() == 2);
  fixture.advance(2 * ReconnectionEngine::RETRY_DELAY_MS);
  fixture.openStable();
  REQUIRE(fixture.engine->getReconnectAttempt() == 0);
  REQUIRE(fixture.engine->getLastFailureReason().empty());
  REQUIRE(fixture.readySessions.size() == 2);
}

TEST_CASE("Policy rejections stop recovery", "[ReconnectionEngine]") {
  EngineFixture fixture;
  fixture.useBaseEngine();
  string reason;

  SECTION("Project") { reason = CLOSE_PROJECT_FORBIDDEN; }
  SECTION("Scope") { reason = CLOSE_SCOPE_FORBIDDEN; }
  SECTION("Protocol") { reason = CLOSE_PROTOCOL_MISMATCH; }
  SECTION("Unauthenticated") { reason = CLOSE_UNAUTHENTICATED; }

  fixture.connectStable();
  fixture.transports->last()->fireClose(reason);
  fixture.advance(5 * ReconnectionEngine::RETRY_DELAY_MS);
  REQUIRE(fixture.engine->getState() == EngineState::FAILED);
  REQUIRE(fixture.engine->getLastFailureReason() == reason);
  REQUIRE(fixture.errors.size() == 1);
  REQUIRE(fixture.transports->count() == 1);
}

TEST_CASE("Exit frames end the session", "[ReconnectionEngine]") {
  EngineFixture fixture;
  fixture.useBaseEngine();
  fixture.connectStable();
  auto transport = fixture.transports->last();

  transport->fireControl(ControlFrame::exit(3));
  REQUIRE(fixture.engine->getState() == EngineState::EXITED);
  REQUIRE(fixture.exitCodes == vector<int>{3});
  REQUIRE(transport->closed);
  REQUIRE_FALSE(fixture.cached());
  REQUIRE(fixture.engine->getActiveSessionId().empty());

  // Late traffic from the old connection is ignored
  transport->fireData("late");
  transport->fireClose(CLOSE_CONNECTION_LOST);
  fixture.advance(5 * ReconnectionEngine::RETRY_DELAY_MS);
  REQUIRE(fixture.output.empty());
  REQUIRE(fixture.engine->getState() == EngineState::EXITED);
  REQUIRE(fixture.transports->count() == 1);
}

TEST_CASE("Heartbeats", "[ReconnectionEngine]") {
  EngineFixture fixture;
  fixture.useBaseEngine();
  fixture.connectStable();
  auto transport = fixture.transports->last();

  SECTION("Pings go out on an interval") {
    fixture.advance(ReconnectionEngine::HEARTBEAT_INTERVAL_MS);
    REQUIRE(transport->countControls(ControlType::PING) == 1);
    fixture.advance(ReconnectionEngine::HEARTBEAT_INTERVAL_MS);
    REQUIRE(transport->countControls(ControlType::PING) == 2);
  }

  SECTION("Server pings are answered") {
    transport->fireControl(ControlFrame::ping());
    REQUIRE(transport->countControls(ControlType::PONG) == 1);
  }

  SECTION("Silence drops the connection") {
    fixture.advance(ReconnectionEngine::HEARTBEAT_TIMEOUT_MS);
    REQUIRE(transport->countControls(ControlType::PING) == 3);
    REQUIRE(fixture.engine->getState() == EngineState::OPEN);
    fixture.advance(ReconnectionEngine::HEARTBEAT_INTERVAL_MS);
    REQUIRE(transport->closed);
    REQUIRE(fixture.engine->getState() == EngineState::WAITING_TO_RETRY);
    REQUIRE(fixture.engine->getLastFailureReason() == CLOSE_HEARTBEAT_TIMEOUT);
  }

  SECTION("Any inbound traffic counts as alive") {
    for (int i = 0; i < 10; i++) {
      fixture.advance(5000);
      if (i % 2) {
        transport->fireControl(ControlFrame::pong());
      } else {
        transport->fireData("tick");
      }
    }
    REQUIRE(fixture.engine->getState() == EngineState::OPEN);
    REQUIRE_FALSE(transport->closed);
  }
}

TEST_CASE("Resizes are deduplicated", "[ReconnectionEngine]") {
  EngineFixture fixture;
  fixture.useBaseEngine();
  fixture.engine->connect();
  fixture.run();

  // Before the attach settles only the target is updated
  fixture.engine->sendResize(100, 30);
  REQUIRE(fixture.transports->last()->sentControls.empty());
  fixture.openStable();
  auto transport = fixture.transports->last();
  REQUIRE(transport->sentControls == vector<ControlFrame>{
                                         ControlFrame::resize(100, 30)});

  fixture.engine->sendResize(100, 30);
  REQUIRE(transport->countControls(ControlType::RESIZE) == 1);
  fixture.engine->sendResize(90, 30);
  fixture.engine->sendResize(90, 30);
  REQUIRE(transport->countControls(ControlType::RESIZE) == 2);

  // A new connection gets the current size again
  transport->fireClose(CLOSE_CONNECTION_LOST);
  fixture.advance(ReconnectionEngine::RETRY_DELAY_MS);
  fixture.openStable();
  REQUIRE(fixture.transports->last()->sentControls ==
          vector<ControlFrame>{ControlFrame::resize(90, 30)});
}

TEST_CASE("Missing sessions fall back to the latest one",
          "[ReconnectionEngine]") {
  EngineFixture fixture;
  fixture.useBaseEngine();
  fixture.connectStable();

  SECTION("A newer session exists") {
    fixture.api->latestSessions["terminal"] = "session-9";
    fixture.transports->last()->fireClose(CLOSE_SESSION_NOT_FOUND);
    fixture.run();
    REQUIRE(fixture.api->findRequests ==
            vector<pair<string, string>>{make_pair("wt-1", "terminal")});
    REQUIRE(fixture.transports->last()->sessionId == "session-9");
    REQUIRE(*fixture.cached() == "session-9");
    REQUIRE(fixture.api->createRequests.size() == 1);
  }

  SECTION("Nothing left, so a new shell is started") {
    fixture.transports->last()->fireClose(CLOSE_SPAWN_FAILED);
    fixture.run();
    fixture.run();
    REQUIRE(fixture.api->createRequests.size() == 2);
    REQUIRE(fixture.transports->last()->sessionId == "session-2");
    REQUIRE(*fixture.cached() == "session-2");
  }

  SECTION("A reconnect while discovery is in flight wins") {
    fixture.transports->last()->fireClose(CLOSE_SESSION_NOT_FOUND);
    fixture.engine->disconnect();
    fixture.run();
    REQUIRE(fixture.transports->count() == 1);
    REQUIRE(fixture.engine->getState() == EngineState::IDLE);
  }
}

TEST_CASE("Disconnect and destroy", "[ReconnectionEngine]") {
  EngineFixture fixture;
  fixture.useBaseEngine();
  string sessionId = fixture.connectStable();
  auto transport = fixture.transports->last();

  SECTION("Disconnect keeps the session for later") {
    fixture.engine->disconnect();
    REQUIRE(transport->closed);
    REQUIRE(fixture.engine->getState() == EngineState::IDLE);
    REQUIRE(*fixture.cached() == sessionId);
    REQUIRE(fixture.api->destroyed.empty());

    fixture.engine->connect();
    fixture.run();
    REQUIRE(fixture.transports->last()->sessionId == sessionId);
  }

  SECTION("Destroy ends it on the server") {
    fixture.engine->destroy();
    fixture.run();
    REQUIRE(transport->closed);
    REQUIRE(fixture.engine->getState() == EngineState::IDLE);
    REQUIRE(fixture.api->destroyed == vector<string>{sessionId});
    REQUIRE_FALSE(fixture.cached());
  }

  SECTION("Destroy without a connection uses the cache") {
    fixture.engine->disconnect();
    fixture.engine->destroy();
    fixture.run();
    REQUIRE(fixture.api->destroyed == vector<string>{sessionId});
  }
}
