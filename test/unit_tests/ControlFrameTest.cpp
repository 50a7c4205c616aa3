#include "ControlFrame.hpp"

#include "TestHeaders.hpp"

using namespace tt;

TEST_CASE("Control frames parse from JSON", "[ControlFrame]") {
  SECTION("resize") {
    auto frame = ControlFrame::parse(R"({"type":"resize","cols":120,"rows":40})");
    REQUIRE(frame);
    REQUIRE(frame->type == ControlType::RESIZE);
    REQUIRE(frame->cols == 120);
    REQUIRE(frame->rows == 40);
  }

  SECTION("exit") {
    auto frame = ControlFrame::parse(R"({"type":"exit","exitCode":3})");
    REQUIRE(frame);
    REQUIRE(frame->type == ControlType::EXIT);
    REQUIRE(frame->exitCode == 3);
  }

  SECTION("heartbeat") {
    REQUIRE(ControlFrame::parse(R"({"type":"ping"})")->type ==
            ControlType::PING);
    REQUIRE(ControlFrame::parse(R"({"type":"pong"})")->type ==
            ControlType::PONG);
  }

  SECTION("Serialized frames read back the same") {
    ControlFrame resize = ControlFrame::resize(81, 25);
    REQUIRE(*ControlFrame::parse(resize.toJson()) == resize);
    ControlFrame exit = ControlFrame::exit(137);
    REQUIRE(*ControlFrame::parse(exit.toJson()) == exit);
  }
}

TEST_CASE("Malformed control frames are rejected", "[ControlFrame]") {
  REQUIRE_FALSE(ControlFrame::parse("not json"));
  REQUIRE_FALSE(ControlFrame::parse("[1,2,3]"));
  REQUIRE_FALSE(ControlFrame::parse(R"({"cols":1})"));
  REQUIRE_FALSE(ControlFrame::parse(R"({"type":"explode"})"));
  REQUIRE_FALSE(ControlFrame::parse(R"({"type":"resize","cols":80})"));
  REQUIRE_FALSE(ControlFrame::parse(R"({"type":"resize","cols":"80","rows":24})"));
  REQUIRE_FALSE(ControlFrame::parse(R"({"type":"exit"})"));
}

TEST_CASE("Packets carry their tag", "[ControlFrame]") {
  SECTION("Data payloads are untouched even if they look like control JSON") {
    string bytes = R"({"type":"resize","cols":1,"rows":1})";
    Packet packet(dataPacket(bytes).serialize());
    REQUIRE(packet.getHeader() == TerminalPacketType::TERMINAL_DATA);
    REQUIRE(packet.getPayload() == bytes);
  }

  SECTION("Control packets") {
    Packet packet(controlPacket(ControlFrame::ping()).serialize());
    REQUIRE(packet.getHeader() == TerminalPacketType::CONTROL);
    REQUIRE(ControlFrame::parse(packet.getPayload())->type == ControlType::PING);
  }

  SECTION("An empty wire buffer is not a packet") {
    REQUIRE_THROWS_AS(Packet(string()), std::runtime_error);
  }
}

TEST_CASE("Attach statuses map to close reasons", "[ControlFrame]") {
  REQUIRE(closeReasonForStatus(SESSION_NOT_FOUND) == "session-not-found");
  REQUIRE(closeReasonForStatus(SPAWN_FAILED) == "terminal-spawn-failed");
  REQUIRE(closeReasonForStatus(UNAUTHENTICATED) == "unauthenticated");
  REQUIRE(closeReasonForStatus(PROJECT_FORBIDDEN) == "project-forbidden");
  REQUIRE(closeReasonForStatus(SCOPE_FORBIDDEN) == "scope-forbidden");
  REQUIRE(closeReasonForStatus(MISMATCHED_PROTOCOL) == "protocol-mismatch");
}
