#ifndef __TT_CONTROL_FRAME__
#define __TT_CONTROL_FRAME__

#include "Headers.hpp"
#include "Packet.hpp"

namespace tt {
enum class ControlType { RESIZE, EXIT, PING, PONG };

/**
 * @brief Metadata carried in a CONTROL packet as JSON, e.g.
 * {"type":"resize","cols":120,"rows":40}.
 */
struct ControlFrame {
  ControlType type = ControlType::PING;
  int cols = 0;
  int rows = 0;
  int exitCode = 0;

  static ControlFrame resize(int cols, int rows);
  static ControlFrame exit(int exitCode);
  static ControlFrame ping();
  static ControlFrame pong();

  string toJson() const;

  /**
   * @brief Parses a CONTROL payload.
   * @return nullopt for malformed JSON, an unknown type, or a resize/exit
   * frame with missing fields.
   */
  static optional<ControlFrame> parse(const string& payload);

  bool operator==(const ControlFrame& other) const;
};

string controlTypeName(ControlType type);

inline Packet dataPacket(const string& bytes) {
  return Packet(uint8_t(TerminalPacketType::TERMINAL_DATA), bytes);
}

inline Packet controlPacket(const ControlFrame& frame) {
  return Packet(uint8_t(TerminalPacketType::CONTROL), frame.toJson());
}

// Close reasons reported to the reconnection engines.
const string CLOSE_SESSION_NOT_FOUND = "session-not-found";
const string CLOSE_SPAWN_FAILED = "terminal-spawn-failed";
const string CLOSE_UNAUTHENTICATED = "unauthenticated";
const string CLOSE_PROJECT_FORBIDDEN = "project-forbidden";
const string CLOSE_SCOPE_FORBIDDEN = "scope-forbidden";
const string CLOSE_PROTOCOL_MISMATCH = "protocol-mismatch";
const string CLOSE_CONNECTION_FAILED = "connection-failed";
const string CLOSE_CONNECTION_LOST = "connection-lost";
const string CLOSE_HEARTBEAT_TIMEOUT = "heartbeat-timeout";

/** @brief Maps a rejected AttachResponse status to its close reason. */
string closeReasonForStatus(AttachStatus status);
}  // namespace tt

#endif  // __TT_CONTROL_FRAME__
