#ifndef __TT_PACKET_H__
#define __TT_PACKET_H__

#include "Headers.hpp"

namespace tt {
/**
 * @brief One framed message on a session stream: a tag byte followed by the
 * payload.
 *
 * The tag is a TerminalPacketType. TERMINAL_DATA payloads are raw terminal
 * bytes and are never inspected.
 */
class Packet {
 public:
  Packet() : header(255) {}
  Packet(uint8_t _header, const string& _payload)
      : header(_header), payload(_payload) {}
  /**
   * @brief Deserializes a packet from its wire representation.
   * @throws std::runtime_error when the buffer has no tag byte.
   */
  explicit Packet(const string& serializedPacket) {
    if (serializedPacket.empty()) {
      throw std::runtime_error("Packet is missing its tag byte");
    }
    header = uint8_t(serializedPacket[0]);
    payload = serializedPacket.substr(1);
  }

  uint8_t getHeader() const { return header; }
  const string& getPayload() const { return payload; }

  ssize_t length() const { return HEADER_SIZE + payload.length(); }

  string serialize() const {
    string s(1, char(header));
    s += payload;
    return s;
  }

 protected:
  static const int HEADER_SIZE = 1;
  uint8_t header;
  string payload;
};
}  // namespace tt

#endif
