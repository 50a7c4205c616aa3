#include "ControlFrame.hpp"

namespace tt {
ControlFrame ControlFrame::resize(int cols, int rows) {
  ControlFrame frame;
  frame.type = ControlType::RESIZE;
  frame.cols = cols;
  frame.rows = rows;
  return frame;
}

ControlFrame ControlFrame::exit(int exitCode) {
  ControlFrame frame;
  frame.type = ControlType::EXIT;
  frame.exitCode = exitCode;
  return frame;
}

ControlFrame ControlFrame::ping() {
  ControlFrame frame;
  frame.type = ControlType::PING;
  return frame;
}

ControlFrame ControlFrame::pong() {
  ControlFrame frame;
  frame.type = ControlType::PONG;
  return frame;
}

string controlTypeName(ControlType type) {
  switch (type) {
    case ControlType::RESIZE:
      return "resize";
    case ControlType::EXIT:
      return "exit";
    case ControlType::PING:
      return "ping";
    case ControlType::PONG:
      return "pong";
  }
  return "unknown";
}

string ControlFrame::toJson() const {
  json j;
  j["type"] = controlTypeName(type);
  if (type == ControlType::RESIZE) {
    j["cols"] = cols;
    j["rows"] = rows;
  } else if (type == ControlType::EXIT) {
    j["exitCode"] = exitCode;
  }
  return j.dump();
}

optional<ControlFrame> ControlFrame::parse(const string& payload) {
  json j = json::parse(payload, nullptr, false);
  if (j.is_discarded() || !j.is_object() || !j.contains("type") ||
      !j["type"].is_string()) {
    return nullopt;
  }
  string type = j["type"].get<string>();
  if (type == "resize") {
    if (!j.contains("cols") || !j.contains("rows") ||
        !j["cols"].is_number_integer() || !j["rows"].is_number_integer()) {
      return nullopt;
    }
    return resize(j["cols"].get<int>(), j["rows"].get<int>());
  }
  if (type == "exit") {
    if (!j.contains("exitCode") || !j["exitCode"].is_number_integer()) {
      return nullopt;
    }
    return exit(j["exitCode"].get<int>());
  }
  if (type == "ping") {
    return ping();
  }
  if (type == "pong") {
    return pong();
  }
  return nullopt;
}

bool ControlFrame::operator==(const ControlFrame& other) const {
  return type == other.type && cols == other.cols && rows == other.rows &&
         exitCode == other.exitCode;
}

string closeReasonForStatus(AttachStatus status) {
  switch (status) {
    case SESSION_NOT_FOUND:
      return CLOSE_SESSION_NOT_FOUND;
    case SPAWN_FAILED:
      return CLOSE_SPAWN_FAILED;
    case UNAUTHENTICATED:
      return CLOSE_UNAUTHENTICATED;
    case PROJECT_FORBIDDEN:
      return CLOSE_PROJECT_FORBIDDEN;
    case SCOPE_FORBIDDEN:
      return CLOSE_SCOPE_FORBIDDEN;
    case MISMATCHED_PROTOCOL:
      return CLOSE_PROTOCOL_MISMATCH;
    case ATTACHED:
      break;
  }
  return CLOSE_CONNECTION_LOST;
}
}  // namespace tt
