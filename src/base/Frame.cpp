#include "Frame.hpp"

namespace ts {
bool isKnownFrameType(uint8_t value) {
  return value >= uint8_t(FrameType::TERMINAL_DATA) &&
         value <= uint8_t(FrameType::PONG);
}

const char* frameTypeName(FrameType type) {
  switch (type) {
    case FrameType::TERMINAL_DATA:
      return "TerminalData";
    case FrameType::TERMINAL_INPUT:
      return "TerminalInput";
    case FrameType::METADATA:
      return "Metadata";
    case FrameType::SCROLLBACK:
      return "Scrollback";
    case FrameType::CONTROL_REQUEST:
      return "ControlRequest";
    case FrameType::CONTROL_GRANT:
      return "ControlGrant";
    case FrameType::CONTROL_REVOKE:
      return "ControlRevoke";
    case FrameType::OBSERVER_ANNOUNCE:
      return "ObserverAnnounce";
    case FrameType::OBSERVER_LIST:
      return "ObserverList";
    case FrameType::SHARE_CLOSE:
      return "ShareClose";
    case FrameType::PING:
      return "Ping";
    case FrameType::PONG:
      return "Pong";
  }
  return "Unknown";
}

string Frame::serialize() const {
  string s(HEADER_SIZE, '\0');
  s[0] = char(type);
  s[1] = char(flags);
  s[2] = char((streamId >> 24) & 0xff);
  s[3] = char((streamId >> 16) & 0xff);
  s[4] = char((streamId >> 8) & 0xff);
  s[5] = char(streamId & 0xff);
  s.append(payload);
  return s;
}

string encodeFrame(FrameType type, const string& payload) {
  return Frame(type, payload).serialize();
}

optional<Frame> decodeFrame(const string& data) {
  if (data.length() < size_t(Frame::HEADER_SIZE)) {
    return nullopt;
  }
  const unsigned char* bytes =
      reinterpret_cast<const unsigned char*>(data.data());
  uint32_t streamId = (uint32_t(bytes[2]) << 24) | (uint32_t(bytes[3]) << 16) |
                      (uint32_t(bytes[4]) << 8) | uint32_t(bytes[5]);
  return Frame(bytes[0], bytes[1], streamId, data.substr(Frame::HEADER_SIZE));
}
}  // namespace ts
