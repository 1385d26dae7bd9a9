#ifndef __TS_FRAME_H__
#define __TS_FRAME_H__

#include "Headers.hpp"

namespace ts {
/**
 * @brief Message kinds carried over a share socket. The byte values are part
 * of the wire format and must never change.
 */
enum class FrameType : uint8_t {
  TERMINAL_DATA = 0x10,
  TERMINAL_INPUT = 0x11,
  METADATA = 0x12,
  SCROLLBACK = 0x13,
  CONTROL_REQUEST = 0x14,
  CONTROL_GRANT = 0x15,
  CONTROL_REVOKE = 0x16,
  OBSERVER_ANNOUNCE = 0x17,
  OBSERVER_LIST = 0x18,
  SHARE_CLOSE = 0x19,
  PING = 0x1A,
  PONG = 0x1B,
};

/** @brief Returns true if @p value names one of the FrameType entries. */
bool isKnownFrameType(uint8_t value);

/** @brief Human readable name for logging. */
const char* frameTypeName(FrameType type);

/**
 * @brief One binary message on a share socket.
 *
 * Wire layout: type (1 byte), flags (1 byte, always 0), stream id (4 bytes,
 * big endian, always 1), then the payload.
 */
class Frame {
 public:
  /** @brief Size of the fixed header that precedes the payload. */
  static const int HEADER_SIZE = 6;
  /** @brief The only stream id in use. */
  static const uint32_t DEFAULT_STREAM_ID = 1;

  Frame() : type(0), flags(0), streamId(DEFAULT_STREAM_ID) {}
  Frame(FrameType _type, const string& _payload)
      : type(uint8_t(_type)),
        flags(0),
        streamId(DEFAULT_STREAM_ID),
        payload(_payload) {}
  Frame(uint8_t _type, uint8_t _flags, uint32_t _streamId,
        const string& _payload)
      : type(_type), flags(_flags), streamId(_streamId), payload(_payload) {}

  /**
   * @brief Raw type byte. Decoding keeps unknown values so the receiver can
   * decide to ignore them.
   */
  uint8_t getTypeByte() const { return type; }
  /** @brief Typed view of the type byte; only valid if isKnownType(). */
  FrameType getType() const { return FrameType(type); }
  bool isKnownType() const { return isKnownFrameType(type); }
  uint8_t getFlags() const { return flags; }
  uint32_t getStreamId() const { return streamId; }
  const string& getPayload() const { return payload; }

  /** @brief Serialized byte count including the header. */
  size_t length() const { return HEADER_SIZE + payload.length(); }

  /** @brief Produces the wire representation of this frame. */
  string serialize() const;

 protected:
  uint8_t type;
  uint8_t flags;
  uint32_t streamId;
  string payload;
};

/**
 * @brief Encodes a frame of the given type. The result is always
 * Frame::HEADER_SIZE + payload.length() bytes long.
 */
string encodeFrame(FrameType type, const string& payload = "");

/**
 * @brief Parses a wire buffer.
 * @return nullopt for buffers shorter than the header; never throws.
 */
optional<Frame> decodeFrame(const string& data);
}  // namespace ts

#endif  // __TS_FRAME_H__
