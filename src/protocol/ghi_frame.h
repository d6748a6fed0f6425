#ifndef GHI_FRAME_H
#define GHI_FRAME_H

#include <stddef.h>
#include <stdint.h>

#include <etl/array.h>
#include <etl/expected.h>
#include <etl/optional.h>
#include <etl/span.h>
#include <etl/vector.h>

#include "ghi_protocol.h"

namespace hexilink {
namespace ghi {

// --- Endianness helpers ---

// Sensor values travel Big Endian.
inline uint16_t read_u16_be(const uint8_t* buffer) {
  return static_cast<uint16_t>((static_cast<uint16_t>(buffer[0]) << 8) | buffer[1]);
}

inline void write_u16_be(uint8_t* buffer, uint16_t value) {
  buffer[0] = static_cast<uint8_t>((value >> 8) & 0xFF);
  buffer[1] = static_cast<uint8_t>(value & 0xFF);
}

// The pairing passkey is the only Little Endian field (3 bytes).
inline uint32_t read_u24_le(const uint8_t* buffer) {
  return static_cast<uint32_t>(buffer[0]) |
         (static_cast<uint32_t>(buffer[1]) << 8) |
         (static_cast<uint32_t>(buffer[2]) << 16);
}

// Exactly the 4 header bytes of the wire format, no padding.
struct FrameHeader {
  uint8_t start1;
  uint8_t start2;
  uint8_t type;
  uint8_t length;
} __attribute__((packed));

static_assert(sizeof(FrameHeader) == HEADER_SIZE, "FrameHeader must be exactly 4 bytes");

enum class FrameError : uint8_t {
  INVALID_PAYLOAD,  // payload longer than MAX_PAYLOAD_SIZE
  TRUNCATED,        // body shorter or longer than the header declares
  BAD_START,        // start marker not found where expected
  BAD_LENGTH,       // length byte above MAX_PAYLOAD_SIZE
  BAD_TRAILER       // trailer byte is not TRAILER_BYTE
};

const char* frame_error_name(FrameError error);

struct Frame {
  FrameHeader header;
  etl::array<uint8_t, MAX_PAYLOAD_SIZE> payload;
  uint8_t trailer;

  PacketType type() const { return static_cast<PacketType>(header.type); }
  size_t length() const { return header.length; }
  bool confirmRequested() const { return (header.start2 & RX_CONFIRM_MASK) != 0; }
  bool txTagged() const { return (header.start2 & TX_PACKET_MASK) != 0; }
  etl::span<const uint8_t> payloadView() const {
    return etl::span<const uint8_t>(payload.data(), header.length);
  }
  size_t wireSize() const { return HEADER_SIZE + header.length + TRAILER_SIZE; }
};

// Serialized bytes of one frame.
using RawFrame = etl::vector<uint8_t, MAX_FRAME_SIZE>;

// Builds a frame queued for transmission: tx tag set, confirm bit set on
// request.
etl::expected<RawFrame, FrameError> encode(PacketType type,
                                           bool confirm_requested,
                                           etl::span<const uint8_t> payload);

// Builds a frame from a 4-byte header and the body that follows it
// (payload + trailer). The trailer value is not checked here.
etl::expected<Frame, FrameError> decode(etl::span<const uint8_t> header,
                                        etl::span<const uint8_t> body);

// Serializes a frame exactly as held in memory, flags included.
RawFrame serialize(const Frame& frame);

// Incremental parser used by the reader loop. Hunts for the start marker,
// so a misaligned stream recovers on the next frame boundary.
class FrameParser {
 public:
  FrameParser();

  // Consumes a byte. Returns true when out_frame holds a complete,
  // structurally valid frame.
  bool consume(uint8_t byte, Frame& out_frame);

  // Bytes required to finish the current stage: the whole header while
  // hunting, then length + 1.
  size_t bytesNeeded() const;

  void reset();

  etl::optional<FrameError> getError() const { return _last_error; }
  void clearError() { _last_error.reset(); }
  uint32_t droppedBytes() const { return _dropped_bytes; }

 private:
  enum class State : uint8_t {
    START_1,
    START_2,
    TYPE,
    LENGTH,
    BODY
  };

  void _fail(FrameError error, uint8_t byte);

  State _state;
  etl::array<uint8_t, MAX_FRAME_SIZE> _buffer;
  size_t _pos;
  size_t _body_len;
  uint32_t _dropped_bytes;
  etl::optional<FrameError> _last_error;
};

}  // namespace ghi
}  // namespace hexilink

#endif  // GHI_FRAME_H
