#include "ghi_frame.h"

#include <etl/algorithm.h>

namespace hexilink {
namespace ghi {

namespace {

bool is_start2(uint8_t byte) {
  return static_cast<uint8_t>(byte & ~FLAGS_MASK) == START_BYTE_2;
}

}  // namespace

const char* frame_error_name(FrameError error) {
  switch (error) {
    case FrameError::INVALID_PAYLOAD: return "invalid_payload";
    case FrameError::TRUNCATED:       return "truncated";
    case FrameError::BAD_START:       return "bad_start";
    case FrameError::BAD_LENGTH:      return "bad_length";
    case FrameError::BAD_TRAILER:     return "bad_trailer";
  }
  return "unknown";
}

const char* packet_type_name(PacketType type) {
  switch (type) {
    case PacketType::PT_PRESS_UP:                return "press_up";
    case PacketType::PT_PRESS_DOWN:              return "press_down";
    case PacketType::PT_PRESS_LEFT:              return "press_left";
    case PacketType::PT_PRESS_RIGHT:             return "press_right";
    case PacketType::PT_SLIDE:                   return "slide";
    case PacketType::PT_BATTERY_LEVEL:           return "battery_level";
    case PacketType::PT_ACCEL:                   return "accel";
    case PacketType::PT_AMBI_LIGHT:              return "ambient_light";
    case PacketType::PT_PRESSURE:                return "pressure";
    case PacketType::PT_GYRO:                    return "gyro";
    case PacketType::PT_TEMPERATURE:             return "temperature";
    case PacketType::PT_HUMIDITY:                return "humidity";
    case PacketType::PT_MAGNET:                  return "magnet";
    case PacketType::PT_HEART_RATE:              return "heart_rate";
    case PacketType::PT_STEPS:                   return "steps";
    case PacketType::PT_CALORIES:                return "calories";
    case PacketType::PT_ALERT_IN:                return "alert_in";
    case PacketType::PT_ALERT_OUT:               return "alert_out";
    case PacketType::PT_PASS_DISPLAY:            return "pass_display";
    case PacketType::PT_OTAP_KW40_STARTED:       return "otap_kw40_started";
    case PacketType::PT_OTAP_MK64_STARTED:       return "otap_mk64_started";
    case PacketType::PT_OTAP_COMPLETED:          return "otap_completed";
    case PacketType::PT_OTAP_FAILED:             return "otap_failed";
    case PacketType::PT_TSI_GROUP_TOGGLE_ACTIVE: return "tsi_group_toggle";
    case PacketType::PT_TSI_GROUP_GET_ACTIVE:    return "tsi_group_get";
    case PacketType::PT_TSI_GROUP_SEND_ACTIVE:   return "tsi_group_send";
    case PacketType::PT_ADV_MODE_GET:            return "adv_mode_get";
    case PacketType::PT_ADV_MODE_SEND:           return "adv_mode_send";
    case PacketType::PT_ADV_MODE_TOGGLE:         return "adv_mode_toggle";
    case PacketType::PT_APP_MODE:                return "app_mode";
    case PacketType::PT_LINK_STATE_GET:          return "link_state_get";
    case PacketType::PT_LINK_STATE_SEND:         return "link_state_send";
    case PacketType::PT_NOTIFICATION:            return "notification";
    case PacketType::PT_BUILD_VERSION:           return "build_version";
    case PacketType::PT_OK:                      return "ok";
  }
  return "unknown";
}

etl::expected<RawFrame, FrameError> encode(PacketType type,
                                           bool confirm_requested,
                                           etl::span<const uint8_t> payload) {
  if (payload.size() > MAX_PAYLOAD_SIZE) {
    return etl::unexpected<FrameError>(FrameError::INVALID_PAYLOAD);
  }

  uint8_t start2 = START_BYTE_2 | TX_PACKET_MASK;
  if (confirm_requested) {
    start2 |= RX_CONFIRM_MASK;
  }

  RawFrame raw;
  raw.push_back(START_BYTE_1);
  raw.push_back(start2);
  raw.push_back(to_underlying(type));
  raw.push_back(static_cast<uint8_t>(payload.size()));
  raw.insert(raw.end(), payload.begin(), payload.end());
  raw.push_back(TRAILER_BYTE);
  return raw;
}

etl::expected<Frame, FrameError> decode(etl::span<const uint8_t> header,
                                        etl::span<const uint8_t> body) {
  if (header.size() != HEADER_SIZE) {
    return etl::unexpected<FrameError>(FrameError::TRUNCATED);
  }

  const size_t length = header[3];
  if (length > MAX_PAYLOAD_SIZE) {
    return etl::unexpected<FrameError>(FrameError::INVALID_PAYLOAD);
  }
  if (body.size() != length + TRAILER_SIZE) {
    return etl::unexpected<FrameError>(FrameError::TRUNCATED);
  }

  Frame frame;
  frame.header.start1 = header[0];
  frame.header.start2 = header[1];
  frame.header.type = header[2];
  frame.header.length = static_cast<uint8_t>(length);
  frame.payload.fill(0);
  etl::copy_n(body.begin(), length, frame.payload.begin());
  frame.trailer = body[length];
  return frame;
}

RawFrame serialize(const Frame& frame) {
  RawFrame raw;
  raw.push_back(frame.header.start1);
  raw.push_back(frame.header.start2);
  raw.push_back(frame.header.type);
  raw.push_back(frame.header.length);
  raw.insert(raw.end(), frame.payload.begin(), frame.payload.begin() + frame.header.length);
  raw.push_back(frame.trailer);
  return raw;
}

// --- FrameParser ---

FrameParser::FrameParser() : _dropped_bytes(0) {
  reset();
}

void FrameParser::reset() {
  _state = State::START_1;
  _pos = 0;
  _body_len = 0;
  _buffer.fill(0);
}

size_t FrameParser::bytesNeeded() const {
  switch (_state) {
    case State::START_1: return HEADER_SIZE;
    case State::START_2: return HEADER_SIZE - 1;
    case State::TYPE:    return HEADER_SIZE - 2;
    case State::LENGTH:  return HEADER_SIZE - 3;
    case State::BODY:    return (HEADER_SIZE + _body_len) - _pos;
  }
  return 1;
}

void FrameParser::_fail(FrameError error, uint8_t byte) {
  _last_error = error;
  _dropped_bytes += static_cast<uint32_t>(_pos);
  reset();
  // The offending byte may itself open the next frame.
  if (byte == START_BYTE_1) {
    _buffer[0] = byte;
    _pos = 1;
    _state = State::START_2;
  } else {
    ++_dropped_bytes;
  }
}

bool FrameParser::consume(uint8_t byte, Frame& out_frame) {
  switch (_state) {
    case State::START_1:
      if (byte == START_BYTE_1) {
        _buffer[_pos++] = byte;
        _state = State::START_2;
      } else {
        ++_dropped_bytes;
      }
      return false;

    case State::START_2:
      if (is_start2(byte)) {
        _buffer[_pos++] = byte;
        _state = State::TYPE;
      } else {
        _fail(FrameError::BAD_START, byte);
      }
      return false;

    case State::TYPE:
      _buffer[_pos++] = byte;
      _state = State::LENGTH;
      return false;

    case State::LENGTH:
      if (byte > MAX_PAYLOAD_SIZE) {
        _fail(FrameError::BAD_LENGTH, byte);
        return false;
      }
      _buffer[_pos++] = byte;
      _body_len = static_cast<size_t>(byte) + TRAILER_SIZE;
      _state = State::BODY;
      return false;

    case State::BODY:
      _buffer[_pos++] = byte;
      if (_pos < HEADER_SIZE + _body_len) {
        return false;
      }
      break;
  }

  if (_buffer[_pos - 1] != TRAILER_BYTE) {
    _fail(FrameError::BAD_TRAILER, _buffer[_pos - 1]);
    return false;
  }

  auto decoded = decode(etl::span<const uint8_t>(_buffer.data(), HEADER_SIZE),
                        etl::span<const uint8_t>(_buffer.data() + HEADER_SIZE, _body_len));
  reset();
  if (!decoded.has_value()) {
    _last_error = decoded.error();
    return false;
  }
  out_frame = decoded.value();
  return true;
}

}  // namespace ghi
}  // namespace hexilink
