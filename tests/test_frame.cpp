#include <cassert>
#include <cstdint>
#include <cstring>
#include <vector>

#include "protocol/PacketBuilder.h"
#include "protocol/ghi_frame.h"
#include "test_support.h"

using namespace hexilink::ghi;

static etl::expected<Frame, FrameError> decode_raw(const RawFrame& raw) {
  return decode(etl::span<const uint8_t>(raw.data(), HEADER_SIZE),
                etl::span<const uint8_t>(raw.data() + HEADER_SIZE, raw.size() - HEADER_SIZE));
}

static void test_endianness_helpers() {
  uint8_t buffer[3] = {0x12, 0x34, 0x56};
  assert(read_u16_be(buffer) == 0x1234);
  write_u16_be(buffer, 0xCDEF);
  assert(buffer[0] == 0xCD && buffer[1] == 0xEF);
  const uint8_t passkey[3] = {0x40, 0xE2, 0x01};
  assert(read_u24_le(passkey) == 123456u);
}

static void test_encode_layout() {
  const uint8_t payload[] = {0x01, 0x02, 0x03};
  auto raw = encode(PacketType::PT_ACCEL, true, etl::span<const uint8_t>(payload, sizeof(payload)));
  assert(raw.has_value());
  const uint8_t expected[] = {0x55, 0xBB, 0x06, 0x03, 0x01, 0x02, 0x03, 0x45};
  TEST_ASSERT_EQ_UINT(raw.value().size(), sizeof(expected));
  assert(test_memeq(raw.value().data(), expected, sizeof(expected)));

  auto plain = encode(PacketType::PT_LINK_STATE_GET, false, etl::span<const uint8_t>());
  assert(plain.has_value());
  const uint8_t expected_plain[] = {0x55, 0xBA, 0x1E, 0x00, 0x45};
  TEST_ASSERT_EQ_UINT(plain.value().size(), sizeof(expected_plain));
  assert(test_memeq(plain.value().data(), expected_plain, sizeof(expected_plain)));
}

static void test_encode_payload_limit() {
  std::vector<uint8_t> payload(MAX_PAYLOAD_SIZE + 1, 0x01);
  auto too_big = encode(PacketType::PT_ALERT_OUT, true, etl::span<const uint8_t>(payload.data(), payload.size()));
  assert(!too_big.has_value());
  assert(too_big.error() == FrameError::INVALID_PAYLOAD);

  payload.pop_back();
  auto largest = encode(PacketType::PT_ALERT_OUT, true, etl::span<const uint8_t>(payload.data(), payload.size()));
  assert(largest.has_value());
  TEST_ASSERT_EQ_UINT(largest.value().size(), MAX_FRAME_SIZE);
}

static void test_round_trip_all_types_and_lengths() {
  const PacketType types[] = {PacketType::PT_PRESS_UP, PacketType::PT_BATTERY_LEVEL,
                              PacketType::PT_ALERT_IN, PacketType::PT_NOTIFICATION,
                              PacketType::PT_BUILD_VERSION, PacketType::PT_OK};
  uint8_t payload[MAX_PAYLOAD_SIZE];
  for (size_t i = 0; i < sizeof(payload); ++i) {
    payload[i] = static_cast<uint8_t>(0xA0 + i);
  }

  for (PacketType type : types) {
    for (size_t len = 0; len <= MAX_PAYLOAD_SIZE; len += 11) {
      for (int confirm = 0; confirm < 2; ++confirm) {
        auto raw = encode(type, confirm != 0, etl::span<const uint8_t>(payload, len));
        assert(raw.has_value());
        auto frame = decode_raw(raw.value());
        assert(frame.has_value());
        assert(frame.value().type() == type);
        assert(frame.value().confirmRequested() == (confirm != 0));
        assert(frame.value().txTagged());
        TEST_ASSERT_EQ_UINT(frame.value().length(), len);
        assert(test_memeq(frame.value().payload.data(), payload, len));
        assert(frame.value().trailer == TRAILER_BYTE);
      }
    }
  }
}

static void test_decode_rejects_bad_sizes() {
  const uint8_t header[] = {0x55, 0xAA, 0x00, 0x02};
  const uint8_t short_body[] = {0x09, 0x45};
  auto truncated = decode(etl::span<const uint8_t>(header, 4), etl::span<const uint8_t>(short_body, 2));
  assert(!truncated.has_value());
  assert(truncated.error() == FrameError::TRUNCATED);

  auto short_header = decode(etl::span<const uint8_t>(header, 3), etl::span<const uint8_t>(short_body, 2));
  assert(!short_header.has_value());
  assert(short_header.error() == FrameError::TRUNCATED);

  const uint8_t oversize_header[] = {0x55, 0xAA, 0x00, 30};
  auto oversize = decode(etl::span<const uint8_t>(oversize_header, 4), etl::span<const uint8_t>(short_body, 2));
  assert(!oversize.has_value());
  assert(oversize.error() == FrameError::INVALID_PAYLOAD);

  // The trailer value is not the decoder's concern.
  const uint8_t body[] = {0x09, 0x08, 0x00};
  auto frame = decode(etl::span<const uint8_t>(header, 4), etl::span<const uint8_t>(body, 3));
  assert(frame.has_value());
  assert(frame.value().type() == PacketType::PT_PRESS_UP);
  assert(!frame.value().confirmRequested());
  assert(!frame.value().txTagged());
  assert(frame.value().payload[0] == 0x09 && frame.value().payload[1] == 0x08);
}

static void test_serialize_preserves_flags() {
  const uint8_t wire[] = {0x55, 0xAB, 0x1F, 0x01, 0x01, 0x45};
  auto frame = decode(etl::span<const uint8_t>(wire, 4), etl::span<const uint8_t>(wire + 4, 2));
  assert(frame.has_value());
  RawFrame raw = serialize(frame.value());
  TEST_ASSERT_EQ_UINT(raw.size(), sizeof(wire));
  assert(test_memeq(raw.data(), wire, sizeof(wire)));
}

static void test_parser_reports_bytes_needed() {
  FrameParser parser;
  Frame frame{};
  TEST_ASSERT_EQ_UINT(parser.bytesNeeded(), 4);
  assert(!parser.consume(0x55, frame));
  TEST_ASSERT_EQ_UINT(parser.bytesNeeded(), 3);
  assert(!parser.consume(0xAA, frame));
  TEST_ASSERT_EQ_UINT(parser.bytesNeeded(), 2);
  assert(!parser.consume(0x0A, frame));
  TEST_ASSERT_EQ_UINT(parser.bytesNeeded(), 1);
  assert(!parser.consume(0x02, frame));
  TEST_ASSERT_EQ_UINT(parser.bytesNeeded(), 3);
  assert(!parser.consume(0x09, frame));
  TEST_ASSERT_EQ_UINT(parser.bytesNeeded(), 2);
  assert(!parser.consume(0xC4, frame));
  TEST_ASSERT_EQ_UINT(parser.bytesNeeded(), 1);
  assert(parser.consume(0x45, frame));
  TEST_ASSERT_EQ_UINT(parser.bytesNeeded(), 4);
  assert(frame.type() == PacketType::PT_TEMPERATURE);
  assert(read_u16_be(frame.payload.data()) == 0x09C4);
  assert(!parser.getError().has_value());
}

static void test_parser_resynchronizes_on_garbage() {
  FrameParser parser;
  Frame frame{};
  const uint8_t stream[] = {0x00, 0x13, 0x55, 0x55, 0xAA, 0x01, 0x00, 0x45};
  int frames = 0;
  for (uint8_t b : stream) {
    if (parser.consume(b, frame)) {
      ++frames;
    }
  }
  assert(frames == 1);
  assert(frame.type() == PacketType::PT_PRESS_DOWN);
  TEST_ASSERT_EQ_UINT(frame.length(), 0);
  assert(parser.getError().has_value());
  assert(*parser.getError() == FrameError::BAD_START);
  TEST_ASSERT_EQ_UINT(parser.droppedBytes(), 3);
  parser.clearError();
  assert(!parser.getError().has_value());
}

static void test_parser_rejects_bad_trailer_and_length() {
  FrameParser parser;
  Frame frame{};

  const uint8_t bad_trailer[] = {0x55, 0xAA, 0x00, 0x01, 0x07, 0x46};
  for (uint8_t b : bad_trailer) {
    assert(!parser.consume(b, frame));
  }
  assert(parser.getError().has_value() && *parser.getError() == FrameError::BAD_TRAILER);
  parser.clearError();

  const uint8_t bad_length[] = {0x55, 0xAA, 0x05, 24};
  for (uint8_t b : bad_length) {
    assert(!parser.consume(b, frame));
  }
  assert(parser.getError().has_value() && *parser.getError() == FrameError::BAD_LENGTH);
  parser.clearError();

  // Next good frame still parses, with both flag bits set.
  const uint8_t good[] = {0x55, 0xBB, 0x1D, 0x01, 0x02, 0x45};
  bool parsed = false;
  for (uint8_t b : good) {
    parsed = parser.consume(b, frame);
  }
  assert(parsed);
  assert(frame.type() == PacketType::PT_APP_MODE);
  assert(frame.confirmRequested());
  assert(frame.txTagged());
  assert(frame.payload[0] == 0x02);
  assert(!parser.getError().has_value());
}

static void test_packet_builder() {
  Payload payload;
  PacketBuilder builder(payload);
  builder.add(0x07).add_u16(0x1234);
  TEST_ASSERT_EQ_UINT(builder.size(), 3);
  assert(payload[0] == 0x07 && payload[1] == 0x12 && payload[2] == 0x34);
  assert(!builder.overflowed());
  TEST_ASSERT_EQ_UINT(builder.view().size(), 3);
  assert(builder.view().data() == payload.data());

  Payload axes;
  etl::array<uint16_t, 3> values = {{1, 256, 65535}};
  PacketBuilder(axes).add_axes(values);
  const uint8_t expected[] = {0x00, 0x01, 0x01, 0x00, 0xFF, 0xFF};
  TEST_ASSERT_EQ_UINT(axes.size(), sizeof(expected));
  assert(test_memeq(axes.data(), expected, sizeof(expected)));

  Payload full;
  PacketBuilder overflow(full);
  for (size_t i = 0; i < MAX_PAYLOAD_SIZE; ++i) {
    overflow.add(static_cast<uint8_t>(i));
  }
  assert(!overflow.overflowed());
  overflow.add_u16(0xFFFF);
  assert(overflow.overflowed());
  TEST_ASSERT_EQ_UINT(full.size(), MAX_PAYLOAD_SIZE);
}

static void test_names() {
  assert(strcmp(packet_type_name(PacketType::PT_PASS_DISPLAY), "pass_display") == 0);
  assert(strcmp(packet_type_name(static_cast<PacketType>(200)), "unknown") == 0);
  assert(strcmp(frame_error_name(FrameError::BAD_TRAILER), "bad_trailer") == 0);
}

int main() {
  test_endianness_helpers();
  test_encode_layout();
  test_encode_payload_limit();
  test_round_trip_all_types_and_lengths();
  test_decode_rejects_bad_sizes();
  test_serialize_preserves_flags();
  test_parser_reports_bytes_needed();
  test_parser_resynchronizes_on_garbage();
  test_parser_rejects_bad_trailer_and_length();
  test_packet_builder();
  test_names();
  return 0;
}
