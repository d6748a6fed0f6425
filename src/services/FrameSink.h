#ifndef FRAME_SINK_H
#define FRAME_SINK_H

#include <stdint.h>

#include <etl/span.h>

#include "protocol/ghi_frame.h"

namespace hexilink {

enum class LinkError : uint8_t {
  NONE = 0,
  RANGE_ERROR,      // value outside the field's documented range
  INVALID_PAYLOAD,  // payload longer than a frame can carry
  NOT_STARTED,      // link not running
  QUEUE_CLOSED      // link stopped while the frame was waiting for space
};

const char* link_error_name(LinkError error);

// Destination for frames waiting to be written: the outbound queue in
// production, a recorder in tests.
class FrameSink {
public:
  virtual ~FrameSink() {}

  // May block while the destination is full.
  virtual LinkError submit(const ghi::RawFrame& raw) = 0;
};

// Encodes a transmit-tagged frame and hands it to the sink.
LinkError submit_packet(FrameSink& sink,
                        ghi::PacketType type,
                        bool confirm_requested,
                        etl::span<const uint8_t> payload = etl::span<const uint8_t>());

}  // namespace hexilink

#endif  // FRAME_SINK_H
