#ifndef RELIABLE_SENDER_H
#define RELIABLE_SENDER_H

#include <stdint.h>

#include <atomic>
#include <mutex>

#include "config/hexilink_config.h"
#include "protocol/ghi_frame.h"
#include "link_fsm.h"

namespace hexilink {

class LinkTransport;

enum class SendResult : uint8_t {
  SENT,          // no confirmation requested
  CONFIRMED,
  UNCONFIRMED,   // every attempt timed out; the frame counts as sent
  WRITE_FAILED
};

const char* send_result_name(SendResult result);

// Writes queued frames and retransmits confirmable ones until a frame is
// accepted as confirmation or the attempts are used up. Called from the
// writer thread only.
class ReliableSender {
 public:
  ReliableSender(LinkTransport& transport,
                 uint8_t retransmit_count = HEXILINK_RETRANSMIT_COUNT,
                 unsigned long timeout_ms = HEXILINK_RETRANSMIT_TIMEOUT_MS);

  // raw must be a transmit-tagged frame from ghi::encode(). The tag is
  // cleared before the frame goes on the wire.
  SendResult send(const ghi::RawFrame& raw);

  bool isAwaitingConfirmation() const;

  // Wire writes performed by the last send(), retransmissions included.
  uint8_t lastAttempts() const { return _last_attempts; }

 private:
  LinkTransport& _transport;
  const uint8_t _retransmit_count;
  const unsigned long _timeout_ms;

  mutable std::mutex _fsm_mutex;
  fsm::LinkFsm _fsm;
  std::atomic<uint8_t> _last_attempts;
};

}  // namespace hexilink

#endif  // RELIABLE_SENDER_H
