#include "ReliableSender.h"

#include <chrono>

#include "transport/LinkTransport.h"
#include "util/log.h"

namespace hexilink {

namespace {
constexpr const char* TAG = "reliable";
}

const char* send_result_name(SendResult result) {
  switch (result) {
    case SendResult::SENT:         return "sent";
    case SendResult::CONFIRMED:    return "confirmed";
    case SendResult::UNCONFIRMED:  return "unconfirmed";
    case SendResult::WRITE_FAILED: return "write_failed";
  }
  return "unknown";
}

ReliableSender::ReliableSender(LinkTransport& transport,
                               uint8_t retransmit_count,
                               unsigned long timeout_ms)
    : _transport(transport),
      _retransmit_count(retransmit_count > 0 ? retransmit_count : 1),
      _timeout_ms(timeout_ms),
      _last_attempts(0) {
  _fsm.begin();
}

bool ReliableSender::isAwaitingConfirmation() const {
  std::lock_guard<std::mutex> lock(_fsm_mutex);
  return _fsm.isAwaitingConfirm();
}

SendResult ReliableSender::send(const ghi::RawFrame& raw) {
  _last_attempts = 0;
  if (raw.size() < ghi::HEADER_SIZE + ghi::TRAILER_SIZE) {
    HEXILINK_LOGE(TAG, "refusing to send a %u byte frame", static_cast<unsigned>(raw.size()));
    return SendResult::WRITE_FAILED;
  }

  ghi::RawFrame wire = raw;
  wire[1] = static_cast<uint8_t>(wire[1] & ~ghi::TX_PACKET_MASK);
  const bool confirm_requested = (wire[1] & ghi::RX_CONFIRM_MASK) != 0;
  const auto type = static_cast<ghi::PacketType>(wire[2]);

  ConfirmSignal& signal = _transport.confirmSignal();
  if (confirm_requested) {
    // Only a frame arriving after this point confirms this send.
    signal.reset();
  }

  const etl::span<const uint8_t> bytes(wire.data(), wire.size());
  uint8_t attempts = 0;
  while (attempts < _retransmit_count) {
    if (!_transport.writeFrame(bytes)) {
      std::lock_guard<std::mutex> lock(_fsm_mutex);
      _fsm.resetFsm();
      HEXILINK_LOGE(TAG, "write of %s failed", ghi::packet_type_name(type));
      return SendResult::WRITE_FAILED;
    }
    ++attempts;
    _last_attempts = attempts;

    if (!confirm_requested) {
      return SendResult::SENT;
    }

    {
      std::lock_guard<std::mutex> lock(_fsm_mutex);
      _fsm.sendConfirmable();
    }

    if (signal.waitFor(std::chrono::milliseconds(_timeout_ms))) {
      std::lock_guard<std::mutex> lock(_fsm_mutex);
      _fsm.confirmed();
      HEXILINK_LOGD(TAG, "%s confirmed after %u attempt(s)",
                    ghi::packet_type_name(type), static_cast<unsigned>(attempts));
      return SendResult::CONFIRMED;
    }
    if (attempts < _retransmit_count) {
      HEXILINK_LOGD(TAG, "%s not confirmed, retransmitting", ghi::packet_type_name(type));
    }
  }

  {
    std::lock_guard<std::mutex> lock(_fsm_mutex);
    _fsm.retriesExhausted();
  }
  HEXILINK_LOGW(TAG, "%s unconfirmed after %u attempts",
                ghi::packet_type_name(type), static_cast<unsigned>(attempts));
  return SendResult::UNCONFIRMED;
}

}  // namespace hexilink
