#ifndef DISPATCHER_H
#define DISPATCHER_H

#include <stdint.h>

#include <mutex>

#include <etl/array.h>
#include <etl/delegate.h>
#include <etl/span.h>

#include "config/hexilink_config.h"
#include "protocol/ghi_frame.h"
#include "router/packet_router.h"
#include "DeviceState.h"
#include "FrameSink.h"

namespace hexilink {

using EventCallback = etl::delegate<void()>;
using PasskeyCallback = etl::delegate<void(uint32_t)>;
// The span is only valid for the duration of the call.
using PayloadCallback = etl::delegate<void(etl::span<const uint8_t>)>;

// Applies inbound frames: relays transmit-tagged frames, answers confirm
// requests with PT_OK, updates the device state and invokes the registered
// callbacks. Runs on the dispatch thread; callbacks run synchronously there.
class Dispatcher : public router::IPacketHandler {
 public:
  Dispatcher(DeviceState& state,
             FrameSink& outbound,
             bool tx_confirmation_enabled = HEXILINK_TX_CONFIRMATION_ENABLE != 0);

  Dispatcher(const Dispatcher&) = delete;
  Dispatcher& operator=(const Dispatcher&) = delete;

  void dispatch(const ghi::Frame& frame);

  // One slot per event; registering again replaces the previous callback.
  void onButtonUp(EventCallback cb) { _setTouch(ghi::PacketType::PT_PRESS_UP, cb); }
  void onButtonDown(EventCallback cb) { _setTouch(ghi::PacketType::PT_PRESS_DOWN, cb); }
  void onButtonLeft(EventCallback cb) { _setTouch(ghi::PacketType::PT_PRESS_LEFT, cb); }
  void onButtonRight(EventCallback cb) { _setTouch(ghi::PacketType::PT_PRESS_RIGHT, cb); }
  void onSlide(EventCallback cb) { _setTouch(ghi::PacketType::PT_SLIDE, cb); }
  void onPasskey(PasskeyCallback cb);
  void onAlert(PayloadCallback cb);
  void onNotification(PayloadCallback cb);

  // router::IPacketHandler
  void onTouchPacket(const router::PacketContext& ctx) override;
  void onPasskeyPacket(const router::PacketContext& ctx) override;
  void onDeviceStatePacket(const router::PacketContext& ctx) override;
  void onAlertPacket(const router::PacketContext& ctx) override;
  void onNotificationPacket(const router::PacketContext& ctx) override;
  void onInfoPacket(const router::PacketContext& ctx) override;
  void onUnknownPacket(const router::PacketContext& ctx) override;

 private:
  static constexpr size_t kTouchSlots = 5;  // PT_PRESS_UP .. PT_SLIDE

  void _setTouch(ghi::PacketType type, EventCallback cb);

  DeviceState& _state;
  FrameSink& _outbound;
  const bool _tx_confirmation_enabled;
  router::PacketRouter _router;

  std::mutex _callback_mutex;
  etl::array<EventCallback, kTouchSlots> _touch_callbacks;
  PasskeyCallback _passkey_callback;
  PayloadCallback _alert_callback;
  PayloadCallback _notification_callback;
};

}  // namespace hexilink

#endif  // DISPATCHER_H
