#include "Dispatcher.h"

#include "util/log.h"

namespace hexilink {

namespace {
constexpr const char* TAG = "dispatch";
}

Dispatcher::Dispatcher(DeviceState& state, FrameSink& outbound, bool tx_confirmation_enabled)
    : _state(state),
      _outbound(outbound),
      _tx_confirmation_enabled(tx_confirmation_enabled) {
  _router.setHandler(this);
}

void Dispatcher::_setTouch(ghi::PacketType type, EventCallback cb) {
  std::lock_guard<std::mutex> lock(_callback_mutex);
  _touch_callbacks[ghi::to_underlying(type)] = cb;
}

void Dispatcher::onPasskey(PasskeyCallback cb) {
  std::lock_guard<std::mutex> lock(_callback_mutex);
  _passkey_callback = cb;
}

void Dispatcher::onAlert(PayloadCallback cb) {
  std::lock_guard<std::mutex> lock(_callback_mutex);
  _alert_callback = cb;
}

void Dispatcher::onNotification(PayloadCallback cb) {
  std::lock_guard<std::mutex> lock(_callback_mutex);
  _notification_callback = cb;
}

void Dispatcher::dispatch(const ghi::Frame& frame) {
  if (frame.txTagged()) {
    // Queued for transmission, not addressed to us.
    const LinkError err = _outbound.submit(ghi::serialize(frame));
    if (err != LinkError::NONE) {
      HEXILINK_LOGW(TAG, "relay of %s failed: %s",
                    ghi::packet_type_name(frame.type()), link_error_name(err));
    }
    return;
  }

  if (frame.confirmRequested() && _tx_confirmation_enabled) {
    const LinkError err = submit_packet(_outbound, ghi::PacketType::PT_OK, false);
    if (err != LinkError::NONE) {
      HEXILINK_LOGW(TAG, "PT_OK for %s not queued: %s",
                    ghi::packet_type_name(frame.type()), link_error_name(err));
    }
  }

  _router.route(frame);
}

void Dispatcher::onTouchPacket(const router::PacketContext& ctx) {
  EventCallback cb;
  {
    std::lock_guard<std::mutex> lock(_callback_mutex);
    cb = _touch_callbacks[ghi::to_underlying(ctx.type)];
  }
  if (cb.is_valid()) {
    cb();
  }
}

void Dispatcher::onPasskeyPacket(const router::PacketContext& ctx) {
  if (ctx.frame->length() < 3) {
    HEXILINK_LOGW(TAG, "passkey frame too short (%u bytes)",
                  static_cast<unsigned>(ctx.frame->length()));
    return;
  }
  const uint32_t passcode = ghi::read_u24_le(ctx.frame->payload.data());
  _state.setPasscode(passcode);
  HEXILINK_LOGI(TAG, "pairing passkey %06u", static_cast<unsigned>(passcode));

  PasskeyCallback cb;
  {
    std::lock_guard<std::mutex> lock(_callback_mutex);
    cb = _passkey_callback;
  }
  if (cb.is_valid()) {
    cb(passcode);
  }
}

void Dispatcher::onDeviceStatePacket(const router::PacketContext& ctx) {
  if (ctx.frame->length() == 0) {
    HEXILINK_LOGW(TAG, "%s without payload ignored", ghi::packet_type_name(ctx.type));
    return;
  }
  const uint8_t value = ctx.frame->payload[0];
  switch (ctx.type) {
    case ghi::PacketType::PT_TSI_GROUP_SEND_ACTIVE:
      _state.setTouchGroup(static_cast<ghi::TouchGroup>(value));
      break;
    case ghi::PacketType::PT_ADV_MODE_SEND:
      _state.setAdvertising(value != 0);
      break;
    case ghi::PacketType::PT_LINK_STATE_SEND:
      _state.setLinkConnected(value != 0);
      break;
    default:
      return;
  }
  HEXILINK_LOGD(TAG, "%s = %u", ghi::packet_type_name(ctx.type), static_cast<unsigned>(value));
}

void Dispatcher::onAlertPacket(const router::PacketContext& ctx) {
  PayloadCallback cb;
  {
    std::lock_guard<std::mutex> lock(_callback_mutex);
    cb = _alert_callback;
  }
  if (cb.is_valid()) {
    cb(ctx.frame->payloadView());
  }
}

void Dispatcher::onNotificationPacket(const router::PacketContext& ctx) {
  PayloadCallback cb;
  {
    std::lock_guard<std::mutex> lock(_callback_mutex);
    cb = _notification_callback;
  }
  if (cb.is_valid()) {
    cb(ctx.frame->payloadView());
  }
}

void Dispatcher::onInfoPacket(const router::PacketContext& ctx) {
  HEXILINK_LOGD(TAG, "%s (len=%u)", ghi::packet_type_name(ctx.type),
                static_cast<unsigned>(ctx.frame->length()));
}

void Dispatcher::onUnknownPacket(const router::PacketContext& ctx) {
  HEXILINK_LOGD(TAG, "ignoring packet type %u", static_cast<unsigned>(ghi::to_underlying(ctx.type)));
}

}  // namespace hexilink
