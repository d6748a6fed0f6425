/**
 * @file packet_router.h
 * @brief ETL message_router dispatching inbound GHI frames by packet type.
 *
 * Packet categories (message IDs):
 *   - MSG_TOUCH (0): PT_PRESS_UP/DOWN/LEFT/RIGHT, PT_SLIDE
 *   - MSG_PASSKEY (1): PT_PASS_DISPLAY
 *   - MSG_DEVICE_STATE (2): PT_TSI_GROUP_SEND_ACTIVE, PT_ADV_MODE_SEND,
 *     PT_LINK_STATE_SEND
 *   - MSG_ALERT (3): PT_ALERT_IN
 *   - MSG_NOTIFICATION (4): PT_NOTIFICATION
 *   - MSG_INFO (5): PT_OK, PT_OTAP_*, PT_BUILD_VERSION
 *   - MSG_UNKNOWN (6): everything else
 */
#ifndef PACKET_ROUTER_H
#define PACKET_ROUTER_H

#include "etl/message.h"
#include "etl/message_router.h"
#include "protocol/ghi_frame.h"
#include "protocol/ghi_protocol.h"

namespace hexilink {
namespace router {

enum MessageId : etl::message_id_t {
  MSG_TOUCH = 0,
  MSG_PASSKEY = 1,
  MSG_DEVICE_STATE = 2,
  MSG_ALERT = 3,
  MSG_NOTIFICATION = 4,
  MSG_INFO = 5,
  MSG_UNKNOWN = 6,
  NUMBER_OF_MESSAGES = 7
};

// Frames are routed by pointer; the frame outlives the route() call.
struct PacketContext {
  const ghi::Frame* frame;
  ghi::PacketType type;
};

struct MsgTouch : public etl::message<MSG_TOUCH> {
  PacketContext ctx;
  explicit MsgTouch(const PacketContext& c) : ctx(c) {}
};

struct MsgPasskey : public etl::message<MSG_PASSKEY> {
  PacketContext ctx;
  explicit MsgPasskey(const PacketContext& c) : ctx(c) {}
};

struct MsgDeviceState : public etl::message<MSG_DEVICE_STATE> {
  PacketContext ctx;
  explicit MsgDeviceState(const PacketContext& c) : ctx(c) {}
};

struct MsgAlert : public etl::message<MSG_ALERT> {
  PacketContext ctx;
  explicit MsgAlert(const PacketContext& c) : ctx(c) {}
};

struct MsgNotification : public etl::message<MSG_NOTIFICATION> {
  PacketContext ctx;
  explicit MsgNotification(const PacketContext& c) : ctx(c) {}
};

struct MsgInfo : public etl::message<MSG_INFO> {
  PacketContext ctx;
  explicit MsgInfo(const PacketContext& c) : ctx(c) {}
};

struct MsgUnknown : public etl::message<MSG_UNKNOWN> {
  PacketContext ctx;
  explicit MsgUnknown(const PacketContext& c) : ctx(c) {}
};

inline MessageId categorize_packet(ghi::PacketType type) {
  using ghi::PacketType;
  switch (type) {
    case PacketType::PT_PRESS_UP:
    case PacketType::PT_PRESS_DOWN:
    case PacketType::PT_PRESS_LEFT:
    case PacketType::PT_PRESS_RIGHT:
    case PacketType::PT_SLIDE:
      return MSG_TOUCH;
    case PacketType::PT_PASS_DISPLAY:
      return MSG_PASSKEY;
    case PacketType::PT_TSI_GROUP_SEND_ACTIVE:
    case PacketType::PT_ADV_MODE_SEND:
    case PacketType::PT_LINK_STATE_SEND:
      return MSG_DEVICE_STATE;
    case PacketType::PT_ALERT_IN:
      return MSG_ALERT;
    case PacketType::PT_NOTIFICATION:
      return MSG_NOTIFICATION;
    case PacketType::PT_OK:
    case PacketType::PT_OTAP_KW40_STARTED:
    case PacketType::PT_OTAP_MK64_STARTED:
    case PacketType::PT_OTAP_COMPLETED:
    case PacketType::PT_OTAP_FAILED:
    case PacketType::PT_BUILD_VERSION:
      return MSG_INFO;
    default:
      return MSG_UNKNOWN;
  }
}

class IPacketHandler {
public:
  virtual ~IPacketHandler() {}
  virtual void onTouchPacket(const PacketContext& ctx) = 0;
  virtual void onPasskeyPacket(const PacketContext& ctx) = 0;
  virtual void onDeviceStatePacket(const PacketContext& ctx) = 0;
  virtual void onAlertPacket(const PacketContext& ctx) = 0;
  virtual void onNotificationPacket(const PacketContext& ctx) = 0;
  virtual void onInfoPacket(const PacketContext& ctx) = 0;
  virtual void onUnknownPacket(const PacketContext& ctx) = 0;
};

class PacketRouter : public etl::message_router<PacketRouter,
                                                MsgTouch,
                                                MsgPasskey,
                                                MsgDeviceState,
                                                MsgAlert,
                                                MsgNotification,
                                                MsgInfo,
                                                MsgUnknown>
{
public:
  PacketRouter()
    : message_router(ROUTER_ID)
    , _handler(nullptr)
  {
  }

  void setHandler(IPacketHandler* handler) {
    _handler = handler;
  }

  void route(const ghi::Frame& frame) {
    PacketContext ctx;
    ctx.frame = &frame;
    ctx.type = frame.type();
    switch (categorize_packet(ctx.type)) {
      case MSG_TOUCH:        receive(MsgTouch(ctx));        break;
      case MSG_PASSKEY:      receive(MsgPasskey(ctx));      break;
      case MSG_DEVICE_STATE: receive(MsgDeviceState(ctx));  break;
      case MSG_ALERT:        receive(MsgAlert(ctx));        break;
      case MSG_NOTIFICATION: receive(MsgNotification(ctx)); break;
      case MSG_INFO:         receive(MsgInfo(ctx));         break;
      default:               receive(MsgUnknown(ctx));      break;
    }
  }

  void on_receive(const MsgTouch& msg)        { if (_handler) _handler->onTouchPacket(msg.ctx); }
  void on_receive(const MsgPasskey& msg)      { if (_handler) _handler->onPasskeyPacket(msg.ctx); }
  void on_receive(const MsgDeviceState& msg)  { if (_handler) _handler->onDeviceStatePacket(msg.ctx); }
  void on_receive(const MsgAlert& msg)        { if (_handler) _handler->onAlertPacket(msg.ctx); }
  void on_receive(const MsgNotification& msg) { if (_handler) _handler->onNotificationPacket(msg.ctx); }
  void on_receive(const MsgInfo& msg)         { if (_handler) _handler->onInfoPacket(msg.ctx); }
  void on_receive(const MsgUnknown& msg)      { if (_handler) _handler->onUnknownPacket(msg.ctx); }

  void on_receive_unknown(const etl::imessage&) {
    // Every category has a handler above.
  }

private:
  static constexpr etl::message_router_id_t ROUTER_ID = 1;
  IPacketHandler* _handler;
};

}  // namespace router
}  // namespace hexilink

#endif // PACKET_ROUTER_H
