#include <cassert>
#include <vector>

#include "router/packet_router.h"
#include "services/DeviceState.h"
#include "services/Dispatcher.h"
#include "test_support.h"

using namespace hexilink;
using ghi::PacketType;

namespace {

struct Recorder {
  int up = 0;
  int down = 0;
  int left = 0;
  int right = 0;
  int slide = 0;
  int passkey_calls = 0;
  uint32_t passkey = 0;
  std::vector<uint8_t> alert;
  std::vector<uint8_t> notification;
  int alert_calls = 0;
  int notification_calls = 0;

  void onUp() { ++up; }
  void onDown() { ++down; }
  void onLeft() { ++left; }
  void onRight() { ++right; }
  void onSlide() { ++slide; }
  void onPasskey(uint32_t value) {
    ++passkey_calls;
    passkey = value;
  }
  void onAlert(etl::span<const uint8_t> data) {
    ++alert_calls;
    alert.assign(data.begin(), data.end());
  }
  void onNotification(etl::span<const uint8_t> data) {
    ++notification_calls;
    notification.assign(data.begin(), data.end());
  }

  int touchTotal() const { return up + down + left + right + slide; }
};

int g_replacement_up = 0;
void replacement_up() { ++g_replacement_up; }

void register_all(Dispatcher& dispatcher, Recorder& rec) {
  dispatcher.onButtonUp(EventCallback::create<Recorder, &Recorder::onUp>(rec));
  dispatcher.onButtonDown(EventCallback::create<Recorder, &Recorder::onDown>(rec));
  dispatcher.onButtonLeft(EventCallback::create<Recorder, &Recorder::onLeft>(rec));
  dispatcher.onButtonRight(EventCallback::create<Recorder, &Recorder::onRight>(rec));
  dispatcher.onSlide(EventCallback::create<Recorder, &Recorder::onSlide>(rec));
  dispatcher.onPasskey(PasskeyCallback::create<Recorder, &Recorder::onPasskey>(rec));
  dispatcher.onAlert(PayloadCallback::create<Recorder, &Recorder::onAlert>(rec));
  dispatcher.onNotification(PayloadCallback::create<Recorder, &Recorder::onNotification>(rec));
}

}  // namespace

static void test_categorize_packet() {
  using namespace router;
  assert(categorize_packet(PacketType::PT_PRESS_UP) == MSG_TOUCH);
  assert(categorize_packet(PacketType::PT_SLIDE) == MSG_TOUCH);
  assert(categorize_packet(PacketType::PT_PASS_DISPLAY) == MSG_PASSKEY);
  assert(categorize_packet(PacketType::PT_ADV_MODE_SEND) == MSG_DEVICE_STATE);
  assert(categorize_packet(PacketType::PT_ALERT_IN) == MSG_ALERT);
  assert(categorize_packet(PacketType::PT_NOTIFICATION) == MSG_NOTIFICATION);
  assert(categorize_packet(PacketType::PT_OTAP_FAILED) == MSG_INFO);
  assert(categorize_packet(PacketType::PT_OK) == MSG_INFO);
  assert(categorize_packet(PacketType::PT_ACCEL) == MSG_UNKNOWN);
  assert(categorize_packet(static_cast<PacketType>(100)) == MSG_UNKNOWN);
}

static void test_button_routes_to_single_callback() {
  DeviceState state;
  RecordingSink sink;
  Dispatcher dispatcher(state, sink);
  Recorder rec;
  register_all(dispatcher, rec);

  dispatcher.dispatch(make_frame(PacketType::PT_PRESS_UP, 0));
  assert(rec.up == 1);
  assert(rec.touchTotal() == 1);
  assert(rec.passkey_calls == 0 && rec.alert_calls == 0 && rec.notification_calls == 0);

  dispatcher.dispatch(make_frame(PacketType::PT_SLIDE, 0));
  assert(rec.slide == 1);
  assert(rec.touchTotal() == 2);
  assert(sink.frames.empty());
}

static void test_unregistered_callback_is_noop() {
  DeviceState state;
  RecordingSink sink;
  Dispatcher dispatcher(state, sink);
  Recorder rec;
  dispatcher.onButtonUp(EventCallback::create<Recorder, &Recorder::onUp>(rec));

  dispatcher.dispatch(make_frame(PacketType::PT_PRESS_DOWN, 0));
  dispatcher.dispatch(make_frame(PacketType::PT_ALERT_IN, 0, {0x01, 0x02}));
  dispatcher.dispatch(make_frame(PacketType::PT_PASS_DISPLAY, 0, {0x01, 0x00, 0x00}));
  assert(rec.up == 0);
  assert(state.passcode() == 1);
}

static void test_last_registration_wins() {
  DeviceState state;
  RecordingSink sink;
  Dispatcher dispatcher(state, sink);
  Recorder rec;
  dispatcher.onButtonUp(EventCallback::create<Recorder, &Recorder::onUp>(rec));
  dispatcher.onButtonUp(EventCallback::create<&replacement_up>());

  dispatcher.dispatch(make_frame(PacketType::PT_PRESS_UP, 0));
  assert(rec.up == 0);
  assert(g_replacement_up == 1);
}

static void test_passkey_decoding() {
  DeviceState state;
  RecordingSink sink;
  Dispatcher dispatcher(state, sink);
  Recorder rec;
  register_all(dispatcher, rec);

  dispatcher.dispatch(make_frame(PacketType::PT_PASS_DISPLAY, 0, {0x40, 0xE2, 0x01}));
  assert(rec.passkey_calls == 1);
  assert(rec.passkey == 123456u);
  assert(state.passcode() == 123456u);

  // Too short to carry a passkey.
  dispatcher.dispatch(make_frame(PacketType::PT_PASS_DISPLAY, 0, {0x01}));
  assert(rec.passkey_calls == 1);
  assert(state.passcode() == 123456u);
}

static void test_device_state_updates() {
  DeviceState state;
  RecordingSink sink;
  Dispatcher dispatcher(state, sink);

  LinkInfo info = state.snapshot();
  assert(!info.link_connected && !info.advertising_on);
  assert(info.active_touch_group == ghi::TouchGroup::LEFT);

  dispatcher.dispatch(make_frame(PacketType::PT_LINK_STATE_SEND, 0, {0x01}));
  dispatcher.dispatch(make_frame(PacketType::PT_ADV_MODE_SEND, 0, {0x01}));
  dispatcher.dispatch(make_frame(PacketType::PT_TSI_GROUP_SEND_ACTIVE, 0, {0x01}));
  info = state.snapshot();
  assert(info.link_connected);
  assert(info.advertising_on);
  assert(info.active_touch_group == ghi::TouchGroup::RIGHT);

  // An empty payload leaves the mirror untouched.
  dispatcher.dispatch(make_frame(PacketType::PT_LINK_STATE_SEND, 0));
  assert(state.linkConnected());

  dispatcher.dispatch(make_frame(PacketType::PT_LINK_STATE_SEND, 0, {0x00}));
  assert(!state.linkConnected());
}

static void test_confirm_request_is_acknowledged() {
  DeviceState state;
  RecordingSink sink;
  Dispatcher dispatcher(state, sink, true);
  Recorder rec;
  register_all(dispatcher, rec);

  dispatcher.dispatch(make_frame(PacketType::PT_PRESS_LEFT, ghi::RX_CONFIRM_MASK));
  assert(rec.left == 1);
  TEST_ASSERT_EQ_UINT(sink.frames.size(), 1);
  const uint8_t expected[] = {0x55, 0xBA, 0xFF, 0x00, 0x45};
  TEST_ASSERT_EQ_UINT(sink.frames[0].size(), sizeof(expected));
  assert(test_memeq(sink.frames[0].data(), expected, sizeof(expected)));

  // No confirm bit, no acknowledgement.
  dispatcher.dispatch(make_frame(PacketType::PT_PRESS_LEFT, 0));
  TEST_ASSERT_EQ_UINT(sink.frames.size(), 1);
}

static void test_acknowledgement_can_be_disabled() {
  DeviceState state;
  RecordingSink sink;
  Dispatcher dispatcher(state, sink, false);

  dispatcher.dispatch(make_frame(PacketType::PT_LINK_STATE_SEND, ghi::RX_CONFIRM_MASK, {0x01}));
  assert(sink.frames.empty());
  assert(state.linkConnected());
}

static void test_tagged_frame_is_relayed() {
  DeviceState state;
  RecordingSink sink;
  Dispatcher dispatcher(state, sink, true);
  Recorder rec;
  register_all(dispatcher, rec);

  const uint8_t flags = ghi::TX_PACKET_MASK | ghi::RX_CONFIRM_MASK;
  dispatcher.dispatch(make_frame(PacketType::PT_PRESS_UP, flags));
  assert(rec.up == 0);
  TEST_ASSERT_EQ_UINT(sink.frames.size(), 1);
  const std::vector<uint8_t> expected = make_wire_frame(PacketType::PT_PRESS_UP, flags);
  assert(sink.frames[0] == expected);
}

static void test_alert_and_notification_payloads() {
  DeviceState state;
  RecordingSink sink;
  Dispatcher dispatcher(state, sink);
  Recorder rec;
  register_all(dispatcher, rec);

  dispatcher.dispatch(make_frame(PacketType::PT_ALERT_IN, 0, {0x03, 0x10, 0x20}));
  assert(rec.alert_calls == 1);
  assert(rec.alert == std::vector<uint8_t>({0x03, 0x10, 0x20}));

  dispatcher.dispatch(make_frame(PacketType::PT_NOTIFICATION, 0, {0x01, 0x05}));
  assert(rec.notification_calls == 1);
  assert(rec.notification == std::vector<uint8_t>({0x01, 0x05}));
  assert(rec.alert_calls == 1);
}

static void test_informational_and_unknown_frames_are_dropped() {
  DeviceState state;
  RecordingSink sink;
  Dispatcher dispatcher(state, sink);
  Recorder rec;
  register_all(dispatcher, rec);

  dispatcher.dispatch(make_frame(PacketType::PT_OK, 0));
  dispatcher.dispatch(make_frame(PacketType::PT_BUILD_VERSION, 0, {0x01, 0x02, 0x03}));
  dispatcher.dispatch(make_frame(PacketType::PT_OTAP_COMPLETED, 0));
  dispatcher.dispatch(make_frame(PacketType::PT_ACCEL, 0, {0, 1, 0, 2, 0, 3}));
  dispatcher.dispatch(make_frame(static_cast<PacketType>(100), 0));

  assert(rec.touchTotal() == 0);
  assert(rec.alert_calls == 0 && rec.notification_calls == 0 && rec.passkey_calls == 0);
  assert(sink.frames.empty());
  assert(!state.linkConnected());
}

int main() {
  test_categorize_packet();
  test_button_routes_to_single_callback();
  test_unregistered_callback_is_noop();
  test_last_registration_wins();
  test_passkey_decoding();
  test_device_state_updates();
  test_confirm_request_is_acknowledged();
  test_acknowledgement_can_be_disabled();
  test_tagged_frame_is_relayed();
  test_alert_and_notification_payloads();
  test_informational_and_unknown_frames_are_dropped();
  return 0;
}
