// Minimal host program for a KW40Z attached to a serial port.
//
//   ble_link_demo /dev/ttyUSB0
//
// Starts advertising, answers touch events on stdout and publishes a slowly
// changing set of sensor values every 5 seconds until interrupted.

#include <signal.h>
#include <stdio.h>

#include <atomic>
#include <chrono>
#include <thread>

#include "HexiLink.h"
#include "transport/PosixSerialPort.h"
#include "util/log.h"

using namespace hexilink;

namespace {

constexpr const char* TAG = "demo";

std::atomic<bool> g_stop(false);

void on_signal(int) {
  g_stop = true;
}

void on_up() { HEXILINK_LOGI(TAG, "button up"); }
void on_down() { HEXILINK_LOGI(TAG, "button down"); }
void on_left() { HEXILINK_LOGI(TAG, "button left"); }
void on_right() { HEXILINK_LOGI(TAG, "button right"); }
void on_slide() { HEXILINK_LOGI(TAG, "slide"); }

void on_passkey(uint32_t passkey) {
  HEXILINK_LOGI(TAG, "enter passkey %06u on the phone", static_cast<unsigned>(passkey));
}

void on_alert(etl::span<const uint8_t> data) {
  if (data.empty()) {
    return;
  }
  HEXILINK_LOGI(TAG, "alert type %u, %u bytes", static_cast<unsigned>(data[0]),
                static_cast<unsigned>(data.size()));
}

void on_notification(etl::span<const uint8_t> data) {
  HEXILINK_LOGI(TAG, "notification, %u bytes", static_cast<unsigned>(data.size()));
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 2) {
    fprintf(stderr, "usage: %s <serial-device>\n", argv[0]);
    return 2;
  }

  signal(SIGINT, on_signal);
  signal(SIGTERM, on_signal);

  PosixSerialPort port;
  if (!port.open(argv[1])) {
    return 1;
  }

  HexiLink link(port);
  link.onButtonUp(EventCallback::create<&on_up>());
  link.onButtonDown(EventCallback::create<&on_down>());
  link.onButtonLeft(EventCallback::create<&on_left>());
  link.onButtonRight(EventCallback::create<&on_right>());
  link.onSlide(EventCallback::create<&on_slide>());
  link.onPasskey(PasskeyCallback::create<&on_passkey>());
  link.onAlert(PayloadCallback::create<&on_alert>());
  link.onNotification(PayloadCallback::create<&on_notification>());

  if (link.begin() != LinkError::NONE) {
    return 1;
  }

  // Give the coprocessor time to answer the state queries.
  std::this_thread::sleep_for(std::chrono::milliseconds(500));
  if (!link.queryLinkInfo().advertising_on && link.toggleAdvertising() != LinkError::NONE) {
    HEXILINK_LOGW(TAG, "advertising toggle not queued");
  }
  if (link.setAppMode(ghi::AppMode::SENSOR_TAG) != LinkError::NONE) {
    HEXILINK_LOGW(TAG, "app mode not queued");
  }

  int32_t tick = 0;
  while (!g_stop) {
    SensorValues values;
    values.battery = 100 - (tick % 100);
    values.temperature = 2500 + (tick % 50);
    values.humidity = 4000 + (tick % 100);
    values.pressure = 10132;
    values.ambient_light = tick % 256;
    values.accel = AxisValues{{0, 0, 1000}};

    const LinkError err = link.pushSensorValues(values);
    if (err != LinkError::NONE) {
      HEXILINK_LOGW(TAG, "publish failed: %s", link_error_name(err));
    }

    const LinkInfo info = link.queryLinkInfo();
    HEXILINK_LOGI(TAG, "advertising=%d touch=%s connected=%d", info.advertising_on ? 1 : 0,
                  info.active_touch_group == ghi::TouchGroup::RIGHT ? "right" : "left",
                  info.link_connected ? 1 : 0);

    for (int i = 0; i < 50 && !g_stop; ++i) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    ++tick;
  }

  link.end();
  port.close();
  return 0;
}
