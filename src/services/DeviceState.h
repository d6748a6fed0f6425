#ifndef DEVICE_STATE_H
#define DEVICE_STATE_H

#include <stdint.h>

#include <atomic>

#include "protocol/ghi_protocol.h"

namespace hexilink {

struct LinkInfo {
  bool advertising_on;
  ghi::TouchGroup active_touch_group;
  bool link_connected;
};

// Last values reported by the coprocessor. Written by the dispatch thread,
// read from anywhere; each field is independent.
class DeviceState {
 public:
  DeviceState()
      : _advertising_on(false),
        _touch_group(static_cast<uint8_t>(ghi::TouchGroup::LEFT)),
        _link_connected(false),
        _passcode(0) {}

  void setAdvertising(bool on) { _advertising_on = on; }
  void setTouchGroup(ghi::TouchGroup group) { _touch_group = ghi::to_underlying(group); }
  void setLinkConnected(bool connected) { _link_connected = connected; }
  void setPasscode(uint32_t passcode) { _passcode = passcode; }

  bool advertisingOn() const { return _advertising_on; }
  ghi::TouchGroup touchGroup() const { return static_cast<ghi::TouchGroup>(_touch_group.load()); }
  bool linkConnected() const { return _link_connected; }
  uint32_t passcode() const { return _passcode; }

  LinkInfo snapshot() const;

 private:
  std::atomic<bool> _advertising_on;
  std::atomic<uint8_t> _touch_group;
  std::atomic<bool> _link_connected;
  std::atomic<uint32_t> _passcode;
};

}  // namespace hexilink

#endif  // DEVICE_STATE_H
