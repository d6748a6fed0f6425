#include "DeviceState.h"

namespace hexilink {

LinkInfo DeviceState::snapshot() const {
  LinkInfo info;
  info.advertising_on = advertisingOn();
  info.active_touch_group = touchGroup();
  info.link_connected = linkConnected();
  return info;
}

}  // namespace hexilink
