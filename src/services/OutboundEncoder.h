#ifndef OUTBOUND_ENCODER_H
#define OUTBOUND_ENCODER_H

#include <stdint.h>

#include <etl/array.h>
#include <etl/optional.h>
#include <etl/span.h>

#include "protocol/ghi_protocol.h"
#include "FrameSink.h"

namespace hexilink {

using AxisValues = etl::array<int32_t, 3>;

// Absent fields are skipped. Each present field becomes one confirmable frame.
struct SensorValues {
  etl::optional<int32_t> battery;        // 0..100 %
  etl::optional<AxisValues> accel;       // 0..65535 per axis
  etl::optional<AxisValues> gyro;        // 0..65535 per axis
  etl::optional<AxisValues> magnet;      // 0..65535 per axis
  etl::optional<int32_t> ambient_light;  // 0..255
  etl::optional<int32_t> temperature;    // 0..65535
  etl::optional<int32_t> humidity;       // 0..65535
  etl::optional<int32_t> pressure;       // 0..65535
};

struct AppData {
  etl::optional<int32_t> heart_rate;  // 0..255 bpm
  etl::optional<int32_t> steps;       // 0..65535
  etl::optional<int32_t> calories;    // 0..65535
};

// Fields are validated and queued one at a time, in declaration order. On
// RANGE_ERROR the fields before the offending one are already queued.
LinkError push_sensor_values(FrameSink& sink, const SensorValues& values);
LinkError push_app_data(FrameSink& sink, const AppData& data);

LinkError send_alert(FrameSink& sink, etl::span<const uint8_t> data);
LinkError toggle_advertising(FrameSink& sink);
LinkError toggle_touch_group(FrameSink& sink);

// Only IDLE and SENSOR_TAG can be selected from the host.
LinkError set_app_mode(FrameSink& sink, ghi::AppMode mode);

// Non-confirmable queries for the active touch group, advertising mode and
// link state, sent when the link starts.
LinkError send_startup_queries(FrameSink& sink);

}  // namespace hexilink

#endif  // OUTBOUND_ENCODER_H
