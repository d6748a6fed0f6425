#include "OutboundEncoder.h"

#include "protocol/PacketBuilder.h"
#include "util/log.h"

namespace hexilink {

namespace {

constexpr const char* TAG = "encode";

bool in_range(int32_t value, int32_t max) {
  return value >= 0 && value <= max;
}

LinkError push_u8(FrameSink& sink, ghi::PacketType type, int32_t value, int32_t max) {
  if (!in_range(value, max)) {
    HEXILINK_LOGW(TAG, "%s value %ld out of range 0..%ld", ghi::packet_type_name(type),
                  static_cast<long>(value), static_cast<long>(max));
    return LinkError::RANGE_ERROR;
  }
  const uint8_t byte = static_cast<uint8_t>(value);
  return submit_packet(sink, type, true, etl::span<const uint8_t>(&byte, 1));
}

LinkError submit_built(FrameSink& sink, ghi::PacketType type, const ghi::PacketBuilder& builder) {
  if (builder.overflowed()) {
    HEXILINK_LOGW(TAG, "%s payload overflow", ghi::packet_type_name(type));
    return LinkError::INVALID_PAYLOAD;
  }
  return submit_packet(sink, type, true, builder.view());
}

LinkError push_u16(FrameSink& sink, ghi::PacketType type, int32_t value) {
  if (!in_range(value, 0xFFFF)) {
    HEXILINK_LOGW(TAG, "%s value %ld out of range 0..65535", ghi::packet_type_name(type),
                  static_cast<long>(value));
    return LinkError::RANGE_ERROR;
  }
  ghi::Payload payload;
  ghi::PacketBuilder builder(payload);
  builder.add_u16(static_cast<uint16_t>(value));
  return submit_built(sink, type, builder);
}

LinkError push_axes(FrameSink& sink, ghi::PacketType type, const AxisValues& axes) {
  etl::array<uint16_t, 3> checked;
  for (size_t i = 0; i < axes.size(); ++i) {
    if (!in_range(axes[i], 0xFFFF)) {
      HEXILINK_LOGW(TAG, "%s axis %u value %ld out of range 0..65535", ghi::packet_type_name(type),
                    static_cast<unsigned>(i), static_cast<long>(axes[i]));
      return LinkError::RANGE_ERROR;
    }
    checked[i] = static_cast<uint16_t>(axes[i]);
  }
  ghi::Payload payload;
  ghi::PacketBuilder builder(payload);
  builder.add_axes(checked);
  return submit_built(sink, type, builder);
}

}  // namespace

const char* link_error_name(LinkError error) {
  switch (error) {
    case LinkError::NONE:            return "none";
    case LinkError::RANGE_ERROR:     return "range_error";
    case LinkError::INVALID_PAYLOAD: return "invalid_payload";
    case LinkError::NOT_STARTED:     return "not_started";
    case LinkError::QUEUE_CLOSED:    return "queue_closed";
  }
  return "unknown";
}

LinkError submit_packet(FrameSink& sink,
                        ghi::PacketType type,
                        bool confirm_requested,
                        etl::span<const uint8_t> payload) {
  auto raw = ghi::encode(type, confirm_requested, payload);
  if (!raw.has_value()) {
    HEXILINK_LOGW(TAG, "%s payload of %u bytes rejected: %s", ghi::packet_type_name(type),
                  static_cast<unsigned>(payload.size()), ghi::frame_error_name(raw.error()));
    return LinkError::INVALID_PAYLOAD;
  }
  return sink.submit(raw.value());
}

LinkError push_sensor_values(FrameSink& sink, const SensorValues& values) {
  using ghi::PacketType;
  LinkError err = LinkError::NONE;

  if (values.battery.has_value() &&
      (err = push_u8(sink, PacketType::PT_BATTERY_LEVEL, *values.battery, 100)) != LinkError::NONE) {
    return err;
  }
  if (values.accel.has_value() &&
      (err = push_axes(sink, PacketType::PT_ACCEL, *values.accel)) != LinkError::NONE) {
    return err;
  }
  if (values.gyro.has_value() &&
      (err = push_axes(sink, PacketType::PT_GYRO, *values.gyro)) != LinkError::NONE) {
    return err;
  }
  if (values.magnet.has_value() &&
      (err = push_axes(sink, PacketType::PT_MAGNET, *values.magnet)) != LinkError::NONE) {
    return err;
  }
  if (values.ambient_light.has_value() &&
      (err = push_u8(sink, PacketType::PT_AMBI_LIGHT, *values.ambient_light, 0xFF)) != LinkError::NONE) {
    return err;
  }
  if (values.temperature.has_value() &&
      (err = push_u16(sink, PacketType::PT_TEMPERATURE, *values.temperature)) != LinkError::NONE) {
    return err;
  }
  if (values.humidity.has_value() &&
      (err = push_u16(sink, PacketType::PT_HUMIDITY, *values.humidity)) != LinkError::NONE) {
    return err;
  }
  if (values.pressure.has_value() &&
      (err = push_u16(sink, PacketType::PT_PRESSURE, *values.pressure)) != LinkError::NONE) {
    return err;
  }
  return LinkError::NONE;
}

LinkError push_app_data(FrameSink& sink, const AppData& data) {
  using ghi::PacketType;
  LinkError err = LinkError::NONE;

  if (data.heart_rate.has_value() &&
      (err = push_u8(sink, PacketType::PT_HEART_RATE, *data.heart_rate, 0xFF)) != LinkError::NONE) {
    return err;
  }
  if (data.steps.has_value() &&
      (err = push_u16(sink, PacketType::PT_STEPS, *data.steps)) != LinkError::NONE) {
    return err;
  }
  if (data.calories.has_value() &&
      (err = push_u16(sink, PacketType::PT_CALORIES, *data.calories)) != LinkError::NONE) {
    return err;
  }
  return LinkError::NONE;
}

LinkError send_alert(FrameSink& sink, etl::span<const uint8_t> data) {
  return submit_packet(sink, ghi::PacketType::PT_ALERT_OUT, true, data);
}

LinkError toggle_advertising(FrameSink& sink) {
  return submit_packet(sink, ghi::PacketType::PT_ADV_MODE_TOGGLE, true);
}

LinkError toggle_touch_group(FrameSink& sink) {
  return submit_packet(sink, ghi::PacketType::PT_TSI_GROUP_TOGGLE_ACTIVE, true);
}

LinkError set_app_mode(FrameSink& sink, ghi::AppMode mode) {
  if (mode != ghi::AppMode::IDLE && mode != ghi::AppMode::SENSOR_TAG) {
    HEXILINK_LOGW(TAG, "app mode %u cannot be selected", static_cast<unsigned>(ghi::to_underlying(mode)));
    return LinkError::RANGE_ERROR;
  }
  const uint8_t byte = ghi::to_underlying(mode);
  return submit_packet(sink, ghi::PacketType::PT_APP_MODE, true, etl::span<const uint8_t>(&byte, 1));
}

LinkError send_startup_queries(FrameSink& sink) {
  static const ghi::PacketType kQueries[] = {
    ghi::PacketType::PT_TSI_GROUP_GET_ACTIVE,
    ghi::PacketType::PT_ADV_MODE_GET,
    ghi::PacketType::PT_LINK_STATE_GET,
  };
  for (const ghi::PacketType type : kQueries) {
    const LinkError err = submit_packet(sink, type, false);
    if (err != LinkError::NONE) {
      return err;
    }
  }
  return LinkError::NONE;
}

}  // namespace hexilink
