/*
 * This file is part of HexiLink.
 *
 * Copyright (C) 2025 HexiLink contributors
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */
#ifndef GHI_PROTOCOL_H
#define GHI_PROTOCOL_H

#include <stddef.h>
#include <stdint.h>

#include <type_traits>

#include "config/hexilink_config.h"

// KW40Z generic host interface (GHI) as implemented by the Hexiwear KW40Z
// application firmware.
//
//   [0] 0x55            start byte 1
//   [1] 0xAA | flags    start byte 2, bit0 confirm request, bit4 tx tag
//   [2] type            PacketType
//   [3] length          payload length, 0..23
//   [4..]               payload
//   [4+length] 0x45     trailer
//
// There is no checksum and no sequence number.

namespace hexilink {
namespace ghi {

template <typename E>
constexpr typename std::underlying_type<E>::type to_underlying(E e) noexcept {
  return static_cast<typename std::underlying_type<E>::type>(e);
}

constexpr uint8_t START_BYTE_1 = 0x55;
constexpr uint8_t START_BYTE_2 = 0xAA;
constexpr uint8_t TRAILER_BYTE = 0x45;

constexpr uint8_t RX_CONFIRM_MASK = 0x01;
constexpr uint8_t TX_PACKET_MASK = 0x10;
constexpr uint8_t FLAGS_MASK = RX_CONFIRM_MASK | TX_PACKET_MASK;

constexpr size_t HEADER_SIZE = 4;
constexpr size_t TRAILER_SIZE = 1;
constexpr size_t MAX_PAYLOAD_SIZE = 23;
constexpr size_t MAX_FRAME_SIZE = HEADER_SIZE + MAX_PAYLOAD_SIZE + TRAILER_SIZE;

constexpr unsigned long DEFAULT_BAUDRATE = HEXILINK_BAUDRATE;
constexpr uint8_t DEFAULT_RETRANSMIT_COUNT = HEXILINK_RETRANSMIT_COUNT;
constexpr unsigned long DEFAULT_RETRANSMIT_TIMEOUT_MS = HEXILINK_RETRANSMIT_TIMEOUT_MS;

enum class PacketType : uint8_t {
  // Capacitive touch electrodes
  PT_PRESS_UP = 0,
  PT_PRESS_DOWN = 1,
  PT_PRESS_LEFT = 2,
  PT_PRESS_RIGHT = 3,
  PT_SLIDE = 4,

  // Battery service
  PT_BATTERY_LEVEL = 5,

  // Motion and weather services
  PT_ACCEL = 6,
  PT_AMBI_LIGHT = 7,
  PT_PRESSURE = 8,
  PT_GYRO = 9,
  PT_TEMPERATURE = 10,
  PT_HUMIDITY = 11,
  PT_MAGNET = 12,

  // Health service
  PT_HEART_RATE = 13,
  PT_STEPS = 14,
  PT_CALORIES = 15,

  // Alert service
  PT_ALERT_IN = 16,
  PT_ALERT_OUT = 17,

  PT_PASS_DISPLAY = 18,

  // OTAP progress, relayed only
  PT_OTAP_KW40_STARTED = 19,
  PT_OTAP_MK64_STARTED = 20,
  PT_OTAP_COMPLETED = 21,
  PT_OTAP_FAILED = 22,

  // Active touch electrode group
  PT_TSI_GROUP_TOGGLE_ACTIVE = 23,
  PT_TSI_GROUP_GET_ACTIVE = 24,
  PT_TSI_GROUP_SEND_ACTIVE = 25,

  // Advertising
  PT_ADV_MODE_GET = 26,
  PT_ADV_MODE_SEND = 27,
  PT_ADV_MODE_TOGGLE = 28,

  PT_APP_MODE = 29,

  // Link state
  PT_LINK_STATE_GET = 30,
  PT_LINK_STATE_SEND = 31,

  PT_NOTIFICATION = 32,
  PT_BUILD_VERSION = 33,

  PT_OK = 255
};

enum class AlertInType : uint8_t {
  NOTIFICATION = 1,
  SETTINGS = 2,
  TIME_UPDATE = 3
};

enum class AppMode : uint8_t {
  IDLE = 0,
  SENSOR_TAG = 2,
  HEART_RATE = 5,
  PEDOMETER = 6
};

enum class TouchGroup : uint8_t {
  LEFT = 0,
  RIGHT = 1
};

const char* packet_type_name(PacketType type);

}  // namespace ghi
}  // namespace hexilink

#endif  // GHI_PROTOCOL_H
