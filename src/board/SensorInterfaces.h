#ifndef SENSOR_INTERFACES_H
#define SENSOR_INTERFACES_H

#include <stdint.h>

#include <etl/array.h>

#include "services/OutboundEncoder.h"

namespace hexilink {
namespace board {

// Onboard sensors as seen by the board layer. Raw readings feed the link;
// calibrated readings are in SI units. Every call returns false on a bus or
// device error. start() powers up and configures the device and is called
// once from HexiwearBoard::begin().

// x, y, z
using Vector3f = etl::array<float, 3>;

class BatterySense {
 public:
  virtual ~BatterySense() {}
  virtual bool start() = 0;
  // 16-bit ADC reading of the battery divider, full scale 3.3 V.
  virtual bool readRaw(uint16_t& out) = 0;
};

class TempHumidSensor {
 public:
  virtual ~TempHumidSensor() {}
  virtual bool start() = 0;
  virtual bool readRawTemperature(int32_t& out) = 0;
  virtual bool readRawHumidity(int32_t& out) = 0;
  // Degrees Celsius.
  virtual bool readTemperature(float& out) = 0;
  // Percent relative humidity.
  virtual bool readHumidity(float& out) = 0;
};

class GyroSensor {
 public:
  virtual ~GyroSensor() {}
  virtual bool start() = 0;
  virtual bool readRaw(AxisValues& out) = 0;
  // Degrees per second.
  virtual bool read(Vector3f& out) = 0;
};

class AccelMagSensor {
 public:
  virtual ~AccelMagSensor() {}
  virtual bool start() = 0;
  virtual bool readRawAccel(AxisValues& out) = 0;
  virtual bool readRawMagnet(AxisValues& out) = 0;
  // m/s^2.
  virtual bool readAccel(Vector3f& out) = 0;
  // Microtesla.
  virtual bool readMagnet(Vector3f& out) = 0;
};

class AmbientLightSensor {
 public:
  virtual ~AmbientLightSensor() {}
  virtual bool start() = 0;
  virtual bool readLux(int32_t& out) = 0;
};

class PressureSensor {
 public:
  virtual ~PressureSensor() {}
  virtual bool start() = 0;
  // 20-bit reading left-aligned in 24 bits.
  virtual bool readRaw(int32_t& out) = 0;
  // Pascal.
  virtual bool readPressure(float& out) = 0;
  // Metres, from the barometric altitude mode.
  virtual bool readAltitude(float& out) = 0;
};

// Optical heart-rate front end with a sample FIFO.
class PpgSensor {
 public:
  static constexpr size_t kSampleBytes = 6;
  using Sample = etl::array<uint8_t, kSampleBytes>;

  virtual ~PpgSensor() {}
  virtual bool start() = 0;
  virtual bool readSamples(Sample& out) = 0;
  virtual bool clearFifo() = 0;
};

}  // namespace board
}  // namespace hexilink

#endif  // SENSOR_INTERFACES_H
