/*
 * This file is part of HexiLink.
 * (C) 2025 HexiLink contributors
 */
#ifndef HEXIWEAR_BOARD_H
#define HEXIWEAR_BOARD_H

#include <stdint.h>

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>

#include <etl/optional.h>

#include "config/hexilink_config.h"
#include "HexiLink.h"
#include "services/HeartRateDetector.h"
#include "SensorInterfaces.h"

namespace hexilink {
namespace board {

// Sensors fitted on this board. A null entry means the sensor is not used.
struct BoardSensors {
  BatterySense* battery = nullptr;
  TempHumidSensor* temp_humid = nullptr;
  GyroSensor* gyro = nullptr;
  AccelMagSensor* accel_mag = nullptr;
  AmbientLightSensor* ambient_light = nullptr;
  PressureSensor* pressure = nullptr;
  PpgSensor* ppg = nullptr;
};

struct BoardConfig {
  unsigned long publish_interval_ms = HEXILINK_SENSOR_PUBLISH_INTERVAL_MS;
  unsigned long publish_backoff_ms = HEXILINK_SENSOR_PUBLISH_BACKOFF_MS;
  unsigned long hr_sample_interval_ms = HEXILINK_HR_SAMPLE_INTERVAL_MS;
  unsigned long hr_reset_window_ms = HEXILINK_HR_RESET_WINDOW_MS;
  unsigned long hr_backoff_ms = HEXILINK_LOOP_BACKOFF_MS;
};

// Battery charge in percent from a raw battery-sense reading.
int battery_level_from_raw(uint16_t raw);

// Wearable board: drives the sensors and publishes them over the link.
//
// Two tasks run after begin(): the heart-rate sampler (when a PPG sensor is
// fitted) and the sensor publisher, which stays parked until
// enableSensorPublishing().
class HexiwearBoard {
 public:
  HexiwearBoard(HexiLink& link, const BoardSensors& sensors, const BoardConfig& config = BoardConfig());
  ~HexiwearBoard();

  HexiwearBoard(const HexiwearBoard&) = delete;
  HexiwearBoard& operator=(const HexiwearBoard&) = delete;

  // Starts every fitted sensor, then the tasks. Returns false, naming the
  // sensor in the log, if one fails to start; no task is running then.
  bool begin();
  void end();

  void enableSensorPublishing();
  void disableSensorPublishing();
  bool isPublishing() const { return _publishing; }

  // Readings of the fitted sensors, each under that sensor's lock. Empty when
  // the sensor is not fitted or the read fails.
  etl::optional<int> getAverageHeartRate() const;
  etl::optional<int> getBatteryLevel();
  etl::optional<float> getTemperature();
  etl::optional<float> getHumidity();
  etl::optional<float> getPressure();
  etl::optional<float> getAltitude();
  etl::optional<Vector3f> getAccelerometerData();
  etl::optional<Vector3f> getMagnetometerData();
  etl::optional<Vector3f> getGyroscopeData();
  etl::optional<int32_t> getAmbientLight();

  // Toggle only when the coprocessor reports the opposite state.
  LinkError bluetoothOn();
  LinkError bluetoothOff();
  LinkError rightTouchActive();
  LinkError leftTouchActive();
  LinkInfo bluetoothInfo() const { return _link.queryLinkInfo(); }

  // One publisher iteration: read every fitted sensor and push the values.
  bool publishOnce();
  // One sampler iteration: read the PPG FIFO, feed the detector, clear it.
  bool sampleHeartRateOnce();

  const HeartRateDetector& heartRate() const { return _heart_rate; }

 private:
  void _publisherLoop();
  void _heartRateLoop();
  // Sleeps up to ms; returns false if the board is stopping.
  bool _sleep(unsigned long ms);

  HexiLink& _link;
  const BoardSensors _sensors;
  const BoardConfig _config;
  HeartRateDetector _heart_rate;

  // One lock per sensor, so a slow bus transaction only blocks its own device.
  std::mutex _battery_mutex;
  std::mutex _temp_humid_mutex;
  std::mutex _gyro_mutex;
  std::mutex _accel_mag_mutex;
  std::mutex _ambient_light_mutex;
  std::mutex _pressure_mutex;
  std::mutex _ppg_mutex;

  std::mutex _task_mutex;
  std::condition_variable _task_cv;
  bool _stopping;
  std::atomic<bool> _publishing;
  std::atomic<bool> _running;

  std::thread _publisher_thread;
  std::thread _heart_rate_thread;
};

}  // namespace board
}  // namespace hexilink

#endif  // HEXIWEAR_BOARD_H
