/*
 * This file is part of HexiLink.
 * (C) 2025 HexiLink contributors
 */
#include "HexiwearBoard.h"

#include <chrono>

#include "util/log.h"

namespace hexilink {
namespace board {

namespace {

constexpr const char* TAG = "board";

template <typename T>
bool start_sensor(T* sensor, std::mutex& mutex, const char* name) {
  if (sensor == nullptr) {
    return true;
  }
  std::lock_guard<std::mutex> lock(mutex);
  if (!sensor->start()) {
    HEXILINK_LOGE(TAG, "%s failed to start", name);
    return false;
  }
  HEXILINK_LOGD(TAG, "%s started", name);
  return true;
}

template <typename T, typename Sensor, typename Read>
etl::optional<T> read_sensor(Sensor* sensor, std::mutex& mutex, const char* what, Read read) {
  if (sensor == nullptr) {
    return etl::nullopt;
  }
  T value{};
  std::lock_guard<std::mutex> lock(mutex);
  if (!read(*sensor, value)) {
    HEXILINK_LOGW(TAG, "%s read failed", what);
    return etl::nullopt;
  }
  return value;
}

}  // namespace

int battery_level_from_raw(uint16_t raw) {
  const float mv = static_cast<float>(raw) * (3.3f / 65535.0f) * 1000.0f;
  float level = 0.0f;
  if (mv > 2670.0f) {
    level = 100.0f;
  } else if (mv > 2500.0f) {
    level = 50.0f + 50.0f * (mv - 2500.0f) / 170.0f;
  } else if (mv > 2430.0f) {
    level = 30.0f + 20.0f * (mv - 2430.0f) / 70.0f;
  } else if (mv > 2370.0f) {
    level = 10.0f + 20.0f * (mv - 2370.0f) / 60.0f;
  }
  return static_cast<int>(level);
}

HexiwearBoard::HexiwearBoard(HexiLink& link, const BoardSensors& sensors, const BoardConfig& config)
    : _link(link),
      _sensors(sensors),
      _config(config),
      _heart_rate(config.hr_sample_interval_ms, config.hr_reset_window_ms),
      _stopping(false),
      _publishing(false),
      _running(false) {}

HexiwearBoard::~HexiwearBoard() {
  end();
}

bool HexiwearBoard::begin() {
  if (_running) {
    return true;
  }
  if (!start_sensor(_sensors.battery, _battery_mutex, "battery sense") ||
      !start_sensor(_sensors.temp_humid, _temp_humid_mutex, "temperature/humidity sensor") ||
      !start_sensor(_sensors.gyro, _gyro_mutex, "gyroscope") ||
      !start_sensor(_sensors.accel_mag, _accel_mag_mutex, "accelerometer/magnetometer") ||
      !start_sensor(_sensors.ambient_light, _ambient_light_mutex, "ambient light sensor") ||
      !start_sensor(_sensors.pressure, _pressure_mutex, "pressure sensor") ||
      !start_sensor(_sensors.ppg, _ppg_mutex, "heart rate sensor")) {
    return false;
  }

  {
    std::lock_guard<std::mutex> lock(_task_mutex);
    _stopping = false;
  }
  _heart_rate.reset();
  _running = true;
  if (_sensors.ppg != nullptr) {
    _heart_rate_thread = std::thread(&HexiwearBoard::_heartRateLoop, this);
  }
  _publisher_thread = std::thread(&HexiwearBoard::_publisherLoop, this);
  HEXILINK_LOGI(TAG, "board started");
  return true;
}

void HexiwearBoard::end() {
  if (!_running.exchange(false)) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(_task_mutex);
    _stopping = true;
  }
  _task_cv.notify_all();
  if (_publisher_thread.joinable()) {
    _publisher_thread.join();
  }
  if (_heart_rate_thread.joinable()) {
    _heart_rate_thread.join();
  }
  HEXILINK_LOGI(TAG, "board stopped");
}

void HexiwearBoard::enableSensorPublishing() {
  {
    std::lock_guard<std::mutex> lock(_task_mutex);
    _publishing = true;
  }
  _task_cv.notify_all();
}

void HexiwearBoard::disableSensorPublishing() {
  std::lock_guard<std::mutex> lock(_task_mutex);
  _publishing = false;
}

bool HexiwearBoard::_sleep(unsigned long ms) {
  std::unique_lock<std::mutex> lock(_task_mutex);
  return !_task_cv.wait_for(lock, std::chrono::milliseconds(ms), [this] { return _stopping; });
}

etl::optional<int> HexiwearBoard::getBatteryLevel() {
  if (_sensors.battery == nullptr) {
    return etl::nullopt;
  }
  uint16_t raw = 0;
  {
    std::lock_guard<std::mutex> lock(_battery_mutex);
    if (!_sensors.battery->readRaw(raw)) {
      HEXILINK_LOGW(TAG, "battery read failed");
      return etl::nullopt;
    }
  }
  return battery_level_from_raw(raw);
}

etl::optional<int> HexiwearBoard::getAverageHeartRate() const {
  if (_sensors.ppg == nullptr) {
    return etl::nullopt;
  }
  return static_cast<int>(_heart_rate.averageBpm());
}

etl::optional<float> HexiwearBoard::getTemperature() {
  return read_sensor<float>(_sensors.temp_humid, _temp_humid_mutex, "temperature",
                            [](TempHumidSensor& s, float& v) { return s.readTemperature(v); });
}

etl::optional<float> HexiwearBoard::getHumidity() {
  return read_sensor<float>(_sensors.temp_humid, _temp_humid_mutex, "humidity",
                            [](TempHumidSensor& s, float& v) { return s.readHumidity(v); });
}

etl::optional<float> HexiwearBoard::getPressure() {
  return read_sensor<float>(_sensors.pressure, _pressure_mutex, "pressure",
                            [](PressureSensor& s, float& v) { return s.readPressure(v); });
}

etl::optional<float> HexiwearBoard::getAltitude() {
  return read_sensor<float>(_sensors.pressure, _pressure_mutex, "altitude",
                            [](PressureSensor& s, float& v) { return s.readAltitude(v); });
}

etl::optional<Vector3f> HexiwearBoard::getAccelerometerData() {
  return read_sensor<Vector3f>(_sensors.accel_mag, _accel_mag_mutex, "accelerometer",
                               [](AccelMagSensor& s, Vector3f& v) { return s.readAccel(v); });
}

etl::optional<Vector3f> HexiwearBoard::getMagnetometerData() {
  return read_sensor<Vector3f>(_sensors.accel_mag, _accel_mag_mutex, "magnetometer",
                               [](AccelMagSensor& s, Vector3f& v) { return s.readMagnet(v); });
}

etl::optional<Vector3f> HexiwearBoard::getGyroscopeData() {
  return read_sensor<Vector3f>(_sensors.gyro, _gyro_mutex, "gyroscope",
                               [](GyroSensor& s, Vector3f& v) { return s.read(v); });
}

etl::optional<int32_t> HexiwearBoard::getAmbientLight() {
  return read_sensor<int32_t>(_sensors.ambient_light, _ambient_light_mutex, "ambient light",
                              [](AmbientLightSensor& s, int32_t& v) { return s.readLux(v); });
}

LinkError HexiwearBoard::bluetoothOn() {
  if (_link.queryLinkInfo().advertising_on) {
    return LinkError::NONE;
  }
  return _link.toggleAdvertising();
}

LinkError HexiwearBoard::bluetoothOff() {
  if (!_link.queryLinkInfo().advertising_on) {
    return LinkError::NONE;
  }
  return _link.toggleAdvertising();
}

LinkError HexiwearBoard::rightTouchActive() {
  if (_link.queryLinkInfo().active_touch_group == ghi::TouchGroup::RIGHT) {
    return LinkError::NONE;
  }
  return _link.toggleTouchGroup();
}

LinkError HexiwearBoard::leftTouchActive() {
  if (_link.queryLinkInfo().active_touch_group == ghi::TouchGroup::LEFT) {
    return LinkError::NONE;
  }
  return _link.toggleTouchGroup();
}

bool HexiwearBoard::publishOnce() {
  SensorValues values;

  if (_sensors.battery != nullptr) {
    const etl::optional<int> level = getBatteryLevel();
    if (!level.has_value()) {
      return false;
    }
    values.battery = *level;
  }

  if (_sensors.temp_humid != nullptr) {
    int32_t temperature = 0;
    int32_t humidity = 0;
    std::lock_guard<std::mutex> lock(_temp_humid_mutex);
    if (!_sensors.temp_humid->readRawTemperature(temperature) ||
        !_sensors.temp_humid->readRawHumidity(humidity)) {
      HEXILINK_LOGW(TAG, "temperature/humidity read failed");
      return false;
    }
    values.temperature = temperature;
    values.humidity = humidity;
  }

  if (_sensors.gyro != nullptr) {
    AxisValues gyro;
    std::lock_guard<std::mutex> lock(_gyro_mutex);
    if (!_sensors.gyro->readRaw(gyro)) {
      HEXILINK_LOGW(TAG, "gyroscope read failed");
      return false;
    }
    values.gyro = gyro;
  }

  if (_sensors.accel_mag != nullptr) {
    AxisValues accel;
    AxisValues magnet;
    std::lock_guard<std::mutex> lock(_accel_mag_mutex);
    if (!_sensors.accel_mag->readRawAccel(accel) || !_sensors.accel_mag->readRawMagnet(magnet)) {
      HEXILINK_LOGW(TAG, "accelerometer/magnetometer read failed");
      return false;
    }
    values.accel = accel;
    values.magnet = magnet;
  }

  if (_sensors.ambient_light != nullptr) {
    int32_t lux = 0;
    std::lock_guard<std::mutex> lock(_ambient_light_mutex);
    if (!_sensors.ambient_light->readLux(lux)) {
      HEXILINK_LOGW(TAG, "ambient light read failed");
      return false;
    }
    values.ambient_light = lux & 0xFF;
  }

  if (_sensors.pressure != nullptr) {
    int32_t raw = 0;
    std::lock_guard<std::mutex> lock(_pressure_mutex);
    if (!_sensors.pressure->readRaw(raw)) {
      HEXILINK_LOGW(TAG, "pressure read failed");
      return false;
    }
    values.pressure = raw >> 4;
  }

  const LinkError err = _link.pushSensorValues(values);
  if (err != LinkError::NONE) {
    HEXILINK_LOGW(TAG, "sensor values not published: %s", link_error_name(err));
    return false;
  }
  return true;
}

bool HexiwearBoard::sampleHeartRateOnce() {
  if (_sensors.ppg == nullptr) {
    return false;
  }

  PpgSensor::Sample bytes;
  {
    std::lock_guard<std::mutex> lock(_ppg_mutex);
    if (!_sensors.ppg->readSamples(bytes)) {
      HEXILINK_LOGW(TAG, "heart rate FIFO read failed");
      return false;
    }
  }

  const int32_t sample = (static_cast<int32_t>(bytes[3]) << 16) |
                         (static_cast<int32_t>(bytes[4]) << 8) |
                         static_cast<int32_t>(bytes[5]);
  _heart_rate.processSample(sample);

  std::lock_guard<std::mutex> lock(_ppg_mutex);
  if (!_sensors.ppg->clearFifo()) {
    HEXILINK_LOGW(TAG, "heart rate FIFO clear failed");
    return false;
  }
  return true;
}

void HexiwearBoard::_publisherLoop() {
  for (;;) {
    {
      std::unique_lock<std::mutex> lock(_task_mutex);
      _task_cv.wait(lock, [this] { return _stopping || _publishing.load(); });
      if (_stopping) {
        return;
      }
    }

    const bool ok = publishOnce();
    if (!ok) {
      HEXILINK_LOGW(TAG, "publish failed, retrying in %lu ms", _config.publish_backoff_ms);
    }
    if (!_sleep(ok ? _config.publish_interval_ms : _config.publish_backoff_ms)) {
      return;
    }
  }
}

void HexiwearBoard::_heartRateLoop() {
  for (;;) {
    const bool ok = sampleHeartRateOnce();
    if (!_sleep(ok ? _config.hr_sample_interval_ms : _config.hr_backoff_ms)) {
      return;
    }
  }
}

}  // namespace board
}  // namespace hexilink
