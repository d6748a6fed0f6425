#ifndef HEART_RATE_DETECTOR_H
#define HEART_RATE_DETECTOR_H

#include <stdint.h>

#include <atomic>

#include <etl/array.h>

#include "config/hexilink_config.h"

namespace hexilink {

// Streaming beat detector for raw PPG samples taken at a fixed interval.
//
// Each sample's difference from the previous one goes into an 8-slot ring.
// A beat is a ring minimum that has aged 4 slots, follows a non-zero delta
// and lies at or below the adaptive threshold. Inter-beat intervals give an
// instantaneous BPM, averaged over the last 10 accepted beats.
//
// processSample() is meant for a single sampling thread; averageBpm() may be
// called from anywhere.
class HeartRateDetector {
 public:
  static constexpr size_t kDeltaSlots = 8;
  static constexpr size_t kAverageSlots = 10;
  static constexpr float kInitialThreshold = -20.0f;
  static constexpr int32_t kPlausibleDipMin = -2000;
  static constexpr int32_t kPlausibleDipMax = -20;
  static constexpr float kMinBpm = 20.0f;
  static constexpr float kMaxBpm = 255.0f;

  explicit HeartRateDetector(unsigned long sample_interval_ms = HEXILINK_HR_SAMPLE_INTERVAL_MS,
                             unsigned long reset_window_ms = HEXILINK_HR_RESET_WINDOW_MS);

  // Feeds one sample. Returns true when it completed a beat.
  bool processSample(int32_t sample);

  // Mean of all 10 BPM slots, empty slots counting as zero.
  float averageBpm() const { return _average_bpm.load(std::memory_order_relaxed); }

  float threshold() const { return _threshold; }
  uint32_t samplesSinceBeat() const { return _samples_since_beat; }
  unsigned long sampleIntervalMs() const { return _interval_ms; }

  // Back to the power-on state, previous sample included.
  void reset();

 private:
  bool _checkForBeat(int32_t sample);
  void _acceptBpm(float bpm);
  void _restartEstimate();

  const unsigned long _interval_ms;
  const uint32_t _reset_samples;

  etl::array<int32_t, kDeltaSlots> _deltas;
  size_t _delta_index;
  int32_t _previous;
  float _threshold;
  uint32_t _samples_since_beat;

  etl::array<float, kAverageSlots> _bpm_slots;
  size_t _bpm_index;
  std::atomic<float> _average_bpm;
};

}  // namespace hexilink

#endif  // HEART_RATE_DETECTOR_H
