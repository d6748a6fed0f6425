#include "HeartRateDetector.h"

#include <etl/algorithm.h>

#include "util/log.h"

namespace hexilink {

namespace {
constexpr const char* TAG = "hr";
}

HeartRateDetector::HeartRateDetector(unsigned long sample_interval_ms, unsigned long reset_window_ms)
    : _interval_ms(sample_interval_ms > 0 ? sample_interval_ms : 1),
      _reset_samples(static_cast<uint32_t>(reset_window_ms / (sample_interval_ms > 0 ? sample_interval_ms : 1))),
      _average_bpm(0.0f) {
  reset();
}

void HeartRateDetector::reset() {
  _deltas.fill(0);
  _delta_index = 0;
  _previous = 0;
  _threshold = kInitialThreshold;
  _samples_since_beat = 0;
  _bpm_slots.fill(0.0f);
  _bpm_index = 0;
  _average_bpm.store(0.0f, std::memory_order_relaxed);
}

bool HeartRateDetector::_checkForBeat(int32_t sample) {
  _deltas[_delta_index] = sample - _previous;
  _previous = sample;
  _delta_index = (_delta_index + 1) % kDeltaSlots;

  const int32_t minimum = *etl::min_element(_deltas.begin(), _deltas.end());
  const int32_t candidate = _deltas[(_delta_index - 4) & (kDeltaSlots - 1)];
  const int32_t before = _deltas[(_delta_index - 5) & (kDeltaSlots - 1)];

  if (candidate != minimum || before == 0 || static_cast<float>(minimum) > _threshold) {
    return false;
  }

  if (minimum >= kPlausibleDipMin && minimum <= kPlausibleDipMax) {
    _threshold = (_threshold + static_cast<float>(minimum) * 0.6f) / 2.0f;
  }
  _deltas.fill(0);
  return true;
}

void HeartRateDetector::_acceptBpm(float bpm) {
  _bpm_slots[_bpm_index] = bpm;
  _bpm_index = (_bpm_index + 1) % kAverageSlots;

  float sum = 0.0f;
  for (size_t i = 0; i < kAverageSlots; ++i) {
    sum += _bpm_slots[i];
  }
  _average_bpm.store(sum / static_cast<float>(kAverageSlots), std::memory_order_relaxed);
}

void HeartRateDetector::_restartEstimate() {
  _samples_since_beat = 0;
  _threshold = kInitialThreshold;
  _deltas.fill(0);
  _bpm_slots.fill(0.0f);
  _average_bpm.store(0.0f, std::memory_order_relaxed);
  HEXILINK_LOGD(TAG, "no beat for %lu ms, estimate restarted",
                static_cast<unsigned long>(_reset_samples) * _interval_ms);
}

bool HeartRateDetector::processSample(int32_t sample) {
  ++_samples_since_beat;
  const bool beat = _checkForBeat(sample);

  if (beat) {
    const unsigned long dt_ms = _samples_since_beat * _interval_ms;
    _samples_since_beat = 0;
    const float bpm = 60000.0f / static_cast<float>(dt_ms);
    if (bpm > kMinBpm && bpm < kMaxBpm) {
      _acceptBpm(bpm);
    } else {
      HEXILINK_LOGD(TAG, "implausible rate %.1f bpm dropped", static_cast<double>(bpm));
    }
  }

  if (_samples_since_beat >= _reset_samples) {
    _restartEstimate();
  }
  return beat;
}

}  // namespace hexilink
