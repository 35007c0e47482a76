#pragma once

#include "slidewatch/core/reading_series.hpp"
#include "slidewatch/core/time_utils.hpp"

#include <vector>

namespace slidewatch {
namespace fixtures {

constexpr int64_t QUARTER_HOUR = 15 * constants::SECONDS_PER_MINUTE;

/// 2019-09-01 00:00:00 UTC
inline Timestamp base_time() {
  return time_utils::make_timestamp(2019, 9, 1);
}

/// Timestamp of sample `index` in a 15-minute series starting at base_time()
inline Timestamp sample_time(size_t index) {
  return base_time() + static_cast<int64_t>(index) * QUARTER_HOUR;
}

/// Uniform series with the given heights, one every `step` seconds
inline ReadingSeries make_series(const std::vector<double>& heights,
                                 int64_t step = QUARTER_HOUR,
                                 Timestamp start = base_time()) {
  std::vector<Reading> readings;
  readings.reserve(heights.size());
  for (size_t i = 0; i < heights.size(); ++i) {
    readings.emplace_back(start + static_cast<int64_t>(i) * step, heights[i]);
  }
  return ReadingSeries(std::move(readings));
}

inline ReadingSeries flat_series(size_t count, double height) {
  return make_series(std::vector<double>(count, height));
}

/// 40 samples at 20.0, then rising 0.13 ft per sample through index 99.
/// With rise 2.5 / rate 0.5 the first critical reading is index 59.
inline ReadingSeries steady_ramp_series() {
  std::vector<double> heights;
  for (size_t i = 0; i < 100; ++i) {
    heights.push_back(i < 40 ? 20.0 : 20.0 + 0.13 * static_cast<double>(i - 39));
  }
  return make_series(heights);
}

/// Append a 3 ft storm pulse starting at `start`: 12 samples up at
/// 0.25 ft each, 24 samples held, 12 samples back down.
inline void add_pulse(std::vector<double>& heights, size_t start, double baseline) {
  for (size_t k = 0; k < 12; ++k) {
    heights[start + k] = baseline + 0.25 * static_cast<double>(k + 1);
  }
  for (size_t k = 12; k < 36; ++k) {
    heights[start + k] = baseline + 3.0;
  }
  for (size_t k = 36; k < 48; ++k) {
    heights[start + k] = baseline + 3.0 - 0.25 * static_cast<double>(k - 35);
  }
}

constexpr size_t STORM_FIRST_PULSE = 200;
constexpr size_t STORM_SECOND_PULSE = 584;
constexpr size_t STORM_FIRST_CRITICAL = 209;
constexpr size_t STORM_SECOND_CRITICAL = 593;

/// Ten days of 15-minute readings at 20.0 ft with two storm pulses four
/// days apart. Default thresholds flag indices 209 and 593.
inline ReadingSeries storm_series() {
  std::vector<double> heights(960, 20.0);
  add_pulse(heights, STORM_FIRST_PULSE, 20.0);
  add_pulse(heights, STORM_SECOND_PULSE, 20.0);
  return make_series(heights);
}

} // namespace fixtures
} // namespace slidewatch
