#pragma once

#include "slidewatch/core/config.hpp"
#include "slidewatch/core/reading_series.hpp"
#include <cstddef>
#include <vector>

namespace slidewatch {

/// A reading flagged as critical, with its position in the scanned series
struct CriticalPoint {
    size_t index;           ///< Index in the scanned series
    Reading reading;        ///< The flagged reading

    CriticalPoint() : index(0) {}

    CriticalPoint(size_t idx, const Reading& r) : index(idx), reading(r) {}

    Timestamp timestamp() const { return reading.timestamp; }
    double height() const { return reading.height; }
};

/// Rise/rate critical point detector
class CriticalPointsDetector {
public:
    CriticalPointsDetector() = default;

    /// Detect first critical points (one per debounced cluster)
    /// @param series Uniformly sampled readings
    /// @param config Thresholds; rise_critical, rate_critical,
    ///               debounce_hours and floor_height are used
    /// @return First critical points, chronological
    /// @throws InsufficientDataError if series.size() <= lookback
    /// @throws NonUniformSamplingError if the sampling interval varies
    /// @throws UnsupportedSamplingError if the interval does not divide an hour
    static std::vector<CriticalPoint> detect(
        const ReadingSeries& series,
        const DetectionConfig& config = DetectionConfig()
    );

    /// Same as detect() with the thresholds given directly
    static std::vector<CriticalPoint> detect(
        const ReadingSeries& series,
        double rise_critical,
        double rate_critical,
        double debounce_hours = 12.0
    );

    /// Every critical point, before debouncing
    static std::vector<CriticalPoint> find_critical_points(
        const ReadingSeries& series,
        const DetectionConfig& config = DetectionConfig()
    );

    /// Keep a point only if it is more than debounce_hours after the
    /// previously kept point
    static std::vector<CriticalPoint> first_critical_points(
        const std::vector<CriticalPoint>& points,
        double debounce_hours
    );

    /// Number of prior samples that could hold a qualifying interval:
    /// ceil(rise_critical / rate_critical) * readings_per_hour
    static size_t lookback_samples(
        const ReadingSeries& series,
        const DetectionConfig& config
    );

private:
    /// Whether series[index] is critical against its `lookback`
    /// immediately preceding readings
    static bool is_critical(
        const ReadingSeries& series,
        size_t index,
        size_t lookback,
        const DetectionConfig& config
    );
};

} // namespace slidewatch
