#pragma once

#include <cmath>
#include <limits>

namespace slidewatch {

/// Threshold configuration threaded through detection, windowing,
/// classification and projection
struct DetectionConfig {
    // Critical point thresholds
    double rise_critical = 2.5;         ///< Minimum total rise (ft)
    double rate_critical = 0.5;         ///< Rate that must be exceeded (ft/hr)
    double debounce_hours = 12.0;       ///< Spacing between first critical points

    /// Readings below floor_height + rise_critical cannot be critical.
    /// Scan shortcut only; NaN disables it.
    double floor_height = std::numeric_limits<double>::quiet_NaN();

    // Event windows
    int window_radius_hours = 24;       ///< Hours kept either side of an anchor

    // Threshold projection
    int project_step_minutes = 15;      ///< Spacing of projected timestamps
    int forward_hours = 6;              ///< Span of the forward curve
    int backward_hours = 12;            ///< Span of the backward curve

    // Classification policy
    bool count_negative_lead_as_true_positive = true;  ///< Keep events that precede detection

    DetectionConfig() = default;

    DetectionConfig(double rise, double rate)
        : rise_critical(rise), rate_critical(rate) {}

    /// Hours a rise of rise_critical takes at exactly rate_critical
    double lookback_hours() const { return rise_critical / rate_critical; }

    bool has_floor() const { return !std::isnan(floor_height); }

    /// Throws ConfigError for out-of-range values
    void validate() const;
};

} // namespace slidewatch
