#pragma once

#include "slidewatch/core/config.hpp"
#include "slidewatch/core/reading_series.hpp"
#include <optional>
#include <vector>

namespace slidewatch {

enum class ProjectionDirection {
    FORWARD,    ///< Timestamps after the last reading; projections feed later ones
    BACKWARD    ///< Trailing timestamps of the series; real readings only
};

/**
 * @brief Minimal heights that would make a timestamp newly critical
 *
 * For a timestamp t and lookback L = rise_critical / rate_critical hours,
 * let w be the readings in [t - L, t). The critical height is
 *
 *   h = min(w) + rise_critical
 *
 * raised to w.first + L * rate_critical when the average rate from the
 * first reading of w would fall below rate_critical.
 */
class ThresholdProjector {
public:
    ThresholdProjector() = delete;

    /// Project `count` timestamps spaced step_minutes apart.
    /// FORWARD starts one step after the last reading; BACKWARD ends at the
    /// last reading. Timestamps with an empty lookback window are skipped.
    /// @throws InsufficientDataError for an empty series
    /// @throws ConfigError for non-positive step or thresholds
    static std::vector<Reading> project(
        const ReadingSeries& series,
        ProjectionDirection direction,
        int step_minutes,
        size_t count,
        double rise_critical,
        double rate_critical
    );

    /// Forward curve spanning config.forward_hours
    static std::vector<Reading> project_forward(
        const ReadingSeries& series,
        const DetectionConfig& config = DetectionConfig()
    );

    /// Backward curve spanning config.backward_hours
    static std::vector<Reading> project_backward(
        const ReadingSeries& series,
        const DetectionConfig& config = DetectionConfig()
    );

    /// Critical height at t given chronological predecessors; nullopt
    /// when none fall inside [t - L, t)
    static std::optional<double> critical_height_at(
        Timestamp t,
        const std::vector<Reading>& predecessors,
        double rise_critical,
        double rate_critical
    );

private:
    static size_t steps_in(int hours, int step_minutes);
};

} // namespace slidewatch
