#include "slidewatch/processing/threshold_projector.hpp"
#include "slidewatch/core/errors.hpp"
#include <algorithm>
#include <string>

namespace slidewatch {

namespace {

size_t first_at_or_after(const std::vector<Reading>& readings, double t) {
    auto it = std::lower_bound(readings.begin(), readings.end(), t,
        [](const Reading& r, double value) {
            return static_cast<double>(r.timestamp) < value;
        });
    return static_cast<size_t>(it - readings.begin());
}

} // namespace

std::optional<double> ThresholdProjector::critical_height_at(
    Timestamp t,
    const std::vector<Reading>& predecessors,
    double rise_critical,
    double rate_critical
) {
    const double lookback_hours = rise_critical / rate_critical;
    const double window_start = static_cast<double>(t) -
        lookback_hours * static_cast<double>(constants::SECONDS_PER_HOUR);

    const size_t begin = first_at_or_after(predecessors, window_start);
    const size_t end = first_at_or_after(predecessors, static_cast<double>(t));
    if (begin >= end) {
        return std::nullopt;
    }

    double min_height = predecessors[begin].height;
    for (size_t i = begin + 1; i < end; ++i) {
        min_height = std::min(min_height, predecessors[i].height);
    }

    // Total-rise floor
    const double first_height = predecessors[begin].height;
    double height = min_height + rise_critical;

    // Sustained-rate floor
    const double average_rate = (height - first_height) / lookback_hours;
    if (average_rate < rate_critical) {
        height = first_height + lookback_hours * rate_critical;
    }

    return height;
}

std::vector<Reading> ThresholdProjector::project(
    const ReadingSeries& series,
    ProjectionDirection direction,
    int step_minutes,
    size_t count,
    double rise_critical,
    double rate_critical
) {
    if (series.empty()) {
        throw InsufficientDataError("Cannot project thresholds from an empty series");
    }
    if (step_minutes <= 0) {
        throw ConfigError("step_minutes must be positive, got " + std::to_string(step_minutes));
    }
    DetectionConfig(rise_critical, rate_critical).validate();

    const int64_t step_seconds = static_cast<int64_t>(step_minutes) * constants::SECONDS_PER_MINUTE;
    const Timestamp last_time = series.last().timestamp;

    std::vector<Reading> projected;
    projected.reserve(count);

    if (direction == ProjectionDirection::FORWARD) {
        // Real readings that can still fall inside a lookback window,
        // followed by each projected point as it is produced
        const double lookback_seconds = rise_critical / rate_critical *
            static_cast<double>(constants::SECONDS_PER_HOUR);
        const auto& readings = series.readings();
        std::vector<Reading> pool(
            readings.begin() + static_cast<std::ptrdiff_t>(
                first_at_or_after(readings, static_cast<double>(last_time) - lookback_seconds)),
            readings.end());

        for (size_t k = 1; k <= count; ++k) {
            const Timestamp t = last_time + static_cast<int64_t>(k) * step_seconds;
            auto height = critical_height_at(t, pool, rise_critical, rate_critical);
            if (!height) {
                continue;
            }
            projected.emplace_back(t, *height);
            pool.emplace_back(t, *height);
        }
    } else {
        for (size_t k = 0; k < count; ++k) {
            const Timestamp t = last_time -
                static_cast<int64_t>(count - 1 - k) * step_seconds;
            auto height = critical_height_at(t, series.readings(), rise_critical, rate_critical);
            if (height) {
                projected.emplace_back(t, *height);
            }
        }
    }

    return projected;
}

std::vector<Reading> ThresholdProjector::project_forward(
    const ReadingSeries& series,
    const DetectionConfig& config
) {
    config.validate();
    return project(series, ProjectionDirection::FORWARD, config.project_step_minutes,
                   steps_in(config.forward_hours, config.project_step_minutes),
                   config.rise_critical, config.rate_critical);
}

std::vector<Reading> ThresholdProjector::project_backward(
    const ReadingSeries& series,
    const DetectionConfig& config
) {
    config.validate();
    return project(series, ProjectionDirection::BACKWARD, config.project_step_minutes,
                   steps_in(config.backward_hours, config.project_step_minutes),
                   config.rise_critical, config.rate_critical);
}

size_t ThresholdProjector::steps_in(int hours, int step_minutes) {
    return static_cast<size_t>(hours) * static_cast<size_t>(constants::MINUTES_PER_HOUR) /
           static_cast<size_t>(step_minutes);
}

} // namespace slidewatch
