#include "slidewatch/processing/critical_points.hpp"
#include "slidewatch/core/errors.hpp"
#include "slidewatch/core/logging.hpp"
#include <cmath>

namespace slidewatch {

std::vector<CriticalPoint> CriticalPointsDetector::detect(
    const ReadingSeries& series,
    const DetectionConfig& config
) {
    auto points = find_critical_points(series, config);
    auto first_points = first_critical_points(points, config.debounce_hours);

    log::info("detect", "Found " + std::to_string(points.size()) +
              " critical points, " + std::to_string(first_points.size()) +
              " first critical points.");
    return first_points;
}

std::vector<CriticalPoint> CriticalPointsDetector::detect(
    const ReadingSeries& series,
    double rise_critical,
    double rate_critical,
    double debounce_hours
) {
    DetectionConfig config(rise_critical, rate_critical);
    config.debounce_hours = debounce_hours;
    return detect(series, config);
}

std::vector<CriticalPoint> CriticalPointsDetector::find_critical_points(
    const ReadingSeries& series,
    const DetectionConfig& config
) {
    config.validate();

    const size_t lookback = lookback_samples(series, config);
    if (series.size() <= lookback) {
        throw InsufficientDataError(
            "Series of " + std::to_string(series.size()) +
            " readings is too short for a lookback of " +
            std::to_string(lookback) + " readings");
    }
    series.validate_uniform_sampling();

    std::vector<CriticalPoint> points;
    for (size_t i = lookback; i < series.size(); ++i) {
        const Reading& reading = series[i];

        // Cannot have risen far enough above the floor
        if (config.has_floor() &&
            reading.height < config.floor_height + config.rise_critical) {
            continue;
        }

        if (is_critical(series, i, lookback, config)) {
            points.emplace_back(i, reading);
        }
    }

    return points;
}

std::vector<CriticalPoint> CriticalPointsDetector::first_critical_points(
    const std::vector<CriticalPoint>& points,
    double debounce_hours
) {
    std::vector<CriticalPoint> first_points;

    for (const auto& point : points) {
        if (first_points.empty()) {
            first_points.push_back(point);
            continue;
        }

        const double elapsed_hours =
            static_cast<double>(point.timestamp() - first_points.back().timestamp()) /
            static_cast<double>(constants::SECONDS_PER_HOUR);
        if (elapsed_hours > debounce_hours) {
            first_points.push_back(point);
        }
    }

    return first_points;
}

size_t CriticalPointsDetector::lookback_samples(
    const ReadingSeries& series,
    const DetectionConfig& config
) {
    const int readings_per_hour = series.readings_per_hour();
    const double hours = std::ceil(config.rise_critical / config.rate_critical);
    return static_cast<size_t>(hours) * static_cast<size_t>(readings_per_hour);
}

bool CriticalPointsDetector::is_critical(
    const ReadingSeries& series,
    size_t index,
    size_t lookback,
    const DetectionConfig& config
) {
    const Reading& reading = series[index];

    // First sufficient prior reading wins
    for (size_t j = index - lookback; j < index; ++j) {
        const Reading& prior = series[j];
        if (rise(reading, prior) >= config.rise_critical &&
            slope(reading, prior) > config.rate_critical) {
            return true;
        }
    }

    return false;
}

} // namespace slidewatch
