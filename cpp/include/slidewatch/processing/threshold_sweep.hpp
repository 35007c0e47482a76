#pragma once

#include "slidewatch/core/config.hpp"
#include "slidewatch/core/reading_series.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace slidewatch {

/// Outcome of one (rise, rate) pair
struct SweepTrial {
    std::string name;                       ///< Alphabetic label: a..z, aa, ab, ...
    double rise_critical;
    double rate_critical;
    uint64_t true_positives;
    uint64_t false_positives;
    uint64_t false_negatives;
    std::vector<int64_t> notification_times;   ///< Lead minutes, by event time

    SweepTrial()
        : rise_critical(0.0), rate_critical(0.0)
        , true_positives(0), false_positives(0), false_negatives(0) {}
};

/**
 * @brief Grid search over critical thresholds
 *
 * Every (rise, rate) pair runs the full analysis with its own aggregator.
 * Trials run in parallel; results come back in grid order, rises outer.
 */
class ThresholdSweep {
public:
    ThresholdSweep() = delete;

    /// @throws ConfigError if either grid is empty or holds a bad value
    static std::vector<SweepTrial> run(
        const std::vector<ReadingSeries>& series_list,
        const std::vector<KnownEvent>& events,
        const DetectionConfig& base_config,
        const std::vector<double>& rises,
        const std::vector<double>& rates
    );

    /// Tab-separated table, one header line then one line per trial
    static std::string format_table(const std::vector<SweepTrial>& trials);

    /// 0 -> "a", 25 -> "z", 26 -> "aa", 27 -> "ab"
    static std::string trial_name(size_t index);
};

} // namespace slidewatch
