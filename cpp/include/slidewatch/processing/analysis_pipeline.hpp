#pragma once

#include "slidewatch/core/config.hpp"
#include "slidewatch/core/reading_series.hpp"
#include "slidewatch/processing/critical_points.hpp"
#include "slidewatch/statistics/results_aggregator.hpp"
#include <vector>

namespace slidewatch {

/// Detection output for one reading series
struct SeriesAnalysis {
    std::vector<CriticalPoint> critical_points;         ///< Before debouncing
    std::vector<CriticalPoint> first_critical_points;   ///< Notifications
    std::vector<ReadingWindow> windows;                 ///< One per notification
    bool scanned = false;                               ///< False if too short to scan
};

/// Summary plus per-series detail of a batch run
struct RunResult {
    RunSummary summary;
    std::vector<SeriesAnalysis> analyses;               ///< Same order as the input
};

/**
 * @brief Batch driver: detect, window, classify, aggregate
 *
 * Windows of every series are classified in one pass against the full
 * event catalog, using the range spanned by all series.
 */
class AnalysisPipeline {
public:
    AnalysisPipeline() = delete;

    /// Detect and window one series, recording its bounds in aggregator.
    /// A series too short to fill the lookback contributes its bounds only.
    /// @throws NonUniformSamplingError, UnsupportedSamplingError, ConfigError
    static SeriesAnalysis analyze_series(
        const ReadingSeries& series,
        const DetectionConfig& config,
        ResultsAggregator& aggregator
    );

    /// Analyze every series, classify all windows and summarize
    static RunResult run(
        const std::vector<ReadingSeries>& series_list,
        const std::vector<KnownEvent>& events,
        const DetectionConfig& config = DetectionConfig()
    );

    /// Windows worth plotting for one series: one per first critical point,
    /// plus one around each known event inside the series range that no
    /// critical window already covers
    static std::vector<ReadingWindow> reading_sets(
        const ReadingSeries& series,
        const std::vector<KnownEvent>& events,
        const DetectionConfig& config = DetectionConfig()
    );
};

} // namespace slidewatch
