#include "slidewatch/processing/analysis_pipeline.hpp"
#include "slidewatch/core/errors.hpp"
#include "slidewatch/core/logging.hpp"
#include "slidewatch/processing/event_classifier.hpp"
#include "slidewatch/processing/event_window.hpp"
#include <algorithm>

namespace slidewatch {

SeriesAnalysis AnalysisPipeline::analyze_series(
    const ReadingSeries& series,
    const DetectionConfig& config,
    ResultsAggregator& aggregator
) {
    config.validate();

    SeriesAnalysis analysis;
    aggregator.record_series(series);

    if (series.size() < 2) {
        log::info("pipeline", "Skipping series of " + std::to_string(series.size()) +
                  " readings");
        return analysis;
    }
    if (series.size() <= CriticalPointsDetector::lookback_samples(series, config)) {
        log::info("pipeline", "Series ending " + format_reading(series.last()) +
                  " is shorter than the lookback; not scanned");
        return analysis;
    }

    analysis.critical_points = CriticalPointsDetector::find_critical_points(series, config);
    analysis.first_critical_points = CriticalPointsDetector::first_critical_points(
        analysis.critical_points, config.debounce_hours);
    analysis.windows = EventWindowExtractor::extract_all(
        analysis.first_critical_points, series, config.window_radius_hours);
    analysis.scanned = true;

    log::info("pipeline", "Series " + format_reading(series.first()) + " .. " +
              format_reading(series.last()) + ": " +
              std::to_string(analysis.first_critical_points.size()) + " notifications");
    return analysis;
}

RunResult AnalysisPipeline::run(
    const std::vector<ReadingSeries>& series_list,
    const std::vector<KnownEvent>& events,
    const DetectionConfig& config
) {
    ResultsAggregator aggregator;
    RunResult result;
    result.analyses.reserve(series_list.size());

    std::vector<ReadingWindow> windows;
    for (const auto& series : series_list) {
        result.analyses.push_back(analyze_series(series, config, aggregator));
        const auto& analyzed = result.analyses.back().windows;
        windows.insert(windows.end(), analyzed.begin(), analyzed.end());
    }

    EventClassifier classifier(config);
    aggregator.accumulate(classifier.classify(windows, events, aggregator.analyzed_range()));
    result.summary = aggregator.summarize();
    return result;
}

std::vector<ReadingWindow> AnalysisPipeline::reading_sets(
    const ReadingSeries& series,
    const std::vector<KnownEvent>& events,
    const DetectionConfig& config
) {
    ResultsAggregator scratch;
    SeriesAnalysis analysis = analyze_series(series, config, scratch);
    std::vector<ReadingWindow> windows = analysis.windows;

    if (series.size() < 2) {
        return windows;
    }

    const AnalyzedRange range(series.first().timestamp, series.last().timestamp);
    for (const auto& event : events) {
        if (!range.contains(event.timestamp)) {
            continue;
        }
        const bool covered = std::any_of(analysis.windows.begin(), analysis.windows.end(),
            [&event](const ReadingWindow& w) { return w.contains(event.timestamp); });
        if (covered) {
            continue;
        }

        // Anchor on the closest reading so missed events can be plotted
        auto nearest = series.nearest_index(event.timestamp);
        if (nearest) {
            windows.push_back(EventWindowExtractor::extract_at(
                *nearest, series, config.window_radius_hours));
        }
    }

    return windows;
}

} // namespace slidewatch
