/**
 * @file results_aggregator.hpp
 * @brief Run-level accumulation of classification outcomes
 *
 * The aggregator is the only mutable state of an analysis run. It is
 * written by one owner (accumulate / record_series / merge) and read once
 * through summarize(), which freezes it.
 */

#pragma once

#include "slidewatch/core/reading_series.hpp"
#include "slidewatch/processing/event_classifier.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace slidewatch {

/// Lead time of one associated notification
struct NotificationTime {
    KnownEvent event;
    int64_t lead_time_minutes;

    NotificationTime() : lead_time_minutes(0) {}
    NotificationTime(const KnownEvent& e, int64_t minutes)
        : event(e), lead_time_minutes(minutes) {}
};

/// Final report of an analysis run
struct RunSummary {
    uint64_t notifications_issued;      ///< First critical points classified
    uint64_t true_positives;            ///< Notifications associated with an event
    uint64_t false_positives;           ///< Notifications with no event
    uint64_t false_negatives;           ///< In-range events with no notification

    std::vector<Reading> unassociated_notification_points;  ///< False positive points
    std::vector<KnownEvent> unassociated_events;            ///< False negative events
    std::vector<KnownEvent> out_of_range_events;            ///< Not scored
    std::vector<NotificationTime> notification_times;       ///< By event time

    /// Unclaimed events that fell inside a window associated with another event
    std::vector<KnownEvent> unclaimed_events_in_windows;

    std::optional<Timestamp> earliest_reading;
    std::optional<Timestamp> latest_reading;

    RunSummary()
        : notifications_issued(0), true_positives(0)
        , false_positives(0), false_negatives(0) {}

    /// Lead times in ascending order
    std::vector<int64_t> sorted_lead_times() const;
};

class ResultsAggregator {
public:
    ResultsAggregator() = default;

    /// Widen the analyzed range to cover the series
    void record_series(const ReadingSeries& series);

    /// Widen the analyzed range to [first, last]
    void record_bounds(Timestamp first, Timestamp last);

    /// Append one classifier pass
    void accumulate(const ClassificationResult& result);

    /// Fold in another worker's aggregator
    void merge(const ResultsAggregator& other);

    /// Range of reading timestamps recorded so far
    AnalyzedRange analyzed_range() const;

    /// Finalize and report. Later writes throw std::logic_error.
    RunSummary summarize();

    bool finalized() const { return finalized_; }

private:
    void ensure_writable() const;

    std::vector<ClassificationOutcome> outcomes_;
    std::vector<KnownEvent> out_of_range_;
    std::vector<KnownEvent> unclaimed_in_windows_;
    std::optional<Timestamp> earliest_;
    std::optional<Timestamp> latest_;
    bool finalized_ = false;
};

/// Human-readable multi-line report of a run
std::string format_summary(const RunSummary& summary);

} // namespace slidewatch
