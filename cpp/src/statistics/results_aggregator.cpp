#include "slidewatch/statistics/results_aggregator.hpp"
#include "slidewatch/core/logging.hpp"
#include "slidewatch/core/time_utils.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

namespace slidewatch {

namespace {

bool by_event_time(const KnownEvent& a, const KnownEvent& b) {
    if (a.timestamp != b.timestamp) {
        return a.timestamp < b.timestamp;
    }
    return a.id < b.id;
}

// Sort chronologically and drop repeated ids, keeping the first
void sort_unique(std::vector<KnownEvent>& events) {
    std::stable_sort(events.begin(), events.end(), by_event_time);
    std::unordered_set<size_t> seen;
    events.erase(std::remove_if(events.begin(), events.end(),
        [&seen](const KnownEvent& e) { return !seen.insert(e.id).second; }),
        events.end());
}

void remove_ids(std::vector<KnownEvent>& events, const std::unordered_set<size_t>& ids) {
    events.erase(std::remove_if(events.begin(), events.end(),
        [&ids](const KnownEvent& e) { return ids.count(e.id) > 0; }),
        events.end());
}

} // namespace

std::vector<int64_t> RunSummary::sorted_lead_times() const {
    std::vector<int64_t> leads;
    leads.reserve(notification_times.size());
    for (const auto& n : notification_times) {
        leads.push_back(n.lead_time_minutes);
    }
    std::sort(leads.begin(), leads.end());
    return leads;
}

void ResultsAggregator::ensure_writable() const {
    if (finalized_) {
        throw std::logic_error("ResultsAggregator is finalized; no further writes allowed");
    }
}

void ResultsAggregator::record_series(const ReadingSeries& series) {
    if (series.empty()) {
        return;
    }
    record_bounds(series.first().timestamp, series.last().timestamp);
}

void ResultsAggregator::record_bounds(Timestamp first, Timestamp last) {
    ensure_writable();
    if (last < first) {
        std::swap(first, last);
    }
    earliest_ = earliest_ ? std::min(*earliest_, first) : first;
    latest_ = latest_ ? std::max(*latest_, last) : last;
}

void ResultsAggregator::accumulate(const ClassificationResult& result) {
    ensure_writable();
    outcomes_.insert(outcomes_.end(), result.outcomes.begin(), result.outcomes.end());
    out_of_range_.insert(out_of_range_.end(),
                         result.out_of_range_events.begin(), result.out_of_range_events.end());
    unclaimed_in_windows_.insert(unclaimed_in_windows_.end(),
                                 result.unclaimed_in_window_events.begin(),
                                 result.unclaimed_in_window_events.end());
}

void ResultsAggregator::merge(const ResultsAggregator& other) {
    ensure_writable();
    if (&other == this) {
        throw std::invalid_argument("ResultsAggregator cannot merge with itself");
    }
    outcomes_.insert(outcomes_.end(), other.outcomes_.begin(), other.outcomes_.end());
    out_of_range_.insert(out_of_range_.end(),
                         other.out_of_range_.begin(), other.out_of_range_.end());
    unclaimed_in_windows_.insert(unclaimed_in_windows_.end(),
                                 other.unclaimed_in_windows_.begin(),
                                 other.unclaimed_in_windows_.end());
    if (other.earliest_ && other.latest_) {
        record_bounds(*other.earliest_, *other.latest_);
    }
}

AnalyzedRange ResultsAggregator::analyzed_range() const {
    AnalyzedRange range;
    range.earliest = earliest_;
    range.latest = latest_;
    return range;
}

RunSummary ResultsAggregator::summarize() {
    finalized_ = true;

    RunSummary summary;
    summary.earliest_reading = earliest_;
    summary.latest_reading = latest_;

    std::unordered_set<size_t> associated_ids;
    std::vector<KnownEvent> missed;

    for (const auto& outcome : outcomes_) {
        switch (outcome.kind) {
            case ClassificationOutcome::Kind::TRUE_POSITIVE:
                associated_ids.insert(outcome.event->id);
                summary.notification_times.emplace_back(*outcome.event, *outcome.lead_time_minutes);
                break;
            case ClassificationOutcome::Kind::FALSE_POSITIVE:
                summary.unassociated_notification_points.push_back(*outcome.critical_point);
                break;
            case ClassificationOutcome::Kind::FALSE_NEGATIVE:
                missed.push_back(*outcome.event);
                break;
        }
    }

    // A pass that missed an event does not override one that claimed it
    sort_unique(missed);
    remove_ids(missed, associated_ids);

    std::unordered_set<size_t> scored_ids = associated_ids;
    for (const auto& e : missed) {
        scored_ids.insert(e.id);
    }

    summary.out_of_range_events = out_of_range_;
    sort_unique(summary.out_of_range_events);
    remove_ids(summary.out_of_range_events, scored_ids);

    summary.unclaimed_events_in_windows = unclaimed_in_windows_;
    sort_unique(summary.unclaimed_events_in_windows);
    remove_ids(summary.unclaimed_events_in_windows, associated_ids);

    std::stable_sort(summary.notification_times.begin(), summary.notification_times.end(),
        [](const NotificationTime& a, const NotificationTime& b) {
            return by_event_time(a.event, b.event);
        });
    std::stable_sort(summary.unassociated_notification_points.begin(),
                     summary.unassociated_notification_points.end(),
        [](const Reading& a, const Reading& b) { return a.timestamp < b.timestamp; });

    summary.unassociated_events = std::move(missed);
    summary.true_positives = summary.notification_times.size();
    summary.false_positives = summary.unassociated_notification_points.size();
    summary.false_negatives = summary.unassociated_events.size();
    summary.notifications_issued = summary.true_positives + summary.false_positives;

    log::info("summary", "TP=" + std::to_string(summary.true_positives) +
              " FP=" + std::to_string(summary.false_positives) +
              " FN=" + std::to_string(summary.false_negatives));

    return summary;
}

std::string format_summary(const RunSummary& summary) {
    std::ostringstream out;

    out << "Analyzed range: ";
    if (summary.earliest_reading && summary.latest_reading) {
        out << time_utils::format_timestamp(*summary.earliest_reading) << " to "
            << time_utils::format_timestamp(*summary.latest_reading);
    } else {
        out << "(none)";
    }
    out << "\n";

    out << "Notifications issued: " << summary.notifications_issued << "\n"
        << "True positives: " << summary.true_positives << "\n"
        << "False positives: " << summary.false_positives << "\n"
        << "False negatives: " << summary.false_negatives << "\n";

    if (!summary.notification_times.empty()) {
        out << "Notification times:\n";
        for (const auto& n : summary.notification_times) {
            out << "  " << time_utils::format_timestamp(n.event.timestamp) << "  "
                << std::setw(6) << n.lead_time_minutes << " min  " << n.event.name << "\n";
        }
    }

    if (!summary.unassociated_notification_points.empty()) {
        out << "Unassociated notifications:\n";
        for (const auto& r : summary.unassociated_notification_points) {
            out << "  " << format_reading(r) << "\n";
        }
    }

    if (!summary.unassociated_events.empty()) {
        out << "Missed events:\n";
        for (const auto& e : summary.unassociated_events) {
            out << "  " << time_utils::format_timestamp(e.timestamp) << "  " << e.name << "\n";
        }
    }

    if (!summary.unclaimed_events_in_windows.empty()) {
        out << "Events sharing a notification window: "
            << summary.unclaimed_events_in_windows.size() << "\n";
        for (const auto& e : summary.unclaimed_events_in_windows) {
            out << "  " << time_utils::format_timestamp(e.timestamp) << "  " << e.name << "\n";
        }
    }

    if (!summary.out_of_range_events.empty()) {
        out << "Events outside the analyzed range: "
            << summary.out_of_range_events.size() << "\n";
    }

    return out.str();
}

} // namespace slidewatch
