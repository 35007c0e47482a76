#include "slidewatch/processing/event_classifier.hpp"
#include <algorithm>
#include <stdexcept>
#include <unordered_map>

namespace slidewatch {

ClassificationOutcome ClassificationOutcome::true_positive(
    const Reading& point, const KnownEvent& event, int64_t lead_minutes)
{
    ClassificationOutcome outcome;
    outcome.kind = Kind::TRUE_POSITIVE;
    outcome.critical_point = point;
    outcome.event = event;
    outcome.lead_time_minutes = lead_minutes;
    return outcome;
}

ClassificationOutcome ClassificationOutcome::false_positive(const Reading& point) {
    ClassificationOutcome outcome;
    outcome.kind = Kind::FALSE_POSITIVE;
    outcome.critical_point = point;
    return outcome;
}

ClassificationOutcome ClassificationOutcome::false_negative(const KnownEvent& event) {
    ClassificationOutcome outcome;
    outcome.kind = Kind::FALSE_NEGATIVE;
    outcome.event = event;
    return outcome;
}

const char* to_string(ClassificationOutcome::Kind kind) {
    switch (kind) {
        case ClassificationOutcome::Kind::TRUE_POSITIVE:  return "true_positive";
        case ClassificationOutcome::Kind::FALSE_POSITIVE: return "false_positive";
        case ClassificationOutcome::Kind::FALSE_NEGATIVE: return "false_negative";
    }
    return "unknown";
}

size_t ClassificationResult::count(ClassificationOutcome::Kind kind) const {
    return static_cast<size_t>(std::count_if(outcomes.begin(), outcomes.end(),
        [kind](const ClassificationOutcome& o) { return o.kind == kind; }));
}

EventClassifier::EventClassifier(const DetectionConfig& config)
    : count_negative_lead_(config.count_negative_lead_as_true_positive)
{}

int64_t EventClassifier::lead_time_minutes(const KnownEvent& event,
                                           const Reading& critical_point) {
    return (event.timestamp - critical_point.timestamp) / constants::SECONDS_PER_MINUTE;
}

ClassificationResult EventClassifier::classify(
    const std::vector<ReadingWindow>& windows,
    const std::vector<KnownEvent>& events,
    const AnalyzedRange& range
) const {
    ClassificationResult result;

    // Chronological view of the catalog
    std::vector<const KnownEvent*> ordered;
    ordered.reserve(events.size());
    for (const auto& event : events) {
        ordered.push_back(&event);
    }
    std::stable_sort(ordered.begin(), ordered.end(),
        [](const KnownEvent* a, const KnownEvent* b) {
            return a->timestamp < b->timestamp;
        });

    std::unordered_map<size_t, bool> claimed;
    for (const auto* event : ordered) {
        if (!claimed.emplace(event->id, false).second) {
            throw std::invalid_argument(
                "Duplicate known event id " + std::to_string(event->id) +
                " (" + event->name + ")");
        }
    }

    std::vector<const ReadingWindow*> associated_windows;

    for (const auto& window : windows) {
        const KnownEvent* match = nullptr;

        for (const auto* event : ordered) {
            if (claimed[event->id] || !window.contains(event->timestamp)) {
                continue;
            }
            if (!count_negative_lead_ && event->timestamp < window.anchor.timestamp) {
                continue;
            }
            match = event;
            break;
        }

        if (match) {
            claimed[match->id] = true;
            associated_windows.push_back(&window);
            result.outcomes.push_back(ClassificationOutcome::true_positive(
                window.anchor, *match, lead_time_minutes(*match, window.anchor)));
        } else {
            result.outcomes.push_back(ClassificationOutcome::false_positive(window.anchor));
        }
    }

    for (const auto* event : ordered) {
        if (claimed[event->id]) {
            continue;
        }

        const bool in_associated_window = std::any_of(
            associated_windows.begin(), associated_windows.end(),
            [event](const ReadingWindow* w) { return w->contains(event->timestamp); });
        if (in_associated_window) {
            result.unclaimed_in_window_events.push_back(*event);
        }

        if (range.contains(event->timestamp)) {
            result.outcomes.push_back(ClassificationOutcome::false_negative(*event));
        } else {
            result.out_of_range_events.push_back(*event);
        }
    }

    return result;
}

} // namespace slidewatch
