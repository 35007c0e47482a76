#pragma once

#include "slidewatch/core/config.hpp"
#include "slidewatch/core/types.hpp"
#include <optional>
#include <vector>

namespace slidewatch {

/// Outcome of correlating notifications with known events
struct ClassificationOutcome {
    enum class Kind {
        TRUE_POSITIVE,      ///< Window associated with a known event
        FALSE_POSITIVE,     ///< Window with no known event
        FALSE_NEGATIVE      ///< In-range event no window claimed
    };

    Kind kind;
    std::optional<Reading> critical_point;      ///< First critical point (TP, FP)
    std::optional<KnownEvent> event;            ///< Associated or missed event (TP, FN)
    std::optional<int64_t> lead_time_minutes;   ///< event - critical point (TP)

    ClassificationOutcome() : kind(Kind::FALSE_POSITIVE) {}

    static ClassificationOutcome true_positive(const Reading& point,
                                               const KnownEvent& event,
                                               int64_t lead_minutes);
    static ClassificationOutcome false_positive(const Reading& point);
    static ClassificationOutcome false_negative(const KnownEvent& event);

    /// True positive whose event preceded the critical point
    bool detected_after_event() const {
        return lead_time_minutes && *lead_time_minutes < 0;
    }
};

const char* to_string(ClassificationOutcome::Kind kind);

/// Span of reading timestamps covered by an analysis run
struct AnalyzedRange {
    std::optional<Timestamp> earliest;
    std::optional<Timestamp> latest;

    AnalyzedRange() = default;

    AnalyzedRange(Timestamp start, Timestamp stop) : earliest(start), latest(stop) {}

    bool valid() const { return earliest && latest; }

    bool contains(Timestamp t) const {
        return valid() && *earliest <= t && t <= *latest;
    }
};

/// Result of one classifier pass
struct ClassificationResult {
    std::vector<ClassificationOutcome> outcomes;    ///< Window order, then false negatives
    std::vector<KnownEvent> out_of_range_events;    ///< Unclaimed and outside the range

    /// Unclaimed events lying inside a window that associated another event
    std::vector<KnownEvent> unclaimed_in_window_events;

    size_t count(ClassificationOutcome::Kind kind) const;
};

/**
 * @brief Correlates critical-point windows with known events
 *
 * Each window claims at most one event: the first unclaimed event, in
 * chronological order, whose timestamp lies in [start, end] of the
 * window. Claimed events are tracked by KnownEvent::id. Unclaimed events
 * inside the analyzed range become false negatives; unclaimed events
 * outside it are reported separately and never scored.
 */
class EventClassifier {
public:
    explicit EventClassifier(const DetectionConfig& config = DetectionConfig());

    /// @throws std::invalid_argument if two events share an id
    ClassificationResult classify(
        const std::vector<ReadingWindow>& windows,
        const std::vector<KnownEvent>& events,
        const AnalyzedRange& range
    ) const;

    /// Whole minutes from the critical point to the event, truncated
    /// toward zero; negative when the event came first
    static int64_t lead_time_minutes(const KnownEvent& event, const Reading& critical_point);

private:
    bool count_negative_lead_;
};

} // namespace slidewatch
