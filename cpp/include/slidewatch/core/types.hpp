#pragma once

/**
 * @file types.hpp
 * @brief Core data types for the slidewatch engine
 *
 * Readings, known events and reading windows are immutable values once
 * built. Timestamps are whole seconds since the Unix epoch, UTC; all
 * timezone handling happens in the loaders.
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace slidewatch {

/// Seconds since 1970-01-01T00:00:00Z
using Timestamp = int64_t;

// ============================================================================
// Data Structures
// ============================================================================

/**
 * @brief One stream gauge reading
 */
struct Reading {
    Timestamp timestamp;    ///< Reading time (UTC seconds)
    double height;          ///< River height (ft)

    Reading() : timestamp(0), height(0.0) {}

    Reading(Timestamp t, double h) : timestamp(t), height(h) {}

    bool operator==(const Reading& other) const {
        return timestamp == other.timestamp && height == other.height;
    }

    bool operator!=(const Reading& other) const { return !(*this == other); }
};

/**
 * @brief A known hazard event (landslide) from the event catalog
 *
 * `id` is the event's identity for claim tracking; the catalog loader
 * assigns ids in chronological order.
 */
struct KnownEvent {
    size_t id;                          ///< Catalog identity
    Timestamp timestamp;                ///< Event time (UTC seconds)
    std::string name;                   ///< Display name
    std::string location;               ///< Location description
    std::optional<int> fatalities;      ///< Reported fatalities, if known
    std::optional<bool> power_outage;   ///< Whether power was lost, if known
    std::vector<std::string> urls;      ///< Reference links

    KnownEvent() : id(0), timestamp(0) {}

    KnownEvent(size_t event_id, Timestamp t, const std::string& event_name,
               const std::string& event_location = "")
        : id(event_id), timestamp(t), name(event_name), location(event_location) {}
};

/**
 * @brief Contiguous copy of part of a ReadingSeries around an anchor
 *
 * The window never owns or mutates the series it came from; it records
 * the half-open index range [series_begin, series_end) it was cut from.
 */
struct ReadingWindow {
    std::vector<Reading> readings;  ///< Copied readings, chronological
    Reading anchor;                 ///< Reading the window is centered on
    size_t anchor_index;            ///< Anchor index in the source series
    size_t series_begin;            ///< First source index (inclusive)
    size_t series_end;              ///< Last source index (exclusive)

    ReadingWindow() : anchor_index(0), series_begin(0), series_end(0) {}

    bool empty() const { return readings.empty(); }

    size_t size() const { return readings.size(); }

    /// Timestamp of the first reading in the window
    Timestamp start_time() const {
        return readings.empty() ? anchor.timestamp : readings.front().timestamp;
    }

    /// Timestamp of the last reading in the window
    Timestamp end_time() const {
        return readings.empty() ? anchor.timestamp : readings.back().timestamp;
    }

    /// Whether t lies in [start_time(), end_time()]
    bool contains(Timestamp t) const {
        return start_time() <= t && t <= end_time();
    }
};

// ============================================================================
// Constants
// ============================================================================

namespace constants {
    constexpr int64_t SECONDS_PER_MINUTE = 60;
    constexpr int64_t SECONDS_PER_HOUR = 3600;
    constexpr int64_t MINUTES_PER_HOUR = 60;
}

} // namespace slidewatch
