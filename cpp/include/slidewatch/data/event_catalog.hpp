#pragma once

#include "slidewatch/core/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace slidewatch {

/**
 * @brief Known-event catalog loader
 *
 * CSV with a header row. Required columns: timestamp, name, location.
 * Optional columns: fatalities (integer), power_outage (true/false/yes/no/1/0)
 * and urls (';'-separated). Empty optional fields stay unset. Timestamps
 * are UTC, "YYYY-MM-DD HH:MM:SS" with an optional "+00:00" suffix.
 *
 * Events come back in chronological order with ids 0..n-1 assigned in
 * that order.
 */
class EventCatalogLoader {
public:
    EventCatalogLoader() = delete;

    /// @throws CatalogFormatError naming the offending line
    static std::vector<KnownEvent> load(const std::string& path);

    /// @throws CatalogFormatError naming the offending line
    static std::vector<KnownEvent> parse(const std::string& text);
};

/// First event (in catalog order) whose time lies within the window
std::optional<KnownEvent> relevant_event(const ReadingWindow& window,
                                         const std::vector<KnownEvent>& events);

} // namespace slidewatch
