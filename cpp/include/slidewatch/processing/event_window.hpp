#pragma once

#include "slidewatch/core/reading_series.hpp"
#include "slidewatch/processing/critical_points.hpp"
#include <vector>

namespace slidewatch {

/// Cuts fixed-radius windows out of a series around anchor readings
class EventWindowExtractor {
public:
    EventWindowExtractor() = delete;

    /// Window of radius_hours * readings_per_hour samples either side of
    /// the anchor, clamped to the series bounds (at most 2 * offset readings)
    /// @throws AnchorNotFoundError if anchor is not a member of series
    static ReadingWindow extract(
        const Reading& anchor,
        const ReadingSeries& series,
        int radius_hours = 24
    );

    /// Same as extract() for an anchor given by index
    static ReadingWindow extract_at(
        size_t anchor_index,
        const ReadingSeries& series,
        int radius_hours = 24
    );

    /// One window per critical point, in the order given
    static std::vector<ReadingWindow> extract_all(
        const std::vector<CriticalPoint>& anchors,
        const ReadingSeries& series,
        int radius_hours = 24
    );
};

} // namespace slidewatch
