#include "slidewatch/processing/event_window.hpp"
#include "slidewatch/core/errors.hpp"
#include <algorithm>

namespace slidewatch {

ReadingWindow EventWindowExtractor::extract(
    const Reading& anchor,
    const ReadingSeries& series,
    int radius_hours
) {
    auto index = series.index_of(anchor);
    if (!index) {
        throw AnchorNotFoundError(
            "Anchor reading " + format_reading(anchor) +
            " is not a member of the series");
    }
    return extract_at(*index, series, radius_hours);
}

ReadingWindow EventWindowExtractor::extract_at(
    size_t anchor_index,
    const ReadingSeries& series,
    int radius_hours
) {
    if (anchor_index >= series.size()) {
        throw AnchorNotFoundError(
            "Anchor index " + std::to_string(anchor_index) +
            " is outside a series of " + std::to_string(series.size()) + " readings");
    }
    if (radius_hours <= 0) {
        throw ConfigError("radius_hours must be positive");
    }

    const size_t offset = static_cast<size_t>(radius_hours) *
                          static_cast<size_t>(series.readings_per_hour());

    // Clamp at both ends, never wrap
    const size_t begin = anchor_index >= offset ? anchor_index - offset : 0;
    const size_t end = std::min(series.size(), anchor_index + offset);

    ReadingWindow window;
    window.anchor = series[anchor_index];
    window.anchor_index = anchor_index;
    window.series_begin = begin;
    window.series_end = end;
    window.readings.assign(series.begin() + static_cast<std::ptrdiff_t>(begin),
                           series.begin() + static_cast<std::ptrdiff_t>(end));
    return window;
}

std::vector<ReadingWindow> EventWindowExtractor::extract_all(
    const std::vector<CriticalPoint>& anchors,
    const ReadingSeries& series,
    int radius_hours
) {
    std::vector<ReadingWindow> windows;
    windows.reserve(anchors.size());

    for (const auto& point : anchors) {
        windows.push_back(extract(point.reading, series, radius_hours));
    }

    return windows;
}

} // namespace slidewatch
