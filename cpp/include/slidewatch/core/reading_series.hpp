#pragma once

#include "slidewatch/core/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace slidewatch {

/**
 * @brief Ordered, timestamped gauge readings
 *
 * Timestamps are strictly increasing (checked on construction). The
 * sampling interval is inferred from the first two readings; detection
 * additionally requires every gap to match it.
 */
class ReadingSeries {
public:
    using const_iterator = std::vector<Reading>::const_iterator;

    ReadingSeries() = default;

    /// Throws ReadingFormatError if timestamps are not strictly increasing
    explicit ReadingSeries(std::vector<Reading> readings);

    size_t size() const { return readings_.size(); }
    bool empty() const { return readings_.empty(); }

    const Reading& operator[](size_t i) const { return readings_[i]; }
    const_iterator begin() const { return readings_.begin(); }
    const_iterator end() const { return readings_.end(); }

    const std::vector<Reading>& readings() const { return readings_; }

    /// First / last reading; throw InsufficientDataError when empty
    const Reading& first() const;
    const Reading& last() const;

    /// Gap between the first two readings, in seconds
    /// @throws InsufficientDataError with fewer than two readings
    int64_t sampling_interval_seconds() const;

    /// Readings per hour implied by the first gap (4 for 15-minute data)
    /// Requires hourly or finer sampling that divides an hour evenly
    /// @throws UnsupportedSamplingError otherwise
    int readings_per_hour() const;

    /// Check every gap equals the inferred interval
    /// @throws NonUniformSamplingError naming the first offending index
    void validate_uniform_sampling() const;

    /// Index of a reading that is a member of this series
    std::optional<size_t> index_of(const Reading& reading) const;

    /// Index of the reading taken exactly at t
    std::optional<size_t> index_at(Timestamp t) const;

    /// First index whose timestamp is >= t (size() if none)
    size_t lower_bound(Timestamp t) const;

    /// Index of the reading closest in time to t (earlier wins ties)
    std::optional<size_t> nearest_index(Timestamp t) const;

    /// Copy of readings in [begin, end), clamped to the series bounds
    ReadingSeries slice(size_t begin, size_t end) const;

    /// Readings with timestamp in [start, stop)
    std::vector<Reading> readings_between(Timestamp start, Timestamp stop) const;

    double min_height() const;
    double max_height() const;

private:
    std::vector<Reading> readings_;
};

/// Height difference, later minus earlier (ft)
double rise(const Reading& later, const Reading& earlier);

/// Absolute rate of change between two readings (ft/hr)
double slope(const Reading& later, const Reading& earlier);

/// "MM/DD/YYYY HH:MM:SS - height"
std::string format_reading(const Reading& reading);

} // namespace slidewatch
