#include "slidewatch/core/reading_series.hpp"
#include "slidewatch/core/errors.hpp"
#include "slidewatch/core/time_utils.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace slidewatch {

ReadingSeries::ReadingSeries(std::vector<Reading> readings)
    : readings_(std::move(readings))
{
    for (size_t i = 1; i < readings_.size(); ++i) {
        if (readings_[i].timestamp <= readings_[i - 1].timestamp) {
            throw ReadingFormatError(
                "Reading timestamps must be strictly increasing (index " +
                std::to_string(i) + ": " + format_reading(readings_[i]) +
                " follows " + format_reading(readings_[i - 1]) + ")");
        }
    }
}

const Reading& ReadingSeries::first() const {
    if (readings_.empty()) {
        throw InsufficientDataError("Reading series is empty");
    }
    return readings_.front();
}

const Reading& ReadingSeries::last() const {
    if (readings_.empty()) {
        throw InsufficientDataError("Reading series is empty");
    }
    return readings_.back();
}

int64_t ReadingSeries::sampling_interval_seconds() const {
    if (readings_.size() < 2) {
        throw InsufficientDataError(
            "At least two readings are needed to infer a sampling rate, got " +
            std::to_string(readings_.size()));
    }
    return readings_[1].timestamp - readings_[0].timestamp;
}

int ReadingSeries::readings_per_hour() const {
    const int64_t interval = sampling_interval_seconds();
    if (interval > constants::SECONDS_PER_HOUR ||
        constants::SECONDS_PER_HOUR % interval != 0) {
        throw UnsupportedSamplingError(
            "Sampling interval of " + std::to_string(interval) +
            " s does not divide an hour; hourly or finer sampling is required");
    }
    return static_cast<int>(constants::SECONDS_PER_HOUR / interval);
}

void ReadingSeries::validate_uniform_sampling() const {
    const int64_t interval = sampling_interval_seconds();
    for (size_t i = 2; i < readings_.size(); ++i) {
        const int64_t gap = readings_[i].timestamp - readings_[i - 1].timestamp;
        if (gap != interval) {
            throw NonUniformSamplingError(
                "Gap of " + std::to_string(gap) + " s before " +
                format_reading(readings_[i]) + " (index " + std::to_string(i) +
                ") differs from the inferred interval of " +
                std::to_string(interval) + " s", i);
        }
    }
}

size_t ReadingSeries::lower_bound(Timestamp t) const {
    auto it = std::lower_bound(readings_.begin(), readings_.end(), t,
        [](const Reading& r, Timestamp value) {
            return r.timestamp < value;
        });
    return static_cast<size_t>(it - readings_.begin());
}

std::optional<size_t> ReadingSeries::index_at(Timestamp t) const {
    const size_t idx = lower_bound(t);
    if (idx < readings_.size() && readings_[idx].timestamp == t) {
        return idx;
    }
    return std::nullopt;
}

std::optional<size_t> ReadingSeries::index_of(const Reading& reading) const {
    auto idx = index_at(reading.timestamp);
    if (idx && readings_[*idx].height == reading.height) {
        return idx;
    }
    return std::nullopt;
}

std::optional<size_t> ReadingSeries::nearest_index(Timestamp t) const {
    if (readings_.empty()) {
        return std::nullopt;
    }
    const size_t idx = lower_bound(t);
    if (idx == 0) {
        return 0;
    }
    if (idx == readings_.size()) {
        return readings_.size() - 1;
    }
    const int64_t before = t - readings_[idx - 1].timestamp;
    const int64_t after = readings_[idx].timestamp - t;
    return after < before ? idx : idx - 1;
}

ReadingSeries ReadingSeries::slice(size_t begin, size_t end) const {
    end = std::min(end, readings_.size());
    begin = std::min(begin, end);
    ReadingSeries out;
    out.readings_.assign(readings_.begin() + static_cast<std::ptrdiff_t>(begin),
                         readings_.begin() + static_cast<std::ptrdiff_t>(end));
    return out;
}

std::vector<Reading> ReadingSeries::readings_between(Timestamp start, Timestamp stop) const {
    if (stop <= start) {
        return {};
    }
    const size_t first_idx = lower_bound(start);
    const size_t stop_idx = lower_bound(stop);
    return std::vector<Reading>(readings_.begin() + static_cast<std::ptrdiff_t>(first_idx),
                                readings_.begin() + static_cast<std::ptrdiff_t>(stop_idx));
}

double ReadingSeries::min_height() const {
    if (readings_.empty()) {
        throw InsufficientDataError("Reading series is empty");
    }
    return std::min_element(readings_.begin(), readings_.end(),
        [](const Reading& a, const Reading& b) { return a.height < b.height; })->height;
}

double ReadingSeries::max_height() const {
    if (readings_.empty()) {
        throw InsufficientDataError("Reading series is empty");
    }
    return std::max_element(readings_.begin(), readings_.end(),
        [](const Reading& a, const Reading& b) { return a.height < b.height; })->height;
}

double rise(const Reading& later, const Reading& earlier) {
    return later.height - earlier.height;
}

double slope(const Reading& later, const Reading& earlier) {
    const double d_hours = static_cast<double>(later.timestamp - earlier.timestamp) /
                           static_cast<double>(constants::SECONDS_PER_HOUR);
    return std::abs(rise(later, earlier) / d_hours);
}

std::string format_reading(const Reading& reading) {
    std::ostringstream out;
    out << time_utils::format_timestamp(reading.timestamp, "%m/%d/%Y %H:%M:%S")
        << " - " << reading.height;
    return out.str();
}

} // namespace slidewatch
