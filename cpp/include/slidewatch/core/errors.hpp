#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace slidewatch {

/// Base class for every error raised by slidewatch
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

/// Series too short to infer a sampling rate or fill the lookback window
class InsufficientDataError : public Error {
public:
    explicit InsufficientDataError(const std::string& message) : Error(message) {}
};

/// Sampling interval the hour-based lookback cannot express (longer
/// than an hour, or not an even divisor of one)
class UnsupportedSamplingError : public Error {
public:
    explicit UnsupportedSamplingError(const std::string& message) : Error(message) {}
};

/// Gap between readings differs from the inferred sampling interval
class NonUniformSamplingError : public Error {
public:
    NonUniformSamplingError(const std::string& message, size_t index)
        : Error(message), index_(index) {}

    /// Index of the first reading whose gap to its predecessor is wrong
    size_t index() const { return index_; }

private:
    size_t index_;
};

/// Window anchor is not a member of the series being windowed
class AnchorNotFoundError : public Error {
public:
    explicit AnchorNotFoundError(const std::string& message) : Error(message) {}
};

/// Threshold configuration out of range
class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& message) : Error(message) {}
};

/// Event catalog missing a required field or holding a malformed value
class CatalogFormatError : public Error {
public:
    CatalogFormatError(const std::string& message, size_t line)
        : Error("line " + std::to_string(line) + ": " + message), line_(line) {}

    /// Failure not tied to a line, such as an unreadable file
    explicit CatalogFormatError(const std::string& message)
        : Error(message), line_(0) {}

    /// 1-based line, 0 when the error is not tied to a line
    size_t line() const { return line_; }

private:
    size_t line_;
};

/// Malformed reading data (bad row, timestamps out of order)
class ReadingFormatError : public Error {
public:
    explicit ReadingFormatError(const std::string& message) : Error(message) {}
};

/// Reading store file could not be written, or failed validation on read
class StoreError : public Error {
public:
    explicit StoreError(const std::string& message) : Error(message) {}
};

} // namespace slidewatch
