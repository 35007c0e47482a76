/**
 * Arrow Export - Columnar hand-off of readings and outcomes
 *
 * Tables go to plotting and notebook code through the Arrow C data
 * interface (pyarrow) without a CSV round trip.
 */

#pragma once

#include "slidewatch/core/reading_series.hpp"
#include "slidewatch/processing/event_classifier.hpp"

#include <memory>
#include <vector>

#include <arrow/api.h>

namespace slidewatch {
namespace arrow_export {

/// Arrow type used for every timestamp column: timestamp[s, tz=UTC]
std::shared_ptr<arrow::DataType> timestamp_type();

/**
 * Readings as a two-column table
 *
 * Schema: timestamp: timestamp[s, UTC], height: float64
 */
arrow::Result<std::shared_ptr<arrow::Table>> readings_to_table(
    const std::vector<Reading>& readings
);

arrow::Result<std::shared_ptr<arrow::Table>> readings_to_table(
    const ReadingSeries& series
);

/**
 * Classification outcomes, one row each
 *
 * Schema: kind: utf8, critical_point_time: timestamp[s, UTC],
 * critical_point_height: float64, event_name: utf8,
 * event_time: timestamp[s, UTC], lead_time_minutes: int64.
 * Fields an outcome does not carry are null.
 */
arrow::Result<std::shared_ptr<arrow::Table>> outcomes_to_table(
    const std::vector<ClassificationOutcome>& outcomes
);

/**
 * Wrap a height vector as an Arrow array (zero-copy)
 *
 * The vector MUST outlive the returned array.
 */
std::shared_ptr<arrow::DoubleArray> wrap_heights(const std::vector<double>& heights);

}  // namespace arrow_export
}  // namespace slidewatch
