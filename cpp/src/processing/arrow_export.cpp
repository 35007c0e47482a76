#include "slidewatch/processing/arrow_export.hpp"

namespace slidewatch {
namespace arrow_export {

std::shared_ptr<arrow::DataType> timestamp_type() {
    return arrow::timestamp(arrow::TimeUnit::SECOND, "UTC");
}

arrow::Result<std::shared_ptr<arrow::Table>> readings_to_table(
    const std::vector<Reading>& readings
) {
    const auto n = static_cast<int64_t>(readings.size());

    arrow::TimestampBuilder time_builder(timestamp_type(), arrow::default_memory_pool());
    arrow::DoubleBuilder height_builder;
    ARROW_RETURN_NOT_OK(time_builder.Reserve(n));
    ARROW_RETURN_NOT_OK(height_builder.Reserve(n));

    for (const auto& r : readings) {
        time_builder.UnsafeAppend(r.timestamp);
        height_builder.UnsafeAppend(r.height);
    }

    std::shared_ptr<arrow::Array> times;
    std::shared_ptr<arrow::Array> heights;
    ARROW_RETURN_NOT_OK(time_builder.Finish(&times));
    ARROW_RETURN_NOT_OK(height_builder.Finish(&heights));

    auto schema = arrow::schema({
        arrow::field("timestamp", timestamp_type(), false),
        arrow::field("height", arrow::float64(), false)
    });
    return arrow::Table::Make(schema, {times, heights});
}

arrow::Result<std::shared_ptr<arrow::Table>> readings_to_table(
    const ReadingSeries& series
) {
    return readings_to_table(series.readings());
}

arrow::Result<std::shared_ptr<arrow::Table>> outcomes_to_table(
    const std::vector<ClassificationOutcome>& outcomes
) {
    arrow::StringBuilder kind_builder;
    arrow::TimestampBuilder cp_time_builder(timestamp_type(), arrow::default_memory_pool());
    arrow::DoubleBuilder cp_height_builder;
    arrow::StringBuilder event_name_builder;
    arrow::TimestampBuilder event_time_builder(timestamp_type(), arrow::default_memory_pool());
    arrow::Int64Builder lead_builder;

    for (const auto& outcome : outcomes) {
        ARROW_RETURN_NOT_OK(kind_builder.Append(to_string(outcome.kind)));

        if (outcome.critical_point) {
            ARROW_RETURN_NOT_OK(cp_time_builder.Append(outcome.critical_point->timestamp));
            ARROW_RETURN_NOT_OK(cp_height_builder.Append(outcome.critical_point->height));
        } else {
            ARROW_RETURN_NOT_OK(cp_time_builder.AppendNull());
            ARROW_RETURN_NOT_OK(cp_height_builder.AppendNull());
        }

        if (outcome.event) {
            ARROW_RETURN_NOT_OK(event_name_builder.Append(outcome.event->name));
            ARROW_RETURN_NOT_OK(event_time_builder.Append(outcome.event->timestamp));
        } else {
            ARROW_RETURN_NOT_OK(event_name_builder.AppendNull());
            ARROW_RETURN_NOT_OK(event_time_builder.AppendNull());
        }

        if (outcome.lead_time_minutes) {
            ARROW_RETURN_NOT_OK(lead_builder.Append(*outcome.lead_time_minutes));
        } else {
            ARROW_RETURN_NOT_OK(lead_builder.AppendNull());
        }
    }

    std::shared_ptr<arrow::Array> kinds, cp_times, cp_heights, event_names, event_times, leads;
    ARROW_RETURN_NOT_OK(kind_builder.Finish(&kinds));
    ARROW_RETURN_NOT_OK(cp_time_builder.Finish(&cp_times));
    ARROW_RETURN_NOT_OK(cp_height_builder.Finish(&cp_heights));
    ARROW_RETURN_NOT_OK(event_name_builder.Finish(&event_names));
    ARROW_RETURN_NOT_OK(event_time_builder.Finish(&event_times));
    ARROW_RETURN_NOT_OK(lead_builder.Finish(&leads));

    auto schema = arrow::schema({
        arrow::field("kind", arrow::utf8(), false),
        arrow::field("critical_point_time", timestamp_type()),
        arrow::field("critical_point_height", arrow::float64()),
        arrow::field("event_name", arrow::utf8()),
        arrow::field("event_time", timestamp_type()),
        arrow::field("lead_time_minutes", arrow::int64())
    });
    return arrow::Table::Make(schema,
        {kinds, cp_times, cp_heights, event_names, event_times, leads});
}

std::shared_ptr<arrow::DoubleArray> wrap_heights(const std::vector<double>& heights) {
    // Borrow the vector storage; no null bitmap
    auto buffer = arrow::Buffer::Wrap(
        reinterpret_cast<const uint8_t*>(heights.data()),
        heights.size() * sizeof(double)
    );

    auto array_data = arrow::ArrayData::Make(
        arrow::float64(),
        static_cast<int64_t>(heights.size()),
        {nullptr, buffer},
        0
    );

    return std::make_shared<arrow::DoubleArray>(array_data);
}

}  // namespace arrow_export
}  // namespace slidewatch
