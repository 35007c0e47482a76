/**
 * @file core_bindings.cpp
 * @brief Python bindings for core types (readings, events, config)
 *
 * Exposes:
 * - Reading, KnownEvent, ReadingWindow: value types
 * - ReadingSeries: with NumPy views of timestamps and heights
 * - DetectionConfig: thresholds and policies
 * - Error hierarchy, logging switch and time helpers
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/numpy.h>
#include <pybind11/operators.h>

#include "slidewatch/core/config.hpp"
#include "slidewatch/core/errors.hpp"
#include "slidewatch/core/logging.hpp"
#include "slidewatch/core/reading_series.hpp"
#include "slidewatch/core/time_utils.hpp"
#include "slidewatch/core/types.hpp"

namespace py = pybind11;

namespace slidewatch {

namespace {

py::array_t<int64_t> timestamps_array(const std::vector<Reading>& readings) {
    py::array_t<int64_t> out(static_cast<py::ssize_t>(readings.size()));
    auto view = out.mutable_unchecked<1>();
    for (size_t i = 0; i < readings.size(); ++i) {
        view(static_cast<py::ssize_t>(i)) = readings[i].timestamp;
    }
    return out;
}

py::array_t<double> heights_array(const std::vector<Reading>& readings) {
    py::array_t<double> out(static_cast<py::ssize_t>(readings.size()));
    auto view = out.mutable_unchecked<1>();
    for (size_t i = 0; i < readings.size(); ++i) {
        view(static_cast<py::ssize_t>(i)) = readings[i].height;
    }
    return out;
}

ReadingSeries series_from_arrays(
    py::array_t<int64_t, py::array::c_style | py::array::forcecast> timestamps,
    py::array_t<double, py::array::c_style | py::array::forcecast> heights
) {
    if (timestamps.ndim() != 1 || heights.ndim() != 1 ||
        timestamps.size() != heights.size()) {
        throw std::invalid_argument(
            "timestamps and heights must be 1-D arrays of equal length");
    }
    auto t = timestamps.unchecked<1>();
    auto h = heights.unchecked<1>();

    std::vector<Reading> readings;
    readings.reserve(static_cast<size_t>(t.shape(0)));
    for (py::ssize_t i = 0; i < t.shape(0); ++i) {
        readings.emplace_back(t(i), h(i));
    }
    return ReadingSeries(std::move(readings));
}

} // namespace

/**
 * @brief Initialize core bindings
 */
void init_core_bindings(py::module& m) {
    // ========================================================================
    // Errors
    // ========================================================================
    auto& error = py::register_exception<Error>(m, "SlidewatchError", PyExc_RuntimeError);
    py::register_exception<InsufficientDataError>(m, "InsufficientDataError", error.ptr());
    py::register_exception<NonUniformSamplingError>(m, "NonUniformSamplingError", error.ptr());
    py::register_exception<UnsupportedSamplingError>(m, "UnsupportedSamplingError", error.ptr());
    py::register_exception<AnchorNotFoundError>(m, "AnchorNotFoundError", error.ptr());
    py::register_exception<ConfigError>(m, "ConfigError", error.ptr());
    py::register_exception<CatalogFormatError>(m, "CatalogFormatError", error.ptr());
    py::register_exception<ReadingFormatError>(m, "ReadingFormatError", error.ptr());
    py::register_exception<StoreError>(m, "StoreError", error.ptr());

    // ========================================================================
    // Logging and time helpers
    // ========================================================================
    m.def("set_verbose", &log::set_verbose, py::arg("verbose"),
        "Enable or disable informational output");
    m.def("is_verbose", &log::is_verbose);

    m.def("make_timestamp", &time_utils::make_timestamp,
        py::arg("year"), py::arg("month"), py::arg("day"),
        py::arg("hour") = 0, py::arg("minute") = 0, py::arg("second") = 0,
        "UTC seconds since the epoch for calendar fields");
    m.def("parse_timestamp", &time_utils::parse_timestamp, py::arg("text"),
        "Parse 'YYYY-MM-DD HH:MM[:SS]' (UTC); None if malformed");
    m.def("format_timestamp",
        [](Timestamp t, const std::string& fmt) {
            return time_utils::format_timestamp(t, fmt.c_str());
        },
        py::arg("timestamp"), py::arg("format") = "%Y-%m-%d %H:%M:%S");

    // ========================================================================
    // Reading
    // ========================================================================
    py::class_<Reading>(m, "Reading", "One stream gauge reading")
        .def(py::init<>())
        .def(py::init<Timestamp, double>(), py::arg("timestamp"), py::arg("height"))
        .def_readwrite("timestamp", &Reading::timestamp, "UTC seconds")
        .def_readwrite("height", &Reading::height, "River height (ft)")
        .def(py::self == py::self)
        .def(py::self != py::self)
        .def("__repr__", [](const Reading& r) {
            return "<Reading " + format_reading(r) + ">";
        });

    m.def("rise", &rise, py::arg("later"), py::arg("earlier"));
    m.def("slope", &slope, py::arg("later"), py::arg("earlier"));
    m.def("format_reading", &format_reading, py::arg("reading"));

    // ========================================================================
    // KnownEvent
    // ========================================================================
    py::class_<KnownEvent>(m, "KnownEvent", "A known landslide event")
        .def(py::init<>())
        .def(py::init<size_t, Timestamp, const std::string&, const std::string&>(),
            py::arg("id"), py::arg("timestamp"), py::arg("name"),
            py::arg("location") = "")
        .def_readwrite("id", &KnownEvent::id)
        .def_readwrite("timestamp", &KnownEvent::timestamp)
        .def_readwrite("name", &KnownEvent::name)
        .def_readwrite("location", &KnownEvent::location)
        .def_readwrite("fatalities", &KnownEvent::fatalities)
        .def_readwrite("power_outage", &KnownEvent::power_outage)
        .def_readwrite("urls", &KnownEvent::urls)
        .def("__repr__", [](const KnownEvent& e) {
            return "<KnownEvent " + std::to_string(e.id) + " " + e.name + " " +
                   time_utils::format_timestamp(e.timestamp) + ">";
        });

    // ========================================================================
    // ReadingWindow
    // ========================================================================
    py::class_<ReadingWindow>(m, "ReadingWindow",
        "Readings cut from a series around an anchor")
        .def(py::init<>())
        .def_readonly("readings", &ReadingWindow::readings)
        .def_readonly("anchor", &ReadingWindow::anchor)
        .def_readonly("anchor_index", &ReadingWindow::anchor_index)
        .def_readonly("series_begin", &ReadingWindow::series_begin)
        .def_readonly("series_end", &ReadingWindow::series_end)
        .def_property_readonly("timestamps",
            [](const ReadingWindow& w) { return timestamps_array(w.readings); })
        .def_property_readonly("heights",
            [](const ReadingWindow& w) { return heights_array(w.readings); })
        .def("__len__", &ReadingWindow::size)
        .def("start_time", &ReadingWindow::start_time)
        .def("end_time", &ReadingWindow::end_time)
        .def("contains", &ReadingWindow::contains, py::arg("timestamp"));

    // ========================================================================
    // DetectionConfig
    // ========================================================================
    py::class_<DetectionConfig>(m, "DetectionConfig", "Detection thresholds")
        .def(py::init<>())
        .def(py::init<double, double>(), py::arg("rise_critical"), py::arg("rate_critical"))
        .def_readwrite("rise_critical", &DetectionConfig::rise_critical)
        .def_readwrite("rate_critical", &DetectionConfig::rate_critical)
        .def_readwrite("debounce_hours", &DetectionConfig::debounce_hours)
        .def_readwrite("floor_height", &DetectionConfig::floor_height)
        .def_readwrite("window_radius_hours", &DetectionConfig::window_radius_hours)
        .def_readwrite("project_step_minutes", &DetectionConfig::project_step_minutes)
        .def_readwrite("forward_hours", &DetectionConfig::forward_hours)
        .def_readwrite("backward_hours", &DetectionConfig::backward_hours)
        .def_readwrite("count_negative_lead_as_true_positive",
            &DetectionConfig::count_negative_lead_as_true_positive)
        .def("lookback_hours", &DetectionConfig::lookback_hours)
        .def("validate", &DetectionConfig::validate);

    // ========================================================================
    // ReadingSeries
    // ========================================================================
    py::class_<ReadingSeries>(m, "ReadingSeries", "Ordered gauge readings")
        .def(py::init<>())
        .def(py::init<std::vector<Reading>>(), py::arg("readings"))
        .def(py::init(&series_from_arrays), py::arg("timestamps"), py::arg("heights"),
            "Build from NumPy arrays of UTC seconds and heights")

        .def_property_readonly("readings", &ReadingSeries::readings)
        .def_property_readonly("timestamps",
            [](const ReadingSeries& s) { return timestamps_array(s.readings()); },
            "Timestamps as NumPy int64 array")
        .def_property_readonly("heights",
            [](const ReadingSeries& s) { return heights_array(s.readings()); },
            "Heights as NumPy float64 array")

        .def("__len__", &ReadingSeries::size)
        .def("__getitem__", [](const ReadingSeries& s, size_t i) {
            if (i >= s.size()) throw py::index_error();
            return s[i];
        })
        .def("first", &ReadingSeries::first)
        .def("last", &ReadingSeries::last)
        .def("sampling_interval_seconds", &ReadingSeries::sampling_interval_seconds)
        .def("readings_per_hour", &ReadingSeries::readings_per_hour)
        .def("validate_uniform_sampling", &ReadingSeries::validate_uniform_sampling)
        .def("index_of", &ReadingSeries::index_of, py::arg("reading"))
        .def("index_at", &ReadingSeries::index_at, py::arg("timestamp"))
        .def("nearest_index", &ReadingSeries::nearest_index, py::arg("timestamp"))
        .def("slice", &ReadingSeries::slice, py::arg("begin"), py::arg("end"))
        .def("readings_between", &ReadingSeries::readings_between,
            py::arg("start"), py::arg("stop"))
        .def("min_height", &ReadingSeries::min_height)
        .def("max_height", &ReadingSeries::max_height);
}

} // namespace slidewatch
