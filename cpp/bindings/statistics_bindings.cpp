/**
 * @file statistics_bindings.cpp
 * @brief Python bindings for run aggregation and reports
 */

#include "slidewatch/statistics/results_aggregator.hpp"
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

namespace py = pybind11;
using namespace slidewatch;

void bind_statistics(py::module_ &m) {
  py::class_<NotificationTime>(m, "NotificationTime")
      .def(py::init<>())
      .def_readonly("event", &NotificationTime::event, "Associated event")
      .def_readonly("lead_time_minutes", &NotificationTime::lead_time_minutes,
                    "Minutes from first critical point to the event");

  py::class_<RunSummary>(m, "RunSummary")
      .def(py::init<>())
      .def_readonly("notifications_issued", &RunSummary::notifications_issued)
      .def_readonly("true_positives", &RunSummary::true_positives)
      .def_readonly("false_positives", &RunSummary::false_positives)
      .def_readonly("false_negatives", &RunSummary::false_negatives)
      .def_readonly("unassociated_notification_points",
                    &RunSummary::unassociated_notification_points)
      .def_readonly("unassociated_events", &RunSummary::unassociated_events)
      .def_readonly("out_of_range_events", &RunSummary::out_of_range_events)
      .def_readonly("notification_times", &RunSummary::notification_times)
      .def_readonly("unclaimed_events_in_windows",
                    &RunSummary::unclaimed_events_in_windows)
      .def_readonly("earliest_reading", &RunSummary::earliest_reading)
      .def_readonly("latest_reading", &RunSummary::latest_reading)
      .def("sorted_lead_times", &RunSummary::sorted_lead_times)
      .def("__str__", &format_summary)
      .def("__repr__", [](const RunSummary &s) {
        return "<RunSummary tp=" + std::to_string(s.true_positives) +
               " fp=" + std::to_string(s.false_positives) +
               " fn=" + std::to_string(s.false_negatives) + ">";
      });

  py::class_<ResultsAggregator>(m, "ResultsAggregator")
      .def(py::init<>())
      .def("record_series", &ResultsAggregator::record_series,
           py::arg("series"))
      .def("record_bounds", &ResultsAggregator::record_bounds,
           py::arg("first"), py::arg("last"))
      .def("accumulate", &ResultsAggregator::accumulate, py::arg("result"))
      .def("merge", &ResultsAggregator::merge, py::arg("other"))
      .def("analyzed_range", &ResultsAggregator::analyzed_range)
      .def("summarize", &ResultsAggregator::summarize,
           R"pbdoc(
                Finalize the run and return its RunSummary.

                Further record/accumulate/merge calls raise RuntimeError.
            )pbdoc")
      .def_property_readonly("finalized", &ResultsAggregator::finalized);

  m.def("format_summary", &format_summary, py::arg("summary"),
        "Human-readable text report of a run");
}
