/**
 * @file processing_bindings.cpp
 * @brief Python bindings for detection, windowing, classification,
 *        projection, the batch pipeline and the threshold sweep
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "slidewatch/processing/analysis_pipeline.hpp"
#include "slidewatch/processing/critical_points.hpp"
#include "slidewatch/processing/event_classifier.hpp"
#include "slidewatch/processing/event_window.hpp"
#include "slidewatch/processing/threshold_projector.hpp"
#include "slidewatch/processing/threshold_sweep.hpp"

namespace py = pybind11;
using namespace slidewatch;

void bind_processing(py::module &m) {
  // ==========================================================================
  // Critical points
  // ==========================================================================
  py::class_<CriticalPoint>(m, "CriticalPoint")
      .def(py::init<>())
      .def(py::init<size_t, const Reading &>(), py::arg("index"),
           py::arg("reading"))
      .def_readonly("index", &CriticalPoint::index)
      .def_readonly("reading", &CriticalPoint::reading)
      .def_property_readonly("timestamp", &CriticalPoint::timestamp)
      .def_property_readonly("height", &CriticalPoint::height);

  py::class_<CriticalPointsDetector>(m, "CriticalPointsDetector")
      .def_static("detect",
                  py::overload_cast<const ReadingSeries &,
                                    const DetectionConfig &>(
                      &CriticalPointsDetector::detect),
                  py::arg("series"), py::arg("config") = DetectionConfig(),
                  R"pbdoc(
                First critical points of a series (one per debounced cluster).

                Raises InsufficientDataError when the series cannot fill the
                lookback window and NonUniformSamplingError for irregular data.
            )pbdoc")
      .def_static("detect",
                  py::overload_cast<const ReadingSeries &, double, double,
                                    double>(&CriticalPointsDetector::detect),
                  py::arg("series"), py::arg("rise_critical"),
                  py::arg("rate_critical"), py::arg("debounce_hours") = 12.0)
      .def_static("find_critical_points",
                  &CriticalPointsDetector::find_critical_points,
                  py::arg("series"), py::arg("config") = DetectionConfig())
      .def_static("first_critical_points",
                  &CriticalPointsDetector::first_critical_points,
                  py::arg("points"), py::arg("debounce_hours"))
      .def_static("lookback_samples", &CriticalPointsDetector::lookback_samples,
                  py::arg("series"), py::arg("config"));

  // ==========================================================================
  // Windows
  // ==========================================================================
  py::class_<EventWindowExtractor>(m, "EventWindowExtractor")
      .def_static("extract", &EventWindowExtractor::extract, py::arg("anchor"),
                  py::arg("series"), py::arg("radius_hours") = 24)
      .def_static("extract_at", &EventWindowExtractor::extract_at,
                  py::arg("anchor_index"), py::arg("series"),
                  py::arg("radius_hours") = 24)
      .def_static("extract_all", &EventWindowExtractor::extract_all,
                  py::arg("anchors"), py::arg("series"),
                  py::arg("radius_hours") = 24);

  // ==========================================================================
  // Classification
  // ==========================================================================
  py::class_<ClassificationOutcome> outcome(m, "ClassificationOutcome");

  py::enum_<ClassificationOutcome::Kind>(outcome, "Kind")
      .value("TRUE_POSITIVE", ClassificationOutcome::Kind::TRUE_POSITIVE)
      .value("FALSE_POSITIVE", ClassificationOutcome::Kind::FALSE_POSITIVE)
      .value("FALSE_NEGATIVE", ClassificationOutcome::Kind::FALSE_NEGATIVE)
      .export_values();

  outcome.def(py::init<>())
      .def_readonly("kind", &ClassificationOutcome::kind)
      .def_readonly("critical_point", &ClassificationOutcome::critical_point)
      .def_readonly("event", &ClassificationOutcome::event)
      .def_readonly("lead_time_minutes",
                    &ClassificationOutcome::lead_time_minutes)
      .def("detected_after_event", &ClassificationOutcome::detected_after_event)
      .def("__repr__", [](const ClassificationOutcome &o) {
        return std::string("<ClassificationOutcome ") + to_string(o.kind) + ">";
      });

  py::class_<AnalyzedRange>(m, "AnalyzedRange")
      .def(py::init<>())
      .def(py::init<Timestamp, Timestamp>(), py::arg("earliest"),
           py::arg("latest"))
      .def_readwrite("earliest", &AnalyzedRange::earliest)
      .def_readwrite("latest", &AnalyzedRange::latest)
      .def("valid", &AnalyzedRange::valid)
      .def("contains", &AnalyzedRange::contains, py::arg("timestamp"));

  py::class_<ClassificationResult>(m, "ClassificationResult")
      .def(py::init<>())
      .def_readonly("outcomes", &ClassificationResult::outcomes)
      .def_readonly("out_of_range_events",
                    &ClassificationResult::out_of_range_events)
      .def_readonly("unclaimed_in_window_events",
                    &ClassificationResult::unclaimed_in_window_events)
      .def("count", &ClassificationResult::count, py::arg("kind"));

  py::class_<EventClassifier>(m, "EventClassifier")
      .def(py::init<const DetectionConfig &>(),
           py::arg("config") = DetectionConfig())
      .def("classify", &EventClassifier::classify, py::arg("windows"),
           py::arg("events"), py::arg("range"))
      .def_static("lead_time_minutes", &EventClassifier::lead_time_minutes,
                  py::arg("event"), py::arg("critical_point"));

  // ==========================================================================
  // Projection
  // ==========================================================================
  py::enum_<ProjectionDirection>(m, "ProjectionDirection")
      .value("FORWARD", ProjectionDirection::FORWARD)
      .value("BACKWARD", ProjectionDirection::BACKWARD)
      .export_values();

  py::class_<ThresholdProjector>(m, "ThresholdProjector")
      .def_static("project", &ThresholdProjector::project, py::arg("series"),
                  py::arg("direction"), py::arg("step_minutes"),
                  py::arg("count"), py::arg("rise_critical"),
                  py::arg("rate_critical"))
      .def_static("project_forward", &ThresholdProjector::project_forward,
                  py::arg("series"), py::arg("config") = DetectionConfig())
      .def_static("project_backward", &ThresholdProjector::project_backward,
                  py::arg("series"), py::arg("config") = DetectionConfig())
      .def_static("critical_height_at", &ThresholdProjector::critical_height_at,
                  py::arg("timestamp"), py::arg("predecessors"),
                  py::arg("rise_critical"), py::arg("rate_critical"));

  // ==========================================================================
  // Pipeline
  // ==========================================================================
  py::class_<SeriesAnalysis>(m, "SeriesAnalysis")
      .def(py::init<>())
      .def_readonly("critical_points", &SeriesAnalysis::critical_points)
      .def_readonly("first_critical_points",
                    &SeriesAnalysis::first_critical_points)
      .def_readonly("windows", &SeriesAnalysis::windows)
      .def_readonly("scanned", &SeriesAnalysis::scanned);

  py::class_<RunResult>(m, "RunResult")
      .def(py::init<>())
      .def_readonly("summary", &RunResult::summary)
      .def_readonly("analyses", &RunResult::analyses);

  py::class_<AnalysisPipeline>(m, "AnalysisPipeline")
      .def_static("analyze_series", &AnalysisPipeline::analyze_series,
                  py::arg("series"), py::arg("config"), py::arg("aggregator"))
      .def_static("run", &AnalysisPipeline::run,
                  py::arg("series_list"), py::arg("events"),
                  py::arg("config") = DetectionConfig(),
                  py::call_guard<py::gil_scoped_release>())
      .def_static("reading_sets", &AnalysisPipeline::reading_sets,
                  py::arg("series"), py::arg("events"),
                  py::arg("config") = DetectionConfig());

  // ==========================================================================
  // Sweep
  // ==========================================================================
  py::class_<SweepTrial>(m, "SweepTrial")
      .def(py::init<>())
      .def_readonly("name", &SweepTrial::name)
      .def_readonly("rise_critical", &SweepTrial::rise_critical)
      .def_readonly("rate_critical", &SweepTrial::rate_critical)
      .def_readonly("true_positives", &SweepTrial::true_positives)
      .def_readonly("false_positives", &SweepTrial::false_positives)
      .def_readonly("false_negatives", &SweepTrial::false_negatives)
      .def_readonly("notification_times", &SweepTrial::notification_times);

  py::class_<ThresholdSweep>(m, "ThresholdSweep")
      .def_static("run", &ThresholdSweep::run, py::arg("series_list"),
                  py::arg("events"), py::arg("base_config"), py::arg("rises"),
                  py::arg("rates"), py::call_guard<py::gil_scoped_release>())
      .def_static("format_table", &ThresholdSweep::format_table,
                  py::arg("trials"))
      .def_static("trial_name", &ThresholdSweep::trial_name, py::arg("index"));
}
