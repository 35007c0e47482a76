#include "slidewatch/core/version.hpp"
#include <pybind11/pybind11.h>

namespace py = pybind11;

// Forward declarations for binding functions
void bind_processing(py::module &m);
void bind_statistics(py::module &m);
void init_data_bindings(py::module &m);

namespace slidewatch {
void init_core_bindings(py::module &m);
}

/// Main Python module definition
PYBIND11_MODULE(slidewatch_cpp, m) {
  m.doc() = "slidewatch C++ core - stream gauge landslide early warning";

  // Version information
  m.attr("__version__") = slidewatch::Version::get_version_string();
  m.def("get_version", &slidewatch::Version::get_version_string,
        "Get library version string");

  // Readings, events, config, errors, logging
  slidewatch::init_core_bindings(m);

  // Detection, windows, classification, projection, pipeline, sweep
  bind_processing(m);

  // Aggregation and reports
  bind_statistics(m);

  // CSV loaders and reading store
  init_data_bindings(m);
}
