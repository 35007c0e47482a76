#include "slidewatch/data/event_catalog.hpp"
#include "slidewatch/data/reading_loader.hpp"
#include "slidewatch/data/reading_store.hpp"
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

namespace py = pybind11;
using namespace slidewatch;

void init_data_bindings(py::module &m) {
  // ReadingCsvOptions
  py::class_<ReadingCsvOptions>(m, "ReadingCsvOptions")
      .def(py::init<>())
      .def_readwrite("skip_rows", &ReadingCsvOptions::skip_rows)
      .def_readwrite("delimiter", &ReadingCsvOptions::delimiter)
      .def_readwrite("timestamp_column", &ReadingCsvOptions::timestamp_column)
      .def_readwrite("height_column", &ReadingCsvOptions::height_column)
      .def_readwrite("utc_offset_hours", &ReadingCsvOptions::utc_offset_hours)
      .def_readwrite("reverse_order", &ReadingCsvOptions::reverse_order);

  // ReadingCsvLoader
  py::class_<ReadingCsvLoader>(m, "ReadingCsvLoader")
      .def_static("load", &ReadingCsvLoader::load, py::arg("path"),
                  py::arg("options") = ReadingCsvOptions(),
                  "Load a gauge CSV file into a ReadingSeries")
      .def_static("parse", &ReadingCsvLoader::parse, py::arg("text"),
                  py::arg("options") = ReadingCsvOptions());

  // EventCatalogLoader
  py::class_<EventCatalogLoader>(m, "EventCatalogLoader")
      .def_static("load", &EventCatalogLoader::load, py::arg("path"),
                  "Load a known-event catalog CSV")
      .def_static("parse", &EventCatalogLoader::parse, py::arg("text"));

  m.def("relevant_event", &relevant_event, py::arg("window"),
        py::arg("events"), "First known event inside the window, or None");

  // ReadingStore
  py::class_<StoredReadingSet>(m, "StoredReadingSet")
      .def(py::init<>())
      .def_readonly("label", &StoredReadingSet::label)
      .def_readonly("series", &StoredReadingSet::series);

  py::class_<ReadingStore>(m, "ReadingStore")
      .def_static("write", &ReadingStore::write, py::arg("path"),
                  py::arg("series"), py::arg("label") = "",
                  py::arg("compression_level") =
                      store::DEFAULT_COMPRESSION_LEVEL)
      .def_static("read", &ReadingStore::read, py::arg("path"))
      .def_static("file_name_for", &ReadingStore::file_name_for,
                  py::arg("series"));
}
