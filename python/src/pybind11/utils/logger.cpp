// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <pybind11/pybind11.h>

#include <qterm/utils/logger.hpp>
#include <string>

namespace py = pybind11;

void bind_logger(py::module& m) {
  using qterm::utils::Logger;

  m.def(
      "set_log_level",
      [](const std::string& level) { Logger::set_global_level(level); },
      py::arg("level"),
      R"(
Set the verbosity of the qterm logger.

Args:
    level (str): One of "trace", "debug", "info", "warn", "error",
        "critical" or "off"

Raises:
    ValueError: If the level name is unknown
)");

  m.def("get_log_level", []() {
    auto name = spdlog::level::to_string_view(Logger::get_global_level());
    return std::string(name.data(), name.size());
  });
}
