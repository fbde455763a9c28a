// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <stdexcept>
#include <string>

namespace qterm::python::utils {

/**
 * @brief Convert a str or os.PathLike argument to a filesystem path string
 * @throws std::runtime_error if @p path_obj is neither
 */
inline std::string to_string_path(const pybind11::object& path_obj) {
  namespace py = pybind11;
  if (py::isinstance<py::str>(path_obj)) {
    return path_obj.cast<std::string>();
  }
  if (py::hasattr(path_obj, "__fspath__")) {
    return path_obj.attr("__fspath__")().cast<std::string>();
  }
  throw std::runtime_error(
      "Path argument must be a string or pathlib Path object");
}

}  // namespace qterm::python::utils
