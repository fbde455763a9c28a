// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <qterm/data/settings.hpp>
#include <string>
#include <variant>

#include "path_utils.hpp"

namespace py = pybind11;
using namespace qterm::data;

namespace {

// Convert a Python value to the type currently held by @p key
SettingValue python_to_setting_value(const Settings& settings,
                                     const std::string& key,
                                     const py::object& value) {
  return std::visit(
      [&settings, &value, &key](const auto& current) -> SettingValue {
        using ValueType = std::decay_t<decltype(current)>;
        try {
          return value.cast<ValueType>();
        } catch (const py::cast_error&) {
          throw py::type_error(
              "Cannot convert " + std::string(py::str(py::type::of(value))) +
              " to " + settings.get_type_name(key) + " for setting '" + key +
              "'");
        }
      },
      settings.get(key));
}

}  // namespace

void bind_settings(py::module& data) {
  py::register_exception<SettingsAreLocked>(data, "SettingsAreLocked",
                                            PyExc_RuntimeError);
  py::register_exception<SettingNotFound>(data, "SettingNotFound",
                                          PyExc_KeyError);
  py::register_exception<SettingTypeMismatch>(data, "SettingTypeMismatch",
                                              PyExc_TypeError);

  py::class_<Settings, py::smart_holder> settings(data, "Settings", R"(
Typed key/value configuration of an algorithm.

The keys of a settings object are fixed when it is created. Values can be
changed until the owning algorithm runs, after which the settings are locked.

Examples:
    >>> evolution = TimeEvolutionFactory.create("trotter")
    >>> evolution.settings().set("time_step", 0.05)
    >>> evolution.settings().get("order")
    2
)");

  settings.def(py::init<>());

  settings.def(
      "set",
      [](Settings& self, const std::string& key, const py::object& value) {
        self.set(key, python_to_setting_value(self, key, value));
      },
      py::arg("key"), py::arg("value"),
      R"(
Set an existing setting.

Args:
    key (str): Setting name
    value: New value, converted to the type of the stored default

Raises:
    SettingsAreLocked: If the settings are locked
    SettingNotFound: If the key does not exist
    TypeError: If the value cannot be converted
    ValueError: If the value violates the setting's constraint
)");

  settings.def(
      "get",
      [](const Settings& self, const std::string& key) {
        return self.get(key);
      },
      py::arg("key"));
  settings.def("has", &Settings::has, py::arg("key"));
  settings.def("keys", &Settings::keys);
  settings.def("size", &Settings::size);
  settings.def("empty", &Settings::empty);
  settings.def("get_description", &Settings::get_description, py::arg("key"));
  settings.def("get_type_name", &Settings::get_type_name, py::arg("key"));
  settings.def("lock", &Settings::lock);
  settings.def("is_locked", &Settings::is_locked);
  settings.def("get_summary", &Settings::get_summary);

  settings.def(
      "to_json",
      [](const Settings& self) { return self.to_json().dump(); },
      R"(
Serialize the settings.

Returns:
    str: JSON document
)");
  settings.def(
      "to_json_file",
      [](const Settings& self, const py::object& filename) {
        self.to_json_file(qterm::python::utils::to_string_path(filename));
      },
      py::arg("filename"));
  settings.def(
      "to_hdf5_file",
      [](const Settings& self, const py::object& filename) {
        self.to_hdf5_file(qterm::python::utils::to_string_path(filename));
      },
      py::arg("filename"));
  settings.def_static(
      "from_json_file",
      [](const py::object& filename) {
        return Settings::from_json_file(
            qterm::python::utils::to_string_path(filename));
      },
      py::arg("filename"));
  settings.def_static(
      "from_hdf5_file",
      [](const py::object& filename) {
        return Settings::from_hdf5_file(
            qterm::python::utils::to_string_path(filename));
      },
      py::arg("filename"));

  settings.def("__contains__", &Settings::has);
  settings.def("__len__", &Settings::size);
  settings.def("__getitem__", [](const Settings& self, const std::string& key) {
    return self.get(key);
  });
  settings.def("__setitem__", [](Settings& self, const std::string& key,
                                 const py::object& value) {
    self.set(key, python_to_setting_value(self, key, value));
  });
  settings.def("__repr__", [](const Settings& self) {
    return "<qterm.data.Settings with " + std::to_string(self.size()) +
           " entries>";
  });
}
