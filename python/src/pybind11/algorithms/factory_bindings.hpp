// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <pybind11/functional.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <memory>
#include <string>
#include <type_traits>

namespace py = pybind11;

namespace qterm::python {

/**
 * @brief Expose an AlgorithmFactory as a Python class of static methods
 *
 * The bound class provides create(name=""), available(), has(key),
 * register_instance(func), unregister_instance(key) and
 * algorithm_type_name().
 *
 * @tparam FactoryType The factory, e.g. TimeEvolutionFactory
 * @tparam AlgorithmType The algorithm interface, e.g. TimeEvolution
 * @tparam TrampolineType Python trampoline of AlgorithmType; when given,
 * register_instance accepts Python subclasses
 *
 * @code
 * bind_algorithm_factory<TimeEvolutionFactory, TimeEvolution,
 *                        TimeEvolutionBase>(m, "TimeEvolutionFactory");
 * @endcode
 */
template <typename FactoryType, typename AlgorithmType,
          typename TrampolineType = void>
void bind_algorithm_factory(py::module& m, const std::string& class_name) {
  py::class_<FactoryType> factory(m, class_name.c_str(),
                                  R"(
Registry of algorithm implementations, addressed by name.

All methods are static and the class cannot be instantiated.
)");

  factory.def_static("create", &FactoryType::create, py::arg("name") = "",
                     R"(
Create an algorithm instance by name.

Args:
    name (str): Registered name or alias; empty selects the default

Returns:
    Algorithm: New instance of the requested implementation

Raises:
    RuntimeError: If the name is not found in the registry
)");

  factory.def_static("available", &FactoryType::available,
                     "Names and aliases of all registered implementations.");

  factory.def_static(
      "register_instance",
      [](py::function creator_func) {
        FactoryType::register_instance(
            [creator_func]() -> std::unique_ptr<AlgorithmType> {
              py::object instance = creator_func();
              if constexpr (!std::is_void_v<TrampolineType>) {
                return instance.cast<std::unique_ptr<TrampolineType>>();
              } else {
                return instance.cast<std::unique_ptr<AlgorithmType>>();
              }
            });
      },
      py::arg("func"),
      R"(
Register an implementation under its name and aliases.

Args:
    func (callable): Returns a new algorithm instance

Raises:
    RuntimeError: If a name is taken or the instance has the wrong type
)");

  factory.def_static("unregister_instance", &FactoryType::unregister_instance,
                     py::arg("key"),
                     R"(
Remove an implementation from the registry.

Returns:
    bool: True if the key was registered
)");
  factory.def_static("algorithm_type_name", &FactoryType::algorithm_type_name);
  factory.def_static("has", &FactoryType::has, py::arg("key"));

  factory.def("__repr__", [class_name](const FactoryType&) {
    return "<" + class_name + " (static factory class)>";
  });
}

}  // namespace qterm::python
