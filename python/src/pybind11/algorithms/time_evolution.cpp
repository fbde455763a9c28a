// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <pybind11/eigen.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <qterm.hpp>

#include "factory_bindings.hpp"

namespace py = pybind11;
using namespace qterm::algorithms;
using namespace qterm::data;

// Trampoline class for enabling Python inheritance
class TimeEvolutionBase : public TimeEvolution,
                          public pybind11::trampoline_self_life_support {
 public:
  std::string name() const override {
    PYBIND11_OVERRIDE_PURE(std::string, TimeEvolution, name);
  }

  std::vector<std::string> aliases() const override {
    PYBIND11_OVERRIDE(std::vector<std::string>, TimeEvolution, aliases);
  }

  void replace_settings(std::unique_ptr<Settings> new_settings) {
    this->_settings = std::move(new_settings);
  }

 protected:
  Eigen::VectorXcd _run_impl(const SymbolicHamiltonian& hamiltonian,
                             const Eigen::VectorXcd& state,
                             double time) const override {
    PYBIND11_OVERRIDE_PURE(Eigen::VectorXcd, TimeEvolution, _run_impl,
                           hamiltonian, state, time);
  }
};

void bind_time_evolution(py::module& m) {
  py::class_<TimeEvolution, TimeEvolutionBase, py::smart_holder> evolution(
      m, "TimeEvolution", R"(
Abstract base class of state evolution under a SymbolicHamiltonian.

Implementations compute exp(-i t H) |psi>, exactly or approximately.

Examples:
    >>> evolution = TimeEvolutionFactory.create("trotter")
    >>> evolution.settings().set("time_step", 0.05)
    >>> psi_t = evolution.run(hamiltonian, psi_0, 1.0)

    >>> # Custom implementations subclass TimeEvolution
    >>> class Identity(TimeEvolution):
    ...     def name(self):
    ...         return "identity"
    ...     def _run_impl(self, hamiltonian, state, time):
    ...         return state
)");

  evolution.def(py::init<>());

  evolution.def("run", &TimeEvolution::run, py::arg("hamiltonian"),
                py::arg("state"), py::arg("time"),
                R"(
Evolve a state vector.

Locks the settings before running.

Args:
    hamiltonian (qterm.data.SymbolicHamiltonian): Generator of the evolution
    state (numpy.ndarray): Initial state of dimension 2^n
    time (float): Total evolution time

Returns:
    numpy.ndarray: The evolved state

Raises:
    ValueError: If the time is negative or the state does not match the
        register
)");

  evolution.def(
      "settings",
      [](TimeEvolution& self) -> Settings& { return self.settings(); },
      py::return_value_policy::reference_internal,
      "The algorithm's settings, locked once run() has been called.");

  evolution.def_property(
      "_settings",
      [](TimeEvolutionBase& self) -> Settings& { return self.settings(); },
      [](TimeEvolutionBase& self, std::unique_ptr<Settings> new_settings) {
        self.replace_settings(std::move(new_settings));
      },
      py::return_value_policy::reference_internal,
      "Settings object, replaceable from a subclass constructor.");

  evolution.def("name", &TimeEvolution::name);
  evolution.def("aliases", &TimeEvolution::aliases);
  evolution.def("type_name", &TimeEvolution::type_name);

  qterm::python::bind_algorithm_factory<TimeEvolutionFactory, TimeEvolution,
                                        TimeEvolutionBase>(
      m, "TimeEvolutionFactory");

  evolution.def("__repr__", [](const TimeEvolution& self) {
    return "<qterm.algorithms.TimeEvolution '" + self.name() + "'>";
  });
}
