// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <pybind11/complex.h>
#include <pybind11/eigen.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <qterm/data/symbols.hpp>
#include <qterm/gates/unitary.hpp>

namespace py = pybind11;

void bind_gates(py::module& data) {
  using qterm::gates::Unitary;

  py::class_<Unitary, py::smart_holder> unitary(data, "Unitary", R"(
Dense operator acting on a list of target qubits.

Qubit 0 is the most significant bit of a state index. Axis i of the matrix
acts on ``target_qubits[i]``.

Examples:
    >>> import numpy as np
    >>> x = Unitary(np.array([[0, 1], [1, 0]], dtype=complex), [0])
    >>> x.apply(np.array([1, 0, 0, 0], dtype=complex))
)");

  unitary.def(py::init<Eigen::MatrixXcd, std::vector<std::uint64_t>>(),
              py::arg("matrix"), py::arg("target_qubits"));
  unitary.def_property_readonly("matrix", &Unitary::get_matrix);
  unitary.def_property_readonly("target_qubits", &Unitary::get_target_qubits);
  unitary.def_property("density_matrix", &Unitary::is_density_matrix,
                       &Unitary::set_density_matrix);
  unitary.def("apply", &Unitary::apply, py::arg("state"),
              R"(
Apply the gate to a state vector.

Args:
    state (numpy.ndarray): Amplitudes of dimension 2^n

Returns:
    numpy.ndarray: The transformed state

Raises:
    ValueError: If the state does not match the target qubits
)");
  unitary.def("density_matrix_half_call", &Unitary::density_matrix_half_call,
              py::arg("rho"));
  unitary.def("__call__", &Unitary::operator(), py::arg("state"));
  unitary.def("__len__", &Unitary::size);
  unitary.def("__repr__", &Unitary::to_string);
}

void bind_symbols(py::module& data) {
  using namespace qterm::data;

  py::class_<Symbol>(data, "Symbol", R"(
Named single-qubit matrix acting on one qubit.

Examples:
    >>> z0 = Symbol.Z(0)
    >>> z0.name
    'Z0'
)")
      .def(py::init([](std::uint64_t qubit, const Eigen::Matrix2cd& matrix,
                       std::string name) {
             return Symbol(qubit, matrix, std::move(name));
           }),
           py::arg("target_qubit"), py::arg("matrix"), py::arg("name"))
      .def_static("X", &Symbol::X, py::arg("qubit"))
      .def_static("Y", &Symbol::Y, py::arg("qubit"))
      .def_static("Z", &Symbol::Z, py::arg("qubit"))
      .def_static("I", &Symbol::I, py::arg("qubit"))
      .def_property_readonly("name", &Symbol::get_name)
      .def_property_readonly("target_qubit", &Symbol::get_target_qubit)
      .def_property_readonly("matrix", &Symbol::get_matrix)
      .def("gate", &Symbol::get_gate)
      .def("__repr__", [](const Symbol& s) { return s.get_name(); });

  py::class_<ScalarSymbol>(data, "ScalarSymbol")
      .def(py::init([](std::string name, std::complex<double> value) {
             return ScalarSymbol{std::move(name), value};
           }),
           py::arg("name"), py::arg("value"))
      .def_readonly("name", &ScalarSymbol::name)
      .def_readonly("value", &ScalarSymbol::value);

  py::class_<NamedSymbol>(data, "NamedSymbol")
      .def(py::init([](std::string name) { return NamedSymbol{std::move(name)}; }),
           py::arg("name"))
      .def_readonly("name", &NamedSymbol::name);

  py::class_<ImaginaryUnit>(data, "ImaginaryUnit").def(py::init<>());

  py::class_<Power>(data, "Power", R"(
A factor raised to a non-negative integer power.

Examples:
    >>> Power(Symbol.X(0), 2)
)")
      .def(py::init([](PowerBase base, std::int64_t exponent) {
             return Power{std::move(base), exponent};
           }),
           py::arg("base"), py::arg("exponent"))
      .def_readonly("exponent", &Power::exponent);
}
