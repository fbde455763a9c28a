// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <pybind11/complex.h>
#include <pybind11/eigen.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <optional>
#include <qterm/data/hamiltonian.hpp>

namespace py = pybind11;

void bind_hamiltonian(py::module& data) {
  using namespace qterm::data;

  py::class_<SymbolicHamiltonian, py::smart_holder> hamiltonian(
      data, "SymbolicHamiltonian", R"(
Sum of product terms over a qubit register.

Every term added is tagged with the Hamiltonian's id.

Examples:
    >>> h = SymbolicHamiltonian(2)
    >>> h.add_term(-1.0, [Symbol.Z(0), Symbol.Z(1)])
    >>> h.add_term(-0.5, [Symbol.X(0)])
    >>> h.dense_matrix().shape
    (4, 4)
)");

  hamiltonian.def(py::init<std::optional<std::size_t>>(),
                  py::arg("num_qubits") = py::none(),
                  R"(
Create an empty Hamiltonian.

Args:
    num_qubits (int | None): Register size; inferred from the terms if None
)");
  hamiltonian.def_property_readonly("id", &SymbolicHamiltonian::get_id);
  hamiltonian.def_property_readonly("num_qubits",
                                    &SymbolicHamiltonian::get_num_qubits);
  hamiltonian.def_property_readonly("terms", &SymbolicHamiltonian::get_terms);

  hamiltonian.def(
      "add_term",
      [](SymbolicHamiltonian& self, std::complex<double> coefficient,
         const std::vector<SymbolicFactor>& factors,
         const std::optional<SymbolMap>& symbol_map) {
        return self.add_term(coefficient, factors,
                             symbol_map ? &*symbol_map : nullptr);
      },
      py::arg("coefficient"), py::arg("factors"),
      py::arg("symbol_map") = py::none(),
      R"(
Parse a product of factors and add it as a term.

Returns:
    SymbolicTerm: The added term

Raises:
    ValueError: If the product cannot be parsed or acts outside the register
)");
  hamiltonian.def(
      "add_term",
      [](SymbolicHamiltonian& self, std::shared_ptr<Term> term) {
        self.add_term(std::move(term));
      },
      py::arg("term"));

  // Copied out: add_term drops the cached groups
  hamiltonian.def("term_groups", &SymbolicHamiltonian::get_term_groups,
                  py::return_value_policy::copy);
  hamiltonian.def("dense_matrix", &SymbolicHamiltonian::dense_matrix);
  hamiltonian.def("apply", &SymbolicHamiltonian::apply, py::arg("state"),
                  py::arg("density_matrix") = false);
  hamiltonian.def("expectation", &SymbolicHamiltonian::expectation,
                  py::arg("state"));
  hamiltonian.def("get_summary", &SymbolicHamiltonian::get_summary);
  hamiltonian.def("__repr__", &SymbolicHamiltonian::get_summary);
}
