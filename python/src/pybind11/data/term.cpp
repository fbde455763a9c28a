// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <pybind11/complex.h>
#include <pybind11/eigen.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <optional>
#include <qterm/data/symbolic_term.hpp>
#include <qterm/data/term.hpp>

#include "path_utils.hpp"

namespace py = pybind11;

namespace {

using qterm::data::Term;

void term_to_file_wrapper(const Term& self, const py::object& filename,
                          const std::string& type) {
  self.to_file(qterm::python::utils::to_string_path(filename), type);
}

std::shared_ptr<Term> term_from_file_wrapper(const py::object& filename,
                                             const std::string& type) {
  return Term::from_file(qterm::python::utils::to_string_path(filename), type);
}

}  // namespace

void bind_term(py::module& data) {
  using namespace qterm::data;

  py::class_<Term, py::smart_holder> term(data, "Term", R"(
Dense operator on an ordered list of target qubits.

The matrix has dimension 2^k for k target qubits, and axis i of the matrix acts
on ``target_qubits[i]``. A term with no target qubits is a scalar.

Examples:
    >>> import numpy as np
    >>> zz = Term(np.diag([1, -1, -1, 1]).astype(complex), [0, 1])
    >>> x1 = Term(np.array([[0, 1], [1, 0]], dtype=complex), [1])
    >>> merged = zz.merge(x1)
)");

  term.def(py::init<Eigen::MatrixXcd, std::vector<std::uint64_t>>(),
           py::arg("matrix"), py::arg("target_qubits"),
           R"(
Create a term from a dense matrix.

Raises:
    ValueError: If the matrix is not 2^k x 2^k for k target qubits, or the
        target qubits contain duplicates
)");
  term.def(py::init<std::complex<double>>(), py::arg("scalar"),
           "Create a scalar term acting on no qubits.");

  term.def_property_readonly(
      "matrix", [](const Term& self) { return self.get_matrix(); });
  term.def_property_readonly("target_qubits", &Term::get_target_qubits);
  // Tags are assigned by SymbolicHamiltonian.add_term only
  term.def_property_readonly(
      "hamiltonian", &Term::get_hamiltonian,
      "Id of the Hamiltonian the term belongs to, or None.");
  term.def("__len__", &Term::size);

  term.def("exponential", &Term::exponential, py::arg("dt"),
           R"(
Compute exp(-i dt M) for the term matrix M.

Args:
    dt (float): Time step

Returns:
    numpy.ndarray: The matrix exponential
)");
  term.def("exponential_gate", &Term::exponential_gate, py::arg("dt"));
  term.def("as_gate", &Term::as_gate);
  term.def("scale", &Term::scale, py::arg("x"));
  term.def("merge", &Term::merge, py::arg("other"),
           R"(
Sum of this term and ``other`` on this term's target qubits.

Raises:
    ValueError: If ``other`` acts on a qubit outside this term's support
)");
  term.def("__call__", &Term::operator(), py::arg("state"),
           py::arg("density_matrix") = false);
  term.def("__mul__", [](const Term& self, std::complex<double> x) {
    return self.scale(x);
  });
  term.def("__rmul__", [](const Term& self, std::complex<double> x) {
    return self.scale(x);
  });

  term.def("get_summary", &Term::get_summary);
  term.def("to_json", [](const Term& self) { return self.to_json().dump(); });
  term.def_static("from_json", [](const std::string& text) {
    return Term::from_json(nlohmann::json::parse(text));
  });
  term.def("to_file", term_to_file_wrapper, py::arg("filename"),
           py::arg("type"));
  term.def_static("from_file", term_from_file_wrapper, py::arg("filename"),
                  py::arg("type"));
  term.def("__repr__", [](const Term& self) { return self.get_summary(); });

  py::class_<SymbolicTerm, Term, py::smart_holder> symbolic(
      data, "SymbolicTerm", R"(
Product of a complex coefficient and single-qubit symbols.

The dense matrix is only built when requested. Applying the term to a state
applies each factor as a single-qubit gate.

Examples:
    >>> t = SymbolicTerm.from_factors(-1.0, [Symbol.Z(0), Symbol.Z(1)])
    >>> t.coefficient
    (-1+0j)
)");

  symbolic.def(py::init<std::complex<double>, std::vector<Symbol>,
                        SymbolicTerm::MatrixMap>(),
               py::arg("coefficient"), py::arg("factors") = std::vector<Symbol>{},
               py::arg("matrix_map") = SymbolicTerm::MatrixMap{});
  symbolic.def_static(
      "from_factors",
      [](std::complex<double> coefficient,
         const std::vector<SymbolicFactor>& factors,
         const std::optional<SymbolMap>& symbol_map) {
        return SymbolicTerm::from_factors(
            coefficient, factors, symbol_map ? &*symbol_map : nullptr);
      },
      py::arg("coefficient"), py::arg("factors"),
      py::arg("symbol_map") = py::none(),
      R"(
Parse a product of factors.

Args:
    coefficient (complex): Leading coefficient
    factors (list): Symbol, ScalarSymbol, NamedSymbol, ImaginaryUnit or Power
    symbol_map (dict | None): Resolves NamedSymbol names to
        ``(qubit, matrix)`` pairs; a 1x1 matrix is a scalar

Raises:
    ValueError: If a factor cannot be resolved
)");
  symbolic.def_property_readonly("coefficient", &SymbolicTerm::get_coefficient);
  symbolic.def_property_readonly("factors", &SymbolicTerm::get_factors);
  symbolic.def_property_readonly("matrix_map", &SymbolicTerm::get_matrix_map);
}
