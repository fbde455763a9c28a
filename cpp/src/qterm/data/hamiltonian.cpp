// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <algorithm>
#include <atomic>
#include <numeric>
#include <qterm/data/hamiltonian.hpp>
#include <qterm/utils/logger.hpp>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace qterm::data {

SymbolicHamiltonian::SymbolicHamiltonian(std::optional<std::size_t> num_qubits)
    : _id(next_id()), _num_qubits(num_qubits) {}

HamiltonianId SymbolicHamiltonian::next_id() {
  static std::atomic<HamiltonianId> counter{0};
  return counter++;
}

void SymbolicHamiltonian::check_support(const Term& term) const {
  if (!_num_qubits) return;
  for (auto qubit : term.get_target_qubits()) {
    if (qubit >= *_num_qubits) {
      throw std::invalid_argument(
          "Term acts on qubit " + std::to_string(qubit) +
          " outside of a register of " + std::to_string(*_num_qubits) +
          " qubits");
    }
  }
}

std::shared_ptr<SymbolicTerm> SymbolicHamiltonian::add_term(
    std::complex<double> coefficient,
    const std::vector<SymbolicFactor>& factors, const SymbolMap* symbol_map) {
  auto term = SymbolicTerm::from_factors(coefficient, factors, symbol_map);
  add_term(term);
  return term;
}

void SymbolicHamiltonian::add_term(std::shared_ptr<Term> term) {
  if (!term) {
    throw std::invalid_argument("Cannot add a null term to a Hamiltonian");
  }
  check_support(*term);
  term->set_hamiltonian(_id);
  _terms.push_back(std::move(term));
  _groups.reset();
}

std::size_t SymbolicHamiltonian::get_num_qubits() const {
  if (_num_qubits) {
    return *_num_qubits;
  }
  std::size_t nqubits = 0;
  for (const auto& term : _terms) {
    for (auto qubit : term->get_target_qubits()) {
      nqubits = std::max<std::size_t>(nqubits, qubit + 1);
    }
  }
  return nqubits;
}

const std::vector<TermGroup>& SymbolicHamiltonian::get_term_groups() const {
  if (!_groups) {
    std::vector<std::shared_ptr<const Term>> terms(_terms.begin(),
                                                   _terms.end());
    _groups = TermGroup::from_terms(terms);
  }
  return *_groups;
}

Eigen::MatrixXcd SymbolicHamiltonian::dense_matrix() const {
  QTERM_LOG_TRACE_ENTERING();
  const std::size_t nqubits = get_num_qubits();
  const Eigen::Index dim = Eigen::Index(1) << nqubits;
  std::vector<std::uint64_t> register_qubits(nqubits);
  std::iota(register_qubits.begin(), register_qubits.end(), 0);

  auto total = std::make_shared<Term>(Eigen::MatrixXcd::Zero(dim, dim),
                                      std::move(register_qubits));
  for (const auto& term : _terms) {
    total = total->merge(*term);
  }
  return total->get_matrix();
}

Eigen::MatrixXcd SymbolicHamiltonian::apply(const Eigen::MatrixXcd& state,
                                            bool density_matrix) const {
  Eigen::MatrixXcd result = Eigen::MatrixXcd::Zero(state.rows(), state.cols());
  for (const auto& term : _terms) {
    result += (*term)(state, density_matrix);
  }
  return result;
}

std::complex<double> SymbolicHamiltonian::expectation(
    const Eigen::VectorXcd& state) const {
  const Eigen::Index dim = Eigen::Index(1) << get_num_qubits();
  if (state.size() != dim) {
    throw std::invalid_argument(
        "State of size " + std::to_string(state.size()) +
        " does not match a register of dimension " + std::to_string(dim));
  }
  Eigen::MatrixXcd h_state = apply(state);
  return state.dot(h_state.col(0));
}

std::string SymbolicHamiltonian::get_summary() const {
  std::ostringstream oss;
  oss << "SymbolicHamiltonian Summary:\n";
  oss << "  Id: " << _id << "\n";
  oss << "  Number of qubits: " << get_num_qubits() << "\n";
  oss << "  Number of terms: " << _terms.size() << "\n";
  if (_groups) {
    oss << "  Number of term groups: " << _groups->size() << "\n";
  }
  return oss.str();
}

}  // namespace qterm::data
