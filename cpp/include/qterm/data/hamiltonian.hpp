// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <Eigen/Dense>
#include <complex>
#include <cstdint>
#include <memory>
#include <optional>
#include <qterm/data/symbolic_term.hpp>
#include <qterm/data/symbols.hpp>
#include <qterm/data/term.hpp>
#include <qterm/data/term_group.hpp>
#include <string>
#include <vector>

namespace qterm::data {

/**
 * @class SymbolicHamiltonian
 * @brief A Hamiltonian given as a sum of product terms
 *
 * Every term added to the Hamiltonian is tagged with the Hamiltonian's id so
 * that grouped terms can later be rescaled per Hamiltonian through
 * TermGroup::to_term.
 *
 * Example:
 * @code
 * // H = -Z0 Z1 - 0.5 (X0 + X1)
 * SymbolicHamiltonian h(2);
 * h.add_term(-1.0, {Symbol::Z(0), Symbol::Z(1)});
 * h.add_term(-0.5, {Symbol::X(0)});
 * h.add_term(-0.5, {Symbol::X(1)});
 * Eigen::MatrixXcd dense = h.dense_matrix();
 * @endcode
 */
class SymbolicHamiltonian {
 public:
  /**
   * @brief Construct an empty Hamiltonian
   * @param num_qubits Size of the register; if unset it is inferred from the
   * largest target qubit of the terms
   */
  explicit SymbolicHamiltonian(
      std::optional<std::size_t> num_qubits = std::nullopt);

  /// Process-unique id carried by the terms of this Hamiltonian
  HamiltonianId get_id() const { return _id; }

  /**
   * @brief Parse a product expression and add it as a term
   * @return The added term
   * @throws std::invalid_argument if the product cannot be parsed or acts
   * outside the register
   */
  std::shared_ptr<SymbolicTerm> add_term(
      std::complex<double> coefficient,
      const std::vector<SymbolicFactor>& factors,
      const SymbolMap* symbol_map = nullptr);

  /**
   * @brief Add an already built term
   *
   * The term is tagged with this Hamiltonian's id.
   *
   * @throws std::invalid_argument if @p term is null or acts outside the
   * register
   */
  void add_term(std::shared_ptr<Term> term);

  std::size_t get_num_qubits() const;

  const std::vector<std::shared_ptr<Term>>& get_terms() const {
    return _terms;
  }

  /**
   * @brief Terms grouped with TermGroup::from_terms, cached until the next
   * add_term
   */
  const std::vector<TermGroup>& get_term_groups() const;

  /**
   * @brief Full 2^n x 2^n matrix of the Hamiltonian
   */
  Eigen::MatrixXcd dense_matrix() const;

  /**
   * @brief Sum of every term applied to @p state
   * @param state State vector or, if @p density_matrix, a density matrix
   * @param density_matrix Apply each term to the ket side of a density matrix
   */
  Eigen::MatrixXcd apply(const Eigen::MatrixXcd& state,
                         bool density_matrix = false) const;

  /**
   * @brief <psi|H|psi> for a state vector
   * @throws std::invalid_argument if @p state does not span the register
   */
  std::complex<double> expectation(const Eigen::VectorXcd& state) const;

  std::string get_summary() const;

 private:
  static HamiltonianId next_id();
  void check_support(const Term& term) const;

  HamiltonianId _id;
  std::optional<std::size_t> _num_qubits;
  std::vector<std::shared_ptr<Term>> _terms;
  mutable std::optional<std::vector<TermGroup>> _groups;
};

}  // namespace qterm::data
