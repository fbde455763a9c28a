// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <Eigen/Dense>
#include <complex>
#include <cstdint>
#include <map>
#include <memory>
#include <qterm/data/symbols.hpp>
#include <qterm/data/term.hpp>
#include <vector>

namespace qterm::data {

/**
 * @class SymbolicTerm
 * @brief A product of single-qubit symbols times a complex coefficient
 *
 * The dense matrix is only built when first requested. Factors acting on the
 * same qubit are composed by matrix multiplication in the order they appear
 * in the product; different qubits are combined by tensor product in
 * ascending qubit order, so the target qubits of a SymbolicTerm are always
 * sorted.
 *
 * Example:
 * @code
 * // 0.5 * X(0) * X(1)
 * auto term = SymbolicTerm::from_factors(
 *     0.5, {Symbol::X(0), Symbol::X(1)});
 * term->get_matrix();  // 0.5 * kron(X, X)
 * @endcode
 */
class SymbolicTerm : public Term {
  /// Restricts the storage-sharing constructor to members
  struct SharedStorage {
    explicit SharedStorage() = default;
  };

 public:
  /// Ordered single-qubit matrices of each qubit, keyed by qubit
  using MatrixMap = std::map<std::uint64_t, std::vector<Eigen::Matrix2cd>>;

  /**
   * @brief Construct from already parsed parts
   * @param coefficient Scalar multiplying the product
   * @param factors Operator symbols in product order
   * @param matrix_map Per-qubit matrices in product order
   * @throws std::invalid_argument if a factor acts on a qubit missing from
   * @p matrix_map or a qubit has no matrices
   */
  explicit SymbolicTerm(std::complex<double> coefficient,
                        std::vector<Symbol> factors = {},
                        MatrixMap matrix_map = {});

  /**
   * @brief Parse an ordered product expression
   *
   * Powers are expanded into repeated factors. Operator symbols contribute
   * qubit support; scalar symbols and the imaginary unit are folded into the
   * coefficient. An empty factor list gives a pure scalar term.
   *
   * @param coefficient Numeric coefficient of the product
   * @param factors Factors in product order
   * @param symbol_map Resolution of NamedSymbol factors
   * @return The parsed term
   * @throws std::invalid_argument for a named symbol that cannot be resolved,
   * a negative exponent or a symbol map entry whose matrix is neither 1x1
   * nor 2x2
   */
  static std::shared_ptr<SymbolicTerm> from_factors(
      std::complex<double> coefficient,
      const std::vector<SymbolicFactor>& factors,
      const SymbolMap* symbol_map = nullptr);

  /// Share already validated factor storage; used by scale()
  SymbolicTerm(SharedStorage, std::complex<double> coefficient,
               std::shared_ptr<const std::vector<Symbol>> factors,
               std::shared_ptr<const MatrixMap> matrix_map);

  std::complex<double> get_coefficient() const { return _coefficient; }
  const std::vector<Symbol>& get_factors() const { return *_factors; }
  const MatrixMap& get_matrix_map() const { return *_matrix_map; }

  /**
   * @brief Term with the coefficient multiplied by @p x
   *
   * The factor list and matrix map are shared with this term. A matrix that
   * was already materialized is carried over rescaled; the cached gate is
   * not.
   */
  std::shared_ptr<Term> scale(std::complex<double> x) const override;

  /**
   * @brief Apply each factor gate in product order, then the coefficient
   */
  Eigen::MatrixXcd operator()(const Eigen::MatrixXcd& state,
                              bool density_matrix = false) const override;

 protected:
  Eigen::MatrixXcd compute_matrix() const override;

 private:
  static std::vector<std::uint64_t> qubits_of(const MatrixMap& matrix_map);

  std::complex<double> _coefficient;
  std::shared_ptr<const std::vector<Symbol>> _factors;
  std::shared_ptr<const MatrixMap> _matrix_map;
};

}  // namespace qterm::data
