// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <Eigen/Dense>
#include <complex>
#include <cstdint>
#include <memory>
#include <qterm/gates/unitary.hpp>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>

namespace qterm::data {

/**
 * @class Symbol
 * @brief A single-qubit operator appearing as a factor of a product term
 *
 * Carries the 2x2 matrix of the operator, the qubit it acts on and a display
 * name. The single-qubit gate built from the symbol is cached and shared by
 * copies made after its construction.
 */
class Symbol {
 public:
  Symbol(std::uint64_t target_qubit, const Eigen::Matrix2cd& matrix,
         std::string name);

  /// Pauli X on @p qubit, named "X<qubit>"
  static Symbol X(std::uint64_t qubit);
  /// Pauli Y on @p qubit, named "Y<qubit>"
  static Symbol Y(std::uint64_t qubit);
  /// Pauli Z on @p qubit, named "Z<qubit>"
  static Symbol Z(std::uint64_t qubit);
  /// Identity on @p qubit, named "I<qubit>"
  static Symbol I(std::uint64_t qubit);

  const std::string& get_name() const { return _name; }
  std::uint64_t get_target_qubit() const { return _target_qubit; }
  const Eigen::Matrix2cd& get_matrix() const { return _matrix; }

  /**
   * @brief Single-qubit gate applying the symbol's matrix
   */
  std::shared_ptr<gates::Unitary> get_gate() const;

 private:
  std::uint64_t _target_qubit;
  Eigen::Matrix2cd _matrix;
  std::string _name;
  mutable std::shared_ptr<gates::Unitary> _gate;
};

/// A named factor with a numeric value; contributes to the coefficient only
struct ScalarSymbol {
  std::string name;
  std::complex<double> value;
};

/// A factor known only by name, resolved through a SymbolMap
struct NamedSymbol {
  std::string name;
};

/// The literal imaginary unit i
struct ImaginaryUnit {};

using PowerBase = std::variant<Symbol, ScalarSymbol, NamedSymbol, ImaginaryUnit>;

/// A factor raised to a non-negative integer power
struct Power {
  PowerBase base;
  std::int64_t exponent;
};

/**
 * @brief One factor of an ordered product expression
 */
using SymbolicFactor =
    std::variant<Symbol, ScalarSymbol, NamedSymbol, ImaginaryUnit, Power>;

/**
 * @brief Resolution of named symbols to (target qubit, matrix)
 *
 * A 2x2 matrix makes the symbol a single-qubit operator; a 1x1 matrix makes it
 * a scalar whose value multiplies the coefficient.
 */
using SymbolMap =
    std::unordered_map<std::string, std::pair<std::uint64_t, Eigen::MatrixXcd>>;

}  // namespace qterm::data
