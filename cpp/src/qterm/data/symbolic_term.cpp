// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <qterm/data/symbolic_term.hpp>
#include <qterm/utils/logger.hpp>
#include <qterm/utils/tensor_utils.hpp>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace qterm::data {

namespace {

const std::complex<double> kI(0.0, 1.0);

/// Accumulates the parts of a product expression while it is parsed
struct FactorParser {
  const SymbolMap* symbol_map;
  std::complex<double> coefficient;
  std::vector<Symbol> factors;
  SymbolicTerm::MatrixMap matrix_map;

  void add(const Symbol& symbol) {
    matrix_map[symbol.get_target_qubit()].push_back(symbol.get_matrix());
    factors.push_back(symbol);
  }

  void add(const ScalarSymbol& scalar) { coefficient *= scalar.value; }

  void add(const ImaginaryUnit&) { coefficient *= kI; }

  void add(const NamedSymbol& named) {
    if (symbol_map == nullptr) {
      throw std::invalid_argument("Cannot resolve symbol '" + named.name +
                                  "' without a symbol map");
    }
    auto it = symbol_map->find(named.name);
    if (it == symbol_map->end()) {
      throw std::invalid_argument("Symbol '" + named.name +
                                  "' is not present in the symbol map");
    }
    const auto& [qubit, matrix] = it->second;
    if (matrix.rows() == 1 && matrix.cols() == 1) {
      coefficient *= matrix(0, 0);
    } else if (matrix.rows() == 2 && matrix.cols() == 2) {
      add(Symbol(qubit, Eigen::Matrix2cd(matrix), named.name));
    } else {
      throw std::invalid_argument(
          "Symbol '" + named.name + "' maps to a matrix of shape (" +
          std::to_string(matrix.rows()) + ", " +
          std::to_string(matrix.cols()) +
          "); only single-qubit operators and scalars are supported");
    }
  }

  void add(const Power& power) {
    if (power.exponent < 0) {
      throw std::invalid_argument("Negative exponent " +
                                  std::to_string(power.exponent) +
                                  " in symbolic product");
    }
    for (std::int64_t i = 0; i < power.exponent; ++i) {
      std::visit([this](const auto& base) { add(base); }, power.base);
    }
  }
};

}  // namespace

SymbolicTerm::SymbolicTerm(std::complex<double> coefficient,
                           std::vector<Symbol> factors, MatrixMap matrix_map)
    : SymbolicTerm(
          SharedStorage{}, coefficient,
          std::make_shared<const std::vector<Symbol>>(std::move(factors)),
          std::make_shared<const MatrixMap>(std::move(matrix_map))) {
  for (const auto& [qubit, matrices] : *_matrix_map) {
    if (matrices.empty()) {
      throw std::invalid_argument("No matrices recorded for qubit " +
                                  std::to_string(qubit));
    }
  }
  for (const auto& factor : *_factors) {
    if (_matrix_map->find(factor.get_target_qubit()) == _matrix_map->end()) {
      throw std::invalid_argument("Factor " + factor.get_name() +
                                  " acts on qubit " +
                                  std::to_string(factor.get_target_qubit()) +
                                  " which has no recorded matrices");
    }
  }
}

SymbolicTerm::SymbolicTerm(SharedStorage, std::complex<double> coefficient,
                           std::shared_ptr<const std::vector<Symbol>> factors,
                           std::shared_ptr<const MatrixMap> matrix_map)
    : Term(qubits_of(*matrix_map)),
      _coefficient(coefficient),
      _factors(std::move(factors)),
      _matrix_map(std::move(matrix_map)) {}

std::vector<std::uint64_t> SymbolicTerm::qubits_of(
    const MatrixMap& matrix_map) {
  std::vector<std::uint64_t> qubits;
  qubits.reserve(matrix_map.size());
  for (const auto& entry : matrix_map) {
    qubits.push_back(entry.first);
  }
  return qubits;
}

std::shared_ptr<SymbolicTerm> SymbolicTerm::from_factors(
    std::complex<double> coefficient,
    const std::vector<SymbolicFactor>& factors, const SymbolMap* symbol_map) {
  QTERM_LOG_TRACE_ENTERING();
  FactorParser parser{symbol_map, coefficient, {}, {}};
  for (const auto& factor : factors) {
    std::visit([&parser](const auto& f) { parser.add(f); }, factor);
  }
  return std::make_shared<SymbolicTerm>(parser.coefficient,
                                        std::move(parser.factors),
                                        std::move(parser.matrix_map));
}

Eigen::MatrixXcd SymbolicTerm::compute_matrix() const {
  Eigen::MatrixXcd result = Eigen::MatrixXcd::Constant(1, 1, _coefficient);
  // std::map iterates in ascending qubit order
  for (const auto& [qubit, matrices] : *_matrix_map) {
    Eigen::Matrix2cd product = matrices.front();
    for (std::size_t i = 1; i < matrices.size(); ++i) {
      product = product * matrices[i];
    }
    result = utils::kron(result, Eigen::MatrixXcd(product));
  }
  return result;
}

std::shared_ptr<Term> SymbolicTerm::scale(std::complex<double> x) const {
  auto scaled = std::make_shared<SymbolicTerm>(
      SharedStorage{}, _coefficient * x, _factors, _matrix_map);
  if (_matrix) {
    scaled->_matrix = x * (*_matrix);
  }
  scaled->_hamiltonian = _hamiltonian;
  return scaled;
}

Eigen::MatrixXcd SymbolicTerm::operator()(const Eigen::MatrixXcd& state,
                                          bool density_matrix) const {
  Eigen::MatrixXcd result = state;
  for (const auto& factor : *_factors) {
    auto gate = factor.get_gate();
    gate->set_density_matrix(density_matrix);
    result = (*gate)(result);
  }
  return _coefficient * result;
}

}  // namespace qterm::data
