// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <algorithm>
#include <qterm/utils/tensor_utils.hpp>
#include <stdexcept>
#include <string>
#include <unsupported/Eigen/KroneckerProduct>

namespace qterm::utils {

namespace {

/// Source index of output index @p index under the axis permutation
inline Eigen::Index permuted_index(Eigen::Index index,
                                   const std::vector<std::size_t>& order) {
  const std::size_t k = order.size();
  Eigen::Index source = 0;
  for (std::size_t axis = 0; axis < k; ++axis) {
    const Eigen::Index bit = (index >> (k - 1 - axis)) & 1;
    source |= bit << (k - 1 - order[axis]);
  }
  return source;
}

}  // namespace

Eigen::MatrixXcd kron(const Eigen::MatrixXcd& a, const Eigen::MatrixXcd& b) {
  Eigen::MatrixXcd result = Eigen::kroneckerProduct(a, b);
  return result;
}

std::size_t num_qubits_from_dimension(Eigen::Index dimension) {
  if (dimension <= 0 || (dimension & (dimension - 1)) != 0) {
    throw std::invalid_argument("Dimension " + std::to_string(dimension) +
                                " is not a power of two");
  }
  std::size_t nqubits = 0;
  while ((Eigen::Index(1) << nqubits) < dimension) {
    ++nqubits;
  }
  return nqubits;
}

Eigen::MatrixXcd permute_qubit_axes(const Eigen::MatrixXcd& matrix,
                                    const std::vector<std::size_t>& order) {
  if (matrix.rows() != matrix.cols()) {
    throw std::invalid_argument("Operator must be square to permute its axes");
  }
  const std::size_t k = num_qubits_from_dimension(matrix.rows());
  if (order.size() != k) {
    throw std::invalid_argument(
        "Axis permutation has " + std::to_string(order.size()) +
        " entries but the operator has " + std::to_string(k) + " qubit axes");
  }
  std::vector<bool> seen(k, false);
  for (auto axis : order) {
    if (axis >= k || seen[axis]) {
      throw std::invalid_argument("Invalid qubit axis permutation");
    }
    seen[axis] = true;
  }

  const Eigen::Index dim = matrix.rows();
  std::vector<Eigen::Index> source(dim);
  for (Eigen::Index i = 0; i < dim; ++i) {
    source[i] = permuted_index(i, order);
  }

  Eigen::MatrixXcd result(dim, dim);
  for (Eigen::Index col = 0; col < dim; ++col) {
    for (Eigen::Index row = 0; row < dim; ++row) {
      result(row, col) = matrix(source[row], source[col]);
    }
  }
  return result;
}

Eigen::MatrixXcd apply_to_qubits(const Eigen::MatrixXcd& op,
                                 const std::vector<std::uint64_t>& qubits,
                                 const Eigen::MatrixXcd& state) {
  const std::size_t nqubits = num_qubits_from_dimension(state.rows());
  const std::size_t k = qubits.size();
  const Eigen::Index op_dim = Eigen::Index(1) << k;
  if (op.rows() != op_dim || op.cols() != op_dim) {
    throw std::invalid_argument(
        "Operator of dimension " + std::to_string(op.rows()) + "x" +
        std::to_string(op.cols()) + " cannot act on " + std::to_string(k) +
        " qubits");
  }

  // Bit position (from the least significant end) of each target qubit
  std::vector<std::size_t> target_bits(k);
  std::vector<bool> is_target(nqubits, false);
  for (std::size_t j = 0; j < k; ++j) {
    if (qubits[j] >= nqubits) {
      throw std::invalid_argument(
          "Target qubit " + std::to_string(qubits[j]) +
          " is out of range for a register of " + std::to_string(nqubits) +
          " qubits");
    }
    if (is_target[qubits[j]]) {
      throw std::invalid_argument("Duplicate target qubit " +
                                  std::to_string(qubits[j]));
    }
    is_target[qubits[j]] = true;
    target_bits[j] = nqubits - 1 - qubits[j];
  }
  std::vector<std::size_t> spectator_bits;
  spectator_bits.reserve(nqubits - k);
  for (std::size_t bit = 0; bit < nqubits; ++bit) {
    if (!is_target[nqubits - 1 - bit]) spectator_bits.push_back(bit);
  }

  // Offsets of the 2^k target configurations, axis 0 most significant
  std::vector<Eigen::Index> offsets(op_dim, 0);
  for (Eigen::Index t = 0; t < op_dim; ++t) {
    for (std::size_t j = 0; j < k; ++j) {
      if ((t >> (k - 1 - j)) & 1) {
        offsets[t] |= Eigen::Index(1) << target_bits[j];
      }
    }
  }

  Eigen::MatrixXcd result(state.rows(), state.cols());
  const Eigen::Index num_blocks = Eigen::Index(1) << (nqubits - k);
  Eigen::VectorXcd block(op_dim);
  for (Eigen::Index rest = 0; rest < num_blocks; ++rest) {
    Eigen::Index base = 0;
    for (std::size_t i = 0; i < spectator_bits.size(); ++i) {
      if ((rest >> i) & 1) base |= Eigen::Index(1) << spectator_bits[i];
    }
    for (Eigen::Index col = 0; col < state.cols(); ++col) {
      for (Eigen::Index t = 0; t < op_dim; ++t) {
        block(t) = state(base | offsets[t], col);
      }
      block = (op * block).eval();
      for (Eigen::Index t = 0; t < op_dim; ++t) {
        result(base | offsets[t], col) = block(t);
      }
    }
  }
  return result;
}

}  // namespace qterm::utils
