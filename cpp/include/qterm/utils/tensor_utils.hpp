// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <Eigen/Dense>
#include <cstdint>
#include <vector>

namespace qterm::utils {

/**
 * @file tensor_utils.hpp
 * @brief Dense tensor primitives on qubit operators
 *
 * Operators on k qubits are stored as 2^k x 2^k matrices. Tensor axis i
 * corresponds to bit (k - 1 - i) of the row/column index, i.e. the first
 * qubit of an operator is the most significant bit.
 */

/**
 * @brief Kronecker (tensor) product of two matrices
 */
Eigen::MatrixXcd kron(const Eigen::MatrixXcd& a, const Eigen::MatrixXcd& b);

/**
 * @brief Number of qubits spanned by a dimension
 * @param dimension Size of the vector space, must be a power of two
 * @return log2(dimension)
 * @throws std::invalid_argument if dimension is not a positive power of two
 */
std::size_t num_qubits_from_dimension(Eigen::Index dimension);

/**
 * @brief Permute the qubit axes of a k-qubit operator
 *
 * Unflattens the 2^k x 2^k matrix into a rank-2k tensor with one row leg and
 * one column leg per qubit, transposes the row legs by @p order (and the
 * column legs by the same order shifted by k), and flattens back. Axis i of
 * the result is axis order[i] of the input.
 *
 * @param matrix Square operator of dimension 2^k
 * @param order Permutation of {0, ..., k-1}
 * @return The permuted operator
 * @throws std::invalid_argument if @p order is not a permutation of the
 * operator's axes
 */
Eigen::MatrixXcd permute_qubit_axes(const Eigen::MatrixXcd& matrix,
                                    const std::vector<std::size_t>& order);

/**
 * @brief Apply an operator to a subset of qubits of a register
 *
 * Every column of @p state is treated as a 2^n amplitude vector (qubit 0 is
 * the most significant bit of the basis index) and is multiplied by
 * @p op acting on @p qubits, identity elsewhere. Passing a density matrix
 * therefore applies the operator to its row (ket) indices only.
 *
 * @param op Operator of dimension 2^k
 * @param qubits Target qubits, k distinct indices; qubits[i] is axis i of op
 * @param state Matrix with 2^n rows
 * @return The transformed state
 * @throws std::invalid_argument on dimension mismatch or out-of-range qubits
 */
Eigen::MatrixXcd apply_to_qubits(const Eigen::MatrixXcd& op,
                                 const std::vector<std::uint64_t>& qubits,
                                 const Eigen::MatrixXcd& state);

}  // namespace qterm::utils
