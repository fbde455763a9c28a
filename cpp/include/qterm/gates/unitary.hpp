// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <Eigen/Dense>
#include <cstdint>
#include <string>
#include <vector>

namespace qterm::gates {

/**
 * @brief A dense multi-qubit gate
 *
 * Holds a 2^k x 2^k matrix together with the ordered tuple of k qubits it acts
 * on; qubits[i] corresponds to tensor axis i of the matrix (axis 0 is the most
 * significant bit of the local basis index). Registers are indexed the same
 * way: qubit 0 is the most significant bit of the global basis index.
 *
 * The matrix is not checked for unitarity; Hamiltonian terms are applied
 * through the same mechanism.
 */
class Unitary {
 public:
  /**
   * @brief Construct a gate
   * @param matrix Operator of dimension 2^k
   * @param qubits k distinct target qubits
   * @throws std::invalid_argument if the matrix is not 2^k x 2^k or the qubits
   * are not distinct
   */
  Unitary(Eigen::MatrixXcd matrix, std::vector<std::uint64_t> qubits);

  const Eigen::MatrixXcd& get_matrix() const { return matrix_; }

  const std::vector<std::uint64_t>& get_target_qubits() const {
    return qubits_;
  }

  /// Number of target qubits
  std::size_t size() const { return qubits_.size(); }

  /**
   * @brief Whether the gate has been flagged for density-matrix simulation
   */
  bool is_density_matrix() const { return density_matrix_; }

  /**
   * @brief Flag the gate for density-matrix (or state-vector) simulation
   */
  void set_density_matrix(bool density_matrix) {
    density_matrix_ = density_matrix;
  }

  /**
   * @brief Apply the gate to a state vector
   * @param state Amplitudes of an n-qubit register as a single column
   * @return The new state vector
   * @throws std::invalid_argument if the state is not a single column of
   * power-of-two length or does not contain the target qubits
   */
  Eigen::MatrixXcd apply(const Eigen::MatrixXcd& state) const;

  /**
   * @brief Apply the gate to the ket side of a density matrix
   *
   * Computes U rho with U acting on the target qubits. Sandwiching rho
   * between U and U^dagger is left to the caller.
   *
   * @param rho Square 2^n x 2^n density matrix
   * @return U rho
   * @throws std::invalid_argument if rho is not square or of power-of-two
   * dimension
   */
  Eigen::MatrixXcd density_matrix_half_call(const Eigen::MatrixXcd& rho) const;

  /**
   * @brief Apply to a state vector or, when flagged, to a density matrix
   */
  Eigen::MatrixXcd operator()(const Eigen::MatrixXcd& state) const;

  std::string to_string() const;

 private:
  Eigen::MatrixXcd matrix_;
  std::vector<std::uint64_t> qubits_;
  bool density_matrix_ = false;
};

}  // namespace qterm::gates
