// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <qterm/gates/unitary.hpp>
#include <qterm/utils/logger.hpp>
#include <qterm/utils/tensor_utils.hpp>
#include <set>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace qterm::gates {

Unitary::Unitary(Eigen::MatrixXcd matrix, std::vector<std::uint64_t> qubits)
    : matrix_(std::move(matrix)), qubits_(std::move(qubits)) {
  const Eigen::Index dim = Eigen::Index(1) << qubits_.size();
  if (matrix_.rows() != dim || matrix_.cols() != dim) {
    throw std::invalid_argument(
        "Gate matrix of shape (" + std::to_string(matrix_.rows()) + ", " +
        std::to_string(matrix_.cols()) + ") does not match " +
        std::to_string(qubits_.size()) + " target qubits");
  }
  std::set<std::uint64_t> unique(qubits_.begin(), qubits_.end());
  if (unique.size() != qubits_.size()) {
    throw std::invalid_argument("Gate target qubits must be distinct");
  }
}

Eigen::MatrixXcd Unitary::apply(const Eigen::MatrixXcd& state) const {
  QTERM_LOG_TRACE_ENTERING();
  if (state.cols() != 1) {
    throw std::invalid_argument(
        "State vector must be a single column, got " +
        std::to_string(state.cols()) + " columns");
  }
  return utils::apply_to_qubits(matrix_, qubits_, state);
}

Eigen::MatrixXcd Unitary::density_matrix_half_call(
    const Eigen::MatrixXcd& rho) const {
  QTERM_LOG_TRACE_ENTERING();
  if (rho.rows() != rho.cols()) {
    throw std::invalid_argument("Density matrix must be square");
  }
  return utils::apply_to_qubits(matrix_, qubits_, rho);
}

Eigen::MatrixXcd Unitary::operator()(const Eigen::MatrixXcd& state) const {
  if (density_matrix_) {
    return density_matrix_half_call(state);
  }
  return apply(state);
}

std::string Unitary::to_string() const {
  std::ostringstream oss;
  oss << "Unitary(";
  for (std::size_t i = 0; i < qubits_.size(); ++i) {
    if (i > 0) oss << ", ";
    oss << qubits_[i];
  }
  oss << ")";
  return oss.str();
}

}  // namespace qterm::gates
