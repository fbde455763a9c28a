// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include "exact.hpp"

#include <complex>
#include <qterm/utils/logger.hpp>
#include <unsupported/Eigen/MatrixFunctions>

namespace qterm::algorithms::builtin {

Eigen::VectorXcd ExactEvolution::_run_impl(
    const data::SymbolicHamiltonian& hamiltonian,
    const Eigen::VectorXcd& state, double time) const {
  QTERM_LOG_TRACE_ENTERING();
  validate_input(hamiltonian, state, time);
  if (time == 0.0) {
    return state;
  }

  const Eigen::MatrixXcd generator =
      std::complex<double>(0.0, -time) * hamiltonian.dense_matrix();
  QTERM_LOGGER().info("Exact evolution: exponentiating a {}x{} Hamiltonian",
                      generator.rows(), generator.cols());
  const Eigen::MatrixXcd propagator = generator.exp();
  return propagator * state;
}

}  // namespace qterm::algorithms::builtin
