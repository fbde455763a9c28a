// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include "trotter.hpp"

#include <cmath>
#include <memory>
#include <qterm/utils/logger.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace qterm::algorithms::builtin {

Eigen::VectorXcd TrotterEvolution::_run_impl(
    const data::SymbolicHamiltonian& hamiltonian,
    const Eigen::VectorXcd& state, double time) const {
  QTERM_LOG_TRACE_ENTERING();
  validate_input(hamiltonian, state, time);
  if (time == 0.0) {
    return state;
  }

  const double time_step = _settings->get<double>("time_step");
  const int64_t order = _settings->get<int64_t>("order");
  const double steps = std::ceil(time / time_step);
  if (!std::isfinite(steps) || steps > static_cast<double>(MAX_STEPS)) {
    throw std::invalid_argument(
        "Trotter evolution over time " + std::to_string(time) +
        " with time_step " + std::to_string(time_step) + " needs more than " +
        std::to_string(MAX_STEPS) + " steps");
  }
  const auto num_steps = static_cast<std::size_t>(steps);
  const double dt = time / static_cast<double>(num_steps);

  const auto& groups = hamiltonian.get_term_groups();
  QTERM_LOGGER().info(
      "Trotter evolution: {} steps of dt = {} (order {}) over {} term groups",
      num_steps, dt, order, groups.size());

  const double gate_dt = order == 1 ? dt : 0.5 * dt;
  std::vector<std::shared_ptr<gates::Unitary>> step_gates;
  step_gates.reserve(groups.size());
  for (const auto& group : groups) {
    step_gates.push_back(group.term()->exponential_gate(gate_dt));
  }

  Eigen::MatrixXcd current = state;
  for (std::size_t step = 0; step < num_steps; ++step) {
    for (const auto& gate : step_gates) {
      current = gate->apply(current);
    }
    if (order == 2) {
      for (auto it = step_gates.rbegin(); it != step_gates.rend(); ++it) {
        current = (*it)->apply(current);
      }
    }
    QTERM_LOGGER().debug("Trotter step {}/{} done", step + 1, num_steps);
  }
  return current.col(0);
}

}  // namespace qterm::algorithms::builtin
