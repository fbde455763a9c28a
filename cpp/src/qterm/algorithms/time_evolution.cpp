// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <cmath>
#include <qterm/algorithms/time_evolution.hpp>
#include <stdexcept>
#include <string>

#include "builtin/exact.hpp"
#include "builtin/trotter.hpp"

namespace qterm::algorithms {

void TimeEvolution::validate_input(const data::SymbolicHamiltonian& hamiltonian,
                                   const Eigen::VectorXcd& state,
                                   double time) {
  if (!std::isfinite(time) || time < 0.0) {
    throw std::invalid_argument("Evolution time must be finite and "
                                "non-negative, got " +
                                std::to_string(time));
  }
  const Eigen::Index dim = Eigen::Index(1) << hamiltonian.get_num_qubits();
  if (state.size() != dim) {
    throw std::invalid_argument(
        "State of size " + std::to_string(state.size()) +
        " does not match a register of dimension " + std::to_string(dim));
  }
}

std::unique_ptr<TimeEvolution> make_trotter_evolution() {
  return std::make_unique<builtin::TrotterEvolution>();
}

std::unique_ptr<TimeEvolution> make_exact_evolution() {
  return std::make_unique<builtin::ExactEvolution>();
}

void TimeEvolutionFactory::register_default_instances() {
  TimeEvolutionFactory::register_instance(&make_trotter_evolution);
  TimeEvolutionFactory::register_instance(&make_exact_evolution);
}

}  // namespace qterm::algorithms
