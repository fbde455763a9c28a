// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once
#include <qterm/algorithms/time_evolution.hpp>

namespace qterm::algorithms::builtin {

/**
 * @brief Reference evolution through the dense propagator exp(-i t H)
 *
 * Builds the full 2^n x 2^n Hamiltonian, so it is only practical for small
 * registers.
 */
class ExactEvolution : public TimeEvolution {
 public:
  ExactEvolution() = default;
  ~ExactEvolution() override = default;
  std::string name() const final { return "exact"; }

 protected:
  Eigen::VectorXcd _run_impl(const data::SymbolicHamiltonian& hamiltonian,
                             const Eigen::VectorXcd& state,
                             double time) const override;
};

}  // namespace qterm::algorithms::builtin
