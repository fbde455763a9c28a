// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <Eigen/Dense>
#include <qterm/algorithms/algorithm.hpp>
#include <qterm/data/hamiltonian.hpp>
#include <string>

namespace qterm::algorithms {

/**
 * @brief Evolve a state vector under a SymbolicHamiltonian
 *
 * Computes exp(-i t H) |psi>, exactly or approximately depending on the
 * implementation.
 *
 * Example usage:
 * @code
 * auto evolution = TimeEvolutionFactory::create("trotter");
 * evolution->settings().set("time_step", 0.05);
 * Eigen::VectorXcd psi_t = evolution->run(hamiltonian, psi_0, 1.0);
 * @endcode
 */
class TimeEvolution
    : public Algorithm<TimeEvolution, Eigen::VectorXcd,
                       const data::SymbolicHamiltonian&,
                       const Eigen::VectorXcd&, double> {
 public:
  TimeEvolution() = default;
  virtual ~TimeEvolution() = default;

  /**
   * @brief Evolve a state
   *
   * \cond DOXYGEN_SUPRESS (Doxygen warning suppression for argument packs)
   * @param hamiltonian Generator of the evolution
   * @param state Initial state vector of dimension 2^n, n the number of
   * qubits of @p hamiltonian
   * @param time Total evolution time
   * \endcond
   *
   * @return The evolved state
   *
   * @throws std::invalid_argument if @p time is negative or the state does not
   * match the register
   * @throws SettingsAreLocked if attempting to modify settings after run() is
   * called
   */
  using Algorithm::run;

  virtual std::string name() const = 0;

  std::string type_name() const final { return "time_evolution"; }

 protected:
  virtual Eigen::VectorXcd _run_impl(
      const data::SymbolicHamiltonian& hamiltonian,
      const Eigen::VectorXcd& state, double time) const = 0;

  /**
   * @brief Shared argument checks of all implementations
   */
  static void validate_input(const data::SymbolicHamiltonian& hamiltonian,
                             const Eigen::VectorXcd& state, double time);
};

struct TimeEvolutionFactory
    : public AlgorithmFactory<TimeEvolution, TimeEvolutionFactory> {
  static std::string algorithm_type_name() { return "time_evolution"; }
  static void register_default_instances();
  static std::string default_algorithm_name() { return "trotter"; }
};

}  // namespace qterm::algorithms
