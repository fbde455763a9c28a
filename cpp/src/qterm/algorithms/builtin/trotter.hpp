// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once
#include <cstdint>
#include <limits>
#include <qterm/algorithms/time_evolution.hpp>
#include <qterm/data/settings.hpp>

namespace qterm::algorithms::builtin {

/**
 * @class TrotterSettings
 * @brief Step size and order of the product formula
 */
class TrotterSettings : public data::Settings {
 public:
  TrotterSettings() {
    set_default("time_step", 0.01, "Largest allowed Trotter step",
                data::BoundConstraint<double>{
                    std::numeric_limits<double>::min(),
                    std::numeric_limits<double>::max()});
    set_default<int64_t>("order", 2,
                         "Product formula order: 1 (Lie) or 2 (symmetric)",
                         data::ListConstraint<int64_t>{{1, 2}});
  }
};

/**
 * @brief Product formula evolution over the Hamiltonian's term groups
 *
 * The evolution time is split into n = ceil(time / time_step) equal steps.
 * Each step applies exp(-i dt G) for every merged term group G in group
 * order (first order), or every group with dt / 2 in order followed by the
 * same in reverse order (second order). A time_step that would need more
 * than MAX_STEPS steps is rejected with std::invalid_argument.
 */
class TrotterEvolution : public TimeEvolution {
 public:
  /// Upper limit on ceil(time / time_step)
  static constexpr std::size_t MAX_STEPS =
      std::numeric_limits<std::uint32_t>::max();

  TrotterEvolution() { _settings = std::make_unique<TrotterSettings>(); }

  ~TrotterEvolution() override = default;
  std::string name() const final { return "trotter"; }
  std::vector<std::string> aliases() const override {
    return {"trotter", "product_formula"};
  }

 protected:
  Eigen::VectorXcd _run_impl(const data::SymbolicHamiltonian& hamiltonian,
                             const Eigen::VectorXcd& state,
                             double time) const override;
};

}  // namespace qterm::algorithms::builtin
