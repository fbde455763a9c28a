// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <complex>
#include <cstdint>
#include <memory>
#include <qterm/data/term.hpp>
#include <set>
#include <unordered_map>
#include <vector>

namespace qterm::data {

/// Per-Hamiltonian coefficient overrides used when re-merging a group
using CoefficientMap =
    std::unordered_map<HamiltonianId, std::complex<double>>;

/**
 * @class TermGroup
 * @brief Terms whose qubit supports fit inside a common support
 *
 * A group is seeded by one term and only accepts further terms whose target
 * qubits are contained in its current support. All members can then be
 * merged into a single term over the qubits of the first member and applied
 * as one gate.
 */
class TermGroup {
 public:
  using container_type = std::vector<std::shared_ptr<const Term>>;
  using const_iterator = container_type::const_iterator;

  /**
   * @brief Start a group from a seed term
   * @throws std::invalid_argument if @p seed is null
   */
  explicit TermGroup(std::shared_ptr<const Term> seed);

  /**
   * @brief Whether all target qubits of @p term lie in the group's support
   */
  bool can_append(const Term& term) const;

  /**
   * @brief Add a term and drop the cached merged term
   *
   * Does not check can_append(); callers are expected to do so.
   */
  void append(std::shared_ptr<const Term> term);

  /**
   * @brief Partition terms into groups with a greedy first-fit strategy
   *
   * Terms are processed by decreasing number of target qubits, keeping their
   * input order within each size. Each term joins the first existing group
   * that can hold it, otherwise it starts a new group.
   *
   * @param terms Terms to group, in any order
   * @return Groups in creation order; every input term is in exactly one
   */
  static std::vector<TermGroup> from_terms(
      const std::vector<std::shared_ptr<const Term>>& terms);

  /**
   * @brief Merged term of the group, built on first access
   */
  std::shared_ptr<const Term> term() const;

  /**
   * @brief Merge all members, left to right starting from the first
   * @param coefficients Scale applied to each member whose Hamiltonian id is
   * present in the map
   */
  std::shared_ptr<Term> to_term(const CoefficientMap& coefficients = {}) const;

  const std::set<std::uint64_t>& get_target_qubits() const {
    return _target_qubits;
  }

  std::size_t size() const { return _terms.size(); }

  /// @throws std::out_of_range if @p index >= size()
  const std::shared_ptr<const Term>& at(std::size_t index) const;

  const_iterator begin() const { return _terms.begin(); }
  const_iterator end() const { return _terms.end(); }

 private:
  container_type _terms;
  std::set<std::uint64_t> _target_qubits;
  mutable std::shared_ptr<const Term> _term;
};

}  // namespace qterm::data
