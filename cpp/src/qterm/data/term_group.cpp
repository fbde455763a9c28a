// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <functional>
#include <map>
#include <qterm/data/term_group.hpp>
#include <qterm/utils/logger.hpp>
#include <stdexcept>
#include <string>
#include <utility>

namespace qterm::data {

TermGroup::TermGroup(std::shared_ptr<const Term> seed) {
  if (!seed) {
    throw std::invalid_argument("Cannot seed a TermGroup with a null term");
  }
  append(std::move(seed));
}

bool TermGroup::can_append(const Term& term) const {
  for (auto qubit : term.get_target_qubits()) {
    if (_target_qubits.count(qubit) == 0) {
      return false;
    }
  }
  return true;
}

void TermGroup::append(std::shared_ptr<const Term> term) {
  const auto& qubits = term->get_target_qubits();
  _target_qubits.insert(qubits.begin(), qubits.end());
  _terms.push_back(std::move(term));
  _term.reset();
}

std::vector<TermGroup> TermGroup::from_terms(
    const std::vector<std::shared_ptr<const Term>>& terms) {
  QTERM_LOG_TRACE_ENTERING();

  std::map<std::size_t, std::vector<std::shared_ptr<const Term>>,
           std::greater<std::size_t>>
      buckets;
  for (const auto& term : terms) {
    if (!term) {
      throw std::invalid_argument("Cannot group a null term");
    }
    buckets[term->size()].push_back(term);
  }

  std::vector<TermGroup> groups;
  for (const auto& [arity, bucket] : buckets) {
    for (const auto& term : bucket) {
      bool placed = false;
      for (auto& group : groups) {
        if (group.can_append(*term)) {
          group.append(term);
          placed = true;
          break;
        }
      }
      if (!placed) {
        groups.emplace_back(term);
      }
    }
  }

  QTERM_LOGGER().debug("Grouped {} terms in {} arity buckets into {} groups",
                       terms.size(), buckets.size(), groups.size());
  return groups;
}

std::shared_ptr<const Term> TermGroup::term() const {
  if (!_term) {
    _term = to_term();
  }
  return _term;
}

std::shared_ptr<Term> TermGroup::to_term(
    const CoefficientMap& coefficients) const {
  auto scaled = [&coefficients](const Term& term) -> std::shared_ptr<Term> {
    const auto& hamiltonian = term.get_hamiltonian();
    if (hamiltonian) {
      auto it = coefficients.find(*hamiltonian);
      if (it != coefficients.end()) {
        return term.scale(it->second);
      }
    }
    return nullptr;
  };

  const Term& first = *_terms.front();
  std::shared_ptr<Term> merged = scaled(first);
  if (!merged) {
    merged = std::make_shared<Term>(first.get_matrix(),
                                    first.get_target_qubits());
  }
  for (std::size_t i = 1; i < _terms.size(); ++i) {
    const Term& member = *_terms[i];
    auto member_scaled = scaled(member);
    merged = merged->merge(member_scaled ? *member_scaled : member);
  }
  return merged;
}

const std::shared_ptr<const Term>& TermGroup::at(std::size_t index) const {
  if (index >= _terms.size()) {
    throw std::out_of_range("TermGroup index " + std::to_string(index) +
                            " out of range for group of size " +
                            std::to_string(_terms.size()));
  }
  return _terms[index];
}

}  // namespace qterm::data
