// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <qterm/data/symbolic_term.hpp>
#include <qterm/data/term_group.hpp>
#include <set>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

#include "ut_common.hpp"

using namespace qterm::data;

namespace {

std::shared_ptr<const Term> pauli_product(
    std::complex<double> coefficient, std::vector<SymbolicFactor> factors) {
  return SymbolicTerm::from_factors(coefficient, factors);
}

std::shared_ptr<const Term> dense_term(std::vector<std::uint64_t> qubits,
                                       unsigned seed) {
  const Eigen::Index dim = Eigen::Index(1) << qubits.size();
  return std::make_shared<Term>(testing::sample_matrix(dim, dim, seed),
                                std::move(qubits));
}

}  // namespace

TEST(TermGroupTest, SeedDefinesSupport) {
  TermGroup group(pauli_product(1.0, {Symbol::Z(0), Symbol::Z(2)}));
  EXPECT_EQ(group.size(), 1);
  EXPECT_EQ(group.get_target_qubits(), (std::set<std::uint64_t>{0, 2}));
}

TEST(TermGroupTest, NullSeedThrows) {
  EXPECT_THROW(TermGroup(nullptr), std::invalid_argument);
}

TEST(TermGroupTest, CanAppend) {
  TermGroup group(pauli_product(1.0, {Symbol::Z(0), Symbol::Z(1)}));
  EXPECT_TRUE(group.can_append(*pauli_product(1.0, {Symbol::X(0)})));
  EXPECT_TRUE(group.can_append(*pauli_product(1.0, {Symbol::X(1)})));
  EXPECT_TRUE(group.can_append(*pauli_product(1.0, {Symbol::X(1), Symbol::Y(0)})));
  EXPECT_TRUE(group.can_append(*pauli_product(3.0, {})));
  EXPECT_FALSE(group.can_append(*pauli_product(1.0, {Symbol::X(2)})));
  EXPECT_FALSE(
      group.can_append(*pauli_product(1.0, {Symbol::X(0), Symbol::X(2)})));
}

TEST(TermGroupTest, AppendInvalidatesMergedTerm) {
  TermGroup group(pauli_product(1.0, {Symbol::Z(0), Symbol::Z(1)}));
  auto before = group.term();
  EXPECT_EQ(before.get(), group.term().get());

  group.append(pauli_product(1.0, {Symbol::X(0)}));
  auto after = group.term();
  EXPECT_NE(before.get(), after.get());
  EXPECT_EQ(group.size(), 2);
  Eigen::MatrixXcd expected =
      testing::kron_all({testing::pauli_z(), testing::pauli_z()}) +
      testing::kron_all({testing::pauli_x(), testing::pauli_i()});
  EXPECT_TRUE(after->get_matrix().isApprox(expected, testing::matrix_tolerance));
}

TEST(TermGroupTest, AppendExtendsSupport) {
  TermGroup group(pauli_product(1.0, {Symbol::Z(0)}));
  group.append(pauli_product(1.0, {Symbol::X(3)}));
  EXPECT_EQ(group.get_target_qubits(), (std::set<std::uint64_t>{0, 3}));
}

TEST(TermGroupTest, MergedTermUsesFirstMemberQubitOrder) {
  auto big = dense_term({2, 0, 1}, 21);
  auto small = dense_term({1, 2}, 23);
  TermGroup group(big);
  group.append(small);

  auto merged = group.term();
  EXPECT_EQ(merged->get_target_qubits(),
            (std::vector<std::uint64_t>{2, 0, 1}));
  Eigen::MatrixXcd expected =
      big->get_matrix() + testing::embed_operator(small->get_matrix(), {2, 0}, 3);
  EXPECT_TRUE(merged->get_matrix().isApprox(expected, testing::matrix_tolerance));
}

TEST(TermGroupTest, ToTermAppliesCoefficientOverrides) {
  auto zz = std::make_shared<Term>(
      testing::kron_all({testing::pauli_z(), testing::pauli_z()}),
      std::vector<std::uint64_t>{0, 1});
  zz->set_hamiltonian(1);
  auto x0 = std::make_shared<Term>(testing::pauli_x(),
                                   std::vector<std::uint64_t>{0});
  x0->set_hamiltonian(2);
  auto z1 = std::make_shared<Term>(testing::pauli_z(),
                                   std::vector<std::uint64_t>{1});

  TermGroup group(zz);
  group.append(x0);
  group.append(z1);

  CoefficientMap coefficients{{1, 2.0}, {2, std::complex<double>(0.0, -1.0)}};
  auto merged = group.to_term(coefficients);
  Eigen::MatrixXcd expected =
      2.0 * testing::kron_all({testing::pauli_z(), testing::pauli_z()}) +
      std::complex<double>(0.0, -1.0) *
          testing::kron_all({testing::pauli_x(), testing::pauli_i()}) +
      testing::kron_all({testing::pauli_i(), testing::pauli_z()});
  EXPECT_TRUE(merged->get_matrix().isApprox(expected, testing::matrix_tolerance));

  // Without overrides the members are merged as they are
  Eigen::MatrixXcd plain =
      testing::kron_all({testing::pauli_z(), testing::pauli_z()}) +
      testing::kron_all({testing::pauli_x(), testing::pauli_i()}) +
      testing::kron_all({testing::pauli_i(), testing::pauli_z()});
  EXPECT_TRUE(group.to_term()->get_matrix().isApprox(plain,
                                                     testing::matrix_tolerance));
  // The members are not modified by the overrides
  EXPECT_TRUE(zz->get_matrix().isApprox(
      testing::kron_all({testing::pauli_z(), testing::pauli_z()}),
      testing::matrix_tolerance));
}

TEST(TermGroupTest, Access) {
  auto first = pauli_product(1.0, {Symbol::Z(0), Symbol::Z(1)});
  auto second = pauli_product(1.0, {Symbol::X(1)});
  TermGroup group(first);
  group.append(second);

  EXPECT_EQ(group.at(0).get(), first.get());
  EXPECT_EQ(group.at(1).get(), second.get());
  EXPECT_THROW(group.at(2), std::out_of_range);

  std::vector<const Term*> visited;
  for (const auto& term : group) {
    visited.push_back(term.get());
  }
  EXPECT_EQ(visited, (std::vector<const Term*>{first.get(), second.get()}));
}

TEST(TermGroupTest, MembersAreReadOnly) {
  static_assert(
      std::is_same_v<decltype(std::declval<const TermGroup&>().at(0)),
                     const std::shared_ptr<const Term>&>);
  static_assert(
      std::is_same_v<decltype(*std::declval<const TermGroup&>().begin()),
                     const std::shared_ptr<const Term>&>);

  // The tag fixed when the member was added decides its rescaling
  auto x0 = SymbolicTerm::from_factors(1.0, {Symbol::X(0)});
  x0->set_hamiltonian(4);
  TermGroup group(x0);
  auto merged = group.to_term(CoefficientMap{{4, 3.0}, {5, 7.0}});
  EXPECT_TRUE(merged->get_matrix().isApprox(3.0 * testing::pauli_x(),
                                            testing::matrix_tolerance));
  ASSERT_TRUE(group.at(0)->get_hamiltonian().has_value());
  EXPECT_EQ(*group.at(0)->get_hamiltonian(), 4u);
}

// Grouping

TEST(TermGroupTest, LargerTermsSeedGroupsFirst) {
  // The one-qubit term comes first but still ends up in the two-qubit group
  auto x0 = pauli_product(1.0, {Symbol::X(0)});
  auto zz = pauli_product(1.0, {Symbol::Z(0), Symbol::Z(1)});
  auto groups = TermGroup::from_terms({x0, zz});
  ASSERT_EQ(groups.size(), 1);
  ASSERT_EQ(groups[0].size(), 2);
  EXPECT_EQ(groups[0].at(0).get(), zz.get());
  EXPECT_EQ(groups[0].at(1).get(), x0.get());
}

TEST(TermGroupTest, FirstFitWithinArity) {
  // Ising chain on 4 qubits with a transverse field
  std::vector<std::shared_ptr<const Term>> terms = {
      pauli_product(0.5, {Symbol::X(0)}),
      pauli_product(0.5, {Symbol::X(3)}),
      pauli_product(1.0, {Symbol::Z(0), Symbol::Z(1)}),
      pauli_product(1.0, {Symbol::Z(1), Symbol::Z(2)}),
      pauli_product(1.0, {Symbol::Z(2), Symbol::Z(3)}),
      pauli_product(0.5, {Symbol::X(1)}),
      pauli_product(0.5, {Symbol::X(2)}),
  };
  auto groups = TermGroup::from_terms(terms);
  ASSERT_EQ(groups.size(), 3);

  // Two-qubit terms seed the groups in input order
  EXPECT_EQ(groups[0].at(0).get(), terms[2].get());
  EXPECT_EQ(groups[1].at(0).get(), terms[3].get());
  EXPECT_EQ(groups[2].at(0).get(), terms[4].get());

  // X0 and X1 fit into the first group, X2 into the second, X3 into the third
  EXPECT_EQ(groups[0].size(), 3);
  EXPECT_EQ(groups[0].at(1).get(), terms[0].get());
  EXPECT_EQ(groups[0].at(2).get(), terms[5].get());
  EXPECT_EQ(groups[1].size(), 2);
  EXPECT_EQ(groups[1].at(1).get(), terms[6].get());
  EXPECT_EQ(groups[2].size(), 2);
  EXPECT_EQ(groups[2].at(1).get(), terms[1].get());
}

TEST(TermGroupTest, GroupingCoversEveryTermOnce) {
  std::vector<std::shared_ptr<const Term>> terms = {
      dense_term({4}, 1),       dense_term({0, 1}, 2),
      dense_term({1, 2, 3}, 3), dense_term({5, 0}, 4),
      dense_term({3}, 5),       dense_term({2, 1}, 6),
      dense_term({}, 7),        dense_term({0, 4}, 8),
      dense_term({3, 1, 2}, 9), dense_term({5}, 10),
  };
  auto groups = TermGroup::from_terms(terms);

  std::vector<const Term*> seen;
  for (const auto& group : groups) {
    std::set<std::uint64_t> support(group.at(0)->get_target_qubits().begin(),
                                    group.at(0)->get_target_qubits().end());
    for (const auto& term : group) {
      seen.push_back(term.get());
      // Every member fits inside the support of the seed
      for (auto qubit : term->get_target_qubits()) {
        EXPECT_TRUE(support.count(qubit) == 1);
      }
    }
    EXPECT_EQ(group.get_target_qubits(), support);
  }
  ASSERT_EQ(seen.size(), terms.size());
  for (const auto& term : terms) {
    EXPECT_EQ(std::count(seen.begin(), seen.end(), term.get()), 1);
  }
}

TEST(TermGroupTest, DisjointTermsStayApart) {
  auto groups = TermGroup::from_terms({pauli_product(1.0, {Symbol::Z(0)}),
                                       pauli_product(1.0, {Symbol::Z(1)}),
                                       pauli_product(1.0, {Symbol::Z(2)})});
  ASSERT_EQ(groups.size(), 3);
  for (const auto& group : groups) {
    EXPECT_EQ(group.size(), 1);
  }
}

TEST(TermGroupTest, ScalarTermsJoinTheFirstGroup) {
  auto scalar = pauli_product(2.0, {});
  auto x1 = pauli_product(1.0, {Symbol::X(1)});
  auto groups = TermGroup::from_terms({scalar, x1});
  ASSERT_EQ(groups.size(), 1);
  Eigen::MatrixXcd expected = testing::pauli_x() + 2.0 * testing::pauli_i();
  EXPECT_TRUE(groups[0].term()->get_matrix().isApprox(
      expected, testing::matrix_tolerance));
}

TEST(TermGroupTest, EmptyInput) {
  EXPECT_TRUE(TermGroup::from_terms({}).empty());
}

TEST(TermGroupTest, NullTermThrows) {
  EXPECT_THROW(TermGroup::from_terms({nullptr}), std::invalid_argument);
}
