// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <gtest/gtest.h>

#include <memory>
#include <qterm/data/hamiltonian.hpp>
#include <stdexcept>
#include <vector>

#include "ut_common.hpp"

using namespace qterm::data;

class SymbolicHamiltonianTest : public ::testing::Test {
 protected:
  void SetUp() override {
    // H = -Z0 Z1 - Z1 Z2 - 0.5 (X0 + X1 + X2)
    ising = std::make_unique<SymbolicHamiltonian>(3);
    ising->add_term(-1.0, {Symbol::Z(0), Symbol::Z(1)});
    ising->add_term(-1.0, {Symbol::Z(1), Symbol::Z(2)});
    for (std::uint64_t q = 0; q < 3; ++q) {
      ising->add_term(-0.5, {Symbol::X(q)});
    }
  }

  Eigen::MatrixXcd reference_ising() const {
    using testing::embed_operator;
    const Eigen::MatrixXcd zz =
        testing::kron_all({testing::pauli_z(), testing::pauli_z()});
    Eigen::MatrixXcd h = -embed_operator(zz, {0, 1}, 3) -
                         embed_operator(zz, {1, 2}, 3);
    for (std::uint64_t q = 0; q < 3; ++q) {
      h -= 0.5 * embed_operator(testing::pauli_x(), {q}, 3);
    }
    return h;
  }

  std::unique_ptr<SymbolicHamiltonian> ising;
};

TEST_F(SymbolicHamiltonianTest, TermsAreTagged) {
  EXPECT_EQ(ising->get_terms().size(), 5);
  for (const auto& term : ising->get_terms()) {
    ASSERT_TRUE(term->get_hamiltonian().has_value());
    EXPECT_EQ(*term->get_hamiltonian(), ising->get_id());
  }
}

TEST_F(SymbolicHamiltonianTest, IdsAreUnique) {
  SymbolicHamiltonian other;
  EXPECT_NE(other.get_id(), ising->get_id());
}

TEST_F(SymbolicHamiltonianTest, NumQubits) {
  EXPECT_EQ(ising->get_num_qubits(), 3);

  SymbolicHamiltonian inferred;
  EXPECT_EQ(inferred.get_num_qubits(), 0);
  inferred.add_term(1.0, {Symbol::X(4)});
  EXPECT_EQ(inferred.get_num_qubits(), 5);
}

TEST_F(SymbolicHamiltonianTest, TermOutsideRegisterThrows) {
  EXPECT_THROW(ising->add_term(1.0, {Symbol::X(3)}), std::invalid_argument);
  EXPECT_THROW(ising->add_term(nullptr), std::invalid_argument);
  EXPECT_EQ(ising->get_terms().size(), 5);
}

TEST_F(SymbolicHamiltonianTest, DenseMatrix) {
  EXPECT_TRUE(ising->dense_matrix().isApprox(reference_ising(),
                                             testing::matrix_tolerance));
}

TEST_F(SymbolicHamiltonianTest, DenseMatrixWithScalarTerm) {
  SymbolicHamiltonian h(1);
  h.add_term(1.0, {Symbol::Z(0)});
  h.add_term(0.75, {});
  Eigen::MatrixXcd expected = testing::pauli_z() + 0.75 * testing::pauli_i();
  EXPECT_TRUE(h.dense_matrix().isApprox(expected, testing::matrix_tolerance));
}

TEST_F(SymbolicHamiltonianTest, TermGroupsAreCached) {
  const auto& groups = ising->get_term_groups();
  EXPECT_EQ(groups.size(), 2);
  EXPECT_EQ(&groups, &ising->get_term_groups());

  std::size_t grouped = 0;
  Eigen::MatrixXcd total = Eigen::MatrixXcd::Zero(8, 8);
  for (const auto& group : groups) {
    grouped += group.size();
    auto merged = group.term();
    total += testing::embed_operator(merged->get_matrix(),
                                     merged->get_target_qubits(), 3);
  }
  EXPECT_EQ(grouped, 5);
  EXPECT_TRUE(total.isApprox(reference_ising(), testing::matrix_tolerance));
}

TEST_F(SymbolicHamiltonianTest, AddTermResetsGroups) {
  EXPECT_EQ(ising->get_term_groups().size(), 2);
  ising->add_term(1.0, {Symbol::Y(0), Symbol::Y(2)});
  EXPECT_EQ(ising->get_term_groups().size(), 3);
}

TEST_F(SymbolicHamiltonianTest, GroupsRescaledPerHamiltonian) {
  CoefficientMap coefficients{{ising->get_id(), 2.0}};
  Eigen::MatrixXcd total = Eigen::MatrixXcd::Zero(8, 8);
  for (const auto& group : ising->get_term_groups()) {
    auto merged = group.to_term(coefficients);
    total += testing::embed_operator(merged->get_matrix(),
                                     merged->get_target_qubits(), 3);
  }
  EXPECT_TRUE(total.isApprox(2.0 * reference_ising(),
                             testing::matrix_tolerance));
}

TEST_F(SymbolicHamiltonianTest, ApplyAndExpectation) {
  Eigen::VectorXcd psi = testing::sample_state(3, 41);
  Eigen::MatrixXcd expected = reference_ising() * psi;
  EXPECT_TRUE(ising->apply(psi).isApprox(expected, testing::matrix_tolerance));

  std::complex<double> energy = ising->expectation(psi);
  std::complex<double> reference = psi.dot(reference_ising() * psi);
  EXPECT_NEAR(std::abs(energy - reference), 0.0, 1e-12);
  EXPECT_NEAR(energy.imag(), 0.0, 1e-12);

  EXPECT_THROW(ising->expectation(testing::sample_state(2)),
               std::invalid_argument);
}

TEST_F(SymbolicHamiltonianTest, ApplyToDensityMatrix) {
  Eigen::VectorXcd psi = testing::sample_state(3, 43);
  Eigen::MatrixXcd rho = psi * psi.adjoint();
  EXPECT_TRUE(ising->apply(rho, true).isApprox(reference_ising() * rho,
                                               testing::matrix_tolerance));
}

TEST_F(SymbolicHamiltonianTest, AddPlainTerm) {
  SymbolicHamiltonian h(2);
  auto term = std::make_shared<Term>(testing::sample_matrix(4, 4, 45),
                                     std::vector<std::uint64_t>{1, 0});
  h.add_term(term);
  ASSERT_TRUE(term->get_hamiltonian().has_value());
  EXPECT_EQ(*term->get_hamiltonian(), h.get_id());
  EXPECT_TRUE(h.dense_matrix().isApprox(
      testing::embed_operator(term->get_matrix(), {1, 0}, 2),
      testing::matrix_tolerance));
}

TEST_F(SymbolicHamiltonianTest, Summary) {
  std::string summary = ising->get_summary();
  EXPECT_NE(summary.find("Number of terms: 5"), std::string::npos);
  EXPECT_NE(summary.find("Number of qubits: 3"), std::string::npos);
}
