// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <gtest/gtest.h>

#include <qterm/gates/unitary.hpp>
#include <stdexcept>
#include <vector>

#include "ut_common.hpp"

using namespace qterm::gates;

TEST(UnitaryTest, Construction) {
  Unitary gate(testing::pauli_x(), {3});
  EXPECT_EQ(gate.size(), 1);
  EXPECT_EQ(gate.get_target_qubits(), (std::vector<std::uint64_t>{3}));
  EXPECT_FALSE(gate.is_density_matrix());
  EXPECT_EQ(gate.to_string(), "Unitary(3)");
}

TEST(UnitaryTest, InvalidConstruction) {
  EXPECT_THROW(Unitary(testing::pauli_x(), {0, 1}), std::invalid_argument);
  EXPECT_THROW(Unitary(Eigen::MatrixXcd::Identity(4, 4), {1, 1}),
               std::invalid_argument);
}

TEST(UnitaryTest, ApplyOnMostSignificantQubit) {
  // X on qubit 0 of |00> gives |10>, i.e. basis index 2
  Unitary gate(testing::pauli_x(), {0});
  Eigen::VectorXcd psi = Eigen::VectorXcd::Zero(4);
  psi(0) = 1.0;
  Eigen::MatrixXcd result = gate.apply(psi);
  EXPECT_NEAR(std::abs(result(2, 0) - 1.0), 0.0,
              testing::numerical_zero_tolerance);
  EXPECT_NEAR(result.norm(), 1.0, testing::numerical_zero_tolerance);
}

TEST(UnitaryTest, ApplyMatchesEmbeddedOperator) {
  Eigen::MatrixXcd op = testing::sample_matrix(4, 4, 31);
  Unitary gate(op, {3, 1});
  Eigen::VectorXcd psi = testing::sample_state(4, 33);
  Eigen::MatrixXcd expected = testing::embed_operator(op, {3, 1}, 4) * psi;
  EXPECT_TRUE(gate.apply(psi).isApprox(expected, testing::matrix_tolerance));
}

TEST(UnitaryTest, ApplyRejectsBadStates) {
  Unitary gate(testing::pauli_x(), {2});
  EXPECT_THROW(gate.apply(Eigen::VectorXcd::Ones(4)), std::invalid_argument);
  EXPECT_THROW(gate.apply(Eigen::VectorXcd::Ones(6)), std::invalid_argument);
  EXPECT_THROW(gate.apply(Eigen::MatrixXcd::Ones(8, 2)), std::invalid_argument);
}

TEST(UnitaryTest, DensityMatrixHalfCall) {
  Eigen::MatrixXcd op = testing::sample_matrix(2, 2, 35);
  Unitary gate(op, {1});
  Eigen::VectorXcd psi = testing::sample_state(2, 37);
  Eigen::MatrixXcd rho = psi * psi.adjoint();
  Eigen::MatrixXcd expected = testing::embed_operator(op, {1}, 2) * rho;
  EXPECT_TRUE(gate.density_matrix_half_call(rho).isApprox(
      expected, testing::matrix_tolerance));
  EXPECT_THROW(gate.density_matrix_half_call(Eigen::MatrixXcd::Ones(4, 2)),
               std::invalid_argument);
}

TEST(UnitaryTest, CallDispatchesOnDensityFlag) {
  Unitary gate(testing::pauli_z(), {0});
  Eigen::VectorXcd psi = testing::sample_state(1, 39);
  Eigen::MatrixXcd rho = psi * psi.adjoint();

  EXPECT_TRUE(gate(psi).isApprox(testing::pauli_z() * psi,
                                 testing::matrix_tolerance));
  EXPECT_THROW(gate(rho), std::invalid_argument);

  gate.set_density_matrix(true);
  EXPECT_TRUE(gate.is_density_matrix());
  EXPECT_TRUE(gate(rho).isApprox(testing::pauli_z() * rho,
                                 testing::matrix_tolerance));
}
