// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <qterm/algorithms/time_evolution.hpp>
#include <stdexcept>
#include <string>
#include <unsupported/Eigen/MatrixFunctions>
#include <vector>

#include "ut_common.hpp"

using namespace qterm::algorithms;
using namespace qterm::data;

class TimeEvolutionTest : public ::testing::Test {
 protected:
  void SetUp() override {
    // Transverse field Ising chain on 3 qubits
    ising = std::make_unique<SymbolicHamiltonian>(3);
    ising->add_term(-1.0, {Symbol::Z(0), Symbol::Z(1)});
    ising->add_term(-1.0, {Symbol::Z(1), Symbol::Z(2)});
    for (std::uint64_t q = 0; q < 3; ++q) {
      ising->add_term(-0.7, {Symbol::X(q)});
    }
    psi = testing::sample_state(3, 51);
  }

  Eigen::VectorXcd reference_evolution(double time) const {
    Eigen::MatrixXcd generator =
        std::complex<double>(0.0, -time) * ising->dense_matrix();
    return generator.exp() * psi;
  }

  std::unique_ptr<SymbolicHamiltonian> ising;
  Eigen::VectorXcd psi;
};

TEST_F(TimeEvolutionTest, FactoryCreate) {
  auto available = TimeEvolutionFactory::available();
  for (const std::string name : {"trotter", "product_formula", "exact"}) {
    EXPECT_TRUE(TimeEvolutionFactory::has(name)) << name;
    EXPECT_NE(std::find(available.begin(), available.end(), name),
              available.end());
  }

  auto by_default = TimeEvolutionFactory::create();
  EXPECT_EQ(by_default->name(), "trotter");
  EXPECT_EQ(by_default->type_name(), "time_evolution");
  EXPECT_EQ(TimeEvolutionFactory::create("product_formula")->name(),
            "trotter");
  EXPECT_EQ(TimeEvolutionFactory::create("exact")->name(), "exact");
  EXPECT_THROW(TimeEvolutionFactory::create("runge_kutta"),
               std::runtime_error);
}

TEST_F(TimeEvolutionTest, FactoryRejectsDuplicateNames) {
  EXPECT_THROW(TimeEvolutionFactory::register_instance([]() {
                 return TimeEvolutionFactory::create("exact");
               }),
               std::runtime_error);
}

TEST_F(TimeEvolutionTest, ExactMatchesMatrixExponential) {
  auto exact = TimeEvolutionFactory::create("exact");
  const double time = 0.8;
  Eigen::VectorXcd result = exact->run(*ising, psi, time);
  EXPECT_TRUE(result.isApprox(reference_evolution(time),
                              testing::evolution_tolerance));
  EXPECT_NEAR(result.norm(), 1.0, testing::evolution_tolerance);
}

TEST_F(TimeEvolutionTest, TrotterFirstOrder) {
  auto trotter = TimeEvolutionFactory::create("trotter");
  trotter->settings().set("order", 1);
  trotter->settings().set("time_step", 2.5e-4);
  const double time = 0.5;
  Eigen::VectorXcd result = trotter->run(*ising, psi, time);
  EXPECT_LT((result - reference_evolution(time)).norm(),
            testing::trotter_tolerance);
  EXPECT_NEAR(result.norm(), 1.0, testing::evolution_tolerance);
}

TEST_F(TimeEvolutionTest, TrotterSecondOrder) {
  auto trotter = TimeEvolutionFactory::create("trotter");
  trotter->settings().set("time_step", 0.01);
  const double time = 1.0;
  Eigen::VectorXcd result = trotter->run(*ising, psi, time);
  EXPECT_LT((result - reference_evolution(time)).norm(),
            testing::trotter_tolerance);
}

TEST_F(TimeEvolutionTest, SecondOrderIsMoreAccurate) {
  const double time = 1.0;
  Eigen::VectorXcd reference = reference_evolution(time);

  auto first = TimeEvolutionFactory::create("trotter");
  first->settings().set("order", 1);
  first->settings().set("time_step", 0.1);
  auto second = TimeEvolutionFactory::create("trotter");
  second->settings().set("order", 2);
  second->settings().set("time_step", 0.1);

  double first_error = (first->run(*ising, psi, time) - reference).norm();
  double second_error = (second->run(*ising, psi, time) - reference).norm();
  EXPECT_LT(second_error, first_error);
}

TEST_F(TimeEvolutionTest, CommutingTermsAreExact) {
  SymbolicHamiltonian diagonal(2);
  diagonal.add_term(0.3, {Symbol::Z(0), Symbol::Z(1)});
  diagonal.add_term(-1.1, {Symbol::Z(1)});
  Eigen::VectorXcd state = testing::sample_state(2, 53);

  auto trotter = TimeEvolutionFactory::create("trotter");
  trotter->settings().set("time_step", 0.5);
  auto exact = TimeEvolutionFactory::create("exact");
  EXPECT_TRUE(trotter->run(diagonal, state, 2.0).isApprox(
      exact->run(diagonal, state, 2.0), testing::evolution_tolerance));
}

TEST_F(TimeEvolutionTest, ZeroTimeReturnsInput) {
  for (const std::string name : {"trotter", "exact"}) {
    auto evolution = TimeEvolutionFactory::create(name);
    EXPECT_TRUE(evolution->run(*ising, psi, 0.0).isApprox(
        psi, testing::evolution_tolerance));
  }
}

TEST_F(TimeEvolutionTest, InvalidInput) {
  for (const std::string name : {"trotter", "exact"}) {
    auto evolution = TimeEvolutionFactory::create(name);
    EXPECT_THROW(evolution->run(*ising, psi, -1.0), std::invalid_argument);
    EXPECT_THROW(evolution->run(*ising, psi,
                                std::numeric_limits<double>::infinity()),
                 std::invalid_argument);
    EXPECT_THROW(evolution->run(*ising, testing::sample_state(2), 1.0),
                 std::invalid_argument);
  }
}

TEST_F(TimeEvolutionTest, TrotterRejectsTooManySteps) {
  SymbolicHamiltonian h(1);
  h.add_term(1.0, {Symbol::X(0)});
  Eigen::VectorXcd zero = Eigen::VectorXcd::Zero(2);
  zero(0) = 1.0;

  // Accepted by the settings, but time / time_step overflows any step count
  auto trotter = TimeEvolutionFactory::create("trotter");
  trotter->settings().set("time_step", 1e-300);
  EXPECT_THROW(trotter->run(h, zero, 1.0), std::invalid_argument);

  auto coarse = TimeEvolutionFactory::create("trotter");
  coarse->settings().set("order", int64_t(1));
  coarse->settings().set("time_step", 1e-3);
  Eigen::VectorXcd expected(2);
  expected << std::cos(1.0), std::complex<double>(0.0, -std::sin(1.0));
  EXPECT_TRUE(
      coarse->run(h, zero, 1.0).isApprox(expected, testing::evolution_tolerance));
}

TEST_F(TimeEvolutionTest, SettingsLockAfterRun) {
  auto trotter = TimeEvolutionFactory::create("trotter");
  trotter->settings().set("time_step", 0.1);
  trotter->run(*ising, psi, 0.2);
  EXPECT_TRUE(trotter->settings().is_locked());
  EXPECT_THROW(trotter->settings().set("time_step", 0.2), SettingsAreLocked);
}

TEST_F(TimeEvolutionTest, TrotterSettingsConstraints) {
  auto trotter = TimeEvolutionFactory::create("trotter");
  EXPECT_EQ(trotter->settings().get<int64_t>("order"), 2);
  EXPECT_DOUBLE_EQ(trotter->settings().get<double>("time_step"), 0.01);
  EXPECT_THROW(trotter->settings().set("order", 3), std::invalid_argument);
  EXPECT_THROW(trotter->settings().set("time_step", 0.0),
               std::invalid_argument);
  EXPECT_THROW(trotter->settings().set("time_step", -0.1),
               std::invalid_argument);
}
