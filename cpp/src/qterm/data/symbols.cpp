// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <qterm/data/symbols.hpp>
#include <string>
#include <utility>
#include <vector>

namespace qterm::data {

namespace {

const std::complex<double> kI(0.0, 1.0);

}  // namespace

Symbol::Symbol(std::uint64_t target_qubit, const Eigen::Matrix2cd& matrix,
               std::string name)
    : _target_qubit(target_qubit), _matrix(matrix), _name(std::move(name)) {}

Symbol Symbol::X(std::uint64_t qubit) {
  Eigen::Matrix2cd matrix;
  matrix << 0.0, 1.0, 1.0, 0.0;
  return Symbol(qubit, matrix, "X" + std::to_string(qubit));
}

Symbol Symbol::Y(std::uint64_t qubit) {
  Eigen::Matrix2cd matrix;
  matrix << 0.0, -kI, kI, 0.0;
  return Symbol(qubit, matrix, "Y" + std::to_string(qubit));
}

Symbol Symbol::Z(std::uint64_t qubit) {
  Eigen::Matrix2cd matrix;
  matrix << 1.0, 0.0, 0.0, -1.0;
  return Symbol(qubit, matrix, "Z" + std::to_string(qubit));
}

Symbol Symbol::I(std::uint64_t qubit) {
  return Symbol(qubit, Eigen::Matrix2cd::Identity(),
                "I" + std::to_string(qubit));
}

std::shared_ptr<gates::Unitary> Symbol::get_gate() const {
  if (!_gate) {
    _gate = std::make_shared<gates::Unitary>(
        Eigen::MatrixXcd(_matrix),
        std::vector<std::uint64_t>{_target_qubit});
  }
  return _gate;
}

}  // namespace qterm::data
