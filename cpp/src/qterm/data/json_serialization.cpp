// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include "json_serialization.hpp"

#include <stdexcept>
#include <string>
#include <tuple>

namespace qterm::data {

namespace {

nlohmann::json real_matrix_to_json(const Eigen::MatrixXd& matrix) {
  nlohmann::json j = nlohmann::json::array();
  for (Eigen::Index row = 0; row < matrix.rows(); ++row) {
    nlohmann::json row_array = nlohmann::json::array();
    for (Eigen::Index col = 0; col < matrix.cols(); ++col) {
      row_array.push_back(matrix(row, col));
    }
    j.push_back(row_array);
  }
  return j;
}

Eigen::MatrixXd json_to_real_matrix(const nlohmann::json& j) {
  if (!j.is_array() || j.empty()) {
    throw std::invalid_argument(
        "JSON must be a non-empty array for matrix conversion");
  }

  const auto rows = static_cast<Eigen::Index>(j.size());
  const auto cols = static_cast<Eigen::Index>(j[0].size());

  Eigen::MatrixXd matrix(rows, cols);
  for (Eigen::Index row = 0; row < rows; ++row) {
    if (!j[row].is_array() ||
        static_cast<Eigen::Index>(j[row].size()) != cols) {
      throw std::invalid_argument(
          "All rows must have the same length for matrix conversion");
    }
    for (Eigen::Index col = 0; col < cols; ++col) {
      matrix(row, col) = j[row][col].get<double>();
    }
  }
  return matrix;
}

}  // namespace

nlohmann::json complex_matrix_to_json(const Eigen::MatrixXcd& matrix) {
  nlohmann::json j;
  j["real"] = real_matrix_to_json(matrix.real());
  j["imag"] = real_matrix_to_json(matrix.imag());
  return j;
}

Eigen::MatrixXcd json_to_complex_matrix(const nlohmann::json& j) {
  if (!j.is_object() || !j.contains("real") || !j.contains("imag")) {
    throw std::invalid_argument(
        "Complex matrix JSON must be an object with 'real' and 'imag' parts");
  }
  Eigen::MatrixXd real = json_to_real_matrix(j["real"]);
  Eigen::MatrixXd imag = json_to_real_matrix(j["imag"]);
  if (real.rows() != imag.rows() || real.cols() != imag.cols()) {
    throw std::invalid_argument(
        "Real and imaginary parts of a complex matrix must have the same "
        "shape");
  }
  Eigen::MatrixXcd matrix(real.rows(), real.cols());
  matrix.real() = real;
  matrix.imag() = imag;
  return matrix;
}

std::tuple<int, int, int> parse_version_string(
    const std::string& version_string) {
  std::size_t first_dot = version_string.find('.');
  std::size_t second_dot = version_string.find('.', first_dot + 1);

  if (first_dot == std::string::npos || second_dot == std::string::npos) {
    throw std::runtime_error(
        "Invalid version string format. Expected 'major.minor.patch', got: " +
        version_string);
  }

  try {
    int major = std::stoi(version_string.substr(0, first_dot));
    int minor = std::stoi(
        version_string.substr(first_dot + 1, second_dot - first_dot - 1));
    int patch = std::stoi(version_string.substr(second_dot + 1));

    return std::make_tuple(major, minor, patch);
  } catch (const std::logic_error&) {
    throw std::runtime_error(
        "Invalid version string format. Expected 'major.minor.patch', got: " +
        version_string);
  }
}

void validate_serialization_version(const std::string& expected_version,
                                    const std::string& found_version) {
  if (expected_version == found_version) {
    return;
  }

  auto [expected_major, expected_minor, expected_patch] =
      parse_version_string(expected_version);
  auto [found_major, found_minor, found_patch] =
      parse_version_string(found_version);

  if (expected_major != found_major) {
    throw std::runtime_error(
        "Serialization version major mismatch. Expected: " + expected_version +
        ", Found: " + found_version +
        ". Major version differences are not compatible.");
  }

  if (expected_minor != found_minor) {
    throw std::runtime_error(
        "Serialization version minor mismatch. Expected: " + expected_version +
        ", Found: " + found_version +
        ". Minor version differences are not compatible.");
  }

  // Patch differences are accepted
}

}  // namespace qterm::data
