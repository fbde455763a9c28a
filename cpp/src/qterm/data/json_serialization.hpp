// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once
#include <Eigen/Dense>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <tuple>
#include <vector>

namespace qterm::data {

/**
 * @file json_serialization.hpp
 * @brief JSON helpers shared by the data classes
 */

/**
 * @brief Validate serialization version compatibility
 * @param expected_version The version string this code writes (e.g. "0.1.0")
 * @param found_version The version string found in the serialized data
 * @throws std::runtime_error if the major or minor versions differ
 */
void validate_serialization_version(const std::string& expected_version,
                                    const std::string& found_version);

/**
 * @brief Parse "major.minor.patch"
 * @throws std::runtime_error if the format is invalid
 */
std::tuple<int, int, int> parse_version_string(
    const std::string& version_string);

/**
 * @brief Complex matrix as {"real": [[...]], "imag": [[...]]}, row by row
 */
nlohmann::json complex_matrix_to_json(const Eigen::MatrixXcd& matrix);

/**
 * @brief Inverse of complex_matrix_to_json
 * @throws std::invalid_argument if the parts are missing, ragged, or of
 * different shapes
 */
Eigen::MatrixXcd json_to_complex_matrix(const nlohmann::json& j);

/**
 * @brief Convert std::vector to JSON array
 */
template <typename T>
nlohmann::json vector_to_json(const std::vector<T>& vector) {
  nlohmann::json j = nlohmann::json::array();
  for (const auto& element : vector) {
    j.push_back(element);
  }
  return j;
}

/**
 * @brief Convert JSON array to std::vector
 * @throws std::invalid_argument if @p j is not an array
 */
template <typename T>
std::vector<T> json_to_vector(const nlohmann::json& j) {
  if (!j.is_array()) {
    throw std::invalid_argument("JSON must be an array for vector conversion");
  }
  std::vector<T> vector;
  vector.reserve(j.size());
  for (const auto& element : j) {
    vector.push_back(element.get<T>());
  }
  return vector;
}

}  // namespace qterm::data
