// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once
#include <H5Cpp.h>

#include <Eigen/Dense>
#include <cstdint>
#include <string>
#include <vector>

namespace qterm::data {

/**
 * @file hdf5_serialization.hpp
 * @brief HDF5 group-based serialization helpers
 *
 * Matrices are written row-major so that the on-disk layout matches the
 * logical (rows, cols) shape seen by other HDF5 readers.
 */

// Complex matrices are stored as two real datasets "<name>_real" and
// "<name>_imag"
void save_complex_matrix_to_group(H5::Group& group,
                                  const std::string& dataset_name,
                                  const Eigen::MatrixXcd& matrix);
Eigen::MatrixXcd load_complex_matrix_from_group(
    H5::Group& group, const std::string& dataset_name);

void save_qubits_to_group(H5::Group& group, const std::string& dataset_name,
                          const std::vector<std::uint64_t>& qubits);
std::vector<std::uint64_t> load_qubits_from_group(
    H5::Group& group, const std::string& dataset_name);

// Scalar string attributes
void write_string_attribute(H5::H5Object& object, const std::string& name,
                            const std::string& value);
std::string read_string_attribute(H5::H5Object& object,
                                  const std::string& name);

bool dataset_exists_in_group(H5::Group& group, const std::string& dataset_name);
bool group_exists_in_group(H5::Group& group, const std::string& group_name);

}  // namespace qterm::data
