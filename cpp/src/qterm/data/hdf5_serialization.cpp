// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include "hdf5_serialization.hpp"

#include <stdexcept>

namespace qterm::data {

namespace {

using RowMajorMatrixXd =
    Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

void save_real_matrix(H5::Group& group, const std::string& dataset_name,
                      const RowMajorMatrixXd& matrix) {
  hsize_t dims[2] = {static_cast<hsize_t>(matrix.rows()),
                     static_cast<hsize_t>(matrix.cols())};
  H5::DataSpace dataspace(2, dims);
  H5::DataSet dataset =
      group.createDataSet(dataset_name, H5::PredType::NATIVE_DOUBLE, dataspace);
  dataset.write(matrix.data(), H5::PredType::NATIVE_DOUBLE);
}

RowMajorMatrixXd load_real_matrix(H5::Group& group,
                                  const std::string& dataset_name) {
  H5::DataSet dataset = group.openDataSet(dataset_name);
  H5::DataSpace dataspace = dataset.getSpace();
  if (dataspace.getSimpleExtentNdims() != 2) {
    throw std::runtime_error("Dataset '" + dataset_name +
                             "' is not a two-dimensional matrix");
  }
  hsize_t dims[2];
  dataspace.getSimpleExtentDims(dims);
  RowMajorMatrixXd matrix(dims[0], dims[1]);
  dataset.read(matrix.data(), H5::PredType::NATIVE_DOUBLE);
  return matrix;
}

}  // namespace

void save_complex_matrix_to_group(H5::Group& group,
                                  const std::string& dataset_name,
                                  const Eigen::MatrixXcd& matrix) {
  save_real_matrix(group, dataset_name + "_real", matrix.real());
  save_real_matrix(group, dataset_name + "_imag", matrix.imag());
}

Eigen::MatrixXcd load_complex_matrix_from_group(
    H5::Group& group, const std::string& dataset_name) {
  RowMajorMatrixXd real = load_real_matrix(group, dataset_name + "_real");
  RowMajorMatrixXd imag = load_real_matrix(group, dataset_name + "_imag");
  if (real.rows() != imag.rows() || real.cols() != imag.cols()) {
    throw std::runtime_error("Real and imaginary parts of '" + dataset_name +
                             "' have different shapes");
  }
  Eigen::MatrixXcd matrix(real.rows(), real.cols());
  matrix.real() = real;
  matrix.imag() = imag;
  return matrix;
}

void save_qubits_to_group(H5::Group& group, const std::string& dataset_name,
                          const std::vector<std::uint64_t>& qubits) {
  // An empty qubit list is encoded by the absence of the dataset
  if (!qubits.empty()) {
    hsize_t dims[1] = {qubits.size()};
    H5::DataSpace dataspace(1, dims);
    H5::DataSet dataset = group.createDataSet(
        dataset_name, H5::PredType::NATIVE_UINT64, dataspace);
    dataset.write(qubits.data(), H5::PredType::NATIVE_UINT64);
  }
}

std::vector<std::uint64_t> load_qubits_from_group(
    H5::Group& group, const std::string& dataset_name) {
  if (!dataset_exists_in_group(group, dataset_name)) {
    return {};
  }
  H5::DataSet dataset = group.openDataSet(dataset_name);
  H5::DataSpace dataspace = dataset.getSpace();
  hsize_t dims[1];
  dataspace.getSimpleExtentDims(dims);
  std::vector<std::uint64_t> qubits(dims[0]);
  dataset.read(qubits.data(), H5::PredType::NATIVE_UINT64);
  return qubits;
}

void write_string_attribute(H5::H5Object& object, const std::string& name,
                            const std::string& value) {
  H5::StrType string_type(H5::PredType::C_S1, value.size() + 1);
  H5::DataSpace scalar_space(H5S_SCALAR);
  H5::Attribute attribute =
      object.createAttribute(name, string_type, scalar_space);
  attribute.write(string_type, value);
}

std::string read_string_attribute(H5::H5Object& object,
                                  const std::string& name) {
  if (!object.attrExists(name)) {
    throw std::runtime_error("HDF5 attribute '" + name + "' not found");
  }
  H5::Attribute attribute = object.openAttribute(name);
  H5::StrType string_type = attribute.getStrType();
  std::string value;
  attribute.read(string_type, value);
  return value;
}

bool dataset_exists_in_group(H5::Group& group,
                             const std::string& dataset_name) {
  return group.nameExists(dataset_name);
}

bool group_exists_in_group(H5::Group& group, const std::string& group_name) {
  return group.nameExists(group_name);
}

}  // namespace qterm::data
