// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <H5Cpp.h>

#include <algorithm>
#include <fstream>
#include <qterm/data/term.hpp>
#include <qterm/utils/logger.hpp>
#include <qterm/utils/tensor_utils.hpp>
#include <set>
#include <sstream>
#include <stdexcept>
#include <unsupported/Eigen/MatrixFunctions>
#include <utility>

#include "filename_utils.hpp"
#include "hdf5_error_handling.hpp"
#include "hdf5_serialization.hpp"
#include "json_serialization.hpp"

namespace qterm::data {

Term::Term(Eigen::MatrixXcd matrix, std::vector<std::uint64_t> target_qubits)
    : _target_qubits(std::move(target_qubits)), _matrix(std::move(matrix)) {
  validate_target_qubits(_target_qubits);
  const Eigen::Index dim = Eigen::Index(1) << _target_qubits.size();
  if (_matrix->rows() != dim || _matrix->cols() != dim) {
    throw std::invalid_argument(
        "Term matrix of shape (" + std::to_string(_matrix->rows()) + ", " +
        std::to_string(_matrix->cols()) + ") does not match " +
        std::to_string(_target_qubits.size()) + " target qubits");
  }
}

Term::Term(std::complex<double> scalar)
    : _matrix(Eigen::MatrixXcd::Constant(1, 1, scalar)) {}

Term::Term(std::vector<std::uint64_t> target_qubits)
    : _target_qubits(std::move(target_qubits)) {
  validate_target_qubits(_target_qubits);
}

void Term::validate_target_qubits(
    const std::vector<std::uint64_t>& target_qubits) {
  std::set<std::uint64_t> unique(target_qubits.begin(), target_qubits.end());
  if (unique.size() != target_qubits.size()) {
    throw std::invalid_argument("Term target qubits must be distinct");
  }
}

Eigen::MatrixXcd Term::compute_matrix() const {
  throw std::logic_error("Term has neither a matrix nor a way to build one");
}

const Eigen::MatrixXcd& Term::get_matrix() const {
  if (!_matrix) {
    _matrix = compute_matrix();
  }
  return *_matrix;
}

Eigen::MatrixXcd Term::exponential(double dt) const {
  const auto& matrix = get_matrix();
  if (matrix.rows() != matrix.cols()) {
    throw std::invalid_argument("Cannot exponentiate a non-square matrix");
  }
  if (!matrix.allFinite()) {
    throw std::invalid_argument(
        "Cannot exponentiate a matrix with non-finite entries");
  }
  const Eigen::MatrixXcd generator = std::complex<double>(0.0, -dt) * matrix;
  return generator.exp();
}

std::shared_ptr<gates::Unitary> Term::exponential_gate(double dt) const {
  return std::make_shared<gates::Unitary>(exponential(dt), _target_qubits);
}

std::shared_ptr<gates::Unitary> Term::as_gate() const {
  if (!_gate) {
    _gate = std::make_shared<gates::Unitary>(get_matrix(), _target_qubits);
  }
  return _gate;
}

std::shared_ptr<Term> Term::scale(std::complex<double> x) const {
  auto scaled = std::make_shared<Term>(x * get_matrix(), _target_qubits);
  scaled->_hamiltonian = _hamiltonian;
  return scaled;
}

std::shared_ptr<Term> Term::merge(const Term& other) const {
  const auto& other_qubits = other.get_target_qubits();
  const std::size_t k = _target_qubits.size();
  const std::size_t m = other_qubits.size();

  for (auto qubit : other_qubits) {
    if (std::find(_target_qubits.begin(), _target_qubits.end(), qubit) ==
        _target_qubits.end()) {
      throw std::invalid_argument(
          "Cannot merge a term acting on qubit " + std::to_string(qubit) +
          " into a term that does not act on it");
    }
  }
  QTERM_LOGGER().trace("Merging {}-qubit term into {}-qubit term", m, k);

  // other's axes come first, followed by the k - m identity axes
  const Eigen::Index extra_dim = Eigen::Index(1) << (k - m);
  Eigen::MatrixXcd expanded = utils::kron(
      other.get_matrix(), Eigen::MatrixXcd::Identity(extra_dim, extra_dim));

  std::vector<std::size_t> order(k);
  std::size_t next_extra = m;
  for (std::size_t i = 0; i < k; ++i) {
    auto it = std::find(other_qubits.begin(), other_qubits.end(),
                        _target_qubits[i]);
    if (it != other_qubits.end()) {
      order[i] = static_cast<std::size_t>(it - other_qubits.begin());
    } else {
      order[i] = next_extra++;
    }
  }

  Eigen::MatrixXcd embedded = utils::permute_qubit_axes(expanded, order);
  return std::make_shared<Term>(get_matrix() + embedded, _target_qubits);
}

Eigen::MatrixXcd Term::operator()(const Eigen::MatrixXcd& state,
                                  bool density_matrix) const {
  auto gate = as_gate();
  gate->set_density_matrix(density_matrix);
  return (*gate)(state);
}

std::shared_ptr<Term> operator*(std::complex<double> x, const Term& term) {
  return term.scale(x);
}

std::shared_ptr<Term> operator*(const Term& term, std::complex<double> x) {
  return term.scale(x);
}

std::string Term::get_summary() const {
  std::ostringstream oss;
  oss << "Term Summary:\n";
  oss << "  Target qubits: (";
  for (std::size_t i = 0; i < _target_qubits.size(); ++i) {
    if (i > 0) oss << ", ";
    oss << _target_qubits[i];
  }
  oss << ")\n";
  if (_matrix) {
    oss << "  Matrix dimension: " << _matrix->rows() << "x" << _matrix->cols()
        << "\n";
  } else {
    oss << "  Matrix: not yet materialized\n";
  }
  if (_hamiltonian) {
    oss << "  Hamiltonian id: " << *_hamiltonian << "\n";
  }
  return oss.str();
}

nlohmann::json Term::to_json() const {
  nlohmann::json j;
  j["version"] = SERIALIZATION_VERSION;
  j["target_qubits"] = vector_to_json(_target_qubits);
  j["matrix"] = complex_matrix_to_json(get_matrix());
  return j;
}

std::shared_ptr<Term> Term::from_json(const nlohmann::json& j) {
  try {
    if (!j.contains("version")) {
      throw std::runtime_error("Invalid JSON: missing version field");
    }
    validate_serialization_version(SERIALIZATION_VERSION,
                                   j["version"].get<std::string>());

    if (!j.contains("target_qubits") || !j.contains("matrix")) {
      throw std::runtime_error(
          "Invalid JSON: missing target_qubits or matrix field");
    }
    auto target_qubits = json_to_vector<std::uint64_t>(j["target_qubits"]);
    auto matrix = json_to_complex_matrix(j["matrix"]);
    return std::make_shared<Term>(std::move(matrix), std::move(target_qubits));
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse Term from JSON: " +
                             std::string(e.what()));
  }
}

void Term::to_json_file(const std::string& filename) const {
  std::string validated_filename =
      DataTypeFilename::validate_write_suffix(filename, get_data_type_name());

  std::ofstream file(validated_filename);
  if (!file.is_open()) {
    throw std::runtime_error("Failed to open file for writing: " +
                             validated_filename);
  }
  file << to_json().dump(2);
  file.close();
  if (file.fail()) {
    throw std::runtime_error("Failed to write to file: " + validated_filename);
  }
}

std::shared_ptr<Term> Term::from_json_file(const std::string& filename) {
  std::string validated_filename =
      DataTypeFilename::validate_read_suffix(filename, "term");

  std::ifstream file(validated_filename);
  if (!file.is_open()) {
    throw std::runtime_error("Failed to open file for reading: " +
                             validated_filename);
  }
  nlohmann::json j;
  try {
    file >> j;
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse JSON file " +
                             validated_filename + ": " + e.what());
  }
  return from_json(j);
}

void Term::to_hdf5(H5::Group& group) const {
  try {
    write_string_attribute(group, "version", SERIALIZATION_VERSION);
    save_qubits_to_group(group, "target_qubits", _target_qubits);
    save_complex_matrix_to_group(group, "matrix", get_matrix());
  } catch (const H5::Exception& e) {
    throw std::runtime_error("HDF5 error: " + std::string(e.getCDetailMsg()));
  }
}

std::shared_ptr<Term> Term::from_hdf5(H5::Group& group) {
  try {
    if (!group.attrExists("version")) {
      throw std::runtime_error(
          "HDF5 group missing required 'version' attribute");
    }
    validate_serialization_version(SERIALIZATION_VERSION,
                                   read_string_attribute(group, "version"));

    auto target_qubits = load_qubits_from_group(group, "target_qubits");
    auto matrix = load_complex_matrix_from_group(group, "matrix");
    return std::make_shared<Term>(std::move(matrix), std::move(target_qubits));
  } catch (const H5::Exception& e) {
    throw std::runtime_error("HDF5 error: " + std::string(e.getCDetailMsg()));
  }
}

void Term::to_hdf5_file(const std::string& filename) const {
  std::string validated_filename =
      DataTypeFilename::validate_write_suffix(filename, get_data_type_name());
  configure_hdf5_error_printing();

  try {
    H5::H5File file(validated_filename, H5F_ACC_TRUNC);
    H5::Group term_group = file.createGroup("/term");
    to_hdf5(term_group);
  } catch (const H5::Exception& e) {
    throw std::runtime_error("HDF5 error: " + std::string(e.getCDetailMsg()));
  }
}

std::shared_ptr<Term> Term::from_hdf5_file(const std::string& filename) {
  std::string validated_filename =
      DataTypeFilename::validate_read_suffix(filename, "term");
  configure_hdf5_error_printing();

  H5::H5File file;
  try {
    file.openFile(validated_filename, H5F_ACC_RDONLY);
  } catch (const H5::Exception&) {
    throw std::runtime_error("Unable to open Term HDF5 file '" +
                             validated_filename +
                             "'. Please check that the file exists, is a "
                             "valid HDF5 file, and you have read permissions.");
  }

  try {
    H5::Group term_group = file.openGroup("/term");
    return from_hdf5(term_group);
  } catch (const H5::Exception& e) {
    throw std::runtime_error("Unable to read Term data from HDF5 file '" +
                             validated_filename +
                             "'. HDF5 error: " + std::string(e.getCDetailMsg()));
  }
}

void Term::to_file(const std::string& filename, const std::string& type) const {
  if (type == "json") {
    to_json_file(filename);
  } else if (type == "hdf5") {
    to_hdf5_file(filename);
  } else {
    throw std::invalid_argument("Unknown file type: " + type +
                                ". Supported types are: json, hdf5");
  }
}

std::shared_ptr<Term> Term::from_file(const std::string& filename,
                                      const std::string& type) {
  if (type == "json") {
    return from_json_file(filename);
  } else if (type == "hdf5") {
    return from_hdf5_file(filename);
  }
  throw std::invalid_argument("Unknown file type: " + type +
                              ". Supported types are: json, hdf5");
}

}  // namespace qterm::data
