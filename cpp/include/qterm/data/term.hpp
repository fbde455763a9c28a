// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <Eigen/Dense>
#include <complex>
#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <qterm/data/data_class.hpp>
#include <qterm/gates/unitary.hpp>
#include <qterm/utils/string_utils.hpp>
#include <string>
#include <vector>

namespace qterm::data {

/// Opaque identifier of the Hamiltonian a term was extracted from
using HamiltonianId = std::uint64_t;

/**
 * @class Term
 * @brief A dense operator tagged with the ordered qubits it acts on
 *
 * The matrix of a term over k qubits has shape 2^k x 2^k; target_qubits[i]
 * is tensor axis i of the matrix, axis 0 being the most significant bit of
 * the basis index. Terms are immutable: scaling and merging return new
 * objects.
 *
 * Subclasses may defer building the matrix by overriding compute_matrix();
 * the result is cached on first access.
 */
class Term : public DataClass {
 public:
  /**
   * @brief Construct a term from a dense matrix
   * @param matrix Operator of shape 2^k x 2^k
   * @param target_qubits k distinct qubit indices, in tensor axis order
   * @throws std::invalid_argument if the shape does not match the number of
   * qubits or the qubits are not distinct
   */
  Term(Eigen::MatrixXcd matrix, std::vector<std::uint64_t> target_qubits);

  /**
   * @brief Construct a pure scalar term (no qubit support, 1x1 matrix)
   */
  explicit Term(std::complex<double> scalar);

  virtual ~Term() = default;

  /**
   * @brief Dense matrix of the term, built and cached on first access
   */
  const Eigen::MatrixXcd& get_matrix() const;

  const std::vector<std::uint64_t>& get_target_qubits() const {
    return _target_qubits;
  }

  /// Number of target qubits
  std::size_t size() const { return _target_qubits.size(); }

  /**
   * @brief Matrix exponential exp(-i dt M)
   * @param dt Time step
   * @throws std::invalid_argument if the matrix is not square or contains
   * non-finite entries
   */
  Eigen::MatrixXcd exponential(double dt) const;

  /**
   * @brief Gate applying exp(-i dt M) to the target qubits
   */
  std::shared_ptr<gates::Unitary> exponential_gate(double dt) const;

  /**
   * @brief Gate wrapping the term matrix
   *
   * Built on first call; later calls return the same object.
   */
  std::shared_ptr<gates::Unitary> as_gate() const;

  /**
   * @brief Term with the matrix multiplied by @p x and the same qubits
   */
  virtual std::shared_ptr<Term> scale(std::complex<double> x) const;

  /**
   * @brief Add another term, embedded into this term's qubit space
   *
   * The other operator is tensored with the identity on the qubits it does
   * not act on and its axes are aligned with this term's target qubit order
   * before the two matrices are summed.
   *
   * @param other Term whose qubits are a subset of this term's qubits
   * @return New term over this term's target qubits
   * @throws std::invalid_argument if @p other acts on a qubit outside this
   * term's support
   */
  std::shared_ptr<Term> merge(const Term& other) const;

  /**
   * @brief Apply the term to a state
   * @param state State vector (single column) or, if @p density_matrix, a
   * square density matrix
   * @param density_matrix Apply as the ket half of a density matrix update
   * @return The transformed state
   */
  virtual Eigen::MatrixXcd operator()(const Eigen::MatrixXcd& state,
                                      bool density_matrix = false) const;

  /**
   * @brief Hamiltonian this term was extracted from, if any
   */
  const std::optional<HamiltonianId>& get_hamiltonian() const {
    return _hamiltonian;
  }

  void set_hamiltonian(std::optional<HamiltonianId> hamiltonian) {
    _hamiltonian = hamiltonian;
  }

  // DataClass interface
  std::string get_data_type_name() const override {
    return DATACLASS_TO_SNAKE_CASE(Term);
  }
  std::string get_summary() const override;
  nlohmann::json to_json() const override;
  void to_json_file(const std::string& filename) const override;
  void to_hdf5(H5::Group& group) const override;
  void to_hdf5_file(const std::string& filename) const override;
  void to_file(const std::string& filename,
               const std::string& type) const override;

  static std::shared_ptr<Term> from_json(const nlohmann::json& j);
  static std::shared_ptr<Term> from_json_file(const std::string& filename);
  static std::shared_ptr<Term> from_hdf5(H5::Group& group);
  static std::shared_ptr<Term> from_hdf5_file(const std::string& filename);
  static std::shared_ptr<Term> from_file(const std::string& filename,
                                         const std::string& type);

 protected:
  /**
   * @brief Construct a term whose matrix is produced by compute_matrix()
   */
  explicit Term(std::vector<std::uint64_t> target_qubits);

  /**
   * @brief Build the dense matrix of a lazily constructed term
   *
   * Only called when no matrix has been cached yet.
   */
  virtual Eigen::MatrixXcd compute_matrix() const;

  static void validate_target_qubits(
      const std::vector<std::uint64_t>& target_qubits);

  std::vector<std::uint64_t> _target_qubits;

  mutable std::optional<Eigen::MatrixXcd> _matrix;
  mutable std::shared_ptr<gates::Unitary> _gate;

  std::optional<HamiltonianId> _hamiltonian;

 private:
  static constexpr const char* SERIALIZATION_VERSION = "0.1.0";
};

/// Equivalent to term.scale(x)
std::shared_ptr<Term> operator*(std::complex<double> x, const Term& term);
std::shared_ptr<Term> operator*(const Term& term, std::complex<double> x);

static_assert(DataClassCompliant<Term>,
              "Term must derive from DataClass and implement all required "
              "deserialization methods");

}  // namespace qterm::data
