// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

namespace H5 {
class Group;
}

#include <concepts>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

namespace qterm::data {

/**
 * @brief Common interface of serializable qterm objects
 *
 * Data classes can describe themselves (get_summary) and persist to JSON or
 * HDF5. Files carry the data type name before the extension, e.g.
 * "zz.term.json" or "trotter.settings.h5".
 */
class DataClass {
 public:
  virtual ~DataClass() = default;

  /**
   * @brief Data type name used in file names and serialized payloads
   * @return snake_case type name (e.g. "term", "settings")
   */
  virtual std::string get_data_type_name() const = 0;

  /**
   * @brief Human-readable one-paragraph description of the object
   */
  virtual std::string get_summary() const = 0;

  /**
   * @brief Save object to file in the given format
   * @param filename Path to the output file
   * @param type "json" or "hdf5"
   * @throws std::invalid_argument if the format is not supported or the
   * filename lacks the data type suffix
   * @throws std::runtime_error if an I/O error occurs
   */
  virtual void to_file(const std::string& filename,
                       const std::string& type) const = 0;

  /**
   * @brief Serialize to a JSON object
   */
  virtual nlohmann::json to_json() const = 0;

  /**
   * @brief Save to a JSON file
   * @throws std::runtime_error if an I/O error occurs
   */
  virtual void to_json_file(const std::string& filename) const = 0;

  /**
   * @brief Write into an open HDF5 group
   * @throws std::runtime_error if an I/O error occurs
   */
  virtual void to_hdf5(H5::Group& group) const = 0;

  /**
   * @brief Save to an HDF5 file
   * @throws std::runtime_error if an I/O error occurs
   */
  virtual void to_hdf5_file(const std::string& filename) const = 0;

 protected:
  DataClass() = default;
  DataClass(const DataClass& other) = default;
  DataClass& operator=(const DataClass& other) = default;
  DataClass(DataClass&& other) = default;
  DataClass& operator=(DataClass&& other) = default;
};

/**
 * @brief A DataClass that also provides the static deserialization entry
 * points
 */
template <typename T>
concept DataClassCompliant = std::derived_from<T, DataClass> && requires {
  T::from_file(std::declval<std::string>(), std::declval<std::string>());
} && requires { T::from_json_file(std::declval<std::string>()); } && requires {
  T::from_json(std::declval<nlohmann::json>());
} && requires { T::from_hdf5_file(std::declval<std::string>()); } && requires {
  T::from_hdf5(std::declval<H5::Group&>());
};

}  // namespace qterm::data
