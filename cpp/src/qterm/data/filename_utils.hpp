// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once
#include <stdexcept>
#include <string>

namespace qterm::data {

/**
 * @brief Checks that file names carry the data type before the extension
 *
 * "zz.term.json" is a valid name for a Term, "zz.json" and
 * "zz.settings.json" are not.
 */
class DataTypeFilename {
 public:
  /**
   * @brief Validate a filename for writing
   * @param filename Filename to validate (e.g., "zz.term.json")
   * @param data_type Expected data type (e.g., "term")
   * @return The original filename if valid
   * @throws std::invalid_argument if the data type suffix is missing or wrong
   */
  static std::string validate_write_suffix(const std::string &filename,
                                           const std::string &data_type) {
    return _validate(filename, data_type);
  }

  /**
   * @brief Validate a filename for reading
   * @see validate_write_suffix
   */
  static std::string validate_read_suffix(const std::string &filename,
                                          const std::string &data_type) {
    return _validate(filename, data_type);
  }

 private:
  static std::string _validate(const std::string &filename,
                               const std::string &data_type) {
    if (filename.empty()) {
      throw std::invalid_argument("Filename cannot be empty");
    }
    size_t last_dot = filename.find_last_of('.');
    if (last_dot == std::string::npos) {
      throw std::invalid_argument("Invalid filename: Filename '" + filename +
                                  "' must have '." + data_type + "' suffix");
    }

    std::string base = filename.substr(0, last_dot);
    size_t second_last_dot = base.find_last_of('.');
    if (second_last_dot == std::string::npos) {
      throw std::invalid_argument("Invalid filename: Filename '" + filename +
                                  "' must have '." + data_type +
                                  ".' before the file extension");
    }

    std::string file_data_type = base.substr(second_last_dot + 1);
    if (file_data_type != data_type) {
      throw std::invalid_argument("Invalid filename: Filename '" + filename +
                                  "' has wrong data type '" + file_data_type +
                                  "', expected '" + data_type + "'");
    }
    return filename;
  }
};

}  // namespace qterm::data
