// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <H5Cpp.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace qterm::data {

/**
 * @brief Whether HDF5's own error stack printing should be silenced
 *
 * Set QTERM_PRINT_VERBOSE_HDF5_ERRORS to 1/true/yes/on to keep it.
 */
inline bool hdf5_errors_should_be_suppressed() {
  const char* env_value = std::getenv("QTERM_PRINT_VERBOSE_HDF5_ERRORS");
  if (!env_value) {
    return true;
  }

  std::string normalized(env_value);
  std::transform(
      normalized.begin(), normalized.end(), normalized.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  const bool verbose_requested = (normalized == "1" || normalized == "true" ||
                                  normalized == "yes" || normalized == "on");

  return !verbose_requested;
}

/**
 * @brief Silence HDF5 diagnostics unless verbose output was requested
 */
inline void configure_hdf5_error_printing() {
  if (hdf5_errors_should_be_suppressed()) {
    H5::Exception::dontPrint();
  }
}

}  // namespace qterm::data
