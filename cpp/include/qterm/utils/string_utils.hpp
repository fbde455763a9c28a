// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <cstddef>
#include <string>

namespace qterm::utils {

/**
 * @brief Convert a PascalCase/camelCase string to snake_case at runtime
 *
 * Inserts an underscore before each uppercase letter (except at position 0)
 * and lowercases all letters.
 *
 * @param input Input string in PascalCase or camelCase
 * @return std::string containing the snake_case version
 *
 * Examples:
 * - "Term" -> "term"
 * - "TermGroup" -> "term_group"
 */
inline std::string to_snake_case(const char* input) {
  std::string result;
  for (std::size_t i = 0; input[i] != '\0'; ++i) {
    char c = input[i];
    if (c >= 'A' && c <= 'Z') {
      if (i > 0) {
        result += '_';
      }
      result += static_cast<char>(c + 32);
    } else {
      result += c;
    }
  }
  return result;
}

/**
 * @def DATACLASS_TO_SNAKE_CASE
 * @brief Snake_case data type name for a data class, computed once per call
 * site
 *
 * @code
 * std::string get_data_type_name() const override {
 *   return DATACLASS_TO_SNAKE_CASE(Term);  // "term"
 * }
 * @endcode
 */
#define DATACLASS_TO_SNAKE_CASE(ClassName)                              \
  ([]() -> const char* {                                                \
    static const std::string result =                                   \
        qterm::utils::to_snake_case(#ClassName);                        \
    return result.c_str();                                              \
  }())

}  // namespace qterm::utils
