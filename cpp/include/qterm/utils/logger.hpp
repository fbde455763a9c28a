// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <source_location>
#include <string>

namespace qterm::utils {

/**
 * @brief Access point for the library-wide spdlog logger.
 *
 * All qterm components log through a single named logger ("qterm") so that
 * the verbosity of the whole library can be adjusted in one place. The logger
 * is created on first use with a colour stderr sink. Its initial level is
 * taken from the QTERM_LOG_LEVEL environment variable (any name accepted by
 * spdlog::level::from_str, e.g. "trace", "debug", "info", "off") and falls
 * back to "warn".
 */
class Logger {
 public:
  /// Name under which the logger is registered with spdlog
  static constexpr const char* LOGGER_NAME = "qterm";

  /**
   * @brief Get the shared library logger, creating it if needed
   * @return Shared pointer to the qterm spdlog logger
   */
  static std::shared_ptr<spdlog::logger> get();

  /**
   * @brief Set the verbosity of the library logger
   * @param level New log level
   */
  static void set_global_level(spdlog::level::level_enum level);

  /**
   * @brief Set the verbosity of the library logger from a level name
   * @param level Level name ("trace", "debug", "info", "warn", "error",
   * "critical", "off")
   * @throws std::invalid_argument if the name is not a known level
   */
  static void set_global_level(const std::string& level);

  /**
   * @brief Current verbosity of the library logger
   */
  static spdlog::level::level_enum get_global_level();

  /**
   * @brief Emit a trace-level "entering" record for the calling function
   *
   * Use through QTERM_LOG_TRACE_ENTERING().
   */
  static void trace_entering(
      const std::source_location& location = std::source_location::current());

 private:
  static spdlog::level::level_enum _level_from_environment();
};

}  // namespace qterm::utils

/**
 * @def QTERM_LOGGER
 * @brief Reference to the library logger
 */
#define QTERM_LOGGER() (*::qterm::utils::Logger::get())

/**
 * @def QTERM_LOG_TRACE_ENTERING
 * @brief Trace entry into the enclosing function
 */
#define QTERM_LOG_TRACE_ENTERING() \
  ::qterm::utils::Logger::trace_entering(std::source_location::current())
