// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <mutex>
#include <qterm/utils/logger.hpp>
#include <stdexcept>

namespace qterm::utils {

namespace {

std::string normalize_level_name(std::string name) {
  std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  // spdlog spells it "warning" in to_string_view but parses "warn"
  if (name == "warning") return "warn";
  return name;
}

bool is_known_level(const std::string& name) {
  return name == "trace" || name == "debug" || name == "info" ||
         name == "warn" || name == "error" || name == "critical" ||
         name == "err" || name == "off";
}

}  // namespace

std::shared_ptr<spdlog::logger> Logger::get() {
  static std::once_flag init_flag;
  std::call_once(init_flag, []() {
    if (!spdlog::get(LOGGER_NAME)) {
      auto logger = spdlog::stderr_color_mt(LOGGER_NAME);
      logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
      logger->set_level(_level_from_environment());
    }
  });
  return spdlog::get(LOGGER_NAME);
}

void Logger::set_global_level(spdlog::level::level_enum level) {
  get()->set_level(level);
}

void Logger::set_global_level(const std::string& level) {
  auto name = normalize_level_name(level);
  if (!is_known_level(name)) {
    throw std::invalid_argument("Unknown log level: '" + level + "'");
  }
  set_global_level(spdlog::level::from_str(name));
}

spdlog::level::level_enum Logger::get_global_level() {
  return get()->level();
}

void Logger::trace_entering(const std::source_location& location) {
  auto logger = get();
  if (logger->should_log(spdlog::level::trace)) {
    logger->trace("Entering {}", location.function_name());
  }
}

spdlog::level::level_enum Logger::_level_from_environment() {
  const char* env_value = std::getenv("QTERM_LOG_LEVEL");
  if (!env_value) {
    return spdlog::level::warn;
  }
  auto name = normalize_level_name(env_value);
  if (!is_known_level(name)) {
    return spdlog::level::warn;
  }
  return spdlog::level::from_str(name);
}

}  // namespace qterm::utils
