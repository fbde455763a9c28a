// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <H5Cpp.h>

#include <concepts>
#include <cstdint>
#include <limits>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <qterm/data/data_class.hpp>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <variant>
#include <vector>

namespace qterm::data {

/**
 * @brief Type-safe variant for storing setting values
 *
 * All integer types are stored as int64_t. Other integer types can be
 * requested through get<T>() and are range checked on conversion.
 */
using SettingValue =
    std::variant<bool, int64_t, double, std::string, std::vector<int64_t>,
                 std::vector<double>, std::vector<std::string>>;

/**
 * @brief Inclusive [min, max] bounds for a numeric setting
 */
template <typename T>
struct BoundConstraint {
  T min = std::numeric_limits<T>::lowest();  ///< Minimum (inclusive)
  T max = std::numeric_limits<T>::max();     ///< Maximum (inclusive)
};

/**
 * @brief Explicit list of allowed values for a setting
 */
template <typename T>
struct ListConstraint {
  std::vector<T> allowed_values;
};

using Constraint =
    std::variant<BoundConstraint<int64_t>, BoundConstraint<double>,
                 ListConstraint<int64_t>, ListConstraint<std::string>>;

template <typename T, typename Variant>
struct is_variant_member_impl;

template <typename T, typename... Ts>
struct is_variant_member_impl<T, std::variant<Ts...>>
    : std::bool_constant<(std::is_same_v<T, Ts> || ...)> {};

template <typename T, typename Variant>
concept VariantMember = is_variant_member_impl<T, Variant>::value;

template <typename T>
concept NonBoolIntegral = std::integral<T> && !std::same_as<T, bool>;

/**
 * @brief Types accepted by Settings::set / Settings::get
 */
template <typename T>
concept SupportedSettingType =
    VariantMember<T, SettingValue> || NonBoolIntegral<T>;

class SettingsAreLocked : public std::runtime_error {
 public:
  explicit SettingsAreLocked()
      : std::runtime_error("Settings are locked: please modify a copy.") {}
};

class SettingNotFound : public std::runtime_error {
 public:
  explicit SettingNotFound(const std::string& key)
      : std::runtime_error("Setting not found: " + key) {}
};

class SettingTypeMismatch : public std::runtime_error {
 public:
  explicit SettingTypeMismatch(const std::string& key,
                               const std::string& expected_type)
      : std::runtime_error("Type mismatch for setting '" + key +
                           "'. Expected: " + expected_type) {}
};

/**
 * @brief Base class for algorithm settings
 *
 * The set of keys is fixed by the derived class constructor through the
 * protected set_default methods. After construction only existing keys can be
 * modified, and only with a value of the same type that satisfies the
 * registered constraint.
 *
 * ```cpp
 * class TrotterSettings : public Settings {
 *  public:
 *   TrotterSettings() {
 *     set_default("time_step", 0.01, "Largest step size",
 *                 BoundConstraint<double>{1e-12, 1e6});
 *     set_default<int64_t>("order", 2, "Product formula order",
 *                          ListConstraint<int64_t>{{1, 2}});
 *   }
 * };
 * ```
 */
class Settings : public DataClass,
                 public std::enable_shared_from_this<Settings> {
 public:
  Settings() = default;
  virtual ~Settings() = default;
  Settings(const Settings& other) = default;
  Settings(Settings&& other) noexcept = default;
  Settings& operator=(const Settings& other) = delete;
  Settings& operator=(Settings&& other) noexcept = default;

  /**
   * @brief Set an existing setting
   * @throws SettingsAreLocked if lock() was called
   * @throws SettingNotFound if @p key was never declared
   * @throws SettingTypeMismatch if @p value holds a different type
   * @throws std::invalid_argument if @p value violates the constraint
   */
  void set(const std::string& key, const SettingValue& value);

  void set(const std::string& key, const char* value);

  template <typename T>
    requires SupportedSettingType<T> && (!std::same_as<T, SettingValue>)
  void set(const std::string& key, const T& value) {
    if constexpr (VariantMember<T, SettingValue>) {
      set(key, SettingValue(value));
    } else {
      if constexpr (std::is_unsigned_v<T>) {
        if (value > static_cast<T>(std::numeric_limits<int64_t>::max())) {
          throw std::out_of_range("Value for setting '" + key +
                                  "' cannot be represented as int64_t.");
        }
      }
      set(key, SettingValue(static_cast<int64_t>(value)));
    }
  }

  /**
   * @brief Get a setting value as variant
   * @throws SettingNotFound if key doesn't exist
   */
  SettingValue get(const std::string& key) const;

  /**
   * @brief Get a setting value with type checking
   * @throws SettingNotFound if key doesn't exist
   * @throws SettingTypeMismatch if the stored type differs, or an integer does
   * not fit into @p T
   */
  template <typename T>
    requires SupportedSettingType<T>
  T get(const std::string& key) const {
    const SettingValue& value = get_ref_(key);
    if constexpr (VariantMember<T, SettingValue>) {
      if (const T* stored = std::get_if<T>(&value)) {
        return *stored;
      }
      throw SettingTypeMismatch(key, typeid(T).name());
    } else {
      const int64_t* stored = std::get_if<int64_t>(&value);
      if (stored == nullptr || !std::in_range<T>(*stored)) {
        throw SettingTypeMismatch(key, typeid(T).name());
      }
      return static_cast<T>(*stored);
    }
  }

  SettingValue get_or_default(const std::string& key,
                              const SettingValue& default_value) const;

  /**
   * @brief Typed get that falls back to @p default_value when the key is
   * missing or holds an incompatible value
   */
  template <typename T>
    requires SupportedSettingType<T>
  T get_or_default(const std::string& key, const T& default_value) const {
    if (!has(key)) {
      return default_value;
    }
    try {
      return get<T>(key);
    } catch (const SettingTypeMismatch&) {
      return default_value;
    }
  }

  bool has(const std::string& key) const;
  std::vector<std::string> keys() const;
  size_t size() const;
  bool empty() const;

  /// Render a single value for display
  std::string get_as_string(const std::string& key) const;

  const std::map<std::string, SettingValue>& get_all_settings() const;

  /**
   * @brief Throw SettingNotFound for the first missing key
   */
  void validate_required(const std::vector<std::string>& required_keys) const;

  bool has_description(const std::string& key) const;
  std::string get_description(const std::string& key) const;
  bool has_limits(const std::string& key) const;
  Constraint get_limits(const std::string& key) const;

  /// Name of the type currently held by @p key ("double", "int", ...)
  std::string get_type_name(const std::string& key) const;

  void update(const std::string& key, const SettingValue& value);
  void update(const std::map<std::string, SettingValue>& updates_map);

  /**
   * @brief Apply string-valued updates, parsing each to the stored type
   */
  void update(const std::map<std::string, std::string>& updates_map);

  /**
   * @brief Copy every key of @p other_settings that this object also declares
   */
  void update(const Settings& other_settings);

  /**
   * @brief Make the settings read-only
   */
  void lock() const;
  bool is_locked() const { return _locked; }

  // DataClass interface
  std::string get_data_type_name() const override { return "settings"; }
  std::string get_summary() const override;
  nlohmann::json to_json() const override;
  void to_json_file(const std::string& filename) const override;
  void to_hdf5(H5::Group& group) const override;
  void to_hdf5_file(const std::string& filename) const override;
  void to_file(const std::string& filename,
               const std::string& type) const override;

  static std::shared_ptr<Settings> from_json(const nlohmann::json& json_obj);
  static std::shared_ptr<Settings> from_json_file(const std::string& filename);
  static std::shared_ptr<Settings> from_hdf5(H5::Group& group);
  static std::shared_ptr<Settings> from_hdf5_file(const std::string& filename);
  static std::shared_ptr<Settings> from_file(const std::string& filename,
                                             const std::string& type);

 protected:
  /**
   * @brief Declare a setting (no-op if the key already exists)
   * @param key The setting key
   * @param value The default value
   * @param description Optional documentation string
   * @param limit Optional constraint checked by set()
   * @throws std::invalid_argument if @p limit does not fit the value type, or
   * the default itself violates it
   */
  void set_default(const std::string& key, const SettingValue& value,
                   std::optional<std::string> description = std::nullopt,
                   std::optional<Constraint> limit = std::nullopt);

  void set_default(const std::string& key, const char* value,
                   std::optional<std::string> description = std::nullopt,
                   std::optional<Constraint> limit = std::nullopt);

  template <typename T>
    requires SupportedSettingType<T> && (!std::same_as<T, SettingValue>)
  void set_default(const std::string& key, const T& value,
                   std::optional<std::string> description = std::nullopt,
                   std::optional<Constraint> limit = std::nullopt) {
    if constexpr (VariantMember<T, SettingValue>) {
      set_default(key, SettingValue(value), std::move(description),
                  std::move(limit));
    } else {
      set_default(key, SettingValue(static_cast<int64_t>(value)),
                  std::move(description), std::move(limit));
    }
  }

 private:
  static constexpr const char* SERIALIZATION_VERSION = "0.1.0";

  const SettingValue& get_ref_(const std::string& key) const;
  void validate_against_limit_(const std::string& key,
                               const SettingValue& value) const;
  SettingValue parse_string_to_setting_value(const std::string& key,
                                             const std::string& text) const;

  static std::string visit_to_string(const SettingValue& value);
  static nlohmann::json convert_setting_value_to_json(
      const SettingValue& value);
  static SettingValue convert_json_to_setting_value(const nlohmann::json& j);

  std::map<std::string, SettingValue> settings_;
  std::map<std::string, std::string> descriptions_;
  std::map<std::string, Constraint> limits_;
  mutable bool _locked = false;
};

static_assert(DataClassCompliant<Settings>,
              "Settings must derive from DataClass and implement all required "
              "deserialization methods");

}  // namespace qterm::data
