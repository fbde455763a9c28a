// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <algorithm>
#include <cctype>
#include <fstream>
#include <qterm/data/settings.hpp>
#include <sstream>

#include "filename_utils.hpp"
#include "hdf5_error_handling.hpp"
#include "hdf5_serialization.hpp"
#include "json_serialization.hpp"

namespace qterm::data {

namespace {

template <typename T>
inline constexpr bool is_vector_v = false;
template <typename T>
inline constexpr bool is_vector_v<std::vector<T>> = true;

template <typename T>
std::string join_options(const std::vector<T>& options) {
  std::ostringstream oss;
  oss << "[";
  for (size_t i = 0; i < options.size(); ++i) {
    if (i > 0) oss << ", ";
    oss << "\"" << options[i] << "\"";
  }
  oss << "]";
  return oss.str();
}

template <typename T>
void check_in_list(const std::string& key, const T& value,
                   const ListConstraint<T>& options) {
  if (std::find(options.allowed_values.begin(), options.allowed_values.end(),
                value) == options.allowed_values.end()) {
    throw std::invalid_argument(
        "Value for setting '" + key +
        "' is out of allowed options. Allowed options: " +
        join_options(options.allowed_values));
  }
}

template <typename T>
void check_in_bounds(const std::string& key, const T& value,
                     const BoundConstraint<T>& bounds) {
  if (bounds.min > value || value > bounds.max) {
    std::ostringstream oss;
    oss << "[" << bounds.min << ", " << bounds.max << "]";
    throw std::invalid_argument("Value for setting '" + key +
                                "' is out of allowed range. Allowed range: " +
                                oss.str());
  }
}

// HDF5 type tags written next to every stored value
std::string hdf5_type_tag(const SettingValue& value) {
  return std::visit(
      [](const auto& v) -> std::string {
        using ValueType = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<ValueType, bool>)
          return "bool";
        else if constexpr (std::is_same_v<ValueType, int64_t>)
          return "int64";
        else if constexpr (std::is_same_v<ValueType, double>)
          return "double";
        else if constexpr (std::is_same_v<ValueType, std::string>)
          return "string";
        else if constexpr (std::is_same_v<ValueType, std::vector<int64_t>>)
          return "vector<int64>";
        else if constexpr (std::is_same_v<ValueType, std::vector<double>>)
          return "vector<double>";
        else
          return "vector<string>";
      },
      value);
}

void save_string_dataset(H5::Group& group, const std::string& name,
                         const std::string& text) {
  H5::StrType str_type(H5::PredType::C_S1, H5T_VARIABLE);
  H5::DataSpace dataspace(H5S_SCALAR);
  H5::DataSet dataset = group.createDataSet(name, str_type, dataspace);
  dataset.write(text, str_type);
}

std::string load_string_dataset(H5::Group& group, const std::string& name) {
  H5::DataSet dataset = group.openDataSet(name);
  std::string text;
  dataset.read(text, dataset.getStrType());
  return text;
}

template <typename T>
void save_numeric_dataset(H5::Group& group, const std::string& name,
                          const std::vector<T>& values,
                          const H5::PredType& type) {
  hsize_t dims[1] = {values.size()};
  H5::DataSpace dataspace(1, dims);
  H5::DataSet dataset = group.createDataSet(name, type, dataspace);
  if (!values.empty()) {
    dataset.write(values.data(), type);
  }
}

template <typename T>
std::vector<T> load_numeric_dataset(H5::DataSet& dataset,
                                    const H5::PredType& type) {
  H5::DataSpace dataspace = dataset.getSpace();
  hsize_t dims[1] = {0};
  dataspace.getSimpleExtentDims(dims);
  std::vector<T> values(dims[0]);
  if (!values.empty()) {
    dataset.read(values.data(), type);
  }
  return values;
}

void save_setting_value(H5::Group& group, const std::string& name,
                        const SettingValue& value) {
  std::visit(
      [&group, &name](const auto& v) {
        using ValueType = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<ValueType, bool>) {
          save_numeric_dataset(group, name, std::vector<int>{v ? 1 : 0},
                               H5::PredType::NATIVE_INT);
        } else if constexpr (std::is_same_v<ValueType, int64_t>) {
          save_numeric_dataset(group, name, std::vector<int64_t>{v},
                               H5::PredType::NATIVE_INT64);
        } else if constexpr (std::is_same_v<ValueType, double>) {
          save_numeric_dataset(group, name, std::vector<double>{v},
                               H5::PredType::NATIVE_DOUBLE);
        } else if constexpr (std::is_same_v<ValueType, std::string>) {
          save_string_dataset(group, name, v);
        } else if constexpr (std::is_same_v<ValueType, std::vector<int64_t>>) {
          save_numeric_dataset(group, name, v, H5::PredType::NATIVE_INT64);
        } else if constexpr (std::is_same_v<ValueType, std::vector<double>>) {
          save_numeric_dataset(group, name, v, H5::PredType::NATIVE_DOUBLE);
        } else {
          H5::StrType str_type(H5::PredType::C_S1, H5T_VARIABLE);
          hsize_t dims[1] = {v.size()};
          H5::DataSpace dataspace(1, dims);
          H5::DataSet dataset = group.createDataSet(name, str_type, dataspace);
          if (!v.empty()) {
            std::vector<const char*> c_strings;
            c_strings.reserve(v.size());
            for (const auto& str : v) {
              c_strings.push_back(str.c_str());
            }
            dataset.write(c_strings.data(), str_type);
          }
        }
      },
      value);
  H5::DataSet dataset = group.openDataSet(name);
  write_string_attribute(dataset, "type", hdf5_type_tag(value));
}

SettingValue load_setting_value(H5::Group& group, const std::string& name) {
  H5::DataSet dataset = group.openDataSet(name);
  const std::string tag = read_string_attribute(dataset, "type");

  if (tag == "bool") {
    auto values = load_numeric_dataset<int>(dataset, H5::PredType::NATIVE_INT);
    return !values.empty() && values[0] != 0;
  } else if (tag == "int64") {
    auto values =
        load_numeric_dataset<int64_t>(dataset, H5::PredType::NATIVE_INT64);
    if (values.size() != 1) {
      throw std::runtime_error("Setting '" + name + "' is not a scalar");
    }
    return values[0];
  } else if (tag == "double") {
    auto values =
        load_numeric_dataset<double>(dataset, H5::PredType::NATIVE_DOUBLE);
    if (values.size() != 1) {
      throw std::runtime_error("Setting '" + name + "' is not a scalar");
    }
    return values[0];
  } else if (tag == "string") {
    return load_string_dataset(group, name);
  } else if (tag == "vector<int64>") {
    return load_numeric_dataset<int64_t>(dataset, H5::PredType::NATIVE_INT64);
  } else if (tag == "vector<double>") {
    return load_numeric_dataset<double>(dataset, H5::PredType::NATIVE_DOUBLE);
  } else if (tag == "vector<string>") {
    H5::StrType str_type(H5::PredType::C_S1, H5T_VARIABLE);
    H5::DataSpace dataspace = dataset.getSpace();
    hsize_t dims[1] = {0};
    dataspace.getSimpleExtentDims(dims);
    std::vector<std::string> values;
    if (dims[0] > 0) {
      std::vector<char*> c_strings(dims[0], nullptr);
      dataset.read(c_strings.data(), str_type);
      values.reserve(dims[0]);
      for (char* c_string : c_strings) {
        values.emplace_back(c_string ? c_string : "");
      }
      H5::DataSet::vlenReclaim(c_strings.data(), str_type, dataspace);
    }
    return values;
  }
  throw std::runtime_error("Unsupported setting type '" + tag +
                           "' for HDF5 dataset '" + name + "'");
}

}  // namespace

const SettingValue& Settings::get_ref_(const std::string& key) const {
  auto it = settings_.find(key);
  if (it == settings_.end()) {
    throw SettingNotFound(key);
  }
  return it->second;
}

void Settings::validate_against_limit_(const std::string& key,
                                       const SettingValue& value) const {
  auto limit_it = limits_.find(key);
  if (limit_it == limits_.end()) {
    return;
  }
  const Constraint& limit = limit_it->second;

  std::visit(
      [&key, &limit](const auto& v) {
        using ValueType = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<ValueType, std::string>) {
          if (auto options = std::get_if<ListConstraint<std::string>>(&limit)) {
            check_in_list(key, v, *options);
          }
        } else if constexpr (std::is_same_v<ValueType, int64_t>) {
          if (auto options = std::get_if<ListConstraint<int64_t>>(&limit)) {
            check_in_list(key, v, *options);
          } else if (auto bounds =
                         std::get_if<BoundConstraint<int64_t>>(&limit)) {
            check_in_bounds(key, v, *bounds);
          }
        } else if constexpr (std::is_same_v<ValueType, double>) {
          if (auto bounds = std::get_if<BoundConstraint<double>>(&limit)) {
            check_in_bounds(key, v, *bounds);
          }
        } else if constexpr (std::is_same_v<ValueType,
                                            std::vector<std::string>>) {
          if (auto options = std::get_if<ListConstraint<std::string>>(&limit)) {
            for (const auto& element : v) check_in_list(key, element, *options);
          }
        } else if constexpr (std::is_same_v<ValueType, std::vector<int64_t>>) {
          if (auto options = std::get_if<ListConstraint<int64_t>>(&limit)) {
            for (const auto& element : v) check_in_list(key, element, *options);
          } else if (auto bounds =
                         std::get_if<BoundConstraint<int64_t>>(&limit)) {
            for (const auto& element : v) check_in_bounds(key, element, *bounds);
          }
        } else if constexpr (std::is_same_v<ValueType, std::vector<double>>) {
          if (auto bounds = std::get_if<BoundConstraint<double>>(&limit)) {
            for (const auto& element : v) check_in_bounds(key, element, *bounds);
          }
        }
      },
      value);
}

void Settings::set(const std::string& key, const SettingValue& value) {
  if (_locked) {
    throw SettingsAreLocked();
  }
  const SettingValue& current = get_ref_(key);
  if (value.index() != current.index()) {
    throw SettingTypeMismatch(key, get_type_name(key));
  }
  validate_against_limit_(key, value);
  settings_[key] = value;
}

void Settings::set(const std::string& key, const char* value) {
  set(key, SettingValue(std::string(value)));
}

SettingValue Settings::get(const std::string& key) const {
  return get_ref_(key);
}

SettingValue Settings::get_or_default(const std::string& key,
                                      const SettingValue& default_value) const {
  auto it = settings_.find(key);
  if (it == settings_.end()) {
    return default_value;
  }
  return it->second;
}

bool Settings::has(const std::string& key) const {
  return settings_.find(key) != settings_.end();
}

std::vector<std::string> Settings::keys() const {
  std::vector<std::string> result;
  result.reserve(settings_.size());
  for (const auto& [key, value] : settings_) {
    result.push_back(key);
  }
  return result;
}

size_t Settings::size() const { return settings_.size(); }

bool Settings::empty() const { return settings_.empty(); }

std::string Settings::get_as_string(const std::string& key) const {
  return visit_to_string(get_ref_(key));
}

const std::map<std::string, SettingValue>& Settings::get_all_settings() const {
  return settings_;
}

void Settings::validate_required(
    const std::vector<std::string>& required_keys) const {
  for (const auto& key : required_keys) {
    if (!has(key)) {
      throw SettingNotFound(key);
    }
  }
}

bool Settings::has_description(const std::string& key) const {
  return descriptions_.find(key) != descriptions_.end();
}

std::string Settings::get_description(const std::string& key) const {
  auto it = descriptions_.find(key);
  if (it == descriptions_.end()) {
    throw SettingNotFound("No description found for setting: " + key);
  }
  return it->second;
}

bool Settings::has_limits(const std::string& key) const {
  return limits_.find(key) != limits_.end();
}

Constraint Settings::get_limits(const std::string& key) const {
  auto it = limits_.find(key);
  if (it == limits_.end()) {
    throw SettingNotFound("No limits found for setting: " + key);
  }
  return it->second;
}

std::string Settings::get_type_name(const std::string& key) const {
  return std::visit(
      [](const auto& value) -> std::string {
        using ValueType = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<ValueType, bool>)
          return "bool";
        else if constexpr (std::is_same_v<ValueType, int64_t>)
          return "int64_t";
        else if constexpr (std::is_same_v<ValueType, double>)
          return "double";
        else if constexpr (std::is_same_v<ValueType, std::string>)
          return "string";
        else if constexpr (std::is_same_v<ValueType, std::vector<int64_t>>)
          return "vector<int64_t>";
        else if constexpr (std::is_same_v<ValueType, std::vector<double>>)
          return "vector<double>";
        else
          return "vector<string>";
      },
      get_ref_(key));
}

void Settings::update(const std::string& key, const SettingValue& value) {
  set(key, value);
}

void Settings::update(const std::map<std::string, SettingValue>& updates_map) {
  if (_locked) {
    throw SettingsAreLocked();
  }
  // Validate everything first so a failed update leaves no partial change
  for (const auto& [key, value] : updates_map) {
    if (get_ref_(key).index() != value.index()) {
      throw SettingTypeMismatch(key, get_type_name(key));
    }
    validate_against_limit_(key, value);
  }
  for (const auto& [key, value] : updates_map) {
    settings_[key] = value;
  }
}

void Settings::update(const std::map<std::string, std::string>& updates_map) {
  if (_locked) {
    throw SettingsAreLocked();
  }
  std::map<std::string, SettingValue> converted_updates;
  for (const auto& [key, str_value] : updates_map) {
    if (!has(key)) {
      throw SettingNotFound(key);
    }
    try {
      converted_updates[key] = parse_string_to_setting_value(key, str_value);
    } catch (const std::exception& conversion_exception) {
      throw std::runtime_error("Failed to convert value for key '" + key +
                               "': " + conversion_exception.what());
    }
  }
  update(converted_updates);
}

void Settings::update(const Settings& other_settings) {
  if (_locked) {
    throw SettingsAreLocked();
  }
  std::map<std::string, SettingValue> shared;
  for (const auto& [key, value] : other_settings.get_all_settings()) {
    if (has(key)) {
      shared[key] = value;
    }
  }
  update(shared);
}

void Settings::lock() const { _locked = true; }

void Settings::set_default(const std::string& key, const SettingValue& value,
                           std::optional<std::string> description,
                           std::optional<Constraint> limit) {
  if (has(key)) {
    return;
  }
  if (limit.has_value()) {
    const bool is_bool = std::holds_alternative<bool>(value);
    const bool is_string =
        std::holds_alternative<std::string>(value) ||
        std::holds_alternative<std::vector<std::string>>(value);
    const bool is_double = std::holds_alternative<double>(value) ||
                           std::holds_alternative<std::vector<double>>(value);
    if (is_bool) {
      throw std::invalid_argument("Limit cannot be set for boolean settings");
    }
    if (is_string &&
        !std::holds_alternative<ListConstraint<std::string>>(*limit)) {
      throw std::invalid_argument(
          "String settings require a ListConstraint<std::string> limit");
    }
    if (is_double && !std::holds_alternative<BoundConstraint<double>>(*limit)) {
      throw std::invalid_argument(
          "Floating point settings require a BoundConstraint<double> limit");
    }
    if (!is_string && !is_double &&
        !(std::holds_alternative<ListConstraint<int64_t>>(*limit) ||
          std::holds_alternative<BoundConstraint<int64_t>>(*limit))) {
      throw std::invalid_argument(
          "Integer settings require a ListConstraint<int64_t> or "
          "BoundConstraint<int64_t> limit");
    }
    limits_[key] = *limit;
  }
  // The default must itself be admissible
  try {
    validate_against_limit_(key, value);
  } catch (const std::invalid_argument&) {
    limits_.erase(key);
    throw;
  }
  settings_[key] = value;
  if (description.has_value()) {
    descriptions_[key] = *description;
  }
}

void Settings::set_default(const std::string& key, const char* value,
                           std::optional<std::string> description,
                           std::optional<Constraint> limit) {
  set_default(key, SettingValue(std::string(value)), std::move(description),
              std::move(limit));
}

std::string Settings::visit_to_string(const SettingValue& value) {
  return std::visit(
      [](const auto& variant_value) -> std::string {
        using ValueType = std::decay_t<decltype(variant_value)>;

        if constexpr (std::is_same_v<ValueType, bool>) {
          return variant_value ? "true" : "false";
        } else if constexpr (std::is_same_v<ValueType, std::string>) {
          return variant_value;
        } else if constexpr (std::is_same_v<ValueType, double>) {
          std::ostringstream oss;
          oss << std::scientific << variant_value;
          return oss.str();
        } else if constexpr (std::is_same_v<ValueType, int64_t>) {
          return std::to_string(variant_value);
        } else {
          using ElementType = typename ValueType::value_type;
          std::ostringstream oss;
          oss << "[";
          for (size_t idx = 0; idx < variant_value.size(); ++idx) {
            if (idx > 0) oss << ", ";
            if constexpr (std::is_same_v<ElementType, std::string>) {
              oss << "\"" << variant_value[idx] << "\"";
            } else if constexpr (std::is_same_v<ElementType, double>) {
              oss << std::scientific << variant_value[idx];
            } else {
              oss << variant_value[idx];
            }
          }
          oss << "]";
          return oss.str();
        }
      },
      value);
}

SettingValue Settings::parse_string_to_setting_value(
    const std::string& key, const std::string& text) const {
  return std::visit(
      [&text, &key, this](const auto& current) -> SettingValue {
        using CurrentType = std::decay_t<decltype(current)>;

        if constexpr (std::is_same_v<CurrentType, bool>) {
          std::string lower = text;
          std::transform(
              lower.begin(), lower.end(), lower.begin(),
              [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
          if (lower == "true" || lower == "1" || lower == "yes" ||
              lower == "on") {
            return true;
          } else if (lower == "false" || lower == "0" || lower == "no" ||
                     lower == "off") {
            return false;
          }
          throw std::runtime_error("Invalid boolean value: '" + text + "'");
        } else if constexpr (std::is_same_v<CurrentType, std::string>) {
          return text;
        } else {
          nlohmann::json json_obj;
          try {
            json_obj = nlohmann::json::parse(text);
          } catch (const nlohmann::json::exception& json_exception) {
            throw std::runtime_error("Invalid value format: '" + text +
                                     "' - " + json_exception.what());
          }
          if constexpr (is_vector_v<CurrentType>) {
            if (!json_obj.is_array()) {
              throw std::runtime_error("Vector value must be a JSON array: '" +
                                       text + "'");
            }
            if (json_obj.empty()) {
              return CurrentType{};
            }
          }
          SettingValue converted = convert_json_to_setting_value(json_obj);
          // An integer literal is acceptable where a double is expected
          if constexpr (std::is_same_v<CurrentType, double>) {
            if (auto as_int = std::get_if<int64_t>(&converted)) {
              return static_cast<double>(*as_int);
            }
          }
          if (!std::holds_alternative<CurrentType>(converted)) {
            throw std::runtime_error("Type mismatch: expected " +
                                     get_type_name(key) + " for key '" + key +
                                     "'");
          }
          return converted;
        }
      },
      get_ref_(key));
}

nlohmann::json Settings::convert_setting_value_to_json(
    const SettingValue& value) {
  return std::visit(
      [](const auto& variant_value) -> nlohmann::json {
        using ValueType = std::decay_t<decltype(variant_value)>;
        if constexpr (is_vector_v<ValueType>) {
          if (variant_value.empty()) {
            // Empty arrays carry their element type explicitly
            nlohmann::json typed_array = nlohmann::json::object();
            typed_array["__type__"] = "array";
            if constexpr (std::is_same_v<ValueType, std::vector<int64_t>>) {
              typed_array["__element_type__"] = "int64";
            } else if constexpr (std::is_same_v<ValueType,
                                                std::vector<double>>) {
              typed_array["__element_type__"] = "double";
            } else {
              typed_array["__element_type__"] = "string";
            }
            typed_array["__value__"] = nlohmann::json::array();
            return typed_array;
          }
          return vector_to_json(variant_value);
        } else {
          return nlohmann::json(variant_value);
        }
      },
      value);
}

SettingValue Settings::convert_json_to_setting_value(
    const nlohmann::json& json_obj) {
  if (json_obj.is_boolean()) {
    return json_obj.get<bool>();
  } else if (json_obj.is_number_integer()) {
    return json_obj.get<int64_t>();
  } else if (json_obj.is_number_float()) {
    return json_obj.get<double>();
  } else if (json_obj.is_string()) {
    return json_obj.get<std::string>();
  } else if (json_obj.is_object() && json_obj.contains("__type__") &&
             json_obj["__type__"] == "array") {
    std::string elem_type = json_obj["__element_type__"];
    if (elem_type == "int64") {
      return std::vector<int64_t>();
    } else if (elem_type == "double") {
      return std::vector<double>();
    } else if (elem_type == "string") {
      return std::vector<std::string>();
    }
    throw std::runtime_error("Unsupported typed array element type: " +
                             elem_type);
  } else if (json_obj.is_array()) {
    if (json_obj.empty()) {
      return std::vector<int64_t>();
    }
    if (json_obj[0].is_number_integer()) {
      return json_to_vector<int64_t>(json_obj);
    } else if (json_obj[0].is_number()) {
      return json_to_vector<double>(json_obj);
    } else if (json_obj[0].is_string()) {
      return json_to_vector<std::string>(json_obj);
    }
    throw std::runtime_error("Unsupported array element type in JSON");
  }
  throw std::runtime_error("Unsupported JSON type");
}

std::string Settings::get_summary() const {
  std::ostringstream oss;
  oss << "Settings Summary:\n";

  if (empty()) {
    oss << "  No settings configured.\n";
    return oss.str();
  }

  oss << "  Settings:\n";
  for (const auto& [key, value] : settings_) {
    std::string value_str = visit_to_string(value);
    if (value_str.length() > 50) {
      value_str = value_str.substr(0, 47) + "...";
    }
    oss << "    " << key << " = " << value_str << "\n";
  }
  return oss.str();
}

nlohmann::json Settings::to_json() const {
  nlohmann::json json_obj;
  json_obj["version"] = SERIALIZATION_VERSION;

  for (const auto& [key, value] : settings_) {
    json_obj[key] = convert_setting_value_to_json(value);
  }

  if (!descriptions_.empty()) {
    json_obj["_descriptions"] = descriptions_;
  }
  if (!limits_.empty()) {
    nlohmann::json limits_json;
    for (const auto& [key, limit_value] : limits_) {
      std::visit(
          [&limits_json, &key](const auto& constraint) {
            using LimitType = std::decay_t<decltype(constraint)>;
            if constexpr (std::is_same_v<LimitType, BoundConstraint<int64_t>> ||
                          std::is_same_v<LimitType, BoundConstraint<double>>) {
              limits_json[key] = {{"min", constraint.min},
                                  {"max", constraint.max}};
            } else {
              limits_json[key] = {{"allowed", constraint.allowed_values}};
            }
          },
          limit_value);
    }
    json_obj["_limits"] = limits_json;
  }
  return json_obj;
}

std::shared_ptr<Settings> Settings::from_json(const nlohmann::json& json_obj) {
  if (!json_obj.is_object()) {
    throw std::runtime_error("JSON must be an object");
  }
  if (json_obj.contains("version")) {
    validate_serialization_version(SERIALIZATION_VERSION,
                                   json_obj["version"].get<std::string>());
  }

  // The base class accepts whatever keys are present
  auto settings = std::make_shared<Settings>();
  for (const auto& [key, value] : json_obj.items()) {
    if (key == "version" || key == "_descriptions" || key == "_limits") {
      continue;
    }
    settings->settings_[key] = convert_json_to_setting_value(value);
  }

  if (json_obj.contains("_descriptions")) {
    settings->descriptions_ =
        json_obj["_descriptions"].get<std::map<std::string, std::string>>();
  }
  if (json_obj.contains("_limits")) {
    for (const auto& [key, limit_json] : json_obj["_limits"].items()) {
      if (limit_json.contains("min") && limit_json.contains("max")) {
        if (limit_json["min"].is_number_integer()) {
          settings->limits_[key] = BoundConstraint<int64_t>{
              limit_json["min"].get<int64_t>(),
              limit_json["max"].get<int64_t>()};
        } else {
          settings->limits_[key] =
              BoundConstraint<double>{limit_json["min"].get<double>(),
                                      limit_json["max"].get<double>()};
        }
      } else if (limit_json.contains("allowed")) {
        const auto& allowed = limit_json["allowed"];
        if (!allowed.empty() && allowed[0].is_string()) {
          settings->limits_[key] = ListConstraint<std::string>{
              allowed.get<std::vector<std::string>>()};
        } else {
          settings->limits_[key] =
              ListConstraint<int64_t>{allowed.get<std::vector<int64_t>>()};
        }
      }
    }
  }
  return settings;
}

void Settings::to_file(const std::string& filename,
                       const std::string& type) const {
  if (type == "json") {
    to_json_file(filename);
  } else if (type == "hdf5") {
    to_hdf5_file(filename);
  } else {
    throw std::invalid_argument("Unknown file type: " + type +
                                ". Supported types are: json, hdf5");
  }
}

std::shared_ptr<Settings> Settings::from_file(const std::string& filename,
                                              const std::string& type) {
  if (type == "json") {
    return from_json_file(filename);
  } else if (type == "hdf5") {
    return from_hdf5_file(filename);
  }
  throw std::invalid_argument("Unknown file type: " + type +
                              ". Supported types are: json, hdf5");
}

void Settings::to_json_file(const std::string& filename) const {
  std::string validated_filename =
      DataTypeFilename::validate_write_suffix(filename, get_data_type_name());

  std::ofstream file(validated_filename);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open file for writing: " +
                             validated_filename);
  }
  file << to_json().dump(2);
  if (file.fail()) {
    throw std::runtime_error("Error writing to file: " + validated_filename);
  }
}

std::shared_ptr<Settings> Settings::from_json_file(
    const std::string& filename) {
  std::string validated_filename =
      DataTypeFilename::validate_read_suffix(filename, "settings");

  std::ifstream file(validated_filename);
  if (!file.is_open()) {
    throw std::runtime_error(
        "Unable to open Settings JSON file '" + validated_filename +
        "'. Please check that the file exists and you have read permissions.");
  }
  nlohmann::json json_obj;
  try {
    file >> json_obj;
  } catch (const nlohmann::json::exception& json_exception) {
    throw std::runtime_error("Error parsing Settings JSON file '" +
                             validated_filename +
                             "': " + json_exception.what());
  }
  return from_json(json_obj);
}

void Settings::to_hdf5(H5::Group& group) const {
  write_string_attribute(group, "version", SERIALIZATION_VERSION);

  for (const auto& [key, value] : settings_) {
    save_setting_value(group, key, value);
  }

  if (!descriptions_.empty()) {
    H5::Group desc_group = group.createGroup("_descriptions");
    for (const auto& [key, desc] : descriptions_) {
      save_string_dataset(desc_group, key, desc);
    }
  }
  // Limits are stored in their JSON form
  if (!limits_.empty()) {
    save_string_dataset(group, "_limits", to_json()["_limits"].dump());
  }
}

std::shared_ptr<Settings> Settings::from_hdf5(H5::Group& group) {
  nlohmann::json json_obj;
  json_obj["version"] = read_string_attribute(group, "version");
  validate_serialization_version(SERIALIZATION_VERSION,
                                 json_obj["version"].get<std::string>());

  auto settings = std::make_shared<Settings>();
  hsize_t num_objs = group.getNumObjs();
  for (hsize_t i = 0; i < num_objs; ++i) {
    std::string obj_name = group.getObjnameByIdx(i);
    if (obj_name == "_descriptions" || obj_name == "_limits") {
      continue;
    }
    if (group.getObjTypeByIdx(i) == H5G_DATASET) {
      settings->settings_[obj_name] = load_setting_value(group, obj_name);
    }
  }

  if (group_exists_in_group(group, "_descriptions")) {
    H5::Group desc_group = group.openGroup("_descriptions");
    hsize_t num_desc = desc_group.getNumObjs();
    for (hsize_t i = 0; i < num_desc; ++i) {
      std::string key = desc_group.getObjnameByIdx(i);
      settings->descriptions_[key] = load_string_dataset(desc_group, key);
    }
  }
  if (dataset_exists_in_group(group, "_limits")) {
    nlohmann::json limits_holder;
    limits_holder["_limits"] =
        nlohmann::json::parse(load_string_dataset(group, "_limits"));
    settings->limits_ = from_json(limits_holder)->limits_;
  }
  return settings;
}

void Settings::to_hdf5_file(const std::string& filename) const {
  std::string validated_filename =
      DataTypeFilename::validate_write_suffix(filename, get_data_type_name());
  configure_hdf5_error_printing();

  try {
    H5::H5File file(validated_filename, H5F_ACC_TRUNC);
    H5::Group settings_group = file.createGroup("/settings");
    to_hdf5(settings_group);
  } catch (const H5::Exception& hdf5_exception) {
    throw std::runtime_error("HDF5 error: " +
                             std::string(hdf5_exception.getCDetailMsg()));
  }
}

std::shared_ptr<Settings> Settings::from_hdf5_file(
    const std::string& filename) {
  std::string validated_filename =
      DataTypeFilename::validate_read_suffix(filename, "settings");
  configure_hdf5_error_printing();

  H5::H5File file;
  try {
    file.openFile(validated_filename, H5F_ACC_RDONLY);
  } catch (const H5::Exception&) {
    throw std::runtime_error("Unable to open Settings HDF5 file '" +
                             validated_filename +
                             "'. Please check that the file exists, is a "
                             "valid HDF5 file, and you have read permissions.");
  }

  try {
    H5::Group root = file.openGroup("/");
    if (!group_exists_in_group(root, "settings")) {
      throw std::runtime_error("Settings group not found in HDF5 file");
    }
    H5::Group settings_group = file.openGroup("/settings");
    return from_hdf5(settings_group);
  } catch (const H5::Exception& hdf5_exception) {
    throw std::runtime_error("Unable to read Settings data from HDF5 file '" +
                             validated_filename + "'. HDF5 error: " +
                             std::string(hdf5_exception.getCDetailMsg()));
  }
}

}  // namespace qterm::data
