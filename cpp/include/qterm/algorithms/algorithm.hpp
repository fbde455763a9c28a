// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <functional>
#include <memory>
#include <qterm/data/settings.hpp>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace qterm::algorithms {

/**
 * @brief Base class for configurable algorithms
 *
 * run() locks the settings and forwards its arguments to _run_impl(), so a
 * configured algorithm cannot be modified once it has been used.
 *
 * @tparam Derived The derived algorithm interface, e.g. TimeEvolution
 * @tparam ReturnType Result of run()
 * @tparam Args Arguments of run()
 *
 * Usage:
 * @code
 * class TimeEvolution
 *     : public Algorithm<TimeEvolution, Eigen::VectorXcd,
 *                        const data::SymbolicHamiltonian&,
 *                        const Eigen::VectorXcd&, double> {
 *  protected:
 *   Eigen::VectorXcd _run_impl(const data::SymbolicHamiltonian& hamiltonian,
 *                              const Eigen::VectorXcd& state,
 *                              double time) const override;
 * };
 * @endcode
 */
template <typename Derived, typename ReturnType, typename... Args>
class Algorithm {
 public:
  Algorithm() = default;
  virtual ~Algorithm() = default;

  /**
   * @brief Lock the settings and execute the algorithm
   */
  virtual ReturnType run(Args... args) const {
    this->lock_settings();
    return this->_run_impl(std::forward<Args>(args)...);
  }

  data::Settings& settings() { return *_settings; }
  const data::Settings& settings() const { return *_settings; }

  /// Registered name of the implementation
  virtual std::string name() const = 0;

  /**
   * @brief Names the implementation can be created under, including name()
   */
  virtual std::vector<std::string> aliases() const { return {this->name()}; }

  /// Name of the algorithm family, shared by all implementations
  virtual std::string type_name() const = 0;

 protected:
  void lock_settings() const { this->_settings->lock(); }

  virtual ReturnType _run_impl(Args... args) const = 0;

  /// Replaced by implementations that declare their own settings
  std::unique_ptr<data::Settings> _settings =
      std::make_unique<data::Settings>();
};

/**
 * @brief Name-keyed registry of algorithm implementations
 *
 * Each factory keeps its own registry, filled on first use by
 * Derived::register_default_instances(). Derived must also provide
 * algorithm_type_name() and default_algorithm_name().
 *
 * Usage:
 * @code
 * struct TimeEvolutionFactory
 *     : public AlgorithmFactory<TimeEvolution, TimeEvolutionFactory> {
 *   static std::string algorithm_type_name() { return "time_evolution"; }
 *   static void register_default_instances();
 *   static std::string default_algorithm_name() { return "trotter"; }
 * };
 *
 * auto evolution = TimeEvolutionFactory::create("exact");
 * @endcode
 */
template <typename BaseAlgorithmType, typename Derived>
class AlgorithmFactory {
 public:
  using return_type = std::unique_ptr<BaseAlgorithmType>;
  using functor_type = std::function<return_type(void)>;

  /**
   * @brief Create a registered implementation
   * @param name Name or alias; empty selects the default implementation
   * @throws std::runtime_error if nothing is registered under @p name
   */
  static return_type create(const std::string& name = "") {
    const std::string key =
        name.empty() ? Derived::default_algorithm_name() : name;

    auto it = registry().find(key);
    if (it == registry().end()) {
      std::string available_keys;
      for (const auto& [k, _] : registry()) {
        if (!available_keys.empty()) {
          available_keys += ", ";
        }
        available_keys += k;
      }
      throw std::runtime_error("Algorithm factory for " +
                               Derived::algorithm_type_name() +
                               ": Algorithm with name '" + key +
                               "' not found in registry, available options "
                               "are: " +
                               available_keys);
    }
    return it->second();
  }

  /**
   * @brief Register an implementation under its name and all its aliases
   * @throws std::runtime_error if the implementation belongs to another
   * algorithm family or one of its names is taken
   */
  static void register_instance(functor_type func) {
    auto& reg = registry();
    auto probe = func();

    if (probe->type_name() != Derived::algorithm_type_name()) {
      throw std::runtime_error(
          "Algorithm factory for " + Derived::algorithm_type_name() +
          ": algorithm with name '" + probe->name() +
          "' has incorrect algorithm type: " + probe->type_name() +
          " expected is: " + Derived::algorithm_type_name());
    }

    auto aliases = probe->aliases();
    for (const auto& alias : aliases) {
      if (reg.find(alias) != reg.end()) {
        throw std::runtime_error("Algorithm factory for " +
                                 Derived::algorithm_type_name() +
                                 ": algorithm with name/alias '" + alias +
                                 "' already exists in registry");
      }
    }
    for (const auto& alias : aliases) {
      reg[alias] = func;
    }
  }

  /// @return true if @p key was registered and has been removed
  static bool unregister_instance(const std::string& key) {
    return registry().erase(key) > 0;
  }

  static std::vector<std::string> available() {
    std::vector<std::string> keys;
    keys.reserve(registry().size());
    for (const auto& [key, _] : registry()) {
      keys.push_back(key);
    }
    return keys;
  }

  static bool has(const std::string& key) {
    return registry().find(key) != registry().end();
  }

 protected:
  static std::unordered_map<std::string, functor_type>& registry() {
    static std::unordered_map<std::string, functor_type> instance;
    static bool initialized = false;
    if (!initialized) {
      initialized = true;
      Derived::register_default_instances();
    }
    return instance;
  }
};

}  // namespace qterm::algorithms
