// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <qterm/data/settings.hpp>
#include <string>
#include <variant>
#include <vector>

#include "ut_common.hpp"

using namespace qterm::data;

class SampleSettings : public Settings {
 public:
  SampleSettings() {
    set_default("verbose", false);
    set_default<int64_t>("order", 2, "Product formula order",
                         ListConstraint<int64_t>{{1, 2}});
    set_default<int64_t>("max_steps", 100, "Step limit",
                         BoundConstraint<int64_t>{1, 1000});
    set_default("time_step", 0.01, "Step size",
                BoundConstraint<double>{1e-6, 1.0});
    set_default("method", "trotter", "Evolution method",
                ListConstraint<std::string>{{"trotter", "exact"}});
    set_default("weights", std::vector<double>{1.0, 0.5});
    set_default("qubits", std::vector<int64_t>{});
    set_default("labels", std::vector<std::string>{"a"});
  }
};

class BadLimitSettings : public Settings {
 public:
  explicit BadLimitSettings(int which) {
    if (which == 0) {
      set_default("flag", true, "A flag", BoundConstraint<int64_t>{0, 1});
    } else if (which == 1) {
      set_default("step", 0.1, "A step", ListConstraint<int64_t>{{1}});
    } else {
      set_default<int64_t>("order", 3, "An order",
                           ListConstraint<int64_t>{{1, 2}});
    }
  }
};

class SettingsTest : public ::testing::Test {
 protected:
  void TearDown() override {
    for (const auto& file : files_to_remove) {
      std::filesystem::remove(file);
    }
  }

  std::vector<std::string> files_to_remove;
};

TEST_F(SettingsTest, Defaults) {
  SampleSettings settings;
  EXPECT_EQ(settings.size(), 8);
  EXPECT_FALSE(settings.empty());
  EXPECT_FALSE(settings.get<bool>("verbose"));
  EXPECT_EQ(settings.get<int64_t>("order"), 2);
  EXPECT_DOUBLE_EQ(settings.get<double>("time_step"), 0.01);
  EXPECT_EQ(settings.get<std::string>("method"), "trotter");
  EXPECT_EQ(settings.get<std::vector<double>>("weights"),
            (std::vector<double>{1.0, 0.5}));
  EXPECT_TRUE(settings.get<std::vector<int64_t>>("qubits").empty());

  EXPECT_TRUE(Settings().empty());
}

TEST_F(SettingsTest, IntegerConversions) {
  SampleSettings settings;
  EXPECT_EQ(settings.get<int>("max_steps"), 100);
  EXPECT_EQ(settings.get<std::size_t>("max_steps"), 100u);
  settings.set("max_steps", 7u);
  EXPECT_EQ(settings.get<int64_t>("max_steps"), 7);
  EXPECT_THROW(settings.get<double>("max_steps"), SettingTypeMismatch);
}

TEST_F(SettingsTest, SetAndGet) {
  SampleSettings settings;
  settings.set("verbose", true);
  settings.set("order", 1);
  settings.set("time_step", 0.5);
  settings.set("method", "exact");
  settings.set("labels", std::vector<std::string>{"x", "y"});

  EXPECT_TRUE(settings.get<bool>("verbose"));
  EXPECT_EQ(settings.get<int64_t>("order"), 1);
  EXPECT_DOUBLE_EQ(settings.get<double>("time_step"), 0.5);
  EXPECT_EQ(settings.get<std::string>("method"), "exact");
  EXPECT_EQ(settings.get_as_string("verbose"), "true");
  EXPECT_TRUE(std::holds_alternative<std::string>(settings.get("method")));
}

TEST_F(SettingsTest, UnknownKeysAndTypes) {
  SampleSettings settings;
  EXPECT_THROW(settings.set("unknown", 1.0), SettingNotFound);
  EXPECT_THROW(settings.get<double>("unknown"), SettingNotFound);
  EXPECT_THROW(settings.set("time_step", "fast"), SettingTypeMismatch);
  EXPECT_THROW(settings.set("order", 1.5), SettingTypeMismatch);
  EXPECT_THROW(settings.get<std::string>("order"), SettingTypeMismatch);
  EXPECT_EQ(settings.get_type_name("order"), "int64_t");
  EXPECT_EQ(settings.get_type_name("weights"), "vector<double>");
}

TEST_F(SettingsTest, Constraints) {
  SampleSettings settings;
  EXPECT_THROW(settings.set("order", 3), std::invalid_argument);
  EXPECT_THROW(settings.set("max_steps", 0), std::invalid_argument);
  EXPECT_THROW(settings.set("max_steps", 1001), std::invalid_argument);
  EXPECT_THROW(settings.set("time_step", 2.0), std::invalid_argument);
  EXPECT_THROW(settings.set("method", "euler"), std::invalid_argument);
  // Failed sets leave the value untouched
  EXPECT_EQ(settings.get<int64_t>("order"), 2);
  EXPECT_EQ(settings.get<std::string>("method"), "trotter");

  EXPECT_TRUE(settings.has_limits("order"));
  EXPECT_FALSE(settings.has_limits("verbose"));
  auto limit = settings.get_limits("order");
  ASSERT_TRUE(std::holds_alternative<ListConstraint<int64_t>>(limit));
  EXPECT_EQ(std::get<ListConstraint<int64_t>>(limit).allowed_values,
            (std::vector<int64_t>{1, 2}));
  EXPECT_THROW(settings.get_limits("verbose"), SettingNotFound);
}

TEST_F(SettingsTest, InvalidDeclarations) {
  EXPECT_THROW(BadLimitSettings(0), std::invalid_argument);
  EXPECT_THROW(BadLimitSettings(1), std::invalid_argument);
  EXPECT_THROW(BadLimitSettings(2), std::invalid_argument);
}

TEST_F(SettingsTest, Descriptions) {
  SampleSettings settings;
  EXPECT_TRUE(settings.has_description("order"));
  EXPECT_EQ(settings.get_description("order"), "Product formula order");
  EXPECT_FALSE(settings.has_description("weights"));
  EXPECT_THROW(settings.get_description("weights"), SettingNotFound);
}

TEST_F(SettingsTest, GetOrDefault) {
  SampleSettings settings;
  EXPECT_EQ(settings.get_or_default<int64_t>("order", 5), 2);
  EXPECT_EQ(settings.get_or_default<int64_t>("missing", 5), 5);
  EXPECT_EQ(settings.get_or_default<std::string>("order", "none"), "none");
}

TEST_F(SettingsTest, ValidateRequired) {
  SampleSettings settings;
  EXPECT_NO_THROW(settings.validate_required({"order", "time_step"}));
  EXPECT_THROW(settings.validate_required({"order", "missing"}),
               SettingNotFound);
}

TEST_F(SettingsTest, UpdateFromStrings) {
  SampleSettings settings;
  settings.update(std::map<std::string, std::string>{{"verbose", "yes"},
                                                     {"order", "1"},
                                                     {"time_step", "1"},
                                                     {"weights", "[0.25]"},
                                                     {"method", "exact"}});
  EXPECT_TRUE(settings.get<bool>("verbose"));
  EXPECT_EQ(settings.get<int64_t>("order"), 1);
  EXPECT_DOUBLE_EQ(settings.get<double>("time_step"), 1.0);
  EXPECT_EQ(settings.get<std::vector<double>>("weights"),
            (std::vector<double>{0.25}));
  EXPECT_EQ(settings.get<std::string>("method"), "exact");

  EXPECT_THROW(
      settings.update(std::map<std::string, std::string>{{"verbose", "maybe"}}),
      std::runtime_error);
  EXPECT_THROW(
      settings.update(std::map<std::string, std::string>{{"missing", "1"}}),
      SettingNotFound);
}

TEST_F(SettingsTest, UpdateIsAllOrNothing) {
  SampleSettings settings;
  std::map<std::string, SettingValue> updates{{"max_steps", int64_t(10)},
                                              {"order", int64_t(5)}};
  EXPECT_THROW(settings.update(updates), std::invalid_argument);
  EXPECT_EQ(settings.get<int64_t>("max_steps"), 100);
}

TEST_F(SettingsTest, UpdateFromOtherSettings) {
  SampleSettings source;
  source.set("order", 1);
  source.set("method", "exact");
  SampleSettings target;
  target.update(source);
  EXPECT_EQ(target.get<int64_t>("order"), 1);
  EXPECT_EQ(target.get<std::string>("method"), "exact");
}

TEST_F(SettingsTest, Lock) {
  SampleSettings settings;
  EXPECT_FALSE(settings.is_locked());
  settings.lock();
  EXPECT_TRUE(settings.is_locked());
  EXPECT_THROW(settings.set("order", 1), SettingsAreLocked);
  EXPECT_THROW(settings.update("order", SettingValue(int64_t(1))),
               SettingsAreLocked);
  EXPECT_THROW(
      settings.update(std::map<std::string, std::string>{{"order", "1"}}),
      SettingsAreLocked);
  EXPECT_EQ(settings.get<int64_t>("order"), 2);
}

TEST_F(SettingsTest, Summary) {
  SampleSettings settings;
  std::string summary = settings.get_summary();
  EXPECT_NE(summary.find("order = 2"), std::string::npos);
  EXPECT_NE(Settings().get_summary().find("No settings configured"),
            std::string::npos);
}

TEST_F(SettingsTest, JsonSerialization) {
  SampleSettings settings;
  settings.set("order", 1);
  settings.set("weights", std::vector<double>{0.1, 0.2, 0.3});

  auto json = settings.to_json();
  EXPECT_TRUE(json.contains("version"));
  EXPECT_TRUE(json.contains("_descriptions"));
  EXPECT_TRUE(json.contains("_limits"));

  auto restored = Settings::from_json(json);
  EXPECT_EQ(restored->size(), settings.size());
  EXPECT_EQ(restored->get<int64_t>("order"), 1);
  EXPECT_EQ(restored->get<std::string>("method"), "trotter");
  EXPECT_EQ(restored->get<std::vector<double>>("weights"),
            (std::vector<double>{0.1, 0.2, 0.3}));
  EXPECT_EQ(restored->get_description("order"), "Product formula order");
  EXPECT_THROW(restored->set("order", 4), std::invalid_argument);

  EXPECT_THROW(Settings::from_json(nlohmann::json::array()),
               std::runtime_error);
}

TEST_F(SettingsTest, JsonFileRoundTrip) {
  SampleSettings settings;
  settings.set("time_step", 0.125);
  const std::string filename = "test_sample.settings.json";
  files_to_remove.push_back(filename);

  settings.to_json_file(filename);
  auto restored = Settings::from_json_file(filename);
  EXPECT_NEAR(restored->get<double>("time_step"), 0.125,
              testing::json_tolerance);
  EXPECT_THROW(settings.to_json_file("test_sample.json"),
               std::invalid_argument);
}

TEST_F(SettingsTest, Hdf5FileRoundTrip) {
  SampleSettings settings;
  settings.set("verbose", true);
  settings.set("labels", std::vector<std::string>{"x", "y"});
  const std::string filename = "test_sample.settings.h5";
  files_to_remove.push_back(filename);

  settings.to_file(filename, "hdf5");
  auto restored = Settings::from_file(filename, "hdf5");
  EXPECT_TRUE(restored->get<bool>("verbose"));
  EXPECT_EQ(restored->get<int64_t>("order"), 2);
  EXPECT_NEAR(restored->get<double>("time_step"), 0.01,
              testing::hdf5_tolerance);
  EXPECT_EQ(restored->get<std::vector<std::string>>("labels"),
            (std::vector<std::string>{"x", "y"}));
  EXPECT_EQ(restored->get_description("method"), "Evolution method");
  EXPECT_TRUE(restored->has_limits("max_steps"));

  EXPECT_THROW(settings.to_file(filename, "xml"), std::invalid_argument);
}
