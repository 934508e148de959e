/// @file settings_test.cpp
/// @brief Change notification and JSON persistence of Settings.

#include "config/settings.hpp"

#include <gtest/gtest.h>

#include <QSignalSpy>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace diffusionlab::test {
namespace {

class SettingsTest : public ::testing::Test {
 protected:
  std::filesystem::path temp_dir_;

  void SetUp() override {
    temp_dir_ = std::filesystem::temp_directory_path() /
                ("diffusion_lab_settings_test_" +
                 std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    std::filesystem::create_directories(temp_dir_);
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(temp_dir_, ec);
  }
};

TEST_F(SettingsTest, Defaults) {
  Settings settings;
  EXPECT_DOUBLE_EQ(settings.HistorySize(), 1000.0);
  EXPECT_EQ(settings.SelectionGrow(), 7);
  EXPECT_EQ(settings.SelectionFeather(), 7);
  EXPECT_EQ(settings.SelectionPadding(), 7);
  EXPECT_FALSE(settings.ShowControlEnd());
}

TEST_F(SettingsTest, ChangedOnlyOnActualChange) {
  Settings   settings;
  QSignalSpy spy(&settings, &Settings::Changed);

  settings.SetSelectionGrow(7);
  EXPECT_EQ(spy.count(), 0);

  settings.SetSelectionGrow(12);
  ASSERT_EQ(spy.count(), 1);
  EXPECT_EQ(spy.at(0).at(0).toString(), QString(Settings::kSelectionGrow));
}

TEST_F(SettingsTest, ValuesAreClamped) {
  Settings settings;
  settings.SetSelectionPadding(250);
  settings.SetHistorySize(-5.0);
  EXPECT_EQ(settings.SelectionPadding(), 100);
  EXPECT_DOUBLE_EQ(settings.HistorySize(), 0.0);
}

TEST_F(SettingsTest, SaveAndLoad) {
  const auto path = temp_dir_ / "settings.json";
  {
    Settings settings;
    settings.SetHistorySize(256.0);
    settings.SetShowControlEnd(true);
    settings.SaveToFile(path);
  }
  Settings loaded;
  loaded.LoadFromFile(path);
  EXPECT_DOUBLE_EQ(loaded.HistorySize(), 256.0);
  EXPECT_TRUE(loaded.ShowControlEnd());
  EXPECT_EQ(loaded.SelectionGrow(), 7);
}

TEST_F(SettingsTest, FromJSON_IgnoresUnknownAndKeepsMissing) {
  Settings settings;
  settings.SetSelectionFeather(20);
  settings.FromJSON({{"selection_grow", 3}, {"unrelated", "x"}});
  EXPECT_EQ(settings.SelectionGrow(), 3);
  EXPECT_EQ(settings.SelectionFeather(), 20);
}

TEST_F(SettingsTest, MalformedFileThrows) {
  const auto path = temp_dir_ / "broken.json";
  std::ofstream(path) << "{ \"history_size\": ";
  Settings settings;
  EXPECT_THROW(settings.LoadFromFile(path), std::runtime_error);
  EXPECT_THROW(settings.LoadFromFile(temp_dir_ / "missing.json"), std::runtime_error);
}

TEST_F(SettingsTest, RestoreDefaults) {
  Settings settings;
  settings.SetSelectionGrow(50);
  settings.SetShowControlEnd(true);
  QSignalSpy spy(&settings, &Settings::Changed);
  settings.RestoreDefaults();
  EXPECT_EQ(settings.SelectionGrow(), 7);
  EXPECT_FALSE(settings.ShowControlEnd());
  EXPECT_EQ(spy.count(), 2);
}

}  // namespace
}  // namespace diffusionlab::test
