//  Copyright 2026 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#include "config/settings.hpp"

#include <algorithm>
#include <format>
#include <fstream>
#include <stdexcept>

namespace diffusionlab {
Settings::Settings(QObject* parent) : QObject(parent) {}

void Settings::SetHistorySize(memory_mb_t value) {
  Update(history_size_, std::max(0.0, value), kHistorySize);
}

void Settings::SetSelectionGrow(int value) {
  Update(selection_grow_, std::clamp(value, 0, 100), kSelectionGrow);
}

void Settings::SetSelectionFeather(int value) {
  Update(selection_feather_, std::clamp(value, 0, 100), kSelectionFeather);
}

void Settings::SetSelectionPadding(int value) {
  Update(selection_padding_, std::clamp(value, 0, 100), kSelectionPadding);
}

void Settings::SetShowControlEnd(bool value) { Update(show_control_end_, value, kShowControlEnd); }

auto Settings::ToJSON() const -> nlohmann::json {
  nlohmann::json j;
  j[kHistorySize]      = history_size_;
  j[kSelectionGrow]    = selection_grow_;
  j[kSelectionFeather] = selection_feather_;
  j[kSelectionPadding] = selection_padding_;
  j[kShowControlEnd]   = show_control_end_;
  return j;
}

void Settings::FromJSON(const nlohmann::json& j) {
  if (!j.is_object()) {
    throw std::runtime_error("[ERROR] Settings: Expected a JSON object.");
  }
  // Keys that are absent keep their current value, unknown keys are ignored
  if (j.contains(kHistorySize)) {
    SetHistorySize(j.at(kHistorySize).get<memory_mb_t>());
  }
  if (j.contains(kSelectionGrow)) {
    SetSelectionGrow(j.at(kSelectionGrow).get<int>());
  }
  if (j.contains(kSelectionFeather)) {
    SetSelectionFeather(j.at(kSelectionFeather).get<int>());
  }
  if (j.contains(kSelectionPadding)) {
    SetSelectionPadding(j.at(kSelectionPadding).get<int>());
  }
  if (j.contains(kShowControlEnd)) {
    SetShowControlEnd(j.at(kShowControlEnd).get<bool>());
  }
}

void Settings::LoadFromFile(const std::filesystem::path& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error(
        std::format("[ERROR] Settings: Unable to open settings file {}.", path.string()));
  }
  nlohmann::json j;
  try {
    file >> j;
    FromJSON(j);
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error(std::format("[ERROR] Settings: Malformed settings file {}: {}",
                                         path.string(), e.what()));
  }
}

void Settings::SaveToFile(const std::filesystem::path& path) const {
  std::ofstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error(
        std::format("[ERROR] Settings: Unable to write settings file {}.", path.string()));
  }
  file << ToJSON().dump(2);
}

void Settings::RestoreDefaults() {
  SetHistorySize(1000.0);
  SetSelectionGrow(7);
  SetSelectionFeather(7);
  SetSelectionPadding(7);
  SetShowControlEnd(false);
}
};  // namespace diffusionlab
