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

#pragma once

#include <QObject>
#include <QString>

#include <filesystem>
#include <nlohmann/json.hpp>

#include "type/type.hpp"

namespace diffusionlab {
/**
 * @brief User configuration shared by all documents. Every setter emits Changed(key) when the
 * stored value actually changes, so dependents can recompute derived state.
 */
class Settings final : public QObject {
  Q_OBJECT

 public:
  static constexpr const char* kHistorySize      = "history_size";
  static constexpr const char* kSelectionGrow    = "selection_grow";
  static constexpr const char* kSelectionFeather = "selection_feather";
  static constexpr const char* kSelectionPadding = "selection_padding";
  static constexpr const char* kShowControlEnd   = "show_control_end";

  explicit Settings(QObject* parent = nullptr);

  // History budget in MB
  auto HistorySize() const -> memory_mb_t { return history_size_; }
  // Selection parameters are percentages of the selection size
  auto SelectionGrow() const -> int { return selection_grow_; }
  auto SelectionFeather() const -> int { return selection_feather_; }
  auto SelectionPadding() const -> int { return selection_padding_; }
  auto ShowControlEnd() const -> bool { return show_control_end_; }

  void SetHistorySize(memory_mb_t value);
  void SetSelectionGrow(int value);
  void SetSelectionFeather(int value);
  void SetSelectionPadding(int value);
  void SetShowControlEnd(bool value);

  auto ToJSON() const -> nlohmann::json;
  void FromJSON(const nlohmann::json& j);

  void LoadFromFile(const std::filesystem::path& path);
  void SaveToFile(const std::filesystem::path& path) const;

  void RestoreDefaults();

 signals:
  void Changed(const QString& key);

 private:
  template <typename T>
  void Update(T& field, T value, const char* key) {
    if (field == value) {
      return;
    }
    field = value;
    emit Changed(QString::fromLatin1(key));
  }

  memory_mb_t history_size_      = 1000.0;
  int         selection_grow_    = 7;
  int         selection_feather_ = 7;
  int         selection_padding_ = 7;
  bool        show_control_end_  = false;
};
};  // namespace diffusionlab
