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

#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "type/type.hpp"

namespace diffusionlab {
/**
 * @brief Checkpoint and prompt preset. Styles are stored as one JSON file each.
 */
struct Style {
  std::string filename_{};
  std::string name_            = "Default Style";
  SDVersion   sd_version_      = SDVersion::AUTO;
  std::string sd_checkpoint_{};
  std::string style_prompt_{};
  std::string negative_prompt_{};
  std::string sampler_         = "DPM++ 2M Karras";
  int         sampler_steps_   = 20;
  double      cfg_scale_       = 7.0;

  auto        ToJSON() const -> nlohmann::json;
  static auto FromJSON(const nlohmann::json& j, std::string filename = {}) -> Style;

  auto        operator==(const Style& other) const -> bool = default;
};

class StyleList {
 private:
  std::vector<Style> styles_{};

 public:
  StyleList() = default;
  explicit StyleList(std::vector<Style> styles) : styles_(std::move(styles)) {}

  /**
   * @brief Load every *.json file of a directory, sorted by file name. Files that fail to parse
   * are skipped and logged.
   */
  static auto LoadFromDirectory(const std::filesystem::path& dir) -> StyleList;

  void Add(Style style) { styles_.push_back(std::move(style)); }

  // First style, or a built-in default when the list is empty
  auto Default() const -> Style;
  auto Find(const std::string& filename) const -> std::optional<Style>;

  auto Size() const -> size_t { return styles_.size(); }
  auto GetStyles() const -> const std::vector<Style>& { return styles_; }
  auto begin() const { return styles_.begin(); }
  auto end() const { return styles_.end(); }
};
};  // namespace diffusionlab
