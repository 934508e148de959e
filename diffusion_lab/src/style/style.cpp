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

#include "style/style.hpp"

#include <QtGlobal>

#include <algorithm>
#include <exception>
#include <fstream>

namespace diffusionlab {
auto Style::ToJSON() const -> nlohmann::json {
  nlohmann::json j;
  j["name"]            = name_;
  j["sd_version"]      = sd_version_ == SDVersion::SD15   ? "sd15"
                         : sd_version_ == SDVersion::SDXL ? "sdxl"
                                                          : "auto";
  j["sd_checkpoint"]   = sd_checkpoint_;
  j["style_prompt"]    = style_prompt_;
  j["negative_prompt"] = negative_prompt_;
  j["sampler"]         = sampler_;
  j["sampler_steps"]   = sampler_steps_;
  j["cfg_scale"]       = cfg_scale_;
  return j;
}

auto Style::FromJSON(const nlohmann::json& j, std::string filename) -> Style {
  Style style;
  style.filename_        = std::move(filename);
  style.name_            = j.value("name", style.name_);
  style.sd_version_      = SDVersionFromName(j.value("sd_version", std::string("auto")));
  style.sd_checkpoint_   = j.value("sd_checkpoint", style.sd_checkpoint_);
  style.style_prompt_    = j.value("style_prompt", style.style_prompt_);
  style.negative_prompt_ = j.value("negative_prompt", style.negative_prompt_);
  style.sampler_         = j.value("sampler", style.sampler_);
  style.sampler_steps_   = j.value("sampler_steps", style.sampler_steps_);
  style.cfg_scale_       = j.value("cfg_scale", style.cfg_scale_);
  return style;
}

auto StyleList::LoadFromDirectory(const std::filesystem::path& dir) -> StyleList {
  StyleList list;
  if (!std::filesystem::is_directory(dir)) {
    return list;
  }

  std::vector<std::filesystem::path> files;
  for (const auto& entry : std::filesystem::directory_iterator(dir)) {
    if (entry.is_regular_file() && entry.path().extension() == ".json") {
      files.push_back(entry.path());
    }
  }
  std::sort(files.begin(), files.end());

  for (const auto& file : files) {
    try {
      std::ifstream  in(file);
      nlohmann::json j;
      in >> j;
      list.Add(Style::FromJSON(j, file.filename().string()));
    } catch (const std::exception& e) {
      qWarning("Failed to load style %s: %s", file.string().c_str(), e.what());
    }
  }
  return list;
}

auto StyleList::Default() const -> Style { return styles_.empty() ? Style{} : styles_.front(); }

auto StyleList::Find(const std::string& filename) const -> std::optional<Style> {
  auto it = std::find_if(styles_.begin(), styles_.end(),
                         [&filename](const Style& s) { return s.filename_ == filename; });
  if (it == styles_.end()) {
    return std::nullopt;
  }
  return *it;
}
};  // namespace diffusionlab
