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

#include "client/client.hpp"

namespace diffusionlab {
auto ClientCapabilities::IpAdapterModel(SDVersion version) const -> std::optional<std::string> {
  auto it = ip_adapter_models_.find(version);
  if (it == ip_adapter_models_.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto ClientCapabilities::ControlModel(ControlMode mode, SDVersion version) const
    -> std::optional<std::string> {
  auto it = control_models_.find({mode, version});
  if (it == control_models_.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto ResolveSDVersion(const Style& style, const Client& client) -> SDVersion {
  if (style.sd_version_ != SDVersion::AUTO) {
    return style.sd_version_;
  }
  const auto& checkpoints = client.Capabilities().checkpoints_;
  auto        it          = checkpoints.find(style.sd_checkpoint_);
  if (it == checkpoints.end() || it->second == SDVersion::AUTO) {
    return SDVersion::SD15;
  }
  return it->second;
}

auto FilterSupportedStyles(const StyleList& styles, const Client& client) -> std::vector<Style> {
  const auto&        checkpoints = client.Capabilities().checkpoints_;
  std::vector<Style> supported;
  for (const auto& style : styles) {
    if (checkpoints.contains(style.sd_checkpoint_)) {
      supported.push_back(style);
    }
  }
  return supported;
}
};  // namespace diffusionlab
