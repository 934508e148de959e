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

#include "type/type.hpp"

#include <format>
#include <stdexcept>

namespace diffusionlab {
auto SDVersionName(SDVersion version) -> std::string {
  switch (version) {
    case SDVersion::SD15:
      return "SD 1.5";
    case SDVersion::SDXL:
      return "SD XL";
    case SDVersion::AUTO:
      return "Automatic";
  }
  return "Automatic";
}

auto SDVersionFromName(const std::string& name) -> SDVersion {
  if (name == "sd15" || name == "SD 1.5") {
    return SDVersion::SD15;
  }
  if (name == "sdxl" || name == "SD XL") {
    return SDVersion::SDXL;
  }
  if (name == "auto" || name == "Automatic" || name.empty()) {
    return SDVersion::AUTO;
  }
  throw std::runtime_error(std::format("[ERROR] SDVersion: Unknown model version '{}'.", name));
}
};  // namespace diffusionlab
