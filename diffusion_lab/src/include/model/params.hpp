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

#include <string>

#include "image/bounds.hpp"

namespace diffusionlab {
enum class Workspace : int { GENERATION, UPSCALING, LIVE };

struct UpscaleParams {
  // Empty selects the server default
  std::string upscaler_{};
  double      factor_        = 2.0;
  bool        use_diffusion_ = true;
  double      strength_      = 0.3;

  auto        TargetExtent(Extent document_extent) const -> Extent {
    return document_extent * factor_;
  }
};
};  // namespace diffusionlab
