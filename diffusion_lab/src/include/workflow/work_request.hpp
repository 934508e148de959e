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

#include <optional>
#include <string>
#include <vector>

#include "control/control_mode.hpp"
#include "image/bounds.hpp"
#include "image/image.hpp"
#include "style/style.hpp"

namespace diffusionlab {
enum class WorkKind : int {
  GENERATE,
  REFINE,
  INPAINT,
  REFINE_REGION,
  UPSCALE_SIMPLE,
  UPSCALE_TILED,
  CONTROL_IMAGE
};

struct Control {
  ControlMode mode_     = ControlMode::SCRIBBLE;
  ResultImage image_{};
  double      strength_ = 1.0;
  double      end_      = 1.0;
};

struct Conditioning {
  std::string           prompt_{};
  std::string           negative_prompt_{};
  std::vector<Control>  control_{};
  // Region the prompt applies to, relative to the request image
  std::optional<Bounds> area_{};
};

struct LiveParams {
  bool   is_active_ = false;
  double strength_  = 0.3;
  int    seed_      = 0;
};

/**
 * @brief Everything the backend needs to run one workflow. Built by the functions in
 * workflow/workflow.hpp, consumed by Client::Enqueue.
 */
struct WorkRequest {
  WorkKind                  kind_           = WorkKind::GENERATE;
  Style                     style_{};
  Extent                    extent_{};
  Conditioning              conditioning_{};
  std::optional<ResultImage> image_{};
  std::optional<Mask>       mask_{};
  double                    strength_       = 1.0;
  std::optional<LiveParams> live_{};
  std::string               upscaler_{};
  double                    upscale_factor_ = 1.0;
  ControlMode               control_mode_   = ControlMode::SCRIBBLE;
};

auto WorkKindName(WorkKind kind) -> const char*;
};  // namespace diffusionlab
