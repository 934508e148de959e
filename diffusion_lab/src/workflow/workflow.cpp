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

#include "workflow/workflow.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace diffusionlab {
auto WorkKindName(WorkKind kind) -> const char* {
  switch (kind) {
    case WorkKind::GENERATE:
      return "generate";
    case WorkKind::REFINE:
      return "refine";
    case WorkKind::INPAINT:
      return "inpaint";
    case WorkKind::REFINE_REGION:
      return "refine_region";
    case WorkKind::UPSCALE_SIMPLE:
      return "upscale_simple";
    case WorkKind::UPSCALE_TILED:
      return "upscale_tiled";
    case WorkKind::CONTROL_IMAGE:
      return "control_image";
  }
  return "unknown";
}

namespace workflow {
auto ComputeBounds(Extent extent, const std::optional<Bounds>& mask_bounds, double strength)
    -> Bounds {
  if (!mask_bounds.has_value()) {
    return {0, 0, extent};
  }
  if (strength < 1.0) {
    return *mask_bounds;
  }
  const Bounds& mask    = *mask_bounds;
  const int     padding = std::max(extent.LongestSide() / 16, mask.GetExtent().AverageSide() / 2);
  return Bounds::Clamp(Bounds::Pad(mask, padding, kMinInpaintSize), extent);
}

auto Generate(const Style& style, Extent extent, Conditioning conditioning,
              std::optional<LiveParams> live) -> WorkRequest {
  WorkRequest work;
  work.kind_         = WorkKind::GENERATE;
  work.style_        = style;
  work.extent_       = extent;
  work.conditioning_ = std::move(conditioning);
  work.live_         = std::move(live);
  return work;
}

auto Refine(const Style& style, ResultImage image, Conditioning conditioning, double strength,
            std::optional<LiveParams> live) -> WorkRequest {
  WorkRequest work;
  work.kind_         = WorkKind::REFINE;
  work.style_        = style;
  work.extent_       = image.GetExtent();
  work.image_        = std::move(image);
  work.conditioning_ = std::move(conditioning);
  work.strength_     = strength;
  work.live_         = std::move(live);
  return work;
}

auto Inpaint(const Style& style, ResultImage image, Mask mask, Conditioning conditioning)
    -> WorkRequest {
  WorkRequest work;
  work.kind_         = WorkKind::INPAINT;
  work.style_        = style;
  work.extent_       = image.GetExtent();
  work.image_        = std::move(image);
  work.mask_         = std::move(mask);
  work.conditioning_ = std::move(conditioning);
  return work;
}

auto RefineRegion(const Style& style, ResultImage image, Mask mask, Conditioning conditioning,
                  double strength) -> WorkRequest {
  WorkRequest work = Inpaint(style, std::move(image), std::move(mask), std::move(conditioning));
  work.kind_       = WorkKind::REFINE_REGION;
  work.strength_   = strength;
  return work;
}

auto UpscaleSimple(ResultImage image, std::string upscaler, double factor) -> WorkRequest {
  WorkRequest work;
  work.kind_           = WorkKind::UPSCALE_SIMPLE;
  work.extent_         = image.GetExtent() * factor;
  work.image_          = std::move(image);
  work.upscaler_       = std::move(upscaler);
  work.upscale_factor_ = factor;
  return work;
}

auto UpscaleTiled(ResultImage image, std::string upscaler, double factor, const Style& style,
                  double strength) -> WorkRequest {
  WorkRequest work = UpscaleSimple(std::move(image), std::move(upscaler), factor);
  work.kind_       = WorkKind::UPSCALE_TILED;
  work.style_      = style;
  work.strength_   = strength;
  return work;
}

auto CreateControlImage(ResultImage image, ControlMode mode) -> WorkRequest {
  WorkRequest work;
  work.kind_         = WorkKind::CONTROL_IMAGE;
  work.extent_       = image.GetExtent();
  work.image_        = std::move(image);
  work.control_mode_ = mode;
  return work;
}

auto CreateDiffusionWork(const Style& style, Extent extent, Conditioning conditioning,
                         std::optional<ResultImage> image, std::optional<Mask> mask,
                         double strength) -> WorkRequest {
  const bool full_strength = strength >= 1.0;
  if (!image.has_value() && !mask.has_value() && full_strength) {
    return Generate(style, extent, std::move(conditioning));
  }
  if (image.has_value() && !mask.has_value() && !full_strength) {
    return Refine(style, std::move(*image), std::move(conditioning), strength);
  }
  if (image.has_value() && mask.has_value()) {
    if (full_strength) {
      return Inpaint(style, std::move(*image), std::move(*mask), std::move(conditioning));
    }
    return RefineRegion(style, std::move(*image), std::move(*mask), std::move(conditioning),
                        strength);
  }
  throw std::logic_error(
      "[ERROR] workflow: Inconsistent combination of reference image, mask and strength.");
}
};  // namespace workflow
};  // namespace diffusionlab
