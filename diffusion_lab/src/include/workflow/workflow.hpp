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

#include "image/bounds.hpp"
#include "image/image.hpp"
#include "style/style.hpp"
#include "workflow/work_request.hpp"

namespace diffusionlab {
namespace workflow {
// Minimum side of the area around a selection that is sent for inpainting
constexpr int kMinInpaintSize = 512;

/**
 * @brief Region of the document that is sent to the backend.
 *
 * Without a mask this is the whole document. A full strength inpaint gets context around the
 * mask, a partial refine only needs the mask area itself.
 */
auto ComputeBounds(Extent extent, const std::optional<Bounds>& mask_bounds, double strength)
    -> Bounds;

auto Generate(const Style& style, Extent extent, Conditioning conditioning,
              std::optional<LiveParams> live = std::nullopt) -> WorkRequest;
auto Refine(const Style& style, ResultImage image, Conditioning conditioning, double strength,
            std::optional<LiveParams> live = std::nullopt) -> WorkRequest;
auto Inpaint(const Style& style, ResultImage image, Mask mask, Conditioning conditioning)
    -> WorkRequest;
auto RefineRegion(const Style& style, ResultImage image, Mask mask, Conditioning conditioning,
                  double strength) -> WorkRequest;
auto UpscaleSimple(ResultImage image, std::string upscaler, double factor) -> WorkRequest;
auto UpscaleTiled(ResultImage image, std::string upscaler, double factor, const Style& style,
                  double strength) -> WorkRequest;
auto CreateControlImage(ResultImage image, ControlMode mode) -> WorkRequest;

/**
 * @brief Pick the diffusion workflow from the presence of a reference image, a mask and the
 * strength, and build it.
 *
 * | image | mask | strength | request       |
 * |-------|------|----------|---------------|
 * | no    | no   | 1.0      | GENERATE      |
 * | yes   | no   | < 1.0    | REFINE        |
 * | yes   | yes  | 1.0      | INPAINT       |
 * | yes   | yes  | < 1.0    | REFINE_REGION |
 *
 * @throws std::logic_error for any other combination
 */
auto CreateDiffusionWork(const Style& style, Extent extent, Conditioning conditioning,
                         std::optional<ResultImage> image, std::optional<Mask> mask,
                         double strength) -> WorkRequest;
};  // namespace workflow
};  // namespace diffusionlab
