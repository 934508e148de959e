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
#include <vector>

#include "type/type.hpp"

namespace diffusionlab {
enum class ControlMode : int {
  IMAGE,
  SCRIBBLE,
  LINE_ART,
  SOFT_EDGE,
  CANNY_EDGE,
  DEPTH,
  NORMAL,
  POSE,
  SEGMENTATION,
  BLUR,
  STENCIL
};

auto ControlModeText(ControlMode mode) -> std::string;

// Scribble and edge modes, their inputs are flattened onto white before upload
auto IsLineMode(ControlMode mode) -> bool;

// Image reference and stencil only condition a generation, they never produce an image
auto ProducesControlImage(ControlMode mode) -> bool;

/**
 * @brief Known ControlNet model file names for a mode, used in error messages when the
 * server lacks the model. Empty if the mode has no model for the given version.
 */
auto ControlModeFilenames(ControlMode mode, SDVersion version) -> std::vector<std::string>;

auto AllControlModes() -> const std::vector<ControlMode>&;
};  // namespace diffusionlab
