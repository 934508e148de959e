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

#include "control/control_mode.hpp"

namespace diffusionlab {
auto ControlModeText(ControlMode mode) -> std::string {
  switch (mode) {
    case ControlMode::IMAGE:
      return "Image";
    case ControlMode::SCRIBBLE:
      return "Scribble";
    case ControlMode::LINE_ART:
      return "Line Art";
    case ControlMode::SOFT_EDGE:
      return "Soft Edge";
    case ControlMode::CANNY_EDGE:
      return "Canny Edge";
    case ControlMode::DEPTH:
      return "Depth";
    case ControlMode::NORMAL:
      return "Normal";
    case ControlMode::POSE:
      return "Pose";
    case ControlMode::SEGMENTATION:
      return "Segment";
    case ControlMode::BLUR:
      return "Blur";
    case ControlMode::STENCIL:
      return "Stencil";
  }
  return "Unknown";
}

auto IsLineMode(ControlMode mode) -> bool {
  return mode == ControlMode::SCRIBBLE || mode == ControlMode::LINE_ART ||
         mode == ControlMode::SOFT_EDGE || mode == ControlMode::CANNY_EDGE;
}

auto ProducesControlImage(ControlMode mode) -> bool {
  return mode != ControlMode::IMAGE && mode != ControlMode::STENCIL;
}

auto ControlModeFilenames(ControlMode mode, SDVersion version) -> std::vector<std::string> {
  const bool sdxl = version == SDVersion::SDXL;
  switch (mode) {
    case ControlMode::IMAGE:
      return {};
    case ControlMode::SCRIBBLE:
      if (sdxl) return {};
      return {"control_v11p_sd15_scribble", "control_lora_rank128_v11p_sd15_scribble"};
    case ControlMode::LINE_ART:
      if (sdxl) return {"sai_xl_sketch_256lora"};
      return {"control_v11p_sd15_lineart", "control_lora_rank128_v11p_sd15_lineart"};
    case ControlMode::SOFT_EDGE:
      if (sdxl) return {};
      return {"control_v11p_sd15_softedge", "control_lora_rank128_v11p_sd15_softedge"};
    case ControlMode::CANNY_EDGE:
      if (sdxl) return {"control-lora-canny-rank", "sai_xl_canny"};
      return {"control_v11p_sd15_canny", "control_lora_rank128_v11p_sd15_canny"};
    case ControlMode::DEPTH:
      if (sdxl) return {"control-lora-depth-rank", "sai_xl_depth"};
      return {"control_sd15_depth", "control_v11f1p_sd15_depth"};
    case ControlMode::NORMAL:
      if (sdxl) return {};
      return {"control_v11p_sd15_normalbae", "control_lora_rank128_v11p_sd15_normalbae"};
    case ControlMode::POSE:
      if (sdxl) return {"control-lora-openposexl2-rank", "thibaud_xl_openpose"};
      return {"control_v11p_sd15_openpose", "control_lora_rank128_v11p_sd15_openpose"};
    case ControlMode::SEGMENTATION:
      if (sdxl) return {};
      return {"control_v11p_sd15_seg", "control_lora_rank128_v11p_sd15_seg"};
    case ControlMode::BLUR:
      if (sdxl) return {};
      return {"control_v11f1e_sd15_tile", "control_lora_rank128_v11f1e_sd15_tile"};
    case ControlMode::STENCIL:
      if (sdxl) return {};
      return {"control_v1p_sd15_qrcode_monster"};
  }
  return {};
}

auto AllControlModes() -> const std::vector<ControlMode>& {
  static const std::vector<ControlMode> modes = {
      ControlMode::IMAGE,      ControlMode::SCRIBBLE, ControlMode::LINE_ART,
      ControlMode::SOFT_EDGE,  ControlMode::CANNY_EDGE, ControlMode::DEPTH,
      ControlMode::NORMAL,     ControlMode::POSE,     ControlMode::SEGMENTATION,
      ControlMode::BLUR,       ControlMode::STENCIL};
  return modes;
}
};  // namespace diffusionlab
