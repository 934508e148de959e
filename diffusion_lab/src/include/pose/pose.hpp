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

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "image/bounds.hpp"

namespace diffusionlab {
/**
 * @brief Body poses in OpenPose COCO-18 layout, converted to SVG for vector control layers.
 */
class Pose {
 public:
  struct Point {
    double x_ = 0.0;
    double y_ = 0.0;
  };
  // 18 joints, missing ones are empty
  using Person = std::vector<std::optional<Point>>;

  static constexpr int kJointCount = 18;

  Pose() = default;
  Pose(Extent extent, std::vector<Person> people);

  /**
   * @brief Parse OpenPose output. Accepts a single frame object or an array of frames, of which
   * the first is used. Normalized coordinates are mapped to the canvas size.
   * @throws std::runtime_error if the structure is not an OpenPose frame
   */
  static auto FromOpenPoseJSON(const nlohmann::json& j) -> Pose;

  void Scale(Extent target);
  auto ToSVG() const -> std::string;

  auto GetExtent() const -> Extent { return extent_; }
  auto GetPeople() const -> const std::vector<Person>& { return people_; }

 private:
  Extent              extent_{};
  std::vector<Person> people_{};
};
};  // namespace diffusionlab
