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

#include "pose/pose.hpp"

#include <array>
#include <format>
#include <stdexcept>
#include <utility>

namespace diffusionlab {
namespace {
constexpr std::array<std::pair<int, int>, 17> kLimbs = {{{1, 2},
                                                         {1, 5},
                                                         {2, 3},
                                                         {3, 4},
                                                         {5, 6},
                                                         {6, 7},
                                                         {1, 8},
                                                         {8, 9},
                                                         {9, 10},
                                                         {1, 11},
                                                         {11, 12},
                                                         {12, 13},
                                                         {1, 0},
                                                         {0, 14},
                                                         {14, 16},
                                                         {0, 15},
                                                         {15, 17}}};

constexpr std::array<const char*, Pose::kJointCount> kColors = {
    "#ff0000", "#ff5500", "#ffaa00", "#ffff00", "#aaff00", "#55ff00",
    "#00ff00", "#00ff55", "#00ffaa", "#00ffff", "#00aaff", "#0055ff",
    "#0000ff", "#5500ff", "#aa00ff", "#ff00ff", "#ff00aa", "#ff0055"};

auto ParsePerson(const nlohmann::json& keypoints, bool& normalized) -> Pose::Person {
  if (!keypoints.is_array() || keypoints.size() < Pose::kJointCount * 3) {
    throw std::runtime_error(
        std::format("[ERROR] Pose: Expected {} keypoint values, got {}.", Pose::kJointCount * 3,
                    keypoints.is_array() ? keypoints.size() : 0));
  }
  Pose::Person person(Pose::kJointCount);
  for (int i = 0; i < Pose::kJointCount; ++i) {
    const double x          = keypoints[i * 3].get<double>();
    const double y          = keypoints[i * 3 + 1].get<double>();
    const double confidence = keypoints[i * 3 + 2].get<double>();
    if (confidence <= 0.0) {
      continue;
    }
    if (x > 1.0 || y > 1.0) {
      normalized = false;
    }
    person[i] = Pose::Point{x, y};
  }
  return person;
}
}  // namespace

Pose::Pose(Extent extent, std::vector<Person> people)
    : extent_(extent), people_(std::move(people)) {}

auto Pose::FromOpenPoseJSON(const nlohmann::json& j) -> Pose {
  const nlohmann::json* frame = &j;
  if (j.is_array()) {
    if (j.empty()) {
      throw std::runtime_error("[ERROR] Pose: Empty pose list.");
    }
    frame = &j.front();
  }
  if (!frame->is_object() || !frame->contains("people")) {
    throw std::runtime_error("[ERROR] Pose: Not an OpenPose frame.");
  }

  const Extent        canvas{frame->value("canvas_width", 512), frame->value("canvas_height", 512)};
  bool                normalized = true;
  std::vector<Person> people;
  for (const auto& entry : frame->at("people")) {
    people.push_back(ParsePerson(entry.at("pose_keypoints_2d"), normalized));
  }

  if (normalized) {
    for (auto& person : people) {
      for (auto& point : person) {
        if (point) {
          point->x_ *= canvas.width_;
          point->y_ *= canvas.height_;
        }
      }
    }
  }
  return Pose(canvas, std::move(people));
}

void Pose::Scale(Extent target) {
  if (extent_.IsEmpty()) {
    throw std::runtime_error("[ERROR] Pose: Cannot scale a pose without canvas size.");
  }
  const double sx = static_cast<double>(target.width_) / extent_.width_;
  const double sy = static_cast<double>(target.height_) / extent_.height_;
  for (auto& person : people_) {
    for (auto& point : person) {
      if (point) {
        point->x_ *= sx;
        point->y_ *= sy;
      }
    }
  }
  extent_ = target;
}

auto Pose::ToSVG() const -> std::string {
  std::string svg = std::format(
      "<svg width=\"{0}\" height=\"{1}\" viewBox=\"0 0 {0} {1}\" "
      "xmlns=\"http://www.w3.org/2000/svg\">",
      extent_.width_, extent_.height_);
  for (size_t p = 0; p < people_.size(); ++p) {
    const Person& person = people_[p];
    for (size_t l = 0; l < kLimbs.size(); ++l) {
      const auto& a = person[kLimbs[l].first];
      const auto& b = person[kLimbs[l].second];
      if (!a || !b) {
        continue;
      }
      svg += std::format(
          "<line id=\"person{}_limb{}\" x1=\"{:.1f}\" y1=\"{:.1f}\" x2=\"{:.1f}\" y2=\"{:.1f}\" "
          "stroke=\"{}\" stroke-width=\"4\" stroke-opacity=\"0.6\"/>",
          p, l, a->x_, a->y_, b->x_, b->y_, kColors[l]);
    }
    for (int i = 0; i < kJointCount; ++i) {
      if (const auto& point = person[i]) {
        svg += std::format(
            "<circle id=\"person{}_joint{}\" cx=\"{:.1f}\" cy=\"{:.1f}\" r=\"4\" fill=\"{}\"/>", p,
            i, point->x_, point->y_, kColors[i]);
      }
    }
  }
  svg += "</svg>";
  return svg;
}
};  // namespace diffusionlab
