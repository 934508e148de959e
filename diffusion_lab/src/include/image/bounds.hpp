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

#include <opencv2/core/types.hpp>

namespace diffusionlab {
struct Extent {
  int  width_  = 0;
  int  height_ = 0;

  auto LongestSide() const -> int { return width_ > height_ ? width_ : height_; }
  auto AverageSide() const -> int { return (width_ + height_) / 2; }
  auto AtLeast(int size) const -> Extent;
  auto IsEmpty() const -> bool { return width_ <= 0 || height_ <= 0; }

  auto operator*(double factor) const -> Extent;
  auto operator==(const Extent& other) const -> bool = default;
};

/**
 * @brief Axis aligned integer rectangle in document pixel coordinates.
 */
struct Bounds {
  int  x_      = 0;
  int  y_      = 0;
  int  width_  = 0;
  int  height_ = 0;

  Bounds()     = default;
  Bounds(int x, int y, int width, int height) : x_(x), y_(y), width_(width), height_(height) {}
  Bounds(int x, int y, Extent extent)
      : x_(x), y_(y), width_(extent.width_), height_(extent.height_) {}

  auto GetExtent() const -> Extent { return {width_, height_}; }
  auto IsEmpty() const -> bool { return width_ <= 0 || height_ <= 0; }
  auto ToRect() const -> cv::Rect { return {x_, y_, width_, height_}; }

  auto operator==(const Bounds& other) const -> bool = default;

  /**
   * @brief Intersect bounds with the crop rectangle, result is relative to the crop origin.
   */
  static auto ApplyCrop(const Bounds& bounds, const Bounds& crop) -> Bounds;

  /**
   * @brief Grow bounds around their center until both sides are at least min_size, without
   * leaving an area of max_extent.
   */
  static auto MinimumSize(const Bounds& bounds, int min_size, Extent max_extent) -> Bounds;

  static auto Pad(const Bounds& bounds, int padding, int min_size = 0) -> Bounds;
  static auto Clamp(const Bounds& bounds, Extent extent) -> Bounds;
  static auto FromRect(const cv::Rect& rect) -> Bounds;
};
};  // namespace diffusionlab
