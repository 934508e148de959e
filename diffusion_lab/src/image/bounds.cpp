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

#include "image/bounds.hpp"

#include <algorithm>
#include <cmath>

namespace diffusionlab {
auto Extent::AtLeast(int size) const -> Extent {
  return {std::max(width_, size), std::max(height_, size)};
}

auto Extent::operator*(double factor) const -> Extent {
  return {static_cast<int>(std::round(width_ * factor)),
          static_cast<int>(std::round(height_ * factor))};
}

auto Bounds::ApplyCrop(const Bounds& bounds, const Bounds& crop) -> Bounds {
  const int x0 = std::max(bounds.x_, crop.x_);
  const int y0 = std::max(bounds.y_, crop.y_);
  const int x1 = std::min(bounds.x_ + bounds.width_, crop.x_ + crop.width_);
  const int y1 = std::min(bounds.y_ + bounds.height_, crop.y_ + crop.height_);
  return {x0 - crop.x_, y0 - crop.y_, std::max(0, x1 - x0), std::max(0, y1 - y0)};
}

auto Bounds::MinimumSize(const Bounds& bounds, int min_size, Extent max_extent) -> Bounds {
  const int center_x = bounds.x_ + bounds.width_ / 2;
  const int center_y = bounds.y_ + bounds.height_ / 2;
  Extent    extent   = bounds.GetExtent().AtLeast(min_size);
  extent.width_      = std::min(extent.width_, max_extent.width_);
  extent.height_     = std::min(extent.height_, max_extent.height_);
  const int x = std::min(std::max(0, center_x - extent.width_ / 2), max_extent.width_ - extent.width_);
  const int y =
      std::min(std::max(0, center_y - extent.height_ / 2), max_extent.height_ - extent.height_);
  return {x, y, extent};
}

auto Bounds::Pad(const Bounds& bounds, int padding, int min_size) -> Bounds {
  const int width   = std::max(bounds.width_ + 2 * padding, min_size);
  const int height  = std::max(bounds.height_ + 2 * padding, min_size);
  const int x       = bounds.x_ - (width - bounds.width_) / 2;
  const int y       = bounds.y_ - (height - bounds.height_) / 2;
  return {x, y, width, height};
}

auto Bounds::Clamp(const Bounds& bounds, Extent extent) -> Bounds {
  const int x0 = std::clamp(bounds.x_, 0, extent.width_);
  const int y0 = std::clamp(bounds.y_, 0, extent.height_);
  const int x1 = std::clamp(bounds.x_ + bounds.width_, 0, extent.width_);
  const int y1 = std::clamp(bounds.y_ + bounds.height_, 0, extent.height_);
  return {x0, y0, x1 - x0, y1 - y0};
}

auto Bounds::FromRect(const cv::Rect& rect) -> Bounds {
  return {rect.x, rect.y, rect.width, rect.height};
}
};  // namespace diffusionlab
