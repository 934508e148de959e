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

#include <cstddef>
#include <opencv2/core.hpp>
#include <vector>

#include "image/bounds.hpp"

namespace diffusionlab {
/**
 * @brief Pixel payload exchanged with the host document and the backend. Pixels are stored as
 * 8-bit BGRA. The matrix header is shared on copy, use Clone() for a deep copy.
 */
class ResultImage {
 private:
  cv::Mat data_;

 public:
  ResultImage() = default;
  explicit ResultImage(cv::Mat data);

  static auto Create(Extent extent, const cv::Scalar& fill = cv::Scalar(0, 0, 0, 255))
      -> ResultImage;

  auto        GetData() -> cv::Mat& { return data_; }
  auto        GetData() const -> const cv::Mat& { return data_; }
  auto        GetExtent() const -> Extent { return {data_.cols, data_.rows}; }
  auto        IsNull() const -> bool { return data_.empty(); }
  auto        SizeInBytes() const -> size_t;

  /**
   * @brief Composite the image onto a solid background, leaving it fully opaque.
   */
  void        MakeOpaque(const cv::Scalar& background = cv::Scalar(255, 255, 255, 255));

  ResultImage Clone() const;
};

/**
 * @brief Ordered set of images produced by a single job.
 */
class ImageCollection {
 private:
  std::vector<ResultImage> images_;

 public:
  ImageCollection() = default;
  explicit ImageCollection(std::vector<ResultImage> images) : images_(std::move(images)) {}

  void Append(ResultImage image) { images_.push_back(std::move(image)); }

  auto Size() const -> size_t { return images_.size(); }
  auto Empty() const -> bool { return images_.empty(); }
  auto SizeInBytes() const -> size_t;

  auto operator[](size_t index) const -> const ResultImage& { return images_[index]; }
  auto begin() const { return images_.begin(); }
  auto end() const { return images_.end(); }
};

/**
 * @brief Single channel selection mask positioned in the document.
 */
struct Mask {
  Bounds  bounds_;
  cv::Mat data_;  // CV_8UC1, same size as bounds_

  Mask() = default;
  Mask(Bounds bounds, cv::Mat data) : bounds_(bounds), data_(std::move(data)) {}
};
};  // namespace diffusionlab
