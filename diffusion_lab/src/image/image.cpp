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

#include "image/image.hpp"

#include <numeric>
#include <stdexcept>
#include <utility>

namespace diffusionlab {
ResultImage::ResultImage(cv::Mat data) : data_(std::move(data)) {
  if (!data_.empty() && data_.type() != CV_8UC4) {
    throw std::runtime_error("[ERROR] ResultImage: Expected 8-bit BGRA pixel data.");
  }
}

auto ResultImage::Create(Extent extent, const cv::Scalar& fill) -> ResultImage {
  return ResultImage(cv::Mat(extent.height_, extent.width_, CV_8UC4, fill));
}

auto ResultImage::SizeInBytes() const -> size_t { return data_.total() * data_.elemSize(); }

void ResultImage::MakeOpaque(const cv::Scalar& background) {
  if (data_.empty()) {
    return;
  }
  cv::Mat result(data_.size(), CV_8UC4);
  for (int r = 0; r < data_.rows; ++r) {
    const auto* src = data_.ptr<cv::Vec4b>(r);
    auto*       dst = result.ptr<cv::Vec4b>(r);
    for (int c = 0; c < data_.cols; ++c) {
      const int alpha = src[c][3];
      for (int ch = 0; ch < 3; ++ch) {
        dst[c][ch] = cv::saturate_cast<uchar>(
            (src[c][ch] * alpha + static_cast<int>(background[ch]) * (255 - alpha)) / 255);
      }
      dst[c][3] = 255;
    }
  }
  data_ = std::move(result);
}

ResultImage ResultImage::Clone() const { return ResultImage(data_.clone()); }

auto ImageCollection::SizeInBytes() const -> size_t {
  return std::accumulate(images_.begin(), images_.end(), size_t{0},
                         [](size_t sum, const ResultImage& img) { return sum + img.SizeInBytes(); });
}
};  // namespace diffusionlab
