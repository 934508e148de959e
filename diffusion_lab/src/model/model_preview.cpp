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

#include <format>
#include <stdexcept>

#include "model/model.hpp"

namespace diffusionlab {
void Model::UpdatePreview() {
  const auto&          selection = jobs_.Selection();
  std::shared_ptr<Job> job       = selection ? jobs_.Find(selection->job_) : nullptr;
  const bool           valid     = job && selection->image_ >= 0 &&
                                   static_cast<size_t>(selection->image_) < job->GetResults().Size();

  const bool           shown     = valid && ReportErrors([&] {
    ShowPreview(selection->job_, selection->image_);
  });
  if (!shown) {
    ReportErrors([&] { HidePreview(); });
  }
  SetCanApplyResult(shown);
}

void Model::ShowPreview(const job_id_t& job_id, int index) {
  auto job = jobs_.Find(job_id);
  if (!job || index < 0 || static_cast<size_t>(index) >= job->GetResults().Size()) {
    throw std::out_of_range(
        std::format("[ERROR] Model: Cannot show result {} of job {}.", index, job_id));
  }

  const std::string  name   = std::format("[Preview] {}", job->GetPrompt());
  const ResultImage& result = job->GetResults()[index];
  preview_.layer_           = PreviewAnchor();
  if (!preview_.layer_.isNull()) {
    doc_.SetLayerName(preview_.layer_, name);
    doc_.SetLayerContent(preview_.layer_, result, job->GetBounds());
  } else {
    preview_.layer_ = doc_.InsertLayer(name, result, job->GetBounds(), layer_id_t());
    doc_.SetLayerLocked(preview_.layer_, true);
  }
}

void Model::HidePreview() {
  if (!preview_.layer_.isNull() && doc_.HasLayer(preview_.layer_)) {
    doc_.HideLayer(preview_.layer_);
  }
}

auto Model::ApplyCurrentResult() -> bool {
  if (preview_.layer_.isNull() || !can_apply_result_ || !doc_.HasLayer(preview_.layer_)) {
    return false;
  }
  const layer_id_t layer = preview_.layer_;
  doc_.SetLayerLocked(layer, false);

  std::string      name  = doc_.GetLayerName(layer);
  const std::string from = "[Preview]";
  if (auto pos = name.find(from); pos != std::string::npos) {
    name.replace(pos, from.size(), "[Generated]");
  }
  doc_.SetLayerName(layer, name);

  preview_.layer_ = layer_id_t();
  SetCanApplyResult(false);
  return true;
}

auto Model::AddLiveLayer() -> bool {
  if (!preview_.live_result_) {
    return false;
  }
  doc_.InsertLayer(std::format("[Live] {}", prompt_), *preview_.live_result_,
                   Bounds(0, 0, doc_.GetExtent()), layer_id_t());
  return true;
}

auto Model::PreviewAnchor() const -> layer_id_t {
  if (!preview_.layer_.isNull() && doc_.HasLayer(preview_.layer_)) {
    return preview_.layer_;
  }
  return layer_id_t();
}
};  // namespace diffusionlab
