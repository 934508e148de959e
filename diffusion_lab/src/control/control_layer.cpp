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

#include "control/control_layer.hpp"

#include <QtGlobal>

#include <algorithm>
#include <format>
#include <stdexcept>
#include <utility>

#include "client/client.hpp"
#include "jobs/job.hpp"
#include "model/model.hpp"

namespace diffusionlab {
namespace {
auto JoinFilenames(const std::vector<std::string>& filenames) -> std::string {
  std::string joined = "[";
  for (size_t i = 0; i < filenames.size(); ++i) {
    if (i > 0) {
      joined += ", ";
    }
    joined += filenames[i];
  }
  return joined + "]";
}
}  // namespace

ControlLayer::ControlLayer(Model& model, ControlMode mode, layer_id_t layer_id, QObject* parent)
    : QObject(parent), model_(model), mode_(mode), layer_id_(std::move(layer_id)) {
  connect(this, &ControlLayer::ModeChanged, this, &ControlLayer::UpdateIsSupported);
  connect(this, &ControlLayer::ModeChanged, this, &ControlLayer::UpdateIsPoseVector);
  connect(this, &ControlLayer::LayerIdChanged, this, &ControlLayer::UpdateIsPoseVector);
  connect(&model_, &Model::StyleChanged, this, &ControlLayer::UpdateIsSupported);
  connect(&model_.GetConnection(), &Connection::StateChanged, this,
          &ControlLayer::UpdateIsSupported);
  connect(&model_.Jobs(), &JobQueue::JobFinished, this, &ControlLayer::UpdateActiveJob);
  connect(&model_.Jobs(), &JobQueue::CountChanged, this, &ControlLayer::UpdateActiveJob);
  connect(&model_.GetSettings(), &Settings::Changed, this, &ControlLayer::HandleSettings);

  UpdateIsSupported();
  UpdateIsPoseVector();
}

void ControlLayer::SetMode(ControlMode mode) {
  if (mode_ == mode) {
    return;
  }
  mode_ = mode;
  emit ModeChanged(mode_);
}

void ControlLayer::SetLayerId(const layer_id_t& layer_id) {
  if (layer_id_ == layer_id) {
    return;
  }
  layer_id_ = layer_id;
  emit LayerIdChanged(layer_id_);
}

void ControlLayer::SetStrength(double strength) {
  strength = std::clamp(strength, 0.0, 1.0);
  if (strength_ == strength) {
    return;
  }
  strength_ = strength;
  emit StrengthChanged(strength_);
}

void ControlLayer::SetEnd(double end) {
  end = std::clamp(end, 0.0, 1.0);
  if (end_ == end) {
    return;
  }
  end_ = end;
  emit EndChanged(end_);
}

auto ControlLayer::GetImage(const std::optional<Bounds>& bounds) const -> Control {
  const Document& doc = model_.GetDocument();
  if (!doc.HasLayer(layer_id_)) {
    throw std::runtime_error(std::format("[ERROR] ControlLayer: Layer {} of {} control was removed.",
                                         layer_id_.toString().toStdString(),
                                         ControlModeText(mode_)));
  }

  std::optional<Bounds> region = bounds;
  if (mode_ == ControlMode::IMAGE && !doc.GetLayerBounds(layer_id_).IsEmpty()) {
    region.reset();
  }
  ResultImage image = doc.GetLayerImage(layer_id_, region);
  if (IsLineMode(mode_) || mode_ == ControlMode::STENCIL) {
    image.MakeOpaque();
  }
  return Control{mode_, std::move(image), strength_, end_};
}

void ControlLayer::Generate() {
  active_job_ = model_.GenerateControlLayer(*this);
  SetHasActiveJob(active_job_ != nullptr);
}

void ControlLayer::UpdateIsSupported() {
  bool        is_supported = true;
  std::string error_text;

  if (Client* client = model_.GetConnection().ClientIfConnected()) {
    const SDVersion version = ResolveSDVersion(model_.GetStyle(), *client);
    const auto&     caps    = client->Capabilities();
    if (mode_ == ControlMode::IMAGE) {
      if (!caps.IpAdapterModel(version)) {
        error_text   = "The server is missing the IP-Adapter model";
        is_supported = false;
      }
    } else if (!caps.ControlModel(mode_, version)) {
      const auto filenames = ControlModeFilenames(mode_, version);
      if (!filenames.empty()) {
        error_text = std::format("The ControlNet model is not installed {}", JoinFilenames(filenames));
      } else {
        error_text = std::format("Not supported for {}", SDVersionName(version));
      }
      is_supported = false;
    }
  }

  SetErrorText(std::move(error_text));
  SetIsSupported(is_supported);
  SetShowEnd(is_supported && model_.GetSettings().ShowControlEnd());
  SetCanGenerate(is_supported && ProducesControlImage(mode_));
}

void ControlLayer::UpdateIsPoseVector() {
  const auto kind = model_.GetDocument().GetLayerKind(layer_id_);
  SetIsPoseVector(mode_ == ControlMode::POSE && kind == LayerKind::VECTOR);
}

void ControlLayer::UpdateActiveJob() {
  if (!active_job_) {
    return;
  }
  const JobState state = active_job_->GetState();
  if (state == JobState::FINISHED || state == JobState::CANCELLED) {
    active_job_.reset();
    SetHasActiveJob(false);
  }
}

void ControlLayer::HandleSettings(const QString& key) {
  if (key == QLatin1String(Settings::kShowControlEnd)) {
    SetShowEnd(is_supported_ && model_.GetSettings().ShowControlEnd());
  }
}

void ControlLayer::SetIsSupported(bool value) {
  if (is_supported_ == value) return;
  is_supported_ = value;
  emit IsSupportedChanged(value);
}

void ControlLayer::SetIsPoseVector(bool value) {
  if (is_pose_vector_ == value) return;
  is_pose_vector_ = value;
  emit IsPoseVectorChanged(value);
}

void ControlLayer::SetCanGenerate(bool value) {
  if (can_generate_ == value) return;
  can_generate_ = value;
  emit CanGenerateChanged(value);
}

void ControlLayer::SetHasActiveJob(bool value) {
  if (has_active_job_ == value) return;
  has_active_job_ = value;
  emit HasActiveJobChanged(value);
}

void ControlLayer::SetShowEnd(bool value) {
  if (show_end_ == value) return;
  show_end_ = value;
  emit ShowEndChanged(value);
}

void ControlLayer::SetErrorText(std::string text) {
  if (error_text_ == text) return;
  error_text_ = std::move(text);
  emit ErrorTextChanged(GetErrorText());
}

ControlLayerList::ControlLayerList(Model& model, QObject* parent)
    : QObject(parent), model_(model) {
  connect(&model_.GetDocument(), &Document::LayersChanged, this,
          &ControlLayerList::UpdateLayerList);
}

auto ControlLayerList::Add() -> ControlLayer* {
  const layer_id_t layer   = model_.GetDocument().GetActiveLayer();
  auto*            control = new ControlLayer(model_, last_mode_, layer, this);
  connect(control, &ControlLayer::ModeChanged, this,
          [this](ControlMode mode) { last_mode_ = mode; });
  layers_.push_back(control);
  emit Added(control);
  return control;
}

void ControlLayerList::Remove(ControlLayer* control) {
  auto it = std::find(layers_.begin(), layers_.end(), control);
  if (it == layers_.end()) {
    qWarning("Attempted to remove a control layer that is not in the list");
    return;
  }
  layers_.erase(it);
  emit Removed(control);
  control->deleteLater();
}

void ControlLayerList::UpdateLayerList() {
  const Document&            doc = model_.GetDocument();
  std::vector<ControlLayer*> removed;
  for (ControlLayer* control : layers_) {
    if (!doc.HasLayer(control->GetLayerId())) {
      removed.push_back(control);
    }
  }
  for (ControlLayer* control : removed) {
    Remove(control);
  }
}
};  // namespace diffusionlab
