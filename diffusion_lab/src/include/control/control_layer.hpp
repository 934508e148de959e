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

#include <QObject>
#include <QString>
#include <QUuid>

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "control/control_mode.hpp"
#include "image/bounds.hpp"
#include "type/type.hpp"
#include "workflow/work_request.hpp"

namespace diffusionlab {
class Job;
class Model;

/**
 * @brief Conditioning input backed by a layer of the document.
 *
 * Derived flags are recomputed whenever one of their inputs changes: the mode, the model style,
 * the connection state, the backing layer or the settings.
 */
class ControlLayer final : public QObject {
  Q_OBJECT
  Q_PROPERTY(double strength READ GetStrength WRITE SetStrength NOTIFY StrengthChanged)
  Q_PROPERTY(double end READ GetEnd WRITE SetEnd NOTIFY EndChanged)
  Q_PROPERTY(bool isSupported READ IsSupported NOTIFY IsSupportedChanged)
  Q_PROPERTY(bool isPoseVector READ IsPoseVector NOTIFY IsPoseVectorChanged)
  Q_PROPERTY(bool canGenerate READ CanGenerate NOTIFY CanGenerateChanged)
  Q_PROPERTY(bool hasActiveJob READ HasActiveJob NOTIFY HasActiveJobChanged)
  Q_PROPERTY(bool showEnd READ ShowEnd NOTIFY ShowEndChanged)
  Q_PROPERTY(QString errorText READ GetErrorText NOTIFY ErrorTextChanged)

 public:
  ControlLayer(Model& model, ControlMode mode, layer_id_t layer_id, QObject* parent = nullptr);

  auto GetMode() const -> ControlMode { return mode_; }
  void SetMode(ControlMode mode);
  auto GetLayerId() const -> const layer_id_t& { return layer_id_; }
  void SetLayerId(const layer_id_t& layer_id);
  auto GetStrength() const -> double { return strength_; }
  void SetStrength(double strength);
  auto GetEnd() const -> double { return end_; }
  void SetEnd(double end);

  auto IsSupported() const -> bool { return is_supported_; }
  auto IsPoseVector() const -> bool { return is_pose_vector_; }
  auto CanGenerate() const -> bool { return can_generate_; }
  auto HasActiveJob() const -> bool { return has_active_job_; }
  auto ShowEnd() const -> bool { return show_end_; }
  auto GetErrorText() const -> QString { return QString::fromStdString(error_text_); }

  /**
   * @brief Pixels of the backing layer as conditioning input. Line modes and stencils are
   * flattened onto white. Image references use the whole layer when it has content.
   * @throws std::runtime_error if the backing layer no longer exists
   */
  auto GetImage(const std::optional<Bounds>& bounds) const -> Control;

  // Create a control image from the current document
  void Generate();

 signals:
  void ModeChanged(diffusionlab::ControlMode mode);
  void LayerIdChanged(const QUuid& layer_id);
  void StrengthChanged(double strength);
  void EndChanged(double end);
  void IsSupportedChanged(bool value);
  void IsPoseVectorChanged(bool value);
  void CanGenerateChanged(bool value);
  void HasActiveJobChanged(bool value);
  void ShowEndChanged(bool value);
  void ErrorTextChanged(const QString& text);

 private:
  void UpdateIsSupported();
  void UpdateIsPoseVector();
  void UpdateActiveJob();
  void HandleSettings(const QString& key);

  void SetIsSupported(bool value);
  void SetIsPoseVector(bool value);
  void SetCanGenerate(bool value);
  void SetHasActiveJob(bool value);
  void SetShowEnd(bool value);
  void SetErrorText(std::string text);

  Model&               model_;
  ControlMode          mode_;
  layer_id_t           layer_id_;
  double               strength_       = 1.0;
  double               end_            = 1.0;
  bool                 is_supported_   = true;
  bool                 is_pose_vector_ = false;
  bool                 can_generate_   = true;
  bool                 has_active_job_ = false;
  bool                 show_end_       = false;
  std::string          error_text_{};
  std::shared_ptr<Job> active_job_     = nullptr;
};

/**
 * @brief Control layers of one document, in insertion order. Controls whose layer disappears
 * from the document are removed automatically.
 */
class ControlLayerList final : public QObject {
  Q_OBJECT

 public:
  explicit ControlLayerList(Model& model, QObject* parent = nullptr);

  auto Add() -> ControlLayer*;
  void Remove(ControlLayer* control);

  auto Size() const -> size_t { return layers_.size(); }
  auto At(size_t index) const -> ControlLayer* { return layers_.at(index); }
  auto LastMode() const -> ControlMode { return last_mode_; }
  auto begin() const { return layers_.begin(); }
  auto end() const { return layers_.end(); }

 signals:
  void Added(diffusionlab::ControlLayer* control);
  void Removed(diffusionlab::ControlLayer* control);

 private:
  void UpdateLayerList();

  Model&                     model_;
  std::vector<ControlLayer*> layers_{};
  ControlMode                last_mode_ = ControlMode::SCRIBBLE;
};
};  // namespace diffusionlab
