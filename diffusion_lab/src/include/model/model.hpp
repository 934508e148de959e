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

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "client/client.hpp"
#include "client/connection.hpp"
#include "concurrency/task_runner.hpp"
#include "config/settings.hpp"
#include "control/control_layer.hpp"
#include "document/document.hpp"
#include "image/image.hpp"
#include "jobs/job_queue.hpp"
#include "model/params.hpp"
#include "style/style.hpp"
#include "workflow/work_request.hpp"

namespace diffusionlab {
/**
 * @brief Layer currently showing a result, plus the last live result.
 */
struct PreviewSession {
  layer_id_t                 layer_{};
  std::optional<ResultImage> live_result_{};
};

/**
 * @brief Diffusion workflows of one host document.
 *
 * Stores the generation inputs, dispatches work to the backend, reconciles backend events with
 * the job queue and manages the preview layer. All members must be used from the thread the
 * model lives in. Backend submissions are awaited by a TaskRunner and resumed on that thread.
 */
class Model final : public QObject {
  Q_OBJECT
  Q_PROPERTY(double progress READ GetProgress NOTIFY ProgressChanged)
  Q_PROPERTY(double strength READ GetStrength WRITE SetStrength NOTIFY StrengthChanged)
  Q_PROPERTY(QString error READ GetErrorText NOTIFY ErrorChanged)
  Q_PROPERTY(bool hasError READ HasError NOTIFY HasErrorChanged)
  Q_PROPERTY(bool canApplyResult READ CanApplyResult NOTIFY CanApplyResultChanged)

 public:
  Model(Document& document, Connection& connection, Settings& settings, const StyleList& styles,
        QObject* parent = nullptr);
  ~Model() override;

  /**
   * @brief Enqueue image generation for the current inputs. Uses the selection as mask when
   * there is one.
   */
  void Generate();
  void UpscaleImage();
  void GenerateLive();
  // Null if the request was rejected before a job was created
  auto GenerateControlLayer(ControlLayer& control) -> std::shared_ptr<Job>;

  void Cancel(bool active, bool queued);

  void ReportProgress(double value);
  void ReportError(const std::string& message);
  void ClearError();

  void HandleMessage(const ClientMessage& message);

  void UpdatePreview();
  void ShowPreview(const job_id_t& job_id, int index);
  void HidePreview();
  auto ApplyCurrentResult() -> bool;
  // Insert the last live result as a new layer, false if there is none
  auto AddLiveLayer() -> bool;

  auto History() const -> std::vector<std::shared_ptr<Job>>;
  auto HasLiveResult() const -> bool { return preview_.live_result_.has_value(); }
  auto GetLiveResult() const -> const std::optional<ResultImage>& { return preview_.live_result_; }
  auto GetPreviewLayer() const -> const layer_id_t& { return preview_.layer_; }

  auto GetWorkspace() const -> Workspace { return workspace_; }
  void SetWorkspace(Workspace workspace);
  auto GetStyle() const -> const Style& { return style_; }
  void SetStyle(Style style);
  auto GetPrompt() const -> const std::string& { return prompt_; }
  void SetPrompt(std::string prompt);
  auto GetNegativePrompt() const -> const std::string& { return negative_prompt_; }
  void SetNegativePrompt(std::string prompt);
  auto GetStrength() const -> double { return strength_; }
  void SetStrength(double strength);
  auto GetProgress() const -> double { return progress_; }
  auto GetError() const -> const std::string& { return error_; }
  auto GetErrorText() const -> QString { return QString::fromStdString(error_); }
  auto HasError() const -> bool { return !error_.empty(); }
  auto CanApplyResult() const -> bool { return can_apply_result_; }

  auto Jobs() -> JobQueue& { return jobs_; }
  auto Jobs() const -> const JobQueue& { return jobs_; }
  auto Controls() -> ControlLayerList& { return control_; }
  auto Upscale() -> UpscaleParams& { return upscale_; }
  auto Live() -> LiveParams& { return live_; }
  auto Live() const -> const LiveParams& { return live_; }
  auto GetDocument() -> Document& { return doc_; }
  auto GetDocument() const -> const Document& { return doc_; }
  auto GetConnection() -> Connection& { return connection_; }
  auto GetSettings() const -> const Settings& { return settings_; }

  auto LastTask() const -> const TaskHandle& { return last_task_; }
  auto PendingTaskCount() const -> size_t { return pending_tasks_.size(); }

 signals:
  void WorkspaceChanged(diffusionlab::Workspace workspace);
  void StyleChanged();
  void PromptChanged();
  void NegativePromptChanged();
  void StrengthChanged(double strength);
  void ProgressChanged(double progress);
  void ErrorChanged(const QString& error);
  void HasErrorChanged(bool has_error);
  void CanApplyResultChanged(bool can_apply);
  void LiveResultChanged();

 private:
  using RequestBuilder  = std::function<WorkRequest(const Client&)>;
  using EnqueuedHandler = std::function<void(const job_id_t&, const TaskHandle&)>;

  /**
   * @brief Build a request and submit it, then run on_enqueued with the backend id once the
   * submission returns. Failures at any stage end up in ReportError.
   */
  void Dispatch(std::string name, RequestBuilder build, EnqueuedHandler on_enqueued,
                const std::shared_ptr<Job>& job);
  void FinishTask(const TaskHandle& task);
  // Runs fn, converting exceptions into the error message. Returns false on failure.
  auto ReportErrors(const std::function<void()>& fn) -> bool;

  auto GetCurrentImage(const Bounds& bounds) const -> ResultImage;
  auto CollectControls(const Bounds& bounds) const -> std::vector<Control>;
  auto CheckColorMode() -> bool;
  // Preview layer if it still exists, null otherwise
  auto PreviewAnchor() const -> layer_id_t;

  void AddControlLayer(const Job& job, const std::optional<nlohmann::json>& result);
  void AddUpscaleLayer(const Job& job);
  void FinishJob(const std::shared_ptr<Job>& job, const ClientMessage& message);

  void SetProgress(double value);
  void SetError(std::string message);
  void SetCanApplyResult(bool value);

  Document&                doc_;
  Connection&              connection_;
  Settings&                settings_;

  Workspace                workspace_        = Workspace::GENERATION;
  Style                    style_{};
  std::string              prompt_{};
  std::string              negative_prompt_{};
  double                   strength_         = 1.0;
  double                   progress_         = 0.0;
  std::string              error_{};
  bool                     can_apply_result_ = false;

  JobQueue                 jobs_;
  ControlLayerList         control_;
  UpscaleParams            upscale_{};
  LiveParams               live_{};
  PreviewSession           preview_{};

  TaskRunner               task_runner_;
  TaskHandle               last_task_{};
  std::vector<TaskHandle>  pending_tasks_{};
  uint64_t                 task_counter_     = 0;
};
};  // namespace diffusionlab
