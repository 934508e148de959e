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

#include <QtGlobal>

#include <format>
#include <stdexcept>

#include "model/model.hpp"
#include "pose/pose.hpp"

namespace diffusionlab {
namespace {
auto ClientEventName(ClientEvent event) -> const char* {
  switch (event) {
    case ClientEvent::PROGRESS:
      return "progress";
    case ClientEvent::FINISHED:
      return "finished";
    case ClientEvent::INTERRUPTED:
      return "interrupted";
    case ClientEvent::ERROR:
      return "error";
  }
  return "unknown";
}
}  // namespace

void Model::HandleMessage(const ClientMessage& message) {
  auto job = jobs_.Find(message.job_id_);
  if (!job) {
    qWarning("Received %s message for unknown job %s", ClientEventName(message.event_),
             message.job_id_.c_str());
    return;
  }
  if (job->IsStale()) {
    qInfo("Ignoring %s message for job %s of a cancelled dispatch",
          ClientEventName(message.event_), message.job_id_.c_str());
    return;
  }

  qDebug("Job %s (%s): %s", message.job_id_.c_str(), JobKindName(job->GetKind()),
         ClientEventName(message.event_));
  switch (message.event_) {
    case ClientEvent::PROGRESS:
      jobs_.NotifyStarted(job);
      ReportProgress(message.progress_);
      break;
    case ClientEvent::FINISHED:
      FinishJob(job, message);
      break;
    case ClientEvent::INTERRUPTED:
      jobs_.NotifyCancelled(job);
      ReportProgress(0.0);
      break;
    case ClientEvent::ERROR:
      jobs_.NotifyCancelled(job);
      ReportError(std::format("Server execution error: {}", message.error_));
      break;
  }
}

void Model::FinishJob(const std::shared_ptr<Job>& job, const ClientMessage& message) {
  if (message.images_) {
    jobs_.SetResults(job, *message.images_);
  }

  ReportErrors([&] {
    switch (job->GetKind()) {
      case JobKind::CONTROL_LAYER:
        AddControlLayer(*job, message.result_);
        break;
      case JobKind::UPSCALING:
        AddUpscaleLayer(*job);
        break;
      case JobKind::LIVE_PREVIEW:
        if (!job->GetResults().Empty()) {
          preview_.live_result_ = job->GetResults()[0];
          emit LiveResultChanged();
        }
        break;
      case JobKind::DIFFUSION:
        break;
    }
  });

  SetProgress(1.0);
  jobs_.NotifyFinished(job);
  if (job->GetKind() != JobKind::DIFFUSION) {
    jobs_.Remove(job);
  } else if (PreviewAnchor().isNull() && job->GetId()) {
    // Also selects when the user deleted the preview layer
    jobs_.Select(*job->GetId(), 0);
  }
}

void Model::AddControlLayer(const Job& job, const std::optional<nlohmann::json>& result) {
  ControlLayer* control = job.GetControl();
  if (control == nullptr) {
    qWarning("Control layer of job %s was removed before the job finished",
             job.GetId().value_or("?").c_str());
    return;
  }

  layer_id_t layer;
  if (control->GetMode() == ControlMode::POSE && result) {
    Pose pose = Pose::FromOpenPoseJSON(*result);
    pose.Scale(job.GetBounds().GetExtent());
    layer = doc_.InsertVectorLayer(job.GetPrompt(), pose.ToSVG(), PreviewAnchor());
  } else if (!job.GetResults().Empty()) {
    layer = doc_.InsertLayer(job.GetPrompt(), job.GetResults()[0], job.GetBounds(),
                             PreviewAnchor());
  } else {
    // Execution was cached on the server and produced no image
    layer = doc_.GetActiveLayer();
  }
  control->SetLayerId(layer);
}

void Model::AddUpscaleLayer(const Job& job) {
  if (job.GetResults().Empty()) {
    throw std::runtime_error("[ERROR] Model: Upscaling job did not produce an image.");
  }
  if (!preview_.layer_.isNull()) {
    if (doc_.HasLayer(preview_.layer_)) {
      doc_.RemoveLayer(preview_.layer_);
    }
    preview_.layer_ = layer_id_t();
  }
  doc_.InsertLayer(job.GetPrompt(), job.GetResults()[0], job.GetBounds(), layer_id_t());
  doc_.Resize(job.GetBounds().GetExtent());
}
};  // namespace diffusionlab
