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

#include "model/model.hpp"

#include <QtGlobal>

#include <algorithm>
#include <iterator>
#include <utility>

namespace diffusionlab {
Model::Model(Document& document, Connection& connection, Settings& settings,
             const StyleList& styles, QObject* parent)
    : QObject(parent),
      doc_(document),
      connection_(connection),
      settings_(settings),
      style_(styles.Default()),
      jobs_(settings),
      control_(*this) {
  qRegisterMetaType<std::shared_ptr<diffusionlab::Job>>("std::shared_ptr<diffusionlab::Job>");

  connect(&jobs_, &JobQueue::JobFinished, this, &Model::UpdatePreview);
  connect(&jobs_, &JobQueue::SelectionChanged, this, &Model::UpdatePreview);
  connect(&connection_, &Connection::MessageReceived, this, &Model::HandleMessage);

  if (Client* client = connection_.ClientIfConnected()) {
    auto supported = FilterSupportedStyles(styles, *client);
    if (!supported.empty()) {
      style_ = supported.front();
    }
    upscale_.upscaler_ = client->Capabilities().default_upscaler_;
  }
}

Model::~Model() {
  for (auto& task : pending_tasks_) {
    task.token_->Cancel();
  }
}

void Model::Cancel(bool active, bool queued) {
  if (queued) {
    std::vector<std::shared_ptr<Job>> to_remove;
    for (const auto& job : jobs_) {
      if (job->GetState() == JobState::QUEUED) {
        to_remove.push_back(job);
      }
    }
    // Dispatches still waiting for their id would otherwise register new jobs afterwards
    for (auto& task : pending_tasks_) {
      task.token_->Cancel();
    }
    if (!to_remove.empty() || !pending_tasks_.empty()) {
      connection_.ClearQueue();
    }
    for (const auto& job : to_remove) {
      jobs_.NotifyCancelled(job);
      jobs_.Remove(job);
    }
  }
  if (active && jobs_.AnyExecuting()) {
    connection_.Interrupt();
  }
}

void Model::ReportProgress(double value) { SetProgress(value); }

void Model::ReportError(const std::string& message) {
  SetError(message);
  live_.is_active_ = false;
}

void Model::ClearError() {
  if (!error_.empty()) {
    SetError({});
  }
}

auto Model::History() const -> std::vector<std::shared_ptr<Job>> {
  std::vector<std::shared_ptr<Job>> finished;
  std::copy_if(jobs_.begin(), jobs_.end(), std::back_inserter(finished),
               [](const std::shared_ptr<Job>& job) {
                 return job->GetState() == JobState::FINISHED;
               });
  return finished;
}

void Model::SetWorkspace(Workspace workspace) {
  if (workspace_ == Workspace::LIVE) {
    live_.is_active_ = false;
  }
  workspace_ = workspace;
  emit WorkspaceChanged(workspace_);
}

void Model::SetStyle(Style style) {
  if (style_ == style) {
    return;
  }
  style_ = std::move(style);
  emit StyleChanged();
}

void Model::SetPrompt(std::string prompt) {
  if (prompt_ == prompt) {
    return;
  }
  prompt_ = std::move(prompt);
  emit PromptChanged();
}

void Model::SetNegativePrompt(std::string prompt) {
  if (negative_prompt_ == prompt) {
    return;
  }
  negative_prompt_ = std::move(prompt);
  emit NegativePromptChanged();
}

void Model::SetStrength(double strength) {
  strength = std::clamp(strength, 0.0, 1.0);
  if (strength_ == strength) {
    return;
  }
  strength_ = strength;
  emit StrengthChanged(strength_);
}

void Model::SetProgress(double value) {
  if (progress_ == value) {
    return;
  }
  progress_ = value;
  emit ProgressChanged(progress_);
}

void Model::SetError(std::string message) {
  if (error_ == message) {
    return;
  }
  error_ = std::move(message);
  emit ErrorChanged(GetErrorText());
  emit HasErrorChanged(HasError());
}

void Model::SetCanApplyResult(bool value) {
  if (can_apply_result_ == value) {
    return;
  }
  can_apply_result_ = value;
  emit CanApplyResultChanged(can_apply_result_);
}
};  // namespace diffusionlab
