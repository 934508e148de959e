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

#include <QMetaType>
#include <QPointer>

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "concurrency/task_runner.hpp"
#include "image/bounds.hpp"
#include "image/image.hpp"
#include "type/type.hpp"

namespace diffusionlab {
class ControlLayer;

enum class JobState : int { QUEUED, EXECUTING, FINISHED, CANCELLED };
enum class JobKind : int { DIFFUSION, CONTROL_LAYER, UPSCALING, LIVE_PREVIEW };

/**
 * @brief One submitted generation request. Kind and creation time never change, the backend id
 * is assigned at most once. State and results are only mutated by JobQueue.
 */
class Job {
 private:
  std::optional<job_id_t>               id_;
  const JobKind                         kind_;
  JobState                              state_ = JobState::QUEUED;
  std::string                           prompt_;
  Bounds                                bounds_;
  QPointer<ControlLayer>                control_;
  std::chrono::system_clock::time_point timestamp_;
  ImageCollection                       results_;

  // Token of the dispatch that created this job, may be null
  std::shared_ptr<CancellationToken>    dispatch_token_ = nullptr;

  friend class JobQueue;

 public:
  Job(std::optional<job_id_t> id, JobKind kind, std::string prompt, Bounds bounds);

  auto GetId() const -> const std::optional<job_id_t>& { return id_; }
  auto GetKind() const -> JobKind { return kind_; }
  auto GetState() const -> JobState { return state_; }
  auto GetPrompt() const -> const std::string& { return prompt_; }
  auto GetBounds() const -> const Bounds& { return bounds_; }
  auto GetTimestamp() const -> std::chrono::system_clock::time_point { return timestamp_; }
  auto GetResults() const -> const ImageCollection& { return results_; }
  auto GetControl() const -> ControlLayer*;

  void SetDispatchToken(std::shared_ptr<CancellationToken> token) {
    dispatch_token_ = std::move(token);
  }
  auto IsStale() const -> bool { return dispatch_token_ && dispatch_token_->IsCancelled(); }
};

auto JobStateName(JobState state) -> const char*;
auto JobKindName(JobKind kind) -> const char*;
};  // namespace diffusionlab

Q_DECLARE_METATYPE(std::shared_ptr<diffusionlab::Job>)
