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

#include "jobs/job.hpp"

#include <utility>

#include "control/control_layer.hpp"

namespace diffusionlab {
Job::Job(std::optional<job_id_t> id, JobKind kind, std::string prompt, Bounds bounds)
    : id_(std::move(id)),
      kind_(kind),
      prompt_(std::move(prompt)),
      bounds_(bounds),
      timestamp_(std::chrono::system_clock::now()) {}

auto Job::GetControl() const -> ControlLayer* { return control_.data(); }

auto JobStateName(JobState state) -> const char* {
  switch (state) {
    case JobState::QUEUED:
      return "queued";
    case JobState::EXECUTING:
      return "executing";
    case JobState::FINISHED:
      return "finished";
    case JobState::CANCELLED:
      return "cancelled";
  }
  return "unknown";
}

auto JobKindName(JobKind kind) -> const char* {
  switch (kind) {
    case JobKind::DIFFUSION:
      return "diffusion";
    case JobKind::CONTROL_LAYER:
      return "control_layer";
    case JobKind::UPSCALING:
      return "upscaling";
    case JobKind::LIVE_PREVIEW:
      return "live_preview";
  }
  return "unknown";
}
};  // namespace diffusionlab
