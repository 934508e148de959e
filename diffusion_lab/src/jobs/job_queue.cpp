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

#include "jobs/job_queue.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>
#include <utility>

#include "control/control_layer.hpp"
#include "control/control_mode.hpp"

namespace diffusionlab {
namespace {
constexpr double kBytesPerMB = 1024.0 * 1024.0;
}  // namespace

JobQueue::JobQueue(const Settings& settings, QObject* parent)
    : QObject(parent), settings_(settings) {}

auto JobQueue::Add(JobKind kind, std::string prompt, Bounds bounds, ControlLayer* control)
    -> std::shared_ptr<Job> {
  auto job      = std::make_shared<Job>(std::nullopt, kind, std::move(prompt), bounds);
  job->control_ = control;
  return Append(std::move(job));
}

auto JobQueue::AddDiffusion(const job_id_t& id, std::string prompt, Bounds bounds)
    -> std::shared_ptr<Job> {
  return Append(std::make_shared<Job>(id, JobKind::DIFFUSION, std::move(prompt), bounds));
}

auto JobQueue::AddControl(ControlLayer& control, Bounds bounds) -> std::shared_ptr<Job> {
  auto prompt = std::format("[Control] {}", ControlModeText(control.GetMode()));
  return Add(JobKind::CONTROL_LAYER, std::move(prompt), bounds, &control);
}

auto JobQueue::AddUpscale(Bounds bounds) -> std::shared_ptr<Job> {
  auto prompt = std::format("[Upscale] {}x{}", bounds.width_, bounds.height_);
  return Add(JobKind::UPSCALING, std::move(prompt), bounds);
}

auto JobQueue::AddLive(std::string prompt, Bounds bounds) -> std::shared_ptr<Job> {
  return Add(JobKind::LIVE_PREVIEW, std::move(prompt), bounds);
}

auto JobQueue::Append(std::shared_ptr<Job> job) -> std::shared_ptr<Job> {
  entries_.push_back(job);
  emit CountChanged();
  return job;
}

void JobQueue::AssignId(Job& job, const job_id_t& id) {
  if (job.id_.has_value()) {
    throw std::logic_error(std::format(
        "[ERROR] JobQueue: Job already has id {}, cannot reassign to {}.", *job.id_, id));
  }
  job.id_ = id;
}

void JobQueue::Remove(const std::shared_ptr<Job>& job) {
  auto it = std::find(entries_.begin(), entries_.end(), job);
  if (it == entries_.end()) {
    return;
  }
  memory_usage_ -= AccountedSize(**it);
  entries_.erase(it);
  emit CountChanged();
}

auto JobQueue::Find(const job_id_t& id) const -> std::shared_ptr<Job> {
  auto it = std::find_if(entries_.begin(), entries_.end(),
                         [&id](const std::shared_ptr<Job>& job) { return job->id_ == id; });
  return it != entries_.end() ? *it : nullptr;
}

auto JobQueue::Count(JobState state) const -> int {
  return static_cast<int>(
      std::count_if(entries_.begin(), entries_.end(),
                    [state](const std::shared_ptr<Job>& job) { return job->state_ == state; }));
}

void JobQueue::SetResults(const std::shared_ptr<Job>& job, ImageCollection results) {
  const bool present = std::find(entries_.begin(), entries_.end(), job) != entries_.end();
  if (present) {
    memory_usage_ -= AccountedSize(*job);
  }
  job->results_ = std::move(results);
  if (job->kind_ != JobKind::DIFFUSION) {
    return;
  }
  if (present) {
    memory_usage_ += AccountedSize(*job);
  }
  Prune(job);
}

void JobQueue::NotifyStarted(const std::shared_ptr<Job>& job) {
  if (job->state_ != JobState::QUEUED) {
    return;
  }
  job->state_ = JobState::EXECUTING;
  emit CountChanged();
}

void JobQueue::NotifyFinished(const std::shared_ptr<Job>& job) {
  job->state_ = JobState::FINISHED;
  emit JobFinished(job);
  emit CountChanged();
}

void JobQueue::NotifyCancelled(const std::shared_ptr<Job>& job) {
  job->state_ = JobState::CANCELLED;
  emit CountChanged();
}

void JobQueue::Prune(const std::shared_ptr<Job>& keep) {
  bool evicted = false;
  while (!entries_.empty() && memory_usage_ > settings_.HistorySize() && entries_.front() != keep) {
    auto discarded = std::move(entries_.front());
    entries_.pop_front();
    memory_usage_ -= AccountedSize(*discarded);
    evicted = true;
  }
  if (entries_.empty()) {
    // Avoid drifting below zero from floating point leftovers
    memory_usage_ = 0.0;
  }
  if (evicted) {
    emit CountChanged();
  }
}

void JobQueue::Select(const job_id_t& job_id, int index) { SetSelection(Item{job_id, index}); }

void JobQueue::SetSelection(std::optional<Item> selection) {
  selection_ = std::move(selection);
  emit SelectionChanged();
}

auto JobQueue::AnyExecuting() const -> bool {
  return std::any_of(entries_.begin(), entries_.end(), [](const std::shared_ptr<Job>& job) {
    return job->state_ == JobState::EXECUTING;
  });
}

auto JobQueue::AccountedSize(const Job& job) -> memory_mb_t {
  if (job.kind_ != JobKind::DIFFUSION) {
    return 0.0;
  }
  return static_cast<double>(job.results_.SizeInBytes()) / kBytesPerMB;
}
};  // namespace diffusionlab
