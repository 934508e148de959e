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

#include <cstddef>
#include <deque>
#include <memory>
#include <optional>
#include <string>

#include "config/settings.hpp"
#include "image/bounds.hpp"
#include "image/image.hpp"
#include "jobs/job.hpp"
#include "type/type.hpp"

namespace diffusionlab {
/**
 * @brief Queue of waiting, ongoing and finished jobs for one document.
 *
 * Jobs are kept in submission order. Finished diffusion jobs stay around as history until the
 * memory held by their results exceeds the configured budget, then the oldest entries are
 * evicted first. Other kinds are expected to be removed by the owner right after they finish.
 *
 * Not thread-safe: every call must come from the thread owning the queue.
 */
class JobQueue final : public QObject {
  Q_OBJECT

 public:
  struct Item {
    job_id_t job_;
    int      image_ = 0;

    auto     operator==(const Item& other) const -> bool = default;
  };

  using Entries = std::deque<std::shared_ptr<Job>>;

  explicit JobQueue(const Settings& settings, QObject* parent = nullptr);

  auto Add(JobKind kind, std::string prompt, Bounds bounds, ControlLayer* control = nullptr)
      -> std::shared_ptr<Job>;
  auto AddDiffusion(const job_id_t& id, std::string prompt, Bounds bounds) -> std::shared_ptr<Job>;
  auto AddControl(ControlLayer& control, Bounds bounds) -> std::shared_ptr<Job>;
  auto AddUpscale(Bounds bounds) -> std::shared_ptr<Job>;
  auto AddLive(std::string prompt, Bounds bounds) -> std::shared_ptr<Job>;

  /**
   * @brief Set the backend id of a job that was registered before enqueue returned.
   * @throws std::logic_error if the job already has an id
   */
  void AssignId(Job& job, const job_id_t& id);

  void Remove(const std::shared_ptr<Job>& job);

  auto Find(const job_id_t& id) const -> std::shared_ptr<Job>;
  auto Count(JobState state) const -> int;

  /**
   * @brief Attach results to a job. Results of diffusion jobs are accounted for and may trigger
   * pruning of older entries, the job itself is never evicted by this call.
   */
  void SetResults(const std::shared_ptr<Job>& job, ImageCollection results);

  void NotifyStarted(const std::shared_ptr<Job>& job);
  void NotifyFinished(const std::shared_ptr<Job>& job);
  void NotifyCancelled(const std::shared_ptr<Job>& job);

  void Prune(const std::shared_ptr<Job>& keep);

  void Select(const job_id_t& job_id, int index);
  void SetSelection(std::optional<Item> selection);
  auto Selection() const -> const std::optional<Item>& { return selection_; }

  auto AnyExecuting() const -> bool;
  auto MemoryUsage() const -> memory_mb_t { return memory_usage_; }

  auto Size() const -> size_t { return entries_.size(); }
  auto At(size_t index) const -> const std::shared_ptr<Job>& { return entries_.at(index); }
  auto begin() const { return entries_.begin(); }
  auto end() const { return entries_.end(); }

 signals:
  void CountChanged();
  void SelectionChanged();
  void JobFinished(std::shared_ptr<diffusionlab::Job> job);

 private:
  auto Append(std::shared_ptr<Job> job) -> std::shared_ptr<Job>;

  static auto AccountedSize(const Job& job) -> memory_mb_t;

  const Settings&     settings_;
  Entries             entries_{};
  std::optional<Item> selection_{};
  memory_mb_t         memory_usage_ = 0.0;
};
};  // namespace diffusionlab
