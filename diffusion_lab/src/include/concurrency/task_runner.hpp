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

#include <QMetaObject>
#include <QObject>
#include <QPointer>
#include <QtGlobal>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "concurrency/thread_pool.hpp"

namespace diffusionlab {
class CancellationToken {
 private:
  std::atomic<bool> cancelled_{false};

 public:
  void Cancel() noexcept { cancelled_.store(true, std::memory_order_release); }
  auto IsCancelled() const noexcept -> bool { return cancelled_.load(std::memory_order_acquire); }
};

/**
 * @brief Handle of one dispatched unit of work. Each dispatch owns its own token, cancelling it
 * prevents the continuation from registering anything and marks events of jobs created by it
 * as stale.
 */
struct TaskHandle {
  uint64_t                           id_ = 0;
  std::string                        name_{};
  std::shared_ptr<CancellationToken> token_ = nullptr;

  auto IsValid() const -> bool { return token_ != nullptr; }
  auto IsCancelled() const -> bool { return token_ && token_->IsCancelled(); }
};

/**
 * @brief Awaits futures returned by the backend client without blocking the control thread.
 * Pending futures are polled in short slices by the pool workers, so a future that resolves
 * early resumes even while older ones are still outstanding. The continuation always runs on
 * the thread of the context object, posted through the Qt event loop, and is dropped when the
 * context has been destroyed meanwhile.
 *
 * A cancelled token stops the polling and resumes the continuation right away with the
 * unresolved future. The continuation must check the token before calling get().
 *
 * While a future is still pending the context must outlive the runner, typically by owning it.
 * Destroying the runner drops every pending await without waiting for the backend.
 */
class TaskRunner {
 private:
  static constexpr auto kPollSlice = std::chrono::milliseconds(10);

  std::atomic<bool>     stopping_{false};
  ThreadPool            pool_;

  template <typename T>
  struct Waiter {
    std::future<T>                      future_;
    std::shared_ptr<CancellationToken>  token_;
    QObject*                            context_ = nullptr;
    // Read on the context thread only
    QPointer<QObject>                   guard_;
    std::function<void(std::future<T>)> continuation_;
  };

  template <typename T>
  static void Post(const std::shared_ptr<Waiter<T>>& waiter) {
    QMetaObject::invokeMethod(
        waiter->context_,
        [waiter]() {
          if (!waiter->guard_) {
            return;
          }
          waiter->continuation_(std::move(waiter->future_));
        },
        Qt::QueuedConnection);
  }

  template <typename T>
  void Poll(std::shared_ptr<Waiter<T>> waiter) {
    const bool queued = pool_.Submit([this, waiter]() {
      if (stopping_.load(std::memory_order_acquire)) {
        return;
      }
      if (waiter->token_ && waiter->token_->IsCancelled()) {
        Post(waiter);
        return;
      }
      if (waiter->future_.wait_for(kPollSlice) == std::future_status::ready) {
        Post(waiter);
        return;
      }
      Poll(waiter);
    });
    if (!queued) {
      qDebug("TaskRunner: Pool stopped, dropping pending await");
    }
  }

 public:
  explicit TaskRunner(size_t thread_count = 2) : pool_(thread_count) {}
  ~TaskRunner() { stopping_.store(true, std::memory_order_release); }

  TaskRunner(const TaskRunner&)            = delete;
  TaskRunner& operator=(const TaskRunner&) = delete;

  template <typename T>
  void Await(std::future<T> future, QObject* context, std::shared_ptr<CancellationToken> token,
             std::function<void(std::future<T>)> continuation) {
    if (!future.valid()) {
      throw std::runtime_error("[ERROR] TaskRunner: Cannot await an invalid future.");
    }
    if (context == nullptr) {
      throw std::invalid_argument("[ERROR] TaskRunner: Context object is required.");
    }
    auto waiter           = std::make_shared<Waiter<T>>();
    waiter->future_       = std::move(future);
    waiter->token_        = std::move(token);
    waiter->context_      = context;
    waiter->guard_        = context;
    waiter->continuation_ = std::move(continuation);

    if (waiter->future_.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
      Post(waiter);
      return;
    }
    Poll(std::move(waiter));
  }
};
};  // namespace diffusionlab
