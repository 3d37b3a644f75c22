/*
 * Copyright 2025 Google LLC
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "services/common/concurrent/worker_pool.h"

#include <algorithm>
#include <optional>
#include <string>
#include <utility>

#include "absl/strings/ascii.h"
#include "services/common/loggers/request_log_context.h"

namespace rtb::bidding_engine {
namespace {

WorkerPoolOptions Sanitize(WorkerPoolOptions options) {
  options.num_workers = std::max(1, options.num_workers);
  options.queue_capacity = std::max(1, options.queue_capacity);
  return options;
}

}  // namespace

bool ParseOverflowPolicy(absl::string_view text, OverflowPolicy* policy) {
  std::string lowered = absl::AsciiStrToLower(text);
  if (lowered == "reject_new") {
    *policy = OverflowPolicy::kRejectNew;
    return true;
  }
  if (lowered == "drop_oldest") {
    *policy = OverflowPolicy::kDropOldest;
    return true;
  }
  return false;
}

std::string OverflowPolicyName(OverflowPolicy policy) {
  switch (policy) {
    case OverflowPolicy::kRejectNew:
      return "reject_new";
    case OverflowPolicy::kDropOldest:
      return "drop_oldest";
  }
  return "unknown";
}

WorkerPool::WorkerPool(WorkerPoolOptions options)
    : options_(Sanitize(options)) {
  absl::MutexLock lock(&join_mu_);
  workers_.reserve(options_.num_workers);
  for (int i = 0; i < options_.num_workers; ++i) {
    workers_.emplace_back([this]() { WorkerLoop(); });
  }
  RTB_VLOG(kNoisyInfo) << "Started worker pool with " << options_.num_workers
                       << " workers, queue capacity "
                       << options_.queue_capacity << ", overflow policy "
                       << OverflowPolicyName(options_.overflow_policy);
}

WorkerPool::~WorkerPool() { Shutdown(); }

absl::Status WorkerPool::Submit(PoolTask task) {
  std::optional<PoolTask> evicted;
  {
    absl::MutexLock lock(&mu_);
    if (shutting_down_) {
      return absl::FailedPreconditionError("Worker pool is shutting down");
    }
    if (queue_.size() >= static_cast<size_t>(options_.queue_capacity)) {
      if (options_.overflow_policy == OverflowPolicy::kRejectNew) {
        return absl::ResourceExhaustedError("Worker pool queue is full");
      }
      evicted = std::move(queue_.front());
      queue_.pop_front();
    }
    queue_.push_back(std::move(task));
  }

  // Callbacks of evicted tasks run without holding the lock.
  if (evicted.has_value()) {
    RTB_VLOG(kNoisyWarn) << "Worker pool saturated, dropping oldest task";
    if (evicted->on_cancelled) {
      std::move(evicted->on_cancelled)(absl::UnavailableError(
          "Task dropped from a saturated worker pool queue"));
    }
  }
  return absl::OkStatus();
}

absl::Status WorkerPool::Run(absl::AnyInvocable<void() &&> closure) {
  return Submit({.run = std::move(closure), .on_cancelled = nullptr});
}

void WorkerPool::Shutdown() {
  std::deque<PoolTask> pending;
  {
    absl::MutexLock lock(&mu_);
    shutting_down_ = true;
    pending.swap(queue_);
  }
  for (PoolTask& task : pending) {
    if (task.on_cancelled) {
      std::move(task.on_cancelled)(
          absl::CancelledError("Worker pool shut down before task started"));
    }
  }

  absl::MutexLock lock(&join_mu_);
  for (std::thread& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  workers_.clear();
}

int WorkerPool::QueueDepth() {
  absl::MutexLock lock(&mu_);
  return static_cast<int>(queue_.size());
}

bool WorkerPool::HasWorkOrShuttingDown() const {
  return !queue_.empty() || shutting_down_;
}

void WorkerPool::WorkerLoop() {
  while (true) {
    PoolTask task;
    mu_.LockWhen(absl::Condition(this, &WorkerPool::HasWorkOrShuttingDown));
    if (queue_.empty()) {
      // Shutting down and nothing left to run.
      mu_.Unlock();
      return;
    }
    task = std::move(queue_.front());
    queue_.pop_front();
    mu_.Unlock();

    if (task.run) {
      std::move(task.run)();
    }
  }
}

}  // namespace rtb::bidding_engine
