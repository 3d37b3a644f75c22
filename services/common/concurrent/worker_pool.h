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

#ifndef SERVICES_COMMON_CONCURRENT_WORKER_POOL_H_
#define SERVICES_COMMON_CONCURRENT_WORKER_POOL_H_

#include <cstdint>
#include <deque>
#include <string>
#include <thread>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/functional/any_invocable.h"
#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "services/common/concurrent/executor.h"

namespace rtb::bidding_engine {

// What a saturated pool does with a new submission.
enum class OverflowPolicy : std::uint8_t {
  // The new task is refused with RESOURCE_EXHAUSTED.
  kRejectNew,
  // The oldest queued task is cancelled with UNAVAILABLE and the new task is
  // queued in its place.
  kDropOldest,
};

// Parses "reject_new" / "drop_oldest" (case insensitive).
bool ParseOverflowPolicy(absl::string_view text, OverflowPolicy* policy);
std::string OverflowPolicyName(OverflowPolicy policy);

struct WorkerPoolOptions {
  int num_workers = 4;
  // Maximum number of tasks waiting for a worker. Tasks being executed do not
  // count against it.
  int queue_capacity = 1024;
  OverflowPolicy overflow_policy = OverflowPolicy::kRejectNew;
};

// A unit of work for the pool. Exactly one of the two callbacks is invoked:
// `run` on a worker thread, or `on_cancelled` when the task is evicted from a
// saturated queue or the pool shuts down before the task started.
struct PoolTask {
  absl::AnyInvocable<void() &&> run;
  absl::AnyInvocable<void(absl::Status) &&> on_cancelled;
};

// Fixed size pool of threads draining a bounded FIFO queue.
class WorkerPool : public Executor {
 public:
  explicit WorkerPool(WorkerPoolOptions options);

  // Shuts the pool down, see `Shutdown`.
  ~WorkerPool() override;

  // WorkerPool is neither copyable nor movable.
  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  // Queues `task`, applying the overflow policy when the queue is full.
  // Returns RESOURCE_EXHAUSTED if the task was rejected and FAILED_PRECONDITION
  // if the pool is shutting down. A rejected task's callbacks are not invoked.
  absl::Status Submit(PoolTask task) ABSL_LOCKS_EXCLUDED(mu_);

  // Executor implementation. The closure is dropped silently if it gets
  // evicted from the queue.
  absl::Status Run(absl::AnyInvocable<void() &&> closure) override;

  // Stops accepting work, cancels queued tasks with CANCELLED and waits for
  // running tasks to finish. Safe to call more than once, but not from a task
  // running on this pool.
  void Shutdown() ABSL_LOCKS_EXCLUDED(mu_);

  // Number of tasks waiting for a worker.
  int QueueDepth() ABSL_LOCKS_EXCLUDED(mu_);

  const WorkerPoolOptions& options() const { return options_; }

 private:
  void WorkerLoop() ABSL_LOCKS_EXCLUDED(mu_);
  bool HasWorkOrShuttingDown() const ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);

  const WorkerPoolOptions options_;
  absl::Mutex mu_;
  std::deque<PoolTask> queue_ ABSL_GUARDED_BY(mu_);
  bool shutting_down_ ABSL_GUARDED_BY(mu_) = false;
  absl::Mutex join_mu_;
  std::vector<std::thread> workers_ ABSL_GUARDED_BY(join_mu_);
};

}  // namespace rtb::bidding_engine

#endif  // SERVICES_COMMON_CONCURRENT_WORKER_POOL_H_
