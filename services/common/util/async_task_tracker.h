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

#ifndef SERVICES_COMMON_UTIL_ASYNC_TASK_TRACKER_H_
#define SERVICES_COMMON_UTIL_ASYNC_TASK_TRACKER_H_

#include <array>
#include <cstdint>
#include <optional>
#include <string>

#include "absl/base/thread_annotations.h"
#include "absl/functional/any_invocable.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "services/common/loggers/request_log_context.h"

namespace rtb::bidding_engine {

enum class TaskStatus : std::uint8_t {
  UNKNOWN,
  SKIPPED,         // Task skipped.
  EMPTY_RESPONSE,  // Task received an empty response.
  CANCELLED,       // Task cancelled.
  ERROR,
  SUCCESS,
};

inline constexpr int kNumTaskStatuses =
    static_cast<int>(TaskStatus::SUCCESS) + 1;

absl::string_view TaskStatusName(TaskStatus task_status);

// Tracks a fixed number of concurrent tasks, e.g. one request per bid source,
// and calls `on_all_tasks_done` once every task has reported back.
// `on_all_tasks_done` receives whether any task returned SUCCESS. It runs on
// the thread of the last report, without holding any lock, and may destroy
// the tracker.
//
// Tasks can report from any thread. The optional per-task closure runs under
// the tracker's lock, so closures of different tasks never overlap. Reports
// arriving after the last expected one are logged and dropped.
//
// The tracker keeps its own copy of the log context since tasks may complete
// after the request that started them has returned.
class AsyncTaskTracker {
 public:
  explicit AsyncTaskTracker(
      int num_tasks_to_track, RequestLogContext log_context,
      absl::AnyInvocable<void(bool) &&> on_all_tasks_done);

  // Updates the stats. If all tasks have been completed, then the registered
  // callback is called.
  void TaskCompleted(TaskStatus task_status) ABSL_LOCKS_EXCLUDED(mu_);

  // Updates the stats. If all tasks have been completed, then the registered
  // callback is called. `on_single_task_done`, if provided, will be called with
  // a lock.
  void TaskCompleted(
      TaskStatus task_status,
      std::optional<absl::AnyInvocable<void()>> on_single_task_done)
      ABSL_LOCKS_EXCLUDED(mu_);

  // Number of tasks that have not reported completion yet.
  int PendingTasks() ABSL_LOCKS_EXCLUDED(mu_);

 private:
  std::string ToString() ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);

  const int num_tasks_to_track_;
  absl::Mutex mu_;
  int pending_tasks_count_ ABSL_GUARDED_BY(mu_);
  // Completed tasks, indexed by TaskStatus.
  std::array<int, kNumTaskStatuses> completed_counts_ ABSL_GUARDED_BY(mu_) =
      {};
  absl::AnyInvocable<void(bool) &&> on_all_tasks_done_;
  const RequestLogContext log_context_;
};

}  // namespace rtb::bidding_engine

#endif  // SERVICES_COMMON_UTIL_ASYNC_TASK_TRACKER_H_
