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

#include "services/common/util/async_task_tracker.h"

#include <utility>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"

namespace rtb::bidding_engine {

absl::string_view TaskStatusName(TaskStatus task_status) {
  switch (task_status) {
    case TaskStatus::UNKNOWN:
      return "unknown";
    case TaskStatus::SKIPPED:
      return "skipped";
    case TaskStatus::EMPTY_RESPONSE:
      return "empty";
    case TaskStatus::CANCELLED:
      return "cancelled";
    case TaskStatus::ERROR:
      return "error";
    case TaskStatus::SUCCESS:
      return "success";
  }
  return "invalid";
}

AsyncTaskTracker::AsyncTaskTracker(
    int num_tasks_to_track, RequestLogContext log_context,
    absl::AnyInvocable<void(bool) &&> on_all_tasks_done)
    : num_tasks_to_track_(num_tasks_to_track),
      pending_tasks_count_(num_tasks_to_track),
      on_all_tasks_done_(std::move(on_all_tasks_done)),
      log_context_(std::move(log_context)) {}

void AsyncTaskTracker::TaskCompleted(TaskStatus task_status) {
  TaskCompleted(task_status, std::nullopt);
}

void AsyncTaskTracker::TaskCompleted(
    TaskStatus task_status,
    std::optional<absl::AnyInvocable<void()>> on_single_task_done) {
  bool all_done = false;
  bool any_successful = false;
  {
    absl::MutexLock lock(&mu_);
    if (pending_tasks_count_ == 0) {
      RTB_LOG(ERROR, log_context_)
          << "Task reported " << TaskStatusName(task_status)
          << " after all tasks completed: " << ToString();
      return;
    }
    const int index = static_cast<int>(task_status);
    if (index < 0 || index >= kNumTaskStatuses) {
      RTB_LOG(ERROR, log_context_) << "Invalid task status " << index;
      ++completed_counts_[static_cast<int>(TaskStatus::UNKNOWN)];
    } else {
      ++completed_counts_[index];
    }
    if (on_single_task_done.has_value()) {
      (*on_single_task_done)();
    }
    --pending_tasks_count_;
    RTB_VLOG(kStats, log_context_) << "Tasks: " << ToString();
    if (pending_tasks_count_ == 0) {
      all_done = true;
      any_successful =
          completed_counts_[static_cast<int>(TaskStatus::SUCCESS)] > 0;
    }
  }

  // The callback may destroy this tracker, so it is moved out first and
  // nothing is touched after it.
  if (all_done) {
    absl::AnyInvocable<void(bool) &&> on_all_tasks_done =
        std::move(on_all_tasks_done_);
    std::move(on_all_tasks_done)(any_successful);
  }
}

int AsyncTaskTracker::PendingTasks() {
  absl::MutexLock lock(&mu_);
  return pending_tasks_count_;
}

std::string AsyncTaskTracker::ToString() {
  std::vector<std::string> parts;
  for (int i = 0; i < kNumTaskStatuses; ++i) {
    if (completed_counts_[i] > 0) {
      parts.push_back(absl::StrCat(TaskStatusName(static_cast<TaskStatus>(i)),
                                   "=", completed_counts_[i]));
    }
  }
  return absl::StrCat(pending_tasks_count_, "/", num_tasks_to_track_,
                      " pending [", absl::StrJoin(parts, ", "), "]");
}

}  // namespace rtb::bidding_engine
