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

#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/synchronization/notification.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace rtb::bidding_engine {
namespace {

using ::testing::UnorderedElementsAre;

constexpr int kNumSources = 8;

RequestLogContext TestLogContext() {
  return RequestLogContext({{"request_id", "req-1"}});
}

TEST(TaskStatusNameTest, NamesEveryStatus) {
  EXPECT_EQ(TaskStatusName(TaskStatus::SUCCESS), "success");
  EXPECT_EQ(TaskStatusName(TaskStatus::EMPTY_RESPONSE), "empty");
  EXPECT_EQ(TaskStatusName(TaskStatus::ERROR), "error");
}

TEST(AsyncTaskTrackerTest, ReportsSuccessWhenOneSourceBid) {
  absl::Notification done;
  bool any_successful = false;
  AsyncTaskTracker tracker(3, TestLogContext(), [&](bool successful) {
    any_successful = successful;
    done.Notify();
  });

  tracker.TaskCompleted(TaskStatus::ERROR);
  tracker.TaskCompleted(TaskStatus::EMPTY_RESPONSE);
  EXPECT_FALSE(done.HasBeenNotified());
  tracker.TaskCompleted(TaskStatus::SUCCESS);

  ASSERT_TRUE(done.HasBeenNotified());
  EXPECT_TRUE(any_successful);
}

TEST(AsyncTaskTrackerTest, EmptyAndFailedSourcesAreNotASuccess) {
  absl::Notification done;
  bool any_successful = true;
  AsyncTaskTracker tracker(4, TestLogContext(), [&](bool successful) {
    any_successful = successful;
    done.Notify();
  });

  for (TaskStatus status : {TaskStatus::EMPTY_RESPONSE, TaskStatus::ERROR,
                            TaskStatus::CANCELLED, TaskStatus::SKIPPED}) {
    tracker.TaskCompleted(status);
  }

  ASSERT_TRUE(done.HasBeenNotified());
  EXPECT_FALSE(any_successful);
}

TEST(AsyncTaskTrackerTest, PendingTasksCountsDown) {
  AsyncTaskTracker tracker(2, TestLogContext(), [](bool) {});
  EXPECT_EQ(tracker.PendingTasks(), 2);
  tracker.TaskCompleted(TaskStatus::SUCCESS);
  EXPECT_EQ(tracker.PendingTasks(), 1);
  tracker.TaskCompleted(TaskStatus::SUCCESS);
  EXPECT_EQ(tracker.PendingTasks(), 0);
}

TEST(AsyncTaskTrackerTest, ReportsAfterCompletionAreDropped) {
  int done_calls = 0;
  AsyncTaskTracker tracker(1, TestLogContext(),
                           [&done_calls](bool) { ++done_calls; });
  tracker.TaskCompleted(TaskStatus::SUCCESS);

  bool late_closure_ran = false;
  tracker.TaskCompleted(TaskStatus::SUCCESS,
                        [&late_closure_ran]() { late_closure_ran = true; });

  EXPECT_EQ(done_calls, 1);
  EXPECT_FALSE(late_closure_ran);
}

TEST(AsyncTaskTrackerTest, ConcurrentSourcesAppendUnderTrackerLock) {
  absl::Notification done;
  std::vector<std::string> bids;
  AsyncTaskTracker tracker(kNumSources, TestLogContext(),
                           [&done](bool) { done.Notify(); });

  std::vector<std::thread> sources;
  sources.reserve(kNumSources);
  for (int i = 0; i < kNumSources; ++i) {
    sources.emplace_back([&tracker, &bids, i]() {
      tracker.TaskCompleted(TaskStatus::SUCCESS, [&bids, i]() {
        bids.push_back(absl::StrCat("bid-", i));
      });
    });
  }
  done.WaitForNotification();
  for (std::thread& source : sources) {
    source.join();
  }

  EXPECT_EQ(bids.size(), static_cast<size_t>(kNumSources));
  EXPECT_EQ(tracker.PendingTasks(), 0);
}

TEST(AsyncTaskTrackerTest, DoneCallbackMayDestroyTracker) {
  std::vector<std::string> events;
  auto tracker = std::make_unique<AsyncTaskTracker>(
      2, TestLogContext(), [&tracker, &events](bool any_successful) {
        events.push_back(any_successful ? "done:success" : "done:none");
        tracker.reset();
      });

  tracker->TaskCompleted(TaskStatus::EMPTY_RESPONSE,
                         [&events]() { events.push_back("first"); });
  tracker->TaskCompleted(TaskStatus::SUCCESS,
                         [&events]() { events.push_back("second"); });

  EXPECT_EQ(tracker, nullptr);
  EXPECT_THAT(events,
              UnorderedElementsAre("first", "second", "done:success"));
}

}  // namespace
}  // namespace rtb::bidding_engine
