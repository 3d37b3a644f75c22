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

#include "services/bidding_engine/frequency_cap_tracker.h"

#include <atomic>
#include <thread>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/synchronization/notification.h"
#include "gtest/gtest.h"

namespace rtb::bidding_engine {
namespace {

constexpr char kUser[] = "user-1";
constexpr CampaignId kCampaignId = 11;
constexpr absl::Duration kWindow = absl::Hours(1);

absl::Time Start() { return absl::FromUnixSeconds(1700000000); }

TEST(FrequencyCapTrackerTest, DeniesOnceCapIsReached) {
  FrequencyCapTracker tracker;
  absl::Time now = Start();

  EXPECT_TRUE(tracker.TryConsume(kUser, kCampaignId, 2, kWindow, now));
  EXPECT_TRUE(tracker.TryConsume(kUser, kCampaignId, 2, kWindow,
                                 now + absl::Minutes(1)));
  EXPECT_FALSE(tracker.TryConsume(kUser, kCampaignId, 2, kWindow,
                                  now + absl::Minutes(2)));
  EXPECT_EQ(tracker.ExposureCount(kUser, kCampaignId, kWindow,
                                  now + absl::Minutes(2)),
            2);
}

TEST(FrequencyCapTrackerTest, WindowRolls) {
  FrequencyCapTracker tracker;
  absl::Time now = Start();
  ASSERT_TRUE(tracker.TryConsume(kUser, kCampaignId, 1, kWindow, now));
  ASSERT_FALSE(tracker.TryConsume(kUser, kCampaignId, 1, kWindow,
                                  now + absl::Minutes(59)));

  // Exactly one window later the first exposure no longer counts.
  EXPECT_TRUE(
      tracker.TryConsume(kUser, kCampaignId, 1, kWindow, now + kWindow));
  EXPECT_FALSE(tracker.TryConsume(kUser, kCampaignId, 1, kWindow,
                                  now + kWindow + absl::Seconds(1)));
}

TEST(FrequencyCapTrackerTest, ZeroCapAlwaysDenies) {
  FrequencyCapTracker tracker;
  EXPECT_FALSE(tracker.TryConsume(kUser, kCampaignId, 0, kWindow, Start()));
  EXPECT_TRUE(tracker.IsCapped(kUser, kCampaignId, 0, kWindow, Start()));
  EXPECT_EQ(tracker.ExposureCount(kUser, kCampaignId, kWindow, Start()), 0);
}

TEST(FrequencyCapTrackerTest, IsCappedDoesNotConsume) {
  FrequencyCapTracker tracker;
  absl::Time now = Start();
  for (int i = 0; i < 5; ++i) {
    EXPECT_FALSE(tracker.IsCapped(kUser, kCampaignId, 1, kWindow, now));
  }
  ASSERT_TRUE(tracker.TryConsume(kUser, kCampaignId, 1, kWindow, now));
  EXPECT_TRUE(tracker.IsCapped(kUser, kCampaignId, 1, kWindow, now));
}

TEST(FrequencyCapTrackerTest, KeysAreIndependent) {
  FrequencyCapTracker tracker;
  absl::Time now = Start();
  ASSERT_TRUE(tracker.TryConsume(kUser, kCampaignId, 1, kWindow, now));
  EXPECT_TRUE(tracker.TryConsume(kUser, kCampaignId + 1, 1, kWindow, now));
  EXPECT_TRUE(tracker.TryConsume("user-2", kCampaignId, 1, kWindow, now));
}

TEST(FrequencyCapTrackerTest, OutOfOrderTimestampsAreCounted) {
  FrequencyCapTracker tracker;
  absl::Time now = Start();
  ASSERT_TRUE(tracker.TryConsume(kUser, kCampaignId, 2, kWindow,
                                 now + absl::Minutes(10)));
  ASSERT_TRUE(tracker.TryConsume(kUser, kCampaignId, 2, kWindow, now));
  EXPECT_FALSE(tracker.TryConsume(kUser, kCampaignId, 2, kWindow,
                                  now + absl::Minutes(20)));
}

TEST(FrequencyCapTrackerTest, ConcurrentConsumersNeverExceedCap) {
  constexpr int kCap = 25;
  constexpr int kNumThreads = 8;
  FrequencyCapTracker tracker(/*num_shards=*/4);
  absl::Time now = Start();

  std::atomic<int> granted{0};
  absl::Notification start;
  std::vector<std::thread> threads;
  for (int i = 0; i < kNumThreads; ++i) {
    threads.emplace_back([&]() {
      start.WaitForNotification();
      for (int j = 0; j < 100; ++j) {
        if (tracker.TryConsume(kUser, kCampaignId, kCap, kWindow, now)) {
          granted.fetch_add(1);
        }
      }
    });
  }
  start.Notify();
  for (auto& thread : threads) {
    thread.join();
  }
  EXPECT_EQ(granted.load(), kCap);
}

TEST(FrequencyCapTrackerTest, PruneExpiredDropsEntriesOutsideTheirWindow) {
  FrequencyCapTracker tracker;
  absl::Time now = Start();
  ASSERT_TRUE(tracker.TryConsume("user-a", kCampaignId, 1, kWindow, now));
  ASSERT_TRUE(tracker.TryConsume("user-b", kCampaignId, 1, kWindow,
                                 now + absl::Minutes(30)));
  ASSERT_TRUE(tracker.TryConsume("user-b", kCampaignId + 1, 1,
                                 absl::Hours(24), now));
  EXPECT_EQ(tracker.entry_count(), 3);

  tracker.PruneExpired(now + absl::Minutes(45));
  EXPECT_EQ(tracker.entry_count(), 3);

  // user-a's only entry and user-b's short window entry have expired.
  tracker.PruneExpired(now + absl::Minutes(90));
  EXPECT_EQ(tracker.entry_count(), 1);
  EXPECT_TRUE(tracker.IsCapped("user-b", kCampaignId + 1, 1, absl::Hours(24),
                               now + absl::Minutes(90)));

  tracker.PruneExpired(now + absl::Hours(25));
  EXPECT_EQ(tracker.entry_count(), 0);
  EXPECT_TRUE(tracker.TryConsume("user-a", kCampaignId, 1, kWindow,
                                 now + absl::Hours(25)));
}

TEST(FrequencyCapTrackerTest, ConsumesSweepExpiredUsers) {
  FrequencyCapTracker tracker(/*num_shards=*/1);
  absl::Time now = Start();
  for (int i = 0; i < kFrequencyCapSweepInterval - 1; ++i) {
    ASSERT_TRUE(tracker.TryConsume(absl::StrCat("user-", i), kCampaignId, 1,
                                   kWindow, now));
  }
  EXPECT_EQ(tracker.entry_count(), kFrequencyCapSweepInterval - 1);

  // This consume completes the interval and sweeps the shard.
  EXPECT_TRUE(tracker.TryConsume("late-user", kCampaignId, 1, kWindow,
                                 now + 2 * kWindow));
  EXPECT_EQ(tracker.entry_count(), 1);
  EXPECT_FALSE(tracker.TryConsume("late-user", kCampaignId, 1, kWindow,
                                  now + 2 * kWindow + absl::Minutes(1)));
}

}  // namespace
}  // namespace rtb::bidding_engine
