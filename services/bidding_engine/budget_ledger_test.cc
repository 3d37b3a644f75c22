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

#include "services/bidding_engine/budget_ledger.h"

#include <atomic>
#include <thread>
#include <vector>

#include "absl/synchronization/notification.h"
#include "gtest/gtest.h"

namespace rtb::bidding_engine {
namespace {

constexpr CampaignId kCampaignId = 7;

TEST(BudgetLedgerTest, ReservesWithinBudget) {
  BudgetLedger ledger;
  ledger.OpenAccount(kCampaignId, /*daily_budget=*/100, /*spent=*/20);

  EXPECT_TRUE(ledger.TryReserve(kCampaignId, 50));
  EXPECT_EQ(*ledger.Spent(kCampaignId), 70);
  EXPECT_EQ(*ledger.Remaining(kCampaignId), 30);
  EXPECT_TRUE(ledger.TryReserve(kCampaignId, 30));
  EXPECT_FALSE(ledger.TryReserve(kCampaignId, 1));
  EXPECT_EQ(*ledger.Spent(kCampaignId), 100);
}

TEST(BudgetLedgerTest, FailedReservationDoesNotMutate) {
  BudgetLedger ledger;
  ledger.OpenAccount(kCampaignId, 100, 90);

  EXPECT_FALSE(ledger.TryReserve(kCampaignId, 11));
  EXPECT_FALSE(ledger.TryReserve(kCampaignId, -5));
  EXPECT_FALSE(ledger.TryReserve(kCampaignId + 1, 1));
  EXPECT_EQ(*ledger.Spent(kCampaignId), 90);
}

TEST(BudgetLedgerTest, ReleaseIsClampedAtZero) {
  BudgetLedger ledger;
  ledger.OpenAccount(kCampaignId, 100, 0);
  ASSERT_TRUE(ledger.TryReserve(kCampaignId, 40));

  ledger.Release(kCampaignId, 15);
  EXPECT_EQ(*ledger.Spent(kCampaignId), 25);
  ledger.Release(kCampaignId, 1000);
  EXPECT_EQ(*ledger.Spent(kCampaignId), 0);
}

TEST(BudgetLedgerTest, UnknownCampaignIsNotFound) {
  BudgetLedger ledger;
  EXPECT_TRUE(absl::IsNotFound(ledger.Spent(kCampaignId).status()));
  EXPECT_TRUE(absl::IsNotFound(ledger.Remaining(kCampaignId).status()));
  EXPECT_FALSE(ledger.ResetDailySpend(kCampaignId));
  EXPECT_FALSE(ledger.CloseAccount(kCampaignId));
}

TEST(BudgetLedgerTest, ReopeningKeepsHigherSpend) {
  BudgetLedger ledger;
  ledger.OpenAccount(kCampaignId, 100, 10);
  ASSERT_TRUE(ledger.TryReserve(kCampaignId, 30));

  // Stale snapshot: the ledger already knows about more spend.
  ledger.OpenAccount(kCampaignId, 200, 10);
  EXPECT_EQ(*ledger.Spent(kCampaignId), 40);
  EXPECT_EQ(*ledger.Remaining(kCampaignId), 160);

  ledger.OpenAccount(kCampaignId, 200, 55);
  EXPECT_EQ(*ledger.Spent(kCampaignId), 55);
}

TEST(BudgetLedgerTest, LoweredBudgetReportsZeroRemaining) {
  BudgetLedger ledger;
  ledger.OpenAccount(kCampaignId, 100, 80);
  ledger.OpenAccount(kCampaignId, 50, 80);
  EXPECT_EQ(*ledger.Remaining(kCampaignId), 0);
  EXPECT_FALSE(ledger.TryReserve(kCampaignId, 1));
}

TEST(BudgetLedgerTest, DailyReset) {
  BudgetLedger ledger;
  ledger.OpenAccount(1, 100, 100);
  ledger.OpenAccount(2, 100, 60);

  EXPECT_TRUE(ledger.ResetDailySpend(1));
  EXPECT_EQ(*ledger.Spent(1), 0);
  EXPECT_EQ(*ledger.Spent(2), 60);

  ledger.ResetAllDailySpend();
  EXPECT_EQ(*ledger.Spent(2), 0);
}

TEST(BudgetLedgerTest, CloseAccountRemovesIt) {
  BudgetLedger ledger;
  ledger.OpenAccount(kCampaignId, 100, 0);
  EXPECT_TRUE(ledger.CloseAccount(kCampaignId));
  EXPECT_FALSE(ledger.TryReserve(kCampaignId, 1));
}

TEST(BudgetLedgerTest, ConcurrentReservationsNeverExceedBudget) {
  constexpr int kNumThreads = 16;
  constexpr int kReservationsPerThread = 500;
  constexpr Money kBudget = 10007;
  BudgetLedger ledger;
  ledger.OpenAccount(kCampaignId, kBudget, 0);

  std::atomic<Money> granted{0};
  absl::Notification start;
  std::vector<std::thread> threads;
  threads.reserve(kNumThreads);
  for (int i = 0; i < kNumThreads; ++i) {
    threads.emplace_back([&ledger, &granted, &start, i]() {
      start.WaitForNotification();
      for (int j = 0; j < kReservationsPerThread; ++j) {
        Money amount = 1 + (i + j) % 5;
        if (ledger.TryReserve(kCampaignId, amount)) {
          granted.fetch_add(amount);
        }
      }
    });
  }
  start.Notify();
  for (auto& thread : threads) {
    thread.join();
  }

  Money spent = *ledger.Spent(kCampaignId);
  EXPECT_LE(spent, kBudget);
  EXPECT_EQ(spent, granted.load());
  // Demand far exceeds the budget, so it must be nearly used up.
  EXPECT_GT(spent, kBudget - 5);
}

}  // namespace
}  // namespace rtb::bidding_engine
