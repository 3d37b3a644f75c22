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

#ifndef SERVICES_BIDDING_ENGINE_BUDGET_LEDGER_H_
#define SERVICES_BIDDING_ENGINE_BUDGET_LEDGER_H_

#include <atomic>
#include <memory>

#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_map.h"
#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"
#include "services/bidding_engine/data/campaign.h"
#include "services/bidding_engine/data/money.h"

namespace rtb::bidding_engine {

// Per campaign spend accounting. Each account is a pair of atomic counters,
// so reservations against different campaigns never contend. The account map
// is write-locked only when accounts are opened or closed.
//
// Invariant: for every account, spent <= daily_budget after any sequence of
// concurrent TryReserve calls.
class BudgetLedger {
 public:
  BudgetLedger() = default;

  // BudgetLedger is neither copyable nor movable.
  BudgetLedger(const BudgetLedger&) = delete;
  BudgetLedger& operator=(const BudgetLedger&) = delete;

  // Opens the account for `campaign_id`, or updates its budget if it exists.
  // An existing account keeps the larger of its current spend and `spent`,
  // since the ledger has seen wins the catalog snapshot may not reflect yet.
  void OpenAccount(CampaignId campaign_id, Money daily_budget, Money spent)
      ABSL_LOCKS_EXCLUDED(mu_);

  // Returns false if there was no such account.
  bool CloseAccount(CampaignId campaign_id) ABSL_LOCKS_EXCLUDED(mu_);

  // Atomically adds `amount` to the spend of `campaign_id` if the result stays
  // within the daily budget. Fails without mutation otherwise, for unknown
  // campaigns and for negative amounts.
  bool TryReserve(CampaignId campaign_id, Money amount)
      ABSL_LOCKS_EXCLUDED(mu_);

  // Reverses a reservation. Spend never drops below zero.
  void Release(CampaignId campaign_id, Money amount) ABSL_LOCKS_EXCLUDED(mu_);

  absl::StatusOr<Money> Spent(CampaignId campaign_id) const
      ABSL_LOCKS_EXCLUDED(mu_);

  // Budget left for the day, zero if the budget was lowered below the spend.
  absl::StatusOr<Money> Remaining(CampaignId campaign_id) const
      ABSL_LOCKS_EXCLUDED(mu_);

  // Day boundary handling. Returns false for unknown campaigns.
  bool ResetDailySpend(CampaignId campaign_id) ABSL_LOCKS_EXCLUDED(mu_);
  void ResetAllDailySpend() ABSL_LOCKS_EXCLUDED(mu_);

 private:
  struct Account {
    std::atomic<Money> spent{0};
    std::atomic<Money> daily_budget{0};
  };

  mutable absl::Mutex mu_;
  absl::flat_hash_map<CampaignId, std::unique_ptr<Account>> accounts_
      ABSL_GUARDED_BY(mu_);
};

}  // namespace rtb::bidding_engine

#endif  // SERVICES_BIDDING_ENGINE_BUDGET_LEDGER_H_
