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

#include <algorithm>
#include <utility>

#include "absl/strings/str_cat.h"
#include "services/common/loggers/request_log_context.h"

namespace rtb::bidding_engine {
namespace {

absl::Status UnknownCampaign(CampaignId campaign_id) {
  return absl::NotFoundError(
      absl::StrCat("No budget account for campaign ", campaign_id));
}

}  // namespace

void BudgetLedger::OpenAccount(CampaignId campaign_id, Money daily_budget,
                               Money spent) {
  absl::MutexLock lock(&mu_);
  auto [it, inserted] = accounts_.try_emplace(campaign_id, nullptr);
  if (inserted) {
    it->second = std::make_unique<Account>();
    it->second->spent.store(std::max<Money>(spent, 0));
    it->second->daily_budget.store(daily_budget);
    RTB_VLOG(kNoisyInfo) << "Opened budget account for campaign "
                         << campaign_id << " (budget: " << daily_budget
                         << ", spent: " << spent << ")";
    return;
  }
  Account& account = *it->second;
  account.daily_budget.store(daily_budget);
  Money current = account.spent.load();
  while (current < spent &&
         !account.spent.compare_exchange_weak(current, spent)) {
  }
}

bool BudgetLedger::CloseAccount(CampaignId campaign_id) {
  absl::MutexLock lock(&mu_);
  return accounts_.erase(campaign_id) > 0;
}

bool BudgetLedger::TryReserve(CampaignId campaign_id, Money amount) {
  if (amount < 0) {
    return false;
  }
  absl::ReaderMutexLock lock(&mu_);
  auto it = accounts_.find(campaign_id);
  if (it == accounts_.end()) {
    return false;
  }
  Account& account = *it->second;
  Money current = account.spent.load();
  do {
    if (amount > account.daily_budget.load() - current) {
      return false;
    }
  } while (!account.spent.compare_exchange_weak(current, current + amount));
  return true;
}

void BudgetLedger::Release(CampaignId campaign_id, Money amount) {
  if (amount <= 0) {
    return;
  }
  absl::ReaderMutexLock lock(&mu_);
  auto it = accounts_.find(campaign_id);
  if (it == accounts_.end()) {
    RTB_LOG(WARNING) << "Release of " << amount
                     << " for campaign without account: " << campaign_id;
    return;
  }
  std::atomic<Money>& spent = it->second->spent;
  Money current = spent.load();
  while (!spent.compare_exchange_weak(current,
                                      std::max<Money>(current - amount, 0))) {
  }
}

absl::StatusOr<Money> BudgetLedger::Spent(CampaignId campaign_id) const {
  absl::ReaderMutexLock lock(&mu_);
  auto it = accounts_.find(campaign_id);
  if (it == accounts_.end()) {
    return UnknownCampaign(campaign_id);
  }
  return it->second->spent.load();
}

absl::StatusOr<Money> BudgetLedger::Remaining(CampaignId campaign_id) const {
  absl::ReaderMutexLock lock(&mu_);
  auto it = accounts_.find(campaign_id);
  if (it == accounts_.end()) {
    return UnknownCampaign(campaign_id);
  }
  return std::max<Money>(
      it->second->daily_budget.load() - it->second->spent.load(), 0);
}

bool BudgetLedger::ResetDailySpend(CampaignId campaign_id) {
  absl::ReaderMutexLock lock(&mu_);
  auto it = accounts_.find(campaign_id);
  if (it == accounts_.end()) {
    return false;
  }
  it->second->spent.store(0);
  return true;
}

void BudgetLedger::ResetAllDailySpend() {
  absl::ReaderMutexLock lock(&mu_);
  for (auto& [campaign_id, account] : accounts_) {
    account->spent.store(0);
  }
  RTB_LOG(INFO) << "Reset daily spend of " << accounts_.size()
                << " campaigns";
}

}  // namespace rtb::bidding_engine
