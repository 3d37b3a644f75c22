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

#include "services/bidding_engine/auction_engine.h"

#include <algorithm>
#include <utility>

namespace rtb::bidding_engine {

Money ComputeClearingPrice(Money winner_price,
                           std::optional<Money> runner_up_price,
                           Money floor_price) {
  if (!runner_up_price.has_value()) {
    return floor_price;
  }
  Money second_price = *runner_up_price + kMinCurrencyIncrement;
  return std::max(floor_price, std::min(second_price, winner_price));
}

AuctionEngine::AuctionEngine(BudgetLedger* ledger,
                             FrequencyCapTracker* frequency_caps,
                             AuctionOptions options)
    : ledger_(ledger),
      frequency_caps_(frequency_caps),
      options_({.max_cascades = std::max(options.max_cascades, 0)}) {}

AuctionEngine::CommitOutcome AuctionEngine::Commit(const BidRequest& request,
                                                   const Bid& bid,
                                                   Money clearing_price) const {
  if (bid.origin == BidOrigin::kExternal) {
    return CommitOutcome::kCommitted;
  }
  if (!ledger_->TryReserve(bid.campaign_id, clearing_price)) {
    return CommitOutcome::kBudgetExhausted;
  }
  if (bid.frequency_cap.has_value() &&
      !frequency_caps_->TryConsume(request.user_id, bid.campaign_id,
                                   bid.frequency_cap->cap,
                                   bid.frequency_cap->window,
                                   request.timestamp)) {
    ledger_->Release(bid.campaign_id, clearing_price);
    return CommitOutcome::kFrequencyCapped;
  }
  return CommitOutcome::kCommitted;
}

AuctionResult AuctionEngine::RunAuction(
    const BidRequest& request, std::vector<Bid> bids,
    const RequestLogContext& log_context) const {
  AuctionResult result;
  result.candidates_considered = static_cast<int>(bids.size());

  // Filtering.
  auto below_floor = std::partition(
      bids.begin(), bids.end(),
      [&request](const Bid& bid) { return bid.price >= request.floor_price; });
  result.drops.below_floor = static_cast<int>(bids.end() - below_floor);
  bids.erase(below_floor, bids.end());
  if (bids.empty()) {
    RTB_VLOG(kNoisyInfo, log_context)
        << "No bid at or above floor " << request.floor_price << " among "
        << result.candidates_considered << " candidates";
    return result;
  }

  // Selecting.
  std::sort(bids.begin(), bids.end(), [](const Bid& a, const Bid& b) {
    if (a.price != b.price) return a.price > b.price;
    if (a.campaign_id != b.campaign_id) return a.campaign_id < b.campaign_id;
    return a.bid_id < b.bid_id;
  });

  // Committing, with cascades.
  for (size_t i = 0; i < bids.size(); ++i) {
    const Bid& bid = bids[i];
    std::optional<Money> runner_up;
    if (i + 1 < bids.size()) {
      runner_up = bids[i + 1].price;
    }
    Money clearing_price =
        ComputeClearingPrice(bid.price, runner_up, request.floor_price);
    CommitOutcome outcome = Commit(request, bid, clearing_price);
    if (outcome == CommitOutcome::kCommitted) {
      result.status = AuctionStatus::kWon;
      result.winner_campaign_id = bid.campaign_id;
      result.clearing_price = clearing_price;
      result.winning_bid = bid;
      RTB_VLOG(kSuccess, log_context)
          << "Campaign " << bid.campaign_id << " won at " << clearing_price
          << " (bid " << bid.price << ", cascades " << result.cascades << ")";
      return result;
    }
    if (outcome == CommitOutcome::kBudgetExhausted) {
      ++result.drops.budget_exhausted;
    } else {
      ++result.drops.frequency_capped;
    }
    RTB_VLOG(kNoisyWarn, log_context)
        << "Commit of campaign " << bid.campaign_id << " at " << clearing_price
        << " failed: "
        << (outcome == CommitOutcome::kBudgetExhausted ? "budget exhausted"
                                                       : "frequency capped");
    if (i + 1 == bids.size() || result.cascades == options_.max_cascades) {
      break;
    }
    ++result.cascades;
  }
  RTB_VLOG(kNoisyInfo, log_context)
      << "No winner committed after " << result.cascades << " cascades";
  return result;
}

}  // namespace rtb::bidding_engine
