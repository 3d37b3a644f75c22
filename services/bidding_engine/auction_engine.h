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

#ifndef SERVICES_BIDDING_ENGINE_AUCTION_ENGINE_H_
#define SERVICES_BIDDING_ENGINE_AUCTION_ENGINE_H_

#include <optional>
#include <vector>

#include "services/bidding_engine/budget_ledger.h"
#include "services/bidding_engine/data/auction_result.h"
#include "services/bidding_engine/data/bid.h"
#include "services/bidding_engine/data/bid_request.h"
#include "services/bidding_engine/frequency_cap_tracker.h"
#include "services/common/loggers/request_log_context.h"

namespace rtb::bidding_engine {

inline constexpr int kDefaultMaxCascades = 3;

struct AuctionOptions {
  // Commit attempts after the first before giving up with a no-bid.
  int max_cascades = kDefaultMaxCascades;
};

// Clearing price of a sealed-bid second price auction. A lone bidder pays the
// floor. Otherwise the winner pays the runner-up price plus one minimal
// currency unit, clamped to [floor, winner_price].
Money ComputeClearingPrice(Money winner_price,
                           std::optional<Money> runner_up_price,
                           Money floor_price);

// Runs the auction over already scored bids and commits the winner.
//
// Bids priced below the floor are dropped. The rest are ranked by price,
// highest first, ties going to the lowest campaign id. The top bid is
// committed: internal bids reserve the clearing price in the BudgetLedger and
// then consume a frequency cap slot. When either step fails the reservation
// is rolled back and the auction cascades to the next bid, re-pricing it
// against the bids below it, at most `max_cascades` times.
class AuctionEngine {
 public:
  AuctionEngine(BudgetLedger* ledger, FrequencyCapTracker* frequency_caps,
                AuctionOptions options = {});

  AuctionResult RunAuction(const BidRequest& request, std::vector<Bid> bids,
                           const RequestLogContext& log_context) const;

 private:
  enum class CommitOutcome { kCommitted, kBudgetExhausted, kFrequencyCapped };

  CommitOutcome Commit(const BidRequest& request, const Bid& bid,
                       Money clearing_price) const;

  BudgetLedger* ledger_;
  FrequencyCapTracker* frequency_caps_;
  const AuctionOptions options_;
};

}  // namespace rtb::bidding_engine

#endif  // SERVICES_BIDDING_ENGINE_AUCTION_ENGINE_H_
