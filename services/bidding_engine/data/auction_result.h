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

#ifndef SERVICES_BIDDING_ENGINE_DATA_AUCTION_RESULT_H_
#define SERVICES_BIDDING_ENGINE_DATA_AUCTION_RESULT_H_

#include <cstdint>
#include <optional>
#include <string>

#include "services/bidding_engine/data/bid.h"
#include "services/bidding_engine/data/campaign.h"
#include "services/bidding_engine/data/money.h"

namespace rtb::bidding_engine {

enum class AuctionStatus : std::uint8_t {
  kWon,
  kNoBid,
  kTimeout,
};

// Candidates dropped on the way to the auction, by reason.
struct DropCounters {
  int frequency_capped = 0;
  int duplicate_suppressed = 0;
  int ineligible = 0;
  int scoring_error = 0;
  int below_floor = 0;
  int budget_exhausted = 0;
};

struct AuctionResult {
  AuctionStatus status = AuctionStatus::kNoBid;
  std::optional<CampaignId> winner_campaign_id;
  // Zero unless won. Never below the floor price when won.
  Money clearing_price = 0;
  int candidates_considered = 0;
  std::optional<Bid> winning_bid;
  // Number of times the commit moved on to the next bid.
  int cascades = 0;
  DropCounters drops;
};

std::string AuctionStatusName(AuctionStatus status);

}  // namespace rtb::bidding_engine

#endif  // SERVICES_BIDDING_ENGINE_DATA_AUCTION_RESULT_H_
