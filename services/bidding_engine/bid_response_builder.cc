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

#include "services/bidding_engine/bid_response_builder.h"

#include <string>

#include "services/bidding_engine/data/money.h"

namespace rtb::bidding_engine {
namespace {

api::AuctionStatus ToApiStatus(AuctionStatus status) {
  switch (status) {
    case AuctionStatus::kWon:
      return api::AUCTION_STATUS_WON;
    case AuctionStatus::kNoBid:
      return api::AUCTION_STATUS_NO_BID;
    case AuctionStatus::kTimeout:
      return api::AUCTION_STATUS_TIMEOUT;
  }
  return api::AUCTION_STATUS_UNSPECIFIED;
}

}  // namespace

api::NoBidReason NoBidReasonFor(const AuctionResult& result) {
  if (result.status == AuctionStatus::kWon) {
    return api::NO_BID_REASON_UNSPECIFIED;
  }
  if (result.status == AuctionStatus::kTimeout) {
    return api::NO_BID_REASON_TIMEOUT;
  }
  const DropCounters& drops = result.drops;
  if (drops.budget_exhausted > 0) {
    return api::NO_BID_REASON_BUDGET_EXHAUSTED;
  }
  if (drops.below_floor > 0) {
    return api::NO_BID_REASON_BELOW_FLOOR;
  }
  if (drops.frequency_capped > 0 || drops.duplicate_suppressed > 0) {
    return api::NO_BID_REASON_FREQUENCY_CAPPED;
  }
  return api::NO_BID_REASON_NO_CANDIDATES;
}

api::BidResponse BuildBidResponse(const BidRequest& request,
                                  const AuctionResult& result,
                                  int64_t currency_unit_scale) {
  api::BidResponse response;
  response.set_id(request.request_id);
  response.set_status(ToApiStatus(result.status));
  response.set_candidates_considered(result.candidates_considered);
  if (result.status != AuctionStatus::kWon || !result.winning_bid.has_value()) {
    response.set_nbr(NoBidReasonFor(result));
    return response;
  }

  const Bid& winning_bid = *result.winning_bid;
  api::BidResponse::SeatBid* seat_bid = response.add_seatbid();
  seat_bid->set_seat(winning_bid.seat);
  api::BidResponse::SeatBid::Bid* bid = seat_bid->add_bid();
  bid->set_id(winning_bid.bid_id);
  bid->set_impid(request.impression_id);
  bid->set_price(ToMajorUnits(result.clearing_price, currency_unit_scale));
  bid->set_adm(winning_bid.adm);
  bid->set_crid(winning_bid.creative_id);
  bid->set_w(winning_bid.w);
  bid->set_h(winning_bid.h);
  bid->set_cid(winning_bid.campaign_id);
  return response;
}

api::BidResponse BuildNoBidResponse(absl::string_view request_id,
                                    api::AuctionStatus status,
                                    api::NoBidReason reason) {
  api::BidResponse response;
  response.set_id(std::string(request_id));
  response.set_status(status);
  response.set_nbr(reason);
  return response;
}

}  // namespace rtb::bidding_engine
