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

#ifndef SERVICES_BIDDING_ENGINE_BID_RESPONSE_BUILDER_H_
#define SERVICES_BIDDING_ENGINE_BID_RESPONSE_BUILDER_H_

#include <cstdint>

#include "absl/strings/string_view.h"
#include "api/rtb_engine.pb.h"
#include "services/bidding_engine/data/auction_result.h"
#include "services/bidding_engine/data/bid_request.h"

namespace rtb::bidding_engine {

// Picks the no-bid reason reported for a lost auction. A timeout wins over
// the drop counters, which are consulted from the last pipeline stage
// backwards.
api::NoBidReason NoBidReasonFor(const AuctionResult& result);

// Builds the wire response for `result`. On a win the response carries
// exactly one seat with one bid priced at the clearing price, in major
// units. Otherwise `seatbid` is empty and `nbr` is set.
api::BidResponse BuildBidResponse(const BidRequest& request,
                                  const AuctionResult& result,
                                  int64_t currency_unit_scale);

// Response for a request that was not auctioned at all.
api::BidResponse BuildNoBidResponse(absl::string_view request_id,
                                    api::AuctionStatus status,
                                    api::NoBidReason reason);

}  // namespace rtb::bidding_engine

#endif  // SERVICES_BIDDING_ENGINE_BID_RESPONSE_BUILDER_H_
