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

#ifndef SERVICES_BIDDING_ENGINE_BID_SOURCE_H_
#define SERVICES_BIDDING_ENGINE_BID_SOURCE_H_

#include <string>
#include <vector>

#include "absl/functional/any_invocable.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/time/time.h"
#include "services/bidding_engine/data/bid.h"
#include "services/bidding_engine/data/bid_request.h"

namespace rtb::bidding_engine {

using OnBidsReceived =
    absl::AnyInvocable<void(absl::StatusOr<std::vector<Bid>>) &&>;

// An external bidder solicited in parallel with internal scoring. The wire
// protocol is up to the implementation.
class BidSource {
 public:
  virtual ~BidSource() = default;

  // Name used in logs.
  virtual absl::string_view name() const = 0;

  // Asks for bids on `request`. `request` is only valid during the call.
  // `on_done` must be called exactly once, from any thread, and may be called
  // after `timeout` has passed; such late results are discarded by the
  // caller. Returned bids need a price in minor units and a campaign id.
  virtual void RequestBids(const BidRequest& request, absl::Duration timeout,
                           OnBidsReceived on_done) = 0;
};

}  // namespace rtb::bidding_engine

#endif  // SERVICES_BIDDING_ENGINE_BID_SOURCE_H_
