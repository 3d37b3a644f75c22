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

#ifndef SERVICES_BIDDING_ENGINE_BID_SCORER_H_
#define SERVICES_BIDDING_ENGINE_BID_SCORER_H_

#include <optional>

#include "absl/status/statusor.h"
#include "services/bidding_engine/data/bid_request.h"
#include "services/bidding_engine/data/campaign.h"
#include "services/bidding_engine/data/money.h"

namespace rtb::bidding_engine {

struct ScoringOptions {
  // Added to the interest weight per shared interest.
  double interest_match_weight = 0.1;
  double max_interest_weight = 1.0;
  // Bonus at a zone center, decaying linearly to zero at its radius.
  double max_proximity_bonus = 0.5;
};

// Deterministic candidate scoring:
//
//   score = base_bid * (1 + interest_weight) * (1 + proximity_bonus)
//           [* predicted_value]
//
// where interest_weight = min(matches * interest_match_weight,
// max_interest_weight) and proximity_bonus = max_proximity_bonus * (1 - d/r)
// for the nearest zone containing the request.
class BidScorer {
 public:
  explicit BidScorer(ScoringOptions options = {}) : options_(options) {}

  // Fails with INVALID_ARGUMENT for a negative bid price, a negative or
  // non-finite prediction, or a non-finite result.
  absl::StatusOr<double> Score(
      const BidRequest& request, const Campaign& campaign,
      std::optional<double> predicted_value = std::nullopt) const;

  // Bids from external sources carry no targeting, they score by price.
  absl::StatusOr<double> ScoreExternalBid(Money price) const;

  // min(matches * interest_match_weight, max_interest_weight).
  double InterestWeight(const BidRequest& request,
                        const Campaign& campaign) const;

  // Zero without request geo or outside every zone.
  double ProximityBonus(const BidRequest& request,
                        const Campaign& campaign) const;

  const ScoringOptions& options() const { return options_; }

 private:
  const ScoringOptions options_;
};

}  // namespace rtb::bidding_engine

#endif  // SERVICES_BIDDING_ENGINE_BID_SCORER_H_
