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

#include "services/bidding_engine/bid_scorer.h"

#include <algorithm>
#include <cmath>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "services/bidding_engine/geo_util.h"

namespace rtb::bidding_engine {

double BidScorer::InterestWeight(const BidRequest& request,
                                 const Campaign& campaign) const {
  int matches = 0;
  for (const std::string& interest : request.interests) {
    if (campaign.target_interests.contains(interest)) {
      ++matches;
    }
  }
  return std::min(matches * options_.interest_match_weight,
                  options_.max_interest_weight);
}

double BidScorer::ProximityBonus(const BidRequest& request,
                                 const Campaign& campaign) const {
  if (!request.geo.has_value()) {
    return 0;
  }
  double best = 0;
  for (const TargetZone& zone : campaign.target_zones) {
    if (!(zone.radius_km > 0)) {
      continue;
    }
    double distance = HaversineDistanceKm(*request.geo, {zone.lat, zone.lng});
    if (distance > zone.radius_km) {
      continue;
    }
    best = std::max(best, options_.max_proximity_bonus *
                              (1 - distance / zone.radius_km));
  }
  return best;
}

absl::StatusOr<double> BidScorer::Score(
    const BidRequest& request, const Campaign& campaign,
    std::optional<double> predicted_value) const {
  if (campaign.bid_price < 0) {
    return absl::InvalidArgumentError(
        absl::StrCat("Campaign ", campaign.campaign_id,
                     " has negative bid price ", campaign.bid_price));
  }
  double score = static_cast<double>(campaign.bid_price) *
                 (1 + InterestWeight(request, campaign)) *
                 (1 + ProximityBonus(request, campaign));
  if (predicted_value.has_value()) {
    if (!std::isfinite(*predicted_value) || *predicted_value < 0) {
      return absl::InvalidArgumentError(
          absl::StrFormat("Invalid predicted value %f for campaign %d",
                          *predicted_value, campaign.campaign_id));
    }
    score *= *predicted_value;
  }
  if (!std::isfinite(score)) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Non-finite score for campaign ", campaign.campaign_id));
  }
  return score;
}

absl::StatusOr<double> BidScorer::ScoreExternalBid(Money price) const {
  if (price < 0) {
    return absl::InvalidArgumentError(
        absl::StrCat("Negative external bid price ", price));
  }
  return static_cast<double>(price);
}

}  // namespace rtb::bidding_engine
