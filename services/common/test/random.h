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

#ifndef SERVICES_COMMON_TEST_RANDOM_H_
#define SERVICES_COMMON_TEST_RANDOM_H_

#include <cstddef>
#include <random>
#include <string>

#include "api/rtb_engine.pb.h"
#include "services/bidding_engine/data/bid_request.h"
#include "services/bidding_engine/data/campaign.h"

// helper functions to generate random objects for testing
namespace rtb::bidding_engine {

// Engine shared by the helpers below, seeded once per process from the clock.
std::default_random_engine& RandomEngine();

std::string MakeARandomString();

std::string MakeARandomStringOfLength(size_t length);

std::string MakeARandomUrl();

int MakeARandomInt(int min, int max);

template <typename num_type>
num_type MakeARandomNumber(num_type min, num_type max) {
  return std::uniform_real_distribution<num_type>(min, max)(RandomEngine());
}

// Active, unbounded campaign with a random price, one creative and plenty of
// budget. No targeting unless the caller adds some.
Campaign MakeARandomCampaign(CampaignId campaign_id);

// Catalog entry that passes validation.
api::CampaignDefinition MakeARandomCampaignDefinition(CampaignId campaign_id);

// Valid wire request with one impression, a user and a location.
api::BidRequest MakeARandomBidRequest();

// Typed request at `location` with no interests and a zero floor.
BidRequest MakeARandomTypedBidRequest(const GeoPoint& location);

}  // namespace rtb::bidding_engine

#endif  // SERVICES_COMMON_TEST_RANDOM_H_
