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

#ifndef SERVICES_BIDDING_ENGINE_DATA_BID_H_
#define SERVICES_BIDDING_ENGINE_DATA_BID_H_

#include <cstdint>
#include <optional>
#include <string>

#include "absl/time/time.h"
#include "api/rtb_engine.pb.h"
#include "services/bidding_engine/data/campaign.h"
#include "services/bidding_engine/data/money.h"

namespace rtb::bidding_engine {

enum class BidOrigin : std::uint8_t {
  // Bid on behalf of a campaign in the repository.
  kInternal,
  // Bid returned by an external bid source. Not accounted in the ledger.
  kExternal,
};

struct Bid {
  std::string bid_id;
  CampaignId campaign_id = 0;
  Money price = 0;
  api::BidType bid_type = api::BID_TYPE_CPM;
  absl::Time timestamp = absl::UnixEpoch();
  double score = 0;
  BidOrigin origin = BidOrigin::kInternal;
  std::string creative_id;
  std::string adm;
  std::string seat;
  int w = 0;
  int h = 0;
  std::string win_notice_url;
  // Cap consumed when an internal bid wins. Unset means uncapped.
  std::optional<FrequencyCap> frequency_cap;
};

}  // namespace rtb::bidding_engine

#endif  // SERVICES_BIDDING_ENGINE_DATA_BID_H_
