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

#ifndef SERVICES_BIDDING_ENGINE_DATA_CAMPAIGN_H_
#define SERVICES_BIDDING_ENGINE_DATA_CAMPAIGN_H_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "absl/time/time.h"
#include "api/rtb_engine.pb.h"
#include "services/bidding_engine/data/money.h"

namespace rtb::bidding_engine {

using CampaignId = int64_t;

struct TargetZone {
  double lat = 0;
  double lng = 0;
  double radius_km = 0;
};

// Opaque creative supplied by the creative service.
struct Creative {
  std::string creative_id;
  std::string adm;
  int w = 0;
  int h = 0;
};

struct FrequencyCap {
  // Maximum exposures per user within `window`. 0 never serves.
  int cap = 0;
  absl::Duration window = absl::ZeroDuration();
};

// Read-only snapshot of a campaign definition. Spend is tracked by the
// BudgetLedger, `spent` only seeds it.
struct Campaign {
  CampaignId campaign_id = 0;
  int64_t advertiser_id = 0;
  Money bid_price = 0;
  Money daily_budget = 0;
  Money spent = 0;
  api::BidType bid_type = api::BID_TYPE_CPM;
  absl::flat_hash_set<std::string> target_interests;
  // Empty means every age group.
  absl::flat_hash_set<std::string> target_age_groups;
  // Empty means no geo targeting.
  std::vector<TargetZone> target_zones;
  bool active = false;
  int priority = 0;
  absl::Time start_time = absl::InfinitePast();
  absl::Time end_time = absl::InfiniteFuture();
  std::vector<Creative> creatives;
  std::string win_notice_url;
  // Engine default applies when absent.
  std::optional<FrequencyCap> frequency_cap;
  std::string seat;
};

}  // namespace rtb::bidding_engine

#endif  // SERVICES_BIDDING_ENGINE_DATA_CAMPAIGN_H_
