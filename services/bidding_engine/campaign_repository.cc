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

#include "services/bidding_engine/campaign_repository.h"

#include <algorithm>
#include <utility>

namespace rtb::bidding_engine {

std::shared_ptr<const Campaign> InMemoryCampaignRepository::Get(
    CampaignId campaign_id) const {
  absl::ReaderMutexLock lock(&mu_);
  auto it = campaigns_.find(campaign_id);
  if (it == campaigns_.end()) {
    return nullptr;
  }
  return it->second;
}

void InMemoryCampaignRepository::Upsert(Campaign campaign) {
  CampaignId campaign_id = campaign.campaign_id;
  auto snapshot = std::make_shared<const Campaign>(std::move(campaign));
  absl::MutexLock lock(&mu_);
  campaigns_[campaign_id] = std::move(snapshot);
}

bool InMemoryCampaignRepository::Remove(CampaignId campaign_id) {
  absl::MutexLock lock(&mu_);
  return campaigns_.erase(campaign_id) > 0;
}

std::vector<CampaignId> InMemoryCampaignRepository::ListIds() const {
  std::vector<CampaignId> ids;
  {
    absl::ReaderMutexLock lock(&mu_);
    ids.reserve(campaigns_.size());
    for (const auto& [campaign_id, campaign] : campaigns_) {
      ids.push_back(campaign_id);
    }
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

}  // namespace rtb::bidding_engine
