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

#ifndef SERVICES_BIDDING_ENGINE_CAMPAIGN_REPOSITORY_H_
#define SERVICES_BIDDING_ENGINE_CAMPAIGN_REPOSITORY_H_

#include <memory>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_map.h"
#include "absl/synchronization/mutex.h"
#include "services/bidding_engine/data/campaign.h"

namespace rtb::bidding_engine {

// Store of campaign snapshots addressed by id. Snapshots are immutable;
// updates replace the whole snapshot, so readers holding an older one keep a
// consistent view.
class CampaignRepository {
 public:
  virtual ~CampaignRepository() = default;

  // Returns nullptr if there is no such campaign.
  virtual std::shared_ptr<const Campaign> Get(CampaignId campaign_id) const = 0;

  virtual void Upsert(Campaign campaign) = 0;

  // Returns false if there was no such campaign.
  virtual bool Remove(CampaignId campaign_id) = 0;

  virtual std::vector<CampaignId> ListIds() const = 0;
};

class InMemoryCampaignRepository final : public CampaignRepository {
 public:
  InMemoryCampaignRepository() = default;

  // InMemoryCampaignRepository is neither copyable nor movable.
  InMemoryCampaignRepository(const InMemoryCampaignRepository&) = delete;
  InMemoryCampaignRepository& operator=(const InMemoryCampaignRepository&) =
      delete;

  std::shared_ptr<const Campaign> Get(CampaignId campaign_id) const override
      ABSL_LOCKS_EXCLUDED(mu_);
  void Upsert(Campaign campaign) override ABSL_LOCKS_EXCLUDED(mu_);
  bool Remove(CampaignId campaign_id) override ABSL_LOCKS_EXCLUDED(mu_);
  std::vector<CampaignId> ListIds() const override ABSL_LOCKS_EXCLUDED(mu_);

 private:
  mutable absl::Mutex mu_;
  absl::flat_hash_map<CampaignId, std::shared_ptr<const Campaign>> campaigns_
      ABSL_GUARDED_BY(mu_);
};

}  // namespace rtb::bidding_engine

#endif  // SERVICES_BIDDING_ENGINE_CAMPAIGN_REPOSITORY_H_
