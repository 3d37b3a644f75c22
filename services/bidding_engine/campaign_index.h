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

#ifndef SERVICES_BIDDING_ENGINE_CAMPAIGN_INDEX_H_
#define SERVICES_BIDDING_ENGINE_CAMPAIGN_INDEX_H_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/synchronization/mutex.h"
#include "services/bidding_engine/data/bid_request.h"
#include "services/bidding_engine/data/campaign.h"

namespace rtb::bidding_engine {

struct CampaignIndexOptions {
  double cell_size_degrees = 0.25;
  // Campaigns whose zones cover more grid cells are kept in the global
  // bucket instead.
  int max_cells_per_campaign = 64;
};

// Candidate retrieval by location and interests. Campaigns with target zones
// are registered in every cell of a fixed latitude/longitude grid that their
// zones touch; campaigns without zones, or with zones too large for the grid,
// live in a global bucket returned by every query. An inverted index maps
// interest tags to campaigns.
//
// Results are a superset: a campaign is returned if any of its zones may
// contain the location or it shares an interest with the request. Exact
// distance and eligibility are decided downstream.
//
// Reads take a shared lock; Add and Remove take it exclusively.
class CampaignIndex {
 public:
  explicit CampaignIndex(CampaignIndexOptions options = {});

  // CampaignIndex is neither copyable nor movable.
  CampaignIndex(const CampaignIndex&) = delete;
  CampaignIndex& operator=(const CampaignIndex&) = delete;

  // Indexes `campaign`, replacing any previous entry with the same id.
  void Add(const Campaign& campaign) ABSL_LOCKS_EXCLUDED(mu_);

  // Returns false if the campaign was not indexed.
  bool Remove(CampaignId campaign_id) ABSL_LOCKS_EXCLUDED(mu_);

  // Union of the global bucket, the grid cell containing `location` (if
  // any) and the campaigns targeting any of `interests`.
  absl::flat_hash_set<CampaignId> Query(
      const std::optional<GeoPoint>& location,
      const absl::flat_hash_set<std::string>& interests) const
      ABSL_LOCKS_EXCLUDED(mu_);

  int size() const ABSL_LOCKS_EXCLUDED(mu_);
  // Number of campaigns in the global bucket.
  int global_size() const ABSL_LOCKS_EXCLUDED(mu_);

 private:
  using CellKey = int64_t;

  struct Entry {
    std::vector<CellKey> cells;
    std::vector<std::string> interests;
    bool global = false;
  };

  // Cells covered by the campaign's zones, or nullopt if it belongs in the
  // global bucket.
  std::optional<std::vector<CellKey>> CoveredCells(
      const Campaign& campaign) const;
  CellKey CellOf(const GeoPoint& point) const;
  int LatIndex(double lat) const;
  int LngIndex(double lng) const;

  void RemoveLocked(CampaignId campaign_id) ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);

  const CampaignIndexOptions options_;
  const int num_lat_cells_;
  const int num_lng_cells_;

  mutable absl::Mutex mu_;
  absl::flat_hash_map<CellKey, absl::flat_hash_set<CampaignId>> cells_
      ABSL_GUARDED_BY(mu_);
  absl::flat_hash_map<std::string, absl::flat_hash_set<CampaignId>>
      interests_ ABSL_GUARDED_BY(mu_);
  absl::flat_hash_set<CampaignId> global_ ABSL_GUARDED_BY(mu_);
  absl::flat_hash_map<CampaignId, Entry> entries_ ABSL_GUARDED_BY(mu_);
};

}  // namespace rtb::bidding_engine

#endif  // SERVICES_BIDDING_ENGINE_CAMPAIGN_INDEX_H_
