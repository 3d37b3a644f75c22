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

#include "services/bidding_engine/campaign_index.h"

#include <algorithm>
#include <cmath>
#include <utility>

#include "absl/container/flat_hash_set.h"
#include "absl/strings/str_cat.h"
#include "services/bidding_engine/geo_util.h"
#include "services/common/loggers/request_log_context.h"

namespace rtb::bidding_engine {
namespace {

CampaignIndexOptions Sanitize(CampaignIndexOptions options) {
  if (!(options.cell_size_degrees > 0) || options.cell_size_degrees > 180) {
    options.cell_size_degrees = CampaignIndexOptions().cell_size_degrees;
  }
  options.max_cells_per_campaign = std::max(options.max_cells_per_campaign, 1);
  return options;
}

}  // namespace

CampaignIndex::CampaignIndex(CampaignIndexOptions options)
    : options_(Sanitize(options)),
      num_lat_cells_(static_cast<int>(
          std::ceil(180.0 / options_.cell_size_degrees))),
      num_lng_cells_(static_cast<int>(
          std::ceil(360.0 / options_.cell_size_degrees))) {}

int CampaignIndex::LatIndex(double lat) const {
  int index =
      static_cast<int>(std::floor((lat + 90.0) / options_.cell_size_degrees));
  return std::clamp(index, 0, num_lat_cells_ - 1);
}

// Longitudes are taken modulo 360, so 180 and -180 share a cell. The last
// column is narrower when the cell size does not divide 360.
int CampaignIndex::LngIndex(double lng) const {
  double offset = std::fmod(lng + 180.0, 360.0);
  if (offset < 0) offset += 360.0;
  int index = static_cast<int>(std::floor(offset / options_.cell_size_degrees));
  return std::clamp(index, 0, num_lng_cells_ - 1);
}

CampaignIndex::CellKey CampaignIndex::CellOf(const GeoPoint& point) const {
  return static_cast<CellKey>(LatIndex(point.lat)) * num_lng_cells_ +
         LngIndex(point.lng);
}

std::optional<std::vector<CampaignIndex::CellKey>> CampaignIndex::CoveredCells(
    const Campaign& campaign) const {
  if (campaign.target_zones.empty()) {
    return std::nullopt;
  }
  const int max_cells = options_.max_cells_per_campaign;
  absl::flat_hash_set<CellKey> cells;
  for (const TargetZone& zone : campaign.target_zones) {
    BoundingBox box = ZoneBoundingBox(zone);
    if (box.full_longitude || box.max_lng - box.min_lng >= 180.0) {
      return std::nullopt;
    }
    const int first_lat = LatIndex(box.min_lat);
    const int last_lat = LatIndex(box.max_lat);
    // A box crossing the antimeridian is split into two longitude ranges,
    // each inside [-180, 180].
    std::vector<std::pair<double, double>> lng_ranges;
    if (box.min_lng < -180.0) {
      lng_ranges.emplace_back(box.min_lng + 360.0, 180.0);
      lng_ranges.emplace_back(-180.0, box.max_lng);
    } else if (box.max_lng > 180.0) {
      lng_ranges.emplace_back(box.min_lng, 180.0);
      lng_ranges.emplace_back(-180.0, box.max_lng - 360.0);
    } else {
      lng_ranges.emplace_back(box.min_lng, box.max_lng);
    }
    std::vector<int> lng_cells;
    for (const auto& [low, high] : lng_ranges) {
      const int first_lng = LngIndex(low);
      const int last_lng =
          high >= 180.0 ? num_lng_cells_ - 1 : LngIndex(high);
      for (int lng = first_lng; lng <= last_lng; ++lng) {
        lng_cells.push_back(lng);
      }
      // The eastern edge at 180 is the same meridian as -180.
      if (high >= 180.0) lng_cells.push_back(0);
    }
    const int64_t zone_cells =
        static_cast<int64_t>(last_lat - first_lat + 1) *
        static_cast<int64_t>(lng_cells.size());
    if (zone_cells > max_cells) {
      return std::nullopt;
    }
    for (int lat = first_lat; lat <= last_lat; ++lat) {
      for (int lng : lng_cells) {
        cells.insert(static_cast<CellKey>(lat) * num_lng_cells_ + lng);
      }
    }
    if (static_cast<int>(cells.size()) > max_cells) {
      return std::nullopt;
    }
  }
  return std::vector<CellKey>(cells.begin(), cells.end());
}

void CampaignIndex::Add(const Campaign& campaign) {
  Entry entry;
  std::optional<std::vector<CellKey>> cells = CoveredCells(campaign);
  if (cells.has_value()) {
    entry.cells = *std::move(cells);
  } else {
    entry.global = true;
  }
  entry.interests.assign(campaign.target_interests.begin(),
                         campaign.target_interests.end());

  absl::MutexLock lock(&mu_);
  RemoveLocked(campaign.campaign_id);
  if (entry.global) {
    global_.insert(campaign.campaign_id);
  }
  for (CellKey cell : entry.cells) {
    cells_[cell].insert(campaign.campaign_id);
  }
  for (const std::string& interest : entry.interests) {
    interests_[interest].insert(campaign.campaign_id);
  }
  RTB_VLOG(kNoisyInfo) << "Indexed campaign " << campaign.campaign_id << " in "
                       << (entry.global ? "global bucket"
                                        : absl::StrCat(entry.cells.size(),
                                                       " cells"));
  entries_[campaign.campaign_id] = std::move(entry);
}

bool CampaignIndex::Remove(CampaignId campaign_id) {
  absl::MutexLock lock(&mu_);
  if (!entries_.contains(campaign_id)) {
    return false;
  }
  RemoveLocked(campaign_id);
  return true;
}

void CampaignIndex::RemoveLocked(CampaignId campaign_id) {
  auto it = entries_.find(campaign_id);
  if (it == entries_.end()) {
    return;
  }
  const Entry& entry = it->second;
  if (entry.global) {
    global_.erase(campaign_id);
  }
  for (CellKey cell : entry.cells) {
    auto cell_it = cells_.find(cell);
    if (cell_it == cells_.end()) continue;
    cell_it->second.erase(campaign_id);
    if (cell_it->second.empty()) {
      cells_.erase(cell_it);
    }
  }
  for (const std::string& interest : entry.interests) {
    auto interest_it = interests_.find(interest);
    if (interest_it == interests_.end()) continue;
    interest_it->second.erase(campaign_id);
    if (interest_it->second.empty()) {
      interests_.erase(interest_it);
    }
  }
  entries_.erase(it);
}

absl::flat_hash_set<CampaignId> CampaignIndex::Query(
    const std::optional<GeoPoint>& location,
    const absl::flat_hash_set<std::string>& interests) const {
  absl::ReaderMutexLock lock(&mu_);
  absl::flat_hash_set<CampaignId> result = global_;
  if (location.has_value()) {
    auto it = cells_.find(CellOf(*location));
    if (it != cells_.end()) {
      result.insert(it->second.begin(), it->second.end());
    }
  }
  for (const std::string& interest : interests) {
    auto it = interests_.find(interest);
    if (it != interests_.end()) {
      result.insert(it->second.begin(), it->second.end());
    }
  }
  return result;
}

int CampaignIndex::size() const {
  absl::ReaderMutexLock lock(&mu_);
  return static_cast<int>(entries_.size());
}

int CampaignIndex::global_size() const {
  absl::ReaderMutexLock lock(&mu_);
  return static_cast<int>(global_.size());
}

}  // namespace rtb::bidding_engine
