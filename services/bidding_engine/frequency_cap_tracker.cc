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

#include "services/bidding_engine/frequency_cap_tracker.h"

#include <algorithm>
#include <utility>

#include "absl/container/flat_hash_map.h"
#include "absl/hash/hash.h"

namespace rtb::bidding_engine {
namespace {

// Number of exposures after `window_start`. `exposures` is sorted.
int CountSince(const std::vector<absl::Time>& exposures,
               absl::Time window_start) {
  auto first_in_window =
      std::upper_bound(exposures.begin(), exposures.end(), window_start);
  return static_cast<int>(exposures.end() - first_in_window);
}

}  // namespace

FrequencyCapTracker::FrequencyCapTracker(int num_shards)
    : num_shards_(std::max(num_shards, 1)),
      shards_(std::make_unique<Shard[]>(num_shards_)) {}

FrequencyCapTracker::Shard& FrequencyCapTracker::ShardFor(
    absl::string_view user_id, CampaignId campaign_id) const {
  size_t hash = absl::Hash<std::pair<absl::string_view, CampaignId>>()(
      std::make_pair(user_id, campaign_id));
  return shards_[hash % num_shards_];
}

bool FrequencyCapTracker::TryConsume(absl::string_view user_id,
                                     CampaignId campaign_id, int cap,
                                     absl::Duration window, absl::Time now) {
  if (cap <= 0) {
    return false;
  }
  Shard& shard = ShardFor(user_id, campaign_id);
  absl::MutexLock lock(&shard.mu);
  auto user_it = shard.exposures.find(user_id);
  if (user_it == shard.exposures.end()) {
    user_it = shard.exposures.try_emplace(std::string(user_id)).first;
  }
  Exposures& exposures = user_it->second[campaign_id];
  exposures.window = std::max(exposures.window, window);

  // Lazy pruning.
  std::vector<absl::Time>& times = exposures.times;
  times.erase(times.begin(),
              std::upper_bound(times.begin(), times.end(), now - window));
  bool consumed = false;
  if (static_cast<int>(times.size()) < cap) {
    times.insert(std::upper_bound(times.begin(), times.end(), now), now);
    consumed = true;
  }
  if (++shard.consumes_since_sweep >= kFrequencyCapSweepInterval) {
    SweepLocked(shard, now);
  }
  return consumed;
}

void FrequencyCapTracker::SweepLocked(Shard& shard, absl::Time now) {
  shard.consumes_since_sweep = 0;
  absl::erase_if(shard.exposures, [now](auto& user_entry) {
    absl::erase_if(user_entry.second, [now](const auto& campaign_entry) {
      const Exposures& exposures = campaign_entry.second;
      return exposures.times.empty() ||
             exposures.times.back() <= now - exposures.window;
    });
    return user_entry.second.empty();
  });
}

void FrequencyCapTracker::PruneExpired(absl::Time now) {
  for (int i = 0; i < num_shards_; ++i) {
    Shard& shard = shards_[i];
    absl::MutexLock lock(&shard.mu);
    SweepLocked(shard, now);
  }
}

int FrequencyCapTracker::entry_count() const {
  int count = 0;
  for (int i = 0; i < num_shards_; ++i) {
    const Shard& shard = shards_[i];
    absl::MutexLock lock(&shard.mu);
    for (const auto& [user_id, campaigns] : shard.exposures) {
      count += static_cast<int>(campaigns.size());
    }
  }
  return count;
}

bool FrequencyCapTracker::IsCapped(absl::string_view user_id,
                                   CampaignId campaign_id, int cap,
                                   absl::Duration window,
                                   absl::Time now) const {
  if (cap <= 0) {
    return true;
  }
  return ExposureCount(user_id, campaign_id, window, now) >= cap;
}

int FrequencyCapTracker::ExposureCount(absl::string_view user_id,
                                       CampaignId campaign_id,
                                       absl::Duration window,
                                       absl::Time now) const {
  const Shard& shard = ShardFor(user_id, campaign_id);
  absl::MutexLock lock(&shard.mu);
  auto user_it = shard.exposures.find(user_id);
  if (user_it == shard.exposures.end()) {
    return 0;
  }
  auto campaign_it = user_it->second.find(campaign_id);
  if (campaign_it == user_it->second.end()) {
    return 0;
  }
  return CountSince(campaign_it->second.times, now - window);
}

}  // namespace rtb::bidding_engine
