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

#ifndef SERVICES_BIDDING_ENGINE_FREQUENCY_CAP_TRACKER_H_
#define SERVICES_BIDDING_ENGINE_FREQUENCY_CAP_TRACKER_H_

#include <memory>
#include <string>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_map.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"
#include "services/bidding_engine/data/campaign.h"

namespace rtb::bidding_engine {

inline constexpr int kDefaultFrequencyCapShards = 64;

// Consumes between sweeps of one shard for expired entries.
inline constexpr int kFrequencyCapSweepInterval = 1024;

// Counts exposures per (user, campaign) over a sliding window. Exposure
// timestamps older than the window are pruned lazily on access, and entries
// whose newest exposure has left its window are swept from the shard every
// kFrequencyCapSweepInterval consumes. State is striped across independently
// locked shards keyed by user and campaign.
class FrequencyCapTracker {
 public:
  explicit FrequencyCapTracker(int num_shards = kDefaultFrequencyCapShards);

  // FrequencyCapTracker is neither copyable nor movable.
  FrequencyCapTracker(const FrequencyCapTracker&) = delete;
  FrequencyCapTracker& operator=(const FrequencyCapTracker&) = delete;

  // Records an exposure at `now` if fewer than `cap` exposures happened in
  // (now - window, now]. Check and increment are one atomic step. Returns
  // false without mutation when capped. A cap of 0 always denies.
  bool TryConsume(absl::string_view user_id, CampaignId campaign_id, int cap,
                  absl::Duration window, absl::Time now);

  // Whether `TryConsume` with the same arguments would currently deny.
  bool IsCapped(absl::string_view user_id, CampaignId campaign_id, int cap,
                absl::Duration window, absl::Time now) const;

  // Exposures in (now - window, now].
  int ExposureCount(absl::string_view user_id, CampaignId campaign_id,
                    absl::Duration window, absl::Time now) const;

  // Drops every (user, campaign) entry with no exposure left in its window,
  // and users left without entries.
  void PruneExpired(absl::Time now);

  // Number of tracked (user, campaign) entries.
  int entry_count() const;

 private:
  struct Exposures {
    // Ascending.
    std::vector<absl::Time> times;
    // Largest window the entry was consumed under.
    absl::Duration window = absl::ZeroDuration();
  };

  using UserExposures = absl::flat_hash_map<CampaignId, Exposures>;

  struct Shard {
    mutable absl::Mutex mu;
    absl::flat_hash_map<std::string, UserExposures> exposures
        ABSL_GUARDED_BY(mu);
    int consumes_since_sweep ABSL_GUARDED_BY(mu) = 0;
  };

  Shard& ShardFor(absl::string_view user_id, CampaignId campaign_id) const;
  static void SweepLocked(Shard& shard, absl::Time now)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(shard.mu);

  const int num_shards_;
  std::unique_ptr<Shard[]> shards_;
};

}  // namespace rtb::bidding_engine

#endif  // SERVICES_BIDDING_ENGINE_FREQUENCY_CAP_TRACKER_H_
