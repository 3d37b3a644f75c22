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

#ifndef SERVICES_BIDDING_ENGINE_CAMPAIGN_LOADER_H_
#define SERVICES_BIDDING_ENGINE_CAMPAIGN_LOADER_H_

#include <string>
#include <thread>

#include "absl/base/thread_annotations.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "absl/synchronization/notification.h"
#include "absl/time/time.h"
#include "api/rtb_engine.pb.h"
#include "services/bidding_engine/budget_ledger.h"
#include "services/bidding_engine/campaign_index.h"
#include "services/bidding_engine/campaign_repository.h"
#include "services/bidding_engine/data/campaign.h"

namespace rtb::bidding_engine {

// Outcome of applying one catalog snapshot.
struct CatalogLoadStats {
  int upserted = 0;
  int removed = 0;
  // Definitions skipped because they failed validation.
  int rejected = 0;
};

// Converts and validates one catalog entry. INVALID_ARGUMENT lists every
// problem found.
absl::StatusOr<Campaign> CampaignFromDefinition(
    const api::CampaignDefinition& definition);

// Applies catalog snapshots to the serving state. A snapshot is the complete
// set of live campaigns: entries are upserted into the repository, re-indexed
// and get a ledger account, and campaigns missing from it are removed from
// all three. Invalid entries are logged and skipped without affecting the
// rest of the snapshot.
class CampaignLoader {
 public:
  // Pointers are not owned and must outlive the loader.
  CampaignLoader(CampaignRepository* repository, CampaignIndex* index,
                 BudgetLedger* ledger)
      : repository_(repository), index_(index), ledger_(ledger) {}

  // CampaignLoader is neither copyable nor movable.
  CampaignLoader(const CampaignLoader&) = delete;
  CampaignLoader& operator=(const CampaignLoader&) = delete;

  CatalogLoadStats Apply(const api::CampaignCatalog& catalog)
      ABSL_LOCKS_EXCLUDED(mu_);

  // Parses a JSON encoded CampaignCatalog and applies it. Nothing is applied
  // if the document does not parse.
  absl::StatusOr<CatalogLoadStats> LoadFromJson(absl::string_view json);

  absl::StatusOr<CatalogLoadStats> LoadFromFile(absl::string_view path);

 private:
  CampaignRepository* repository_;
  CampaignIndex* index_;
  BudgetLedger* ledger_;
  // Serializes snapshot application.
  absl::Mutex mu_;
};

inline constexpr absl::Duration kMinCatalogRefreshPeriod = absl::Seconds(1);

// Re-reads a catalog file on a fixed period on a thread of its own.
class PeriodicCatalogLoader {
 public:
  // `period` is raised to kMinCatalogRefreshPeriod if below it.
  PeriodicCatalogLoader(std::string path, absl::Duration period,
                        CampaignLoader* loader);

  ~PeriodicCatalogLoader() { End(); }

  // Not copyable or movable.
  PeriodicCatalogLoader(const PeriodicCatalogLoader&) = delete;
  PeriodicCatalogLoader& operator=(const PeriodicCatalogLoader&) = delete;

  // Loads the catalog once synchronously and then keeps refreshing it in the
  // background. Fails, without starting the refresh, if the first load
  // fails. May only be called once.
  absl::Status Start();

  // Stops refreshing and joins the background thread.
  void End();

 private:
  void RefreshLoop();

  const std::string path_;
  const absl::Duration period_;
  CampaignLoader& loader_;
  absl::Notification stop_;
  std::thread refresh_thread_;
};

}  // namespace rtb::bidding_engine

#endif  // SERVICES_BIDDING_ENGINE_CAMPAIGN_LOADER_H_
