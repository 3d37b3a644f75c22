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

#include "services/bidding_engine/campaign_loader.h"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "absl/strings/str_format.h"
#include "services/common/loggers/request_log_context.h"
#include "services/common/util/error_accumulator.h"
#include "services/common/util/error_categories.h"
#include "services/common/util/file_util.h"
#include "services/common/util/proto_util.h"
#include "services/common/util/status_macros.h"

namespace rtb::bidding_engine {
namespace {

bool IsValidZone(const api::CampaignDefinition::TargetZone& zone) {
  return zone.lat() >= -90 && zone.lat() <= 90 && zone.lng() >= -180 &&
         zone.lng() <= 180 && zone.radius_km() >= 0 &&
         std::isfinite(zone.radius_km());
}

// Empty means unbounded, in which case `time` keeps its default.
bool ParseFlightTime(absl::string_view text, absl::Time* time) {
  if (text.empty()) {
    return true;
  }
  std::string error;
  return absl::ParseTime(absl::RFC3339_full, text, time, &error);
}

}  // namespace

absl::StatusOr<Campaign> CampaignFromDefinition(
    const api::CampaignDefinition& definition) {
  const int64_t id = definition.campaign_id();
  ErrorAccumulator errors;
  auto report = [&errors](absl::string_view msg) {
    errors.ReportError(ErrorVisibility::AD_SERVER_VISIBLE, msg);
  };

  Campaign campaign;
  campaign.campaign_id = id;
  campaign.advertiser_id = definition.advertiser_id();
  campaign.bid_price = definition.bid_price();
  campaign.daily_budget = definition.daily_budget();
  campaign.spent = definition.spent();
  campaign.bid_type = definition.bid_type();
  campaign.active = definition.active();
  campaign.priority = definition.priority();
  campaign.win_notice_url = definition.win_notice_url();
  campaign.seat = definition.seat();

  if (definition.bid_price() < 0) {
    report(absl::StrFormat(kNegativeBidPrice, id));
  }
  if (definition.daily_budget() < 0 || definition.spent() < 0) {
    report(absl::StrFormat(kNegativeBudget, id));
  }
  if (definition.spent() > definition.daily_budget()) {
    RTB_VLOG(kNoisyWarn) << absl::StrFormat(kSpentOverBudget, id);
  }
  for (const auto& zone : definition.target_zones()) {
    if (!IsValidZone(zone)) {
      report(absl::StrFormat(kInvalidZone, id));
      continue;
    }
    campaign.target_zones.push_back(
        {.lat = zone.lat(), .lng = zone.lng(), .radius_km = zone.radius_km()});
  }
  if (!ParseFlightTime(definition.start_time(), &campaign.start_time)) {
    report(absl::StrFormat(kBadTimestamp, id, "start_time",
                           definition.start_time()));
  }
  if (!ParseFlightTime(definition.end_time(), &campaign.end_time)) {
    report(absl::StrFormat(kBadTimestamp, id, "end_time",
                           definition.end_time()));
  }
  if (campaign.start_time > campaign.end_time) {
    report(absl::StrFormat(kInvalidFlightDates, id));
  }
  if (errors.HasErrors()) {
    return errors.ToInvalidArgumentStatus(ErrorVisibility::AD_SERVER_VISIBLE);
  }

  campaign.target_interests.insert(definition.target_interests().begin(),
                                   definition.target_interests().end());
  campaign.target_age_groups.insert(definition.target_age_groups().begin(),
                                    definition.target_age_groups().end());
  for (const auto& creative : definition.creatives()) {
    campaign.creatives.push_back({.creative_id = creative.creative_id(),
                                  .adm = creative.adm(),
                                  .w = creative.w(),
                                  .h = creative.h()});
  }
  if (definition.has_frequency_cap()) {
    campaign.frequency_cap = FrequencyCap{
        .cap = definition.frequency_cap().cap(),
        .window = absl::Seconds(definition.frequency_cap().window_seconds())};
  }
  return campaign;
}

CatalogLoadStats CampaignLoader::Apply(const api::CampaignCatalog& catalog) {
  absl::MutexLock lock(&mu_);
  CatalogLoadStats stats;
  absl::flat_hash_set<CampaignId> live_ids;
  for (const api::CampaignDefinition& definition : catalog.campaigns()) {
    if (!live_ids.insert(definition.campaign_id()).second) {
      RTB_LOG(ERROR) << absl::StrFormat(kDuplicateCampaignId,
                                        definition.campaign_id());
      ++stats.rejected;
      continue;
    }
    absl::StatusOr<Campaign> campaign = CampaignFromDefinition(definition);
    if (!campaign.ok()) {
      RTB_LOG(ERROR) << "Skipping catalog entry: " << campaign.status();
      // A rejected update leaves the previously loaded version serving.
      ++stats.rejected;
      continue;
    }
    ledger_->OpenAccount(campaign->campaign_id, campaign->daily_budget,
                         campaign->spent);
    index_->Add(*campaign);
    repository_->Upsert(*std::move(campaign));
    ++stats.upserted;
  }

  for (CampaignId campaign_id : repository_->ListIds()) {
    if (live_ids.contains(campaign_id)) {
      continue;
    }
    index_->Remove(campaign_id);
    repository_->Remove(campaign_id);
    ledger_->CloseAccount(campaign_id);
    ++stats.removed;
  }
  RTB_VLOG(kSuccess) << "Applied campaign catalog: upserted " << stats.upserted
                     << ", removed " << stats.removed << ", rejected "
                     << stats.rejected;
  return stats;
}

absl::StatusOr<CatalogLoadStats> CampaignLoader::LoadFromJson(
    absl::string_view json) {
  api::CampaignCatalog catalog;
  RTB_RETURN_IF_ERROR(JsonToProto(json, &catalog));
  return Apply(catalog);
}

absl::StatusOr<CatalogLoadStats> CampaignLoader::LoadFromFile(
    absl::string_view path) {
  RTB_ASSIGN_OR_RETURN(std::string json, GetFileContent(path));
  return LoadFromJson(json);
}

PeriodicCatalogLoader::PeriodicCatalogLoader(std::string path,
                                             absl::Duration period,
                                             CampaignLoader* loader)
    : path_(std::move(path)),
      period_(std::max(period, kMinCatalogRefreshPeriod)),
      loader_(*loader) {}

absl::Status PeriodicCatalogLoader::Start() {
  if (refresh_thread_.joinable()) {
    return absl::FailedPreconditionError("Catalog refresh already started");
  }
  RTB_RETURN_IF_ERROR(loader_.LoadFromFile(path_).status());
  refresh_thread_ = std::thread([this]() { RefreshLoop(); });
  return absl::OkStatus();
}

void PeriodicCatalogLoader::End() {
  if (!stop_.HasBeenNotified()) {
    stop_.Notify();
  }
  if (refresh_thread_.joinable()) {
    refresh_thread_.join();
  }
}

void PeriodicCatalogLoader::RefreshLoop() {
  while (!stop_.WaitForNotificationWithTimeout(period_)) {
    absl::StatusOr<CatalogLoadStats> stats = loader_.LoadFromFile(path_);
    if (!stats.ok()) {
      // Keep serving the last good snapshot.
      RTB_LOG(ERROR) << "Catalog refresh from " << path_
                     << " failed: " << stats.status();
    }
  }
}

}  // namespace rtb::bidding_engine
