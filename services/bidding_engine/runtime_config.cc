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

#include "services/bidding_engine/runtime_config.h"

#include <string>

#include "absl/strings/str_cat.h"
#include "services/bidding_engine/campaign_loader.h"
#include "services/bidding_engine/runtime_flags.h"
#include "services/common/util/status_macros.h"

namespace rtb::bidding_engine {
namespace {

// Sets `*value` from `name` when the parameter has a value.
absl::Status ReadInt(const ConfigClient& config_client, absl::string_view name,
                     int* value) {
  if (!config_client.HasValue(name)) {
    return absl::OkStatus();
  }
  RTB_ASSIGN_OR_RETURN(*value, config_client.GetIntParameter(name));
  return absl::OkStatus();
}

absl::Status ReadInt64(const ConfigClient& config_client,
                       absl::string_view name, int64_t* value) {
  if (!config_client.HasValue(name)) {
    return absl::OkStatus();
  }
  RTB_ASSIGN_OR_RETURN(*value, config_client.GetInt64Parameter(name));
  return absl::OkStatus();
}

absl::Status ReadDouble(const ConfigClient& config_client,
                        absl::string_view name, double* value) {
  if (!config_client.HasValue(name)) {
    return absl::OkStatus();
  }
  RTB_ASSIGN_OR_RETURN(*value, config_client.GetDoubleParameter(name));
  return absl::OkStatus();
}

absl::Status ReadMillis(const ConfigClient& config_client,
                        absl::string_view name, absl::Duration* value) {
  int64_t millis = absl::ToInt64Milliseconds(*value);
  RTB_RETURN_IF_ERROR(ReadInt64(config_client, name, &millis));
  *value = absl::Milliseconds(millis);
  return absl::OkStatus();
}

absl::Status OutOfRange(absl::string_view name, absl::string_view expected) {
  return absl::InvalidArgumentError(
      absl::StrCat("Parameter ", name, " must be ", expected));
}

}  // namespace

absl::StatusOr<EngineRuntimeConfig> GetRuntimeConfig(
    const ConfigClient& config_client) {
  EngineRuntimeConfig config;
  RTB_RETURN_IF_ERROR(ReadInt(config_client, PORT, &config.port));
  RTB_RETURN_IF_ERROR(ReadInt(config_client, RTB_VERBOSITY, &config.verbosity));
  if (config_client.HasValue(CAMPAIGN_CATALOG_PATH)) {
    RTB_ASSIGN_OR_RETURN(
        config.campaign_catalog_path,
        config_client.GetStringParameter(CAMPAIGN_CATALOG_PATH));
  }
  int64_t refresh_seconds =
      absl::ToInt64Seconds(config.catalog_refresh_period);
  RTB_RETURN_IF_ERROR(ReadInt64(config_client, CATALOG_REFRESH_PERIOD_SECONDS,
                                &refresh_seconds));
  config.catalog_refresh_period = absl::Seconds(refresh_seconds);

  // Worker pool.
  RTB_RETURN_IF_ERROR(
      ReadInt(config_client, NUM_WORKERS, &config.worker_pool.num_workers));
  RTB_RETURN_IF_ERROR(ReadInt(config_client, WORKER_QUEUE_CAPACITY,
                              &config.worker_pool.queue_capacity));
  if (config_client.HasValue(OVERFLOW_POLICY)) {
    RTB_ASSIGN_OR_RETURN(std::string policy,
                         config_client.GetStringParameter(OVERFLOW_POLICY));
    if (!ParseOverflowPolicy(policy, &config.worker_pool.overflow_policy)) {
      return OutOfRange(OVERFLOW_POLICY, "reject_new or drop_oldest");
    }
  }

  // Request handling.
  RTB_RETURN_IF_ERROR(ReadInt64(config_client, CURRENCY_UNIT_SCALE,
                                &config.validator.currency_unit_scale));
  RTB_RETURN_IF_ERROR(ReadMillis(config_client, DEFAULT_TMAX_MS,
                                 &config.validator.default_tmax));
  RequestOrchestratorOptions& orchestrator = config.orchestrator;
  RTB_RETURN_IF_ERROR(ReadMillis(config_client, BID_SOURCE_TIMEOUT_MS,
                                 &orchestrator.bid_source_timeout));
  RTB_RETURN_IF_ERROR(ReadInt(config_client, MAX_CANDIDATES_PER_AUCTION,
                              &orchestrator.max_candidates_per_auction));
  RTB_RETURN_IF_ERROR(ReadInt(config_client, MAX_CASCADES,
                              &orchestrator.auction.max_cascades));
  RTB_RETURN_IF_ERROR(ReadDouble(config_client, INTEREST_MATCH_WEIGHT,
                                 &orchestrator.scoring.interest_match_weight));
  RTB_RETURN_IF_ERROR(ReadDouble(config_client, MAX_INTEREST_WEIGHT,
                                 &orchestrator.scoring.max_interest_weight));
  RTB_RETURN_IF_ERROR(ReadDouble(config_client, MAX_PROXIMITY_BONUS,
                                 &orchestrator.scoring.max_proximity_bonus));

  // A default cap of zero or less means campaigns without their own cap are
  // not capped at all.
  int default_cap = 0;
  RTB_RETURN_IF_ERROR(ReadInt(config_client, DEFAULT_FREQUENCY_CAP,
                              &default_cap));
  int64_t default_window_seconds = absl::ToInt64Seconds(absl::Hours(24));
  RTB_RETURN_IF_ERROR(ReadInt64(config_client, DEFAULT_FREQUENCY_WINDOW_SECONDS,
                                &default_window_seconds));
  if (default_cap > 0) {
    if (default_window_seconds <= 0) {
      return OutOfRange(DEFAULT_FREQUENCY_WINDOW_SECONDS, "positive");
    }
    orchestrator.default_frequency_cap =
        FrequencyCap{.cap = default_cap,
                     .window = absl::Seconds(default_window_seconds)};
  }

  // State.
  RTB_RETURN_IF_ERROR(ReadInt(config_client, FREQUENCY_CAP_SHARDS,
                              &config.frequency_cap_shards));
  RTB_RETURN_IF_ERROR(
      ReadInt(config_client, DEDUP_EXPECTED_ITEMS_PER_USER,
              &config.duplicate_filter.expected_items_per_user));
  RTB_RETURN_IF_ERROR(ReadDouble(config_client, DEDUP_FALSE_POSITIVE_RATE,
                                 &config.duplicate_filter.false_positive_rate));
  RTB_RETURN_IF_ERROR(ReadDouble(config_client, INDEX_CELL_SIZE_DEGREES,
                                 &config.index.cell_size_degrees));
  RTB_RETURN_IF_ERROR(ReadInt(config_client, INDEX_MAX_CELLS_PER_CAMPAIGN,
                              &config.index.max_cells_per_campaign));
  RTB_RETURN_IF_ERROR(ReadInt(config_client, WIN_NOTICE_TIMEOUT_MS,
                              &config.win_notice_timeout_ms));

  if (config.port <= 0 || config.port > 65535) {
    return OutOfRange(PORT, "in [1, 65535]");
  }
  if (config.catalog_refresh_period < kMinCatalogRefreshPeriod) {
    return OutOfRange(CATALOG_REFRESH_PERIOD_SECONDS, "at least 1");
  }
  if (config.worker_pool.num_workers <= 0) {
    return OutOfRange(NUM_WORKERS, "positive");
  }
  if (config.worker_pool.queue_capacity <= 0) {
    return OutOfRange(WORKER_QUEUE_CAPACITY, "positive");
  }
  if (config.validator.currency_unit_scale <= 0) {
    return OutOfRange(CURRENCY_UNIT_SCALE, "positive");
  }
  if (config.validator.default_tmax <= absl::ZeroDuration()) {
    return OutOfRange(DEFAULT_TMAX_MS, "positive");
  }
  if (orchestrator.bid_source_timeout < absl::ZeroDuration()) {
    return OutOfRange(BID_SOURCE_TIMEOUT_MS, "non-negative");
  }
  if (orchestrator.max_candidates_per_auction <= 0) {
    return OutOfRange(MAX_CANDIDATES_PER_AUCTION, "positive");
  }
  if (orchestrator.auction.max_cascades < 0) {
    return OutOfRange(MAX_CASCADES, "non-negative");
  }
  if (config.frequency_cap_shards <= 0) {
    return OutOfRange(FREQUENCY_CAP_SHARDS, "positive");
  }
  if (!(config.index.cell_size_degrees > 0 &&
        config.index.cell_size_degrees <= 90)) {
    return OutOfRange(INDEX_CELL_SIZE_DEGREES, "in (0, 90]");
  }
  if (config.win_notice_timeout_ms <= 0) {
    return OutOfRange(WIN_NOTICE_TIMEOUT_MS, "positive");
  }
  // The filter options are checked by DuplicateSuppressionFilter::Create.
  return config;
}

}  // namespace rtb::bidding_engine
