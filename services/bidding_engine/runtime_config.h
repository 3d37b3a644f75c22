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

#ifndef SERVICES_BIDDING_ENGINE_RUNTIME_CONFIG_H_
#define SERVICES_BIDDING_ENGINE_RUNTIME_CONFIG_H_

#include <cstdint>
#include <string>

#include "absl/status/statusor.h"
#include "absl/time/time.h"
#include "services/bidding_engine/campaign_index.h"
#include "services/bidding_engine/duplicate_suppression_filter.h"
#include "services/bidding_engine/frequency_cap_tracker.h"
#include "services/bidding_engine/request_orchestrator.h"
#include "services/bidding_engine/request_validator.h"
#include "services/common/clients/config/config_client.h"
#include "services/common/concurrent/worker_pool.h"
#include "services/common/reporters/async_reporter.h"

namespace rtb::bidding_engine {

inline constexpr int kDefaultPort = 50051;
inline constexpr absl::Duration kDefaultCatalogRefreshPeriod = absl::Minutes(1);

struct EngineRuntimeConfig {
  int port = kDefaultPort;
  int verbosity = 0;
  // JSON CampaignCatalog. Required.
  std::string campaign_catalog_path;
  absl::Duration catalog_refresh_period = kDefaultCatalogRefreshPeriod;
  WorkerPoolOptions worker_pool;
  RequestValidatorOptions validator;
  RequestOrchestratorOptions orchestrator;
  int frequency_cap_shards = kDefaultFrequencyCapShards;
  DuplicateSuppressionFilterOptions duplicate_filter;
  CampaignIndexOptions index;
  int win_notice_timeout_ms = kDefaultReportingTimeoutMs;
};

// Reads every parameter named in runtime_flags.h from `config_client`.
// Parameters without a value keep their defaults. Values that do not parse
// or are out of range fail with INVALID_ARGUMENT.
absl::StatusOr<EngineRuntimeConfig> GetRuntimeConfig(
    const ConfigClient& config_client);

}  // namespace rtb::bidding_engine

#endif  // SERVICES_BIDDING_ENGINE_RUNTIME_CONFIG_H_
