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

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "absl/debugging/failure_signal_handler.h"
#include "absl/debugging/symbolize.h"
#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/log/check.h"
#include "absl/log/globals.h"
#include "absl/log/initialize.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "grpcpp/ext/proto_server_reflection_plugin.h"
#include "grpcpp/grpcpp.h"
#include "grpcpp/health_check_service_interface.h"
#include "services/bidding_engine/bid_request_dispatcher.h"
#include "services/bidding_engine/budget_ledger.h"
#include "services/bidding_engine/campaign_index.h"
#include "services/bidding_engine/campaign_loader.h"
#include "services/bidding_engine/campaign_repository.h"
#include "services/bidding_engine/duplicate_suppression_filter.h"
#include "services/bidding_engine/frequency_cap_tracker.h"
#include "services/bidding_engine/request_orchestrator.h"
#include "services/bidding_engine/request_validator.h"
#include "services/bidding_engine/rtb_engine_service.h"
#include "services/bidding_engine/runtime_config.h"
#include "services/bidding_engine/runtime_flags.h"
#include "services/bidding_engine/win_notifier.h"
#include "services/common/clients/config/config_client.h"
#include "services/common/clients/config/parameter_source.h"
#include "services/common/clients/http/curl_http_fetcher_async.h"
#include "services/common/concurrent/worker_pool.h"
#include "services/common/loggers/request_log_context.h"
#include "services/common/reporters/async_reporter.h"
#include "services/common/util/status_macros.h"

ABSL_FLAG(std::optional<uint16_t>, port, std::nullopt,
          "Port the server is listening on.");
ABSL_FLAG(std::optional<int>, rtb_verbosity, std::nullopt,
          "Maximum level of RTB_VLOG statements that are emitted.");
ABSL_FLAG(std::optional<std::string>, campaign_catalog_path, std::nullopt,
          "Path of the JSON campaign catalog.");
ABSL_FLAG(std::optional<int64_t>, catalog_refresh_period_seconds, std::nullopt,
          "Seconds between reloads of the campaign catalog.");
ABSL_FLAG(std::optional<int>, num_workers, std::nullopt,
          "Number of threads running auctions.");
ABSL_FLAG(std::optional<int>, worker_queue_capacity, std::nullopt,
          "Maximum number of requests waiting for an auction thread.");
ABSL_FLAG(std::optional<std::string>, overflow_policy, std::nullopt,
          "What to do when the request queue is full: reject_new or "
          "drop_oldest.");
ABSL_FLAG(std::optional<int64_t>, default_tmax_ms, std::nullopt,
          "Request deadline used when a request does not carry tmax.");
ABSL_FLAG(std::optional<int64_t>, bid_source_timeout_ms, std::nullopt,
          "Upper bound on the wait for external bid sources.");
ABSL_FLAG(std::optional<int>, max_candidates_per_auction, std::nullopt,
          "Highest scoring candidates forwarded to the auction.");
ABSL_FLAG(std::optional<int>, max_cascades, std::nullopt,
          "Commit retries on lower bids after a failed commit.");
ABSL_FLAG(std::optional<int64_t>, currency_unit_scale, std::nullopt,
          "Minor currency units per major unit.");
ABSL_FLAG(std::optional<int>, default_frequency_cap, std::nullopt,
          "Exposure cap for campaigns without their own. 0 disables it.");
ABSL_FLAG(std::optional<int64_t>, default_frequency_window_seconds,
          std::nullopt, "Window of the default frequency cap.");
ABSL_FLAG(std::optional<int>, frequency_cap_shards, std::nullopt,
          "Number of lock shards of the frequency cap tracker.");
ABSL_FLAG(std::optional<int>, dedup_expected_items_per_user, std::nullopt,
          "Expected distinct ads per user in the duplicate filter.");
ABSL_FLAG(std::optional<double>, dedup_false_positive_rate, std::nullopt,
          "Target false positive rate of the duplicate filter.");
ABSL_FLAG(std::optional<double>, index_cell_size_degrees, std::nullopt,
          "Grid cell size of the campaign index.");
ABSL_FLAG(std::optional<int>, index_max_cells_per_campaign, std::nullopt,
          "Campaigns covering more cells are indexed globally.");
ABSL_FLAG(std::optional<double>, interest_match_weight, std::nullopt,
          "Score weight per shared interest.");
ABSL_FLAG(std::optional<double>, max_interest_weight, std::nullopt,
          "Upper bound of the interest weight.");
ABSL_FLAG(std::optional<double>, max_proximity_bonus, std::nullopt,
          "Score bonus at the center of a target zone.");
ABSL_FLAG(std::optional<int>, win_notice_timeout_ms, std::nullopt,
          "Timeout of win notification requests.");
ABSL_FLAG(
    bool, init_config_client, false,
    "Fetch runtime parameters not supplied on the command line from "
    "environment variables prefixed with --config_param_prefix.");
ABSL_FLAG(std::string, config_param_prefix, "RTB_",
          "Prefix of the environment variables holding runtime parameters.");

namespace rtb::bidding_engine {

absl::StatusOr<ConfigClient> GetConfigClient() {
  ConfigClient config_client(GetServiceFlags());
  config_client.SetFlag(FLAGS_port, PORT);
  config_client.SetFlag(FLAGS_rtb_verbosity, RTB_VERBOSITY);
  config_client.SetFlag(FLAGS_campaign_catalog_path, CAMPAIGN_CATALOG_PATH);
  config_client.SetFlag(FLAGS_catalog_refresh_period_seconds,
                        CATALOG_REFRESH_PERIOD_SECONDS);
  config_client.SetFlag(FLAGS_num_workers, NUM_WORKERS);
  config_client.SetFlag(FLAGS_worker_queue_capacity, WORKER_QUEUE_CAPACITY);
  config_client.SetFlag(FLAGS_overflow_policy, OVERFLOW_POLICY);
  config_client.SetFlag(FLAGS_default_tmax_ms, DEFAULT_TMAX_MS);
  config_client.SetFlag(FLAGS_bid_source_timeout_ms, BID_SOURCE_TIMEOUT_MS);
  config_client.SetFlag(FLAGS_max_candidates_per_auction,
                        MAX_CANDIDATES_PER_AUCTION);
  config_client.SetFlag(FLAGS_max_cascades, MAX_CASCADES);
  config_client.SetFlag(FLAGS_currency_unit_scale, CURRENCY_UNIT_SCALE);
  config_client.SetFlag(FLAGS_default_frequency_cap, DEFAULT_FREQUENCY_CAP);
  config_client.SetFlag(FLAGS_default_frequency_window_seconds,
                        DEFAULT_FREQUENCY_WINDOW_SECONDS);
  config_client.SetFlag(FLAGS_frequency_cap_shards, FREQUENCY_CAP_SHARDS);
  config_client.SetFlag(FLAGS_dedup_expected_items_per_user,
                        DEDUP_EXPECTED_ITEMS_PER_USER);
  config_client.SetFlag(FLAGS_dedup_false_positive_rate,
                        DEDUP_FALSE_POSITIVE_RATE);
  config_client.SetFlag(FLAGS_index_cell_size_degrees,
                        INDEX_CELL_SIZE_DEGREES);
  config_client.SetFlag(FLAGS_index_max_cells_per_campaign,
                        INDEX_MAX_CELLS_PER_CAMPAIGN);
  config_client.SetFlag(FLAGS_interest_match_weight, INTEREST_MATCH_WEIGHT);
  config_client.SetFlag(FLAGS_max_interest_weight, MAX_INTEREST_WEIGHT);
  config_client.SetFlag(FLAGS_max_proximity_bonus, MAX_PROXIMITY_BONUS);
  config_client.SetFlag(FLAGS_win_notice_timeout_ms, WIN_NOTICE_TIMEOUT_MS);

  if (absl::GetFlag(FLAGS_init_config_client)) {
    absl::Status init_status =
        config_client.Init(absl::GetFlag(FLAGS_config_param_prefix),
                           std::make_unique<EnvironmentParameterSource>());
    if (!init_status.ok()) {
      RTB_LOG(ERROR) << "Config client failed to initialize.";
      return init_status;
    }
  }
  RTB_LOG(INFO) << "Successfully constructed the config client.";
  return config_client;
}

absl::Status RunServer() {
  RTB_ASSIGN_OR_RETURN(ConfigClient config_client, GetConfigClient());
  RTB_ASSIGN_OR_RETURN(EngineRuntimeConfig runtime_config,
                       GetRuntimeConfig(config_client));
  SetGlobalRtbVLogLevel(runtime_config.verbosity);
  RTB_LOG(INFO, SystemLogContext()) << "server parameters:\n"
                                    << config_client.DebugString();
  if (runtime_config.campaign_catalog_path.empty()) {
    return absl::InvalidArgumentError(
        absl::StrCat(CAMPAIGN_CATALOG_PATH, " must be set"));
  }

  // Serving state.
  InMemoryCampaignRepository repository;
  CampaignIndex index(runtime_config.index);
  BudgetLedger ledger;
  FrequencyCapTracker frequency_caps(runtime_config.frequency_cap_shards);
  RTB_ASSIGN_OR_RETURN(
      std::unique_ptr<DuplicateSuppressionFilter> duplicate_filter,
      DuplicateSuppressionFilter::Create(runtime_config.duplicate_filter));

  CampaignLoader loader(&repository, &index, &ledger);
  PeriodicCatalogLoader catalog_refresh(runtime_config.campaign_catalog_path,
                                        runtime_config.catalog_refresh_period,
                                        &loader);
  RTB_RETURN_IF_ERROR(catalog_refresh.Start());

  // Win notifications run on their own threads so that slow owner endpoints
  // never hold up auctions.
  WorkerPool reporting_pool({.num_workers = 2, .queue_capacity = 4096});
  AsyncReporter reporter(std::make_unique<CurlHttpFetcherAsync>(&reporting_pool),
                         runtime_config.win_notice_timeout_ms);
  WinNotifier win_notifier(&reporter,
                           runtime_config.validator.currency_unit_scale);

  RequestValidator validator(runtime_config.validator);
  RequestOrchestrator orchestrator(
      {.repository = &repository,
       .index = &index,
       .frequency_caps = &frequency_caps,
       .duplicate_filter = duplicate_filter.get(),
       .ledger = &ledger,
       .win_notifier = &win_notifier},
      runtime_config.orchestrator);
  WorkerPool auction_pool(runtime_config.worker_pool);
  BidRequestDispatcher dispatcher(&validator, &orchestrator, &auction_pool);
  RtbEngineService rtb_engine_service(&dispatcher);

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();
  grpc::ServerBuilder builder;
  const std::string server_address =
      absl::StrCat("0.0.0.0:", runtime_config.port);
  builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
  builder.RegisterService(&rtb_engine_service);
  std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
  if (server == nullptr) {
    return absl::UnavailableError(
        absl::StrCat("Failed to start server on ", server_address));
  }
  RTB_LOG(INFO, SystemLogContext()) << "Server listening on " << server_address;

  // Wait for the server to shut down. Note that some other thread must be
  // responsible for shutting down the server for this call to ever return.
  server->Wait();
  catalog_refresh.End();
  auction_pool.Shutdown();
  reporting_pool.Shutdown();
  return absl::OkStatus();
}

}  // namespace rtb::bidding_engine

int main(int argc, char** argv) {
  absl::InitializeSymbolizer(argv[0]);
  absl::FailureSignalHandlerOptions options;
  absl::InstallFailureSignalHandler(options);
  absl::ParseCommandLine(argc, argv);
  absl::InitializeLog();
  absl::SetStderrThreshold(absl::LogSeverityAtLeast::kInfo);

  CHECK_OK(rtb::bidding_engine::RunServer()) << "Failed to run server.";
  return 0;
}
