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

#ifndef SERVICES_BIDDING_ENGINE_RUNTIME_FLAGS_H_
#define SERVICES_BIDDING_ENGINE_RUNTIME_FLAGS_H_

#include <vector>

#include "absl/strings/string_view.h"

namespace rtb::bidding_engine {

// Define runtime flag names.
inline constexpr char PORT[] = "RTB_ENGINE_PORT";
inline constexpr char RTB_VERBOSITY[] = "RTB_VERBOSITY";
inline constexpr char CAMPAIGN_CATALOG_PATH[] = "CAMPAIGN_CATALOG_PATH";
inline constexpr char CATALOG_REFRESH_PERIOD_SECONDS[] =
    "CATALOG_REFRESH_PERIOD_SECONDS";
inline constexpr char NUM_WORKERS[] = "NUM_WORKERS";
inline constexpr char WORKER_QUEUE_CAPACITY[] = "WORKER_QUEUE_CAPACITY";
inline constexpr char OVERFLOW_POLICY[] = "OVERFLOW_POLICY";
inline constexpr char DEFAULT_TMAX_MS[] = "DEFAULT_TMAX_MS";
inline constexpr char BID_SOURCE_TIMEOUT_MS[] = "BID_SOURCE_TIMEOUT_MS";
inline constexpr char MAX_CANDIDATES_PER_AUCTION[] =
    "MAX_CANDIDATES_PER_AUCTION";
inline constexpr char MAX_CASCADES[] = "MAX_CASCADES";
inline constexpr char CURRENCY_UNIT_SCALE[] = "CURRENCY_UNIT_SCALE";
inline constexpr char DEFAULT_FREQUENCY_CAP[] = "DEFAULT_FREQUENCY_CAP";
inline constexpr char DEFAULT_FREQUENCY_WINDOW_SECONDS[] =
    "DEFAULT_FREQUENCY_WINDOW_SECONDS";
inline constexpr char FREQUENCY_CAP_SHARDS[] = "FREQUENCY_CAP_SHARDS";
inline constexpr char DEDUP_EXPECTED_ITEMS_PER_USER[] =
    "DEDUP_EXPECTED_ITEMS_PER_USER";
inline constexpr char DEDUP_FALSE_POSITIVE_RATE[] =
    "DEDUP_FALSE_POSITIVE_RATE";
inline constexpr char INDEX_CELL_SIZE_DEGREES[] = "INDEX_CELL_SIZE_DEGREES";
inline constexpr char INDEX_MAX_CELLS_PER_CAMPAIGN[] =
    "INDEX_MAX_CELLS_PER_CAMPAIGN";
inline constexpr char INTEREST_MATCH_WEIGHT[] = "INTEREST_MATCH_WEIGHT";
inline constexpr char MAX_INTEREST_WEIGHT[] = "MAX_INTEREST_WEIGHT";
inline constexpr char MAX_PROXIMITY_BONUS[] = "MAX_PROXIMITY_BONUS";
inline constexpr char WIN_NOTICE_TIMEOUT_MS[] = "WIN_NOTICE_TIMEOUT_MS";

inline constexpr absl::string_view kFlags[] = {
    PORT,
    RTB_VERBOSITY,
    CAMPAIGN_CATALOG_PATH,
    CATALOG_REFRESH_PERIOD_SECONDS,
    NUM_WORKERS,
    WORKER_QUEUE_CAPACITY,
    OVERFLOW_POLICY,
    DEFAULT_TMAX_MS,
    BID_SOURCE_TIMEOUT_MS,
    MAX_CANDIDATES_PER_AUCTION,
    MAX_CASCADES,
    CURRENCY_UNIT_SCALE,
    DEFAULT_FREQUENCY_CAP,
    DEFAULT_FREQUENCY_WINDOW_SECONDS,
    FREQUENCY_CAP_SHARDS,
    DEDUP_EXPECTED_ITEMS_PER_USER,
    DEDUP_FALSE_POSITIVE_RATE,
    INDEX_CELL_SIZE_DEGREES,
    INDEX_MAX_CELLS_PER_CAMPAIGN,
    INTEREST_MATCH_WEIGHT,
    MAX_INTEREST_WEIGHT,
    MAX_PROXIMITY_BONUS,
    WIN_NOTICE_TIMEOUT_MS};

inline std::vector<absl::string_view> GetServiceFlags() {
  int size = sizeof(kFlags) / sizeof(kFlags[0]);
  return std::vector<absl::string_view>(kFlags, kFlags + size);
}

}  // namespace rtb::bidding_engine

#endif  // SERVICES_BIDDING_ENGINE_RUNTIME_FLAGS_H_
