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

#ifndef SERVICES_COMMON_UTIL_ERROR_CATEGORIES_H_
#define SERVICES_COMMON_UTIL_ERROR_CATEGORIES_H_

#include <cstdint>

namespace rtb::bidding_engine {

// We have at least two types of errors that can be reported by the engine:
//
//  1) Errors that need to be reported back to the exchange that sent the bid
//     request (e.g. a request without impressions).
//
//  2) Errors that are only of interest to the ad server operating the engine
//     (e.g. a malformed campaign definition in the catalog).
enum class ErrorVisibility : std::uint8_t { CLIENT_VISIBLE, AD_SERVER_VISIBLE };

enum class ErrorCode : std::uint16_t { CLIENT_SIDE = 400, SERVER_SIDE = 500 };

// Client side errors listed here.
inline constexpr char kMissingRequestId[] = "Request is missing id";
inline constexpr char kMissingImpressions[] = "Request has no impressions";
inline constexpr char kMissingImpressionId[] =
    "Impression at index %d is missing id";
inline constexpr char kMissingUserId[] = "Request is missing user id";
inline constexpr char kLatitudeOutOfRange[] =
    "Latitude %f is outside [-90, 90]";
inline constexpr char kLongitudeOutOfRange[] =
    "Longitude %f is outside [-180, 180]";
inline constexpr char kNegativeFloorPrice[] =
    "Impression at index %d has negative bid floor";
inline constexpr char kFloorPriceOutOfRange[] =
    "Impression at index %d has a bid floor that is not finite or too large";
inline constexpr char kNegativeTmax[] = "Request has negative tmax";
inline constexpr char kIncompleteGeo[] =
    "Request geo must carry both lat and lng";

// Server side errors listed here.
inline constexpr char kInternalError[] = "Internal Error";
inline constexpr char kEngineOverloaded[] =
    "Engine queue is full, request rejected";
inline constexpr char kDroppedUnderLoad[] =
    "Request dropped from a saturated queue";
inline constexpr char kEngineShuttingDown[] = "Engine is shutting down";

// Constants for bad catalog provided inputs.
inline constexpr char kNegativeBidPrice[] = "Campaign %d has negative bid price";
inline constexpr char kNegativeBudget[] = "Campaign %d has negative budget";
inline constexpr char kSpentOverBudget[] =
    "Campaign %d has spent more than its daily budget";
inline constexpr char kInvalidZone[] =
    "Campaign %d has a target zone with invalid coordinates or radius";
inline constexpr char kInvalidFlightDates[] =
    "Campaign %d has start date after end date";
inline constexpr char kDuplicateCampaignId[] =
    "Campaign %d appears more than once in the catalog";
inline constexpr char kBadTimestamp[] = "Campaign %d has unparsable %s: %s";

// Error handling related constants.
inline constexpr char kErrorDelimiter[] = "; ";

}  // namespace rtb::bidding_engine

#endif  // SERVICES_COMMON_UTIL_ERROR_CATEGORIES_H_
