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

#ifndef SERVICES_BIDDING_ENGINE_DATA_BID_REQUEST_H_
#define SERVICES_BIDDING_ENGINE_DATA_BID_REQUEST_H_

#include <optional>
#include <string>

#include "absl/container/flat_hash_set.h"
#include "absl/time/time.h"
#include "api/rtb_engine.pb.h"
#include "services/bidding_engine/data/money.h"

namespace rtb::bidding_engine {

inline constexpr absl::Duration kDefaultTmax = absl::Milliseconds(100);

struct GeoPoint {
  double lat = 0;
  double lng = 0;
};

// Validated ad opportunity. Only ever built by RequestValidator, so every
// field is populated and in range.
struct BidRequest {
  std::string request_id;
  std::string impression_id;
  std::string user_id;
  // Time the opportunity was created. Eligibility and frequency windows are
  // evaluated against it.
  absl::Time timestamp = absl::UnixEpoch();
  api::DeviceType device_type = api::DEVICE_TYPE_UNSPECIFIED;
  std::optional<GeoPoint> geo;
  std::string country;
  absl::flat_hash_set<std::string> interests;
  std::string age_group;
  Money floor_price = 0;
  int banner_w = 0;
  int banner_h = 0;
  int position = 0;
  // Site or app id.
  std::string inventory_id;
  absl::Duration tmax = kDefaultTmax;
};

}  // namespace rtb::bidding_engine

#endif  // SERVICES_BIDDING_ENGINE_DATA_BID_REQUEST_H_
