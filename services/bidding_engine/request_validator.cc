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

#include "services/bidding_engine/request_validator.h"

#include <utility>

#include "absl/strings/str_format.h"
#include "services/common/loggers/request_log_context.h"
#include "services/common/util/error_accumulator.h"
#include "services/common/util/error_categories.h"

namespace rtb::bidding_engine {
namespace {

bool IsValidLatitude(double lat) { return lat >= -90 && lat <= 90; }
bool IsValidLongitude(double lng) { return lng >= -180 && lng <= 180; }

}  // namespace

absl::StatusOr<BidRequest> RequestValidator::Validate(
    const api::BidRequest& wire_request, absl::Time received_at) const {
  RequestLogContext log_context(
      {{"request_id", wire_request.id()},
       {"user_id", wire_request.user().id()}});
  ErrorAccumulator errors(&log_context);
  auto report = [&errors](absl::string_view msg) {
    errors.ReportError(ErrorVisibility::CLIENT_VISIBLE, msg);
  };

  if (wire_request.id().empty()) {
    report(kMissingRequestId);
  }
  if (wire_request.impressions().empty()) {
    report(kMissingImpressions);
  }
  for (int i = 0; i < wire_request.impressions_size(); ++i) {
    const auto& impression = wire_request.impressions(i);
    if (impression.id().empty()) {
      report(absl::StrFormat(kMissingImpressionId, i));
    }
    if (impression.bidfloor() < 0) {
      report(absl::StrFormat(kNegativeFloorPrice, i));
    } else if (!ToMinorUnits(impression.bidfloor(),
                             options_.currency_unit_scale)
                    .has_value()) {
      report(absl::StrFormat(kFloorPriceOutOfRange, i));
    }
  }
  if (wire_request.user().id().empty()) {
    report(kMissingUserId);
  }
  const auto& geo = wire_request.geo();
  if (geo.has_lat() != geo.has_lng()) {
    report(kIncompleteGeo);
  }
  if (geo.has_lat() && !IsValidLatitude(geo.lat())) {
    report(absl::StrFormat(kLatitudeOutOfRange, geo.lat()));
  }
  if (geo.has_lng() && !IsValidLongitude(geo.lng())) {
    report(absl::StrFormat(kLongitudeOutOfRange, geo.lng()));
  }
  if (wire_request.tmax_ms() < 0) {
    report(kNegativeTmax);
  }
  if (errors.HasErrors()) {
    return errors.ToInvalidArgumentStatus(ErrorVisibility::CLIENT_VISIBLE);
  }

  // Only the first impression is auctioned.
  const auto& impression = wire_request.impressions(0);
  BidRequest request;
  request.request_id = wire_request.id();
  request.impression_id = impression.id();
  request.user_id = wire_request.user().id();
  request.timestamp = wire_request.timestamp_ms() > 0
                          ? absl::FromUnixMillis(wire_request.timestamp_ms())
                          : received_at;
  request.device_type = wire_request.device().type();
  if (geo.has_lat() && geo.has_lng()) {
    request.geo = GeoPoint{geo.lat(), geo.lng()};
  }
  request.country = geo.country();
  request.interests.insert(wire_request.user().interests().begin(),
                           wire_request.user().interests().end());
  request.age_group = wire_request.user().age_group();
  request.floor_price =
      *ToMinorUnits(impression.bidfloor(), options_.currency_unit_scale);
  request.banner_w = impression.banner().w();
  request.banner_h = impression.banner().h();
  request.position = impression.pos();
  switch (wire_request.inventory_case()) {
    case api::BidRequest::kSite:
      request.inventory_id = wire_request.site().id();
      break;
    case api::BidRequest::kApp:
      request.inventory_id = wire_request.app().id();
      break;
    case api::BidRequest::INVENTORY_NOT_SET:
      break;
  }
  request.tmax = wire_request.tmax_ms() > 0
                     ? absl::Milliseconds(wire_request.tmax_ms())
                     : options_.default_tmax;
  if (wire_request.impressions_size() > 1) {
    RTB_VLOG(kNoisyInfo, log_context)
        << "Ignoring " << wire_request.impressions_size() - 1
        << " additional impressions";
  }
  return request;
}

}  // namespace rtb::bidding_engine
