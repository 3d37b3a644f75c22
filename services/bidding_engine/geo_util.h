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

#ifndef SERVICES_BIDDING_ENGINE_GEO_UTIL_H_
#define SERVICES_BIDDING_ENGINE_GEO_UTIL_H_

#include "services/bidding_engine/data/bid_request.h"
#include "services/bidding_engine/data/campaign.h"

namespace rtb::bidding_engine {

inline constexpr double kEarthRadiusKm = 6371.0;

// Great-circle distance on a spherical earth.
double HaversineDistanceKm(const GeoPoint& a, const GeoPoint& b);

// Latitude/longitude box enclosing every point within `zone.radius_km` of the
// zone center. `min_lng` may be below -180 and `max_lng` above 180 when the
// zone crosses the antimeridian.
struct BoundingBox {
  double min_lat = 0;
  double max_lat = 0;
  double min_lng = 0;
  double max_lng = 0;
  // The box spans every longitude, e.g. because it contains a pole.
  bool full_longitude = false;
};

BoundingBox ZoneBoundingBox(const TargetZone& zone);

}  // namespace rtb::bidding_engine

#endif  // SERVICES_BIDDING_ENGINE_GEO_UTIL_H_
