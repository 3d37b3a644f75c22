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

#include "services/bidding_engine/geo_util.h"

#include <algorithm>
#include <cmath>

namespace rtb::bidding_engine {
namespace {

constexpr double kPi = 3.14159265358979323846;

double ToRadians(double degrees) { return degrees * kPi / 180.0; }
double ToDegrees(double radians) { return radians * 180.0 / kPi; }

}  // namespace

double HaversineDistanceKm(const GeoPoint& a, const GeoPoint& b) {
  double lat1 = ToRadians(a.lat);
  double lat2 = ToRadians(b.lat);
  double dlat = lat2 - lat1;
  double dlng = ToRadians(b.lng - a.lng);
  double h = std::sin(dlat / 2) * std::sin(dlat / 2) +
             std::cos(lat1) * std::cos(lat2) * std::sin(dlng / 2) *
                 std::sin(dlng / 2);
  return 2 * kEarthRadiusKm * std::asin(std::min(1.0, std::sqrt(h)));
}

// See "Finding Points Within a Distance of a Latitude/Longitude Using
// Bounding Coordinates" (J. Matuschek).
BoundingBox ZoneBoundingBox(const TargetZone& zone) {
  const double angular_radius = std::max(zone.radius_km, 0.0) / kEarthRadiusKm;
  const double lat = ToRadians(zone.lat);
  BoundingBox box;
  box.min_lat = ToDegrees(lat - angular_radius);
  box.max_lat = ToDegrees(lat + angular_radius);
  if (box.min_lat <= -90 || box.max_lat >= 90) {
    box.min_lat = std::max(box.min_lat, -90.0);
    box.max_lat = std::min(box.max_lat, 90.0);
    box.full_longitude = true;
    box.min_lng = -180;
    box.max_lng = 180;
    return box;
  }
  double delta_lng =
      ToDegrees(std::asin(std::sin(angular_radius) / std::cos(lat)));
  box.min_lng = zone.lng - delta_lng;
  box.max_lng = zone.lng + delta_lng;
  return box;
}

}  // namespace rtb::bidding_engine
