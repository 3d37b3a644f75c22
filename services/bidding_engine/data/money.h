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

#ifndef SERVICES_BIDDING_ENGINE_DATA_MONEY_H_
#define SERVICES_BIDDING_ENGINE_DATA_MONEY_H_

#include <cmath>
#include <cstdint>
#include <optional>

namespace rtb::bidding_engine {

// Amount of money in the smallest currency unit (e.g. cents).
using Money = int64_t;

// Smallest amount a clearing price can be raised by.
inline constexpr Money kMinCurrencyIncrement = 1;

// Default number of minor units per major currency unit.
inline constexpr int64_t kDefaultCurrencyUnitScale = 100;

// Converts a decimal wire price in major units to minor units, rounding to
// nearest. Returns nullopt if the price is not finite or does not fit in
// Money.
inline std::optional<Money> ToMinorUnits(double major_units,
                                         int64_t unit_scale) {
  const double minor_units = major_units * static_cast<double>(unit_scale);
  // 2^63; every double below it in magnitude converts without overflow.
  constexpr double kLimit = 9223372036854775808.0;
  if (!std::isfinite(minor_units) || !(std::fabs(minor_units) < kLimit)) {
    return std::nullopt;
  }
  return static_cast<Money>(std::llround(minor_units));
}

inline double ToMajorUnits(Money minor_units, int64_t unit_scale) {
  return static_cast<double>(minor_units) / static_cast<double>(unit_scale);
}

}  // namespace rtb::bidding_engine

#endif  // SERVICES_BIDDING_ENGINE_DATA_MONEY_H_
