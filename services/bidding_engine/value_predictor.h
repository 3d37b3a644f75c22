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

#ifndef SERVICES_BIDDING_ENGINE_VALUE_PREDICTOR_H_
#define SERVICES_BIDDING_ENGINE_VALUE_PREDICTOR_H_

#include "absl/status/statusor.h"
#include "services/bidding_engine/data/bid_request.h"
#include "services/bidding_engine/data/campaign.h"

namespace rtb::bidding_engine {

// External CTR / value model consulted while scoring. The returned value
// multiplies the candidate's score, so it must be finite and non-negative.
// Called concurrently from request threads.
class ValuePredictor {
 public:
  virtual ~ValuePredictor() = default;

  virtual absl::StatusOr<double> Predict(const BidRequest& request,
                                         const Campaign& campaign) const = 0;
};

}  // namespace rtb::bidding_engine

#endif  // SERVICES_BIDDING_ENGINE_VALUE_PREDICTOR_H_
