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

#ifndef SERVICES_BIDDING_ENGINE_REQUEST_VALIDATOR_H_
#define SERVICES_BIDDING_ENGINE_REQUEST_VALIDATOR_H_

#include <cstdint>

#include "absl/status/statusor.h"
#include "absl/time/time.h"
#include "api/rtb_engine.pb.h"
#include "services/bidding_engine/data/bid_request.h"
#include "services/bidding_engine/data/money.h"

namespace rtb::bidding_engine {

struct RequestValidatorOptions {
  int64_t currency_unit_scale = kDefaultCurrencyUnitScale;
  // Used when the request does not set tmax.
  absl::Duration default_tmax = kDefaultTmax;
};

// Turns a wire request into a typed BidRequest. Either every field is valid
// or the request is rejected as a whole with INVALID_ARGUMENT listing all the
// problems found.
class RequestValidator {
 public:
  explicit RequestValidator(RequestValidatorOptions options = {})
      : options_(options) {}

  // `received_at` stands in for a missing request timestamp.
  absl::StatusOr<BidRequest> Validate(const api::BidRequest& wire_request,
                                      absl::Time received_at) const;

  const RequestValidatorOptions& options() const { return options_; }

 private:
  const RequestValidatorOptions options_;
};

}  // namespace rtb::bidding_engine

#endif  // SERVICES_BIDDING_ENGINE_REQUEST_VALIDATOR_H_
