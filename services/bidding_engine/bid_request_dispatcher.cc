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

#include "services/bidding_engine/bid_request_dispatcher.h"

#include <memory>
#include <utility>

#include "absl/time/clock.h"
#include "services/bidding_engine/bid_response_builder.h"
#include "services/common/loggers/request_log_context.h"

namespace rtb::bidding_engine {

void BidRequestDispatcher::Dispatch(const api::BidRequest& wire_request,
                                    OnBidResponse on_done) {
  const absl::Time received_at = absl::Now();
  absl::StatusOr<BidRequest> request =
      validator_->Validate(wire_request, received_at);
  if (!request.ok()) {
    RTB_VLOG(kNoisyWarn) << "Rejecting request " << wire_request.id() << ": "
                         << request.status();
    std::move(on_done)(request.status());
    return;
  }

  // Shared by the run and cancel paths, only one of which fires.
  auto shared_on_done = std::make_shared<OnBidResponse>(std::move(on_done));
  const absl::Time deadline = received_at + request->tmax;
  absl::Status submitted = worker_pool_->Submit(
      {.run =
           [this, request = *std::move(request), deadline, received_at,
            shared_on_done]() {
             if (absl::Now() >= deadline) {
               RTB_VLOG(kNoisyWarn)
                   << "Request " << request.request_id << " waited "
                   << absl::Now() - received_at
                   << " for a worker, past its tmax of " << request.tmax;
               std::move(*shared_on_done)(BuildNoBidResponse(
                   request.request_id, api::AUCTION_STATUS_TIMEOUT,
                   api::NO_BID_REASON_TIMEOUT));
               return;
             }
             AuctionResult result = orchestrator_->Process(request, deadline);
             std::move(*shared_on_done)(BuildBidResponse(
                 request, result,
                 validator_->options().currency_unit_scale));
           },
       .on_cancelled =
           [shared_on_done](absl::Status status) {
             std::move(*shared_on_done)(std::move(status));
           }});
  if (!submitted.ok()) {
    RTB_VLOG(kNoisyWarn) << "Request " << wire_request.id()
                         << " not queued: " << submitted;
    std::move(*shared_on_done)(std::move(submitted));
  }
}

}  // namespace rtb::bidding_engine
