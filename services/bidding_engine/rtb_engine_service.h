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

#ifndef SERVICES_BIDDING_ENGINE_RTB_ENGINE_SERVICE_H_
#define SERVICES_BIDDING_ENGINE_RTB_ENGINE_SERVICE_H_

#include <grpcpp/grpcpp.h>

#include "absl/status/status.h"
#include "api/rtb_engine.grpc.pb.h"
#include "services/bidding_engine/bid_request_dispatcher.h"

namespace rtb::bidding_engine {

inline constexpr char kProcessBidRequest[] = "ProcessBidRequest";

// Converts an absl status to a gRPC status with the same code.
grpc::Status ToGrpcStatus(const absl::Status& status);

// RtbEngineService is the gRPC surface of the engine. Each call is handed to
// the dispatcher and finished from whichever thread produces its answer.
class RtbEngineService final : public api::RtbEngine::CallbackService {
 public:
  // The dispatcher must outlive the service.
  explicit RtbEngineService(BidRequestDispatcher* dispatcher)
      : dispatcher_(dispatcher) {}

  // Runs the auction for one opportunity.
  //
  // Validation failures finish with INVALID_ARGUMENT and requests refused
  // under load with RESOURCE_EXHAUSTED or UNAVAILABLE. Everything else
  // finishes OK with a win or no-bid response.
  grpc::ServerUnaryReactor* ProcessBidRequest(
      grpc::CallbackServerContext* context, const api::BidRequest* request,
      api::BidResponse* response) override;

 private:
  BidRequestDispatcher* dispatcher_;
};

}  // namespace rtb::bidding_engine

#endif  // SERVICES_BIDDING_ENGINE_RTB_ENGINE_SERVICE_H_
