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

#include "services/bidding_engine/rtb_engine_service.h"

#include <string>
#include <utility>

#include "services/common/loggers/request_log_context.h"

namespace rtb::bidding_engine {

grpc::Status ToGrpcStatus(const absl::Status& status) {
  if (status.ok()) {
    return grpc::Status::OK;
  }
  // absl and gRPC share the canonical code numbering.
  return grpc::Status(static_cast<grpc::StatusCode>(status.code()),
                      std::string(status.message()));
}

grpc::ServerUnaryReactor* RtbEngineService::ProcessBidRequest(
    grpc::CallbackServerContext* context, const api::BidRequest* request,
    api::BidResponse* response) {
  grpc::ServerUnaryReactor* reactor = context->DefaultReactor();
  RTB_VLOG(kPlain) << kProcessBidRequest << " request: "
                   << request->ShortDebugString();
  dispatcher_->Dispatch(
      *request,
      [reactor, response](absl::StatusOr<api::BidResponse> result) {
        if (!result.ok()) {
          reactor->Finish(ToGrpcStatus(result.status()));
          return;
        }
        *response = *std::move(result);
        RTB_VLOG(kPlain) << kProcessBidRequest << " response: "
                         << response->ShortDebugString();
        reactor->Finish(grpc::Status::OK);
      });
  return reactor;
}

}  // namespace rtb::bidding_engine
