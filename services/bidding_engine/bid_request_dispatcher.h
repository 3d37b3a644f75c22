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

#ifndef SERVICES_BIDDING_ENGINE_BID_REQUEST_DISPATCHER_H_
#define SERVICES_BIDDING_ENGINE_BID_REQUEST_DISPATCHER_H_

#include <cstdint>

#include "absl/functional/any_invocable.h"
#include "absl/status/statusor.h"
#include "api/rtb_engine.pb.h"
#include "services/bidding_engine/request_orchestrator.h"
#include "services/bidding_engine/request_validator.h"
#include "services/common/concurrent/worker_pool.h"

namespace rtb::bidding_engine {

using OnBidResponse =
    absl::AnyInvocable<void(absl::StatusOr<api::BidResponse>) &&>;

// Entry point for wire requests. Validates on the calling thread and runs the
// auction on the worker pool.
//
// `on_done` is invoked exactly once, possibly on the calling thread:
//  - INVALID_ARGUMENT if validation failed,
//  - RESOURCE_EXHAUSTED if the pool refused the request,
//  - UNAVAILABLE if the request was evicted from a saturated queue,
//  - CANCELLED if the pool shut down before the request ran,
//  - a BidResponse otherwise. A request that waited longer than its tmax
//    for a worker gets a TIMEOUT response without running the auction.
class BidRequestDispatcher {
 public:
  // Pointers are not owned and must outlive the dispatcher.
  BidRequestDispatcher(const RequestValidator* validator,
                       const RequestOrchestrator* orchestrator,
                       WorkerPool* worker_pool)
      : validator_(validator),
        orchestrator_(orchestrator),
        worker_pool_(worker_pool) {}

  // BidRequestDispatcher is neither copyable nor movable.
  BidRequestDispatcher(const BidRequestDispatcher&) = delete;
  BidRequestDispatcher& operator=(const BidRequestDispatcher&) = delete;

  void Dispatch(const api::BidRequest& wire_request, OnBidResponse on_done);

 private:
  const RequestValidator* validator_;
  const RequestOrchestrator* orchestrator_;
  WorkerPool* worker_pool_;
};

}  // namespace rtb::bidding_engine

#endif  // SERVICES_BIDDING_ENGINE_BID_REQUEST_DISPATCHER_H_
