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

#ifndef SERVICES_COMMON_TEST_MOCKS_H_
#define SERVICES_COMMON_TEST_MOCKS_H_

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/functional/any_invocable.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/time/time.h"
#include "gmock/gmock.h"
#include "services/bidding_engine/bid_source.h"
#include "services/bidding_engine/value_predictor.h"
#include "services/common/clients/config/parameter_source.h"
#include "services/common/clients/http/http_fetcher_async.h"
#include "services/common/concurrent/executor.h"
#include "services/common/reporters/async_reporter.h"

namespace rtb::bidding_engine {

class MockExecutor : public Executor {
 public:
  MOCK_METHOD(absl::Status, Run, (absl::AnyInvocable<void() &&> closure),
              (override));
};

// Utility class to be used by anything that relies on an HttpFetcherAsync.
class MockHttpFetcherAsync : public HttpFetcherAsync {
 public:
  MOCK_METHOD(void, FetchUrl,
              (const HTTPRequest& http_request, int timeout_ms,
               OnDoneFetchUrl done_callback),
              (override));
  MOCK_METHOD(void, PostUrl,
              (const HTTPRequest& http_request, int timeout_ms,
               OnDoneFetchUrl done_callback),
              (override));
};

// Utility class to be used to mock AsyncReporter.
class MockAsyncReporter : public AsyncReporter {
 public:
  explicit MockAsyncReporter(
      std::unique_ptr<HttpFetcherAsync> http_fetcher_async)
      : AsyncReporter(std::move(http_fetcher_async)) {}

  MOCK_METHOD(void, DoReport,
              (const HTTPRequest& reporting_request,
               absl::AnyInvocable<void(absl::StatusOr<absl::string_view>) &&>
                   done_callback),
              (const, override));
};

class MockParameterSource : public ParameterSource {
 public:
  MOCK_METHOD(absl::StatusOr<std::string>, GetParameter,
              (absl::string_view name), (const, override));
};

class MockBidSource : public BidSource {
 public:
  MOCK_METHOD(absl::string_view, name, (), (const, override));
  MOCK_METHOD(void, RequestBids,
              (const BidRequest& request, absl::Duration timeout,
               OnBidsReceived on_done),
              (override));
};

class MockValuePredictor : public ValuePredictor {
 public:
  MOCK_METHOD(absl::StatusOr<double>, Predict,
              (const BidRequest& request, const Campaign& campaign),
              (const, override));
};

}  // namespace rtb::bidding_engine

#endif  // SERVICES_COMMON_TEST_MOCKS_H_
