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

#include "services/common/clients/http/curl_http_fetcher_async.h"

#include <string>
#include <utility>

#include "absl/status/status.h"
#include "absl/synchronization/blocking_counter.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "services/common/concurrent/worker_pool.h"
#include "services/common/test/mocks.h"

namespace rtb::bidding_engine {
namespace {

using ::testing::_;
using ::testing::HasSubstr;
using ::testing::Return;

constexpr int kNormalTimeoutMs = 5000;

TEST(CurlResultToStatusTest, MapsCurlCodes) {
  EXPECT_TRUE(CurlResultToStatus(CURLE_OK, 200, "http://a").ok());
  EXPECT_TRUE(CurlResultToStatus(CURLE_OK, 204, "http://a").ok());
  absl::Status http_error = CurlResultToStatus(CURLE_OK, 503, "http://a");
  EXPECT_EQ(http_error.code(), absl::StatusCode::kInternal);
  EXPECT_THAT(http_error.message(), HasSubstr("503"));
  EXPECT_EQ(CurlResultToStatus(CURLE_OPERATION_TIMEDOUT, 0, "http://a").code(),
            absl::StatusCode::kDeadlineExceeded);
  EXPECT_EQ(CurlResultToStatus(CURLE_URL_MALFORMAT, 0, "http://a").code(),
            absl::StatusCode::kInvalidArgument);
  EXPECT_EQ(CurlResultToStatus(CURLE_COULDNT_CONNECT, 0, "http://a").code(),
            absl::StatusCode::kInternal);
}

TEST(CurlHttpFetcherAsyncTest, EmptyUrlFailsWithInvalidArgument) {
  WorkerPool pool({.num_workers = 1, .queue_capacity = 4});
  CurlHttpFetcherAsync fetcher(&pool);
  absl::BlockingCounter done(1);
  fetcher.PostUrl({.url = "", .headers = {}, .body = "{}"}, kNormalTimeoutMs,
                  [&done](absl::StatusOr<std::string> result) {
                    EXPECT_EQ(result.status().code(),
                              absl::StatusCode::kInvalidArgument);
                    done.DecrementCount();
                  });
  done.Wait();
}

TEST(CurlHttpFetcherAsyncTest, UnreachableHostFails) {
  WorkerPool pool({.num_workers = 1, .queue_capacity = 4});
  CurlHttpFetcherAsync fetcher(&pool);
  absl::BlockingCounter done(1);
  // Port 1 on the loopback interface is not expected to accept connections.
  fetcher.FetchUrl({.url = "http://127.0.0.1:1/win"}, kNormalTimeoutMs,
                   [&done](absl::StatusOr<std::string> result) {
                     EXPECT_FALSE(result.ok());
                     done.DecrementCount();
                   });
  done.Wait();
}

TEST(CurlHttpFetcherAsyncTest, ReportsExecutorRejection) {
  MockExecutor executor;
  EXPECT_CALL(executor, Run(_))
      .WillOnce(Return(absl::ResourceExhaustedError("full")));
  CurlHttpFetcherAsync fetcher(&executor);
  bool called = false;
  fetcher.FetchUrl({.url = "http://127.0.0.1/"}, kNormalTimeoutMs,
                   [&called](absl::StatusOr<std::string> result) {
                     EXPECT_EQ(result.status().code(),
                               absl::StatusCode::kResourceExhausted);
                     called = true;
                   });
  EXPECT_TRUE(called);
}

}  // namespace
}  // namespace rtb::bidding_engine
