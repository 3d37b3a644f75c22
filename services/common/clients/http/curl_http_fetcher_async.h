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

#ifndef SERVICES_COMMON_CLIENTS_HTTP_CURL_HTTP_FETCHER_ASYNC_H_
#define SERVICES_COMMON_CLIENTS_HTTP_CURL_HTTP_FETCHER_ASYNC_H_

#include <string>

#include <curl/curl.h>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "services/common/clients/http/http_fetcher_async.h"
#include "services/common/concurrent/executor.h"

namespace rtb::bidding_engine {

// Maps a completed libcurl transfer to a status. HTTP codes >= 400 are
// reported as errors.
absl::Status CurlResultToStatus(CURLcode result, long http_code,
                                absl::string_view url);

// Executes each HTTP request as a blocking libcurl easy transfer on a thread
// of the provided executor, then invokes the done callback on that thread.
// Requests the executor refuses fail immediately with the executor's status.
class CurlHttpFetcherAsync final : public HttpFetcherAsync {
 public:
  // The executor must outlive this object.
  explicit CurlHttpFetcherAsync(Executor* executor);

  void FetchUrl(const HTTPRequest& http_request, int timeout_ms,
                OnDoneFetchUrl done_callback) override;

  void PostUrl(const HTTPRequest& http_request, int timeout_ms,
               OnDoneFetchUrl done_callback) override;

 private:
  void Schedule(HTTPRequest http_request, bool is_post, int timeout_ms,
                OnDoneFetchUrl done_callback);

  Executor* executor_;
};

}  // namespace rtb::bidding_engine

#endif  // SERVICES_COMMON_CLIENTS_HTTP_CURL_HTTP_FETCHER_ASYNC_H_
