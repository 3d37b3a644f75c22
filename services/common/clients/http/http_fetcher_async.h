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

#ifndef SERVICES_COMMON_CLIENTS_HTTP_FETCHER_ASYNC_H_
#define SERVICES_COMMON_CLIENTS_HTTP_FETCHER_ASYNC_H_

#include "services/common/clients/http/curl_request_data.h"

namespace rtb::bidding_engine {

class HttpFetcherAsync {
 public:
  HttpFetcherAsync() = default;
  virtual ~HttpFetcherAsync() = default;
  HttpFetcherAsync(const HttpFetcherAsync&) = delete;
  HttpFetcherAsync& operator=(const HttpFetcherAsync&) = delete;

  // Fetches the specified url.
  //
  // http_request: The URL and headers for the HTTP GET request.
  // timeout_ms: The request timeout
  // done_callback: Output param. Invoked either on error or after finished
  // receiving a response. Please note that done_callback will run in a
  // threadpool and is not guaranteed to be the FetchUrl client's thread.
  // Clients can expect done_callback to be called exactly once.
  virtual void FetchUrl(const HTTPRequest& http_request, int timeout_ms,
                        OnDoneFetchUrl done_callback) = 0;

  // POSTs `http_request.body` to the specified url.
  //
  // Same threading and callback guarantees as `FetchUrl`.
  virtual void PostUrl(const HTTPRequest& http_request, int timeout_ms,
                       OnDoneFetchUrl done_callback) = 0;
};

}  // namespace rtb::bidding_engine

#endif  // SERVICES_COMMON_CLIENTS_HTTP_FETCHER_ASYNC_H_
