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

#ifndef SERVICES_COMMON_CLIENTS_HTTP_CURL_REQUEST_DATA_H_
#define SERVICES_COMMON_CLIENTS_HTTP_CURL_REQUEST_DATA_H_

#include <string>
#include <vector>

#include <curl/curl.h>

#include "absl/functional/any_invocable.h"
#include "absl/status/statusor.h"

namespace rtb::bidding_engine {

using OnDoneFetchUrl = absl::AnyInvocable<void(absl::StatusOr<std::string>) &&>;

struct HTTPRequest {
  std::string url;
  // Optional
  std::vector<std::string> headers = {};
  // Optional. Sent as the request body by POST requests.
  std::string body = "";
};

// Owns the libcurl easy handle and header list of one request. Both are
// released when the request completes.
struct CurlRequestData {
  explicit CurlRequestData(const std::vector<std::string>& headers);
  ~CurlRequestData();

  // CurlRequestData is neither copyable nor movable.
  CurlRequestData(const CurlRequestData&) = delete;
  CurlRequestData& operator=(const CurlRequestData&) = delete;

  // The easy handle provided by libcurl.
  CURL* req_handle;

  // The pointer to the linked list of the request HTTP headers.
  struct curl_slist* headers_list_ptr = nullptr;

  // Response body, written by libcurl.
  std::string response_body;
};

}  // namespace rtb::bidding_engine

#endif  // SERVICES_COMMON_CLIENTS_HTTP_CURL_REQUEST_DATA_H_
