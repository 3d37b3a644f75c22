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

#include <memory>
#include <string>
#include <utility>

#include "absl/strings/str_cat.h"
#include "services/common/clients/http/curl_request_data.h"
#include "services/common/loggers/request_log_context.h"

namespace rtb::bidding_engine {
namespace {

inline constexpr char kFailCurl[] = "Failed to perform HTTP request.";

// The function declaration of WriteCallback is specified by libcurl.
// libcurl documentation: https://curl.se/libcurl/c/CURLOPT_WRITEFUNCTION.html
//
// data: A pointer to the data that was delivered over the wire.
// size: (legacy) size is always 1. Represents 1 byte.
// number_elements: the number of elements (each of size 1 byte) to write
// output: a libcurl-client-provided pointer of where to save the data
// return: number of bytes actually written to output
size_t WriteCallback(char* data, size_t size, size_t number_elements,
                     std::string* output) {
  output->append(data, size * number_elements);
  return size * number_elements;
}

absl::StatusOr<std::string> Perform(const HTTPRequest& request, bool is_post,
                                    int timeout_ms) {
  if (request.url.empty()) {
    return absl::InvalidArgumentError("Empty URL");
  }
  CurlRequestData data(request.headers);
  if (data.req_handle == nullptr) {
    return absl::InternalError("Unable to create a curl easy handle");
  }
  CURL* handle = data.req_handle;
  curl_easy_setopt(handle, CURLOPT_URL, request.url.c_str());
  curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, WriteCallback);
  curl_easy_setopt(handle, CURLOPT_WRITEDATA, &data.response_body);
  curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(handle, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
  // Worker threads must not receive signals from libcurl's resolver.
  curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
  if (data.headers_list_ptr != nullptr) {
    curl_easy_setopt(handle, CURLOPT_HTTPHEADER, data.headers_list_ptr);
  }
  if (is_post) {
    curl_easy_setopt(handle, CURLOPT_POSTFIELDS, request.body.c_str());
    curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE_LARGE,
                     static_cast<curl_off_t>(request.body.size()));
  }

  CURLcode result = curl_easy_perform(handle);
  long http_code = 0;
  curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &http_code);
  absl::Status status = CurlResultToStatus(result, http_code, request.url);
  if (!status.ok()) {
    return status;
  }
  return std::move(data.response_body);
}

}  // namespace

absl::Status CurlResultToStatus(CURLcode result, long http_code,
                                absl::string_view url) {
  const char* result_msg = curl_easy_strerror(result);
  switch (result) {
    case CURLE_OK:
      if (http_code >= 400) {
        return absl::InternalError(
            absl::StrCat(kFailCurl, " HTTP Code: ", http_code, "; ", url));
      }
      return absl::OkStatus();
    case CURLE_OPERATION_TIMEDOUT:
      return absl::DeadlineExceededError(result_msg);
    case CURLE_URL_MALFORMAT:
    case CURLE_UNSUPPORTED_PROTOCOL:
      return absl::InvalidArgumentError(result_msg);
    default:
      return absl::InternalError(result_msg);
  }
}

CurlHttpFetcherAsync::CurlHttpFetcherAsync(Executor* executor)
    : executor_(executor) {}

void CurlHttpFetcherAsync::FetchUrl(const HTTPRequest& http_request,
                                    int timeout_ms,
                                    OnDoneFetchUrl done_callback) {
  Schedule(http_request, /*is_post=*/false, timeout_ms,
           std::move(done_callback));
}

void CurlHttpFetcherAsync::PostUrl(const HTTPRequest& http_request,
                                   int timeout_ms,
                                   OnDoneFetchUrl done_callback) {
  Schedule(http_request, /*is_post=*/true, timeout_ms,
           std::move(done_callback));
}

void CurlHttpFetcherAsync::Schedule(HTTPRequest http_request, bool is_post,
                                    int timeout_ms,
                                    OnDoneFetchUrl done_callback) {
  // Shared so that the callback is still reachable if the executor refuses
  // the closure.
  auto on_done = std::make_shared<OnDoneFetchUrl>(std::move(done_callback));
  absl::Status scheduled = executor_->Run(
      [request = std::move(http_request), is_post, timeout_ms, on_done]() {
        RTB_VLOG(kOriginated) << (is_post ? "POST " : "GET ") << request.url;
        std::move (*on_done)(Perform(request, is_post, timeout_ms));
      });
  if (!scheduled.ok()) {
    std::move (*on_done)(std::move(scheduled));
  }
}

}  // namespace rtb::bidding_engine
