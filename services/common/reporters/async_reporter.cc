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

#include "services/common/reporters/async_reporter.h"

#include <string>
#include <utility>

namespace rtb::bidding_engine {

void AsyncReporter::DoReport(
    const HTTPRequest& reporting_request,
    absl::AnyInvocable<void(absl::StatusOr<absl::string_view>) &&>
        done_callback) const {
  http_fetcher_async_->PostUrl(
      reporting_request, timeout_ms_,
      [done_callback = std::move(done_callback)](
          absl::StatusOr<std::string> response) mutable {
        if (!response.ok()) {
          std::move(done_callback)(response.status());
          return;
        }
        std::move(done_callback)(absl::string_view(*response));
      });
}

}  // namespace rtb::bidding_engine
