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

#include "services/common/util/error_accumulator.h"

#include <string>

#include "absl/strings/str_join.h"

namespace rtb::bidding_engine {

ErrorAccumulator::ErrorAccumulator(const RequestLogContext* log_context)
    : log_context_(log_context) {}

void ErrorAccumulator::ReportError(ErrorVisibility error_visibility,
                                   absl::string_view msg,
                                   ErrorCode error_code) {
  dst_error_map_[error_visibility][error_code].emplace(msg);
  if (log_context_) {
    RTB_VLOG(kNoisyWarn, *log_context_) << msg;
  }
}

const ErrorAccumulator::ErrorMap& ErrorAccumulator::GetErrors(
    ErrorVisibility error_visibility) const {
  auto it = dst_error_map_.find(error_visibility);
  if (it == dst_error_map_.end()) {
    return empty_error_map_;
  }

  return it->second;
}

bool ErrorAccumulator::HasErrors() const { return !dst_error_map_.empty(); }

std::string ErrorAccumulator::GetAccumulatedErrorString(
    ErrorVisibility error_visibility) const {
  const ErrorAccumulator::ErrorMap& error_map = GetErrors(error_visibility);
  auto it = error_map.find(ErrorCode::CLIENT_SIDE);
  if (it == error_map.end()) {
    return "";
  }
  return absl::StrJoin(it->second, kErrorDelimiter);
}

absl::Status ErrorAccumulator::ToInvalidArgumentStatus(
    ErrorVisibility error_visibility) const {
  std::string errors = GetAccumulatedErrorString(error_visibility);
  if (errors.empty()) {
    return absl::OkStatus();
  }
  return absl::InvalidArgumentError(errors);
}

}  // namespace rtb::bidding_engine
