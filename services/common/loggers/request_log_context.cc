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

#include "services/common/loggers/request_log_context.h"

#include <atomic>
#include <utility>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"

namespace rtb::bidding_engine {
namespace {

std::atomic<int> max_rtb_verbosity{0};

}  // namespace

void SetGlobalRtbVLogLevel(int max_verbosity) {
  max_rtb_verbosity.store(max_verbosity, std::memory_order_relaxed);
}

bool RtbVLogIsOn(int verbose_level) {
  return verbose_level <= max_rtb_verbosity.load(std::memory_order_relaxed);
}

std::string FormatContext(
    const absl::btree_map<std::string, std::string>& context_map) {
  if (context_map.empty()) {
    return "";
  }
  std::vector<std::string> pairs;
  for (const auto& [key, val] : context_map) {
    if (!val.empty()) {
      pairs.emplace_back(absl::StrCat(key, ": ", val));
    }
  }
  if (pairs.empty()) {
    return "";
  }
  return absl::StrCat(" (", absl::StrJoin(std::move(pairs), ", "), ") ");
}

RequestLogContext::RequestLogContext(
    const absl::btree_map<std::string, std::string>& context_map)
    : context_(FormatContext(context_map)) {}

void RequestLogContext::Update(
    const absl::btree_map<std::string, std::string>& new_context) {
  context_ = FormatContext(new_context);
}

RequestLogContext& SystemLogContext() {
  static RequestLogContext* system_context = new RequestLogContext();
  return *system_context;
}

}  // namespace rtb::bidding_engine
