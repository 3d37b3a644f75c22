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

#include "services/bidding_engine/creative_selector.h"

#include "services/common/util/hash_util.h"

namespace rtb::bidding_engine {

const Creative* SelectCreative(absl::string_view request_id,
                               const std::vector<Creative>& creatives) {
  if (creatives.empty()) {
    return nullptr;
  }
  return &creatives[StableHash64(request_id) % creatives.size()];
}

}  // namespace rtb::bidding_engine
