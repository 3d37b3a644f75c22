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

#ifndef SERVICES_BIDDING_ENGINE_CREATIVE_SELECTOR_H_
#define SERVICES_BIDDING_ENGINE_CREATIVE_SELECTOR_H_

#include <vector>

#include "absl/strings/string_view.h"
#include "services/bidding_engine/data/campaign.h"

namespace rtb::bidding_engine {

// Picks a creative deterministically from the request id, so that replaying
// a request serves the same creative. Returns nullptr if there are none.
const Creative* SelectCreative(absl::string_view request_id,
                               const std::vector<Creative>& creatives);

}  // namespace rtb::bidding_engine

#endif  // SERVICES_BIDDING_ENGINE_CREATIVE_SELECTOR_H_
