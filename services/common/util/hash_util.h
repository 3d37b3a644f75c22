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

#ifndef SERVICES_COMMON_UTIL_HASH_UTIL_H_
#define SERVICES_COMMON_UTIL_HASH_UTIL_H_

#include <cstdint>
#include <string>
#include <utility>

#include "absl/strings/string_view.h"

namespace rtb::bidding_engine {

// Wrapper around OpenSSL to compute the SHA256 hash of a given input string.
// It converts the resulting binary hash into a hexadecimal string.
std::string ComputeSHA256(absl::string_view data, bool return_hex = true);

// Hash of `data` that is stable across processes and builds (unlike
// absl::Hash, which is seeded per process). Taken from the leading bytes of
// the SHA256 digest.
uint64_t StableHash64(absl::string_view data);

// Two independent 64-bit hashes of `data` from a single SHA256 digest, for
// double hashing schemes (h1 + i * h2).
std::pair<uint64_t, uint64_t> StableHashPair(absl::string_view data);

}  // namespace rtb::bidding_engine

#endif  // SERVICES_COMMON_UTIL_HASH_UTIL_H_
