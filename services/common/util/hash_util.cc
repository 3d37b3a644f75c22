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

#include "services/common/util/hash_util.h"

#include <cstdint>
#include <cstdio>
#include <string>

#include <openssl/sha.h>

namespace rtb::bidding_engine {
namespace {

void Digest(absl::string_view data, unsigned char (&hash)[SHA256_DIGEST_LENGTH]) {
  SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(),
         hash);
}

uint64_t LoadBigEndian64(const unsigned char* bytes) {
  uint64_t value = 0;
  for (int i = 0; i < 8; ++i) {
    value = (value << 8) | bytes[i];
  }
  return value;
}

}  // namespace

std::string ComputeSHA256(absl::string_view data, bool return_hex) {
  unsigned char hash[SHA256_DIGEST_LENGTH];
  Digest(data, hash);
  if (!return_hex) {
    return std::string(std::begin(hash), std::end(hash));
  }

  constexpr ptrdiff_t kTwoDigestLength = SHA256_DIGEST_LENGTH * 2;
  char output_buf[kTwoDigestLength + 1];
  output_buf[kTwoDigestLength] = 0;
  for (long i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
    ptrdiff_t i_times_2 = i * 2;
    snprintf(output_buf + i_times_2, sizeof(output_buf) - i_times_2, "%02x",
             hash[i]);
  }
  return std::string(output_buf);
}

uint64_t StableHash64(absl::string_view data) {
  unsigned char hash[SHA256_DIGEST_LENGTH];
  Digest(data, hash);
  return LoadBigEndian64(hash);
}

std::pair<uint64_t, uint64_t> StableHashPair(absl::string_view data) {
  unsigned char hash[SHA256_DIGEST_LENGTH];
  Digest(data, hash);
  return {LoadBigEndian64(hash), LoadBigEndian64(hash + 8)};
}

}  // namespace rtb::bidding_engine
