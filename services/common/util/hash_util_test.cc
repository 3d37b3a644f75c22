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

#include "gtest/gtest.h"

namespace rtb::bidding_engine {
namespace {

TEST(HashUtilTest, ComputesHexDigest) {
  EXPECT_EQ(ComputeSHA256("abc"),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(HashUtilTest, ComputesBinaryDigest) {
  EXPECT_EQ(ComputeSHA256("abc", /*return_hex=*/false).size(), 32);
}

TEST(HashUtilTest, StableHashUsesLeadingDigestBytes) {
  EXPECT_EQ(StableHash64("abc"), 0xba7816bf8f01cfeaULL);
  auto [h1, h2] = StableHashPair("abc");
  EXPECT_EQ(h1, 0xba7816bf8f01cfeaULL);
  EXPECT_EQ(h2, 0x414140de5dae2223ULL);
}

}  // namespace
}  // namespace rtb::bidding_engine
