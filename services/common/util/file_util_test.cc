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

#include "services/common/util/file_util.h"

#include <string>

#include "absl/strings/str_cat.h"
#include "gtest/gtest.h"
#include "services/common/test/random.h"

namespace rtb::bidding_engine {
namespace {

std::string TempPath() {
  return absl::StrCat(::testing::TempDir(), "/file_util_test_",
                      MakeARandomString());
}

TEST(FileUtilTest, ReplacesAndReadsBack) {
  const std::string path = TempPath();
  ASSERT_TRUE(ReplaceFileContents(path, "first").ok());
  ASSERT_TRUE(ReplaceFileContents(path, "second\nline").ok());

  absl::StatusOr<std::string> content = GetFileContent(path);
  ASSERT_TRUE(content.ok()) << content.status();
  EXPECT_EQ(*content, "second\nline");
}

TEST(FileUtilTest, ReplaceLeavesNoPendingFile) {
  const std::string path = TempPath();
  ASSERT_TRUE(ReplaceFileContents(path, "{}").ok());

  EXPECT_EQ(GetFileContent(absl::StrCat(path, kPendingWriteSuffix))
                .status()
                .code(),
            absl::StatusCode::kNotFound);
}

TEST(FileUtilTest, ReplaceInMissingDirectoryFails) {
  absl::Status status = ReplaceFileContents(
      absl::StrCat(TempPath(), "/missing/catalog.json"), "{}");
  EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);
}

TEST(FileUtilTest, MissingFileIsNotFound) {
  absl::StatusOr<std::string> content =
      GetFileContent(absl::StrCat(TempPath(), "/missing.json"));
  EXPECT_EQ(content.status().code(), absl::StatusCode::kNotFound);
}

}  // namespace
}  // namespace rtb::bidding_engine
