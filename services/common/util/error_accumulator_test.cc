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

#include "absl/strings/str_cat.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "services/common/util/error_categories.h"

namespace rtb::bidding_engine {
namespace {

using ::testing::HasSubstr;
using ::testing::IsEmpty;

TEST(ErrorAccumulatorTest, EmptyErrorList) {
  ErrorAccumulator error_accumulator;
  EXPECT_THAT(error_accumulator.GetErrors(ErrorVisibility::AD_SERVER_VISIBLE),
              IsEmpty());
  EXPECT_THAT(error_accumulator.GetErrors(ErrorVisibility::CLIENT_VISIBLE),
              IsEmpty());
  EXPECT_FALSE(error_accumulator.HasErrors());
  EXPECT_TRUE(
      error_accumulator.ToInvalidArgumentStatus(ErrorVisibility::CLIENT_VISIBLE)
          .ok());
}

TEST(ErrorAccumulatorTest, ReportAndGetError) {
  ErrorAccumulator error_accumulator;
  std::string error_msg = "Bad catalog entry";
  error_accumulator.ReportError(ErrorVisibility::AD_SERVER_VISIBLE, error_msg,
                                ErrorCode::CLIENT_SIDE);
  ErrorAccumulator::ErrorMap expected_error_map = {
      {ErrorCode::CLIENT_SIDE, {error_msg}}};
  EXPECT_EQ(error_accumulator.GetErrors(ErrorVisibility::AD_SERVER_VISIBLE),
            expected_error_map);
  EXPECT_THAT(error_accumulator.GetErrors(ErrorVisibility::CLIENT_VISIBLE),
              IsEmpty());
  EXPECT_TRUE(error_accumulator.HasErrors());
}

TEST(ErrorAccumulatorTest, DeduplicatesErrors) {
  RequestLogContext log_context({{"request_id", "r-1"}});
  ErrorAccumulator error_accumulator(&log_context);
  error_accumulator.ReportError(ErrorVisibility::CLIENT_VISIBLE,
                                kMissingUserId);
  error_accumulator.ReportError(ErrorVisibility::CLIENT_VISIBLE,
                                kMissingUserId);

  ErrorAccumulator::ErrorMap expected_error_map = {
      {ErrorCode::CLIENT_SIDE, {kMissingUserId}}};
  EXPECT_EQ(error_accumulator.GetErrors(ErrorVisibility::CLIENT_VISIBLE),
            expected_error_map);
}

TEST(ErrorAccumulatorTest, ReturnsConcatenatedErrorString) {
  ErrorAccumulator error_accumulator;
  error_accumulator.ReportError(ErrorVisibility::CLIENT_VISIBLE,
                                kMissingRequestId);
  error_accumulator.ReportError(ErrorVisibility::CLIENT_VISIBLE,
                                kMissingImpressions);
  error_accumulator.ReportError(ErrorVisibility::CLIENT_VISIBLE, kInternalError,
                                ErrorCode::SERVER_SIDE);

  // Errors are ordered lexicographically, server side errors are excluded.
  EXPECT_EQ(error_accumulator.GetAccumulatedErrorString(
                ErrorVisibility::CLIENT_VISIBLE),
            absl::StrCat(kMissingImpressions, "; ", kMissingRequestId));
  EXPECT_EQ(error_accumulator.GetAccumulatedErrorString(
                ErrorVisibility::AD_SERVER_VISIBLE),
            "");
}

TEST(ErrorAccumulatorTest, FoldsClientErrorsIntoInvalidArgument) {
  ErrorAccumulator error_accumulator;
  error_accumulator.ReportError(ErrorVisibility::CLIENT_VISIBLE,
                                kMissingRequestId);
  absl::Status status =
      error_accumulator.ToInvalidArgumentStatus(ErrorVisibility::CLIENT_VISIBLE);
  EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);
  EXPECT_THAT(status.message(), HasSubstr(kMissingRequestId));
}

}  // namespace
}  // namespace rtb::bidding_engine
