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

#include <string>

#include "absl/container/btree_map.h"
#include "gtest/gtest.h"

namespace rtb::bidding_engine {
namespace {

TEST(FormatContext, EmptyMapFormatsToEmptyString) {
  EXPECT_EQ(FormatContext({}), "");
}

TEST(FormatContext, SkipsEmptyValues) {
  EXPECT_EQ(FormatContext({{"request_id", ""}, {"user_id", ""}}), "");
  EXPECT_EQ(FormatContext({{"request_id", "r1"}, {"user_id", ""}}),
            " (request_id: r1) ");
}

TEST(FormatContext, OrdersKeys) {
  EXPECT_EQ(FormatContext({{"user_id", "u7"}, {"request_id", "r1"}}),
            " (request_id: r1, user_id: u7) ");
}

TEST(RequestLogContext, DefaultContextIsEmpty) {
  RequestLogContext context;
  EXPECT_EQ(context.ContextStr(), "");
}

TEST(RequestLogContext, UpdateReplacesContext) {
  RequestLogContext context({{"request_id", "r1"}});
  EXPECT_EQ(context.ContextStr(), " (request_id: r1) ");

  context.Update({{"request_id", "r2"}, {"user_id", "u1"}});
  EXPECT_EQ(context.ContextStr(), " (request_id: r2, user_id: u1) ");
}

TEST(RequestLogContext, CopiesAreIndependent) {
  RequestLogContext context({{"request_id", "r1"}});
  RequestLogContext copy = context;
  copy.Update({{"request_id", "r2"}});
  EXPECT_EQ(context.ContextStr(), " (request_id: r1) ");
  EXPECT_EQ(copy.ContextStr(), " (request_id: r2) ");
}

TEST(RtbVLog, VerbosityLevelGatesMessages) {
  SetGlobalRtbVLogLevel(kSuccess);
  EXPECT_TRUE(RtbVLogIsOn(kPlain));
  EXPECT_TRUE(RtbVLogIsOn(kSuccess));
  EXPECT_FALSE(RtbVLogIsOn(kStats));

  SetGlobalRtbVLogLevel(0);
  EXPECT_FALSE(RtbVLogIsOn(kPlain));
}

TEST(RtbLog, AcceptsOptionalContext) {
  SetGlobalRtbVLogLevel(kOriginated);
  RequestLogContext context({{"request_id", "r1"}});
  RTB_LOG(INFO) << "system message";
  RTB_LOG(INFO, context) << "request message";
  RTB_VLOG(kNoisyInfo) << "verbose system message";
  RTB_VLOG(kNoisyInfo, context) << "verbose request message";
  SetGlobalRtbVLogLevel(0);
}

}  // namespace
}  // namespace rtb::bidding_engine
