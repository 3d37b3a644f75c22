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

#include "services/bidding_engine/win_notifier.h"

#include <memory>
#include <string>
#include <utility>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "services/common/test/mocks.h"
#include "services/common/util/proto_util.h"

namespace rtb::bidding_engine {
namespace {

using ::testing::ElementsAre;

constexpr int64_t kCurrencyUnitScale = 100;

BidRequest MakeRequest() {
  BidRequest request;
  request.request_id = "auction-7";
  request.impression_id = "imp-3";
  request.user_id = "user-1";
  return request;
}

Bid MakeWinningBid() {
  Bid bid;
  bid.bid_id = "auction-7-12";
  bid.campaign_id = 12;
  bid.price = 120;
  bid.win_notice_url = "https://dsp.test/win";
  return bid;
}

TEST(BuildWinNoticeTest, ConvertsPriceToMajorUnits) {
  api::WinNotice notice =
      BuildWinNotice(MakeRequest(), MakeWinningBid(), 91, kCurrencyUnitScale);
  EXPECT_EQ(notice.auction_id(), "auction-7");
  EXPECT_EQ(notice.bid_id(), "auction-7-12");
  EXPECT_DOUBLE_EQ(notice.winning_price(), 0.91);
  EXPECT_EQ(notice.impression_id(), "imp-3");
}

TEST(WinNotifierTest, PostsJsonNoticeToWinUrl) {
  MockAsyncReporter reporter(std::make_unique<MockHttpFetcherAsync>());
  EXPECT_CALL(reporter, DoReport)
      .WillOnce([](const HTTPRequest& request,
                   absl::AnyInvocable<void(absl::StatusOr<absl::string_view>)&&>
                       done) {
        EXPECT_EQ(request.url, "https://dsp.test/win");
        EXPECT_THAT(request.headers, ElementsAre(kJsonContentTypeHeader));
        api::WinNotice notice;
        ASSERT_TRUE(JsonToProto(request.body, &notice).ok()) << request.body;
        EXPECT_EQ(notice.auction_id(), "auction-7");
        EXPECT_DOUBLE_EQ(notice.winning_price(), 0.91);
        std::move(done)("");
      });

  WinNotifier notifier(&reporter, kCurrencyUnitScale);
  notifier.NotifyWin(MakeRequest(), MakeWinningBid(), 91, RequestLogContext());
}

TEST(WinNotifierTest, DeliveryFailureIsOnlyLogged) {
  MockAsyncReporter reporter(std::make_unique<MockHttpFetcherAsync>());
  EXPECT_CALL(reporter, DoReport)
      .WillOnce([](const HTTPRequest&,
                   absl::AnyInvocable<void(absl::StatusOr<absl::string_view>)&&>
                       done) {
        std::move(done)(absl::UnavailableError("connection refused"));
      });

  WinNotifier notifier(&reporter, kCurrencyUnitScale);
  notifier.NotifyWin(MakeRequest(), MakeWinningBid(), 91, RequestLogContext());
}

TEST(WinNotifierTest, SkipsWinnersWithoutUrl) {
  MockAsyncReporter reporter(std::make_unique<MockHttpFetcherAsync>());
  EXPECT_CALL(reporter, DoReport).Times(0);

  Bid bid = MakeWinningBid();
  bid.win_notice_url.clear();
  WinNotifier notifier(&reporter, kCurrencyUnitScale);
  notifier.NotifyWin(MakeRequest(), bid, 91, RequestLogContext());
}

}  // namespace
}  // namespace rtb::bidding_engine
