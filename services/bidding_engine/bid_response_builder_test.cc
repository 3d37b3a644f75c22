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

#include "services/bidding_engine/bid_response_builder.h"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace rtb::bidding_engine {
namespace {

constexpr int64_t kCurrencyUnitScale = 100;

BidRequest MakeRequest() {
  BidRequest request;
  request.request_id = "auction-1";
  request.impression_id = "imp-1";
  return request;
}

AuctionResult MakeWonResult() {
  Bid bid;
  bid.bid_id = "auction-1-7";
  bid.campaign_id = 7;
  bid.price = 120;
  bid.creative_id = "cr-7";
  bid.adm = "<img src=\"ad.png\">";
  bid.seat = "seat-3";
  bid.w = 320;
  bid.h = 50;

  AuctionResult result;
  result.status = AuctionStatus::kWon;
  result.winner_campaign_id = 7;
  result.clearing_price = 91;
  result.candidates_considered = 3;
  result.winning_bid = bid;
  return result;
}

TEST(BuildBidResponseTest, WinCarriesOneSeatWithOneBid) {
  api::BidResponse response =
      BuildBidResponse(MakeRequest(), MakeWonResult(), kCurrencyUnitScale);

  EXPECT_EQ(response.id(), "auction-1");
  EXPECT_EQ(response.status(), api::AUCTION_STATUS_WON);
  EXPECT_EQ(response.nbr(), api::NO_BID_REASON_UNSPECIFIED);
  EXPECT_EQ(response.candidates_considered(), 3);
  ASSERT_EQ(response.seatbid_size(), 1);
  EXPECT_EQ(response.seatbid(0).seat(), "seat-3");
  ASSERT_EQ(response.seatbid(0).bid_size(), 1);
  const api::BidResponse::SeatBid::Bid& bid = response.seatbid(0).bid(0);
  EXPECT_EQ(bid.id(), "auction-1-7");
  EXPECT_EQ(bid.impid(), "imp-1");
  EXPECT_DOUBLE_EQ(bid.price(), 0.91);
  EXPECT_EQ(bid.crid(), "cr-7");
  EXPECT_EQ(bid.adm(), "<img src=\"ad.png\">");
  EXPECT_EQ(bid.w(), 320);
  EXPECT_EQ(bid.h(), 50);
  EXPECT_EQ(bid.cid(), 7);
}

TEST(BuildBidResponseTest, NoBidHasEmptySeatBid) {
  AuctionResult result;
  result.candidates_considered = 0;

  api::BidResponse response =
      BuildBidResponse(MakeRequest(), result, kCurrencyUnitScale);

  EXPECT_EQ(response.status(), api::AUCTION_STATUS_NO_BID);
  EXPECT_TRUE(response.seatbid().empty());
  EXPECT_EQ(response.nbr(), api::NO_BID_REASON_NO_CANDIDATES);
}

TEST(NoBidReasonForTest, TimeoutTakesPrecedence) {
  AuctionResult result;
  result.status = AuctionStatus::kTimeout;
  result.drops.below_floor = 2;
  EXPECT_EQ(NoBidReasonFor(result), api::NO_BID_REASON_TIMEOUT);
}

TEST(NoBidReasonForTest, LaterStagesTakePrecedence) {
  AuctionResult result;
  result.drops.frequency_capped = 1;
  EXPECT_EQ(NoBidReasonFor(result), api::NO_BID_REASON_FREQUENCY_CAPPED);
  result.drops.below_floor = 1;
  EXPECT_EQ(NoBidReasonFor(result), api::NO_BID_REASON_BELOW_FLOOR);
  result.drops.budget_exhausted = 1;
  EXPECT_EQ(NoBidReasonFor(result), api::NO_BID_REASON_BUDGET_EXHAUSTED);
}

TEST(NoBidReasonForTest, SuppressionReportsAsFrequencyCapped) {
  AuctionResult result;
  result.drops.duplicate_suppressed = 1;
  EXPECT_EQ(NoBidReasonFor(result), api::NO_BID_REASON_FREQUENCY_CAPPED);
}

TEST(BuildNoBidResponseTest, SetsStatusAndReason) {
  api::BidResponse response = BuildNoBidResponse(
      "auction-9", api::AUCTION_STATUS_TIMEOUT, api::NO_BID_REASON_TIMEOUT);
  EXPECT_EQ(response.id(), "auction-9");
  EXPECT_EQ(response.status(), api::AUCTION_STATUS_TIMEOUT);
  EXPECT_EQ(response.nbr(), api::NO_BID_REASON_TIMEOUT);
  EXPECT_TRUE(response.seatbid().empty());
}

}  // namespace
}  // namespace rtb::bidding_engine
