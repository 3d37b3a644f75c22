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

#include "services/bidding_engine/rtb_engine_service.h"

#include <memory>
#include <utility>

#include "absl/time/time.h"
#include "api/rtb_engine.grpc.pb.h"
#include "gmock/gmock.h"
#include "google/protobuf/text_format.h"
#include "gtest/gtest.h"
#include "services/common/test/utils/service_utils.h"

namespace rtb::bidding_engine {
namespace {

constexpr absl::Duration kCallTimeout = absl::Seconds(10);

constexpr char kRequest[] = R"pb(
  id: "auction-1"
  impressions { id: "imp-1" bidfloor: 0.25 }
  user { id: "user-1" interests: "sports" }
  geo { country: "US" lat: 40.758 lng: -73.9855 }
  tmax_ms: 1000
)pb";

api::BidRequest MakeWireRequest() {
  api::BidRequest request;
  EXPECT_TRUE(google::protobuf::TextFormat::ParseFromString(kRequest, &request));
  return request;
}

class RtbEngineServiceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    absl::StatusOr<std::unique_ptr<DuplicateSuppressionFilter>> filter =
        DuplicateSuppressionFilter::Create({});
    ASSERT_TRUE(filter.ok()) << filter.status();
    duplicate_filter_ = *std::move(filter);

    Campaign campaign;
    campaign.campaign_id = 42;
    campaign.bid_price = 100;
    campaign.daily_budget = 100000;
    campaign.active = true;
    campaign.target_interests = {"sports"};
    campaign.creatives.push_back(
        {.creative_id = "cr-42", .adm = "<div/>", .w = 300, .h = 250});
    campaign.seat = "seat-42";
    repository_.Upsert(campaign);
    index_.Add(campaign);
    ledger_.OpenAccount(42, campaign.daily_budget, 0);

    orchestrator_ = std::make_unique<RequestOrchestrator>(
        OrchestratorDependencies{.repository = &repository_,
                                 .index = &index_,
                                 .frequency_caps = &frequency_caps_,
                                 .duplicate_filter = duplicate_filter_.get(),
                                 .ledger = &ledger_});
    worker_pool_ = std::make_unique<WorkerPool>(WorkerPoolOptions{});
    dispatcher_ = std::make_unique<BidRequestDispatcher>(
        &validator_, orchestrator_.get(), worker_pool_.get());
    service_ = std::make_unique<RtbEngineService>(dispatcher_.get());
  }

  RequestValidator validator_;
  InMemoryCampaignRepository repository_;
  CampaignIndex index_;
  FrequencyCapTracker frequency_caps_;
  std::unique_ptr<DuplicateSuppressionFilter> duplicate_filter_;
  BudgetLedger ledger_;
  std::unique_ptr<RequestOrchestrator> orchestrator_;
  std::unique_ptr<WorkerPool> worker_pool_;
  std::unique_ptr<BidRequestDispatcher> dispatcher_;
  std::unique_ptr<RtbEngineService> service_;
};

TEST(ToGrpcStatusTest, KeepsCodeAndMessage) {
  grpc::Status status =
      ToGrpcStatus(absl::ResourceExhaustedError("queue is full"));
  EXPECT_EQ(status.error_code(), grpc::StatusCode::RESOURCE_EXHAUSTED);
  EXPECT_EQ(status.error_message(), "queue is full");
  EXPECT_TRUE(ToGrpcStatus(absl::OkStatus()).ok());
}

TEST_F(RtbEngineServiceTest, ReturnsWinningBid) {
  LocalService local_service(service_.get());
  ASSERT_TRUE(local_service.started());
  std::unique_ptr<api::RtbEngine::Stub> stub =
      local_service.NewStub<api::RtbEngine>();

  std::unique_ptr<grpc::ClientContext> context =
      ContextWithTimeout(kCallTimeout);
  api::BidResponse response;
  grpc::Status status =
      stub->ProcessBidRequest(context.get(), MakeWireRequest(), &response);

  ASSERT_TRUE(status.ok()) << status.error_message();
  EXPECT_EQ(response.id(), "auction-1");
  EXPECT_EQ(response.status(), api::AUCTION_STATUS_WON);
  ASSERT_EQ(response.seatbid_size(), 1);
  EXPECT_EQ(response.seatbid(0).seat(), "seat-42");
  EXPECT_EQ(response.seatbid(0).bid(0).cid(), 42);
  EXPECT_DOUBLE_EQ(response.seatbid(0).bid(0).price(), 0.25);
}

TEST_F(RtbEngineServiceTest, InvalidRequestFailsWithInvalidArgument) {
  LocalService local_service(service_.get());
  ASSERT_TRUE(local_service.started());
  std::unique_ptr<api::RtbEngine::Stub> stub =
      local_service.NewStub<api::RtbEngine>();
  api::BidRequest request = MakeWireRequest();
  request.clear_user();

  std::unique_ptr<grpc::ClientContext> context =
      ContextWithTimeout(kCallTimeout);
  api::BidResponse response;
  grpc::Status status =
      stub->ProcessBidRequest(context.get(), request, &response);

  EXPECT_EQ(status.error_code(), grpc::StatusCode::INVALID_ARGUMENT);
}

TEST_F(RtbEngineServiceTest, NoMatchingCampaignIsNoBid) {
  LocalService local_service(service_.get());
  ASSERT_TRUE(local_service.started());
  std::unique_ptr<api::RtbEngine::Stub> stub =
      local_service.NewStub<api::RtbEngine>();
  api::BidRequest request = MakeWireRequest();
  request.mutable_user()->clear_interests();

  std::unique_ptr<grpc::ClientContext> context =
      ContextWithTimeout(kCallTimeout);
  api::BidResponse response;
  grpc::Status status =
      stub->ProcessBidRequest(context.get(), request, &response);

  ASSERT_TRUE(status.ok()) << status.error_message();
  EXPECT_EQ(response.status(), api::AUCTION_STATUS_NO_BID);
  EXPECT_EQ(response.nbr(), api::NO_BID_REASON_NO_CANDIDATES);
  EXPECT_TRUE(response.seatbid().empty());
}

}  // namespace
}  // namespace rtb::bidding_engine
