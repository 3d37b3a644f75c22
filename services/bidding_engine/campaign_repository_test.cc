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

#include "services/bidding_engine/campaign_repository.h"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace rtb::bidding_engine {
namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;

Campaign MakeCampaign(CampaignId id, Money bid_price) {
  Campaign campaign;
  campaign.campaign_id = id;
  campaign.bid_price = bid_price;
  return campaign;
}

TEST(InMemoryCampaignRepositoryTest, UpsertAndGet) {
  InMemoryCampaignRepository repository;
  EXPECT_EQ(repository.Get(1), nullptr);

  repository.Upsert(MakeCampaign(1, 100));
  std::shared_ptr<const Campaign> campaign = repository.Get(1);
  ASSERT_NE(campaign, nullptr);
  EXPECT_EQ(campaign->bid_price, 100);
}

TEST(InMemoryCampaignRepositoryTest, UpdateKeepsOldSnapshotIntact) {
  InMemoryCampaignRepository repository;
  repository.Upsert(MakeCampaign(1, 100));
  std::shared_ptr<const Campaign> before = repository.Get(1);

  repository.Upsert(MakeCampaign(1, 200));
  EXPECT_EQ(before->bid_price, 100);
  EXPECT_EQ(repository.Get(1)->bid_price, 200);
}

TEST(InMemoryCampaignRepositoryTest, RemoveAndList) {
  InMemoryCampaignRepository repository;
  repository.Upsert(MakeCampaign(3, 1));
  repository.Upsert(MakeCampaign(1, 1));
  repository.Upsert(MakeCampaign(2, 1));
  EXPECT_THAT(repository.ListIds(), ElementsAre(1, 2, 3));

  EXPECT_TRUE(repository.Remove(2));
  EXPECT_FALSE(repository.Remove(2));
  EXPECT_THAT(repository.ListIds(), ElementsAre(1, 3));

  repository.Remove(1);
  repository.Remove(3);
  EXPECT_THAT(repository.ListIds(), IsEmpty());
}

}  // namespace
}  // namespace rtb::bidding_engine
