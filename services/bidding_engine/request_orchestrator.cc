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

#include "services/bidding_engine/request_orchestrator.h"

#include <algorithm>
#include <string>
#include <utility>

#include "absl/base/thread_annotations.h"
#include "absl/strings/str_cat.h"
#include "absl/synchronization/mutex.h"
#include "absl/synchronization/notification.h"
#include "absl/time/clock.h"
#include "services/bidding_engine/creative_selector.h"
#include "services/common/util/async_task_tracker.h"

namespace rtb::bidding_engine {
namespace {

std::string AdKey(CampaignId campaign_id) { return absl::StrCat(campaign_id); }

// Eligibility independent of frequency: active, in flight, age group
// targeted, budget left and something to show.
bool IsEligible(const Campaign& campaign, const BidRequest& request,
                const BudgetLedger& ledger,
                const RequestLogContext& log_context) {
  if (!campaign.active) {
    return false;
  }
  if (request.timestamp < campaign.start_time ||
      request.timestamp > campaign.end_time) {
    return false;
  }
  if (!campaign.target_age_groups.empty() &&
      !campaign.target_age_groups.contains(request.age_group)) {
    return false;
  }
  if (campaign.creatives.empty()) {
    return false;
  }
  absl::StatusOr<Money> remaining = ledger.Remaining(campaign.campaign_id);
  if (!remaining.ok()) {
    RTB_VLOG(kNoisyWarn, log_context) << remaining.status();
    return false;
  }
  return *remaining > 0;
}

}  // namespace

// Bids collected from external sources for one request. Shared with the
// source callbacks, which may outlive the request.
struct RequestOrchestrator::ExternalBids {
  absl::Mutex mu;
  // Set once the orchestrator stopped waiting. Later bids are discarded.
  bool closed ABSL_GUARDED_BY(mu) = false;
  std::vector<Bid> bids ABSL_GUARDED_BY(mu);
  absl::Notification all_done;
  std::unique_ptr<AsyncTaskTracker> tracker;
};

RequestOrchestrator::RequestOrchestrator(OrchestratorDependencies dependencies,
                                         RequestOrchestratorOptions options)
    : dependencies_(std::move(dependencies)),
      options_(std::move(options)),
      scorer_(options_.scoring),
      auction_engine_(dependencies_.ledger, dependencies_.frequency_caps,
                      options_.auction) {}

std::optional<FrequencyCap> RequestOrchestrator::EffectiveFrequencyCap(
    const Campaign& campaign) const {
  if (campaign.frequency_cap.has_value()) {
    return campaign.frequency_cap;
  }
  return options_.default_frequency_cap;
}

std::vector<std::shared_ptr<const Campaign>>
RequestOrchestrator::CollectCandidates(
    const BidRequest& request, DropCounters& drops,
    const RequestLogContext& log_context) const {
  absl::flat_hash_set<CampaignId> campaign_ids =
      dependencies_.index->Query(request.geo, request.interests);
  RTB_VLOG(kStats, log_context)
      << "Index returned " << campaign_ids.size() << " campaigns";

  std::vector<std::shared_ptr<const Campaign>> candidates;
  candidates.reserve(campaign_ids.size());
  for (CampaignId campaign_id : campaign_ids) {
    std::shared_ptr<const Campaign> campaign =
        dependencies_.repository->Get(campaign_id);
    if (campaign == nullptr ||
        !IsEligible(*campaign, request, *dependencies_.ledger, log_context)) {
      ++drops.ineligible;
      continue;
    }
    std::optional<FrequencyCap> cap = EffectiveFrequencyCap(*campaign);
    if (cap.has_value()) {
      // Show-once campaigns are checked against the cheap filter first.
      if (cap->cap == 1 && dependencies_.duplicate_filter->MightHaveShown(
                               request.user_id, AdKey(campaign_id))) {
        ++drops.duplicate_suppressed;
        continue;
      }
      if (dependencies_.frequency_caps->IsCapped(request.user_id, campaign_id,
                                                 cap->cap, cap->window,
                                                 request.timestamp)) {
        ++drops.frequency_capped;
        continue;
      }
    }
    candidates.push_back(std::move(campaign));
  }
  return candidates;
}

std::vector<Bid> RequestOrchestrator::ScoreCandidates(
    const BidRequest& request,
    const std::vector<std::shared_ptr<const Campaign>>& candidates,
    DropCounters& drops, const RequestLogContext& log_context) const {
  std::vector<Bid> bids;
  bids.reserve(candidates.size());
  for (const auto& campaign : candidates) {
    std::optional<double> predicted_value;
    if (dependencies_.value_predictor != nullptr) {
      absl::StatusOr<double> prediction =
          dependencies_.value_predictor->Predict(request, *campaign);
      if (!prediction.ok()) {
        RTB_VLOG(kNoisyWarn, log_context)
            << "Prediction failed for campaign " << campaign->campaign_id
            << ": " << prediction.status();
        ++drops.scoring_error;
        continue;
      }
      predicted_value = *prediction;
    }
    absl::StatusOr<double> score =
        scorer_.Score(request, *campaign, predicted_value);
    if (!score.ok()) {
      RTB_VLOG(kNoisyWarn, log_context) << score.status();
      ++drops.scoring_error;
      continue;
    }
    if (*score <= 0) {
      ++drops.ineligible;
      continue;
    }
    const Creative* creative =
        SelectCreative(request.request_id, campaign->creatives);
    Bid bid;
    bid.bid_id = absl::StrCat(request.request_id, "-", campaign->campaign_id);
    bid.campaign_id = campaign->campaign_id;
    bid.price = campaign->bid_price;
    bid.bid_type = campaign->bid_type;
    bid.timestamp = request.timestamp;
    bid.score = *score;
    bid.origin = BidOrigin::kInternal;
    bid.creative_id = creative->creative_id;
    bid.adm = creative->adm;
    bid.w = creative->w;
    bid.h = creative->h;
    bid.seat = campaign->seat;
    bid.win_notice_url = campaign->win_notice_url;
    bid.frequency_cap = EffectiveFrequencyCap(*campaign);
    bids.push_back(std::move(bid));
  }
  return bids;
}

std::shared_ptr<RequestOrchestrator::ExternalBids>
RequestOrchestrator::SolicitExternalBids(
    const BidRequest& request, absl::Duration timeout,
    const RequestLogContext& log_context) const {
  if (dependencies_.bid_sources.empty()) {
    return nullptr;
  }
  auto external_bids = std::make_shared<ExternalBids>();
  // The tracker is owned by `external_bids`, so it must not hold a strong
  // reference back.
  ExternalBids* raw_external_bids = external_bids.get();
  external_bids->tracker = std::make_unique<AsyncTaskTracker>(
      dependencies_.bid_sources.size(), log_context,
      [raw_external_bids](bool any_successful) {
        raw_external_bids->all_done.Notify();
      });

  for (BidSource* source : dependencies_.bid_sources) {
    source->RequestBids(
        request, timeout,
        [external_bids, log_context, source_name = std::string(source->name())](
            absl::StatusOr<std::vector<Bid>> result) mutable {
          TaskStatus status = TaskStatus::SUCCESS;
          if (!result.ok()) {
            RTB_VLOG(kNoisyWarn, log_context)
                << "Bid source " << source_name
                << " failed: " << result.status();
            status = TaskStatus::ERROR;
          } else if (result->empty()) {
            status = TaskStatus::EMPTY_RESPONSE;
          }
          external_bids->tracker->TaskCompleted(
              status, [&external_bids, &result, &log_context, &source_name]() {
                if (!result.ok()) {
                  return;
                }
                absl::MutexLock lock(&external_bids->mu);
                if (external_bids->closed) {
                  RTB_VLOG(kNoisyInfo, log_context)
                      << "Discarding " << result->size()
                      << " late bids from " << source_name;
                  return;
                }
                for (Bid& bid : *result) {
                  bid.origin = BidOrigin::kExternal;
                  if (bid.bid_id.empty()) {
                    bid.bid_id = absl::StrCat(source_name, "-",
                                              external_bids->bids.size());
                  }
                  external_bids->bids.push_back(std::move(bid));
                }
              });
        });
  }
  return external_bids;
}

std::vector<Bid> RequestOrchestrator::AwaitExternalBids(
    ExternalBids& external_bids, absl::Duration timeout, bool& timed_out,
    const RequestLogContext& log_context) const {
  timed_out = !external_bids.all_done.WaitForNotificationWithTimeout(timeout);
  if (timed_out) {
    RTB_VLOG(kNoisyWarn, log_context)
        << external_bids.tracker->PendingTasks()
        << " bid sources missed the deadline";
  }
  absl::MutexLock lock(&external_bids.mu);
  external_bids.closed = true;
  return std::move(external_bids.bids);
}

AuctionResult RequestOrchestrator::Process(const BidRequest& request,
                                           absl::Time deadline) const {
  RequestLogContext log_context(
      {{"request_id", request.request_id}, {"user_id", request.user_id}});
  DropCounters drops;

  std::vector<std::shared_ptr<const Campaign>> candidates =
      CollectCandidates(request, drops, log_context);

  const absl::Duration source_timeout = std::max(
      std::min(options_.bid_source_timeout, deadline - absl::Now()),
      absl::ZeroDuration());
  const absl::Time wait_until = absl::Now() + source_timeout;
  std::shared_ptr<ExternalBids> external_bids =
      SolicitExternalBids(request, source_timeout, log_context);

  std::vector<Bid> bids =
      ScoreCandidates(request, candidates, drops, log_context);

  bool sources_timed_out = false;
  if (external_bids != nullptr) {
    // Internal scoring already used part of the budget.
    const absl::Duration remaining =
        std::max(wait_until - absl::Now(), absl::ZeroDuration());
    std::vector<Bid> received = AwaitExternalBids(
        *external_bids, remaining, sources_timed_out, log_context);
    for (Bid& bid : received) {
      absl::StatusOr<double> score = scorer_.ScoreExternalBid(bid.price);
      if (!score.ok()) {
        RTB_VLOG(kNoisyWarn, log_context) << score.status();
        ++drops.scoring_error;
        continue;
      }
      bid.score = *score;
      bids.push_back(std::move(bid));
    }
  }

  // Ranking.
  std::sort(bids.begin(), bids.end(), [](const Bid& a, const Bid& b) {
    if (a.score != b.score) return a.score > b.score;
    return a.campaign_id < b.campaign_id;
  });
  if (static_cast<int>(bids.size()) > options_.max_candidates_per_auction) {
    bids.resize(std::max(options_.max_candidates_per_auction, 0));
  }

  AuctionResult result =
      auction_engine_.RunAuction(request, std::move(bids), log_context);
  result.drops.frequency_capped += drops.frequency_capped;
  result.drops.duplicate_suppressed += drops.duplicate_suppressed;
  result.drops.ineligible += drops.ineligible;
  result.drops.scoring_error += drops.scoring_error;

  if (result.status == AuctionStatus::kWon) {
    const Bid& winning_bid = *result.winning_bid;
    if (winning_bid.origin == BidOrigin::kInternal) {
      dependencies_.duplicate_filter->RecordShown(
          request.user_id, AdKey(winning_bid.campaign_id));
    }
    if (dependencies_.win_notifier != nullptr) {
      dependencies_.win_notifier->NotifyWin(
          request, winning_bid, result.clearing_price, log_context);
    }
  } else if (sources_timed_out) {
    result.status = AuctionStatus::kTimeout;
  }
  RTB_VLOG(kStats, log_context)
      << "Auction finished: " << AuctionStatusName(result.status)
      << ", candidates " << result.candidates_considered << ", dropped ("
      << "capped " << result.drops.frequency_capped << ", suppressed "
      << result.drops.duplicate_suppressed << ", ineligible "
      << result.drops.ineligible << ", scoring errors "
      << result.drops.scoring_error << ", below floor "
      << result.drops.below_floor << ", budget "
      << result.drops.budget_exhausted << ")";
  return result;
}

}  // namespace rtb::bidding_engine
