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

#ifndef SERVICES_BIDDING_ENGINE_REQUEST_ORCHESTRATOR_H_
#define SERVICES_BIDDING_ENGINE_REQUEST_ORCHESTRATOR_H_

#include <memory>
#include <optional>
#include <vector>

#include "absl/time/time.h"
#include "services/bidding_engine/auction_engine.h"
#include "services/bidding_engine/bid_scorer.h"
#include "services/bidding_engine/bid_source.h"
#include "services/bidding_engine/budget_ledger.h"
#include "services/bidding_engine/campaign_index.h"
#include "services/bidding_engine/campaign_repository.h"
#include "services/bidding_engine/data/auction_result.h"
#include "services/bidding_engine/data/bid.h"
#include "services/bidding_engine/data/bid_request.h"
#include "services/bidding_engine/duplicate_suppression_filter.h"
#include "services/bidding_engine/frequency_cap_tracker.h"
#include "services/bidding_engine/value_predictor.h"
#include "services/bidding_engine/win_notifier.h"
#include "services/common/loggers/request_log_context.h"

namespace rtb::bidding_engine {

inline constexpr absl::Duration kDefaultBidSourceTimeout =
    absl::Milliseconds(100);
inline constexpr int kDefaultMaxCandidatesPerAuction = 64;

struct RequestOrchestratorOptions {
  // Upper bound on the wait for external bid sources. The request deadline
  // may cut it shorter.
  absl::Duration bid_source_timeout = kDefaultBidSourceTimeout;
  // Highest scoring candidates forwarded to the auction. The cut is by score,
  // so a candidate with a higher price but a lower score may be left out
  // before the auction ranks by price.
  int max_candidates_per_auction = kDefaultMaxCandidatesPerAuction;
  // Cap for campaigns that do not define their own. Unset means uncapped.
  std::optional<FrequencyCap> default_frequency_cap;
  ScoringOptions scoring;
  AuctionOptions auction;
};

// Collaborators of the orchestrator. Pointers are not owned and must outlive
// it. `value_predictor` and `win_notifier` are optional.
struct OrchestratorDependencies {
  const CampaignRepository* repository = nullptr;
  const CampaignIndex* index = nullptr;
  FrequencyCapTracker* frequency_caps = nullptr;
  DuplicateSuppressionFilter* duplicate_filter = nullptr;
  BudgetLedger* ledger = nullptr;
  std::vector<BidSource*> bid_sources;
  const ValuePredictor* value_predictor = nullptr;
  const WinNotifier* win_notifier = nullptr;
};

// Runs one auction per validated request:
//
//   index lookup -> eligibility, show-once and frequency cap pruning
//   -> external bid solicitation (in parallel with internal scoring)
//   -> ranking -> auction and commit -> win bookkeeping
//
// Runs synchronously on the calling thread. The only blocking step is the
// wait for external bid sources, bounded by min(bid_source_timeout,
// deadline - now); sources that miss it are ignored and their late answers
// discarded. A failure while scoring one candidate only drops that
// candidate.
class RequestOrchestrator {
 public:
  RequestOrchestrator(OrchestratorDependencies dependencies,
                      RequestOrchestratorOptions options = {});

  // RequestOrchestrator is neither copyable nor movable.
  RequestOrchestrator(const RequestOrchestrator&) = delete;
  RequestOrchestrator& operator=(const RequestOrchestrator&) = delete;

  AuctionResult Process(const BidRequest& request, absl::Time deadline) const;

  const RequestOrchestratorOptions& options() const { return options_; }

 private:
  struct ExternalBids;

  // Index lookup and pruning. Returns the campaigns that may bid.
  std::vector<std::shared_ptr<const Campaign>> CollectCandidates(
      const BidRequest& request, DropCounters& drops,
      const RequestLogContext& log_context) const;

  std::vector<Bid> ScoreCandidates(
      const BidRequest& request,
      const std::vector<std::shared_ptr<const Campaign>>& candidates,
      DropCounters& drops, const RequestLogContext& log_context) const;

  // Returns nullptr if there are no bid sources.
  std::shared_ptr<ExternalBids> SolicitExternalBids(
      const BidRequest& request, absl::Duration timeout,
      const RequestLogContext& log_context) const;

  // Waits for the solicited sources and closes the collection. Sets
  // `timed_out` if any source missed the wait.
  std::vector<Bid> AwaitExternalBids(ExternalBids& external_bids,
                                     absl::Duration timeout, bool& timed_out,
                                     const RequestLogContext& log_context) const;

  std::optional<FrequencyCap> EffectiveFrequencyCap(
      const Campaign& campaign) const;

  const OrchestratorDependencies dependencies_;
  const RequestOrchestratorOptions options_;
  const BidScorer scorer_;
  const AuctionEngine auction_engine_;
};

}  // namespace rtb::bidding_engine

#endif  // SERVICES_BIDDING_ENGINE_REQUEST_ORCHESTRATOR_H_
