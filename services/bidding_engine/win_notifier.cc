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

#include <utility>

#include "services/common/util/proto_util.h"

namespace rtb::bidding_engine {

api::WinNotice BuildWinNotice(const BidRequest& request, const Bid& winning_bid,
                              Money clearing_price,
                              int64_t currency_unit_scale) {
  api::WinNotice notice;
  notice.set_auction_id(request.request_id);
  notice.set_bid_id(winning_bid.bid_id);
  notice.set_winning_price(ToMajorUnits(clearing_price, currency_unit_scale));
  notice.set_impression_id(request.impression_id);
  return notice;
}

void WinNotifier::NotifyWin(const BidRequest& request, const Bid& winning_bid,
                            Money clearing_price,
                            const RequestLogContext& log_context) const {
  if (winning_bid.win_notice_url.empty()) {
    RTB_VLOG(kNoisyInfo, log_context)
        << "No win notice url for campaign " << winning_bid.campaign_id;
    return;
  }
  absl::StatusOr<std::string> body = ProtoToJson(BuildWinNotice(
      request, winning_bid, clearing_price, currency_unit_scale_));
  if (!body.ok()) {
    RTB_LOG(ERROR, log_context) << body.status();
    return;
  }
  HTTPRequest http_request = {.url = winning_bid.win_notice_url,
                              .headers = {kJsonContentTypeHeader},
                              .body = *std::move(body)};
  RTB_VLOG(kOriginated, log_context)
      << "Sending win notice to " << http_request.url << ": "
      << http_request.body;
  reporter_->DoReport(
      http_request,
      [log_context, url = http_request.url](
          absl::StatusOr<absl::string_view> response) {
        if (!response.ok()) {
          RTB_LOG(WARNING, log_context)
              << "Win notice to " << url << " failed: " << response.status();
          return;
        }
        RTB_VLOG(kSuccess, log_context) << "Win notice delivered to " << url;
      });
}

}  // namespace rtb::bidding_engine
