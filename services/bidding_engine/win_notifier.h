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

#ifndef SERVICES_BIDDING_ENGINE_WIN_NOTIFIER_H_
#define SERVICES_BIDDING_ENGINE_WIN_NOTIFIER_H_

#include <cstdint>
#include <string>

#include "absl/status/statusor.h"
#include "api/rtb_engine.pb.h"
#include "services/bidding_engine/data/bid.h"
#include "services/bidding_engine/data/bid_request.h"
#include "services/bidding_engine/data/money.h"
#include "services/common/loggers/request_log_context.h"
#include "services/common/reporters/async_reporter.h"

namespace rtb::bidding_engine {

inline constexpr char kJsonContentTypeHeader[] =
    "Content-Type: application/json";

api::WinNotice BuildWinNotice(const BidRequest& request, const Bid& winning_bid,
                              Money clearing_price,
                              int64_t currency_unit_scale);

// Tells the winning campaign's owner about a committed win by POSTing a JSON
// WinNotice to its win notice url. Fire and forget: the outcome is only
// logged, and nothing is retried.
class WinNotifier {
 public:
  // `reporter` must outlive this object.
  WinNotifier(const AsyncReporter* reporter, int64_t currency_unit_scale)
      : reporter_(reporter), currency_unit_scale_(currency_unit_scale) {}

  void NotifyWin(const BidRequest& request, const Bid& winning_bid,
                 Money clearing_price,
                 const RequestLogContext& log_context) const;

 private:
  const AsyncReporter* reporter_;
  const int64_t currency_unit_scale_;
};

}  // namespace rtb::bidding_engine

#endif  // SERVICES_BIDDING_ENGINE_WIN_NOTIFIER_H_
