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

#include "services/bidding_engine/duplicate_suppression_filter.h"

#include <algorithm>
#include <cmath>
#include <utility>

#include "absl/memory/memory.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "services/common/loggers/request_log_context.h"
#include "services/common/util/hash_util.h"

namespace rtb::bidding_engine {
namespace {

constexpr char kKeySeparator = '\x1f';

}  // namespace

absl::StatusOr<std::unique_ptr<DuplicateSuppressionFilter>>
DuplicateSuppressionFilter::Create(DuplicateSuppressionFilterOptions options) {
  if (options.expected_items_per_user < 1) {
    return absl::InvalidArgumentError(
        absl::StrCat("Expected items per user must be positive, got ",
                     options.expected_items_per_user));
  }
  if (!(options.false_positive_rate > 0 && options.false_positive_rate < 1)) {
    return absl::InvalidArgumentError(
        absl::StrFormat("False positive rate must be in (0, 1), got %f",
                        options.false_positive_rate));
  }
  size_t num_bits = OptimalNumBits(options.expected_items_per_user,
                                   options.false_positive_rate);
  int num_hashes = OptimalNumHashes(num_bits, options.expected_items_per_user);
  RTB_LOG(INFO) << "Duplicate suppression filter: " << num_bits
                << " bits and " << num_hashes << " hashes per user";
  return absl::WrapUnique(new DuplicateSuppressionFilter(num_bits, num_hashes));
}

size_t DuplicateSuppressionFilter::OptimalNumBits(int expected_items,
                                                  double false_positive_rate) {
  const double ln2 = std::log(2.0);
  double bits = -static_cast<double>(expected_items) *
                std::log(false_positive_rate) / (ln2 * ln2);
  return std::max<size_t>(1, static_cast<size_t>(std::ceil(bits)));
}

int DuplicateSuppressionFilter::OptimalNumHashes(size_t num_bits,
                                                 int expected_items) {
  double hashes = static_cast<double>(num_bits) /
                  static_cast<double>(expected_items) * std::log(2.0);
  return std::max(1, static_cast<int>(std::lround(hashes)));
}

DuplicateSuppressionFilter::DuplicateSuppressionFilter(size_t num_bits,
                                                       int num_hashes)
    : num_bits_(num_bits),
      num_words_((num_bits + 63) / 64),
      num_hashes_(num_hashes) {}

DuplicateSuppressionFilter::UserBits::UserBits(size_t num_words)
    : words(std::make_unique<std::atomic<uint64_t>[]>(num_words)) {
  for (size_t i = 0; i < num_words; ++i) {
    words[i].store(0, std::memory_order_relaxed);
  }
}

template <typename Fn>
void DuplicateSuppressionFilter::ForEachBit(absl::string_view user_id,
                                            absl::string_view ad_key,
                                            Fn fn) const {
  auto [h1, h2] =
      StableHashPair(absl::StrCat(user_id, std::string(1, kKeySeparator),
                                  ad_key));
  // Step must be non-zero.
  h2 |= 1;
  for (int i = 0; i < num_hashes_; ++i) {
    uint64_t bit = (h1 + static_cast<uint64_t>(i) * h2) % num_bits_;
    if (!fn(bit / 64, uint64_t{1} << (bit % 64))) {
      return;
    }
  }
}

bool DuplicateSuppressionFilter::MightHaveShown(
    absl::string_view user_id, absl::string_view ad_key) const {
  absl::ReaderMutexLock lock(&mu_);
  auto it = users_.find(user_id);
  if (it == users_.end()) {
    return false;
  }
  const UserBits& bits = *it->second;
  bool all_set = true;
  ForEachBit(user_id, ad_key, [&bits, &all_set](size_t word, uint64_t mask) {
    all_set = (bits.words[word].load(std::memory_order_relaxed) & mask) != 0;
    return all_set;
  });
  return all_set;
}

void DuplicateSuppressionFilter::RecordShown(absl::string_view user_id,
                                             absl::string_view ad_key) {
  {
    absl::ReaderMutexLock lock(&mu_);
    auto it = users_.find(user_id);
    if (it != users_.end()) {
      UserBits& bits = *it->second;
      ForEachBit(user_id, ad_key, [&bits](size_t word, uint64_t mask) {
        bits.words[word].fetch_or(mask, std::memory_order_relaxed);
        return true;
      });
      return;
    }
  }
  absl::MutexLock lock(&mu_);
  auto [it, inserted] = users_.try_emplace(std::string(user_id), nullptr);
  if (inserted) {
    it->second = std::make_unique<UserBits>(num_words_);
  }
  UserBits& bits = *it->second;
  ForEachBit(user_id, ad_key, [&bits](size_t word, uint64_t mask) {
    bits.words[word].fetch_or(mask, std::memory_order_relaxed);
    return true;
  });
}

void DuplicateSuppressionFilter::Reset() {
  absl::MutexLock lock(&mu_);
  RTB_VLOG(kNoisyInfo) << "Resetting duplicate suppression filter for "
                       << users_.size() << " users";
  users_.clear();
}

}  // namespace rtb::bidding_engine
