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

#ifndef SERVICES_BIDDING_ENGINE_DUPLICATE_SUPPRESSION_FILTER_H_
#define SERVICES_BIDDING_ENGINE_DUPLICATE_SUPPRESSION_FILTER_H_

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_map.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"

namespace rtb::bidding_engine {

struct DuplicateSuppressionFilterOptions {
  // Expected number of distinct ads recorded per user between resets.
  int expected_items_per_user = 64;
  // Target false positive rate at that load, in (0, 1).
  double false_positive_rate = 0.01;
};

// Per user Bloom filter answering "might this ad have been shown to this
// user already". No false negatives; false positives at the configured rate.
// Bits are only ever set, with atomic OR, so recording does not block
// readers. `Reset` drops everything.
class DuplicateSuppressionFilter {
 public:
  static absl::StatusOr<std::unique_ptr<DuplicateSuppressionFilter>> Create(
      DuplicateSuppressionFilterOptions options);

  // DuplicateSuppressionFilter is neither copyable nor movable.
  DuplicateSuppressionFilter(const DuplicateSuppressionFilter&) = delete;
  DuplicateSuppressionFilter& operator=(const DuplicateSuppressionFilter&) =
      delete;

  bool MightHaveShown(absl::string_view user_id, absl::string_view ad_key) const
      ABSL_LOCKS_EXCLUDED(mu_);

  void RecordShown(absl::string_view user_id, absl::string_view ad_key)
      ABSL_LOCKS_EXCLUDED(mu_);

  // Forgets all users. Meant for the periodic rotation.
  void Reset() ABSL_LOCKS_EXCLUDED(mu_);

  // m = ceil(-n * ln(p) / ln(2)^2).
  static size_t OptimalNumBits(int expected_items, double false_positive_rate);
  // k = max(1, round(m / n * ln(2))).
  static int OptimalNumHashes(size_t num_bits, int expected_items);

  size_t num_bits() const { return num_bits_; }
  int num_hashes() const { return num_hashes_; }

 private:
  DuplicateSuppressionFilter(size_t num_bits, int num_hashes);

  struct UserBits {
    explicit UserBits(size_t num_words);
    std::unique_ptr<std::atomic<uint64_t>[]> words;
  };

  // Calls `fn(word_index, mask)` for each of the k bit positions of the key.
  template <typename Fn>
  void ForEachBit(absl::string_view user_id, absl::string_view ad_key,
                  Fn fn) const;

  const size_t num_bits_;
  const size_t num_words_;
  const int num_hashes_;
  mutable absl::Mutex mu_;
  absl::flat_hash_map<std::string, std::unique_ptr<UserBits>> users_
      ABSL_GUARDED_BY(mu_);
};

}  // namespace rtb::bidding_engine

#endif  // SERVICES_BIDDING_ENGINE_DUPLICATE_SUPPRESSION_FILTER_H_
