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

#ifndef SERVICES_COMMON_CONCURRENT_EXECUTOR_H_
#define SERVICES_COMMON_CONCURRENT_EXECUTOR_H_

#include "absl/functional/any_invocable.h"
#include "absl/status/status.h"

namespace rtb::bidding_engine {

// Runs closures asynchronously. Implementations decide on which thread and
// when, and may refuse work when saturated.
class Executor {
 public:
  // Polymorphic class => virtual destructor
  virtual ~Executor() = default;

  // Schedules `closure` to run. Returns a non-OK status if the closure was
  // not accepted, in which case it will never run.
  virtual absl::Status Run(absl::AnyInvocable<void() &&> closure) = 0;
};

}  // namespace rtb::bidding_engine

#endif  // SERVICES_COMMON_CONCURRENT_EXECUTOR_H_
