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

#ifndef SERVICES_COMMON_CLIENTS_CONFIG_PARAMETER_SOURCE_H_
#define SERVICES_COMMON_CLIENTS_CONFIG_PARAMETER_SOURCE_H_

#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace rtb::bidding_engine {

// A store of named configuration parameters consulted at start-up for values
// that were not given on the command line.
class ParameterSource {
 public:
  virtual ~ParameterSource() = default;

  // Returns the value of `name`, or NOT_FOUND.
  virtual absl::StatusOr<std::string> GetParameter(
      absl::string_view name) const = 0;
};

// Reads parameters from the process environment.
class EnvironmentParameterSource : public ParameterSource {
 public:
  absl::StatusOr<std::string> GetParameter(
      absl::string_view name) const override;
};

}  // namespace rtb::bidding_engine

#endif  // SERVICES_COMMON_CLIENTS_CONFIG_PARAMETER_SOURCE_H_
