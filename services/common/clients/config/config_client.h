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

#ifndef SERVICES_COMMON_CLIENTS_CONFIG_CONFIG_CLIENT_H_
#define SERVICES_COMMON_CLIENTS_CONFIG_CONFIG_CLIENT_H_

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "absl/container/btree_map.h"
#include "absl/flags/flag.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "services/common/clients/config/parameter_source.h"

namespace rtb::bidding_engine {

// Sentinel value to be used as the corresponding value for keys in
// config_entries_map_ that need to be fetched.
inline constexpr char kEmptyValue[] = "";
inline constexpr char kTrue[] = "true";
inline constexpr char kFalse[] = "false";

// Config client to hold the values for all config flags, from the command line
// or a parameter source. Values from both sources are coalesced into this
// class; command line values take precedence.
class ConfigClient {
 public:
  // @param all_flags names of every config parameter needed by the service.
  // Each starts out empty until set from a flag or fetched by `Init`.
  explicit ConfigClient(absl::Span<const absl::string_view> all_flags);

  // Fetches `<config_param_prefix><name>` from `parameter_source` for every
  // parameter that is still empty. Parameters missing from both places stay
  // empty and are reported by the typed getters.
  absl::Status Init(absl::string_view config_param_prefix,
                    std::unique_ptr<ParameterSource> parameter_source);

  // Checks if a parameter is known to the config client.
  bool HasParameter(absl::string_view name) const;

  // Checks if a parameter is known and has a non-empty value.
  bool HasValue(absl::string_view name) const;

  // Fetches the string value for the specified config parameter.
  absl::StatusOr<std::string> GetStringParameter(absl::string_view name) const;

  // Fetches the boolean value for the specified config parameter.
  absl::StatusOr<bool> GetBooleanParameter(absl::string_view name) const;

  // Fetches the int value for the specified config parameter.
  absl::StatusOr<int> GetIntParameter(absl::string_view name) const;

  // Fetches the int64 value for the specified config parameter.
  absl::StatusOr<int64_t> GetInt64Parameter(absl::string_view name) const;

  // Fetches the double value for the specified config parameter.
  absl::StatusOr<double> GetDoubleParameter(absl::string_view name) const;

  // Sets `config_entries_map_` if flag is set.
  template <typename T>
  void SetFlag(const absl::Flag<std::optional<T>>& flag,
               absl::string_view config_name) {
    std::optional<T> flag_value = absl::GetFlag(flag);
    if (flag_value) {
      config_entries_map_[config_name] = absl::StrCat(*flag_value);
    }
  }
  void SetFlag(const absl::Flag<std::optional<bool>>& flag,
               absl::string_view config_name) {
    std::optional<bool> flag_value = absl::GetFlag(flag);
    if (flag_value) {
      config_entries_map_[config_name] = *flag_value ? kTrue : kFalse;
    }
  }

  // For overriding flag values, regardless of their value on the command line
  // or in the parameter source. Call this method after Init(), else the value
  // set via this method may be overriden.
  void SetOverride(absl::string_view flag_value, absl::string_view config_name);

  std::string DebugString() const {
    return absl::StrJoin(config_entries_map_, "\n", absl::PairFormatter("="));
  }

 private:
  absl::StatusOr<absl::string_view> GetRaw(absl::string_view name) const;

  std::unique_ptr<ParameterSource> parameter_source_;
  absl::btree_map<std::string, std::string> config_entries_map_;
};

}  // namespace rtb::bidding_engine

#endif  // SERVICES_COMMON_CLIENTS_CONFIG_CONFIG_CLIENT_H_
