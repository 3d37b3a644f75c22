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

#include "services/common/clients/config/config_client.h"

#include <cstdlib>
#include <string>
#include <utility>

#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_format.h"
#include "services/common/loggers/request_log_context.h"

namespace rtb::bidding_engine {
namespace {

constexpr char kParseError[] =
    "Config parameter %s has value '%s' which is not a valid %s";

}  // namespace

absl::StatusOr<std::string> EnvironmentParameterSource::GetParameter(
    absl::string_view name) const {
  const char* value = std::getenv(std::string(name).c_str());
  if (value == nullptr) {
    return absl::NotFoundError(
        absl::StrCat("Environment variable not set: ", name));
  }
  return std::string(value);
}

ConfigClient::ConfigClient(absl::Span<const absl::string_view> all_flags) {
  for (absl::string_view flag_name : all_flags) {
    config_entries_map_.try_emplace(flag_name, kEmptyValue);
  }
}

absl::Status ConfigClient::Init(
    absl::string_view config_param_prefix,
    std::unique_ptr<ParameterSource> parameter_source) {
  if (parameter_source == nullptr) {
    return absl::InvalidArgumentError("Parameter source must not be null");
  }
  parameter_source_ = std::move(parameter_source);

  for (auto& [key, value] : config_entries_map_) {
    if (value != kEmptyValue) {
      continue;
    }
    std::string param_name = absl::StrCat(config_param_prefix, key);
    absl::StatusOr<std::string> param_value =
        parameter_source_->GetParameter(param_name);
    if (param_value.ok()) {
      RTB_VLOG(kNoisyInfo) << "Fetched parameter: " << param_name;
      value = *std::move(param_value);
    } else if (!absl::IsNotFound(param_value.status())) {
      RTB_LOG(ERROR) << "Fetching parameter " << param_name
                     << " failed: " << param_value.status();
      return param_value.status();
    }
  }
  return absl::OkStatus();
}

bool ConfigClient::HasParameter(absl::string_view name) const {
  return config_entries_map_.contains(name);
}

bool ConfigClient::HasValue(absl::string_view name) const {
  auto it = config_entries_map_.find(name);
  return it != config_entries_map_.end() && it->second != kEmptyValue;
}

void ConfigClient::SetOverride(absl::string_view flag_value,
                               absl::string_view config_name) {
  RTB_LOG(INFO) << absl::StrFormat(
      "Overriding flag (flag name: %s, overriden value: %s)", config_name,
      flag_value);
  config_entries_map_[config_name] = std::string(flag_value);
}

absl::StatusOr<absl::string_view> ConfigClient::GetRaw(
    absl::string_view name) const {
  auto it = config_entries_map_.find(name);
  if (it == config_entries_map_.end()) {
    return absl::NotFoundError(absl::StrCat("Flag ", name, " not found"));
  }
  if (it->second == kEmptyValue) {
    return absl::FailedPreconditionError(
        absl::StrCat("Parameter: ", name, " is missing a value."));
  }
  return absl::string_view(it->second);
}

absl::StatusOr<std::string> ConfigClient::GetStringParameter(
    absl::string_view name) const {
  absl::StatusOr<absl::string_view> raw = GetRaw(name);
  if (!raw.ok()) {
    return raw.status();
  }
  return std::string(*raw);
}

absl::StatusOr<bool> ConfigClient::GetBooleanParameter(
    absl::string_view name) const {
  absl::StatusOr<absl::string_view> raw = GetRaw(name);
  if (!raw.ok()) {
    return raw.status();
  }
  std::string lowered = absl::AsciiStrToLower(*raw);
  if (lowered == kTrue) {
    return true;
  }
  if (lowered == kFalse) {
    return false;
  }
  return absl::InvalidArgumentError(
      absl::StrFormat(kParseError, name, *raw, "bool"));
}

absl::StatusOr<int> ConfigClient::GetIntParameter(
    absl::string_view name) const {
  absl::StatusOr<absl::string_view> raw = GetRaw(name);
  if (!raw.ok()) {
    return raw.status();
  }
  int value;
  if (!absl::SimpleAtoi(*raw, &value)) {
    return absl::InvalidArgumentError(
        absl::StrFormat(kParseError, name, *raw, "int"));
  }
  return value;
}

absl::StatusOr<int64_t> ConfigClient::GetInt64Parameter(
    absl::string_view name) const {
  absl::StatusOr<absl::string_view> raw = GetRaw(name);
  if (!raw.ok()) {
    return raw.status();
  }
  int64_t value;
  if (!absl::SimpleAtoi(*raw, &value)) {
    return absl::InvalidArgumentError(
        absl::StrFormat(kParseError, name, *raw, "int64"));
  }
  return value;
}

absl::StatusOr<double> ConfigClient::GetDoubleParameter(
    absl::string_view name) const {
  absl::StatusOr<absl::string_view> raw = GetRaw(name);
  if (!raw.ok()) {
    return raw.status();
  }
  double value;
  if (!absl::SimpleAtod(*raw, &value)) {
    return absl::InvalidArgumentError(
        absl::StrFormat(kParseError, name, *raw, "double"));
  }
  return value;
}

}  // namespace rtb::bidding_engine
