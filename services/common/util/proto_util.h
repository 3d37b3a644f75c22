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

#ifndef SERVICES_COMMON_UTIL_PROTO_UTIL_H_
#define SERVICES_COMMON_UTIL_PROTO_UTIL_H_

#include <string>

#include <google/protobuf/message.h>
#include <google/protobuf/util/json_util.h>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"

namespace rtb::bidding_engine {

// Serializes `proto` to JSON, keeping the proto field names.
inline absl::StatusOr<std::string> ProtoToJson(
    const google::protobuf::Message& proto) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;
  options.always_print_primitive_fields = true;
  std::string json;
  auto status =
      google::protobuf::util::MessageToJsonString(proto, &json, options);
  if (!status.ok()) {
    return absl::InternalError(
        absl::StrCat("Failed to serialize ", proto.GetTypeName(),
                     " to JSON: ", status.ToString()));
  }
  return json;
}

// Parses JSON into `proto`. Unknown fields are rejected.
inline absl::Status JsonToProto(absl::string_view json,
                                google::protobuf::Message* proto) {
  auto status = google::protobuf::util::JsonStringToMessage(
      std::string(json), proto, google::protobuf::util::JsonParseOptions());
  if (!status.ok()) {
    return absl::InvalidArgumentError(
        absl::StrCat("Failed to parse ", proto->GetTypeName(),
                     " from JSON: ", status.ToString()));
  }
  return absl::OkStatus();
}

}  // namespace rtb::bidding_engine

#endif  // SERVICES_COMMON_UTIL_PROTO_UTIL_H_
