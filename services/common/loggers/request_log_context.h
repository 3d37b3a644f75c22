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

#ifndef SERVICES_COMMON_LOGGERS_REQUEST_LOG_CONTEXT_H_
#define SERVICES_COMMON_LOGGERS_REQUEST_LOG_CONTEXT_H_

#include <string>

#include "absl/container/btree_map.h"
#include "absl/log/absl_log.h"
#include "absl/strings/string_view.h"

namespace rtb::bidding_engine {

// log verbosity

inline constexpr int kPlain = 1;  // plaintext request and response served
inline constexpr int kNoisyWarn =
    2;  // non-critical error, use RTB_LOG(ERROR, *) for critical error
inline constexpr int kSuccess = 3;
inline constexpr int kNoisyInfo = 5;
inline constexpr int kStats = 5;  // Stats log e.g. time, counts, etc.
inline constexpr int kOriginated =
    6;  // plaintext request and response originated from server

// Sets the process wide maximum verbosity for `RTB_VLOG`. Messages logged
// with a level above it are dropped.
void SetGlobalRtbVLogLevel(int max_verbosity);

// Similar to absl VLOG_IS_ON.
bool RtbVLogIsOn(int verbose_level);

// Used by `RTB_LOG` and `RTB_VLOG` to tag every line logged for a request
// with the request's identifying context (e.g. request id, user id).
class RequestLogContext {
 public:
  RequestLogContext() = default;
  explicit RequestLogContext(
      const absl::btree_map<std::string, std::string>& context_map);

  // `ContextStr()` will be added to the front of log message.
  absl::string_view ContextStr() const { return context_; }

  void Update(const absl::btree_map<std::string, std::string>& new_context);

 private:
  std::string context_;
};

// Context used for logs that are not tied to a single request.
RequestLogContext& SystemLogContext();

// Utility method to format the context provided as key/value pair into a
// string. Function excludes any empty values from the output string.
std::string FormatContext(
    const absl::btree_map<std::string, std::string>& context_map);

}  // namespace rtb::bidding_engine

#define RTB_LOG_CONTEXT_INTERNAL(severity, request_context)                \
  switch (const ::rtb::bidding_engine::RequestLogContext&                 \
              rtb_logging_internal_context = (request_context);           \
          0)                                                              \
  default:                                                                \
    ABSL_LOG(severity) << rtb_logging_internal_context.ContextStr()

#define RTB_LOG_NO_CONTEXT_INTERNAL(severity) \
  RTB_LOG_CONTEXT_INTERNAL(severity, ::rtb::bidding_engine::SystemLogContext())

#define RTB_VLOG_CONTEXT_INTERNAL(verbose_level, request_context)          \
  switch (const ::rtb::bidding_engine::RequestLogContext&                 \
              rtb_logging_internal_context = (request_context);           \
          0)                                                              \
  default:                                                                \
    ABSL_LOG_IF(INFO, ::rtb::bidding_engine::RtbVLogIsOn(verbose_level))   \
        << rtb_logging_internal_context.ContextStr()

#define RTB_VLOG_NO_CONTEXT_INTERNAL(verbose_level) \
  RTB_VLOG_CONTEXT_INTERNAL(verbose_level,          \
                            ::rtb::bidding_engine::SystemLogContext())

// It can have 1 or 2 arguments. i.e.
// RTB_LOG(severity)
//   Same as ABSL_LOG(severity), tagged with the system context.
// RTB_LOG(severity, request_context)
//   Same as ABSL_LOG(severity), prefixed with `request_context.ContextStr()`.
#define RTB_LOG(...)                                   \
  GET_RTB_LOG(__VA_ARGS__, RTB_LOG_CONTEXT_INTERNAL,   \
              RTB_LOG_NO_CONTEXT_INTERNAL)             \
  (__VA_ARGS__)
#define GET_RTB_LOG(_1, _2, NAME, ...) NAME

// RTB_VLOG(verbose_level) and RTB_VLOG(verbose_level, request_context).
// Logs at INFO only when `verbose_level` is enabled by
// `SetGlobalRtbVLogLevel`.
#define RTB_VLOG(...)                                  \
  GET_RTB_VLOG(__VA_ARGS__, RTB_VLOG_CONTEXT_INTERNAL, \
               RTB_VLOG_NO_CONTEXT_INTERNAL)           \
  (__VA_ARGS__)
#define GET_RTB_VLOG(_1, _2, NAME, ...) NAME

#endif  // SERVICES_COMMON_LOGGERS_REQUEST_LOG_CONTEXT_H_
