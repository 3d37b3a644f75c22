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

// Helper macros to return and propagate errors with `absl::Status`.

#ifndef SERVICES_COMMON_UTIL_STATUS_MACROS_H_
#define SERVICES_COMMON_UTIL_STATUS_MACROS_H_

#include <utility>

#include "absl/base/optimization.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"

// Evaluates an expression that produces a `absl::Status`. If the
// status is not ok, returns it from the current function.
//
// For example:
//   absl::Status MultiStepFunction() {
//     RTB_RETURN_IF_ERROR(Function(args...));
//     RTB_RETURN_IF_ERROR(foo.Method(args...));
//     return absl::OkStatus();
//   }
//
// If using this macro inside a lambda, annotate the return type of the
// lambda as `absl::Status`.
#define RTB_RETURN_IF_ERROR(expr)                                    \
  do {                                                               \
    const absl::Status rtb_status_macro_internal_status = (expr);    \
    if (ABSL_PREDICT_FALSE(!rtb_status_macro_internal_status.ok())) { \
      return rtb_status_macro_internal_status;                       \
    }                                                                \
  } while (0)

// Executes an expression `rexpr` that returns a `absl::StatusOr<T>`. On OK,
// extracts its value into the variable defined by `lhs`, otherwise returns
// the error status from the current function. If there is an error, `lhs` is
// not evaluated.
//
// WARNING: expands into multiple statements; it cannot be used in a single
// statement (e.g. as the body of an if statement without {})!
//
// Example:
//   RTB_ASSIGN_OR_RETURN(BidRequest request, validator.Validate(wire));
#define RTB_ASSIGN_OR_RETURN(lhs, rexpr)                                    \
  RTB_STATUS_MACROS_IMPL_ASSIGN_OR_RETURN_(                                 \
      RTB_STATUS_MACROS_IMPL_CONCAT_(_status_or_value, __LINE__), lhs, rexpr)

// =================================================================
// == Implementation details, do not rely on anything below here. ==
// =================================================================
#define RTB_STATUS_MACROS_IMPL_ASSIGN_OR_RETURN_(statusor, lhs, rexpr) \
  auto statusor = (rexpr);                                             \
  if (ABSL_PREDICT_FALSE(!statusor.ok())) {                            \
    return std::move(statusor).status();                               \
  }                                                                    \
  lhs = std::move(statusor).value()

#define RTB_STATUS_MACROS_IMPL_CONCAT_INNER_(x, y) x##y
#define RTB_STATUS_MACROS_IMPL_CONCAT_(x, y) \
  RTB_STATUS_MACROS_IMPL_CONCAT_INNER_(x, y)

#endif  // SERVICES_COMMON_UTIL_STATUS_MACROS_H_
