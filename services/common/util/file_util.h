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

#ifndef SERVICES_COMMON_UTIL_FILE_UTIL_H_
#define SERVICES_COMMON_UTIL_FILE_UTIL_H_

#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace rtb::bidding_engine {

// Suffix of the sibling file `ReplaceFileContents` writes before renaming.
inline constexpr char kPendingWriteSuffix[] = ".pending";

// Reads the whole file at `path`. NOT_FOUND if it cannot be opened, INTERNAL
// if reading stops early.
absl::StatusOr<std::string> GetFileContent(absl::string_view path);

// Replaces the file at `path` with `contents`. The data goes to a sibling
// file first, which is then renamed over `path`: readers polling the file
// see either the old or the new contents, never a partial write.
absl::Status ReplaceFileContents(absl::string_view path,
                                 absl::string_view contents);

}  // namespace rtb::bidding_engine

#endif  // SERVICES_COMMON_UTIL_FILE_UTIL_H_
