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

#include "services/common/util/file_util.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iterator>
#include <string>

#include "absl/strings/str_cat.h"

namespace rtb::bidding_engine {

absl::StatusOr<std::string> GetFileContent(absl::string_view path) {
  std::ifstream ifs{std::string(path), std::ios::binary};
  if (!ifs.is_open()) {
    return absl::NotFoundError(absl::StrCat("Failed to open file: ", path));
  }
  std::string content{std::istreambuf_iterator<char>(ifs),
                      std::istreambuf_iterator<char>()};
  if (ifs.bad()) {
    return absl::InternalError(absl::StrCat("Failed to read file: ", path));
  }
  return content;
}

absl::Status ReplaceFileContents(absl::string_view path,
                                 absl::string_view contents) {
  const std::string pending_path = absl::StrCat(path, kPendingWriteSuffix);
  {
    std::ofstream ofs{pending_path, std::ios::binary | std::ios::trunc};
    if (!ofs.is_open()) {
      return absl::InvalidArgumentError(
          absl::StrCat("Failed to create file: ", pending_path));
    }
    ofs.write(contents.data(), contents.size());
    ofs.close();
    if (ofs.fail()) {
      std::remove(pending_path.c_str());
      return absl::InternalError(
          absl::StrCat("Failed to write file: ", pending_path));
    }
  }
  if (std::rename(pending_path.c_str(), std::string(path).c_str()) != 0) {
    const int rename_errno = errno;
    std::remove(pending_path.c_str());
    return absl::InternalError(absl::StrCat("Failed to move ", pending_path,
                                            " to ", path, ": ",
                                            std::strerror(rename_errno)));
  }
  return absl::OkStatus();
}

}  // namespace rtb::bidding_engine
