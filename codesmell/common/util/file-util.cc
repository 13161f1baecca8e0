// Copyright 2026 The Codesmell Authors.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "codesmell/common/util/file-util.h"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "codesmell/common/util/logging.h"
#include "codesmell/common/util/status-macros.h"

namespace fs = std::filesystem;

namespace codesmell {
namespace file {

// Create an error message derived from errno. The message includes the
// filename as prefix.
static absl::Status CreateErrorStatusFromErrno(std::string_view filename,
                                               std::string_view fallback_msg) {
  const int sys_error = errno;
  const std::string message =
      absl::StrCat(filename, ": ", sys_error ? strerror(sys_error) : "",
                   sys_error ? " " : "", fallback_msg);
  switch (sys_error) {
    case EPERM:
    case EACCES:
      return absl::PermissionDeniedError(message);
    case ENOENT:
      return absl::NotFoundError(message);
    case EEXIST:
      return absl::AlreadyExistsError(message);
    case EINVAL:
      return absl::InvalidArgumentError(message);
    default:
      return absl::UnknownError(message);
  }
}

absl::Status FileExists(const std::string &filename) {
  std::error_code err;
  const fs::file_status stat = fs::status(filename, err);

  if (err.value() != 0) {
    return absl::NotFoundError(absl::StrCat(filename, ": ", err.message()));
  }

  if (fs::is_regular_file(stat) || fs::is_fifo(stat)) {
    return absl::OkStatus();
  }

  if (fs::is_directory(stat)) {
    return absl::InvalidArgumentError(
        absl::StrCat(filename, ": is a directory, not a file"));
  }
  return absl::InvalidArgumentError(
      absl::StrCat(filename, ": not a regular file."));
}

absl::StatusOr<std::string> GetContentAsString(std::string_view filename) {
  const std::string filename_str(filename);
  RETURN_IF_ERROR(FileExists(filename_str));

  FILE *stream = fopen(filename_str.c_str(), "rb");
  if (!stream) {
    return CreateErrorStatusFromErrno(filename, "can't read");
  }
  std::string content;
  std::error_code err;
  const auto prealloc = fs::file_size(filename_str, err);
  if (err.value() == 0) content.reserve(prealloc);

  char buffer[4096];
  size_t bytes_read;
  do {
    bytes_read = fread(buffer, 1, sizeof(buffer), stream);
    content.append(buffer, bytes_read);
  } while (bytes_read > 0);
  const bool read_error = ferror(stream) != 0;
  fclose(stream);
  if (read_error) {
    return CreateErrorStatusFromErrno(filename, "read error");
  }
  return content;
}

absl::Status SetContents(std::string_view filename, std::string_view content) {
  VLOG(1) << __FUNCTION__ << ": Writing file: " << filename;
  FILE *out = fopen(std::string(filename).c_str(), "wb");
  if (!out) return CreateErrorStatusFromErrno(filename, "can't write.");
  const size_t expected_write = content.size();
  size_t total_written = 0;
  while (!content.empty()) {
    const size_t w = fwrite(content.data(), 1, content.size(), out);
    if (w == 0) break;
    total_written += w;
    content.remove_prefix(w);
  }
  const bool written_completely = (total_written == expected_write);
  if (fclose(out) != 0 || !written_completely) {
    return CreateErrorStatusFromErrno(filename, "closing.");
  }
  return absl::OkStatus();
}

absl::Status ReplaceContents(std::string_view filename,
                             std::string_view content) {
  const std::string target(filename);
  const std::string temporary = absl::StrCat(target, ".tmp");
  RETURN_IF_ERROR(SetContents(temporary, content));
  std::error_code err;
  fs::rename(temporary, target, err);
  if (err.value() != 0) {
    fs::remove(temporary, err);  // best effort, the rename error wins.
    return absl::UnknownError(
        absl::StrCat(target, ": can't replace: ", err.message()));
  }
  return absl::OkStatus();
}

std::string JoinPath(std::string_view base, std::string_view name) {
  fs::path p = fs::path(std::string(base)) / fs::path(std::string(name));
  return p.lexically_normal().string();
}

namespace testing {

ScopedTestFile::ScopedTestFile(std::string_view base_dir,
                               std::string_view content,
                               std::string_view use_this_filename)
    // There is no secrecy needed for test files,
    // file name just need to be unique enough.
    : filename_(JoinPath(base_dir,
                         use_this_filename.empty()
                             ? absl::StrCat("scoped-file-", rand())
                             : std::string(use_this_filename))) {
  const absl::Status status = SetContents(filename_, content);
  CHECK(status.ok()) << status.message();  // ok for test-only code
}

ScopedTestFile::~ScopedTestFile() {
  std::error_code err;
  fs::remove(filename_, err);
}

}  // namespace testing
}  // namespace file
}  // namespace codesmell
