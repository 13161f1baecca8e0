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

// -*- c++ -*-
// Some filesystem utilities.
#ifndef CODESMELL_COMMON_UTIL_FILE_UTIL_H_
#define CODESMELL_COMMON_UTIL_FILE_UTIL_H_

#include <string>
#include <string_view>

#include "absl/status/status.h"
#include "absl/status/statusor.h"

namespace codesmell {
namespace file {

// Determines whether the given filename exists and is a regular file or pipe.
// Returns a NotFound status if it doesn't.
absl::Status FileExists(const std::string &filename);

// Read file "filename" and return its content as string.
absl::StatusOr<std::string> GetContentAsString(std::string_view filename);

// Create file "filename" and store given content in it.
absl::Status SetContents(std::string_view filename, std::string_view content);

// Like SetContents(), but writes to a sibling temporary file first and renames
// it over "filename", so that readers never observe a partially written file.
absl::Status ReplaceContents(std::string_view filename,
                             std::string_view content);

// Join directory + filename and lightly canonicalize.
std::string JoinPath(std::string_view base, std::string_view name);

namespace testing {

// Useful for testing: a temporary file with a randomly generated name
// that is pre-populated with a particular content.
// File is deleted when instance goes out of scope.
class ScopedTestFile {
 public:
  // Write a new file in directory 'base_dir' with given 'content'.
  // 'base_dir' needs to already exist, and will not be automatically created.
  // If 'use_this_filename' is provided as a base name, that will be used,
  // otherwise, a file name will be randomly generated.
  ScopedTestFile(std::string_view base_dir, std::string_view content,
                 std::string_view use_this_filename = "");
  ~ScopedTestFile();

  ScopedTestFile(const ScopedTestFile &) = delete;
  ScopedTestFile &operator=(const ScopedTestFile &) = delete;

  // Filename created by this instance.
  const std::string &filename() const { return filename_; }

 private:
  std::string filename_;
};

}  // namespace testing
}  // namespace file
}  // namespace codesmell

#endif  // CODESMELL_COMMON_UTIL_FILE_UTIL_H_
