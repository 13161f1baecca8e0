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

#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace codesmell {
namespace file {
namespace {

using ::testing::HasSubstr;
using testing::ScopedTestFile;

TEST(FileUtil, ReadMissingFile) {
  const std::string path = JoinPath(::testing::TempDir(), "does-not-exist");
  const absl::StatusOr<std::string> content = GetContentAsString(path);
  EXPECT_FALSE(content.ok());
  EXPECT_EQ(content.status().code(), absl::StatusCode::kNotFound);
}

TEST(FileUtil, ReadDirectoryIsAnError) {
  const absl::StatusOr<std::string> content =
      GetContentAsString(::testing::TempDir());
  EXPECT_FALSE(content.ok());
  EXPECT_THAT(content.status().message(), HasSubstr("is a directory"));
}

TEST(FileUtil, ScopedTestFileRoundTrip) {
  const ScopedTestFile test_file(::testing::TempDir(), "some\ncontent\n");
  const absl::StatusOr<std::string> content =
      GetContentAsString(test_file.filename());
  ASSERT_TRUE(content.ok()) << content.status();
  EXPECT_EQ(*content, "some\ncontent\n");
}

TEST(FileUtil, ReplaceContentsOverwrites) {
  const ScopedTestFile test_file(::testing::TempDir(), "old", "replace-me");
  ASSERT_TRUE(ReplaceContents(test_file.filename(), "new").ok());
  const absl::StatusOr<std::string> content =
      GetContentAsString(test_file.filename());
  ASSERT_TRUE(content.ok()) << content.status();
  EXPECT_EQ(*content, "new");
  EXPECT_FALSE(FileExists(test_file.filename() + ".tmp").ok());
}

TEST(FileUtil, WriteIntoMissingDirectoryFails) {
  const std::string path =
      JoinPath(::testing::TempDir(), "no-such-dir/file.txt");
  EXPECT_FALSE(SetContents(path, "x").ok());
}

TEST(FileUtil, JoinPath) {
  EXPECT_EQ(JoinPath("foo", "bar"), "foo/bar");
  EXPECT_EQ(JoinPath("foo/", "bar"), "foo/bar");
  EXPECT_EQ(JoinPath("foo/./baz/..", "bar"), "foo/bar");
}

}  // namespace
}  // namespace file
}  // namespace codesmell
