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

#include "codesmell/analysis/path-matcher.h"

#include <string>
#include <string_view>
#include <vector>

#include "gtest/gtest.h"

namespace codesmell {
namespace analysis {
namespace {

struct MatchCase {
  const char *glob;
  const char *path;
  bool matches;
};

TEST(PathMatcherTest, GlobSemantics) {
  const MatchCase kTestCases[] = {
      {"src/Main.kt", "src/Main.kt", true},
      {"src/Main.kt", "src/Main.kts", false},
      {"*.kt", "Main.kt", true},
      {"*.kt", "src/Main.kt", false},
      {"**/*.kt", "Main.kt", true},
      {"**/*.kt", "src/a/b/Main.kt", true},
      {"**/generated/**", "build/generated/x/Y.kt", true},
      {"**/generated/**", "generated/Y.kt", true},
      {"**/generated/**", "src/generatedfoo/Y.kt", false},
      {"src/**", "src/a/b", true},
      {"src/?.kt", "src/A.kt", true},
      {"src/?.kt", "src/AB.kt", false},
      {"src/[AB].kt", "src/B.kt", true},
      {"src/[!AB].kt", "src/B.kt", false},
      {"src/[!AB].kt", "src/C.kt", true},
      {"**/*{Test,Spec}.kt", "src/FooTest.kt", true},
      {"**/*{Test,Spec}.kt", "src/FooSpec.kt", true},
      {"**/*{Test,Spec}.kt", "src/Foo.kt", false},
      {"a+b(c).kt", "a+b(c).kt", true},
  };
  for (const auto &test : kTestCases) {
    const auto matcher = PathMatcher::Create({test.glob});
    ASSERT_TRUE(matcher.ok()) << test.glob << ": " << matcher.status();
    EXPECT_EQ(matcher->Matches(test.path), test.matches)
        << "glob: " << test.glob << " path: " << test.path;
  }
}

TEST(PathMatcherTest, AnyOfSeveralGlobs) {
  const auto matcher = PathMatcher::Create({"**/test/**", "**/*.gen.kt"});
  ASSERT_TRUE(matcher.ok()) << matcher.status();
  EXPECT_TRUE(matcher->Matches("module/test/A.kt"));
  EXPECT_TRUE(matcher->Matches("src/B.gen.kt"));
  EXPECT_FALSE(matcher->Matches("src/B.kt"));
}

TEST(PathMatcherTest, EmptyMatchesNothing) {
  const PathMatcher default_matcher;
  EXPECT_TRUE(default_matcher.empty());
  EXPECT_FALSE(default_matcher.Matches("anything"));

  const auto matcher = PathMatcher::Create({});
  ASSERT_TRUE(matcher.ok());
  EXPECT_FALSE(matcher->Matches(""));
}

TEST(PathMatcherTest, RejectsMalformedGlobs) {
  for (const char *glob : {"src/{a,b", "src/a}", "src/[ab"}) {
    EXPECT_FALSE(PathMatcher::Create({glob}).ok()) << glob;
    EXPECT_FALSE(GlobToRegex(glob).ok()) << glob;
  }
}

TEST(PathMatcherTest, ReportsGlobsWhoseRegexDoesNotCompile) {
  ASSERT_TRUE(GlobToRegex("src/[z-a].kt").ok());
  const auto matcher = PathMatcher::Create({"**/generated/**", "src/[z-a].kt"});
  ASSERT_FALSE(matcher.ok());
  EXPECT_NE(matcher.status().message().find("src/[z-a].kt"),
            std::string_view::npos)
      << matcher.status();
}

}  // namespace
}  // namespace analysis
}  // namespace codesmell
