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

#include "codesmell/common/text/config-utils.h"

#include <memory>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/match.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "re2/re2.h"

namespace codesmell {
namespace config {
namespace {

using ::testing::ElementsAre;

TEST(ConfigUtilsTest, ComplainInvalidParameter) {
  absl::Status s;
  s = ParseNameValues("baz:123", {{"foo", nullptr}});
  EXPECT_FALSE(s.ok());
  EXPECT_EQ(s.message(),
            "baz: unknown parameter; supported parameter is 'foo'");

  s = ParseNameValues("baz:123", {{"foo", nullptr}, {"bar", nullptr}});
  EXPECT_FALSE(s.ok());
  EXPECT_EQ(s.message(),
            "baz: unknown parameter; supported parameters are 'foo', 'bar'");

  s = ParseNameValues("baz:123", {});
  EXPECT_FALSE(s.ok());
  EXPECT_EQ(s.message(), "baz: unknown parameter; no parameters supported");

  s = ParseNameValues("foo:123", {{"foo", nullptr}, {"bar", nullptr}});
  EXPECT_TRUE(s.ok());
}

TEST(ConfigUtilsTest, EmptyConfigIsAccepted) {
  EXPECT_TRUE(ParseNameValues("", {}).ok());
  EXPECT_TRUE(ParseNameValues(" ; ", {}).ok());
  EXPECT_TRUE(ParseParameters({}, {}).ok());
}

TEST(ConfigUtilsTest, ParseInteger) {
  absl::Status s;
  int value = -1;
  s = ParseNameValues("threshold:42", {{"threshold", SetInt(&value, 0, 100)}});
  EXPECT_TRUE(s.ok());
  EXPECT_EQ(value, 42);

  s = ParseNameValues("threshold:many",
                      {{"threshold", SetInt(&value, 0, 100)}});
  EXPECT_FALSE(s.ok());
  EXPECT_EQ(s.message(), "threshold: 'many': Cannot parse integer");

  s = ParseNameValues("threshold:142", {{"threshold", SetInt(&value, 0, 100)}});
  EXPECT_FALSE(s.ok());
  EXPECT_EQ(s.message(), "threshold: 142 out of range [0...100]");
  EXPECT_EQ(value, 42);

  s = ParseNameValues("threshold:-12345", {{"threshold", SetInt(&value)}});
  EXPECT_TRUE(s.ok());
  EXPECT_EQ(value, -12345);
}

TEST(ConfigUtilsTest, ParseBool) {
  absl::Status s;
  bool value = false;
  for (auto config : {"active", "active:TrUe", "active:on", "active:1"}) {
    s = ParseNameValues(config, {{"active", SetBool(&value)}});
    EXPECT_TRUE(s.ok());
    EXPECT_TRUE(value);
  }

  for (auto config : {"active:fAlse", "active:off", "active:0"}) {
    s = ParseNameValues(config, {{"active", SetBool(&value)}});
    EXPECT_TRUE(s.ok());
    EXPECT_FALSE(value);
  }

  s = ParseNameValues("active:maybe", {{"active", SetBool(&value)}});
  EXPECT_FALSE(s.ok());
  EXPECT_TRUE(
      absl::StartsWith(s.message(), "active: Boolean value should be one of"));
}

TEST(ConfigUtilsTest, ParseRegex) {
  absl::Status s;
  std::unique_ptr<re2::RE2> regex;
  s = ParseNameValues("pattern:[a-z0-9_]+", {{"pattern", SetRegex(&regex)}});
  EXPECT_TRUE(s.ok());
  ASSERT_NE(regex, nullptr);
  EXPECT_EQ(regex->pattern(), "[a-z0-9_]+");

  s = ParseNameValues("pattern:[a-z", {{"pattern", SetRegex(&regex)}});
  EXPECT_FALSE(s.ok());
  EXPECT_TRUE(absl::StartsWith(
      s.message(), "pattern: Failed to parse regular expression: "));
  // A failed parse leaves the previous value in place.
  EXPECT_EQ(regex->pattern(), "[a-z0-9_]+");
}

TEST(ConfigUtilsTest, RegexValueMayContainColon) {
  std::unique_ptr<re2::RE2> regex;
  const absl::Status s =
      ParseNameValues("pattern:a:b", {{"pattern", SetRegex(&regex)}});
  EXPECT_TRUE(s.ok());
  EXPECT_EQ(regex->pattern(), "a:b");
}

TEST(ConfigUtilsTest, ParseString) {
  absl::Status s;
  std::string str;
  s = ParseNameValues("style:camel", {{"style", SetString(&str)}});
  EXPECT_TRUE(s.ok());
  EXPECT_EQ(str, "camel");

  s = ParseNameValues(
      "style:snake", {{"style", SetStringOneOf(&str, {"camel", "snake"})}});
  EXPECT_TRUE(s.ok());
  EXPECT_EQ(str, "snake");

  s = ParseNameValues(
      "style:kebab", {{"style", SetStringOneOf(&str, {"camel", "snake"})}});
  EXPECT_FALSE(s.ok());
  EXPECT_EQ(s.message(),
            "style: Value can only be one of ['camel', 'snake']; got 'kebab'");

  s = ParseNameValues("style:kebab",
                      {{"style", SetStringOneOf(&str, {"camel"})}});
  EXPECT_FALSE(s.ok());
  EXPECT_EQ(s.message(), "style: Value can only be 'camel'; got 'kebab'");
}

TEST(ConfigUtilsTest, ParseStringList) {
  std::vector<std::string> names = {"stale"};
  const absl::Status s = ParseNameValues(
      "ignore: main , , test", {{"ignore", SetStringList(&names)}});
  EXPECT_TRUE(s.ok());
  EXPECT_THAT(names, ElementsAre("main", "test"));
}

TEST(ConfigUtilsTest, ParseMultipleParameters) {
  int threshold = 0;
  bool active = false;
  const absl::Status s = ParseNameValues(
      "threshold:7; active:on",
      {{"threshold", SetInt(&threshold)}, {"active", SetBool(&active)}});
  EXPECT_TRUE(s.ok());
  EXPECT_EQ(threshold, 7);
  EXPECT_TRUE(active);
}

TEST(ConfigUtilsTest, ParseParameterMap) {
  int threshold = 0;
  std::string style;
  const ParameterMap parameters = {{"threshold", "12"}, {"style", "camel"}};
  absl::Status s = ParseParameters(
      parameters,
      {{"threshold", SetInt(&threshold)}, {"style", SetString(&style)}});
  EXPECT_TRUE(s.ok());
  EXPECT_EQ(threshold, 12);
  EXPECT_EQ(style, "camel");

  s = ParseParameters({{"unknown", "1"}}, {{"threshold", SetInt(&threshold)}});
  EXPECT_FALSE(s.ok());
  EXPECT_TRUE(absl::StartsWith(s.message(), "unknown: unknown parameter"));
}

TEST(ConfigUtilsTest, SplitNameValues) {
  const ParameterMap parameters =
      SplitNameValues(" threshold : 3 ; pattern:a:b;;flag; threshold:4");
  EXPECT_EQ(parameters, (ParameterMap{{"flag", ""},
                                      {"pattern", "a:b"},
                                      {"threshold", "4"}}));
  EXPECT_TRUE(SplitNameValues("").empty());
}

}  // namespace
}  // namespace config
}  // namespace codesmell
