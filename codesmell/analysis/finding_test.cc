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

#include "codesmell/analysis/finding.h"

#include <algorithm>
#include <sstream>
#include <string>
#include <vector>

#include "gtest/gtest.h"

namespace codesmell {
namespace analysis {
namespace {

TEST(AutoFixTest, ApplyEdits) {
  const std::string text = "val x = 1;;\n";
  const AutoFix fix(
      "Remove extra semicolon and rename",
      {ReplacementEdit({10, 11}, ""), ReplacementEdit({4, 5}, "y")});
  EXPECT_EQ(fix.Apply(text), "val y = 1;\n");
  EXPECT_EQ(fix.Edits().size(), 2);
}

TEST(AutoFixTest, InsertAndReplaceAtSameOffset) {
  AutoFix fix("insert", ReplacementEdit({0, 0}, "// "));
  EXPECT_TRUE(fix.AddEdits({ReplacementEdit({0, 3}, "VAL")}));
  EXPECT_EQ(fix.Apply("val"), "// VAL");
}

TEST(AutoFixTest, AddEditsRejectsOverlap) {
  AutoFix fix("first", ReplacementEdit({2, 6}, "abc"));
  EXPECT_FALSE(fix.AddEdits({ReplacementEdit({5, 8}, "x")}));
  EXPECT_FALSE(fix.AddEdits({ReplacementEdit({0, 1}, "y"),
                             ReplacementEdit({3, 4}, "z")}));
  EXPECT_EQ(fix.Edits().size(), 1);
  EXPECT_TRUE(fix.AddEdits({ReplacementEdit({6, 7}, "w")}));
  EXPECT_EQ(fix.Edits().size(), 2);
}

TEST(LocationTest, PrintsOneBased) {
  std::ostringstream single_line;
  single_line << Location{"A.kt", {{2, 4}, {2, 9}}};
  EXPECT_EQ(single_line.str(), "A.kt:3:5-9");

  std::ostringstream single_char;
  single_char << Location{"A.kt", {{0, 0}, {0, 1}}};
  EXPECT_EQ(single_char.str(), "A.kt:1:1");

  std::ostringstream multi_line;
  multi_line << Location{"A.kt", {{2, 4}, {5, 1}}};
  EXPECT_EQ(multi_line.str(), "A.kt:3:5-6:1");
}

Finding MakeFinding(std::string path, int line, std::string rule_id,
                    std::string message) {
  Finding finding;
  finding.rule_id = std::move(rule_id);
  finding.location = {std::move(path), {{line, 0}, {line, 4}}};
  finding.message = std::move(message);
  return finding;
}

TEST(FindingTest, SortsByPathLocationRuleAndMessage) {
  std::vector<Finding> findings = {
      MakeFinding("b.kt", 0, "a-rule", "m"),
      MakeFinding("a.kt", 5, "a-rule", "m"),
      MakeFinding("a.kt", 1, "z-rule", "m"),
      MakeFinding("a.kt", 1, "b-rule", "y"),
      MakeFinding("a.kt", 1, "b-rule", "x"),
  };
  std::sort(findings.begin(), findings.end());
  std::vector<std::string> order;
  for (const auto &f : findings) {
    std::ostringstream stream;
    stream << f.location.path << ':' << f.location.range.start.line << ':'
           << f.rule_id << ':' << f.message;
    order.push_back(stream.str());
  }
  EXPECT_EQ(order, (std::vector<std::string>{"a.kt:1:b-rule:x",
                                             "a.kt:1:b-rule:y",
                                             "a.kt:1:z-rule:m",
                                             "a.kt:5:a-rule:m",
                                             "b.kt:0:a-rule:m"}));
}

TEST(FindingTest, Print) {
  Finding finding = MakeFinding("A.kt", 2, "no-empty-block", "Empty block");
  finding.severity = Severity::kStyle;
  std::ostringstream stream;
  stream << finding;
  EXPECT_EQ(stream.str(), "A.kt:3:1-4: style: Empty block [no-empty-block]");
}

TEST(DiagnosticTest, Print) {
  std::ostringstream stream;
  stream << Diagnostic{DiagnosticKind::kInternalRuleError, "A.kt", "broken",
                       "boom"};
  EXPECT_EQ(stream.str(), "A.kt: internal-rule-error: boom [broken]");

  std::ostringstream config_stream;
  config_stream << Diagnostic{DiagnosticKind::kUnknownRuleId, "", "nope",
                              "unknown rule"};
  EXPECT_EQ(config_stream.str(), "unknown-rule-id: unknown rule [nope]");
}

}  // namespace
}  // namespace analysis
}  // namespace codesmell
