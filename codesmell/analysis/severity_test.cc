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

#include "codesmell/analysis/severity.h"

#include <sstream>

#include "gtest/gtest.h"

namespace codesmell {
namespace analysis {
namespace {

TEST(SeverityTest, Ordering) {
  EXPECT_LT(Severity::kStyle, Severity::kWarning);
  EXPECT_LT(Severity::kWarning, Severity::kError);
  EXPECT_LT(Severity::kError, Severity::kDefect);
}

TEST(SeverityTest, NameRoundTrip) {
  for (Severity s : {Severity::kStyle, Severity::kWarning, Severity::kError,
                     Severity::kDefect}) {
    const auto parsed = ParseSeverity(SeverityName(s));
    ASSERT_TRUE(parsed.ok()) << parsed.status();
    EXPECT_EQ(*parsed, s);
  }
}

TEST(SeverityTest, ParseIgnoresCase) {
  const auto parsed = ParseSeverity("WaRnInG");
  ASSERT_TRUE(parsed.ok());
  EXPECT_EQ(*parsed, Severity::kWarning);
}

TEST(SeverityTest, ParseRejectsUnknown) {
  const auto parsed = ParseSeverity("fatal");
  EXPECT_FALSE(parsed.ok());
  EXPECT_EQ(parsed.status().code(), absl::StatusCode::kInvalidArgument);
}

TEST(SeverityTest, Print) {
  std::ostringstream stream;
  stream << Severity::kDefect;
  EXPECT_EQ(stream.str(), "defect");
}

}  // namespace
}  // namespace analysis
}  // namespace codesmell
