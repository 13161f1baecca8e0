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

#include <ostream>
#include <string_view>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"

namespace codesmell {
namespace analysis {

static constexpr std::string_view kSeverityNames[kNumSeverities] = {
    "style", "warning", "error", "defect"};

std::string_view SeverityName(Severity severity) {
  return kSeverityNames[SeverityIndex(severity)];
}

absl::StatusOr<Severity> ParseSeverity(std::string_view name) {
  for (int i = 0; i < kNumSeverities; ++i) {
    if (absl::EqualsIgnoreCase(name, kSeverityNames[i])) {
      return static_cast<Severity>(i);
    }
  }
  return absl::InvalidArgumentError(
      absl::StrCat("'", name,
                   "' is not a severity; expected one of style, warning, "
                   "error, defect"));
}

std::ostream &operator<<(std::ostream &stream, Severity severity) {
  return stream << SeverityName(severity);
}

}  // namespace analysis
}  // namespace codesmell
