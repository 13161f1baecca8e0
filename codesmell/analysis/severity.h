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

#ifndef CODESMELL_ANALYSIS_SEVERITY_H_
#define CODESMELL_ANALYSIS_SEVERITY_H_

#include <iosfwd>
#include <string_view>

#include "absl/status/statusor.h"

namespace codesmell {
namespace analysis {

// How bad a finding is, in increasing order.
enum class Severity {
  kStyle,
  kWarning,
  kError,
  kDefect,
};

inline constexpr int kNumSeverities = 4;

inline constexpr int SeverityIndex(Severity severity) {
  return static_cast<int>(severity);
}

// Lower-case name: "style", "warning", "error", "defect".
std::string_view SeverityName(Severity severity);

// Case-insensitive inverse of SeverityName().
absl::StatusOr<Severity> ParseSeverity(std::string_view name);

std::ostream &operator<<(std::ostream &, Severity);

}  // namespace analysis
}  // namespace codesmell

#endif  // CODESMELL_ANALYSIS_SEVERITY_H_
