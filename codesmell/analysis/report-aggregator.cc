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

#include "codesmell/analysis/report-aggregator.h"

#include <algorithm>
#include <iterator>
#include <map>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "codesmell/analysis/baseline.h"
#include "codesmell/analysis/finding.h"
#include "codesmell/analysis/module-linter.h"
#include "codesmell/analysis/severity.h"
#include "codesmell/common/util/container-util.h"

namespace codesmell {
namespace analysis {

std::map<std::string_view, std::vector<const Finding *>>
AnalysisResult::FindingsByFile() const {
  std::map<std::string_view, std::vector<const Finding *>> by_file;
  for (const Finding &finding : findings) {
    by_file[finding.location.path].push_back(&finding);
  }
  return by_file;
}

std::ostream &operator<<(std::ostream &stream, const AnalysisResult &result) {
  for (const auto &[path, findings] : result.FindingsByFile()) {
    stream << path << ":\n";
    for (const Finding *finding : findings) stream << "  " << *finding << '\n';
  }
  for (const Diagnostic &diagnostic : result.diagnostics) {
    stream << diagnostic << '\n';
  }
  stream << "counts:";
  for (int i = 0; i < kNumSeverities; ++i) {
    stream << ' ' << static_cast<Severity>(i) << '='
           << result.severity_counts[i];
  }
  stream << '\n';
  stream << "baseline-suppressed: " << result.baseline_suppressed << '\n'
         << "inline-suppressed: " << result.inline_suppressed << '\n'
         << "debt: " << result.total_debt_minutes << "min\n";
  if (!result.excluded_files.empty()) {
    stream << "excluded: " << absl::StrJoin(result.excluded_files, ", ")
           << '\n';
  }
  if (!result.incomplete_files.empty()) {
    stream << "incomplete: " << absl::StrJoin(result.incomplete_files, ", ")
           << '\n';
  }
  for (const std::string &note : result.notes) {
    stream << "note: " << note << '\n';
  }
  for (const auto &[path, contents] : result.corrected_contents) {
    stream << "corrected: " << path << '\n';
  }
  if (result.baseline_update.has_value()) {
    stream << "baseline update: " << result.baseline_update->size()
           << " fingerprint(s)\n";
  }
  stream << (result.passed ? "PASSED" : "FAILED");
  if (!result.failure_reasons.empty()) {
    stream << ": " << absl::StrJoin(result.failure_reasons, "; ");
  }
  return stream << '\n';
}

AnalysisResult BuildAnalysisResult(AggregationInput input,
                                   const FailurePolicy &policy) {
  AnalysisResult result;
  std::sort(input.outcomes.begin(), input.outcomes.end(),
            [](const FileOutcome &a, const FileOutcome &b) {
              return a.path < b.path;
            });

  result.diagnostics = std::move(input.diagnostics);
  if (input.baseline_mode == BaselineMode::kUpdate) {
    result.baseline_update.emplace();
  }
  for (FileOutcome &outcome : input.outcomes) {
    std::move(outcome.findings.begin(), outcome.findings.end(),
              std::back_inserter(result.findings));
    std::move(outcome.diagnostics.begin(), outcome.diagnostics.end(),
              std::back_inserter(result.diagnostics));
    result.baseline_suppressed += outcome.baseline_suppressed;
    result.inline_suppressed += outcome.inline_suppressed;
    if (outcome.incomplete) result.incomplete_files.push_back(outcome.path);
    if (outcome.corrected_contents.has_value()) {
      result.corrected_contents[outcome.path] =
          std::move(*outcome.corrected_contents);
    }
    if (result.baseline_update.has_value()) {
      result.baseline_update->insert(outcome.fingerprints.begin(),
                                     outcome.fingerprints.end());
    }
  }

  // Findings within a file are already in a deterministic order; keep it
  // for the rare entries that compare equal.
  std::stable_sort(result.findings.begin(), result.findings.end());
  std::sort(result.diagnostics.begin(), result.diagnostics.end());

  for (const Finding &finding : result.findings) {
    ++result.severity_counts[SeverityIndex(finding.severity)];
    result.total_debt_minutes += finding.debt_minutes;
    result.weighted_issues +=
        container::FindWithDefault(policy.rule_weights, finding.rule_id, 1);
  }

  result.notes = std::move(input.notes);
  result.excluded_files = std::move(input.excluded_files);
  std::sort(result.excluded_files.begin(), result.excluded_files.end());

  ApplyFailurePolicy(policy, &result);
  return result;
}

void ApplyFailurePolicy(const FailurePolicy &policy, AnalysisResult *result) {
  result->failure_reasons.clear();
  for (const Severity severity : policy.failing_severities) {
    const int count = result->CountOf(severity);
    if (count > 0) {
      result->failure_reasons.push_back(
          absl::StrCat(count, " finding(s) of severity ",
                       SeverityName(severity)));
    }
  }
  if (policy.max_issues >= 0 && result->weighted_issues > policy.max_issues) {
    result->failure_reasons.push_back(
        absl::StrCat("weighted issue count ", result->weighted_issues,
                     " exceeds the maximum of ", policy.max_issues));
  }
  if (policy.fail_on_diagnostics && !result->diagnostics.empty()) {
    result->failure_reasons.push_back(
        absl::StrCat(result->diagnostics.size(), " diagnostic(s)"));
  }
  result->passed = result->failure_reasons.empty();
}

}  // namespace analysis
}  // namespace codesmell
