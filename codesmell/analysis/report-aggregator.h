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

// Turns per-file outcomes into the final, deterministic result of a run.

#ifndef CODESMELL_ANALYSIS_REPORT_AGGREGATOR_H_
#define CODESMELL_ANALYSIS_REPORT_AGGREGATOR_H_

#include <array>
#include <functional>
#include <iosfwd>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "codesmell/analysis/baseline.h"
#include "codesmell/analysis/finding.h"
#include "codesmell/analysis/module-linter.h"
#include "codesmell/analysis/severity.h"

namespace codesmell {
namespace analysis {

// Decides whether a run passes.
struct FailurePolicy {
  // Any reported finding of one of these severities fails the run.
  std::set<Severity> failing_severities = {Severity::kError,
                                           Severity::kDefect};

  // The run fails when the weighted number of findings exceeds this.
  // Negative: no limit.
  int max_issues = -1;

  // Weight of a rule's findings for 'max_issues'.  Unlisted rules weigh 1.
  std::map<std::string, int, std::less<>> rule_weights;

  // Any diagnostic fails the run.
  bool fail_on_diagnostics = false;
};

struct AnalysisResult {
  // Sorted by file path, then location, then rule id, then message.
  std::vector<Finding> findings;
  // Sorted by path, then rule id, then kind, then message.  Diagnostics not
  // tied to a file come first.
  std::vector<Diagnostic> diagnostics;

  // Reported findings per severity, indexed by SeverityIndex().
  std::array<int, kNumSeverities> severity_counts = {};

  std::vector<std::string> notes;
  int baseline_suppressed = 0;
  int inline_suppressed = 0;
  int total_debt_minutes = 0;
  int weighted_issues = 0;

  // Sorted.
  std::vector<std::string> excluded_files;
  std::vector<std::string> incomplete_files;

  bool passed = true;
  // Why the run failed; empty if it passed.
  std::vector<std::string> failure_reasons;

  // Auto-correct: new contents of each file that had fixable findings.
  std::map<std::string, std::string> corrected_contents;

  // Update mode: the fingerprints to store as the new baseline.
  std::optional<Baseline> baseline_update;

  int CountOf(Severity severity) const {
    return severity_counts[SeverityIndex(severity)];
  }

  // Findings grouped by file path, each group in report order.
  std::map<std::string_view, std::vector<const Finding *>> FindingsByFile()
      const;
};

// Prints a stable, line-oriented dump of the result.
std::ostream &operator<<(std::ostream &, const AnalysisResult &);

// What BuildAnalysisResult() works from.
struct AggregationInput {
  std::vector<FileOutcome> outcomes;
  std::vector<std::string> excluded_files;
  // Problems not found by analyzing a file, e.g. configuration warnings.
  std::vector<Diagnostic> diagnostics;
  std::vector<std::string> notes;
  BaselineMode baseline_mode = BaselineMode::kFilter;
};

// Merges the outcomes into one result and evaluates 'policy'.  The result
// does not depend on the order of the outcomes.
AnalysisResult BuildAnalysisResult(AggregationInput input,
                                   const FailurePolicy &policy);

// (Re-)computes result->passed and result->failure_reasons.
void ApplyFailurePolicy(const FailurePolicy &policy, AnalysisResult *result);

}  // namespace analysis
}  // namespace codesmell

#endif  // CODESMELL_ANALYSIS_REPORT_AGGREGATOR_H_
