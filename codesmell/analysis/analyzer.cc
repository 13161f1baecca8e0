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

#include "codesmell/analysis/analyzer.h"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "codesmell/analysis/baseline.h"
#include "codesmell/analysis/configuration-resolver.h"
#include "codesmell/analysis/finding.h"
#include "codesmell/analysis/module-linter.h"
#include "codesmell/analysis/report-aggregator.h"
#include "codesmell/analysis/rule-config.h"
#include "codesmell/common/util/logging.h"

namespace codesmell {
namespace analysis {

namespace {
bool AllFilesAnalyzed(const AnalysisResult &result) {
  if (!result.incomplete_files.empty()) return false;
  return std::none_of(result.diagnostics.begin(), result.diagnostics.end(),
                      [](const Diagnostic &d) {
                        return d.kind == DiagnosticKind::kParseFailure;
                      });
}
}  // namespace

absl::StatusOr<AnalysisResult> AnalyzeModule(const AnalysisRequest &request,
                                             const RuleRegistry &registry,
                                             const AstProvider &provider,
                                             BaselineStore *baseline_store) {
  if (!registry.IsSealed()) {
    return absl::FailedPreconditionError(
        "Rule registry must be sealed before analysis starts.");
  }

  const EffectiveConfig config =
      ResolveConfiguration(request.module, registry, request.resolve);
  for (const Diagnostic &warning : config.warnings) {
    LOG(WARNING) << warning;
  }
  VLOG(1) << "Effective configuration of module '"
          << request.module.module_name << "':\n"
          << config;

  AggregationInput input;
  input.diagnostics = config.warnings;
  input.notes = config.notes;
  input.baseline_mode = request.lint.baseline_mode;

  Baseline baseline;
  if (baseline_store != nullptr) {
    absl::StatusOr<Baseline> loaded = baseline_store->Load();
    if (loaded.ok()) {
      baseline = *std::move(loaded);
      VLOG(1) << "Baseline has " << baseline.size() << " fingerprint(s)";
    } else if (absl::IsNotFound(loaded.status())) {
      VLOG(1) << "No baseline yet";
    } else {
      LOG(WARNING) << "Can't load baseline: " << loaded.status();
      input.diagnostics.push_back({DiagnosticKind::kBaselineError, "", "",
                                   std::string(loaded.status().message())});
    }
  }

  const ModuleLinter linter(registry, config, provider, baseline,
                            request.lint);
  ModuleLintResult lint_result = linter.Lint(request.files);
  input.outcomes = std::move(lint_result.outcomes);
  input.excluded_files = std::move(lint_result.excluded_files);

  AnalysisResult result = BuildAnalysisResult(std::move(input), request.policy);

  if (result.baseline_update.has_value() && baseline_store != nullptr) {
    // Fingerprints of files that were not analyzed are unknown; keep the old
    // entries rather than forgetting them.
    if (!AllFilesAnalyzed(result)) {
      result.baseline_update->insert(baseline.begin(), baseline.end());
      result.notes.push_back(
          "Not all files were analyzed; the updated baseline keeps all "
          "previous fingerprints.");
    }
    const absl::Status saved = baseline_store->Save(*result.baseline_update);
    if (saved.ok()) {
      VLOG(1) << "Saved baseline with " << result.baseline_update->size()
              << " fingerprint(s)";
    } else {
      LOG(WARNING) << "Can't save baseline: " << saved;
      result.diagnostics.push_back({DiagnosticKind::kBaselineError, "", "",
                                    std::string(saved.message())});
      std::sort(result.diagnostics.begin(), result.diagnostics.end());
      ApplyFailurePolicy(request.policy, &result);
    }
  }

  VLOG(1) << "Module '" << request.module.module_name << "': "
          << result.findings.size() << " finding(s), "
          << result.diagnostics.size() << " diagnostic(s), "
          << (result.passed ? "passed" : "failed");
  return result;
}

}  // namespace analysis
}  // namespace codesmell
