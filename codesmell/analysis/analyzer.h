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

// Entry point: one analysis request over the files of one module.

#ifndef CODESMELL_ANALYSIS_ANALYZER_H_
#define CODESMELL_ANALYSIS_ANALYZER_H_

#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "codesmell/analysis/ast-provider.h"
#include "codesmell/analysis/baseline.h"
#include "codesmell/analysis/configuration-resolver.h"
#include "codesmell/analysis/module-linter.h"
#include "codesmell/analysis/report-aggregator.h"
#include "codesmell/analysis/rule-config.h"
#include "codesmell/analysis/rule-registry.h"

namespace codesmell {
namespace analysis {

struct AnalysisRequest {
  ModuleConfig module;
  std::vector<std::string> files;
  ResolveOptions resolve;
  ModuleLinterOptions lint;
  FailurePolicy policy;
};

// Resolves the configuration, loads the baseline, analyzes all files and
// aggregates the outcomes.  In baseline update mode the new baseline is saved
// to 'baseline_store' at the end.  'baseline_store' may be null: no baseline.
//
// Fails only if 'registry' is not sealed yet.  Every other problem is
// reported as a diagnostic of the result.
absl::StatusOr<AnalysisResult> AnalyzeModule(const AnalysisRequest &request,
                                             const RuleRegistry &registry,
                                             const AstProvider &provider,
                                             BaselineStore *baseline_store);

}  // namespace analysis
}  // namespace codesmell

#endif  // CODESMELL_ANALYSIS_ANALYZER_H_
