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

// Parallel analysis of the files of one module.

#ifndef CODESMELL_ANALYSIS_MODULE_LINTER_H_
#define CODESMELL_ANALYSIS_MODULE_LINTER_H_

#include <atomic>
#include <optional>
#include <string>
#include <vector>

#include "absl/time/time.h"
#include "codesmell/analysis/ast-provider.h"
#include "codesmell/analysis/baseline.h"
#include "codesmell/analysis/finding.h"
#include "codesmell/analysis/path-matcher.h"
#include "codesmell/analysis/rule-config.h"
#include "codesmell/analysis/rule-registry.h"
#include "codesmell/analysis/tree-linter.h"

namespace codesmell {
namespace analysis {

struct ModuleLinterOptions {
  // Number of worker threads; 0 picks the hardware concurrency.
  int worker_count = 0;

  // Wall-clock budget for the whole module.  Files not finished in time are
  // reported incomplete.
  absl::Duration timeout = absl::InfiniteDuration();

  // Attach fixes to findings and produce corrected file contents.
  bool autocorrect = false;

  BaselineMode baseline_mode = BaselineMode::kFilter;
};

// Everything a worker found out about one file.
struct FileOutcome {
  std::string path;
  std::vector<Finding> findings;
  std::vector<Diagnostic> diagnostics;
  int baseline_suppressed = 0;
  int inline_suppressed = 0;

  // Cancelled or timed out; no findings are reported for the file.
  bool incomplete = false;

  // Update mode only: fingerprints of all findings of the file.
  Baseline fingerprints;

  // Auto-correct only: the contents with all compatible fixes applied, if
  // there was anything to fix.
  std::optional<std::string> corrected_contents;
};

struct ModuleLintResult {
  // One per analyzed file, in the order the files were given.
  std::vector<FileOutcome> outcomes;
  // Files skipped because they match the module excludes.
  std::vector<std::string> excluded_files;
};

// Fans out the files of a module to a pool of workers, each of which parses
// one file, runs the TreeLinter on it and filters the findings against the
// baseline.
//
// With fail_fast set in the configuration, the first finding of severity
// Error or above, or the first rule failure, stops the analysis of all files
// that have not been started yet; files already being analyzed complete.
//
// The registry, configuration, provider and baseline must outlive the
// linter and are shared read-only by all workers.
class ModuleLinter {
 public:
  ModuleLinter(const RuleRegistry &registry, const EffectiveConfig &config,
               const AstProvider &provider, const Baseline &baseline,
               const ModuleLinterOptions &options = {});

  ModuleLintResult Lint(const std::vector<std::string> &files) const;

  // Analyzes a single file on the calling thread.
  FileOutcome LintOneFile(const std::string &path) const;

  // The number of threads Lint() uses.
  int WorkerCount() const;

 private:
  FileOutcome LintFile(const TreeLinter &linter, const std::string &path,
                       const std::atomic<bool> *abandon) const;

  const RuleRegistry &registry_;
  const EffectiveConfig &config_;
  const AstProvider &provider_;
  const Baseline &baseline_;
  const ModuleLinterOptions options_;
  PathMatcher excludes_;
};

// Whether 'outcome' stops a fail-fast run.
bool TriggersFailFast(const FileOutcome &outcome);

}  // namespace analysis
}  // namespace codesmell

#endif  // CODESMELL_ANALYSIS_MODULE_LINTER_H_
