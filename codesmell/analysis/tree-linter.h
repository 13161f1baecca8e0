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

// TreeLinter runs the active rules over the syntax tree of a file.
//
// The tree is walked once, in pre-order.  At every node, the rules interested
// in the node's kind are invoked in ascending id order.  Suppression
// directives of a node apply to the node and its subtree.  A rule that fails
// is recorded as an internal rule error for that node; the walk continues.
//
// Usage:
//   const TreeLinter linter(registry, effective_config);
//   for (...) {
//     FileLintResult result = linter.Lint(parsed_file);
//   }

#ifndef CODESMELL_ANALYSIS_TREE_LINTER_H_
#define CODESMELL_ANALYSIS_TREE_LINTER_H_

#include <atomic>
#include <string_view>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "codesmell/analysis/finding.h"
#include "codesmell/analysis/path-matcher.h"
#include "codesmell/analysis/rule-config.h"
#include "codesmell/analysis/rule-descriptor.h"
#include "codesmell/analysis/rule-registry.h"
#include "codesmell/common/text/ast-node.h"
#include "codesmell/common/text/parsed-file.h"

namespace codesmell {
namespace analysis {

struct TreeLinterOptions {
  // Ask rules with a fix callback for an AutoFix of each finding.
  bool autocorrect = false;
  // When set to true by another thread, the walk stops at the next node and
  // the result is marked abandoned.  Not owned; may be null.
  const std::atomic<bool> *abandon = nullptr;
};

struct FileLintResult {
  // In report order: pre-order by node, ascending rule id per node.
  std::vector<Finding> findings;
  // Internal rule errors.
  std::vector<Diagnostic> diagnostics;
  // Findings dropped by inline suppression.
  int inline_suppressed = 0;
  // True if the walk was stopped before reaching every node.
  bool abandoned = false;
};

class TreeLinter {
 public:
  struct ActiveRule {
    const RuleDescriptor *descriptor;
    const ResolvedRule *settings;
    PathMatcher excludes;
  };

  // Node kind to the rules interested in it, ascending by rule id.
  using RuleTable =
      absl::flat_hash_map<NodeKind, std::vector<const ActiveRule *>>;

  // 'registry' and 'config' must outlive the linter.
  TreeLinter(const RuleRegistry &registry, const EffectiveConfig &config,
             const TreeLinterOptions &options = {});

  // Rules active for the file at 'path', by node kind.
  RuleTable BuildRuleTable(std::string_view path) const;

  FileLintResult Lint(const ParsedFile &file) const;

 private:
  const TreeLinterOptions options_;
  // Enabled rules, ascending by id.
  std::vector<ActiveRule> active_rules_;
};

// Lints one file with a temporary TreeLinter.
FileLintResult AnalyzeFile(const ParsedFile &file,
                           const EffectiveConfig &config,
                           const RuleRegistry &registry,
                           const TreeLinterOptions &options = {});

}  // namespace analysis
}  // namespace codesmell

#endif  // CODESMELL_ANALYSIS_TREE_LINTER_H_
