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

#include "codesmell/analysis/tree-linter.h"

#include <atomic>
#include <exception>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "codesmell/analysis/fingerprint.h"
#include "codesmell/analysis/finding.h"
#include "codesmell/analysis/path-matcher.h"
#include "codesmell/analysis/rule-config.h"
#include "codesmell/analysis/rule-descriptor.h"
#include "codesmell/analysis/rule-registry.h"
#include "codesmell/analysis/suppression.h"
#include "codesmell/common/strings/line-column-map.h"
#include "codesmell/common/text/ast-context.h"
#include "codesmell/common/text/ast-node.h"
#include "codesmell/common/text/parsed-file.h"
#include "codesmell/common/util/logging.h"

namespace codesmell {
namespace analysis {

namespace {

// Finds the path from 'from' (inclusive) down to 'target' (inclusive).  With
// 'prune', subtrees whose range does not contain the target are skipped.
bool FindPathTo(const AstNode &from, const AstNode &target, bool prune,
                std::vector<const AstNode *> *path) {
  path->push_back(&from);
  if (&from == &target) return true;
  if (!prune || from.Range().Contains(target.Range())) {
    for (size_t i = 0; i < from.NumChildren(); ++i) {
      if (FindPathTo(from.ChildAt(i), target, prune, path)) return true;
    }
  }
  path->pop_back();
  return false;
}

// Ranges are a hint only: providers may hand out children that reach past
// their parent, so an unsuccessful pruned search falls back to a full one.
bool FindReportedNode(const AstNode &from, const AstNode &target,
                      std::vector<const AstNode *> *path) {
  return FindPathTo(from, target, /*prune=*/true, path) ||
         FindPathTo(from, target, /*prune=*/false, path);
}

// Walks one file.  Owns everything that changes during the walk.
class FileTraversal {
 public:
  FileTraversal(const ParsedFile &file, const TreeLinter::RuleTable &table,
                const TreeLinterOptions &options)
      : file_(file), table_(table), options_(options) {}

  FileLintResult Run() && {
    Traverse(file_.Root());
    return std::move(result_);
  }

 private:
  class NodeSink;

  void Traverse(const AstNode &node) {
    if (options_.abandon != nullptr &&
        options_.abandon->load(std::memory_order_relaxed)) {
      result_.abandoned = true;
      return;
    }
    const SuppressionScope::AutoPop suppressions(&suppressions_, node);
    Dispatch(node);
    const AstContext::AutoPop ancestors(&context_, node);
    for (size_t i = 0; i < node.NumChildren(); ++i) {
      Traverse(node.ChildAt(i));
      if (result_.abandoned) return;
    }
  }

  void Dispatch(const AstNode &node);

  void RecordRuleError(const TreeLinter::ActiveRule &rule, const AstNode &node,
                       std::string_view message) {
    std::ostringstream where;
    where << file_.RangeOf(node).start << ": " << message;
    LOG(WARNING) << file_.Path() << ": rule " << rule.descriptor->id
                 << " failed at " << where.str();
    result_.diagnostics.push_back({DiagnosticKind::kInternalRuleError,
                                   file_.Path(), rule.descriptor->id,
                                   where.str()});
  }

  void Report(const TreeLinter::ActiveRule &rule, const RuleContext &context,
              const AstNode &visited, const AstNode &reported,
              std::string_view message);

  const ParsedFile &file_;
  const TreeLinter::RuleTable &table_;
  const TreeLinterOptions &options_;

  AstContext context_;
  SuppressionScope suppressions_;
  // Reports so far per reported node and rule.
  using ReportKey = std::pair<const AstNode *, const TreeLinter::ActiveRule *>;
  absl::flat_hash_map<ReportKey, int> report_counts_;
  FileLintResult result_;
};

// Collects the findings of one rule invocation on one node.
class FileTraversal::NodeSink final : public FindingSink {
 public:
  NodeSink(FileTraversal *traversal, const TreeLinter::ActiveRule &rule,
           const RuleContext &context, const AstNode &visited)
      : traversal_(traversal),
        rule_(rule),
        context_(context),
        visited_(visited) {}

  void Report(const AstNode &node, std::string_view message) final {
    traversal_->Report(rule_, context_, visited_, node, message);
  }

 private:
  FileTraversal *const traversal_;
  const TreeLinter::ActiveRule &rule_;
  const RuleContext &context_;
  const AstNode &visited_;
};

void FileTraversal::Dispatch(const AstNode &node) {
  const auto found = table_.find(node.Kind());
  if (found == table_.end()) return;
  for (const TreeLinter::ActiveRule *rule : found->second) {
    const RuleContext context(rule->descriptor->id, file_, context_,
                              rule->settings->parameters);
    NodeSink sink(this, *rule, context, node);
    absl::Status status;
    try {
      status = rule->descriptor->visit(node, context, &sink);
    } catch (const std::exception &e) {
      status = absl::InternalError(absl::StrCat("exception: ", e.what()));
    } catch (...) {
      status = absl::InternalError("unknown exception");
    }
    if (!status.ok()) RecordRuleError(*rule, node, status.ToString());
  }
}

void FileTraversal::Report(const TreeLinter::ActiveRule &rule,
                           const RuleContext &context, const AstNode &visited,
                           const AstNode &reported, std::string_view message) {
  const RuleDescriptor &descriptor = *rule.descriptor;
  std::vector<const AstNode *> path(context_.begin(), context_.end());
  if (!FindReportedNode(visited, reported, &path)) {
    RecordRuleError(rule, visited,
                    "reported a node outside of the visited subtree");
    return;
  }

  const int occurrence = report_counts_[{&reported, &rule}]++;

  // Directives between the visited node (already in scope) and the reported
  // node apply as well.
  bool suppressed =
      suppressions_.IsSuppressed(descriptor.id, descriptor.rule_set);
  for (size_t i = context_.size() + 1; !suppressed && i < path.size(); ++i) {
    suppressed = DirectiveOf(*path[i]).Covers(descriptor.id,
                                              descriptor.rule_set);
  }
  if (suppressed) {
    VLOG(2) << file_.Path() << ": suppressed finding of " << descriptor.id;
    ++result_.inline_suppressed;
    return;
  }

  Finding finding;
  finding.rule_id = descriptor.id;
  finding.severity = rule.settings->severity;
  finding.location = {file_.Path(), file_.RangeOf(reported)};
  finding.message = std::string(message);
  finding.entity_signature = ComputeEntitySignature(file_.Path(), path);
  finding.fingerprint =
      ComputeFingerprint(descriptor.id, finding.entity_signature,
                         file_.TextOf(reported), occurrence);
  finding.debt_minutes = descriptor.debt_minutes;
  if (options_.autocorrect && descriptor.fix) {
    try {
      finding.autofix = descriptor.fix(reported, context);
    } catch (const std::exception &e) {
      RecordRuleError(rule, reported,
                      absl::StrCat("fix failed: exception: ", e.what()));
    } catch (...) {
      RecordRuleError(rule, reported, "fix failed: unknown exception");
    }
  }
  result_.findings.push_back(std::move(finding));
}

}  // namespace

TreeLinter::TreeLinter(const RuleRegistry &registry,
                       const EffectiveConfig &config,
                       const TreeLinterOptions &options)
    : options_(options) {
  for (const RuleDescriptor *descriptor : registry.All()) {
    const ResolvedRule *settings = config.Find(descriptor->id);
    if (settings == nullptr || !settings->enabled) continue;
    auto excludes = PathMatcher::Create(settings->excludes);
    if (!excludes.ok()) {
      // The resolver only lets valid globs through.
      LOG(WARNING) << descriptor->id << ": " << excludes.status();
      excludes = PathMatcher();
    }
    active_rules_.push_back({descriptor, settings, *std::move(excludes)});
  }
  VLOG(1) << active_rules_.size() << " active rules";
}

TreeLinter::RuleTable TreeLinter::BuildRuleTable(std::string_view path) const {
  RuleTable table;
  for (const ActiveRule &rule : active_rules_) {
    if (rule.excludes.Matches(path)) {
      VLOG(2) << path << ": rule " << rule.descriptor->id << " excluded";
      continue;
    }
    for (const NodeKind kind : rule.descriptor->node_interest) {
      table[kind].push_back(&rule);
    }
  }
  return table;
}

FileLintResult TreeLinter::Lint(const ParsedFile &file) const {
  const RuleTable table = BuildRuleTable(file.Path());
  FileLintResult result = FileTraversal(file, table, options_).Run();
  VLOG(1) << file.Path() << ": " << result.findings.size() << " findings, "
          << result.diagnostics.size() << " rule errors"
          << (result.abandoned ? " (abandoned)" : "");
  return result;
}

FileLintResult AnalyzeFile(const ParsedFile &file,
                           const EffectiveConfig &config,
                           const RuleRegistry &registry,
                           const TreeLinterOptions &options) {
  return TreeLinter(registry, config, options).Lint(file);
}

}  // namespace analysis
}  // namespace codesmell
