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

// A rule is described by a RuleDescriptor: metadata plus the callbacks the
// traversal engine invokes.  Rules hold no state of their own; per-run state
// (file, ancestors, parameters) comes in through RuleContext.

#ifndef CODESMELL_ANALYSIS_RULE_DESCRIPTOR_H_
#define CODESMELL_ANALYSIS_RULE_DESCRIPTOR_H_

#include <functional>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "absl/status/status.h"
#include "codesmell/analysis/finding.h"
#include "codesmell/analysis/severity.h"
#include "codesmell/common/text/ast-context.h"
#include "codesmell/common/text/ast-node.h"
#include "codesmell/common/text/config-utils.h"
#include "codesmell/common/text/parsed-file.h"

namespace codesmell {
namespace analysis {

// Everything a rule may look at while visiting a node.
class RuleContext {
 public:
  RuleContext(std::string_view rule_id, const ParsedFile &file,
              const AstContext &ancestors,
              const config::ParameterMap &parameters)
      : rule_id_(rule_id),
        file_(file),
        ancestors_(ancestors),
        parameters_(parameters) {}

  std::string_view RuleId() const { return rule_id_; }
  const ParsedFile &File() const { return file_; }

  // Ancestors of the visited node, root first.  Does not include the node.
  const AstContext &Ancestors() const { return ancestors_; }

  // Resolved parameters of this rule; parse with ParseParameters().
  const config::ParameterMap &Parameters() const { return parameters_; }

 private:
  const std::string_view rule_id_;
  const ParsedFile &file_;
  const AstContext &ancestors_;
  const config::ParameterMap &parameters_;
};

// Receives the findings of a rule.
class FindingSink {
 public:
  virtual ~FindingSink() = default;

  // Reports a violation on 'node', which must be the visited node or one of
  // its descendants.
  virtual void Report(const AstNode &node, std::string_view message) = 0;
};

// Visit callback.  A non-OK status is recorded as an internal rule error for
// the visited node; findings reported before the failure are kept.
using VisitFunction = std::function<absl::Status(
    const AstNode &node, const RuleContext &context, FindingSink *sink)>;

// Optional auto-correct callback, asked for a fix of each finding on
// 'node'.  Returns nullopt when no fix is possible.
using FixFunction = std::function<std::optional<AutoFix>(
    const AstNode &node, const RuleContext &context)>;

struct ParameterDescriptor {
  std::string name;
  std::string default_value;
  std::string description;
};

struct RuleDescriptor {
  std::string id;                   // unique across the registry
  std::string rule_set = "default";  // group that can be switched as a whole
  std::string description;
  Severity severity = Severity::kWarning;
  int debt_minutes = 5;  // remediation effort per finding
  bool default_enabled = true;

  // Needs semantic information beyond the syntax tree, such as types
  // resolved across files.  Disabled in degraded runs.
  bool requires_extra_context = false;

  std::set<NodeKind> node_interest;
  VisitFunction visit;
  FixFunction fix;  // may be empty
  std::vector<ParameterDescriptor> params;
};

}  // namespace analysis
}  // namespace codesmell

#endif  // CODESMELL_ANALYSIS_RULE_DESCRIPTOR_H_
