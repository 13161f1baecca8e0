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

// Inline suppression of findings.
//
// Comments and annotations attached to a node can suppress rules for that
// node and its whole subtree; on the file's root node they cover the whole
// file.  Recognized forms:
//
//   // codesmell: suppress rule-a rule-b
//   // codesmell: suppress all
//   @Suppress("rule-a", "codesmell:rule-b")
//   @SuppressWarnings("all")
//
// A rule may also be suppressed through the name of its rule set.
// Suppression is cumulative: a directive on any enclosing node suffices, and
// inner directives cannot narrow outer ones.

#ifndef CODESMELL_ANALYSIS_SUPPRESSION_H_
#define CODESMELL_ANALYSIS_SUPPRESSION_H_

#include <cstddef>
#include <functional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "codesmell/common/text/ast-node.h"

namespace codesmell {
namespace analysis {

class SuppressionDirective {
 public:
  bool empty() const { return !all_ && ids_.empty(); }
  bool SuppressesAll() const { return all_; }
  const std::set<std::string, std::less<>> &RuleIds() const { return ids_; }

  // Adds one id as written in a directive.  A "codesmell:" prefix is
  // removed; "all" and "ALL" suppress everything.
  void Add(std::string_view id);

  // Adds everything 'other' suppresses.
  void Merge(const SuppressionDirective &other);

  // Returns true if this names 'rule_id', 'rule_set' or all rules.
  bool Covers(std::string_view rule_id, std::string_view rule_set) const;

 private:
  bool all_ = false;
  std::set<std::string, std::less<>> ids_;
};

// Extracts all directives in one comment or annotation text.
SuppressionDirective ParseSuppressionDirective(std::string_view comment);

// Union of the directives in all comments attached to 'node'.
SuppressionDirective DirectiveOf(const AstNode &node);

// Directives in effect at the node currently being visited: those of the
// node itself and of all its ancestors.
class SuppressionScope {
 public:
  // Pushes the directives of 'node' (if any) for the lifetime of this object.
  class AutoPop {
   public:
    AutoPop(SuppressionScope *scope, const AstNode &node);
    ~AutoPop();

    AutoPop(const AutoPop &) = delete;
    AutoPop &operator=(const AutoPop &) = delete;

   private:
    SuppressionScope *const scope_;
    bool pushed_ = false;
  };

  // Number of nodes in scope that carry directives.
  size_t size() const { return stack_.size(); }

  bool IsSuppressed(std::string_view rule_id,
                    std::string_view rule_set) const;

 private:
  std::vector<SuppressionDirective> stack_;
};

}  // namespace analysis
}  // namespace codesmell

#endif  // CODESMELL_ANALYSIS_SUPPRESSION_H_
