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

#include "codesmell/analysis/suppression.h"

#include <algorithm>
#include <string>
#include <string_view>
#include <utility>

#include "absl/strings/str_split.h"
#include "absl/strings/strip.h"
#include "re2/re2.h"
#include "codesmell/common/text/ast-node.h"
#include "codesmell/common/util/logging.h"

namespace codesmell {
namespace analysis {

static constexpr std::string_view kTriggerPrefix = "codesmell:";

void SuppressionDirective::Add(std::string_view id) {
  id = absl::StripPrefix(id, kTriggerPrefix);
  if (id.empty()) return;
  if (id == "all" || id == "ALL") {
    all_ = true;
    return;
  }
  ids_.emplace(id);
}

void SuppressionDirective::Merge(const SuppressionDirective &other) {
  all_ |= other.all_;
  ids_.insert(other.ids_.begin(), other.ids_.end());
}

bool SuppressionDirective::Covers(std::string_view rule_id,
                                  std::string_view rule_set) const {
  if (all_) return true;
  if (ids_.find(rule_id) != ids_.end()) return true;
  return !rule_set.empty() && ids_.find(rule_set) != ids_.end();
}

SuppressionDirective ParseSuppressionDirective(std::string_view comment) {
  static const LazyRE2 kKeywordRe = {R"re(codesmell:\s*suppress\s+([^\n]*))re"};
  static const LazyRE2 kAnnotationRe = {
      R"re(@Suppress(?:Warnings)?\s*\(([^)]*)\))re"};
  static const LazyRE2 kQuotedRe = {R"re("([^"]*)")re"};

  SuppressionDirective directive;

  std::string_view input = comment;
  std::string_view ids;
  while (RE2::FindAndConsume(&input, *kKeywordRe, &ids)) {
    // A block comment may close on the same line.
    ids = ids.substr(0, ids.find("*/"));
    for (std::string_view id :
         absl::StrSplit(ids, absl::ByAnyChar(" \t,"), absl::SkipEmpty())) {
      directive.Add(id);
    }
  }

  input = comment;
  std::string_view arguments;
  while (RE2::FindAndConsume(&input, *kAnnotationRe, &arguments)) {
    std::string_view id;
    while (RE2::FindAndConsume(&arguments, *kQuotedRe, &id)) {
      directive.Add(id);
    }
  }
  return directive;
}

SuppressionDirective DirectiveOf(const AstNode &node) {
  SuppressionDirective directive;
  for (const std::string_view comment : node.Comments()) {
    directive.Merge(ParseSuppressionDirective(comment));
  }
  return directive;
}

SuppressionScope::AutoPop::AutoPop(SuppressionScope *scope,
                                   const AstNode &node)
    : scope_(scope) {
  SuppressionDirective directive = DirectiveOf(node);
  if (directive.empty()) return;
  scope_->stack_.push_back(std::move(directive));
  pushed_ = true;
}

SuppressionScope::AutoPop::~AutoPop() {
  if (!pushed_) return;
  CHECK(!scope_->stack_.empty());
  scope_->stack_.pop_back();
}

bool SuppressionScope::IsSuppressed(std::string_view rule_id,
                                    std::string_view rule_set) const {
  return std::any_of(stack_.begin(), stack_.end(),
                     [&](const SuppressionDirective &directive) {
                       return directive.Covers(rule_id, rule_set);
                     });
}

}  // namespace analysis
}  // namespace codesmell
