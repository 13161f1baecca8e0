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

// Test support: a tiny brace-structured source language with its parser,
// an in-memory AstProvider, and a handful of rules written against it.
//
// The language, one construct per line:
//   class Name {      opens a class
//   fun name() {      opens a function ("{}" at the end opens and closes)
//   anything {        opens an unnamed block
//   }                 closes the innermost open node
//   // text, @Anno    comment lines, attached to the next node
//   //! text          comment attached to the file root
//   other text        a statement
// A "//" comment after code on the same line attaches to that line's node.

#ifndef CODESMELL_ANALYSIS_RULE_TEST_UTILS_H_
#define CODESMELL_ANALYSIS_RULE_TEST_UTILS_H_

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "codesmell/analysis/ast-provider.h"
#include "codesmell/analysis/rule-descriptor.h"
#include "codesmell/analysis/rule-registry.h"
#include "codesmell/analysis/severity.h"
#include "codesmell/common/text/parsed-file.h"

namespace codesmell {
namespace analysis {

enum class MiniKind { kFile, kClass, kFunction, kBlock, kStatement };

std::string_view MiniKindName(NodeKind kind);

// Parses 'contents'.  Unbalanced braces are an error.
absl::StatusOr<std::unique_ptr<ParsedFile>> ParseMiniSource(
    std::string_view path, std::string_view contents);

// Serves files from memory, parsed with ParseMiniSource().
class InMemoryAstProvider final : public AstProvider {
 public:
  void AddFile(std::string_view path, std::string_view contents);
  // Parse() of 'path' returns 'status'.
  void AddFailingFile(std::string_view path, absl::Status status);

  // Called at the start of every Parse(), before the file is looked up.
  // Lets tests block or slow down workers.
  void SetParseHook(std::function<void(const std::string &path)> hook) {
    parse_hook_ = std::move(hook);
  }

  absl::StatusOr<std::unique_ptr<ParsedFile>> Parse(
      const std::string &path) const final;

  // Paths passed to Parse() so far, in call order.
  std::vector<std::string> ParsedPaths() const;

 private:
  std::map<std::string, std::string, std::less<>> files_;
  std::map<std::string, absl::Status, std::less<>> failures_;
  std::function<void(const std::string &)> parse_hook_;

  mutable std::mutex lock_;
  mutable std::vector<std::string> parsed_paths_;
};

// "no-empty-block": functions and blocks without children.  Style.
RuleDescriptor EmptyBlockRule();

// Reports every node of 'kind' with message "Found <kind>".
RuleDescriptor NodeKindRule(std::string_view id, MiniKind kind,
                            Severity severity = Severity::kWarning);

// Fails on every node of 'kind' by returning an error status.
RuleDescriptor FailingRule(std::string_view id, MiniKind kind);

// Fails on every node of 'kind' by throwing std::runtime_error.
RuleDescriptor ThrowingRule(std::string_view id, MiniKind kind);

// Fails on every node of 'kind' by throwing a value that is not derived from
// std::exception.
RuleDescriptor ThrowingNonStandardRule(std::string_view id, MiniKind kind);

// "function-naming": function names must fully match the "pattern"
// parameter (default "[a-z][A-Za-z0-9]*").  Offers a fix that lower-cases
// the first letter.
RuleDescriptor FunctionNamingRule();

// "class-members": on each class, reports each direct child function.
RuleDescriptor ClassMemberRule();

// Builds a registry from 'rules' and seals it.
std::unique_ptr<RuleRegistry> MakeSealedRegistry(
    std::vector<RuleDescriptor> rules);

}  // namespace analysis
}  // namespace codesmell

#endif  // CODESMELL_ANALYSIS_RULE_TEST_UTILS_H_
