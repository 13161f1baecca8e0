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

#include "codesmell/analysis/rule-test-utils.h"

#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "re2/re2.h"
#include "codesmell/analysis/finding.h"
#include "codesmell/analysis/rule-descriptor.h"
#include "codesmell/analysis/rule-registry.h"
#include "codesmell/common/text/ast-tree.h"
#include "codesmell/common/text/config-utils.h"
#include "codesmell/common/util/logging.h"

namespace codesmell {
namespace analysis {

std::string_view MiniKindName(NodeKind kind) {
  switch (static_cast<MiniKind>(kind)) {
    case MiniKind::kFile:
      return "file";
    case MiniKind::kClass:
      return "class";
    case MiniKind::kFunction:
      return "function";
    case MiniKind::kBlock:
      return "block";
    case MiniKind::kStatement:
      return "statement";
  }
  return "???";
}

namespace {
// Identifier at the start of 'text'.
std::string_view LeadingIdentifier(std::string_view text) {
  size_t end = 0;
  while (end < text.size() &&
         (absl::ascii_isalnum(text[end]) || text[end] == '_')) {
    ++end;
  }
  return text.substr(0, end);
}

// Offset of the first non-blank character of 'line' (or its size).
size_t FirstNonBlank(std::string_view line) {
  size_t pos = 0;
  while (pos < line.size() && absl::ascii_isblank(line[pos])) ++pos;
  return pos;
}
}  // namespace

absl::StatusOr<std::unique_ptr<ParsedFile>> ParseMiniSource(
    std::string_view path, std::string_view contents) {
  const int file_end = static_cast<int>(contents.size());
  auto root = std::make_unique<AstTreeNode>(KindOf(MiniKind::kFile),
                                            ByteRange{0, file_end});
  std::vector<AstTreeNode *> open_nodes = {root.get()};
  std::vector<std::string> pending_comments;

  int line_number = 0;
  size_t line_start = 0;
  while (line_start < contents.size()) {
    ++line_number;
    size_t line_end = contents.find('\n', line_start);
    if (line_end == std::string_view::npos) line_end = contents.size();
    std::string_view line = contents.substr(line_start, line_end - line_start);
    const int code_begin = static_cast<int>(line_start + FirstNonBlank(line));
    const size_t next_line_start = line_end + 1;

    // Split off a trailing comment.
    std::string_view trailing_comment;
    std::string_view code = absl::StripAsciiWhitespace(line);
    if (absl::StartsWith(code, "//!")) {
      root->AddComment(code);
      line_start = next_line_start;
      continue;
    }
    if (absl::StartsWith(code, "//") || absl::StartsWith(code, "@")) {
      pending_comments.emplace_back(code);
      line_start = next_line_start;
      continue;
    }
    const size_t comment_pos = code.find("//");
    if (comment_pos != std::string_view::npos) {
      trailing_comment = code.substr(comment_pos);
      code = absl::StripTrailingAsciiWhitespace(code.substr(0, comment_pos));
    }
    if (code.empty()) {
      line_start = next_line_start;
      continue;
    }
    const int code_end = code_begin + static_cast<int>(code.size());

    if (code == "}") {
      if (open_nodes.size() == 1) {
        return absl::InvalidArgumentError(
            absl::StrCat(path, ":", line_number, ": unbalanced '}'"));
      }
      AstTreeNode *closed = open_nodes.back();
      open_nodes.pop_back();
      closed->SetRange({closed->Range().begin, code_end});
      if (!trailing_comment.empty()) closed->AddComment(trailing_comment);
      line_start = next_line_start;
      continue;
    }

    const bool opens = absl::EndsWith(code, "{");
    const bool opens_and_closes = absl::EndsWith(code, "{}");
    MiniKind kind = MiniKind::kStatement;
    std::string_view name;
    if (opens || opens_and_closes) {
      kind = MiniKind::kBlock;
      if (absl::StartsWith(code, "class ")) {
        kind = MiniKind::kClass;
        name = LeadingIdentifier(
            absl::StripLeadingAsciiWhitespace(code.substr(6)));
      } else if (absl::StartsWith(code, "fun ")) {
        kind = MiniKind::kFunction;
        name = LeadingIdentifier(
            absl::StripLeadingAsciiWhitespace(code.substr(4)));
      }
    }

    const int node_end = (kind == MiniKind::kStatement || opens_and_closes)
                             ? code_end
                             : file_end;  // fixed up by the closing brace
    AstTreeNode &node =
        open_nodes.back()->AddChild(KindOf(kind), {code_begin, node_end});
    node.SetName(name);
    for (const auto &comment : pending_comments) node.AddComment(comment);
    pending_comments.clear();
    if (!trailing_comment.empty()) node.AddComment(trailing_comment);
    if (opens && !opens_and_closes) open_nodes.push_back(&node);

    line_start = next_line_start;
  }

  if (open_nodes.size() > 1) {
    return absl::InvalidArgumentError(absl::StrCat(
        path, ": ", open_nodes.size() - 1,
        " unclosed block(s) at end of file"));
  }
  return std::make_unique<ParsedFile>(std::string(path), std::string(contents),
                                      std::move(root));
}

void InMemoryAstProvider::AddFile(std::string_view path,
                                  std::string_view contents) {
  files_[std::string(path)] = std::string(contents);
}

void InMemoryAstProvider::AddFailingFile(std::string_view path,
                                         absl::Status status) {
  failures_[std::string(path)] = std::move(status);
}

absl::StatusOr<std::unique_ptr<ParsedFile>> InMemoryAstProvider::Parse(
    const std::string &path) const {
  {
    const std::lock_guard<std::mutex> l(lock_);
    parsed_paths_.push_back(path);
  }
  if (parse_hook_) parse_hook_(path);
  const auto failure = failures_.find(path);
  if (failure != failures_.end()) return failure->second;
  const auto file = files_.find(path);
  if (file == files_.end()) {
    return absl::NotFoundError(absl::StrCat(path, ": no such file"));
  }
  return ParseMiniSource(path, file->second);
}

std::vector<std::string> InMemoryAstProvider::ParsedPaths() const {
  const std::lock_guard<std::mutex> l(lock_);
  return parsed_paths_;
}

RuleDescriptor EmptyBlockRule() {
  RuleDescriptor rule;
  rule.id = "no-empty-block";
  rule.rule_set = "empty-blocks";
  rule.description = "Functions and blocks should not be empty.";
  rule.severity = Severity::kStyle;
  rule.node_interest = {KindOf(MiniKind::kFunction), KindOf(MiniKind::kBlock)};
  rule.visit = [](const AstNode &node, const RuleContext &,
                  FindingSink *sink) {
    if (node.NumChildren() == 0) sink->Report(node, "Empty block");
    return absl::OkStatus();
  };
  return rule;
}

RuleDescriptor NodeKindRule(std::string_view id, MiniKind kind,
                            Severity severity) {
  RuleDescriptor rule;
  rule.id = std::string(id);
  rule.severity = severity;
  rule.node_interest = {KindOf(kind)};
  rule.visit = [](const AstNode &node, const RuleContext &,
                  FindingSink *sink) {
    sink->Report(node, absl::StrCat("Found ", MiniKindName(node.Kind())));
    return absl::OkStatus();
  };
  return rule;
}

RuleDescriptor FailingRule(std::string_view id, MiniKind kind) {
  RuleDescriptor rule;
  rule.id = std::string(id);
  rule.node_interest = {KindOf(kind)};
  rule.visit = [](const AstNode &, const RuleContext &, FindingSink *) {
    return absl::InternalError("rule exploded");
  };
  return rule;
}

RuleDescriptor ThrowingRule(std::string_view id, MiniKind kind) {
  RuleDescriptor rule;
  rule.id = std::string(id);
  rule.node_interest = {KindOf(kind)};
  rule.visit = [](const AstNode &, const RuleContext &,
                  FindingSink *) -> absl::Status {
    throw std::runtime_error("rule threw");
  };
  return rule;
}

RuleDescriptor ThrowingNonStandardRule(std::string_view id, MiniKind kind) {
  RuleDescriptor rule;
  rule.id = std::string(id);
  rule.node_interest = {KindOf(kind)};
  rule.visit = [](const AstNode &, const RuleContext &,
                  FindingSink *) -> absl::Status { throw 42; };
  return rule;
}

namespace {
constexpr std::string_view kDefaultFunctionPattern = "[a-z][A-Za-z0-9]*";

absl::Status FunctionNamePattern(const RuleContext &context,
                                 std::unique_ptr<re2::RE2> *pattern) {
  *pattern = std::make_unique<re2::RE2>(kDefaultFunctionPattern);
  return ParseParameters(context.Parameters(),
                         {{"pattern", config::SetRegex(pattern)}});
}
}  // namespace

RuleDescriptor FunctionNamingRule() {
  RuleDescriptor rule;
  rule.id = "function-naming";
  rule.rule_set = "naming";
  rule.description = "Function names should follow the configured pattern.";
  rule.severity = Severity::kStyle;
  rule.debt_minutes = 2;
  rule.node_interest = {KindOf(MiniKind::kFunction)};
  rule.params = {{"pattern", std::string(kDefaultFunctionPattern),
                  "Regular expression function names must match."}};
  rule.visit = [](const AstNode &node, const RuleContext &context,
                  FindingSink *sink) {
    std::unique_ptr<re2::RE2> pattern;
    const absl::Status status = FunctionNamePattern(context, &pattern);
    if (!status.ok()) return status;
    if (!re2::RE2::FullMatch(node.Name(), *pattern)) {
      sink->Report(node, absl::StrCat("Function name '", node.Name(),
                                      "' does not match ",
                                      pattern->pattern()));
    }
    return absl::OkStatus();
  };
  rule.fix = [](const AstNode &node,
                const RuleContext &context) -> std::optional<AutoFix> {
    const std::string_view name = node.Name();
    if (name.empty() || !absl::ascii_isupper(name[0])) return std::nullopt;
    const std::string_view text = context.File().TextOf(node);
    const size_t name_pos = text.find(name);
    if (name_pos == std::string_view::npos) return std::nullopt;
    const int begin = node.Range().begin + static_cast<int>(name_pos);
    const std::string lower(1, absl::ascii_tolower(name[0]));
    return AutoFix("Lower-case first letter",
                   ReplacementEdit({begin, begin + 1}, lower));
  };
  return rule;
}

RuleDescriptor ClassMemberRule() {
  RuleDescriptor rule;
  rule.id = "class-members";
  rule.node_interest = {KindOf(MiniKind::kClass)};
  rule.visit = [](const AstNode &node, const RuleContext &,
                  FindingSink *sink) {
    for (size_t i = 0; i < node.NumChildren(); ++i) {
      const AstNode &child = node.ChildAt(i);
      if (child.Kind() == KindOf(MiniKind::kFunction)) {
        sink->Report(child, absl::StrCat("Member ", child.Name()));
      }
    }
    return absl::OkStatus();
  };
  return rule;
}

std::unique_ptr<RuleRegistry> MakeSealedRegistry(
    std::vector<RuleDescriptor> rules) {
  auto registry = std::make_unique<RuleRegistry>();
  for (auto &rule : rules) CHECK_OK(registry->Register(std::move(rule)));
  registry->Seal();
  return registry;
}

}  // namespace analysis
}  // namespace codesmell
