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

#include "codesmell/analysis/finding.h"

#include <ostream>
#include <set>
#include <string>
#include <string_view>
#include <tuple>

#include "absl/strings/str_cat.h"
#include "codesmell/common/util/logging.h"

namespace codesmell {
namespace analysis {

std::string AutoFix::Apply(std::string_view base) const {
  std::string result;
  int prev_end = 0;
  for (const auto &edit : edits_) {
    CHECK_LE(prev_end, edit.fragment.begin);
    CHECK_LE(edit.fragment.end, static_cast<int>(base.size()));
    absl::StrAppend(&result,
                    base.substr(prev_end, edit.fragment.begin - prev_end),
                    edit.replacement);
    prev_end = edit.fragment.end;
  }
  absl::StrAppend(&result, base.substr(prev_end));
  return result;
}

bool AutoFix::AddEdits(const std::set<ReplacementEdit> &new_edits) {
  for (const auto &edit : new_edits) {
    if (edits_.find(edit) != edits_.end()) return false;
  }
  // Edits within 'new_edits' are non-overlapping by construction of the set.
  edits_.insert(new_edits.cbegin(), new_edits.cend());
  return true;
}

std::ostream &operator<<(std::ostream &stream, const Location &location) {
  const LineColumn &start = location.range.start;
  const LineColumn &end = location.range.end;
  stream << location.path << ':' << start.line + 1 << ':' << start.column + 1;
  if (end.line == start.line) {
    if (end.column > start.column + 1) stream << '-' << end.column;
  } else {
    stream << '-' << end.line + 1 << ':' << end.column;
  }
  return stream;
}

bool Finding::operator<(const Finding &r) const {
  return std::tie(location, rule_id, message, fingerprint, severity) <
         std::tie(r.location, r.rule_id, r.message, r.fingerprint, r.severity);
}

bool Finding::operator==(const Finding &r) const {
  return rule_id == r.rule_id && severity == r.severity &&
         location == r.location && message == r.message &&
         entity_signature == r.entity_signature &&
         fingerprint == r.fingerprint && debt_minutes == r.debt_minutes;
}

std::ostream &operator<<(std::ostream &stream, const Finding &finding) {
  stream << finding.location << ": " << finding.severity << ": "
         << finding.message << " [" << finding.rule_id << "]";
  if (finding.autofix.has_value()) {
    stream << " (autofix: " << finding.autofix->Description() << ")";
  }
  return stream;
}

std::string_view DiagnosticKindName(DiagnosticKind kind) {
  switch (kind) {
    case DiagnosticKind::kParseFailure:
      return "parse-failure";
    case DiagnosticKind::kInternalRuleError:
      return "internal-rule-error";
    case DiagnosticKind::kIncomplete:
      return "incomplete";
    case DiagnosticKind::kUnknownRuleId:
      return "unknown-rule-id";
    case DiagnosticKind::kBaselineError:
      return "baseline-error";
    case DiagnosticKind::kInvalidConfiguration:
      return "invalid-configuration";
  }
  return "???";
}

std::ostream &operator<<(std::ostream &stream, DiagnosticKind kind) {
  return stream << DiagnosticKindName(kind);
}

bool Diagnostic::operator<(const Diagnostic &r) const {
  return std::tie(path, rule_id, kind, message) <
         std::tie(r.path, r.rule_id, r.kind, r.message);
}

bool Diagnostic::operator==(const Diagnostic &r) const {
  return kind == r.kind && path == r.path && rule_id == r.rule_id &&
         message == r.message;
}

std::ostream &operator<<(std::ostream &stream, const Diagnostic &diagnostic) {
  if (!diagnostic.path.empty()) stream << diagnostic.path << ": ";
  stream << diagnostic.kind << ": " << diagnostic.message;
  if (!diagnostic.rule_id.empty()) stream << " [" << diagnostic.rule_id << "]";
  return stream;
}

}  // namespace analysis
}  // namespace codesmell
