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

// Findings and diagnostics: what an analysis run reports.

#ifndef CODESMELL_ANALYSIS_FINDING_H_
#define CODESMELL_ANALYSIS_FINDING_H_

#include <initializer_list>
#include <iosfwd>
#include <optional>
#include <set>
#include <string>
#include <string_view>

#include "codesmell/analysis/severity.h"
#include "codesmell/common/strings/line-column-map.h"
#include "codesmell/common/text/ast-node.h"
#include "codesmell/common/util/logging.h"

namespace codesmell {
namespace analysis {

// Represents a single replace operation on a text fragment, addressed by
// byte offsets into the file contents.
//
// Either fragment or replacement can have zero width, providing a way for,
// respectively, inserting and removing text.
struct ReplacementEdit {
  ReplacementEdit(ByteRange fragment, std::string_view replacement)
      : fragment(fragment), replacement(replacement) {}

  bool operator<(const ReplacementEdit &other) const {
    // When fragments overlap, both `this<other` and `other<this` are false,
    // which makes them equivalent in std::set.
    return fragment.end <= other.fragment.begin &&
           !(fragment.size() == 0 && other.fragment.size() == 0 &&
             fragment.begin == other.fragment.begin);
  }

  ByteRange fragment;
  std::string replacement;
};

// Collection of non-overlapping ReplacementEdits performing a single fix.
class AutoFix {
 public:
  AutoFix() = default;

  AutoFix(std::string_view description,
          std::initializer_list<ReplacementEdit> edits)
      : description_(description), edits_(edits) {
    CHECK_EQ(edits_.size(), edits.size()) << "Edits must not overlap.";
  }

  AutoFix(std::string_view description, const ReplacementEdit &edit)
      : AutoFix(description, {edit}) {}

  // Applies the fix on a `base` and returns modified text.
  std::string Apply(std::string_view base) const;

  // Adds all of 'new_edits' unless one of them overlaps an existing edit, in
  // which case nothing is added and false is returned.
  bool AddEdits(const std::set<ReplacementEdit> &new_edits);

  const std::set<ReplacementEdit> &Edits() const { return edits_; }
  const std::string &Description() const { return description_; }

 private:
  std::string description_;
  std::set<ReplacementEdit> edits_;
};

// Where a finding is: the file and the 0-based line/column range.
// Printed 1-based, e.g. "src/A.kt:3:5-9".
struct Location {
  std::string path;
  LineColumnRange range;

  bool operator==(const Location &r) const {
    return path == r.path && range == r.range;
  }
  bool operator<(const Location &r) const {
    if (path != r.path) return path < r.path;
    return range < r.range;
  }
};

std::ostream &operator<<(std::ostream &, const Location &);

// A single reported rule violation.
struct Finding {
  std::string rule_id;
  Severity severity = Severity::kWarning;
  Location location;
  std::string message;

  // Structural identity of the offending element, independent of line
  // numbers.  See fingerprint.h.
  std::string entity_signature;
  std::string fingerprint;

  // Estimated remediation effort.
  int debt_minutes = 0;

  // Present only when auto-correct is requested and the rule offers a fix.
  std::optional<AutoFix> autofix;

  // Orders by location, then rule id, then message.
  bool operator<(const Finding &r) const;
  bool operator==(const Finding &r) const;
};

std::ostream &operator<<(std::ostream &, const Finding &);

// Problems that are not rule violations, isolated to a file or a rule.
enum class DiagnosticKind {
  kParseFailure,          // The AST provider could not parse the file.
  kInternalRuleError,     // A rule's visit callback failed.
  kIncomplete,            // Analysis of the file was cancelled or timed out.
  kUnknownRuleId,         // Configuration mentions a rule that does not exist.
  kBaselineError,         // The baseline could not be read or written.
  kInvalidConfiguration,  // A configuration value was rejected.
};

std::string_view DiagnosticKindName(DiagnosticKind kind);
std::ostream &operator<<(std::ostream &, DiagnosticKind);

struct Diagnostic {
  DiagnosticKind kind;
  std::string path;     // empty when not tied to a file
  std::string rule_id;  // empty when not tied to a rule
  std::string message;

  // Orders by path, then rule id, then kind, then message.
  bool operator<(const Diagnostic &r) const;
  bool operator==(const Diagnostic &r) const;
};

std::ostream &operator<<(std::ostream &, const Diagnostic &);

}  // namespace analysis
}  // namespace codesmell

#endif  // CODESMELL_ANALYSIS_FINDING_H_
