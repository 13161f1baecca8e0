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

// Configuration value types.  Callers reduce whatever configuration sources
// they have (files, flags, build scripts) to ConfigLayers; the resolver in
// configuration-resolver.h merges them into one EffectiveConfig.

#ifndef CODESMELL_ANALYSIS_RULE_CONFIG_H_
#define CODESMELL_ANALYSIS_RULE_CONFIG_H_

#include <functional>
#include <iosfwd>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "absl/status/statusor.h"
#include "codesmell/analysis/finding.h"
#include "codesmell/analysis/severity.h"
#include "codesmell/common/text/config-utils.h"

namespace codesmell {
namespace analysis {

// Base set of rules that resolution starts from.
//   kNone     no rules are enabled
//   kDefault  rules are enabled according to their default_enabled flag
//   kAll      all rules are enabled
enum class BaseRuleSet { kNone, kDefault, kAll };

// One layer's settings for one rule.  Unset fields leave the value from
// earlier layers untouched; set fields replace it entirely.
struct RuleOverride {
  std::optional<bool> enabled;
  std::optional<Severity> severity;
  std::optional<config::ParameterMap> parameters;
  // Path globs of files this rule does not run on.
  std::optional<std::vector<std::string>> excludes;

  bool operator==(const RuleOverride &r) const {
    return enabled == r.enabled && severity == r.severity &&
           parameters == r.parameters && excludes == r.excludes;
  }
};

// A partial configuration, e.g. the defaults, a user's global file, a module
// override, or in-file overrides.
struct ConfigLayer {
  std::string name;  // for diagnostics
  std::map<std::string, RuleOverride, std::less<>> rules;
  // Rule set name to active flag.  Rules of an inactive set are disabled.
  std::map<std::string, bool, std::less<>> rule_sets;
  // Path globs of files not analyzed at all.  Additive across layers.
  std::vector<std::string> excludes;
};

// Parses a compact layer description, a list of rule settings separated by
// 'separator':
//   "rule"  or "+rule"   enables rule
//   "-rule"              disables rule
//   "rule=name:value;.." sets parameters (and enables, unless prefixed '-')
//   "rule@severity"      overrides the severity
// With '\n' as separator, '#' starts a comment that runs to the end of line.
// Rule ids are not validated here.
absl::StatusOr<ConfigLayer> ParseConfigLayer(std::string_view name,
                                             std::string_view text,
                                             char separator = ',');

// Everything the caller knows about the module to analyze.
struct ModuleConfig {
  std::string module_name;
  // Ordered from lowest to highest precedence:
  // default < global < module < in-file.
  std::vector<ConfigLayer> layers;
  std::vector<std::string> excludes;
  bool fail_fast = false;
};

struct ResolvedRule {
  bool enabled = false;
  Severity severity = Severity::kWarning;
  config::ParameterMap parameters;
  std::vector<std::string> excludes;

  bool operator==(const ResolvedRule &r) const {
    return enabled == r.enabled && severity == r.severity &&
           parameters == r.parameters && excludes == r.excludes;
  }
};

// The fully merged configuration governing one analysis run.
struct EffectiveConfig {
  // Every registered rule, by id.
  std::map<std::string, ResolvedRule, std::less<>> rules;
  // Sorted, de-duplicated union of all exclude globs.
  std::vector<std::string> excludes;
  bool fail_fast = false;

  // Problems found while resolving (unknown rule ids, invalid globs).
  std::vector<Diagnostic> warnings;
  // Informational notes, e.g. rules disabled in degraded mode.
  std::vector<std::string> notes;

  // Returns the resolved settings of a rule, or nullptr if unknown.
  const ResolvedRule *Find(std::string_view rule_id) const;
  bool IsEnabled(std::string_view rule_id) const;

  // Compares the configuration proper.  'warnings' are diagnostics about the
  // input and are not compared.
  bool operator==(const EffectiveConfig &r) const {
    return rules == r.rules && excludes == r.excludes &&
           fail_fast == r.fail_fast && notes == r.notes;
  }
  bool operator!=(const EffectiveConfig &r) const { return !(*this == r); }
};

std::ostream &operator<<(std::ostream &, const EffectiveConfig &);

}  // namespace analysis
}  // namespace codesmell

#endif  // CODESMELL_ANALYSIS_RULE_CONFIG_H_
