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

#include "codesmell/analysis/configuration-resolver.h"

#include <functional>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "absl/strings/str_cat.h"
#include "codesmell/analysis/finding.h"
#include "codesmell/analysis/path-matcher.h"
#include "codesmell/analysis/rule-config.h"
#include "codesmell/analysis/rule-registry.h"
#include "codesmell/common/util/container-util.h"
#include "codesmell/common/util/logging.h"

namespace codesmell {
namespace analysis {

namespace {
void ApplyOverride(const RuleOverride &setting, ResolvedRule *rule) {
  if (setting.enabled.has_value()) rule->enabled = *setting.enabled;
  if (setting.severity.has_value()) rule->severity = *setting.severity;
  if (setting.parameters.has_value()) rule->parameters = *setting.parameters;
  if (setting.excludes.has_value()) rule->excludes = *setting.excludes;
}

void MergeOverride(const RuleOverride &later, RuleOverride *earlier) {
  if (later.enabled.has_value()) earlier->enabled = later.enabled;
  if (later.severity.has_value()) earlier->severity = later.severity;
  if (later.parameters.has_value()) earlier->parameters = later.parameters;
  if (later.excludes.has_value()) earlier->excludes = later.excludes;
}

// Drops globs that do not compile and warns about them.  Each glob is
// compiled on its own, so one bad glob cannot disable the others.
std::vector<std::string> ValidGlobs(const std::vector<std::string> &globs,
                                    std::string_view rule_id,
                                    std::vector<Diagnostic> *warnings) {
  std::vector<std::string> result;
  for (const auto &glob : globs) {
    const auto matcher = PathMatcher::Create({glob});
    if (!matcher.ok()) {
      warnings->push_back({DiagnosticKind::kInvalidConfiguration, "",
                           std::string(rule_id),
                           std::string(matcher.status().message())});
      continue;
    }
    result.push_back(glob);
  }
  return result;
}
}  // namespace

EffectiveConfig ResolveConfiguration(const ModuleConfig &module,
                                     const RuleRegistry &registry,
                                     const ResolveOptions &options) {
  EffectiveConfig result;
  result.fail_fast = module.fail_fast;

  for (const RuleDescriptor *rule : registry.All()) {
    ResolvedRule resolved;
    resolved.severity = rule->severity;
    switch (options.base) {
      case BaseRuleSet::kNone:
        resolved.enabled = false;
        break;
      case BaseRuleSet::kDefault:
        resolved.enabled = rule->default_enabled;
        break;
      case BaseRuleSet::kAll:
        resolved.enabled = true;
        break;
    }
    result.rules.emplace(rule->id, std::move(resolved));
  }

  std::set<std::string> excludes(module.excludes.begin(),
                                 module.excludes.end());
  std::map<std::string, bool, std::less<>> rule_set_active;
  for (const ConfigLayer &layer : module.layers) {
    VLOG(2) << "Applying configuration layer '" << layer.name << "'";
    for (const auto &[rule_id, setting] : layer.rules) {
      const auto found = result.rules.find(rule_id);
      if (found == result.rules.end()) {
        VLOG(1) << "Unknown rule id '" << rule_id << "' in layer '"
                << layer.name << "'";
        result.warnings.push_back(
            {DiagnosticKind::kUnknownRuleId, "", rule_id,
             absl::StrCat("Unknown rule id in configuration layer '",
                          layer.name, "'")});
        continue;
      }
      ApplyOverride(setting, &found->second);
    }
    for (const auto &[rule_set, active] : layer.rule_sets) {
      rule_set_active[rule_set] = active;
    }
    excludes.insert(layer.excludes.begin(), layer.excludes.end());
  }
  result.excludes = ValidGlobs(std::vector<std::string>(excludes.begin(),
                                                        excludes.end()),
                               "", &result.warnings);

  for (const RuleDescriptor *rule : registry.All()) {
    ResolvedRule &resolved = result.rules[rule->id];
    resolved.excludes =
        ValidGlobs(resolved.excludes, rule->id, &result.warnings);
    if (!container::FindWithDefault(rule_set_active, rule->rule_set, true)) {
      resolved.enabled = false;
    }
    if (resolved.enabled && rule->requires_extra_context &&
        !options.extra_context_available) {
      resolved.enabled = false;
      result.notes.push_back(
          absl::StrCat("Rule '", rule->id,
                       "' disabled: it requires semantic context that is not "
                       "available in this run"));
    }
  }
  return result;
}

ConfigLayer MergeLayers(const ConfigLayer &first, const ConfigLayer &second) {
  ConfigLayer merged = first;
  merged.name = absl::StrCat(first.name, "+", second.name);
  for (const auto &[rule_id, setting] : second.rules) {
    MergeOverride(setting, &merged.rules[rule_id]);
  }
  for (const auto &[rule_set, active] : second.rule_sets) {
    merged.rule_sets[rule_set] = active;
  }
  merged.excludes.insert(merged.excludes.end(), second.excludes.begin(),
                         second.excludes.end());
  return merged;
}

}  // namespace analysis
}  // namespace codesmell
