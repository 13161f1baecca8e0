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

#include "codesmell/analysis/rule-config.h"

#include <ostream>
#include <string>
#include <string_view>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "codesmell/common/text/config-utils.h"
#include "codesmell/common/util/container-util.h"

namespace codesmell {
namespace analysis {

absl::StatusOr<ConfigLayer> ParseConfigLayer(std::string_view name,
                                             std::string_view text,
                                             char separator) {
  ConfigLayer layer;
  layer.name = std::string(name);
  for (std::string_view part :
       absl::StrSplit(text, separator, absl::SkipEmpty())) {
    if (separator == '\n') {
      const auto comment_pos = part.find('#');
      if (comment_pos != std::string_view::npos) {
        part = part.substr(0, comment_pos);
      }
    }
    part = absl::StripAsciiWhitespace(part);
    if (part.empty()) continue;

    // If prefix is '-', the rule is disabled. For symmetry, we also allow
    // '+' to enable rule.
    const bool prefix_minus = (part[0] == '-');
    const bool has_prefix = (part[0] == '+' || prefix_minus);
    const std::string_view rule_with_config = part.substr(has_prefix ? 1 : 0);

    RuleOverride setting;
    setting.enabled = !prefix_minus;

    const auto equals_pos = rule_with_config.find('=');
    if (equals_pos != std::string_view::npos) {
      std::string_view parameters = rule_with_config.substr(equals_pos + 1);
      // Trim outer '"' if present.
      if (parameters.size() >= 2 && parameters.front() == '"' &&
          parameters.back() == '"') {
        parameters.remove_suffix(1);
        parameters.remove_prefix(1);
      }
      setting.parameters = config::SplitNameValues(parameters);
    }

    std::string_view rule_id = absl::StripAsciiWhitespace(
        rule_with_config.substr(0, equals_pos));
    const auto at_pos = rule_id.find('@');
    if (at_pos != std::string_view::npos) {
      const auto severity = ParseSeverity(
          absl::StripAsciiWhitespace(rule_id.substr(at_pos + 1)));
      if (!severity.ok()) {
        return absl::InvalidArgumentError(absl::StrCat(
            layer.name, ": '", part, "': ", severity.status().message()));
      }
      setting.severity = *severity;
      rule_id = absl::StripAsciiWhitespace(rule_id.substr(0, at_pos));
    }
    if (rule_id.empty()) {
      return absl::InvalidArgumentError(
          absl::StrCat(layer.name, ": '", part, "': missing rule id"));
    }

    // A rule mentioned twice keeps the fields of both, later ones winning.
    RuleOverride &entry = layer.rules[std::string(rule_id)];
    entry.enabled = setting.enabled;
    if (setting.severity.has_value()) entry.severity = setting.severity;
    if (setting.parameters.has_value()) {
      entry.parameters = std::move(setting.parameters);
    }
  }
  return layer;
}

const ResolvedRule *EffectiveConfig::Find(std::string_view rule_id) const {
  return container::FindOrNull(rules, rule_id);
}

bool EffectiveConfig::IsEnabled(std::string_view rule_id) const {
  const ResolvedRule *rule = Find(rule_id);
  return rule != nullptr && rule->enabled;
}

std::ostream &operator<<(std::ostream &stream, const EffectiveConfig &config) {
  for (const auto &[id, rule] : config.rules) {
    stream << (rule.enabled ? '+' : '-') << id << '@' << rule.severity;
    if (!rule.parameters.empty()) {
      stream << '=' << absl::StrJoin(rule.parameters, ";",
                                     absl::PairFormatter(":"));
    }
    if (!rule.excludes.empty()) {
      stream << " excludes[" << absl::StrJoin(rule.excludes, ",") << ']';
    }
    stream << '\n';
  }
  if (!config.excludes.empty()) {
    stream << "excludes: " << absl::StrJoin(config.excludes, ",") << '\n';
  }
  stream << "fail_fast: " << (config.fail_fast ? "true" : "false") << '\n';
  for (const auto &note : config.notes) stream << "note: " << note << '\n';
  return stream;
}

}  // namespace analysis
}  // namespace codesmell
