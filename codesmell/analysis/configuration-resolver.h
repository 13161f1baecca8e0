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

// Merges layered configuration into the EffectiveConfig of one module.
//
// Usage:
//   ModuleConfig module;
//   module.layers = {defaults, global, module_overrides};
//   ResolveOptions options;
//   options.extra_context_available = false;
//   const EffectiveConfig config =
//       ResolveConfiguration(module, registry, options);

#ifndef CODESMELL_ANALYSIS_CONFIGURATION_RESOLVER_H_
#define CODESMELL_ANALYSIS_CONFIGURATION_RESOLVER_H_

#include "codesmell/analysis/rule-config.h"
#include "codesmell/analysis/rule-registry.h"

namespace codesmell {
namespace analysis {

struct ResolveOptions {
  BaseRuleSet base = BaseRuleSet::kDefault;
  // False in degraded runs: rules that require extra semantic context are
  // then disabled, and a note says so.
  bool extra_context_available = true;
};

// Starts from the base rule set (default severities, no parameters) and
// applies the layers of 'module' in order.  For each rule a layer mentions,
// every field the layer sets replaces the earlier value; parameters and
// per-rule excludes are replaced as a whole.  Rule set flags are replaced
// too, and a rule only stays enabled if its rule set is active.  Excludes of
// the module and all layers are united.
//
// Rule ids unknown to 'registry' and malformed globs become warnings; they
// never abort resolution.
EffectiveConfig ResolveConfiguration(const ModuleConfig &module,
                                     const RuleRegistry &registry,
                                     const ResolveOptions &options = {});

// Combines two layers into one that has the same effect as applying 'first'
// then 'second'.  Resolving [A, B, C] equals resolving
// [MergeLayers(A, B), C].
ConfigLayer MergeLayers(const ConfigLayer &first, const ConfigLayer &second);

}  // namespace analysis
}  // namespace codesmell

#endif  // CODESMELL_ANALYSIS_CONFIGURATION_RESOLVER_H_
