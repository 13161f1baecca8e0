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

#include "codesmell/analysis/rule-registry.h"

#include <functional>
#include <memory>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "codesmell/common/util/logging.h"

namespace codesmell {
namespace analysis {

absl::Status RuleRegistry::Register(RuleDescriptor descriptor) {
  if (sealed_) {
    return absl::FailedPreconditionError(absl::StrCat(
        "Rule registry is sealed; cannot register '", descriptor.id, "'"));
  }
  if (descriptor.id.empty()) {
    return absl::InvalidArgumentError("Rule id must not be empty");
  }
  if (!descriptor.visit) {
    return absl::InvalidArgumentError(
        absl::StrCat("Rule '", descriptor.id, "' has no visit callback"));
  }
  if (rules_.find(descriptor.id) != rules_.end()) {
    return absl::AlreadyExistsError(
        absl::StrCat("Duplicate rule id '", descriptor.id, "'"));
  }
  VLOG(2) << "Registering rule " << descriptor.id;
  std::string id = descriptor.id;
  rules_.emplace(std::move(id),
                 std::make_unique<const RuleDescriptor>(std::move(descriptor)));
  return absl::OkStatus();
}

const RuleDescriptor *RuleRegistry::Lookup(std::string_view id) const {
  const auto found = rules_.find(id);
  return found == rules_.end() ? nullptr : found->second.get();
}

std::vector<const RuleDescriptor *> RuleRegistry::All() const {
  std::vector<const RuleDescriptor *> result;
  result.reserve(rules_.size());
  for (const auto &rule : rules_) result.push_back(rule.second.get());
  return result;
}

RuleRegistry *GlobalRuleRegistry() {
  // Function local static pointer avoids initialization order issues.
  static auto *registry = new RuleRegistry();
  return registry;
}

RuleRegisterer::RuleRegisterer(
    const std::function<RuleDescriptor()> &descriptor) {
  CHECK_OK(GlobalRuleRegistry()->Register(descriptor()));
}

}  // namespace analysis
}  // namespace codesmell
