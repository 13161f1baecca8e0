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

// RuleRegistry is the catalog of rules available to an analysis.
//
// Registration happens during startup; Seal() then closes the registry, after
// which it is read-only and may be shared freely between threads.
//
// Rules are usually registered with the process-wide registry from their own
// source file:
//
//   (in my-rule.cc):
//   static RuleDescriptor MyRule() {
//     RuleDescriptor rule;
//     rule.id = "my-rule";
//     rule.node_interest = {KindOf(MyLanguage::kFunction)};
//     rule.visit = ...;
//     return rule;
//   }
//   CODESMELL_REGISTER_RULE(MyRule);
//
// Registration failures there (duplicate id, sealed registry) are fatal.

#ifndef CODESMELL_ANALYSIS_RULE_REGISTRY_H_
#define CODESMELL_ANALYSIS_RULE_REGISTRY_H_

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "absl/status/status.h"
#include "codesmell/analysis/rule-descriptor.h"

namespace codesmell {
namespace analysis {

class RuleRegistry {
 public:
  RuleRegistry() = default;

  RuleRegistry(const RuleRegistry &) = delete;
  RuleRegistry &operator=(const RuleRegistry &) = delete;

  // Adds a rule.  Fails with
  //   kAlreadyExists if a rule with the same id is registered,
  //   kFailedPrecondition if the registry is sealed,
  //   kInvalidArgument if the id is empty or there is no visit callback.
  absl::Status Register(RuleDescriptor descriptor);

  // Closes the registry for registration.  Idempotent.
  void Seal() { sealed_ = true; }
  bool IsSealed() const { return sealed_; }

  // Returns the rule with the given id, or nullptr.
  const RuleDescriptor *Lookup(std::string_view id) const;

  // Returns all rules, ascending by id.
  std::vector<const RuleDescriptor *> All() const;

  size_t size() const { return rules_.size(); }

 private:
  bool sealed_ = false;
  // unique_ptr keeps descriptor addresses stable.
  std::map<std::string, std::unique_ptr<const RuleDescriptor>, std::less<>>
      rules_;
};

// Process-wide registry that CODESMELL_REGISTER_RULE adds to.
RuleRegistry *GlobalRuleRegistry();

// Static objects of type RuleRegisterer add a rule to GlobalRuleRegistry()
// during static initialization.  Use CODESMELL_REGISTER_RULE to create them.
class RuleRegisterer {
 public:
  explicit RuleRegisterer(const std::function<RuleDescriptor()> &descriptor);
};

// 'descriptor_function' is a function returning a RuleDescriptor.
#define CODESMELL_REGISTER_RULE(descriptor_function)     \
  static ::codesmell::analysis::RuleRegisterer           \
      __##descriptor_function##__registerer(descriptor_function);

}  // namespace analysis
}  // namespace codesmell

#endif  // CODESMELL_ANALYSIS_RULE_REGISTRY_H_
