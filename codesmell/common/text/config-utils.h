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

#ifndef CODESMELL_COMMON_TEXT_CONFIG_UTILS_H_
#define CODESMELL_COMMON_TEXT_CONFIG_UTILS_H_

#include <functional>
#include <initializer_list>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "absl/status/status.h"
#include "re2/re2.h"

namespace codesmell {
namespace config {
using ConfigValueSetter = std::function<absl::Status(std::string_view)>;

struct NVConfigSpec {
  const char *name;
  ConfigValueSetter set_value;
};

// Rule parameters as they arrive from configuration layers: name to raw
// string value.
using ParameterMap = std::map<std::string, std::string, std::less<>>;
}  // namespace config

// Parses name/value pairs from a string and directly sets user values.
//
// The "config_string" contains a list of colon-separated name:value-pairs,
// separated by semicolon.  So 'max:30; ignore_private:on' would be a valid
// string.
//
// For a parsed name/value pair, the setter associated with that name in
// "spec" is called with the value.  Names not found in "spec" are an error.
//
// Sample call:
// return ParseNameValues(configuration_string,
//                        {{"threshold", SetInt(&threshold_)},
//                         {"pattern", SetRegex(&pattern_)}});
absl::Status ParseNameValues(
    std::string_view config_string,
    const std::initializer_list<config::NVConfigSpec> &spec);

// Same as ParseNameValues(), for parameters that are already split into
// a name to value map.  Setters are called in name order.
absl::Status ParseParameters(
    const config::ParameterMap &parameters,
    const std::initializer_list<config::NVConfigSpec> &spec);

namespace config {

// Splits "name:value; name2:value2" into a ParameterMap without interpreting
// values.  A later duplicate name replaces an earlier one.
ParameterMap SplitNameValues(std::string_view config_string);

// Setter factories for ParseNameValues() and ParseParameters(), parsing
// values directly into variables.

ConfigValueSetter SetInt(int *value);

// Set an integer value and validate that it is in [minimum...maximum] range.
ConfigValueSetter SetInt(int *value, int minimum, int maximum);
ConfigValueSetter SetBool(bool *value);
ConfigValueSetter SetString(std::string *value);

// Set a string, but verify that it is only one of a limited set. The
// set is provided as vector to allow the caller to impose a particular order
// when returning an error.
ConfigValueSetter SetStringOneOf(std::string *value,
                                 const std::vector<std::string_view> &allowed);

// Set a comma-separated list of strings; surrounding whitespace of each
// element is removed and empty elements are skipped.
ConfigValueSetter SetStringList(std::vector<std::string> *values);

// Set a Regex
ConfigValueSetter SetRegex(std::unique_ptr<re2::RE2> *regex);

}  // namespace config
}  // namespace codesmell

#endif  // CODESMELL_COMMON_TEXT_CONFIG_UTILS_H_
