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

#include "codesmell/common/text/config-utils.h"

#include <algorithm>
#include <initializer_list>
#include <limits>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "re2/re2.h"
#include "codesmell/common/util/logging.h"

namespace codesmell {
using config::NVConfigSpec;

namespace {
absl::Status UnknownParameterError(
    std::string_view name, const std::initializer_list<NVConfigSpec> &spec) {
  std::string available;
  for (const auto &s : spec) {
    if (!available.empty()) available.append(", ");
    available.append("'").append(s.name).append("'");
  }
  if (available.empty()) {
    return absl::InvalidArgumentError(
        absl::StrCat(name, ": unknown parameter; no parameters supported"));
  }
  const bool plural = spec.size() > 1;
  return absl::InvalidArgumentError(
      absl::StrCat(name, ": unknown parameter; supported ",
                   (plural ? "parameters are " : "parameter is "), available));
}

absl::Status SetOneValue(std::string_view name, std::string_view value,
                         const std::initializer_list<NVConfigSpec> &spec) {
  const auto value_config =
      std::find_if(spec.begin(), spec.end(),
                   [name](const NVConfigSpec &s) { return name == s.name; });
  if (value_config == spec.end()) return UnknownParameterError(name, spec);
  if (!value_config->set_value) return absl::OkStatus();  // consume, not use.
  const absl::Status result = value_config->set_value(value);
  if (!result.ok()) {
    // The parameter name is always prepended, so setters only need to worry
    // about parsing.
    return absl::InvalidArgumentError(
        absl::StrCat(name, ": ", result.message()));
  }
  return absl::OkStatus();
}
}  // namespace

absl::Status ParseNameValues(std::string_view config_string,
                             const std::initializer_list<NVConfigSpec> &spec) {
  for (const std::string_view single_config :
       absl::StrSplit(config_string, ';', absl::SkipWhitespace())) {
    const std::pair<std::string_view, std::string_view> nv_pair =
        absl::StrSplit(single_config, absl::MaxSplits(':', 1));
    const absl::Status status =
        SetOneValue(absl::StripAsciiWhitespace(nv_pair.first),
                    absl::StripAsciiWhitespace(nv_pair.second), spec);
    if (!status.ok()) return status;
  }
  return absl::OkStatus();
}

absl::Status ParseParameters(const config::ParameterMap &parameters,
                             const std::initializer_list<NVConfigSpec> &spec) {
  for (const auto &[name, value] : parameters) {
    const absl::Status status = SetOneValue(name, value, spec);
    if (!status.ok()) return status;
  }
  return absl::OkStatus();
}

namespace config {
ParameterMap SplitNameValues(std::string_view config_string) {
  ParameterMap result;
  for (const std::string_view single_config :
       absl::StrSplit(config_string, ';', absl::SkipWhitespace())) {
    const std::pair<std::string_view, std::string_view> nv_pair =
        absl::StrSplit(single_config, absl::MaxSplits(':', 1));
    result[std::string(absl::StripAsciiWhitespace(nv_pair.first))] =
        std::string(absl::StripAsciiWhitespace(nv_pair.second));
  }
  return result;
}

ConfigValueSetter SetInt(int *value, int minimum, int maximum) {
  CHECK(value) << "Must provide pointer to integer to store.";
  return [value, minimum, maximum](std::string_view v) {
    int parsed_value;
    if (!absl::SimpleAtoi(v, &parsed_value)) {
      return absl::InvalidArgumentError(
          absl::StrCat("'", v, "': Cannot parse integer"));
    }
    if (parsed_value < minimum || parsed_value > maximum) {
      return absl::InvalidArgumentError(absl::StrCat(
          parsed_value, " out of range [", minimum, "...", maximum, "]"));
    }
    *value = parsed_value;
    return absl::OkStatus();
  };
}

ConfigValueSetter SetInt(int *value) {
  return SetInt(value, std::numeric_limits<int>::min(),
                std::numeric_limits<int>::max());
}

ConfigValueSetter SetBool(bool *value) {
  CHECK(value) << "Must provide pointer to boolean to store.";
  return [value](std::string_view v) {
    // clang-format off
    if (v.empty() || v == "1"
        || absl::EqualsIgnoreCase(v, "true")
        || absl::EqualsIgnoreCase(v, "on")) {
      *value = true;
      return absl::OkStatus();
    }
    if (v == "0"
        || absl::EqualsIgnoreCase(v, "false")
        || absl::EqualsIgnoreCase(v, "off")) {
      *value = false;
      return absl::OkStatus();
    }
    // clang-format on
    return absl::InvalidArgumentError(
        "Boolean value should be one of 'true', 'on' or 'false', 'off'");
  };
}

ConfigValueSetter SetString(std::string *value) {
  CHECK(value) << "Must provide pointer to string to store.";
  return [value](std::string_view v) {
    value->assign(v.data(), v.length());
    return absl::OkStatus();
  };
}

ConfigValueSetter SetStringOneOf(std::string *value,
                                 const std::vector<std::string_view> &allowed) {
  CHECK(value) << "Must provide pointer to string to store.";
  return [value, allowed](std::string_view v) {
    const auto item = std::find(allowed.begin(), allowed.end(), v);
    if (item == allowed.end()) {
      if (allowed.size() == 1) {
        return absl::InvalidArgumentError(absl::StrCat(
            "Value can only be '", allowed[0], "'; got '", v, "'"));
      }
      return absl::InvalidArgumentError(
          absl::StrCat("Value can only be one of ['",
                       absl::StrJoin(allowed, "', '"), "']; got '", v, "'"));
    }
    value->assign(v.data(), v.length());
    return absl::OkStatus();
  };
}

ConfigValueSetter SetStringList(std::vector<std::string> *values) {
  CHECK(values) << "Must provide pointer to vector to store.";
  return [values](std::string_view v) {
    values->clear();
    for (std::string_view element :
         absl::StrSplit(v, ',', absl::SkipWhitespace())) {
      values->emplace_back(absl::StripAsciiWhitespace(element));
    }
    return absl::OkStatus();
  };
}

ConfigValueSetter SetRegex(std::unique_ptr<re2::RE2> *regex) {
  CHECK(regex) << "Must provide pointer to a RE2 to store.";
  return [regex](std::string_view v) {
    auto parsed = std::make_unique<re2::RE2>(v, re2::RE2::Quiet);
    if (!parsed->ok()) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Failed to parse regular expression: ", parsed->error()));
    }
    *regex = std::move(parsed);
    return absl::OkStatus();
  };
}

}  // namespace config
}  // namespace codesmell
