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

#include "codesmell/analysis/path-matcher.h"

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "re2/re2.h"
#include "codesmell/common/util/status-macros.h"

namespace codesmell {
namespace analysis {

absl::StatusOr<std::string> GlobToRegex(std::string_view glob) {
  std::string regex;
  int brace_depth = 0;
  for (size_t i = 0; i < glob.size(); ++i) {
    const char c = glob[i];
    switch (c) {
      case '*':
        if (i + 1 < glob.size() && glob[i + 1] == '*') {
          ++i;
          if (i + 1 < glob.size() && glob[i + 1] == '/') {
            ++i;
            regex.append("(?:.*/)?");
          } else {
            regex.append(".*");
          }
        } else {
          regex.append("[^/]*");
        }
        break;
      case '?':
        regex.append("[^/]");
        break;
      case '[': {
        const size_t close = glob.find(']', i + 2);
        if (close == std::string_view::npos) {
          return absl::InvalidArgumentError(
              absl::StrCat("Unterminated '[' in glob '", glob, "'"));
        }
        std::string_view members = glob.substr(i + 1, close - i - 1);
        regex.push_back('[');
        if (members.front() == '!' || members.front() == '^') {
          regex.push_back('^');
          members.remove_prefix(1);
        }
        for (const char m : members) {
          if (m == '\\' || m == '[' || m == ']') regex.push_back('\\');
          regex.push_back(m);
        }
        regex.push_back(']');
        i = close;
        break;
      }
      case '{':
        ++brace_depth;
        regex.append("(?:");
        break;
      case '}':
        if (brace_depth == 0) {
          return absl::InvalidArgumentError(
              absl::StrCat("Unbalanced '}' in glob '", glob, "'"));
        }
        --brace_depth;
        regex.push_back(')');
        break;
      case ',':
        regex.append(brace_depth > 0 ? "|" : ",");
        break;
      default:
        regex.append(RE2::QuoteMeta(std::string_view(&glob[i], 1)));
    }
  }
  if (brace_depth != 0) {
    return absl::InvalidArgumentError(
        absl::StrCat("Unbalanced '{' in glob '", glob, "'"));
  }
  return regex;
}

absl::StatusOr<PathMatcher> PathMatcher::Create(
    const std::vector<std::string> &globs) {
  if (globs.empty()) return PathMatcher();
  std::vector<std::string> alternatives;
  alternatives.reserve(globs.size());
  for (const auto &glob : globs) {
    ASSIGN_OR_RETURN(std::string regex, GlobToRegex(glob));
    alternatives.push_back(absl::StrCat("(?:", regex, ")"));
  }
  auto regex = std::make_shared<const re2::RE2>(
      absl::StrJoin(alternatives, "|"), re2::RE2::Quiet);
  if (!regex->ok()) {
    return absl::InvalidArgumentError(
        absl::StrCat("Invalid path globs '", absl::StrJoin(globs, "', '"),
                     "': ", regex->error()));
  }
  return PathMatcher(std::move(regex));
}

bool PathMatcher::Matches(std::string_view path) const {
  return regex_ != nullptr && re2::RE2::FullMatch(path, *regex_);
}

}  // namespace analysis
}  // namespace codesmell
