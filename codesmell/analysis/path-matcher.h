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

// PathMatcher matches file paths against a set of shell-style globs.
//
// Glob syntax:
//   **/     zero or more directories
//   **      any characters, including '/'
//   *       any characters except '/'
//   ?       one character except '/'
//   [...]   character class, '!' or '^' negates
//   {a,b}   alternatives, may nest
// Everything else matches literally.  A glob must match the whole path.

#ifndef CODESMELL_ANALYSIS_PATH_MATCHER_H_
#define CODESMELL_ANALYSIS_PATH_MATCHER_H_

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "absl/status/statusor.h"
#include "re2/re2.h"

namespace codesmell {
namespace analysis {

// Translates one glob to an RE2 pattern.
absl::StatusOr<std::string> GlobToRegex(std::string_view glob);

class PathMatcher {
 public:
  // Matches nothing.
  PathMatcher() = default;

  static absl::StatusOr<PathMatcher> Create(
      const std::vector<std::string> &globs);

  bool empty() const { return regex_ == nullptr; }

  // Returns true if 'path' matches any of the globs.
  bool Matches(std::string_view path) const;

 private:
  explicit PathMatcher(std::shared_ptr<const re2::RE2> regex)
      : regex_(std::move(regex)) {}

  // All globs combined into one alternation.
  std::shared_ptr<const re2::RE2> regex_;
};

}  // namespace analysis
}  // namespace codesmell

#endif  // CODESMELL_ANALYSIS_PATH_MATCHER_H_
