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

#ifndef CODESMELL_ANALYSIS_AST_PROVIDER_H_
#define CODESMELL_ANALYSIS_AST_PROVIDER_H_

#include <memory>
#include <string>

#include "absl/status/statusor.h"
#include "codesmell/common/text/parsed-file.h"

namespace codesmell {
namespace analysis {

// Turns a file path into a syntax tree.  Implemented by language front-ends.
class AstProvider {
 public:
  virtual ~AstProvider() = default;

  // Reads and parses the file at 'path'.  An error status is reported as a
  // parse failure of that file.  Called concurrently from worker threads.
  virtual absl::StatusOr<std::unique_ptr<ParsedFile>> Parse(
      const std::string &path) const = 0;
};

}  // namespace analysis
}  // namespace codesmell

#endif  // CODESMELL_ANALYSIS_AST_PROVIDER_H_
