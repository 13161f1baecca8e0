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

// ParsedFile bundles what the analysis needs to know about one source file:
// its path, its text, and the root of its syntax tree.

#ifndef CODESMELL_COMMON_TEXT_PARSED_FILE_H_
#define CODESMELL_COMMON_TEXT_PARSED_FILE_H_

#include <memory>
#include <string>
#include <string_view>

#include "codesmell/common/strings/line-column-map.h"
#include "codesmell/common/text/ast-node.h"

namespace codesmell {

class ParsedFile {
 public:
  // 'root' must not be null; its ranges index into 'contents'.
  ParsedFile(std::string path, std::string contents,
             std::unique_ptr<AstNode> root);

  ParsedFile(const ParsedFile &) = delete;
  ParsedFile &operator=(const ParsedFile &) = delete;

  const std::string &Path() const { return path_; }
  std::string_view Contents() const { return contents_; }
  const AstNode &Root() const { return *root_; }
  const LineColumnMap &GetLineColumnMap() const { return line_column_map_; }

  // Returns the source text covered by 'node', clamped to the contents.
  std::string_view TextOf(const AstNode &node) const;

  // Returns the 0-based line/column range covered by 'node'.
  LineColumnRange RangeOf(const AstNode &node) const;

 private:
  const std::string path_;
  const std::string contents_;
  const std::unique_ptr<AstNode> root_;
  const LineColumnMap line_column_map_;
};

}  // namespace codesmell

#endif  // CODESMELL_COMMON_TEXT_PARSED_FILE_H_
