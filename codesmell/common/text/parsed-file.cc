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

#include "codesmell/common/text/parsed-file.h"

#include <algorithm>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "codesmell/common/strings/line-column-map.h"
#include "codesmell/common/text/ast-node.h"
#include "codesmell/common/util/logging.h"

namespace codesmell {

ParsedFile::ParsedFile(std::string path, std::string contents,
                       std::unique_ptr<AstNode> root)
    : path_(std::move(path)),
      contents_(std::move(contents)),
      root_(ABSL_DIE_IF_NULL(std::move(root))),
      line_column_map_(contents_) {}

static ByteRange ClampRange(ByteRange range, int size) {
  range.begin = std::clamp(range.begin, 0, size);
  range.end = std::clamp(range.end, range.begin, size);
  return range;
}

std::string_view ParsedFile::TextOf(const AstNode &node) const {
  const ByteRange range =
      ClampRange(node.Range(), static_cast<int>(contents_.size()));
  return std::string_view(contents_).substr(range.begin, range.size());
}

LineColumnRange ParsedFile::RangeOf(const AstNode &node) const {
  const ByteRange range =
      ClampRange(node.Range(), static_cast<int>(contents_.size()));
  return line_column_map_.GetRangeAtOffsets(contents_, range.begin, range.end);
}

}  // namespace codesmell
