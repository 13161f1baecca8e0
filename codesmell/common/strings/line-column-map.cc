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

// Implementation for LineColumnMap.
#include "codesmell/common/strings/line-column-map.h"

#include <algorithm>  // for binary search
#include <iostream>
#include <iterator>
#include <string_view>

namespace codesmell {

// Number of code points in a UTF-8 string: every byte that is not a
// continuation byte (10xxxxxx) starts a character.
static int Utf8Length(std::string_view text) {
  return std::count_if(text.begin(), text.end(), [](char c) {
    return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
  });
}

// Print to the user as 1-based index because that is how lines
// and columns are indexed in every file diagnostic tool.
std::ostream &operator<<(std::ostream &out, const LineColumn &line_column) {
  return out << line_column.line + 1 << ':' << line_column.column + 1;
}

std::ostream &operator<<(std::ostream &out, const LineColumnRange &r) {
  // For human consumption, point to the last character, not one past it.
  LineColumn right = r.end;
  if (right.column > 0) right.column--;
  out << r.start;
  if (r.start.line == right.line) {
    if (right.column > r.start.column) out << '-' << right.column + 1;
  } else {
    out << '-' << right;
  }
  return out;
}

LineColumnMap::LineColumnMap(std::string_view text) {
  // The column number after every line break is 0.
  // The first line always starts at offset 0.
  beginning_of_line_offsets_.push_back(0);
  auto offset = text.find('\n');
  while (offset != std::string_view::npos) {
    beginning_of_line_offsets_.push_back(offset + 1);
    offset = text.find('\n', offset + 1);
  }
}

LineColumn LineColumnMap::GetLineColAtOffset(std::string_view base,
                                             int bytes_offset) const {
  const int line_number = LineAtOffset(bytes_offset);
  const int line_start = beginning_of_line_offsets_[line_number];
  const std::string_view line =
      base.substr(line_start, bytes_offset - line_start);
  return LineColumn{line_number, Utf8Length(line)};
}

int LineColumnMap::LineAtOffset(int bytes_offset) const {
  const auto begin = beginning_of_line_offsets_.begin();
  const auto end = beginning_of_line_offsets_.end();
  // std::upper_bound is a binary search.
  const auto line_at_offset = std::upper_bound(begin, end, bytes_offset) - 1;
  return std::distance(begin, line_at_offset);
}

}  // namespace codesmell
