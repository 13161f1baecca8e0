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

// LineColumnMap translates byte-offset into line-column.
//
// usage:
// std::string_view text = ...;
// LineColumnMap lcmap(text);
// LineColumn where = lcmap.GetLineColAtOffset(text, node_range.begin);
// std::cout << "Finding at " << where << std::endl;

#ifndef CODESMELL_COMMON_STRINGS_LINE_COLUMN_MAP_H_
#define CODESMELL_COMMON_STRINGS_LINE_COLUMN_MAP_H_

#include <iosfwd>
#include <string_view>
#include <vector>

namespace codesmell {

// Pair: line number and column number.
struct LineColumn {
  int line;    // 0-based index
  int column;  // 0-based index

  constexpr bool operator==(const LineColumn &r) const {
    return line == r.line && column == r.column;
  }
  constexpr bool operator!=(const LineColumn &r) const { return !(*this == r); }
  constexpr bool operator<(const LineColumn &r) const {
    if (line < r.line) return true;
    if (line > r.line) return false;
    return column < r.column;
  }
  constexpr bool operator>=(const LineColumn &r) const { return !(*this < r); }
};

// Prints 1-based "line:column".
std::ostream &operator<<(std::ostream &, const LineColumn &);

// A complete range.
struct LineColumnRange {
  LineColumn start;  // Inclusive
  LineColumn end;    // Exclusive

  constexpr bool operator==(const LineColumnRange &r) const {
    return start == r.start && end == r.end;
  }
  constexpr bool operator<(const LineColumnRange &r) const {
    if (start != r.start) return start < r.start;
    return end < r.end;
  }
  constexpr bool PositionInRange(const LineColumn &pos) const {
    return pos >= start && pos < end;
  }
};

std::ostream &operator<<(std::ostream &, const LineColumnRange &);

// Fast mapping of byte offsets to human-useful line/column
class LineColumnMap {
 public:
  explicit LineColumnMap(std::string_view text);

  bool empty() const { return beginning_of_line_offsets_.empty(); }

  // Number of lines, counting a final line without newline.
  int NumLines() const { return beginning_of_line_offsets_.size(); }

  // Get line number at the given byte offset.
  int LineAtOffset(int bytes_offset) const;

  // Get line and column at the given offset. The column takes multi-byte
  // encodings into account, so the column represents the true character not
  // simply the byte-offset within the line.
  LineColumn GetLineColAtOffset(std::string_view base, int bytes_offset) const;

  // Translates a [begin, end) byte range.
  LineColumnRange GetRangeAtOffsets(std::string_view base, int begin,
                                    int end) const {
    return {GetLineColAtOffset(base, begin), GetLineColAtOffset(base, end)};
  }

 private:
  // Index: line number, Value: byte offset that starts the line.
  // The first value will always be 0 because the beginning of the first line
  // has offset 0.
  std::vector<int> beginning_of_line_offsets_;
};

}  // namespace codesmell

#endif  // CODESMELL_COMMON_STRINGS_LINE_COLUMN_MAP_H_
