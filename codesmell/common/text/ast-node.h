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

// AstNode is the read-only view of a parsed syntax tree that the analysis
// engine consumes.  Parsers (not part of codesmell) implement this interface
// for their own tree types; AstTreeNode in ast-tree.h is a simple owning
// implementation.

#ifndef CODESMELL_COMMON_TEXT_AST_NODE_H_
#define CODESMELL_COMMON_TEXT_AST_NODE_H_

#include <cstddef>
#include <iosfwd>
#include <string_view>
#include <vector>

namespace codesmell {

// Syntactic kind of a node.  Language front-ends map their own enums onto it,
// see KindOf().
using NodeKind = int;

template <typename EnumType>
constexpr NodeKind KindOf(EnumType kind) {
  return static_cast<NodeKind>(kind);
}

// Half-open [begin, end) range of byte offsets into the file contents.
struct ByteRange {
  int begin = 0;
  int end = 0;

  int size() const { return end - begin; }
  bool Contains(const ByteRange &other) const {
    return begin <= other.begin && other.end <= end;
  }
  bool operator==(const ByteRange &r) const {
    return begin == r.begin && end == r.end;
  }
};

std::ostream &operator<<(std::ostream &, const ByteRange &);

class AstNode {
 public:
  virtual ~AstNode() = default;

  virtual NodeKind Kind() const = 0;

  // Ordered children, in source order.
  virtual size_t NumChildren() const = 0;
  virtual const AstNode &ChildAt(size_t index) const = 0;

  // Source range covered by this node, including its children.
  virtual ByteRange Range() const = 0;

  // Declared identifier of this node (class name, function name, ...), or
  // empty if the node does not declare anything.  Used to compute identities
  // that survive unrelated edits of the file.
  virtual std::string_view Name() const = 0;

  // Text of the comments and annotations attached to this node, in source
  // order.  Suppression directives are read from here.
  virtual std::vector<std::string_view> Comments() const = 0;

 protected:
  AstNode() = default;
};

}  // namespace codesmell

#endif  // CODESMELL_COMMON_TEXT_AST_NODE_H_
