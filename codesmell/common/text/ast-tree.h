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

#ifndef CODESMELL_COMMON_TEXT_AST_TREE_H_
#define CODESMELL_COMMON_TEXT_AST_TREE_H_

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "codesmell/common/text/ast-node.h"

namespace codesmell {

// AstTreeNode is a plain owning tree that implements AstNode.
// It can be populated by a front-end, or built by hand in tests:
//
//   auto root = std::make_unique<AstTreeNode>(kFile, ByteRange{0, 42});
//   root->AddChild(kClass, {0, 42}).SetName("Main").AddComment("// note");
class AstTreeNode final : public AstNode {
 public:
  AstTreeNode(NodeKind kind, ByteRange range) : kind_(kind), range_(range) {}

  NodeKind Kind() const final { return kind_; }
  size_t NumChildren() const final { return children_.size(); }
  const AstNode &ChildAt(size_t index) const final;
  ByteRange Range() const final { return range_; }
  std::string_view Name() const final { return name_; }
  std::vector<std::string_view> Comments() const final;

  // Appends a new child and returns a reference to it for further building.
  AstTreeNode &AddChild(NodeKind kind, ByteRange range);

  // Appends an already constructed child.
  AstTreeNode &AdoptChild(std::unique_ptr<AstTreeNode> child);

  AstTreeNode &SetName(std::string_view name) {
    name_ = std::string(name);
    return *this;
  }

  // For front-ends that learn where a node ends only after its children.
  AstTreeNode &SetRange(ByteRange range) {
    range_ = range;
    return *this;
  }

  AstTreeNode &AddComment(std::string_view comment) {
    comments_.emplace_back(comment);
    return *this;
  }

  // Mutable access to a child, for tests that patch trees.
  AstTreeNode &MutableChild(size_t index) { return *children_[index]; }

 private:
  NodeKind kind_;
  ByteRange range_;
  std::string name_;
  std::vector<std::string> comments_;
  std::vector<std::unique_ptr<AstTreeNode>> children_;
};

}  // namespace codesmell

#endif  // CODESMELL_COMMON_TEXT_AST_TREE_H_
