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

#include "codesmell/common/text/ast-tree.h"

#include <cstddef>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "codesmell/common/util/logging.h"

namespace codesmell {

std::ostream &operator<<(std::ostream &stream, const ByteRange &range) {
  return stream << '[' << range.begin << ", " << range.end << ')';
}

const AstNode &AstTreeNode::ChildAt(size_t index) const {
  CHECK_LT(index, children_.size());
  return *children_[index];
}

std::vector<std::string_view> AstTreeNode::Comments() const {
  return std::vector<std::string_view>(comments_.begin(), comments_.end());
}

AstTreeNode &AstTreeNode::AddChild(NodeKind kind, ByteRange range) {
  return AdoptChild(std::make_unique<AstTreeNode>(kind, range));
}

AstTreeNode &AstTreeNode::AdoptChild(std::unique_ptr<AstTreeNode> child) {
  CHECK(child != nullptr);
  DCHECK(range_.Contains(child->Range()))
      << "child " << child->Range() << " outside of parent " << range_;
  children_.push_back(std::move(child));
  return *children_.back();
}

}  // namespace codesmell
