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

#ifndef CODESMELL_COMMON_TEXT_AST_CONTEXT_H_
#define CODESMELL_COMMON_TEXT_AST_CONTEXT_H_

#include <algorithm>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <vector>

#include "codesmell/common/text/ast-node.h"
#include "codesmell/common/util/logging.h"

namespace codesmell {

// Stack of the ancestors of the node currently being visited, outermost
// first.  The stack is only modified through AutoPop, which pushes on
// construction and pops on destruction, so that a traversal can never leave
// it unbalanced.
// Note: Public methods are named to follow STL convention for std::stack.
class AstContext {
 public:
  using stack_type = std::vector<const AstNode *>;
  using const_iterator = stack_type::const_iterator;
  using const_reverse_iterator = stack_type::const_reverse_iterator;

  class AutoPop {
   public:
    AutoPop(AstContext *context, const AstNode &node) : context_(context) {
      context_->stack_.push_back(&node);
    }
    ~AutoPop() {
      CHECK(!context_->stack_.empty());
      context_->stack_.pop_back();
    }

    AutoPop(const AutoPop &) = delete;
    AutoPop &operator=(const AutoPop &) = delete;

   private:
    AstContext *const context_;
  };

  size_t size() const { return stack_.size(); }
  bool empty() const { return stack_.empty(); }

  // Returns the innermost ancestor.
  const AstNode &top() const {
    CHECK(!stack_.empty());
    return *stack_.back();
  }

  const_iterator begin() const { return stack_.begin(); }
  const_iterator end() const { return stack_.end(); }
  const_reverse_iterator rbegin() const { return stack_.rbegin(); }
  const_reverse_iterator rend() const { return stack_.rend(); }

  // Returns true if any ancestor has the given kind.
  template <typename E>
  bool IsInside(E kind) const {
    return std::any_of(stack_.begin(), stack_.end(), [=](const AstNode *node) {
      return node->Kind() == KindOf(kind);
    });
  }

  // Returns true if the innermost ancestor has the given kind.
  template <typename E>
  bool DirectParentIs(E kind) const {
    return !empty() && top().Kind() == KindOf(kind);
  }

  // Returns true if the innermost ancestor has one of the given kinds.
  template <typename E>
  bool DirectParentIsOneOf(std::initializer_list<E> kinds) const {
    if (empty()) return false;
    return std::any_of(kinds.begin(), kinds.end(),
                       [this](E kind) { return top().Kind() == KindOf(kind); });
  }

  // Returns the closest ancestor that matches the given 'predicate', or
  // nullptr if no match is found.
  const AstNode *NearestParentMatching(
      const std::function<bool(const AstNode &)> &predicate) const {
    const auto found =
        std::find_if(stack_.rbegin(), stack_.rend(),
                     [&predicate](const AstNode *node) {
                       return predicate(*node);
                     });
    return found != stack_.rend() ? *found : nullptr;
  }

  template <typename E>
  const AstNode *NearestParentWithKind(E kind) const {
    return NearestParentMatching(
        [kind](const AstNode &node) { return node.Kind() == KindOf(kind); });
  }

 private:
  stack_type stack_;
};

}  // namespace codesmell

#endif  // CODESMELL_COMMON_TEXT_AST_CONTEXT_H_
