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

#include <memory>
#include <string_view>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace codesmell {
namespace {

using ::testing::ElementsAre;

enum class Kind { kFile, kClass, kFunction };

TEST(AstTreeNodeTest, BuildsOrderedChildren) {
  AstTreeNode root(KindOf(Kind::kFile), {0, 30});
  root.AddChild(KindOf(Kind::kClass), {0, 10}).SetName("A");
  root.AddChild(KindOf(Kind::kClass), {11, 30}).SetName("B");

  ASSERT_EQ(root.NumChildren(), 2);
  EXPECT_EQ(root.ChildAt(0).Name(), "A");
  EXPECT_EQ(root.ChildAt(1).Name(), "B");
  EXPECT_EQ(root.ChildAt(1).Range(), (ByteRange{11, 30}));
  EXPECT_EQ(root.ChildAt(1).Kind(), KindOf(Kind::kClass));
}

TEST(AstTreeNodeTest, NestedBuilding) {
  auto root =
      std::make_unique<AstTreeNode>(KindOf(Kind::kFile), ByteRange{0, 20});
  root->AddChild(KindOf(Kind::kClass), {0, 20})
      .SetName("A")
      .AddChild(KindOf(Kind::kFunction), {5, 15})
      .SetName("f");
  const AstNode &function = root->ChildAt(0).ChildAt(0);
  EXPECT_EQ(function.Name(), "f");
  EXPECT_EQ(function.NumChildren(), 0);
}

TEST(AstTreeNodeTest, CommentsKeepSourceOrder) {
  AstTreeNode node(KindOf(Kind::kFunction), {0, 1});
  node.AddComment("// first").AddComment("@Suppress(\"x\")");
  EXPECT_THAT(node.Comments(), ElementsAre("// first", "@Suppress(\"x\")"));
}

TEST(AstTreeNodeTest, UnnamedNodeHasEmptyName) {
  const AstTreeNode node(KindOf(Kind::kFunction), {0, 1});
  EXPECT_TRUE(node.Name().empty());
  EXPECT_TRUE(node.Comments().empty());
}

}  // namespace
}  // namespace codesmell
