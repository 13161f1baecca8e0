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

#include "codesmell/common/util/sha256.h"

#include <string>
#include <string_view>

#include "gtest/gtest.h"

namespace codesmell {
namespace {

// Expected digests were produced with `printf '...' | sha256sum`.

TEST(Sha256, EmptyInput) {
  EXPECT_EQ(Sha256Hex(""),
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(Sha256, ShortInput) {
  EXPECT_EQ(Sha256Hex("abc"),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  EXPECT_EQ(Sha256Hex("banana"),
            "b493d48364afe44d11c0165cf470a4164d1e2609911ef998be868d46ade3de4e");
}

TEST(Sha256, NonAsciiInput) {
  EXPECT_EQ(Sha256Hex("バナナ"),
            "787bcc7042939ad9607bc8ca87332e4178716be0f0b890cbf673884d39d8ff79");
}

// 56 bytes: the length no longer fits in the first block.
TEST(Sha256, PaddingSpillsIntoSecondBlock) {
  EXPECT_EQ(
      Sha256Hex("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq"),
      "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST(Sha256, MillionCharacters) {
  const std::string million_a(1000000, 'a');
  EXPECT_EQ(Sha256Hex(million_a),
            "cdc76e5c9914fb9281a1c7e284d73e67f1809a48a497200e046d39ccc7112cd0");
}

TEST(Sha256, IncrementalUpdatesMatchOneShot) {
  constexpr std::string_view kText =
      "rule-id\nsrc/Main.kt:3:CLASS:Main#0/7:FUN:run#0\nfun run(){}";
  Sha256Context context;
  for (size_t pos = 0; pos < kText.size(); pos += 5) {
    context.Update(kText.substr(pos, 5));
  }
  EXPECT_EQ(context.Finish(), Sha256(kText));
}

TEST(Sha256, ContextIsReusableAfterFinish) {
  Sha256Context context;
  context.Update("something else");
  (void)context.Finish();
  context.Update("abc");
  EXPECT_EQ(context.Finish(), Sha256("abc"));
}

}  // namespace
}  // namespace codesmell
