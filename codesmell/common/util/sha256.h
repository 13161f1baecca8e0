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

// SHA-256 message digest as defined in FIPS PUB 180-4.
// Used to derive stable, persistable fingerprints; absl::Hash is seeded per
// process and must not be used for anything that is written to disk.

#ifndef CODESMELL_COMMON_UTIL_SHA256_H_
#define CODESMELL_COMMON_UTIL_SHA256_H_

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace codesmell {

// The size of SHA256 hash in bytes.
inline constexpr size_t kSha256HashSize = 32;
// The size of a single message block, in bytes.
inline constexpr size_t kSha256MessageBlockSize = 64;

using Sha256Digest = std::array<uint8_t, kSha256HashSize>;

// Incremental SHA-256 computation.
//
// Usage:
//   Sha256Context context;
//   context.Update("part one");
//   context.Update("part two");
//   const Sha256Digest digest = context.Finish();
class Sha256Context {
 public:
  Sha256Context() { Reset(); }

  // Appends 'data' to the message.
  void Update(std::string_view data);

  // Pads the message, returns its digest and resets the context so that it
  // can be re-used for a new message.
  Sha256Digest Finish();

 private:
  void Reset();

  // Compresses the 64-byte block in block_ into state_.
  void ProcessBlock();

  std::array<uint32_t, 8> state_;
  std::array<uint8_t, kSha256MessageBlockSize> block_;
  size_t block_fill_;  // bytes used in block_
  uint64_t total_bytes_;
};

// Returns the SHA256 hash of the given content.
Sha256Digest Sha256(std::string_view content);

// Returns the lower-case hex representation of the SHA256 of content.
std::string Sha256Hex(std::string_view content);

}  // namespace codesmell

#endif  // CODESMELL_COMMON_UTIL_SHA256_H_
