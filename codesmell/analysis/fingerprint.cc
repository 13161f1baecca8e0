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

#include "codesmell/analysis/fingerprint.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "absl/strings/ascii.h"
#include "absl/strings/escaping.h"
#include "absl/strings/str_cat.h"
#include "codesmell/common/text/ast-node.h"
#include "codesmell/common/util/logging.h"
#include "codesmell/common/util/sha256.h"

namespace codesmell {
namespace analysis {

namespace {
int OrdinalAmongSiblings(const AstNode &parent, const AstNode &node) {
  int ordinal = 0;
  for (size_t i = 0; i < parent.NumChildren(); ++i) {
    const AstNode &sibling = parent.ChildAt(i);
    if (&sibling == &node) return ordinal;
    if (sibling.Kind() == node.Kind() && sibling.Name() == node.Name()) {
      ++ordinal;
    }
  }
  LOG(DFATAL) << "Node is not a child of its presumed parent";
  return ordinal;
}
}  // namespace

std::string ComputeEntitySignature(
    std::string_view file_path,
    const std::vector<const AstNode *> &path_from_root) {
  std::string signature = absl::StrCat(file_path, "::");
  for (size_t i = 1; i < path_from_root.size(); ++i) {
    const AstNode &node = *path_from_root[i];
    if (i > 1) signature.push_back('/');
    absl::StrAppend(&signature, node.Kind());
    if (!node.Name().empty()) absl::StrAppend(&signature, ":", node.Name());
    absl::StrAppend(&signature, "#",
                    OrdinalAmongSiblings(*path_from_root[i - 1], node));
  }
  return signature;
}

std::string NormalizeSnippet(std::string_view snippet) {
  std::string result;
  result.reserve(snippet.size());
  for (const char c : snippet) {
    if (!absl::ascii_isspace(static_cast<unsigned char>(c))) {
      result.push_back(c);
    }
  }
  return result;
}

std::string ComputeFingerprint(std::string_view rule_id,
                               std::string_view entity_signature,
                               std::string_view snippet, int occurrence) {
  Sha256Context context;
  context.Update(rule_id);
  context.Update("\n");
  context.Update(entity_signature);
  context.Update("\n");
  context.Update(NormalizeSnippet(snippet));
  if (occurrence > 0) context.Update(absl::StrCat("\n#", occurrence));
  const Sha256Digest digest = context.Finish();
  return absl::BytesToHexString(std::string_view(
      reinterpret_cast<const char *>(digest.data()), digest.size()));
}

}  // namespace analysis
}  // namespace codesmell
