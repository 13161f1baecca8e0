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

// Stable identities of findings.
//
// An entity signature names a node by its structural path from the file's
// root, e.g. "src/A.kt::2:Main#0/3:run#0/4#1": one "kind[:name]#ordinal"
// segment per node below the root, where the ordinal counts the preceding
// siblings with the same kind and name.  Line numbers take no part, so the
// signature survives edits elsewhere in the file.
//
// A fingerprint hashes the rule id, the entity signature and the node's text
// with all whitespace removed.  When a rule reports the same node more than
// once, the occurrence index of the report is hashed too, so that every
// finding has its own fingerprint.  Fingerprints are persisted in baselines.

#ifndef CODESMELL_ANALYSIS_FINGERPRINT_H_
#define CODESMELL_ANALYSIS_FINGERPRINT_H_

#include <string>
#include <string_view>
#include <vector>

#include "codesmell/common/text/ast-node.h"

namespace codesmell {
namespace analysis {

// 'path_from_root' holds the file's root node first and the node to sign
// last; every element must be a child of the one before.
std::string ComputeEntitySignature(
    std::string_view file_path,
    const std::vector<const AstNode *> &path_from_root);

// Removes all whitespace from 'snippet'.
std::string NormalizeSnippet(std::string_view snippet);

// Returns the lower-case hex SHA-256 of the rule id, the signature and the
// normalized snippet.  'occurrence' counts the earlier reports of the same
// rule on the same node; it only takes part when non-zero, so the first
// report of a node keeps the fingerprint it would have on its own.
std::string ComputeFingerprint(std::string_view rule_id,
                               std::string_view entity_signature,
                               std::string_view snippet, int occurrence = 0);

}  // namespace analysis
}  // namespace codesmell

#endif  // CODESMELL_ANALYSIS_FINGERPRINT_H_
