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

// Baselines: fingerprints of findings accepted in an earlier run.  Findings
// whose fingerprint is in the baseline are not reported, only counted.

#ifndef CODESMELL_ANALYSIS_BASELINE_H_
#define CODESMELL_ANALYSIS_BASELINE_H_

#include <functional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "codesmell/analysis/finding.h"

namespace codesmell {
namespace analysis {

using Baseline = std::set<std::string, std::less<>>;

enum class BaselineMode {
  kFilter,  // drop baselined findings
  kUpdate,  // keep everything and collect all fingerprints
};

struct BaselineFilterResult {
  // Findings to report: those not in the baseline, or all in update mode.
  std::vector<Finding> kept;
  // Number of findings dropped because they are in the baseline.
  int baseline_suppressed = 0;
  // Update mode only: fingerprints of all findings.
  Baseline fingerprints;
};

BaselineFilterResult FilterAgainstBaseline(std::vector<Finding> findings,
                                           const Baseline &baseline,
                                           BaselineMode mode);

// Where baselines are persisted.
class BaselineStore {
 public:
  virtual ~BaselineStore() = default;

  // Returns the stored baseline; nothing stored yet means an empty baseline.
  virtual absl::StatusOr<Baseline> Load() const = 0;

  // Replaces the stored baseline.
  virtual absl::Status Save(const Baseline &baseline) = 0;
};

// Stores the baseline in a JSON file:
//   {
//     "version": 1,
//     "fingerprints": ["0a1b...", ...]
//   }
// Fingerprints are written sorted, so that the file diffs well.
class JsonFileBaselineStore final : public BaselineStore {
 public:
  explicit JsonFileBaselineStore(std::string path) : path_(std::move(path)) {}

  absl::StatusOr<Baseline> Load() const final;
  absl::Status Save(const Baseline &baseline) final;

  const std::string &path() const { return path_; }

 private:
  const std::string path_;
};

// Parses and renders the JSON representation used by JsonFileBaselineStore.
absl::StatusOr<Baseline> ParseBaselineJson(std::string_view json_text);
std::string BaselineToJson(const Baseline &baseline);

}  // namespace analysis
}  // namespace codesmell

#endif  // CODESMELL_ANALYSIS_BASELINE_H_
