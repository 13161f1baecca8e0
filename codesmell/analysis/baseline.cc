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

#include "codesmell/analysis/baseline.h"

#include <exception>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "nlohmann/json.hpp"
#include "codesmell/common/util/file-util.h"
#include "codesmell/common/util/logging.h"

namespace codesmell {
namespace analysis {

using nlohmann::json;

static constexpr int kBaselineFormatVersion = 1;

BaselineFilterResult FilterAgainstBaseline(std::vector<Finding> findings,
                                           const Baseline &baseline,
                                           BaselineMode mode) {
  BaselineFilterResult result;
  if (mode == BaselineMode::kUpdate) {
    for (const Finding &finding : findings) {
      result.fingerprints.insert(finding.fingerprint);
    }
    result.kept = std::move(findings);
    return result;
  }
  result.kept.reserve(findings.size());
  for (Finding &finding : findings) {
    if (baseline.find(finding.fingerprint) != baseline.end()) {
      ++result.baseline_suppressed;
      continue;
    }
    result.kept.push_back(std::move(finding));
  }
  return result;
}

absl::StatusOr<Baseline> ParseBaselineJson(std::string_view json_text) {
  json document;
  try {
    document = json::parse(json_text);
  } catch (const std::exception &e) {
    return absl::InvalidArgumentError(
        absl::StrCat("Baseline is not valid JSON: ", e.what()));
  }
  if (!document.is_object()) {
    return absl::InvalidArgumentError("Baseline must be a JSON object");
  }
  const auto version = document.find("version");
  if (version != document.end() &&
      (!version->is_number_integer() ||
       version->get<int>() != kBaselineFormatVersion)) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Unsupported baseline version ", version->dump(), "; expected ",
        kBaselineFormatVersion));
  }
  const auto fingerprints = document.find("fingerprints");
  if (fingerprints == document.end() || !fingerprints->is_array()) {
    return absl::InvalidArgumentError(
        "Baseline needs a 'fingerprints' array");
  }
  Baseline baseline;
  for (const json &entry : *fingerprints) {
    if (!entry.is_string()) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Baseline fingerprints must be strings, got ", entry.dump()));
    }
    baseline.insert(entry.get<std::string>());
  }
  return baseline;
}

std::string BaselineToJson(const Baseline &baseline) {
  json document = json::object();
  document["version"] = kBaselineFormatVersion;
  document["fingerprints"] = json::array();
  for (const auto &fingerprint : baseline) {
    document["fingerprints"].push_back(fingerprint);
  }
  return document.dump(2) + "\n";
}

absl::StatusOr<Baseline> JsonFileBaselineStore::Load() const {
  const absl::StatusOr<std::string> content = file::GetContentAsString(path_);
  if (absl::IsNotFound(content.status())) {
    VLOG(1) << path_ << ": no baseline yet";
    return Baseline();
  }
  if (!content.ok()) return content.status();
  absl::StatusOr<Baseline> baseline = ParseBaselineJson(*content);
  if (!baseline.ok()) {
    return absl::Status(baseline.status().code(),
                        absl::StrCat(path_, ": ", baseline.status().message()));
  }
  VLOG(1) << path_ << ": loaded " << baseline->size() << " fingerprints";
  return baseline;
}

absl::Status JsonFileBaselineStore::Save(const Baseline &baseline) {
  VLOG(1) << path_ << ": saving " << baseline.size() << " fingerprints";
  return file::ReplaceContents(path_, BaselineToJson(baseline));
}

}  // namespace analysis
}  // namespace codesmell
