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

#include "codesmell/analysis/module-linter.h"

#include <algorithm>
#include <atomic>
#include <exception>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "codesmell/analysis/baseline.h"
#include "codesmell/analysis/finding.h"
#include "codesmell/analysis/path-matcher.h"
#include "codesmell/analysis/tree-linter.h"
#include "codesmell/common/text/parsed-file.h"
#include "codesmell/common/util/logging.h"
#include "codesmell/common/util/thread-pool.h"

namespace codesmell {
namespace analysis {

namespace {
constexpr std::string_view kCancelled =
    "analysis cancelled after an earlier failure (fail fast)";
constexpr std::string_view kTimedOut = "analysis did not finish in time";

FileOutcome IncompleteOutcome(const std::string &path,
                              std::string_view reason) {
  FileOutcome outcome;
  outcome.path = path;
  outcome.incomplete = true;
  outcome.diagnostics.push_back(
      {DiagnosticKind::kIncomplete, path, "", std::string(reason)});
  return outcome;
}

// Applies the fixes of all 'findings', skipping those that conflict with
// fixes already taken.  Returns nullopt if there is nothing to fix.
std::optional<std::string> ApplyFixes(const ParsedFile &file,
                                      const std::vector<Finding> &findings) {
  AutoFix combined;
  for (const Finding &finding : findings) {
    if (!finding.autofix.has_value()) continue;
    if (!combined.AddEdits(finding.autofix->Edits())) {
      VLOG(1) << finding.location << ": fix of " << finding.rule_id
              << " conflicts with previously applied fixes, rejecting.";
    }
  }
  if (combined.Edits().empty()) return std::nullopt;
  return combined.Apply(file.Contents());
}
}  // namespace

bool TriggersFailFast(const FileOutcome &outcome) {
  for (const Finding &finding : outcome.findings) {
    if (finding.severity >= Severity::kError) return true;
  }
  for (const Diagnostic &diagnostic : outcome.diagnostics) {
    if (diagnostic.kind == DiagnosticKind::kInternalRuleError) return true;
  }
  return false;
}

ModuleLinter::ModuleLinter(const RuleRegistry &registry,
                           const EffectiveConfig &config,
                           const AstProvider &provider,
                           const Baseline &baseline,
                           const ModuleLinterOptions &options)
    : registry_(registry),
      config_(config),
      provider_(provider),
      baseline_(baseline),
      options_(options) {
  auto excludes = PathMatcher::Create(config.excludes);
  if (excludes.ok()) {
    excludes_ = *std::move(excludes);
  } else {
    // The resolver only lets valid globs through.
    LOG(WARNING) << "Module excludes: " << excludes.status();
  }
}

int ModuleLinter::WorkerCount() const {
  if (options_.worker_count > 0) return options_.worker_count;
  return std::max(1, static_cast<int>(std::thread::hardware_concurrency()));
}

FileOutcome ModuleLinter::LintOneFile(const std::string &path) const {
  TreeLinterOptions linter_options;
  linter_options.autocorrect = options_.autocorrect;
  const TreeLinter linter(registry_, config_, linter_options);
  return LintFile(linter, path, nullptr);
}

FileOutcome ModuleLinter::LintFile(const TreeLinter &linter,
                                   const std::string &path,
                                   const std::atomic<bool> *abandon) const {
  VLOG(1) << "Analyzing " << path;
  FileOutcome outcome;
  outcome.path = path;

  absl::StatusOr<std::unique_ptr<ParsedFile>> parsed;
  try {
    parsed = provider_.Parse(path);
  } catch (const std::exception &e) {
    parsed = absl::InternalError(absl::StrCat("exception: ", e.what()));
  } catch (...) {
    parsed = absl::InternalError("unknown exception");
  }
  if (!parsed.ok()) {
    LOG(WARNING) << "Can't parse '" << path << "': " << parsed.status();
    outcome.diagnostics.push_back({DiagnosticKind::kParseFailure, path, "",
                                   std::string(parsed.status().message())});
    return outcome;
  }
  if (abandon != nullptr && abandon->load()) {
    return IncompleteOutcome(path, kTimedOut);
  }

  const ParsedFile &file = **parsed;
  FileLintResult lint = linter.Lint(file);
  if (lint.abandoned) return IncompleteOutcome(path, kTimedOut);

  BaselineFilterResult filtered = FilterAgainstBaseline(
      std::move(lint.findings), baseline_, options_.baseline_mode);
  outcome.findings = std::move(filtered.kept);
  outcome.baseline_suppressed = filtered.baseline_suppressed;
  outcome.fingerprints = std::move(filtered.fingerprints);
  outcome.inline_suppressed = lint.inline_suppressed;
  outcome.diagnostics = std::move(lint.diagnostics);
  if (options_.autocorrect) {
    outcome.corrected_contents = ApplyFixes(file, outcome.findings);
  }
  return outcome;
}

ModuleLintResult ModuleLinter::Lint(
    const std::vector<std::string> &files) const {
  ModuleLintResult result;
  std::vector<const std::string *> to_analyze;
  absl::flat_hash_set<std::string_view> seen;
  for (const std::string &path : files) {
    if (!seen.insert(path).second) continue;
    if (excludes_.Matches(path)) {
      VLOG(1) << "Excluded: " << path;
      result.excluded_files.push_back(path);
      continue;
    }
    to_analyze.push_back(&path);
  }

  std::atomic<bool> abandon(false);  // timeout reached
  std::atomic<bool> stopped(false);  // fail fast triggered
  TreeLinterOptions linter_options;
  linter_options.autocorrect = options_.autocorrect;
  linter_options.abandon = &abandon;
  const TreeLinter linter(registry_, config_, linter_options);

  const auto cancelled = [&abandon](const std::string &path) {
    return IncompleteOutcome(path, abandon.load() ? kTimedOut : kCancelled);
  };

  ThreadPool pool(WorkerCount());
  VLOG(1) << "Analyzing " << to_analyze.size() << " file(s) with "
          << pool.size() << " worker(s)";
  std::vector<std::future<FileOutcome>> futures;
  futures.reserve(to_analyze.size());
  for (const std::string *path : to_analyze) {
    futures.push_back(pool.ExecAsync<FileOutcome>(
        [&, path]() {
          // Work queued before a cancellation may still be picked up.
          if (stopped.load() || abandon.load()) return cancelled(*path);
          FileOutcome outcome = LintFile(linter, *path, &abandon);
          if (config_.fail_fast && TriggersFailFast(outcome) &&
              !stopped.exchange(true)) {
            const size_t count = pool.CancelPendingWork();
            LOG(INFO) << *path << ": fail fast, " << count
                      << " file(s) will not be analyzed";
          }
          return outcome;
        },
        [&cancelled, path]() { return cancelled(*path); }));
  }

  const bool has_deadline = options_.timeout != absl::InfiniteDuration();
  const absl::Time deadline = absl::Now() + options_.timeout;
  bool timed_out = false;
  for (std::future<FileOutcome> &future : futures) {
    if (has_deadline && !timed_out &&
        future.wait_until(absl::ToChronoTime(deadline)) ==
            std::future_status::timeout) {
      timed_out = true;
      abandon.store(true);
      const size_t count = pool.CancelPendingWork();
      LOG(WARNING) << "Module analysis timed out after " << options_.timeout
                   << "; " << count << " file(s) not started";
    }
    result.outcomes.push_back(future.get());
  }
  return result;
}

}  // namespace analysis
}  // namespace codesmell
