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

#include "codesmell/analysis/analyzer.h"

#include <map>
#include <memory>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/random/random.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "codesmell/analysis/baseline.h"
#include "codesmell/analysis/finding.h"
#include "codesmell/analysis/report-aggregator.h"
#include "codesmell/analysis/rule-config.h"
#include "codesmell/analysis/rule-registry.h"
#include "codesmell/analysis/rule-test-utils.h"
#include "codesmell/common/util/file-util.h"
#include "codesmell/common/util/logging.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace codesmell {
namespace analysis {
namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;

// Keeps the baseline in memory; can be told to fail.
class MemoryBaselineStore final : public BaselineStore {
 public:
  absl::StatusOr<Baseline> Load() const final {
    if (!load_status.ok()) return load_status;
    if (!stored.has_value()) return absl::NotFoundError("nothing stored");
    return *stored;
  }

  absl::Status Save(const Baseline &baseline) final {
    if (!save_status.ok()) return save_status;
    stored = baseline;
    return absl::OkStatus();
  }

  std::optional<Baseline> stored;
  absl::Status load_status;
  absl::Status save_status;
};

class AnalyzeModuleTest : public ::testing::Test {
 protected:
  AnalyzeModuleTest()
      : registry_(MakeSealedRegistry(
            {EmptyBlockRule(), NodeKindRule("classes", MiniKind::kClass)})) {
    provider_.AddFile("A.kt",
                      "class A {\n"
                      "  // nothing yet\n"
                      "  fun f() {}\n"
                      "}\n");
    provider_.AddFailingFile("B.kt",
                             absl::InvalidArgumentError("unexpected token"));
    request_.module.module_name = "app";
    request_.module.layers.push_back(*ParseConfigLayer("module", "-classes"));
    request_.files = {"A.kt", "B.kt"};
  }

  absl::StatusOr<AnalysisResult> Analyze(BaselineStore *store = nullptr) {
    return AnalyzeModule(request_, *registry_, provider_, store);
  }

  std::unique_ptr<RuleRegistry> registry_;
  InMemoryAstProvider provider_;
  AnalysisRequest request_;
};

TEST_F(AnalyzeModuleTest, UnsealedRegistryFailsTheRequest) {
  RuleRegistry open_registry;
  CHECK_OK(open_registry.Register(EmptyBlockRule()));
  const auto result =
      AnalyzeModule(request_, open_registry, provider_, nullptr);
  EXPECT_EQ(result.status().code(), absl::StatusCode::kFailedPrecondition);
  EXPECT_THAT(provider_.ParsedPaths(), IsEmpty());
}

TEST_F(AnalyzeModuleTest, ParseFailureDoesNotFailOnErrorOnlyPolicy) {
  const auto result = Analyze();
  ASSERT_TRUE(result.ok()) << result.status();
  ASSERT_EQ(result->findings.size(), 1);
  const Finding &finding = result->findings[0];
  EXPECT_EQ(finding.rule_id, "no-empty-block");
  EXPECT_EQ(finding.severity, Severity::kStyle);
  EXPECT_EQ(finding.location.path, "A.kt");
  EXPECT_EQ(finding.location.range.start.line + 1, 3);
  ASSERT_EQ(result->diagnostics.size(), 1);
  EXPECT_EQ(result->diagnostics[0].kind, DiagnosticKind::kParseFailure);
  EXPECT_EQ(result->diagnostics[0].path, "B.kt");
  EXPECT_TRUE(result->passed);
}

TEST_F(AnalyzeModuleTest, ConfigurationProblemsAreDiagnostics) {
  request_.module.layers.push_back(
      *ParseConfigLayer("global", "+no-such-rule"));
  request_.module.excludes = {"{unbalanced"};
  request_.files = {"A.kt"};
  const auto result = Analyze();
  ASSERT_TRUE(result.ok()) << result.status();
  ASSERT_EQ(result->diagnostics.size(), 2);
  EXPECT_EQ(result->diagnostics[0].kind,
            DiagnosticKind::kInvalidConfiguration);
  EXPECT_EQ(result->diagnostics[1].kind, DiagnosticKind::kUnknownRuleId);
  EXPECT_EQ(result->diagnostics[1].rule_id, "no-such-rule");
  EXPECT_EQ(result->findings.size(), 1);
}

TEST_F(AnalyzeModuleTest, DegradedModeNote) {
  RuleDescriptor semantic = NodeKindRule("semantic", MiniKind::kFunction);
  semantic.requires_extra_context = true;
  registry_ = MakeSealedRegistry({EmptyBlockRule(), std::move(semantic)});
  request_.module.layers.clear();
  request_.resolve.extra_context_available = false;
  request_.files = {"A.kt"};

  const auto result = Analyze();
  ASSERT_TRUE(result.ok()) << result.status();
  ASSERT_EQ(result->findings.size(), 1);
  EXPECT_EQ(result->findings[0].rule_id, "no-empty-block");
  ASSERT_EQ(result->notes.size(), 1);
  EXPECT_THAT(result->notes[0], HasSubstr("'semantic'"));
  EXPECT_THAT(result->diagnostics, IsEmpty());
}

TEST_F(AnalyzeModuleTest, BaselineRoundTrip) {
  MemoryBaselineStore store;
  request_.files = {"A.kt"};

  // Accept the current findings.
  request_.lint.baseline_mode = BaselineMode::kUpdate;
  const auto update = Analyze(&store);
  ASSERT_TRUE(update.ok()) << update.status();
  ASSERT_EQ(update->findings.size(), 1);
  const Finding accepted = update->findings[0];
  ASSERT_TRUE(store.stored.has_value());
  EXPECT_THAT(*store.stored, ElementsAre(accepted.fingerprint));

  // Now they are baselined.
  request_.lint.baseline_mode = BaselineMode::kFilter;
  const auto filtered = Analyze(&store);
  ASSERT_TRUE(filtered.ok()) << filtered.status();
  EXPECT_THAT(filtered->findings, IsEmpty());
  EXPECT_EQ(filtered->baseline_suppressed, 1);
  EXPECT_FALSE(filtered->baseline_update.has_value());

  // Removing them from the baseline brings them back unchanged.
  store.stored = Baseline();
  const auto again = Analyze(&store);
  ASSERT_TRUE(again.ok()) << again.status();
  EXPECT_THAT(again->findings, ElementsAre(accepted));
  EXPECT_EQ(again->baseline_suppressed, 0);
}

TEST_F(AnalyzeModuleTest, UpdateKeepsOldEntriesWhenFilesAreMissing) {
  MemoryBaselineStore store;
  store.stored = Baseline({"from-B"});
  request_.lint.baseline_mode = BaselineMode::kUpdate;
  const auto result = Analyze(&store);
  ASSERT_TRUE(result.ok()) << result.status();
  ASSERT_EQ(result->findings.size(), 1);
  EXPECT_THAT(*store.stored,
              ElementsAre(result->findings[0].fingerprint, "from-B"));
  EXPECT_THAT(result->notes, ElementsAre(HasSubstr("Not all files")));
}

TEST_F(AnalyzeModuleTest, BaselineErrorsAreDiagnostics) {
  MemoryBaselineStore store;
  store.load_status = absl::DataLossError("baseline unreadable");
  request_.files = {"A.kt"};
  request_.policy.fail_on_diagnostics = true;

  const auto load_failed = Analyze(&store);
  ASSERT_TRUE(load_failed.ok()) << load_failed.status();
  EXPECT_EQ(load_failed->findings.size(), 1);
  ASSERT_EQ(load_failed->diagnostics.size(), 1);
  EXPECT_EQ(load_failed->diagnostics[0].kind, DiagnosticKind::kBaselineError);
  EXPECT_EQ(load_failed->diagnostics[0].message, "baseline unreadable");
  EXPECT_FALSE(load_failed->passed);

  store.load_status = absl::OkStatus();
  store.save_status = absl::PermissionDeniedError("read-only");
  request_.lint.baseline_mode = BaselineMode::kUpdate;
  const auto save_failed = Analyze(&store);
  ASSERT_TRUE(save_failed.ok()) << save_failed.status();
  ASSERT_EQ(save_failed->diagnostics.size(), 1);
  EXPECT_EQ(save_failed->diagnostics[0].kind, DiagnosticKind::kBaselineError);
  EXPECT_EQ(save_failed->diagnostics[0].message, "read-only");
  EXPECT_FALSE(save_failed->passed);
  EXPECT_FALSE(store.stored.has_value());
}

TEST_F(AnalyzeModuleTest, JsonFileBaseline) {
  const std::string path =
      file::JoinPath(::testing::TempDir(), "analyzer_test_baseline.json");
  JsonFileBaselineStore store(path);
  request_.files = {"A.kt"};

  request_.lint.baseline_mode = BaselineMode::kUpdate;
  ASSERT_TRUE(Analyze(&store).ok());

  request_.lint.baseline_mode = BaselineMode::kFilter;
  const auto result = Analyze(&store);
  ASSERT_TRUE(result.ok()) << result.status();
  EXPECT_THAT(result->findings, IsEmpty());
  EXPECT_EQ(result->baseline_suppressed, 1);
}

TEST_F(AnalyzeModuleTest, FailFastScenario) {
  registry_ = MakeSealedRegistry(
      {NodeKindRule("bad-class", MiniKind::kClass, Severity::kError)});
  request_.module.layers.clear();
  request_.module.fail_fast = true;
  request_.lint.worker_count = 1;
  request_.files.clear();
  for (int i = 1; i <= 10; ++i) {
    const std::string path = "f" + std::to_string(i) + ".kt";
    provider_.AddFile(path, i == 3 ? "class Bad {\n}\n" : "fun ok() {}\n");
    request_.files.push_back(path);
  }

  const auto result = Analyze();
  ASSERT_TRUE(result.ok()) << result.status();
  ASSERT_EQ(result->findings.size(), 1);
  EXPECT_EQ(result->findings[0].location.path, "f3.kt");
  EXPECT_EQ(result->incomplete_files.size(), 7);
  EXPECT_EQ(result->diagnostics.size(), 7);
  for (const Diagnostic &diagnostic : result->diagnostics) {
    EXPECT_EQ(diagnostic.kind, DiagnosticKind::kIncomplete);
  }
  EXPECT_FALSE(result->passed);
}

// Random per-file parse delays change the order in which workers pick up and
// finish files; the result must not change with it.
TEST_F(AnalyzeModuleTest, ResultIndependentOfSchedulingAndWorkerCount) {
  registry_ = MakeSealedRegistry(
      {EmptyBlockRule(), FunctionNamingRule(),
       NodeKindRule("classes", MiniKind::kClass),
       FailingRule("broken", MiniKind::kBlock)});
  request_.module.layers.clear();
  request_.module.excludes = {"**/gen/**"};
  request_.lint.autocorrect = true;
  request_.files.clear();
  for (int i = 1; i <= 24; ++i) {
    const std::string path = absl::StrCat("src/f", i, ".kt");
    request_.files.push_back(path);
    if (i % 7 == 0) {
      provider_.AddFailingFile(
          path, absl::InvalidArgumentError(absl::StrCat(path, ": bad")));
      continue;
    }
    provider_.AddFile(
        path, absl::StrCat("class C", i, " {\n",
                           i % 3 == 0
                               ? "  // codesmell: suppress no-empty-block\n"
                               : "",
                           "  fun F", i, "() {}\n",
                           "  fun g() {\n",
                           "    if (x) {\n",
                           "    }\n",
                           "  }\n",
                           "}\n"));
  }
  provider_.AddFile("gen/G.kt", "fun G() {}\n");
  request_.files.push_back("gen/G.kt");
  request_.files.push_back("src/f1.kt");

  // Baseline every other finding of a sequential run.
  request_.lint.worker_count = 1;
  const auto unfiltered = Analyze();
  ASSERT_TRUE(unfiltered.ok()) << unfiltered.status();
  ASSERT_GT(unfiltered->findings.size(), 20);
  MemoryBaselineStore store;
  store.stored = Baseline();
  for (size_t i = 0; i < unfiltered->findings.size(); i += 2) {
    store.stored->insert(unfiltered->findings[i].fingerprint);
  }

  const auto expected = Analyze(&store);
  ASSERT_TRUE(expected.ok()) << expected.status();
  EXPECT_GT(expected->baseline_suppressed, 0);
  EXPECT_GT(expected->inline_suppressed, 0);
  EXPECT_FALSE(expected->corrected_contents.empty());
  std::ostringstream expected_dump;
  expected_dump << *expected;

  for (const unsigned seed : {1u, 2u, 3u}) {
    std::seed_seq seed_sequence = {seed};
    absl::InsecureBitGen gen(seed_sequence);
    std::map<std::string, absl::Duration> delays;
    for (const std::string &path : request_.files) {
      delays[path] = absl::Microseconds(absl::Uniform(gen, 0, 3000));
    }
    provider_.SetParseHook([delays](const std::string &path) {
      const auto found = delays.find(path);
      if (found != delays.end()) absl::SleepFor(found->second);
    });
    for (const int workers : {1, 2, 4, 8}) {
      request_.lint.worker_count = workers;
      const auto result = Analyze(&store);
      ASSERT_TRUE(result.ok()) << result.status();
      std::ostringstream dump;
      dump << *result;
      EXPECT_EQ(dump.str(), expected_dump.str())
          << "seed " << seed << ", " << workers << " workers";
      EXPECT_EQ(result->findings, expected->findings);
      EXPECT_EQ(result->diagnostics, expected->diagnostics);
      EXPECT_EQ(result->corrected_contents, expected->corrected_contents);
    }
  }
}

}  // namespace
}  // namespace analysis
}  // namespace codesmell
