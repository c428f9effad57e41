#include <inquest/technique_runner.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <stdexcept>

#include "test_support/scripted_techniques.h"

namespace inquest {
namespace {

using ::testing::_;
using ::testing::HasSubstr;
using ::testing::Return;
using ::testing::Throw;

class FakeTree : public SyntaxTree {
public:
  std::string Language() const override { return "fake"; }
};

class MockSyntaxTreeBuilder : public SyntaxTreeBuilder {
public:
  MOCK_METHOD(std::shared_ptr<const SyntaxTree>, Build,
              (std::string_view content, const std::string &rel_path),
              (const, override));
};

class TechniqueRunnerTest : public ::testing::Test {
protected:
  void SetUp() override {
    auto files = std::make_shared<std::vector<FileEntry>>();
    files->push_back(test::MakeFile("a.ts", "let a = 1;"));
    files->push_back(test::MakeFile("b.md", "# notes"));
    context_ = std::make_shared<ExecutionContext>();
    context_->base_dir = "/virtual";
    context_->files = files;
    channel_ = std::make_shared<ReportChannel>();
    context_->report = [channel = channel_](Occurrence occurrence) {
      channel->Push(std::move(occurrence));
    };
    options_.timeout_ms = 2000;
    options_.global_timeout_ms = 2000;
  }

  TechniqueRunner MakeRunner(
      std::shared_ptr<const SyntaxTreeBuilder> builder = nullptr) const {
    return TechniqueRunner(options_, context_, channel_, std::move(builder),
                           nullptr);
  }

  ExecutionOptions options_;
  std::shared_ptr<ExecutionContext> context_;
  std::shared_ptr<ReportChannel> channel_;
  IncrementalStore disabled_store_{false, nullptr};
};

TEST_F(TechniqueRunnerTest, RequiresContextWithFiles) {
  EXPECT_THROW(TechniqueRunner(options_, nullptr, nullptr, nullptr, nullptr),
               std::invalid_argument);
  EXPECT_THROW(TechniqueRunner(options_,
                               std::make_shared<ExecutionContext>(), nullptr,
                               nullptr, nullptr),
               std::invalid_argument);
}

TEST_F(TechniqueRunnerTest, SkipsTechniquesWhosePredicateRejectsFile) {
  auto calls = std::make_shared<std::atomic<int>>(0);
  auto technique = test::CountingTechnique("ts-only", "hit", calls);
  technique.file_predicate = [](const std::string &path) {
    return path.size() > 3 && path.substr(path.size() - 3) == ".ts";
  };
  const auto runner = MakeRunner();

  const auto markdown = runner.RunFile(1, {technique}, disabled_store_);
  EXPECT_TRUE(markdown.occurrences.empty());
  EXPECT_TRUE(markdown.invocations.empty());
  const auto typescript = runner.RunFile(0, {technique}, disabled_store_);
  ASSERT_EQ(typescript.occurrences.size(), 1u);
  EXPECT_EQ(calls->load(), 1);
}

TEST_F(TechniqueRunnerTest, ThrowingPredicateBecomesErrorOccurrence) {
  auto calls = std::make_shared<std::atomic<int>>(0);
  auto picky = test::CountingTechnique("picky", "never", calls);
  picky.file_predicate = [](const std::string &path) -> bool {
    throw std::runtime_error("cannot classify " + path);
  };
  const auto runner = MakeRunner();

  const auto outcome = runner.RunFile(
      0, {picky, test::CountingTechnique("steady", "hit", calls)},
      disabled_store_);

  EXPECT_EQ(calls->load(), 1);
  ASSERT_EQ(outcome.occurrences.size(), 2u);
  EXPECT_EQ(outcome.occurrences[0].kind, kTechniqueErrorKind);
  EXPECT_EQ(outcome.occurrences[0].severity, Severity::kError);
  EXPECT_EQ(outcome.occurrences[0].source_technique, "picky");
  EXPECT_THAT(outcome.occurrences[0].message, HasSubstr("cannot classify a.ts"));
  EXPECT_EQ(outcome.occurrences[1].kind, "hit");
  EXPECT_EQ(outcome.occurrences[1].source_technique, "steady");
}

TEST_F(TechniqueRunnerTest, BuildsSyntaxTreeOncePerFileOnlyWhenNeeded) {
  auto builder = std::make_shared<MockSyntaxTreeBuilder>();
  auto tree = std::make_shared<FakeTree>();
  EXPECT_CALL(*builder, Build(_, std::string("a.ts")))
      .Times(1)
      .WillOnce(Return(tree));

  std::atomic<int> saw_tree{0};
  auto inspect = [&saw_tree](std::string_view, const std::string &,
                             const SyntaxTree *syntax_tree,
                             const std::string &,
                             const ExecutionContext &) -> TechniqueResult {
    if (syntax_tree != nullptr && syntax_tree->Language() == "fake") {
      ++saw_tree;
    }
    return std::nullopt;
  };
  const auto predicate = [](const std::string &path) { return path == "a.ts"; };
  const auto runner = MakeRunner(builder);

  runner.RunFile(0,
                 {test::PerFile("first", inspect, predicate),
                  test::PerFile("second", inspect, predicate)},
                 disabled_store_);
  const auto skipped = runner.RunFile(
      1, {test::PerFile("first", inspect, predicate)}, disabled_store_);

  EXPECT_EQ(saw_tree.load(), 2);
  EXPECT_DOUBLE_EQ(skipped.parse_time_ms, 0.0);
}

TEST_F(TechniqueRunnerTest, BuilderFailureLeavesTreeNull) {
  auto builder = std::make_shared<MockSyntaxTreeBuilder>();
  EXPECT_CALL(*builder, Build(_, _))
      .WillOnce(Throw(std::runtime_error("unsupported")));

  bool got_null = false;
  const auto runner = MakeRunner(builder);
  const auto outcome = runner.RunFile(
      0,
      {test::PerFile("probe",
                     [&got_null](std::string_view, const std::string &,
                                 const SyntaxTree *syntax_tree,
                                 const std::string &,
                                 const ExecutionContext &) -> TechniqueResult {
                       got_null = syntax_tree == nullptr;
                       return std::nullopt;
                     })},
      disabled_store_);

  EXPECT_TRUE(got_null);
  EXPECT_TRUE(outcome.occurrences.empty());
}

TEST_F(TechniqueRunnerTest, FailureBecomesErrorOccurrence) {
  const auto runner = MakeRunner();
  const auto outcome =
      runner.RunFile(0, {test::ThrowingTechnique("broken")}, disabled_store_);

  ASSERT_EQ(outcome.occurrences.size(), 1u);
  const auto &occurrence = outcome.occurrences.front();
  EXPECT_EQ(occurrence.kind, kTechniqueErrorKind);
  EXPECT_EQ(occurrence.severity, Severity::kError);
  EXPECT_EQ(occurrence.file_path, "a.ts");
  EXPECT_EQ(occurrence.source_technique, "broken");
  EXPECT_THAT(occurrence.message, HasSubstr("boom on a.ts"));
  ASSERT_EQ(outcome.invocations.size(), 1u);
  EXPECT_EQ(outcome.invocations.front().occurrence_count, 0u);
}

TEST_F(TechniqueRunnerTest, TimeoutBecomesWarningOccurrence) {
  options_.timeout_ms = 40;
  auto release = std::make_shared<std::atomic<bool>>(false);
  const auto runner = MakeRunner();
  const auto outcome = runner.RunFile(
      0, {test::BlockingTechnique("stuck", release)}, disabled_store_);
  release->store(true);

  ASSERT_EQ(outcome.occurrences.size(), 1u);
  EXPECT_EQ(outcome.occurrences.front().kind, kTechniqueTimeoutKind);
  EXPECT_EQ(outcome.occurrences.front().severity, Severity::kWarning);
  EXPECT_THAT(outcome.occurrences.front().message, HasSubstr("40ms"));
}

TEST_F(TechniqueRunnerTest, ReportedOccurrencesFollowReturnedOnes) {
  const auto runner = MakeRunner();
  const auto outcome = runner.RunFile(
      0,
      {test::PerFile("mixed",
                     [](std::string_view, const std::string &rel_path,
                        const SyntaxTree *, const std::string &,
                        const ExecutionContext &context) -> TechniqueResult {
                       Occurrence side;
                       side.kind = "side";
                       context.report(side);
                       return std::vector<Occurrence>{
                           test::MakeOccurrence("returned", rel_path, "mixed")};
                     })},
      disabled_store_);

  ASSERT_EQ(outcome.occurrences.size(), 2u);
  EXPECT_EQ(outcome.occurrences[0].kind, "returned");
  EXPECT_EQ(outcome.occurrences[1].kind, "side");
  EXPECT_EQ(outcome.occurrences[1].file_path, "a.ts");
  EXPECT_EQ(outcome.occurrences[1].source_technique, "mixed");
  EXPECT_EQ(outcome.per_technique.at("mixed").occurrence_count, 2u);
}

TEST_F(TechniqueRunnerTest, RunnerWithoutChannelHidesReport) {
  const auto runner = MakeRunner().WithoutReportChannel();
  EXPECT_FALSE(runner.HasReportChannel());
  bool had_report = true;
  runner.RunFile(0,
                 {test::PerFile("probe",
                                [&had_report](std::string_view,
                                              const std::string &,
                                              const SyntaxTree *,
                                              const std::string &,
                                              const ExecutionContext &context)
                                    -> TechniqueResult {
                                  had_report = static_cast<bool>(context.report);
                                  return std::nullopt;
                                })},
                 disabled_store_);
  EXPECT_FALSE(had_report);
}

TEST_F(TechniqueRunnerTest, GlobalTechniquesSeeAllFilesAndRecordMetrics) {
  const auto runner = MakeRunner();
  MetricsAggregator metrics;
  std::size_t seen = 0;
  const auto occurrences = runner.RunGlobal(
      {test::Global("census",
                    [&seen](std::string_view content,
                            const std::string &rel_path, const SyntaxTree *,
                            const std::string &,
                            const ExecutionContext &context) -> TechniqueResult {
                      EXPECT_TRUE(content.empty());
                      EXPECT_TRUE(rel_path.empty());
                      seen = context.files->size();
                      return std::vector<Occurrence>{
                          test::MakeOccurrence("census", "a.ts", "census")};
                    }),
       test::CountingTechnique("per-file", "ignored",
                               std::make_shared<std::atomic<int>>(0))},
      metrics);

  EXPECT_EQ(seen, 2u);
  ASSERT_EQ(occurrences.size(), 1u);
  const auto summary = metrics.Finish(2, 1.0);
  ASSERT_EQ(summary.per_technique.size(), 1u);
  EXPECT_TRUE(summary.per_technique.front().is_global);
}

TEST_F(TechniqueRunnerTest, FailingGlobalTechniqueUsesGlobalPath) {
  const auto runner = MakeRunner();
  MetricsAggregator metrics;
  const auto occurrences = runner.RunGlobal(
      {test::Global("fragile",
                    [](std::string_view, const std::string &,
                       const SyntaxTree *, const std::string &,
                       const ExecutionContext &) -> TechniqueResult {
                      throw std::logic_error("no files");
                    })},
      metrics);

  ASSERT_EQ(occurrences.size(), 1u);
  EXPECT_EQ(occurrences.front().file_path, kGlobalScopePath);
  EXPECT_EQ(occurrences.front().kind, kTechniqueErrorKind);
}

TEST_F(TechniqueRunnerTest, ReusesMatchingRecordWithoutInvoking) {
  auto calls = std::make_shared<std::atomic<int>>(0);
  const auto technique = test::CountingTechnique("count", "hit", calls);
  const auto runner = MakeRunner();

  IncrementalStore store(true, nullptr);
  const auto first = runner.RunFile(0, {technique}, store);
  EXPECT_EQ(first.reused_from, nullptr);
  EXPECT_FALSE(first.fingerprint.empty());

  IncrementalRecord record;
  record.fingerprint = first.fingerprint;
  record.occurrences = first.occurrences;
  store.RecordExecution("a.ts", record);
  store.Commit();

  const auto second = runner.RunFile(0, {technique}, store);
  EXPECT_NE(second.reused_from, nullptr);
  EXPECT_EQ(second.occurrences, first.occurrences);
  EXPECT_EQ(calls->load(), 1);
}

} // namespace
} // namespace inquest
