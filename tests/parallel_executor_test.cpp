#include <inquest/parallel_executor.h>
#include <inquest/sequential_executor.h>

#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "test_support/scripted_techniques.h"

namespace inquest {
namespace {

std::shared_ptr<ExecutionContext> ContextWith(std::size_t file_count) {
  auto files = std::make_shared<std::vector<FileEntry>>();
  for (std::size_t i = 0; i < file_count; ++i) {
    files->push_back(test::MakeFile("dir/file" + std::to_string(i) + ".ts",
                                    std::string(i % 7, 'x')));
  }
  auto context = std::make_shared<ExecutionContext>();
  context->files = files;
  context->report = [](Occurrence) {};
  return context;
}

TechniqueDescriptor LengthTechnique() {
  return test::PerFile(
      "length", [](std::string_view content, const std::string &rel_path,
                   const SyntaxTree *, const std::string &,
                   const ExecutionContext &) -> TechniqueResult {
        if (content.size() % 2 == 0) {
          return std::nullopt;
        }
        auto occurrence = test::MakeOccurrence("odd-length", rel_path, "length");
        occurrence.line = static_cast<unsigned>(content.size());
        return std::vector<Occurrence>{occurrence};
      });
}

std::vector<Occurrence> Collect(Executor &executor,
                                const TechniqueRunner &runner,
                                const std::vector<TechniqueDescriptor> &per_file,
                                std::vector<std::size_t> *order = nullptr) {
  const IncrementalStore store(false, nullptr);
  std::vector<Occurrence> occurrences;
  executor.Execute(runner, per_file, store, [&](FileOutcome outcome) {
    if (order != nullptr) {
      order->push_back(outcome.file_index);
    }
    occurrences.insert(occurrences.end(), outcome.occurrences.begin(),
                       outcome.occurrences.end());
  });
  return occurrences;
}

TEST(ParallelExecutorTest, MatchesSequentialOutputInOrder) {
  const auto context = ContextWith(53);
  const TechniqueRunner runner({}, context, std::make_shared<ReportChannel>(),
                               nullptr, nullptr);
  const std::vector<TechniqueDescriptor> per_file{LengthTechnique()};

  SequentialExecutor sequential(nullptr);
  ParallelExecutor parallel(4, 5, nullptr);
  std::vector<std::size_t> order;
  const auto expected = Collect(sequential, runner, per_file);
  const auto actual = Collect(parallel, runner, per_file, &order);

  EXPECT_FALSE(expected.empty());
  EXPECT_EQ(actual, expected);
  ASSERT_EQ(order.size(), 53u);
  EXPECT_TRUE(std::is_sorted(order.begin(), order.end()));
}

TEST(ParallelExecutorTest, WorkersNeverSeeReportCallback) {
  const auto context = ContextWith(8);
  const TechniqueRunner runner({}, context, std::make_shared<ReportChannel>(),
                               nullptr, nullptr);
  ParallelExecutor parallel(3, 2, nullptr);

  const auto occurrences = Collect(
      parallel, runner,
      {test::PerFile("probe",
                     [](std::string_view, const std::string &rel_path,
                        const SyntaxTree *, const std::string &,
                        const ExecutionContext &context) -> TechniqueResult {
                       if (context.report) {
                         return std::vector<Occurrence>{test::MakeOccurrence(
                             "report-visible", rel_path, "probe")};
                       }
                       return std::nullopt;
                     })});
  EXPECT_TRUE(occurrences.empty());
}

TEST(ParallelExecutorTest, FailuresStayWithTheirFile) {
  const auto context = ContextWith(12);
  const TechniqueRunner runner({}, context, nullptr, nullptr, nullptr);
  ParallelExecutor parallel(4, 1, nullptr);

  const auto occurrences = Collect(
      parallel, runner, {test::ThrowingTechnique("fragile"), LengthTechnique()});
  const auto failures = std::count_if(
      occurrences.begin(), occurrences.end(), [](const Occurrence &occurrence) {
        return occurrence.kind == kTechniqueErrorKind;
      });
  EXPECT_EQ(failures, 12);
}

TEST(ParallelExecutorTest, EmptyFileListDeliversNothing) {
  const auto context = ContextWith(0);
  const TechniqueRunner runner({}, context, nullptr, nullptr, nullptr);
  ParallelExecutor parallel(2, 10, nullptr);
  EXPECT_TRUE(Collect(parallel, runner, {LengthTechnique()}).empty());
}

TEST(ParallelExecutorTest, RejectsZeroBatchSize) {
  EXPECT_THROW(ParallelExecutor(2, 0, nullptr), std::invalid_argument);
}

} // namespace
} // namespace inquest
