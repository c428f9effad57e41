#include <inquest/parallel_executor.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace inquest {

ParallelExecutor::ParallelExecutor(unsigned worker_count,
                                   std::size_t batch_size,
                                   std::shared_ptr<Logger> logger)
    : pool_(worker_count, logger), batch_size_(batch_size),
      logger_(EnsureLogger(std::move(logger))) {
  if (batch_size_ == 0) {
    throw std::invalid_argument("Batch size must be at least 1");
  }
}

void ParallelExecutor::Execute(
    const TechniqueRunner &runner,
    const std::vector<TechniqueDescriptor> &per_file,
    const IncrementalStore &store, const FileOutcomeSink &sink) {
  const auto worker_runner = runner.WithoutReportChannel();
  const auto file_count = worker_runner.FileCount();
  const auto batch_count = (file_count + batch_size_ - 1) / batch_size_;

  logger_->Log(LogLevel::kDebug, "executor.parallel.start",
               {{"files", std::to_string(file_count)},
                {"batches", std::to_string(batch_count)},
                {"workers", std::to_string(pool_.Size())}});

  // Each slot is written by exactly one job.
  std::vector<FileOutcome> outcomes(file_count);
  pool_.Run(batch_count, [&](std::size_t batch) {
    const auto begin = batch * batch_size_;
    const auto end = std::min(file_count, begin + batch_size_);
    for (auto index = begin; index < end; ++index) {
      outcomes[index] = worker_runner.RunFile(index, per_file, store);
    }
  });

  for (auto &outcome : outcomes) {
    sink(std::move(outcome));
  }
}

} // namespace inquest
