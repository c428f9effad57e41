#include <inquest/sequential_executor.h>

#include <utility>

namespace inquest {

SequentialExecutor::SequentialExecutor(std::shared_ptr<Logger> logger)
    : logger_(EnsureLogger(std::move(logger))) {}

void SequentialExecutor::Execute(
    const TechniqueRunner &runner,
    const std::vector<TechniqueDescriptor> &per_file,
    const IncrementalStore &store, const FileOutcomeSink &sink) {
  const auto file_count = runner.FileCount();
  logger_->Log(LogLevel::kDebug, "executor.sequential.start",
               {{"files", std::to_string(file_count)},
                {"techniques", std::to_string(per_file.size())}});
  for (std::size_t index = 0; index < file_count; ++index) {
    sink(runner.RunFile(index, per_file, store));
  }
}

} // namespace inquest
