#include <inquest/execution_options.h>

#include <algorithm>
#include <stdexcept>
#include <thread>

namespace inquest {

const char *ExecutionModeName(ExecutionMode mode) {
  switch (mode) {
  case ExecutionMode::kSequential:
    return "sequential";
  case ExecutionMode::kParallel:
    return "parallel";
  }
  return "unknown";
}

ExecutionMode ParseExecutionMode(const std::string &value) {
  if (value == "sequential") {
    return ExecutionMode::kSequential;
  }
  if (value == "parallel" || value == "fast") {
    return ExecutionMode::kParallel;
  }
  throw std::invalid_argument("Unknown execution mode: " + value +
                              ". Supported: sequential, parallel");
}

std::filesystem::path DefaultStateDirectory(const std::filesystem::path &root) {
  return root / ".inquest";
}

std::filesystem::path
DefaultIncrementalStatePath(const std::filesystem::path &state_directory) {
  return state_directory / "incremental-state.yml";
}

std::filesystem::path
DefaultMetricsHistoryPath(const std::filesystem::path &state_directory) {
  return state_directory / "metrics-history.yml";
}

void ValidateExecutionOptions(const ExecutionOptions &options) {
  if (options.worker_count && *options.worker_count == 0) {
    throw std::invalid_argument("worker_count must be at least 1");
  }
  if (options.batch_size == 0) {
    throw std::invalid_argument("batch_size must be at least 1");
  }
}

unsigned ResolveWorkerCount(const ExecutionOptions &options) {
  if (options.worker_count) {
    return *options.worker_count;
  }
  return std::max(1u, std::thread::hardware_concurrency());
}

} // namespace inquest
