#include <inquest/executor.h>

#include <inquest/parallel_executor.h>
#include <inquest/sequential_executor.h>

#include <stdexcept>
#include <utility>

namespace inquest {

std::unique_ptr<Executor> MakeExecutor(const ExecutionOptions &options,
                                       std::shared_ptr<Logger> logger) {
  switch (options.mode) {
  case ExecutionMode::kSequential:
    return std::make_unique<SequentialExecutor>(std::move(logger));
  case ExecutionMode::kParallel:
    return std::make_unique<ParallelExecutor>(ResolveWorkerCount(options),
                                              options.batch_size,
                                              std::move(logger));
  }
  throw std::invalid_argument("Unsupported execution mode");
}

} // namespace inquest
