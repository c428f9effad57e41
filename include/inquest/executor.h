#pragma once

#include <inquest/execution_options.h>
#include <inquest/incremental_store.h>
#include <inquest/logging.h>
#include <inquest/technique.h>
#include <inquest/technique_runner.h>

#include <functional>
#include <memory>
#include <vector>

namespace inquest {

// Receives one outcome per file, in scan order, on the calling thread.
using FileOutcomeSink = std::function<void(FileOutcome)>;

// Strategy for the per-file phase of a run. Global techniques are not an
// executor's concern.
class Executor {
public:
  virtual ~Executor() = default;
  virtual const char *Name() const = 0;
  virtual void Execute(const TechniqueRunner &runner,
                       const std::vector<TechniqueDescriptor> &per_file,
                       const IncrementalStore &store,
                       const FileOutcomeSink &sink) = 0;
};

std::unique_ptr<Executor> MakeExecutor(const ExecutionOptions &options,
                                       std::shared_ptr<Logger> logger);

} // namespace inquest
