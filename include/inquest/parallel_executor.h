#pragma once

#include <inquest/executor.h>
#include <inquest/worker_pool.h>

#include <cstddef>

namespace inquest {

// Splits the file list into batches of `batch_size` and hands them to a
// WorkerPool. Workers see a context without the report callback. Outcomes
// are delivered to the sink in scan order once every batch completed.
class ParallelExecutor : public Executor {
public:
  ParallelExecutor(unsigned worker_count, std::size_t batch_size,
                   std::shared_ptr<Logger> logger);

  const char *Name() const override { return "parallel"; }
  void Execute(const TechniqueRunner &runner,
               const std::vector<TechniqueDescriptor> &per_file,
               const IncrementalStore &store,
               const FileOutcomeSink &sink) override;

  unsigned WorkerCount() const { return pool_.Size(); }

private:
  WorkerPool pool_;
  std::size_t batch_size_;
  std::shared_ptr<Logger> logger_;
};

} // namespace inquest
