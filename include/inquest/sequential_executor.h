#pragma once

#include <inquest/executor.h>

namespace inquest {

// Files in scan order, techniques in registration order, one invocation at
// a time. The runner's report channel stays attached.
class SequentialExecutor : public Executor {
public:
  explicit SequentialExecutor(std::shared_ptr<Logger> logger);

  const char *Name() const override { return "sequential"; }
  void Execute(const TechniqueRunner &runner,
               const std::vector<TechniqueDescriptor> &per_file,
               const IncrementalStore &store,
               const FileOutcomeSink &sink) override;

private:
  std::shared_ptr<Logger> logger_;
};

} // namespace inquest
