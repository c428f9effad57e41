#pragma once

#include <inquest/execution_options.h>
#include <inquest/incremental_store.h>
#include <inquest/interfaces.h>
#include <inquest/logging.h>
#include <inquest/technique.h>

#include <memory>
#include <string>
#include <vector>

namespace inquest {

enum class RunPhase { kIdle, kRunningGlobal, kRunningPerFile, kFinalizing, kDone };

const char *RunPhaseName(RunPhase phase);

struct EngineComponents {
  std::shared_ptr<Logger> logger;
  // Optional; files without a tree are handed to techniques with null.
  std::shared_ptr<const SyntaxTreeBuilder> syntax_tree_builder;
  // Optional and not owned; must outlive every Run call.
  ExecutionListener *listener = nullptr;
};

// Throws std::invalid_argument for descriptors that could never have been
// registered: empty or duplicate names, missing run functions, global
// techniques with a file predicate.
void ValidateTechniques(const std::vector<TechniqueDescriptor> &techniques);

class AnalysisEngine {
public:
  explicit AnalysisEngine(EngineComponents components = {});

  // Loads the incremental store from options.incremental_state_path (when
  // enabled), runs, and persists the replacement store.
  ExecutionResult Run(std::vector<FileEntry> files,
                      const std::vector<TechniqueDescriptor> &techniques,
                      const std::string &base_dir,
                      const ExecutionOptions &options);

  // Runs against a caller-owned store. The store's state is promoted with
  // Commit() after a successful run, and additionally saved when
  // options.incremental_state_path is set.
  ExecutionResult Run(std::vector<FileEntry> files,
                      const std::vector<TechniqueDescriptor> &techniques,
                      const std::string &base_dir,
                      const ExecutionOptions &options,
                      IncrementalStore &store);

  RunPhase Phase() const { return phase_; }

private:
  std::shared_ptr<Logger> logger_;
  std::shared_ptr<const SyntaxTreeBuilder> syntax_tree_builder_;
  ExecutionListener *listener_;
  RunPhase phase_ = RunPhase::kIdle;
};

} // namespace inquest
