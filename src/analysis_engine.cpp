#include <inquest/analysis_engine.h>

#include <inquest/executor.h>
#include <inquest/metrics.h>
#include <inquest/report_channel.h>
#include <inquest/technique_registry.h>
#include <inquest/technique_runner.h>

#include <chrono>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace inquest {
namespace {

using Clock = std::chrono::steady_clock;

double ElapsedMs(Clock::time_point start) {
  return std::chrono::duration<double, std::milli>(Clock::now() - start)
      .count();
}

} // namespace

const char *RunPhaseName(RunPhase phase) {
  switch (phase) {
  case RunPhase::kIdle:
    return "idle";
  case RunPhase::kRunningGlobal:
    return "running-global";
  case RunPhase::kRunningPerFile:
    return "running-per-file";
  case RunPhase::kFinalizing:
    return "finalizing";
  case RunPhase::kDone:
    return "done";
  }
  return "unknown";
}

void ValidateTechniques(const std::vector<TechniqueDescriptor> &techniques) {
  TechniqueRegistry registry;
  for (const auto &technique : techniques) {
    registry.Register(technique);
  }
}

AnalysisEngine::AnalysisEngine(EngineComponents components)
    : logger_(EnsureLogger(std::move(components.logger))),
      syntax_tree_builder_(std::move(components.syntax_tree_builder)),
      listener_(components.listener) {}

ExecutionResult
AnalysisEngine::Run(std::vector<FileEntry> files,
                    const std::vector<TechniqueDescriptor> &techniques,
                    const std::string &base_dir,
                    const ExecutionOptions &options) {
  if (options.incremental_enabled && options.incremental_state_path.empty()) {
    throw std::invalid_argument(
        "incremental_state_path is required when incremental analysis is "
        "enabled");
  }
  auto store = IncrementalStore::Load(options.incremental_state_path,
                                      options.incremental_enabled, logger_);
  return Run(std::move(files), techniques, base_dir, options, store);
}

ExecutionResult
AnalysisEngine::Run(std::vector<FileEntry> files,
                    const std::vector<TechniqueDescriptor> &techniques,
                    const std::string &base_dir,
                    const ExecutionOptions &options, IncrementalStore &store) {
  phase_ = RunPhase::kIdle;
  ValidateExecutionOptions(options);
  ValidateTechniques(techniques);
  auto executor = MakeExecutor(options, logger_);

  std::vector<TechniqueDescriptor> global;
  std::vector<TechniqueDescriptor> per_file;
  for (const auto &technique : techniques) {
    (technique.is_global ? global : per_file).push_back(technique);
  }

  const auto start = Clock::now();
  const auto run_epoch_ms = EpochMilliseconds();
  const auto total_files = static_cast<unsigned>(files.size());
  logger_->Log(LogLevel::kInfo, "engine.start",
               {{"mode", executor->Name()},
                {"files", std::to_string(total_files)},
                {"global_techniques", std::to_string(global.size())},
                {"per_file_techniques", std::to_string(per_file.size())},
                {"incremental", store.Enabled() ? "true" : "false"}});

  auto channel = std::make_shared<ReportChannel>();
  auto context = std::make_shared<ExecutionContext>();
  context->base_dir = base_dir;
  context->files =
      std::make_shared<const std::vector<FileEntry>>(std::move(files));
  context->ambient_flags = options.ambient_flags;
  context->report = [channel](Occurrence occurrence) {
    channel->Push(std::move(occurrence));
  };

  const TechniqueRunner runner(options, context, channel, syntax_tree_builder_,
                               logger_);
  MetricsAggregator metrics;
  ExecutionResult result;

  phase_ = RunPhase::kRunningGlobal;
  result.occurrences = runner.RunGlobal(global, metrics);

  phase_ = RunPhase::kRunningPerFile;
  result.analyzed_files.reserve(total_files);
  executor->Execute(runner, per_file, store, [&](FileOutcome outcome) {
    metrics.RecordParseTime(outcome.parse_time_ms);
    if (outcome.reused_from != nullptr) {
      metrics.RecordCacheHit();
      store.RecordReuse(outcome.rel_path, *outcome.reused_from);
    } else {
      metrics.RecordCacheMiss();
      for (const auto &invocation : outcome.invocations) {
        metrics.RecordInvocation(invocation.name, false,
                                 invocation.duration_ms,
                                 invocation.occurrence_count);
      }
      if (store.Enabled()) {
        store.RecordExecution(
            outcome.rel_path,
            IncrementalRecord{outcome.fingerprint, outcome.occurrences,
                              outcome.per_technique, run_epoch_ms, 0});
      }
    }

    if (listener_ != nullptr) {
      listener_->OnFileProcessed(outcome.rel_path, outcome.occurrences.size());
    }
    result.analyzed_files.push_back(std::move(outcome.rel_path));
    result.occurrences.insert(
        result.occurrences.end(),
        std::make_move_iterator(outcome.occurrences.begin()),
        std::make_move_iterator(outcome.occurrences.end()));
  });

  phase_ = RunPhase::kFinalizing;
  result.duration_ms = ElapsedMs(start);

  if (store.Enabled()) {
    store.Finish(result.duration_ms);
    if (!options.incremental_state_path.empty() &&
        !store.Save(options.incremental_state_path)) {
      logger_->Log(LogLevel::kWarn, "engine.incremental.unsaved",
                   {{"path", options.incremental_state_path.string()}});
    }
    store.Commit();
  }

  if (options.metrics_enabled) {
    result.metrics = metrics.Finish(total_files, result.duration_ms);
    if (!options.metrics_history_path.empty() &&
        !AppendMetricsHistory(options.metrics_history_path,
                              MetricsHistoryEntry{EpochMilliseconds(),
                                                  *result.metrics},
                              options.history_max_entries, logger_)) {
      logger_->Log(LogLevel::kWarn, "engine.history.unsaved",
                   {{"path", options.metrics_history_path.string()}});
    }
  }

  if (channel->Dropped() > 0) {
    logger_->Log(LogLevel::kWarn, "report.dropped",
                 {{"count", std::to_string(channel->Dropped())}});
  }
  logger_->Log(LogLevel::kInfo, "engine.complete",
               {{"duration_ms", std::to_string(result.duration_ms)},
                {"files", std::to_string(total_files)},
                {"occurrences", std::to_string(result.occurrences.size())}});

  phase_ = RunPhase::kDone;
  if (listener_ != nullptr) {
    listener_->OnAnalysisComplete(result);
  }
  return result;
}

} // namespace inquest
