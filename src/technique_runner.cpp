#include <inquest/technique_runner.h>

#include <inquest/fingerprint.h>
#include <inquest/guarded_invocation.h>

#include <chrono>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace inquest {
namespace {

using Clock = std::chrono::steady_clock;

std::string_view ContentOf(const FileEntry &entry) {
  if (!entry.content) {
    return {};
  }
  return *entry.content;
}

} // namespace

Occurrence TechniqueFailureOccurrence(const std::string &technique,
                                      const std::string &rel_path,
                                      const std::string &error) {
  Occurrence occurrence;
  occurrence.kind = kTechniqueErrorKind;
  occurrence.severity = Severity::kError;
  occurrence.message =
      "Technique '" + technique + "' failed for " + rel_path + ": " + error;
  occurrence.file_path = rel_path;
  occurrence.source_technique = technique;
  return occurrence;
}

Occurrence TechniqueTimeoutOccurrence(const std::string &technique,
                                      const std::string &rel_path,
                                      unsigned budget_ms) {
  Occurrence occurrence;
  occurrence.kind = kTechniqueTimeoutKind;
  occurrence.severity = Severity::kWarning;
  occurrence.message = "Technique '" + technique + "' timed out for " +
                       rel_path + ": " + std::to_string(budget_ms) +
                       "ms exceeded";
  occurrence.file_path = rel_path;
  occurrence.source_technique = technique;
  return occurrence;
}

TechniqueRunner::TechniqueRunner(
    const ExecutionOptions &options,
    std::shared_ptr<const ExecutionContext> context,
    std::shared_ptr<ReportChannel> channel,
    std::shared_ptr<const SyntaxTreeBuilder> syntax_tree_builder,
    std::shared_ptr<Logger> logger)
    : options_(options), context_(std::move(context)),
      channel_(std::move(channel)),
      syntax_tree_builder_(std::move(syntax_tree_builder)),
      logger_(EnsureLogger(std::move(logger))) {
  if (!context_ || !context_->files) {
    throw std::invalid_argument("TechniqueRunner requires a context with files");
  }
}

std::size_t TechniqueRunner::FileCount() const { return context_->files->size(); }

TechniqueRunner TechniqueRunner::WithoutReportChannel() const {
  auto stripped = std::make_shared<ExecutionContext>(*context_);
  stripped->report = nullptr;
  return TechniqueRunner(options_, std::move(stripped), nullptr,
                         syntax_tree_builder_, logger_);
}

TechniqueRunner::Invocation
TechniqueRunner::Invoke(const TechniqueDescriptor &technique,
                        const FileEntry *entry,
                        std::shared_ptr<const SyntaxTree> syntax_tree) const {
  const bool is_global = entry == nullptr;
  const std::string rel_path = is_global ? kGlobalScopePath : entry->rel_path;
  const auto budget_ms =
      is_global ? options_.global_timeout_ms : options_.timeout_ms;

  std::uint64_t invocation_id = 0;
  if (channel_) {
    invocation_id = channel_->Open(rel_path, technique.name);
  }

  // Everything the call touches is owned by the closure, so an abandoned
  // invocation stays valid after the run has moved on.
  GuardedCall call = [context = context_, run = technique.run, entry,
                      syntax_tree = std::move(syntax_tree),
                      invocation_id]() -> TechniqueResult {
    ReportChannel::InvocationScope scope(invocation_id);
    if (entry == nullptr) {
      return run({}, {}, nullptr, {}, *context);
    }
    return run(ContentOf(*entry), entry->rel_path, syntax_tree.get(),
               entry->full_path, *context);
  };

  auto outcome =
      InvokeGuarded(std::move(call), std::chrono::milliseconds(budget_ms));

  Invocation invocation;
  invocation.duration_ms = outcome.duration_ms;
  invocation.occurrences = std::move(outcome.occurrences);
  if (channel_) {
    auto reported = channel_->Close();
    invocation.occurrences.insert(invocation.occurrences.end(),
                                  std::make_move_iterator(reported.begin()),
                                  std::make_move_iterator(reported.end()));
  }
  invocation.produced = invocation.occurrences.size();

  switch (outcome.status) {
  case InvocationStatus::kCompleted:
    logger_->Log(LogLevel::kDebug, "technique.complete",
                 {{"technique", technique.name},
                  {"file", rel_path},
                  {"duration_ms", std::to_string(outcome.duration_ms)},
                  {"occurrences", std::to_string(invocation.produced)}});
    break;
  case InvocationStatus::kFailed:
    logger_->Log(LogLevel::kError, "technique.failed",
                 {{"technique", technique.name},
                  {"file", rel_path},
                  {"error", outcome.error}});
    invocation.occurrences.push_back(
        TechniqueFailureOccurrence(technique.name, rel_path, outcome.error));
    break;
  case InvocationStatus::kTimedOut:
    logger_->Log(LogLevel::kWarn, "technique.timeout",
                 {{"technique", technique.name},
                  {"file", rel_path},
                  {"budget_ms", std::to_string(budget_ms)}});
    invocation.occurrences.push_back(
        TechniqueTimeoutOccurrence(technique.name, rel_path, budget_ms));
    break;
  }
  return invocation;
}

std::vector<Occurrence>
TechniqueRunner::RunGlobal(const std::vector<TechniqueDescriptor> &techniques,
                           MetricsAggregator &metrics) const {
  std::vector<Occurrence> occurrences;
  for (const auto &technique : techniques) {
    if (!technique.is_global) {
      continue;
    }
    auto invocation = Invoke(technique, nullptr, nullptr);
    metrics.RecordInvocation(technique.name, true, invocation.duration_ms,
                             static_cast<unsigned>(invocation.produced));
    occurrences.insert(occurrences.end(),
                       std::make_move_iterator(invocation.occurrences.begin()),
                       std::make_move_iterator(invocation.occurrences.end()));
  }
  return occurrences;
}

std::shared_ptr<const SyntaxTree>
TechniqueRunner::BuildSyntaxTree(const FileEntry &entry,
                                 double &parse_time_ms) const {
  if (!syntax_tree_builder_) {
    return nullptr;
  }
  const auto start = Clock::now();
  std::shared_ptr<const SyntaxTree> tree;
  try {
    tree = syntax_tree_builder_->Build(ContentOf(entry), entry.rel_path);
  } catch (const std::exception &ex) {
    logger_->Log(LogLevel::kWarn, "syntax_tree.failed",
                 {{"file", entry.rel_path}, {"error", ex.what()}});
  }
  parse_time_ms +=
      std::chrono::duration<double, std::milli>(Clock::now() - start).count();
  return tree;
}

bool TechniqueRunner::Applies(const TechniqueDescriptor &technique,
                              const std::string &rel_path,
                              FileOutcome &outcome) const {
  std::string error;
  try {
    return technique.AppliesTo(rel_path);
  } catch (const std::exception &ex) {
    error = ex.what();
  } catch (...) {
    error = "unknown exception";
  }
  logger_->Log(LogLevel::kError, "technique.predicate.failed",
               {{"technique", technique.name},
                {"file", rel_path},
                {"error", error}});
  outcome.occurrences.push_back(
      TechniqueFailureOccurrence(technique.name, rel_path, error));
  outcome.invocations.push_back(TechniqueMetric{technique.name, 0.0, 0, false});
  return false;
}

FileOutcome
TechniqueRunner::RunFile(std::size_t file_index,
                         const std::vector<TechniqueDescriptor> &techniques,
                         const IncrementalStore &store) const {
  const auto &entry = context_->files->at(file_index);

  FileOutcome outcome;
  outcome.file_index = file_index;
  outcome.rel_path = entry.rel_path;

  if (store.Enabled()) {
    outcome.fingerprint = ContentFingerprint(ContentOf(entry));
    if (const auto *previous =
            store.FindReusable(entry.rel_path, outcome.fingerprint)) {
      outcome.reused_from = previous;
      outcome.occurrences = previous->occurrences;
      logger_->Log(LogLevel::kDebug, "incremental.reuse",
                   {{"file", entry.rel_path},
                    {"occurrences",
                     std::to_string(previous->occurrences.size())}});
      return outcome;
    }
  }

  auto syntax_tree = entry.syntax_tree;
  bool tree_requested = syntax_tree != nullptr;
  for (const auto &technique : techniques) {
    if (technique.is_global || !Applies(technique, entry.rel_path, outcome)) {
      continue;
    }
    if (!tree_requested) {
      tree_requested = true;
      syntax_tree = BuildSyntaxTree(entry, outcome.parse_time_ms);
    }

    auto invocation = Invoke(technique, &entry, syntax_tree);
    const auto produced = static_cast<unsigned>(invocation.produced);
    auto &timing = outcome.per_technique[technique.name];
    timing.duration_ms += invocation.duration_ms;
    timing.occurrence_count += produced;
    outcome.invocations.push_back(
        TechniqueMetric{technique.name, invocation.duration_ms, produced, false});
    outcome.occurrences.insert(
        outcome.occurrences.end(),
        std::make_move_iterator(invocation.occurrences.begin()),
        std::make_move_iterator(invocation.occurrences.end()));
  }
  return outcome;
}

} // namespace inquest
