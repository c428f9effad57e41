#pragma once

#include <inquest/execution_options.h>
#include <inquest/incremental_store.h>
#include <inquest/interfaces.h>
#include <inquest/logging.h>
#include <inquest/metrics.h>
#include <inquest/report_channel.h>
#include <inquest/technique.h>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace inquest {

inline constexpr char kGlobalScopePath[] = "[global]";
inline constexpr char kTechniqueErrorKind[] = "technique-error";
inline constexpr char kTechniqueTimeoutKind[] = "technique-timeout";

Occurrence TechniqueFailureOccurrence(const std::string &technique,
                                      const std::string &rel_path,
                                      const std::string &error);
Occurrence TechniqueTimeoutOccurrence(const std::string &technique,
                                      const std::string &rel_path,
                                      unsigned budget_ms);

// Everything produced for one file, in the order it has to be emitted.
struct FileOutcome {
  std::size_t file_index = 0;
  std::string rel_path;
  std::string fingerprint;
  // Set when the previous run's record was reused instead of executing.
  const IncrementalRecord *reused_from = nullptr;
  std::vector<Occurrence> occurrences;
  std::map<std::string, TechniqueTiming> per_technique;
  std::vector<TechniqueMetric> invocations;
  double parse_time_ms = 0.0;
};

// Runs techniques against the files of one ExecutionContext. RunFile may be
// called concurrently as long as the runner has no report channel.
class TechniqueRunner {
public:
  TechniqueRunner(const ExecutionOptions &options,
                  std::shared_ptr<const ExecutionContext> context,
                  std::shared_ptr<ReportChannel> channel,
                  std::shared_ptr<const SyntaxTreeBuilder> syntax_tree_builder,
                  std::shared_ptr<Logger> logger);

  std::vector<Occurrence>
  RunGlobal(const std::vector<TechniqueDescriptor> &techniques,
            MetricsAggregator &metrics) const;

  FileOutcome RunFile(std::size_t file_index,
                      const std::vector<TechniqueDescriptor> &techniques,
                      const IncrementalStore &store) const;

  // A copy sharing files and flags but with the report side channel removed,
  // for use across threads.
  TechniqueRunner WithoutReportChannel() const;

  const ExecutionContext &Context() const { return *context_; }
  std::size_t FileCount() const;
  bool HasReportChannel() const { return channel_ != nullptr; }

private:
  struct Invocation {
    std::vector<Occurrence> occurrences;
    std::size_t produced = 0;
    double duration_ms = 0.0;
  };

  Invocation Invoke(const TechniqueDescriptor &technique,
                    const FileEntry *entry,
                    std::shared_ptr<const SyntaxTree> syntax_tree) const;

  // A predicate that throws counts as a failed invocation on that file.
  bool Applies(const TechniqueDescriptor &technique, const std::string &rel_path,
               FileOutcome &outcome) const;

  std::shared_ptr<const SyntaxTree> BuildSyntaxTree(const FileEntry &entry,
                                                    double &parse_time_ms) const;

  ExecutionOptions options_;
  std::shared_ptr<const ExecutionContext> context_;
  std::shared_ptr<ReportChannel> channel_;
  std::shared_ptr<const SyntaxTreeBuilder> syntax_tree_builder_;
  std::shared_ptr<Logger> logger_;
};

} // namespace inquest
