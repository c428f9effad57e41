#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace inquest {

enum class Severity { kInfo = 0, kWarning = 1, kError = 2 };

const char *SeverityName(Severity severity);
Severity ParseSeverity(const std::string &value);

struct Occurrence {
  std::string kind;
  Severity severity = Severity::kInfo;
  std::string message;
  std::string file_path;
  std::optional<unsigned> line;
  std::optional<unsigned> column;
  std::string source_technique;

  bool operator==(const Occurrence &other) const = default;
};

// Opaque handle produced by a SyntaxTreeBuilder. The engine only passes it
// through to techniques.
class SyntaxTree {
public:
  virtual ~SyntaxTree() = default;
  virtual std::string Language() const = 0;
};

struct FileEntry {
  std::string rel_path;
  std::string full_path;
  std::optional<std::string> content;
  std::shared_ptr<const SyntaxTree> syntax_tree;
};

struct TechniqueTiming {
  double duration_ms = 0.0;
  unsigned occurrence_count = 0;
};

struct IncrementalRecord {
  std::string fingerprint;
  std::vector<Occurrence> occurrences;
  std::map<std::string, TechniqueTiming> per_technique;
  std::uint64_t last_run_epoch_ms = 0;
  unsigned reuse_count = 0;
};

struct IncrementalStats {
  unsigned total_reuses = 0;
  unsigned total_processed = 0;
  double last_duration_ms = 0.0;
};

struct IncrementalState {
  unsigned schema_version = 0;
  std::map<std::string, IncrementalRecord> records;
  IncrementalStats stats;
};

struct TechniqueMetric {
  std::string name;
  double duration_ms = 0.0;
  unsigned occurrence_count = 0;
  bool is_global = false;
};

struct ExecutionMetrics {
  unsigned total_files = 0;
  double parse_time_ms = 0.0;
  double analysis_time_ms = 0.0;
  unsigned cache_hits = 0;
  unsigned cache_misses = 0;
  std::vector<TechniqueMetric> per_technique;
};

struct MetricsHistoryEntry {
  std::uint64_t timestamp_ms = 0;
  ExecutionMetrics metrics;
};

struct MetricsHistory {
  unsigned schema_version = 0;
  std::vector<MetricsHistoryEntry> entries;
};

struct ExecutionResult {
  std::vector<Occurrence> occurrences;
  std::optional<ExecutionMetrics> metrics;
  std::vector<std::string> analyzed_files;
  double duration_ms = 0.0;
};

} // namespace inquest
