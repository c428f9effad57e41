#pragma once

#include <inquest/logging.h>
#include <inquest/models.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace inquest {

// Sums invocation durations and occurrence counts per technique, keeping the
// order in which techniques were first seen. Not thread-safe; fed by the
// coordinating thread only.
class MetricsAggregator {
public:
  void RecordInvocation(const std::string &technique, bool is_global,
                        double duration_ms, unsigned occurrence_count);
  void RecordParseTime(double duration_ms);
  void RecordCacheHit();
  void RecordCacheMiss();

  ExecutionMetrics Finish(unsigned total_files, double analysis_time_ms) const;

private:
  std::vector<TechniqueMetric> per_technique_;
  double parse_time_ms_ = 0.0;
  unsigned cache_hits_ = 0;
  unsigned cache_misses_ = 0;
};

std::uint64_t EpochMilliseconds();

// Appends `entry` to the persisted history, keeping at most `max_entries`
// (oldest evicted; 0 keeps everything). A history written by another schema
// version is replaced. Returns false when the history could not be saved.
bool AppendMetricsHistory(const std::filesystem::path &path,
                          MetricsHistoryEntry entry, std::size_t max_entries,
                          const std::shared_ptr<Logger> &logger);

MetricsHistory LoadMetricsHistory(const std::filesystem::path &path,
                                  const std::shared_ptr<Logger> &logger);

} // namespace inquest
