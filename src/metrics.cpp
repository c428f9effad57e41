#include <inquest/metrics.h>

#include <inquest/execution_options.h>
#include <inquest/persistence.h>

#include <algorithm>
#include <chrono>
#include <iterator>
#include <utility>

namespace inquest {

void MetricsAggregator::RecordInvocation(const std::string &technique,
                                         bool is_global, double duration_ms,
                                         unsigned occurrence_count) {
  auto found = std::find_if(
      per_technique_.begin(), per_technique_.end(), [&](const auto &metric) {
        return metric.name == technique && metric.is_global == is_global;
      });
  if (found == per_technique_.end()) {
    per_technique_.push_back(TechniqueMetric{technique, 0.0, 0, is_global});
    found = std::prev(per_technique_.end());
  }
  found->duration_ms += duration_ms;
  found->occurrence_count += occurrence_count;
}

void MetricsAggregator::RecordParseTime(double duration_ms) {
  parse_time_ms_ += duration_ms;
}

void MetricsAggregator::RecordCacheHit() { ++cache_hits_; }

void MetricsAggregator::RecordCacheMiss() { ++cache_misses_; }

ExecutionMetrics MetricsAggregator::Finish(unsigned total_files,
                                           double analysis_time_ms) const {
  ExecutionMetrics metrics;
  metrics.total_files = total_files;
  metrics.parse_time_ms = parse_time_ms_;
  metrics.analysis_time_ms = analysis_time_ms;
  metrics.cache_hits = cache_hits_;
  metrics.cache_misses = cache_misses_;
  metrics.per_technique = per_technique_;
  return metrics;
}

std::uint64_t EpochMilliseconds() {
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

MetricsHistory LoadMetricsHistory(const std::filesystem::path &path,
                                  const std::shared_ptr<Logger> &logger) {
  auto history = LoadState<MetricsHistory>(path, logger);
  if (history.schema_version != kMetricsHistorySchemaVersion) {
    history.entries.clear();
    history.schema_version = kMetricsHistorySchemaVersion;
  }
  return history;
}

bool AppendMetricsHistory(const std::filesystem::path &path,
                          MetricsHistoryEntry entry, std::size_t max_entries,
                          const std::shared_ptr<Logger> &logger) {
  auto history = LoadMetricsHistory(path, logger);
  history.entries.push_back(std::move(entry));
  if (max_entries > 0 && history.entries.size() > max_entries) {
    const auto excess = history.entries.size() - max_entries;
    history.entries.erase(
        history.entries.begin(),
        history.entries.begin() + static_cast<std::ptrdiff_t>(excess));
  }
  return SaveState(path, history, logger);
}

} // namespace inquest
