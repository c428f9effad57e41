#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace inquest {

enum class ExecutionMode { kSequential, kParallel };

const char *ExecutionModeName(ExecutionMode mode);
ExecutionMode ParseExecutionMode(const std::string &value);

inline constexpr unsigned kDefaultTimeoutMs = 30000;
inline constexpr std::size_t kDefaultBatchSize = 10;
inline constexpr std::size_t kDefaultHistoryMaxEntries = 200;
inline constexpr unsigned kIncrementalSchemaVersion = 1;
inline constexpr unsigned kMetricsHistorySchemaVersion = 1;

struct ExecutionOptions {
  ExecutionMode mode = ExecutionMode::kSequential;
  // 0 disables the guard.
  unsigned timeout_ms = kDefaultTimeoutMs;
  unsigned global_timeout_ms = kDefaultTimeoutMs;
  bool incremental_enabled = false;
  bool metrics_enabled = true;
  std::optional<unsigned> worker_count;
  std::size_t batch_size = kDefaultBatchSize;
  std::filesystem::path incremental_state_path;
  std::filesystem::path metrics_history_path;
  std::size_t history_max_entries = kDefaultHistoryMaxEntries;
  std::map<std::string, bool> ambient_flags;
};

std::filesystem::path DefaultStateDirectory(const std::filesystem::path &root);
std::filesystem::path
DefaultIncrementalStatePath(const std::filesystem::path &state_directory);
std::filesystem::path
DefaultMetricsHistoryPath(const std::filesystem::path &state_directory);

// Throws std::invalid_argument on values that cannot drive a run.
void ValidateExecutionOptions(const ExecutionOptions &options);
unsigned ResolveWorkerCount(const ExecutionOptions &options);

} // namespace inquest
