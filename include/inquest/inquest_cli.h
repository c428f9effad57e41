#pragma once

#include <inquest/execution_options.h>
#include <inquest/logging.h>

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace inquest {

struct AnalyzeOptions {
  std::optional<std::filesystem::path> root;
  std::optional<std::filesystem::path> config_file;
  std::optional<std::filesystem::path> output_directory;
  std::optional<std::filesystem::path> state_directory;
  std::optional<ExecutionMode> mode;
  std::optional<unsigned> workers;
  std::optional<std::size_t> batch_size;
  std::optional<unsigned> timeout_ms;
  std::optional<unsigned> global_timeout_ms;
  std::optional<bool> incremental;
  std::optional<bool> metrics;
  std::optional<std::size_t> history_max;
  std::vector<std::string> techniques;
  std::vector<std::string> formats;
  std::map<std::string, bool> flags;
  std::vector<std::filesystem::path> ignored_paths;
  std::optional<LogLevel> log_level;
  bool show_help = false;
};

// Options shared by the commands that only touch persisted state.
struct StateCommandOptions {
  std::optional<std::filesystem::path> root;
  std::optional<std::filesystem::path> state_directory;
  std::size_t last = 10;
  bool show_help = false;
};

AnalyzeOptions ParseAnalyzeArguments(const std::vector<std::string> &arguments);
AnalyzeOptions ParseConfigFile(const std::filesystem::path &path);
AnalyzeOptions MergeOptions(const AnalyzeOptions &config_options,
                            const AnalyzeOptions &cli_options);
AnalyzeOptions ResolveAnalyzeOptions(const AnalyzeOptions &cli_options);
const std::vector<std::string> &SupportedConfigKeys();

ExecutionOptions BuildExecutionOptions(const AnalyzeOptions &options,
                                       const std::filesystem::path &root);
std::filesystem::path ResolveStateDirectory(
    const std::optional<std::filesystem::path> &state_directory,
    const std::filesystem::path &root);

StateCommandOptions
ParseStateCommandArguments(const std::vector<std::string> &arguments,
                           bool accepts_last);

int RunAnalyze(const std::vector<std::string> &arguments);
int RunTechniques(const std::vector<std::string> &arguments);
int RunMetrics(const std::vector<std::string> &arguments);
int RunCacheClean(const std::vector<std::string> &arguments);
int RunCacheCommand(const std::vector<std::string> &arguments);

} // namespace inquest
