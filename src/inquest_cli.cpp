#include <inquest/inquest_cli.h>

#include <inquest/analysis_engine.h>
#include <inquest/clang_syntax_tree.h>
#include <inquest/cli_exit_codes.h>
#include <inquest/file_scanner.h>
#include <inquest/metrics.h>
#include <inquest/report_renderer.h>
#include <inquest/technique_registry.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace {

using inquest::AnalyzeOptions;
using inquest::StateCommandOptions;

void PrintAnalyzeUsage() {
  std::cout
      << "Usage: inquest analyze --root <path> [options]\n"
      << "Options:\n"
      << "  --root <path>             Directory to analyze\n"
      << "  --config <file>           Optional YAML config file\n"
      << "  --mode <mode>             sequential (default) or parallel\n"
      << "  --workers <n>             Worker threads in parallel mode\n"
      << "                            (default: hardware concurrency)\n"
      << "  --batch-size <n>          Files per worker job (default: 10)\n"
      << "  --timeout-ms <n>          Budget per technique and file\n"
      << "                            (default: 30000, 0 disables)\n"
      << "  --global-timeout-ms <n>   Budget per global technique\n"
      << "  --incremental             Reuse results of unchanged files\n"
      << "  --no-incremental          Always run every technique\n"
      << "  --no-metrics              Skip metrics and history\n"
      << "  --state-dir <path>        Persisted state (default: <root>/.inquest)\n"
      << "  --history-max <n>         Metrics history entries kept (default: "
         "200)\n"
      << "  --techniques <list>       Comma-separated technique names\n"
      << "  --ignored-paths <list>    Comma-separated paths relative to --root\n"
      << "  --flag <name[=bool]>      Ambient flag exposed to techniques\n"
      << "  --format <list>           Comma-separated list of output formats\n"
      << "                            (supported: markdown,json)\n"
      << "  --out <path>              Directory for report outputs (default: "
         "analysis root)\n"
      << "  --log-level <level>       Logging verbosity (error,warn,info,debug)\n"
      << "  --verbose                 Shortcut for --log-level info\n"
      << "  --debug                   Shortcut for --log-level debug\n"
      << "  --help                    Show this message\n";
}

std::string Trim(std::string value) {
  const auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
  value.erase(value.begin(),
              std::find_if(value.begin(), value.end(),
                           [&](unsigned char ch) { return !is_space(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
                           [&](unsigned char ch) { return !is_space(ch); })
                  .base(),
              value.end());
  return value;
}

std::string ToLower(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

bool ParseBool(const std::string &value) {
  const auto normalized = ToLower(Trim(value));
  if (normalized == "true" || normalized == "1" || normalized == "yes" ||
      normalized == "on") {
    return true;
  }
  if (normalized == "false" || normalized == "0" || normalized == "no" ||
      normalized == "off") {
    return false;
  }
  throw std::invalid_argument("Expected a boolean value, got: " + value);
}

unsigned long ParseCount(const std::string &value, const std::string &name) {
  const auto trimmed = Trim(value);
  if (trimmed.empty() ||
      !std::all_of(trimmed.begin(), trimmed.end(),
                   [](unsigned char c) { return std::isdigit(c) != 0; })) {
    throw std::invalid_argument(name + " expects a non-negative integer, got: " +
                                value);
  }
  try {
    return std::stoul(trimmed);
  } catch (const std::out_of_range &) {
    throw std::invalid_argument(name + " is out of range: " + value);
  }
}

unsigned ParseUnsigned(const std::string &value, const std::string &name) {
  return static_cast<unsigned>(ParseCount(value, name));
}

std::vector<std::string> SplitList(const std::string &raw_values) {
  std::vector<std::string> values;
  std::string current;
  for (const auto character : raw_values) {
    if (character == ',') {
      if (!Trim(current).empty()) {
        values.push_back(Trim(current));
      }
      current.clear();
    } else {
      current.push_back(character);
    }
  }
  if (!Trim(current).empty()) {
    values.push_back(Trim(current));
  }
  return values;
}

void AppendUnique(const std::string &raw_values,
                  std::vector<std::string> &target) {
  for (auto &value : SplitList(raw_values)) {
    if (std::find(target.begin(), target.end(), value) == target.end()) {
      target.push_back(std::move(value));
    }
  }
}

void AppendFormats(const std::string &raw_formats,
                   std::vector<std::string> &target) {
  for (auto format : SplitList(raw_formats)) {
    format = ToLower(format);
    if (format != "markdown" && format != "json") {
      throw std::invalid_argument("Unsupported format: " + format);
    }
    if (std::find(target.begin(), target.end(), format) == target.end()) {
      target.push_back(std::move(format));
    }
  }
}

void AppendIgnoredPaths(const std::string &raw_paths,
                        std::vector<std::filesystem::path> &target) {
  for (const auto &value : SplitList(raw_paths)) {
    const std::filesystem::path path(
        std::filesystem::path(value).generic_string());
    const auto matches =
        std::find_if(target.begin(), target.end(), [&](const auto &existing) {
          return existing.generic_string() == path.generic_string();
        });
    if (matches == target.end()) {
      target.push_back(path);
    }
  }
}

// "name" enables the flag; "name=<bool>" sets it explicitly.
void ApplyFlag(const std::string &raw_flag, std::map<std::string, bool> &flags) {
  const auto separator = raw_flag.find('=');
  const auto name = Trim(raw_flag.substr(0, separator));
  if (name.empty()) {
    throw std::invalid_argument("Flag name cannot be empty");
  }
  flags[name] = separator == std::string::npos
                    ? true
                    : ParseBool(raw_flag.substr(separator + 1));
}

std::string RequireValue(const std::vector<std::string> &arguments,
                         std::size_t &index, const std::string &flag) {
  if (++index >= arguments.size()) {
    throw std::invalid_argument(flag + " requires a value");
  }
  return arguments[index];
}

bool DispatchPathOption(const std::vector<std::string> &arguments,
                        std::size_t &index, AnalyzeOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--root") {
    options.root = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--config") {
    options.config_file = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--out") {
    options.output_directory = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--state-dir") {
    options.state_directory = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--ignored-paths") {
    AppendIgnoredPaths(RequireValue(arguments, index, argument),
                       options.ignored_paths);
    return true;
  }
  return false;
}

bool DispatchExecutionOption(const std::vector<std::string> &arguments,
                             std::size_t &index, AnalyzeOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--mode") {
    options.mode =
        inquest::ParseExecutionMode(RequireValue(arguments, index, argument));
    return true;
  }
  if (argument == "--workers") {
    options.workers =
        ParseUnsigned(RequireValue(arguments, index, argument), argument);
    return true;
  }
  if (argument == "--batch-size") {
    options.batch_size =
        ParseCount(RequireValue(arguments, index, argument), argument);
    return true;
  }
  if (argument == "--timeout-ms") {
    options.timeout_ms =
        ParseUnsigned(RequireValue(arguments, index, argument), argument);
    return true;
  }
  if (argument == "--global-timeout-ms") {
    options.global_timeout_ms =
        ParseUnsigned(RequireValue(arguments, index, argument), argument);
    return true;
  }
  if (argument == "--incremental") {
    options.incremental = true;
    return true;
  }
  if (argument == "--no-incremental") {
    options.incremental = false;
    return true;
  }
  if (argument == "--no-metrics") {
    options.metrics = false;
    return true;
  }
  if (argument == "--history-max") {
    options.history_max =
        ParseCount(RequireValue(arguments, index, argument), argument);
    return true;
  }
  if (argument == "--techniques") {
    AppendUnique(RequireValue(arguments, index, argument), options.techniques);
    return true;
  }
  if (argument == "--flag") {
    ApplyFlag(RequireValue(arguments, index, argument), options.flags);
    return true;
  }
  return false;
}

bool DispatchOutputOption(const std::vector<std::string> &arguments,
                          std::size_t &index, AnalyzeOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--format") {
    AppendFormats(RequireValue(arguments, index, argument), options.formats);
    return true;
  }
  if (argument == "--log-level") {
    options.log_level =
        inquest::ParseLogLevel(RequireValue(arguments, index, argument));
    return true;
  }
  if (argument == "--verbose") {
    options.log_level = inquest::LogLevel::kInfo;
    return true;
  }
  if (argument == "--debug") {
    options.log_level = inquest::LogLevel::kDebug;
    return true;
  }
  return false;
}

bool DispatchAnalyzeOption(const std::vector<std::string> &arguments,
                           std::size_t &index, AnalyzeOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--help" || argument == "-h") {
    options.show_help = true;
    return true;
  }
  return DispatchPathOption(arguments, index, options) ||
         DispatchExecutionOption(arguments, index, options) ||
         DispatchOutputOption(arguments, index, options);
}

void ValidateAnalyzeOptions(const AnalyzeOptions &options) {
  if (!options.root) {
    throw std::invalid_argument("--root is required (or set in config file)");
  }
}

std::string NormalizeConfigKey(std::string key) {
  key = ToLower(Trim(key));
  std::replace(key.begin(), key.end(), '-', '_');
  static const std::unordered_map<std::string, std::string> aliases = {
      {"output", "out"},
      {"output_directory", "out"},
      {"format", "formats"},
      {"state_directory", "state_dir"},
      {"worker_count", "workers"},
      {"incremental_enabled", "incremental"},
      {"metrics_enabled", "metrics"},
      {"history_max_entries", "history_max"},
      {"ambient_flags", "flags"}};

  if (const auto alias = aliases.find(key); alias != aliases.end()) {
    return alias->second;
  }
  return key;
}

[[noreturn]] void ThrowUnknownKey(const std::string &key) {
  std::string message = "Unknown config key: " + key + ". Supported keys: ";
  const auto &supported = inquest::SupportedConfigKeys();
  for (std::size_t i = 0; i < supported.size(); ++i) {
    message += supported[i];
    if (i + 1 < supported.size()) {
      message += ", ";
    }
  }
  throw std::invalid_argument(message);
}

std::string NormalizeAndValidateKey(const std::string &key) {
  const auto normalized = NormalizeConfigKey(key);
  const auto &supported = inquest::SupportedConfigKeys();
  if (std::find(supported.begin(), supported.end(), normalized) ==
      supported.end()) {
    ThrowUnknownKey(key);
  }
  return normalized;
}

std::string ExtractScalar(const YAML::Node &node, const std::string &key_name) {
  if (!node.IsScalar()) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must be a scalar value");
  }
  return node.as<std::string>();
}

// Scalars are treated as comma-separated lists.
std::string ExtractJoinedList(const YAML::Node &node,
                              const std::string &key_name) {
  if (node.IsScalar()) {
    return node.as<std::string>();
  }
  if (!node.IsSequence()) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must be a string or list of strings");
  }
  std::string joined;
  for (const auto &child : node) {
    if (!child.IsScalar()) {
      throw std::invalid_argument("Config key '" + key_name +
                                  "' must be a list of strings");
    }
    if (!joined.empty()) {
      joined += ",";
    }
    joined += child.as<std::string>();
  }
  return joined;
}

void ApplyFlagsNode(const YAML::Node &node, std::map<std::string, bool> &flags) {
  if (node.IsMap()) {
    for (const auto &entry : node) {
      flags[Trim(entry.first.as<std::string>())] =
          ParseBool(ExtractScalar(entry.second, "flags"));
    }
    return;
  }
  for (const auto &flag : SplitList(ExtractJoinedList(node, "flags"))) {
    ApplyFlag(flag, flags);
  }
}

void ApplyConfigEntry(const std::string &key, const YAML::Node &node,
                      AnalyzeOptions &options) {
  if (key == "root") {
    options.root = ExtractScalar(node, key);
  } else if (key == "out") {
    options.output_directory = ExtractScalar(node, key);
  } else if (key == "state_dir") {
    options.state_directory = ExtractScalar(node, key);
  } else if (key == "mode") {
    options.mode = inquest::ParseExecutionMode(ExtractScalar(node, key));
  } else if (key == "workers") {
    options.workers = ParseUnsigned(ExtractScalar(node, key), key);
  } else if (key == "batch_size") {
    options.batch_size = ParseCount(ExtractScalar(node, key), key);
  } else if (key == "timeout_ms") {
    options.timeout_ms = ParseUnsigned(ExtractScalar(node, key), key);
  } else if (key == "global_timeout_ms") {
    options.global_timeout_ms = ParseUnsigned(ExtractScalar(node, key), key);
  } else if (key == "incremental") {
    options.incremental = ParseBool(ExtractScalar(node, key));
  } else if (key == "metrics") {
    options.metrics = ParseBool(ExtractScalar(node, key));
  } else if (key == "history_max") {
    options.history_max = ParseCount(ExtractScalar(node, key), key);
  } else if (key == "techniques") {
    options.techniques.clear();
    AppendUnique(ExtractJoinedList(node, key), options.techniques);
  } else if (key == "formats") {
    options.formats.clear();
    AppendFormats(ExtractJoinedList(node, key), options.formats);
  } else if (key == "ignored_paths") {
    options.ignored_paths.clear();
    AppendIgnoredPaths(ExtractJoinedList(node, key), options.ignored_paths);
  } else if (key == "flags") {
    ApplyFlagsNode(node, options.flags);
  } else if (key == "log_level") {
    options.log_level = inquest::ParseLogLevel(ExtractScalar(node, key));
  } else {
    ThrowUnknownKey(key);
  }
}

inquest::LoggingConfig BuildLoggingConfig(const AnalyzeOptions &options) {
  inquest::LoggingConfig logging;
  logging.level = options.log_level.value_or(inquest::LogLevel::kWarn);
  return logging;
}

void WriteFileIfContent(const std::filesystem::path &path,
                        const std::string &content) {
  if (content.empty()) {
    return;
  }
  std::ofstream stream(path);
  if (!stream) {
    throw std::runtime_error("Failed to open output file: " + path.string());
  }
  stream << content;
}

void WriteReports(const std::filesystem::path &directory,
                  const inquest::Report &report) {
  std::filesystem::create_directories(directory);
  WriteFileIfContent(directory / "inquest_report.md", report.markdown);
  WriteFileIfContent(directory / "inquest_report.json", report.json);
}

// Relays engine progress to the log.
class LoggingProgressListener : public inquest::ExecutionListener {
public:
  explicit LoggingProgressListener(std::shared_ptr<inquest::Logger> logger)
      : logger_(std::move(logger)) {}

  void OnFileProcessed(const std::string &rel_path,
                       std::size_t occurrence_count) override {
    ++processed_;
    logger_->Log(inquest::LogLevel::kDebug, "progress.file",
                 {{"file", rel_path},
                  {"occurrences", std::to_string(occurrence_count)},
                  {"processed", std::to_string(processed_)}});
  }

  void OnAnalysisComplete(const inquest::ExecutionResult &result) override {
    logger_->Log(inquest::LogLevel::kInfo, "progress.complete",
                 {{"files", std::to_string(result.analyzed_files.size())},
                  {"occurrences", std::to_string(result.occurrences.size())}});
  }

private:
  std::shared_ptr<inquest::Logger> logger_;
  std::size_t processed_ = 0;
};

std::string FormatTimestamp(std::uint64_t epoch_ms) {
  const auto seconds = static_cast<std::time_t>(epoch_ms / 1000);
  std::tm tm{};
  gmtime_r(&seconds, &tm);
  std::ostringstream stream;
  stream << std::put_time(&tm, "%FT%TZ");
  return stream.str();
}

} // namespace

namespace inquest {

const std::vector<std::string> &SupportedConfigKeys() {
  static const std::vector<std::string> keys = {
      "root",       "out",         "state_dir",  "mode",
      "workers",    "batch_size",  "timeout_ms", "global_timeout_ms",
      "incremental", "metrics",    "history_max", "techniques",
      "formats",    "ignored_paths", "flags",    "log_level"};
  return keys;
}

AnalyzeOptions
ParseAnalyzeArguments(const std::vector<std::string> &arguments) {
  AnalyzeOptions options;
  for (std::size_t i = 0; i < arguments.size(); ++i) {
    if (!DispatchAnalyzeOption(arguments, i, options)) {
      throw std::invalid_argument("Unknown argument: " + arguments[i]);
    }
    if (options.show_help) {
      break;
    }
  }
  return options;
}

AnalyzeOptions ParseConfigFile(const std::filesystem::path &path) {
  if (!std::filesystem::exists(path)) {
    throw std::runtime_error("Config file not found: " + path.string());
  }
  const auto extension = ToLower(path.extension().string());
  if (extension != ".yml" && extension != ".yaml") {
    throw std::invalid_argument("Unsupported config format: " + extension);
  }

  const auto document = YAML::LoadFile(path.string());
  if (!document.IsMap()) {
    throw std::invalid_argument(
        "Config file must contain a mapping at the root");
  }

  AnalyzeOptions options;
  options.config_file = path;
  for (const auto &entry : document) {
    const auto key = NormalizeAndValidateKey(entry.first.as<std::string>());
    ApplyConfigEntry(key, entry.second, options);
  }
  return options;
}

AnalyzeOptions MergeOptions(const AnalyzeOptions &config_options,
                            const AnalyzeOptions &cli_options) {
  AnalyzeOptions merged = config_options;
  const auto override_value = [](auto &target, const auto &source) {
    if (source) {
      target = source;
    }
  };
  const auto override_list = [](auto &target, const auto &source) {
    if (!source.empty()) {
      target = source;
    }
  };

  override_value(merged.root, cli_options.root);
  override_value(merged.config_file, cli_options.config_file);
  override_value(merged.output_directory, cli_options.output_directory);
  override_value(merged.state_directory, cli_options.state_directory);
  override_value(merged.mode, cli_options.mode);
  override_value(merged.workers, cli_options.workers);
  override_value(merged.batch_size, cli_options.batch_size);
  override_value(merged.timeout_ms, cli_options.timeout_ms);
  override_value(merged.global_timeout_ms, cli_options.global_timeout_ms);
  override_value(merged.incremental, cli_options.incremental);
  override_value(merged.metrics, cli_options.metrics);
  override_value(merged.history_max, cli_options.history_max);
  override_value(merged.log_level, cli_options.log_level);
  override_list(merged.techniques, cli_options.techniques);
  override_list(merged.formats, cli_options.formats);
  override_list(merged.ignored_paths, cli_options.ignored_paths);
  for (const auto &[name, value] : cli_options.flags) {
    merged.flags[name] = value;
  }
  return merged;
}

AnalyzeOptions ResolveAnalyzeOptions(const AnalyzeOptions &cli_options) {
  if (cli_options.show_help) {
    return cli_options;
  }

  AnalyzeOptions config_options;
  if (cli_options.config_file) {
    config_options = ParseConfigFile(*cli_options.config_file);
  }

  const auto merged = MergeOptions(config_options, cli_options);
  ValidateAnalyzeOptions(merged);
  return merged;
}

std::filesystem::path ResolveStateDirectory(
    const std::optional<std::filesystem::path> &state_directory,
    const std::filesystem::path &root) {
  if (!state_directory) {
    return DefaultStateDirectory(root);
  }
  if (state_directory->is_absolute()) {
    return *state_directory;
  }
  return root / *state_directory;
}

ExecutionOptions BuildExecutionOptions(const AnalyzeOptions &options,
                                       const std::filesystem::path &root) {
  const auto state_directory =
      ResolveStateDirectory(options.state_directory, root);

  ExecutionOptions execution;
  execution.mode = options.mode.value_or(ExecutionMode::kSequential);
  execution.timeout_ms = options.timeout_ms.value_or(kDefaultTimeoutMs);
  execution.global_timeout_ms =
      options.global_timeout_ms.value_or(kDefaultTimeoutMs);
  execution.incremental_enabled = options.incremental.value_or(false);
  execution.metrics_enabled = options.metrics.value_or(true);
  execution.worker_count = options.workers;
  execution.batch_size = options.batch_size.value_or(kDefaultBatchSize);
  execution.incremental_state_path =
      DefaultIncrementalStatePath(state_directory);
  execution.metrics_history_path = DefaultMetricsHistoryPath(state_directory);
  execution.history_max_entries =
      options.history_max.value_or(kDefaultHistoryMaxEntries);
  execution.ambient_flags = options.flags;
  ValidateExecutionOptions(execution);
  return execution;
}

int RunAnalyze(const std::vector<std::string> &arguments) {
  const auto cli_options = ParseAnalyzeArguments(arguments);
  if (cli_options.show_help) {
    PrintAnalyzeUsage();
    return kExitClean;
  }

  const auto merged = ResolveAnalyzeOptions(cli_options);
  const auto root = std::filesystem::weakly_canonical(*merged.root);
  auto logger = MakeLogger(BuildLoggingConfig(merged), std::clog);

  const auto execution = BuildExecutionOptions(merged, root);
  const auto registry = MakeTechniqueRegistryWithDefaults();
  const auto techniques = registry.Select(merged.techniques);

  ScanOptions scan;
  scan.root = root;
  scan.ignored_paths = merged.ignored_paths;
  scan.ignored_paths.push_back(
      ResolveStateDirectory(merged.state_directory, root));
  scan.extensions = DefaultScanExtensions();
  auto files = FileScanner(logger).Scan(scan);

  LoggingProgressListener listener(logger);
  EngineComponents components;
  components.logger = logger;
  components.syntax_tree_builder = std::make_shared<ClangSyntaxTreeBuilder>();
  components.listener = &listener;
  AnalysisEngine engine(std::move(components));

  const auto result =
      engine.Run(std::move(files), techniques, root.string(), execution);

  ReportOptions report_options;
  report_options.root_path = root.string();
  report_options.formats = merged.formats;
  WriteReports(merged.output_directory.value_or(root),
               RenderReport(result, report_options));

  const auto errors = std::count_if(
      result.occurrences.begin(), result.occurrences.end(),
      [](const auto &occurrence) {
        return occurrence.severity == Severity::kError;
      });
  std::cout << "Analyzed " << result.analyzed_files.size() << " files: "
            << result.occurrences.size() << " occurrences (" << errors
            << " errors)\n";
  return OccurrenceExitCode(result.occurrences);
}

int RunTechniques(const std::vector<std::string> &arguments) {
  for (const auto &argument : arguments) {
    if (argument == "--help" || argument == "-h") {
      std::cout << "Usage: inquest techniques\n";
      return kExitClean;
    }
    throw std::invalid_argument("Unknown techniques argument: " + argument);
  }

  const auto registry = MakeTechniqueRegistryWithDefaults();
  for (const auto &technique : registry.List()) {
    std::cout << std::left << std::setw(20) << technique.name
              << std::setw(10) << (technique.is_global ? "global" : "per-file")
              << technique.description << "\n";
  }
  return kExitClean;
}

StateCommandOptions
ParseStateCommandArguments(const std::vector<std::string> &arguments,
                           bool accepts_last) {
  StateCommandOptions options;
  for (std::size_t i = 0; i < arguments.size(); ++i) {
    const auto &argument = arguments[i];
    if (argument == "--help" || argument == "-h") {
      options.show_help = true;
      return options;
    }
    if (argument == "--root") {
      options.root = RequireValue(arguments, i, argument);
      continue;
    }
    if (argument == "--state-dir") {
      options.state_directory = RequireValue(arguments, i, argument);
      continue;
    }
    if (accepts_last && argument == "--last") {
      options.last = ParseCount(RequireValue(arguments, i, argument), argument);
      continue;
    }
    throw std::invalid_argument("Unknown argument: " + argument);
  }
  return options;
}

int RunMetrics(const std::vector<std::string> &arguments) {
  const auto options = ParseStateCommandArguments(arguments, true);
  if (options.show_help) {
    std::cout << "Usage: inquest metrics [--root <path>] [--state-dir <path>] "
                 "[--last <n>]\n";
    return kExitClean;
  }

  const auto root = std::filesystem::weakly_canonical(
      options.root.value_or(std::filesystem::current_path()));
  const auto history = LoadMetricsHistory(
      DefaultMetricsHistoryPath(
          ResolveStateDirectory(options.state_directory, root)),
      nullptr);
  if (history.entries.empty()) {
    std::cout << "No metrics history recorded under " << root << "\n";
    return kExitClean;
  }

  const auto count = std::min(options.last, history.entries.size());
  std::cout << "| Timestamp | Files | Analysis (ms) | Parse (ms) | Cache hits "
               "| Cache misses |\n";
  std::cout << "| --- | --- | --- | --- | --- | --- |\n";
  for (auto it = history.entries.end() - static_cast<std::ptrdiff_t>(count);
       it != history.entries.end(); ++it) {
    const auto &metrics = it->metrics;
    std::cout << "| " << FormatTimestamp(it->timestamp_ms) << " | "
              << metrics.total_files << " | " << std::fixed
              << std::setprecision(2) << metrics.analysis_time_ms << " | "
              << metrics.parse_time_ms << " | " << metrics.cache_hits << " | "
              << metrics.cache_misses << " |\n";
  }
  return kExitClean;
}

int RunCacheClean(const std::vector<std::string> &arguments) {
  const auto options = ParseStateCommandArguments(arguments, false);
  if (options.show_help) {
    std::cout << "Usage: inquest cache clean [--root <path>] [--state-dir "
                 "<path>]\n";
    return kExitClean;
  }

  const auto root = std::filesystem::weakly_canonical(
      options.root.value_or(std::filesystem::current_path()));
  const auto state_directory =
      ResolveStateDirectory(options.state_directory, root);
  if (std::filesystem::exists(state_directory)) {
    std::filesystem::remove_all(state_directory);
    std::cout << "Removed state at " << state_directory << "\n";
  } else {
    std::cout << "No state directory found at " << state_directory << "\n";
  }
  return kExitClean;
}

int RunCacheCommand(const std::vector<std::string> &arguments) {
  if (arguments.empty()) {
    std::cout << "Cache subcommand requires an action (e.g., clean).\n";
    return kExitUsageError;
  }
  const std::string &action = arguments.front();
  if (action == "clean") {
    const std::vector<std::string> clean_args(arguments.begin() + 1,
                                              arguments.end());
    return RunCacheClean(clean_args);
  }
  std::cout << "Unknown cache subcommand: " << action << "\n";
  return kExitUsageError;
}

} // namespace inquest
