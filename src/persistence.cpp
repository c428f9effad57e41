#include <inquest/persistence.h>

#include <chrono>
#include <fstream>
#include <string>
#include <system_error>

#include <yaml-cpp/yaml.h>

namespace YAML {

template <> struct convert<inquest::Occurrence> {
  static Node encode(const inquest::Occurrence &occurrence) {
    Node node;
    node["kind"] = occurrence.kind;
    node["severity"] = std::string(inquest::SeverityName(occurrence.severity));
    node["message"] = occurrence.message;
    node["file_path"] = occurrence.file_path;
    if (occurrence.line) {
      node["line"] = *occurrence.line;
    }
    if (occurrence.column) {
      node["column"] = *occurrence.column;
    }
    node["source_technique"] = occurrence.source_technique;
    return node;
  }

  static bool decode(const Node &node, inquest::Occurrence &occurrence) {
    if (!node.IsMap()) {
      return false;
    }
    occurrence.kind = node["kind"].as<std::string>();
    occurrence.severity =
        inquest::ParseSeverity(node["severity"].as<std::string>());
    occurrence.message = node["message"].as<std::string>();
    occurrence.file_path = node["file_path"].as<std::string>();
    occurrence.line.reset();
    occurrence.column.reset();
    if (node["line"]) {
      occurrence.line = node["line"].as<unsigned>();
    }
    if (node["column"]) {
      occurrence.column = node["column"].as<unsigned>();
    }
    occurrence.source_technique = node["source_technique"].as<std::string>();
    return true;
  }
};

template <> struct convert<inquest::TechniqueTiming> {
  static Node encode(const inquest::TechniqueTiming &timing) {
    Node node;
    node["duration_ms"] = timing.duration_ms;
    node["occurrence_count"] = timing.occurrence_count;
    return node;
  }

  static bool decode(const Node &node, inquest::TechniqueTiming &timing) {
    if (!node.IsMap()) {
      return false;
    }
    timing.duration_ms = node["duration_ms"].as<double>();
    timing.occurrence_count = node["occurrence_count"].as<unsigned>();
    return true;
  }
};

template <> struct convert<inquest::IncrementalRecord> {
  static Node encode(const inquest::IncrementalRecord &record) {
    Node node;
    node["fingerprint"] = record.fingerprint;
    node["occurrences"] = Node(NodeType::Sequence);
    for (const auto &occurrence : record.occurrences) {
      node["occurrences"].push_back(occurrence);
    }
    node["per_technique"] = Node(NodeType::Map);
    for (const auto &[name, timing] : record.per_technique) {
      node["per_technique"][name] = timing;
    }
    node["last_run_epoch_ms"] = record.last_run_epoch_ms;
    node["reuse_count"] = record.reuse_count;
    return node;
  }

  static bool decode(const Node &node, inquest::IncrementalRecord &record) {
    if (!node.IsMap()) {
      return false;
    }
    record.fingerprint = node["fingerprint"].as<std::string>();
    record.occurrences =
        node["occurrences"].as<std::vector<inquest::Occurrence>>();
    record.per_technique.clear();
    if (node["per_technique"]) {
      record.per_technique =
          node["per_technique"]
              .as<std::map<std::string, inquest::TechniqueTiming>>();
    }
    record.last_run_epoch_ms =
        node["last_run_epoch_ms"].as<std::uint64_t>(0);
    record.reuse_count = node["reuse_count"].as<unsigned>(0);
    return true;
  }
};

template <> struct convert<inquest::IncrementalState> {
  static Node encode(const inquest::IncrementalState &state) {
    Node node;
    node["schema_version"] = state.schema_version;
    node["records"] = Node(NodeType::Map);
    for (const auto &[path, record] : state.records) {
      node["records"][path] = record;
    }
    Node stats;
    stats["total_reuses"] = state.stats.total_reuses;
    stats["total_processed"] = state.stats.total_processed;
    stats["last_duration_ms"] = state.stats.last_duration_ms;
    node["stats"] = stats;
    return node;
  }

  static bool decode(const Node &node, inquest::IncrementalState &state) {
    if (!node.IsMap()) {
      return false;
    }
    state.schema_version = node["schema_version"].as<unsigned>();
    state.records.clear();
    if (node["records"]) {
      state.records =
          node["records"]
              .as<std::map<std::string, inquest::IncrementalRecord>>();
    }
    if (const auto stats = node["stats"]; stats) {
      state.stats.total_reuses = stats["total_reuses"].as<unsigned>(0);
      state.stats.total_processed = stats["total_processed"].as<unsigned>(0);
      state.stats.last_duration_ms =
          stats["last_duration_ms"].as<double>(0.0);
    }
    return true;
  }
};

template <> struct convert<inquest::TechniqueMetric> {
  static Node encode(const inquest::TechniqueMetric &metric) {
    Node node;
    node["name"] = metric.name;
    node["duration_ms"] = metric.duration_ms;
    node["occurrence_count"] = metric.occurrence_count;
    node["is_global"] = metric.is_global;
    return node;
  }

  static bool decode(const Node &node, inquest::TechniqueMetric &metric) {
    if (!node.IsMap()) {
      return false;
    }
    metric.name = node["name"].as<std::string>();
    metric.duration_ms = node["duration_ms"].as<double>();
    metric.occurrence_count = node["occurrence_count"].as<unsigned>();
    metric.is_global = node["is_global"].as<bool>(false);
    return true;
  }
};

template <> struct convert<inquest::ExecutionMetrics> {
  static Node encode(const inquest::ExecutionMetrics &metrics) {
    Node node;
    node["total_files"] = metrics.total_files;
    node["parse_time_ms"] = metrics.parse_time_ms;
    node["analysis_time_ms"] = metrics.analysis_time_ms;
    node["cache_hits"] = metrics.cache_hits;
    node["cache_misses"] = metrics.cache_misses;
    node["per_technique"] = Node(NodeType::Sequence);
    for (const auto &metric : metrics.per_technique) {
      node["per_technique"].push_back(metric);
    }
    return node;
  }

  static bool decode(const Node &node, inquest::ExecutionMetrics &metrics) {
    if (!node.IsMap()) {
      return false;
    }
    metrics.total_files = node["total_files"].as<unsigned>();
    metrics.parse_time_ms = node["parse_time_ms"].as<double>(0.0);
    metrics.analysis_time_ms = node["analysis_time_ms"].as<double>(0.0);
    metrics.cache_hits = node["cache_hits"].as<unsigned>(0);
    metrics.cache_misses = node["cache_misses"].as<unsigned>(0);
    metrics.per_technique.clear();
    if (node["per_technique"]) {
      metrics.per_technique =
          node["per_technique"].as<std::vector<inquest::TechniqueMetric>>();
    }
    return true;
  }
};

template <> struct convert<inquest::MetricsHistoryEntry> {
  static Node encode(const inquest::MetricsHistoryEntry &entry) {
    Node node;
    node["timestamp_ms"] = entry.timestamp_ms;
    node["metrics"] = entry.metrics;
    return node;
  }

  static bool decode(const Node &node, inquest::MetricsHistoryEntry &entry) {
    if (!node.IsMap()) {
      return false;
    }
    entry.timestamp_ms = node["timestamp_ms"].as<std::uint64_t>();
    entry.metrics = node["metrics"].as<inquest::ExecutionMetrics>();
    return true;
  }
};

template <> struct convert<inquest::MetricsHistory> {
  static Node encode(const inquest::MetricsHistory &history) {
    Node node;
    node["schema_version"] = history.schema_version;
    node["entries"] = Node(NodeType::Sequence);
    for (const auto &entry : history.entries) {
      node["entries"].push_back(entry);
    }
    return node;
  }

  static bool decode(const Node &node, inquest::MetricsHistory &history) {
    if (!node.IsMap()) {
      return false;
    }
    history.schema_version = node["schema_version"].as<unsigned>();
    history.entries.clear();
    if (node["entries"]) {
      history.entries =
          node["entries"].as<std::vector<inquest::MetricsHistoryEntry>>();
    }
    return true;
  }
};

} // namespace YAML

namespace inquest {
namespace {

std::filesystem::path TemporarySibling(const std::filesystem::path &path) {
  const auto stamp =
      std::chrono::steady_clock::now().time_since_epoch().count();
  auto name = "." + path.filename().string() + ".tmp-" + std::to_string(stamp);
  return path.parent_path() / name;
}

} // namespace

template <typename T>
T LoadState(const std::filesystem::path &path,
            const std::shared_ptr<Logger> &logger) {
  const auto log = EnsureLogger(logger);
  std::error_code error;
  if (path.empty() || !std::filesystem::exists(path, error)) {
    log->Log(LogLevel::kDebug, "state.load.missing",
             {{"path", path.string()}});
    return T{};
  }

  try {
    const auto root = YAML::LoadFile(path.string());
    auto value = root.as<T>();
    log->Log(LogLevel::kDebug, "state.load.complete",
             {{"path", path.string()}});
    return value;
  } catch (const std::exception &ex) {
    log->Log(LogLevel::kWarn, "state.load.failed",
             {{"path", path.string()}, {"error", ex.what()}});
  }
  return T{};
}

template <typename T>
bool SaveState(const std::filesystem::path &path, const T &value,
               const std::shared_ptr<Logger> &logger) {
  const auto log = EnsureLogger(logger);
  if (path.empty()) {
    log->Log(LogLevel::kWarn, "state.save.failed",
             {{"error", "empty state path"}});
    return false;
  }

  std::filesystem::path temporary;
  try {
    if (path.has_parent_path()) {
      std::filesystem::create_directories(path.parent_path());
    }

    YAML::Emitter emitter;
    emitter << YAML::Node(value);
    if (!emitter.good()) {
      throw std::runtime_error(emitter.GetLastError());
    }

    temporary = TemporarySibling(path);
    {
      std::ofstream stream(temporary, std::ios::trunc);
      if (!stream) {
        throw std::runtime_error("cannot open " + temporary.string());
      }
      stream << emitter.c_str() << '\n';
      stream.flush();
      if (!stream) {
        throw std::runtime_error("cannot write " + temporary.string());
      }
    }
    std::filesystem::rename(temporary, path);
  } catch (const std::exception &ex) {
    log->Log(LogLevel::kError, "state.save.failed",
             {{"path", path.string()}, {"error", ex.what()}});
    if (!temporary.empty()) {
      std::error_code ignored;
      std::filesystem::remove(temporary, ignored);
    }
    return false;
  }

  log->Log(LogLevel::kDebug, "state.save.complete", {{"path", path.string()}});
  return true;
}

template IncrementalState LoadState<IncrementalState>(
    const std::filesystem::path &, const std::shared_ptr<Logger> &);
template MetricsHistory LoadState<MetricsHistory>(
    const std::filesystem::path &, const std::shared_ptr<Logger> &);

template bool SaveState<IncrementalState>(const std::filesystem::path &,
                                          const IncrementalState &,
                                          const std::shared_ptr<Logger> &);
template bool SaveState<MetricsHistory>(const std::filesystem::path &,
                                        const MetricsHistory &,
                                        const std::shared_ptr<Logger> &);

} // namespace inquest
