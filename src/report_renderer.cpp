#include <inquest/report_renderer.h>

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <map>
#include <sstream>

namespace inquest {
namespace {

bool ShouldRenderFormat(const std::vector<std::string> &formats,
                        const std::string &format) {
  if (formats.empty()) {
    return format == "markdown";
  }
  return std::find(formats.begin(), formats.end(), format) != formats.end();
}

std::string EscapeMarkdownCell(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size());
  for (const auto character : value) {
    if (character == '|') {
      escaped.append("\\|");
    } else if (character == '\n' || character == '\r') {
      escaped.push_back(' ');
    } else {
      escaped.push_back(character);
    }
  }
  return escaped;
}

std::string Location(const Occurrence &occurrence) {
  if (!occurrence.line) {
    return "-";
  }
  auto location = std::to_string(*occurrence.line);
  if (occurrence.column) {
    location += ":" + std::to_string(*occurrence.column);
  }
  return location;
}

std::string FormatMs(double value) {
  std::ostringstream stream;
  stream << std::fixed << std::setprecision(2) << value;
  return stream.str();
}

std::string BuildSummaryMarkdown(const ExecutionResult &result,
                                 const ReportOptions &options,
                                 const std::string &timestamp) {
  std::map<Severity, std::size_t> by_severity;
  for (const auto &occurrence : result.occurrences) {
    ++by_severity[occurrence.severity];
  }

  std::ostringstream section;
  section << "## Summary\n\n";
  section << "| Field | Value |\n";
  section << "| --- | --- |\n";
  section << "| Generated On | " << timestamp << " |\n";
  section << "| Source | " << EscapeMarkdownCell(options.root_path) << " |\n";
  section << "| Files Analyzed | " << result.analyzed_files.size() << " |\n";
  section << "| Occurrences | " << result.occurrences.size() << " |\n";
  section << "| Errors | " << by_severity[Severity::kError] << " |\n";
  section << "| Warnings | " << by_severity[Severity::kWarning] << " |\n";
  section << "| Info | " << by_severity[Severity::kInfo] << " |\n";
  section << "| Duration (ms) | " << FormatMs(result.duration_ms) << " |\n\n";
  return section.str();
}

std::string BuildOccurrencesMarkdown(const ExecutionResult &result) {
  std::ostringstream section;
  section << "## Occurrences\n\n";
  section << "| Severity | Kind | File | Location | Technique | Message |\n";
  section << "| --- | --- | --- | --- | --- | --- |\n";
  if (result.occurrences.empty()) {
    section << "| None | - | - | - | - | - |\n\n";
    return section.str();
  }
  for (const auto &occurrence : result.occurrences) {
    section << "| " << SeverityName(occurrence.severity) << " | "
            << EscapeMarkdownCell(occurrence.kind) << " | "
            << EscapeMarkdownCell(occurrence.file_path) << " | "
            << Location(occurrence) << " | "
            << EscapeMarkdownCell(occurrence.source_technique) << " | "
            << EscapeMarkdownCell(occurrence.message) << " |\n";
  }
  section << "\n";
  return section.str();
}

std::string BuildMetricsMarkdown(const ExecutionResult &result) {
  std::ostringstream section;
  section << "## Metrics\n\n";
  if (!result.metrics) {
    section << "- Disabled\n";
    return section.str();
  }
  const auto &metrics = *result.metrics;
  section << "- Total files: " << metrics.total_files << "\n";
  section << "- Parse time (ms): " << FormatMs(metrics.parse_time_ms) << "\n";
  section << "- Analysis time (ms): " << FormatMs(metrics.analysis_time_ms)
          << "\n";
  section << "- Cache hits: " << metrics.cache_hits << "\n";
  section << "- Cache misses: " << metrics.cache_misses << "\n\n";
  section << "| Technique | Scope | Duration (ms) | Occurrences |\n";
  section << "| --- | --- | --- | --- |\n";
  if (metrics.per_technique.empty()) {
    section << "| None | - | - | - |\n";
  }
  for (const auto &technique : metrics.per_technique) {
    section << "| " << EscapeMarkdownCell(technique.name) << " | "
            << (technique.is_global ? "global" : "per-file") << " | "
            << FormatMs(technique.duration_ms) << " | "
            << technique.occurrence_count << " |\n";
  }
  return section.str();
}

std::string BuildOccurrencesJson(const ExecutionResult &result) {
  std::ostringstream json;
  json << "\"occurrences\": [";
  for (std::size_t i = 0; i < result.occurrences.size(); ++i) {
    const auto &occurrence = result.occurrences[i];
    if (i > 0) {
      json << ",";
    }
    json << "{\"kind\": \"" << EscapeJsonString(occurrence.kind) << "\",";
    json << "\"severity\": \"" << SeverityName(occurrence.severity) << "\",";
    json << "\"message\": \"" << EscapeJsonString(occurrence.message) << "\",";
    json << "\"file_path\": \"" << EscapeJsonString(occurrence.file_path)
         << "\",";
    if (occurrence.line) {
      json << "\"line\": " << *occurrence.line << ",";
    }
    if (occurrence.column) {
      json << "\"column\": " << *occurrence.column << ",";
    }
    json << "\"source_technique\": \""
         << EscapeJsonString(occurrence.source_technique) << "\"}";
  }
  json << "]";
  return json.str();
}

std::string BuildMetricsJson(const ExecutionResult &result) {
  if (!result.metrics) {
    return "\"metrics\": null";
  }
  const auto &metrics = *result.metrics;
  std::ostringstream json;
  json << "\"metrics\": {";
  json << "\"total_files\": " << metrics.total_files << ",";
  json << "\"parse_time_ms\": " << FormatMs(metrics.parse_time_ms) << ",";
  json << "\"analysis_time_ms\": " << FormatMs(metrics.analysis_time_ms)
       << ",";
  json << "\"cache_hits\": " << metrics.cache_hits << ",";
  json << "\"cache_misses\": " << metrics.cache_misses << ",";
  json << "\"per_technique\": [";
  for (std::size_t i = 0; i < metrics.per_technique.size(); ++i) {
    const auto &technique = metrics.per_technique[i];
    if (i > 0) {
      json << ",";
    }
    json << "{\"name\": \"" << EscapeJsonString(technique.name) << "\",";
    json << "\"duration_ms\": " << FormatMs(technique.duration_ms) << ",";
    json << "\"occurrence_count\": " << technique.occurrence_count << ",";
    json << "\"is_global\": " << (technique.is_global ? "true" : "false")
         << "}";
  }
  json << "]}";
  return json.str();
}

} // namespace

std::string EscapeJsonString(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size());
  for (const auto character : value) {
    switch (character) {
    case '"':
      escaped.append("\\\"");
      break;
    case '\\':
      escaped.append("\\\\");
      break;
    case '\n':
      escaped.append("\\n");
      break;
    case '\r':
      escaped.append("\\r");
      break;
    case '\t':
      escaped.append("\\t");
      break;
    default:
      if (static_cast<unsigned char>(character) < 0x20) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x",
                      static_cast<unsigned>(character));
        escaped.append(buffer);
      } else {
        escaped.push_back(character);
      }
    }
  }
  return escaped;
}

Report RenderReport(const ExecutionResult &result,
                    const ReportOptions &options) {
  const auto now = std::chrono::system_clock::now();
  const std::time_t now_time = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  gmtime_r(&now_time, &tm);
  std::ostringstream timestamp_stream;
  timestamp_stream << std::put_time(&tm, "%FT%TZ");
  const auto timestamp = timestamp_stream.str();

  Report report;
  if (ShouldRenderFormat(options.formats, "markdown")) {
    std::ostringstream output;
    output << "# Analysis Report\n\n";
    output << BuildSummaryMarkdown(result, options, timestamp);
    output << BuildOccurrencesMarkdown(result);
    output << BuildMetricsMarkdown(result);
    report.markdown = output.str();
  }

  if (ShouldRenderFormat(options.formats, "json")) {
    std::ostringstream output;
    output << "{";
    output << "\"generated_on\": \"" << timestamp << "\",";
    output << "\"source\": \"" << EscapeJsonString(options.root_path) << "\",";
    output << "\"files_analyzed\": " << result.analyzed_files.size() << ",";
    output << BuildOccurrencesJson(result) << ",";
    output << BuildMetricsJson(result);
    output << "}";
    report.json = output.str();
  }
  return report;
}

} // namespace inquest
