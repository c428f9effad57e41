#pragma once

#include <inquest/models.h>

#include <string>
#include <vector>

namespace inquest {

struct Report {
  std::string markdown;
  std::string json;
};

struct ReportOptions {
  std::string root_path;
  // "markdown" and/or "json"; empty renders markdown only.
  std::vector<std::string> formats;
};

Report RenderReport(const ExecutionResult &result,
                    const ReportOptions &options);

std::string EscapeJsonString(const std::string &value);

} // namespace inquest
