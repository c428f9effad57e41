#include <inquest/models.h>

#include <stdexcept>

namespace inquest {

const char *SeverityName(Severity severity) {
  switch (severity) {
  case Severity::kInfo:
    return "info";
  case Severity::kWarning:
    return "warning";
  case Severity::kError:
    return "error";
  }
  return "unknown";
}

Severity ParseSeverity(const std::string &value) {
  if (value == "info") {
    return Severity::kInfo;
  }
  if (value == "warning" || value == "warn") {
    return Severity::kWarning;
  }
  if (value == "error") {
    return Severity::kError;
  }
  throw std::invalid_argument("Unknown severity: " + value);
}

} // namespace inquest
