#include <inquest/cli_exit_codes.h>

#include <algorithm>

namespace inquest {

int OccurrenceExitCode(const std::vector<Occurrence> &occurrences) {
  const bool has_error = std::any_of(
      occurrences.begin(), occurrences.end(), [](const auto &occurrence) {
        return occurrence.severity == Severity::kError;
      });
  return has_error ? kExitErrorOccurrences : kExitClean;
}

} // namespace inquest
