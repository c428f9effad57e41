#pragma once

#include <inquest/models.h>

#include <vector>

namespace inquest {

inline constexpr int kExitClean = 0;
inline constexpr int kExitUsageError = 1;
inline constexpr int kExitErrorOccurrences = 2;

// kExitErrorOccurrences when any occurrence has error severity.
int OccurrenceExitCode(const std::vector<Occurrence> &occurrences);

} // namespace inquest
