#pragma once

#include <inquest/logging.h>
#include <inquest/models.h>

#include <filesystem>
#include <memory>

namespace inquest {

// Loads a YAML state document. Missing, unreadable or malformed files yield
// a value-initialized T; the failure is logged, never thrown. Instantiated
// for IncrementalState and MetricsHistory.
template <typename T>
T LoadState(const std::filesystem::path &path,
            const std::shared_ptr<Logger> &logger);

// Writes atomically through a sibling temporary file. Returns false (after
// logging) when the document could not be persisted.
template <typename T>
bool SaveState(const std::filesystem::path &path, const T &value,
               const std::shared_ptr<Logger> &logger);

} // namespace inquest
