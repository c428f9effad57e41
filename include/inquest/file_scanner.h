#pragma once

#include <inquest/logging.h>
#include <inquest/models.h>

#include <filesystem>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace inquest {

struct ScanOptions {
  std::filesystem::path root;
  // Absolute, or relative to `root`. Directories are pruned entirely.
  std::vector<std::filesystem::path> ignored_paths;
  // Lower-case, with the leading dot. Empty keeps every extension.
  std::set<std::string> extensions;
};

std::set<std::string> DefaultScanExtensions();

class FileScanner {
public:
  explicit FileScanner(std::shared_ptr<Logger> logger = nullptr);

  // Throws std::runtime_error when the root is not a directory. Files that
  // cannot be read are kept with an empty content.
  std::vector<FileEntry> Scan(const ScanOptions &options) const;

private:
  std::shared_ptr<Logger> logger_;
};

} // namespace inquest
