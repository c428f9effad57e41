#include <inquest/file_scanner.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace inquest {
namespace {

const char *const kSkippedDirectories[] = {".git", ".inquest", "node_modules",
                                           "build"};

bool IsWithin(const std::filesystem::path &candidate,
              const std::filesystem::path &potential_parent) {
  if (potential_parent.empty()) {
    return false;
  }
  return std::distance(potential_parent.begin(), potential_parent.end()) <=
             std::distance(candidate.begin(), candidate.end()) &&
         std::equal(potential_parent.begin(), potential_parent.end(),
                    candidate.begin());
}

bool IsIgnoredPath(const std::filesystem::path &path,
                   const std::vector<std::filesystem::path> &ignored_paths) {
  return std::any_of(
      ignored_paths.begin(), ignored_paths.end(),
      [&](const auto &ignored) { return IsWithin(path, ignored); });
}

bool IsSkippedDirectory(const std::filesystem::path &path) {
  const auto name = path.filename().string();
  return std::find(std::begin(kSkippedDirectories),
                   std::end(kSkippedDirectories),
                   name) != std::end(kSkippedDirectories);
}

std::string LowerExtension(const std::filesystem::path &path) {
  auto extension = path.extension().string();
  std::transform(
      extension.begin(), extension.end(), extension.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return extension;
}

std::filesystem::path ResolveRoot(const std::filesystem::path &root) {
  if (root.empty()) {
    throw std::invalid_argument("Scan root must not be empty");
  }
  const auto normalized = std::filesystem::weakly_canonical(root);
  if (!std::filesystem::is_directory(normalized)) {
    throw std::runtime_error("Analysis root path is not a directory: " +
                             normalized.string());
  }
  return normalized;
}

std::optional<std::string> ReadContent(const std::filesystem::path &path) {
  std::ifstream stream(path, std::ios::binary);
  if (!stream) {
    return std::nullopt;
  }
  std::ostringstream buffer;
  buffer << stream.rdbuf();
  return buffer.str();
}

} // namespace

std::set<std::string> DefaultScanExtensions() {
  return {".c",  ".cc", ".cpp", ".cxx", ".h",   ".hh",  ".hpp", ".hxx",
          ".js", ".jsx", ".ts", ".tsx", ".mjs", ".cjs"};
}

FileScanner::FileScanner(std::shared_ptr<Logger> logger)
    : logger_(EnsureLogger(std::move(logger))) {}

std::vector<FileEntry> FileScanner::Scan(const ScanOptions &options) const {
  const auto root = ResolveRoot(options.root);

  std::vector<std::filesystem::path> ignored_paths;
  ignored_paths.reserve(options.ignored_paths.size());
  for (const auto &ignored : options.ignored_paths) {
    ignored_paths.push_back(std::filesystem::weakly_canonical(
        ignored.is_absolute() ? ignored : root / ignored));
  }

  std::vector<FileEntry> files;
  for (std::filesystem::recursive_directory_iterator it(root), end; it != end;
       ++it) {
    const auto &entry = *it;
    const auto path = std::filesystem::weakly_canonical(entry.path());
    if (IsIgnoredPath(path, ignored_paths) ||
        (entry.is_directory() && IsSkippedDirectory(path))) {
      if (entry.is_directory()) {
        it.disable_recursion_pending();
      }
      continue;
    }
    if (!entry.is_regular_file()) {
      continue;
    }
    if (!options.extensions.empty() &&
        options.extensions.count(LowerExtension(path)) == 0) {
      continue;
    }

    FileEntry file;
    file.rel_path = path.lexically_relative(root).generic_string();
    file.full_path = path.string();
    file.content = ReadContent(path);
    if (!file.content) {
      logger_->Log(LogLevel::kWarn, "scanner.read.failed",
                   {{"file", file.rel_path}});
      file.content = std::string();
    }
    files.push_back(std::move(file));
  }

  std::sort(files.begin(), files.end(), [](const auto &lhs, const auto &rhs) {
    return lhs.rel_path < rhs.rel_path;
  });

  logger_->Log(LogLevel::kInfo, "scanner.complete",
               {{"root", root.string()},
                {"files", std::to_string(files.size())}});
  return files;
}

} // namespace inquest
