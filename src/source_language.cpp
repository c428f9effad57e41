#include <inquest/source_language.h>

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace inquest {

std::string LanguageForPath(const std::string &rel_path) {
  auto extension = std::filesystem::path(rel_path).extension().string();
  std::transform(
      extension.begin(), extension.end(), extension.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (extension == ".c") {
    return "c";
  }
  if (extension == ".cc" || extension == ".cpp" || extension == ".cxx" ||
      extension == ".h" || extension == ".hh" || extension == ".hpp" ||
      extension == ".hxx") {
    return "c++";
  }
  return {};
}

} // namespace inquest
