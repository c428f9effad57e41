#pragma once

#include <string>

namespace inquest {

// "c", "c++" or empty when the extension is not a C-family source.
std::string LanguageForPath(const std::string &rel_path);

} // namespace inquest
