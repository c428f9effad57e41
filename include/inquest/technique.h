#pragma once

#include <inquest/models.h>

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace inquest {

// Shared, read-only state handed to every technique invocation of a run.
// `report` is only set in sequential mode; techniques must check it before
// calling.
struct ExecutionContext {
  std::string base_dir;
  std::shared_ptr<const std::vector<FileEntry>> files;
  std::map<std::string, bool> ambient_flags;
  std::function<void(Occurrence)> report;

  bool Flag(const std::string &name) const {
    const auto found = ambient_flags.find(name);
    return found != ambient_flags.end() && found->second;
  }
};

// std::nullopt means "nothing to report".
using TechniqueResult = std::optional<std::vector<Occurrence>>;

using TechniqueFunction = std::function<TechniqueResult(
    std::string_view content, const std::string &rel_path,
    const SyntaxTree *syntax_tree, const std::string &full_path,
    const ExecutionContext &context)>;

using FilePredicate = std::function<bool(const std::string &rel_path)>;

struct TechniqueDescriptor {
  std::string name;
  std::string description;
  bool is_global = false;
  FilePredicate file_predicate;
  TechniqueFunction run;

  bool AppliesTo(const std::string &rel_path) const {
    return !file_predicate || file_predicate(rel_path);
  }
};

} // namespace inquest
