#include <inquest/builtin_techniques.h>

#include <inquest/clang_syntax_tree.h>
#include <inquest/fingerprint.h>
#include <inquest/source_language.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <initializer_list>
#include <map>
#include <optional>
#include <string_view>

namespace inquest {
namespace {

constexpr std::string_view kTodoMarker = "TODO";

bool IsIdentifierChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool IsTodoAt(std::string_view line, std::size_t position) {
  if (line.compare(position, kTodoMarker.size(), kTodoMarker) != 0) {
    return false;
  }
  const auto end = position + kTodoMarker.size();
  const bool starts_word = position == 0 || !IsIdentifierChar(line[position - 1]);
  const bool ends_word = end >= line.size() || !IsIdentifierChar(line[end]);
  return starts_word && ends_word;
}

// Column (0-based) of the first TODO inside a comment on `line`. Block
// comment state carries over between lines through `in_block`.
std::optional<std::size_t> FindTodoInComment(std::string_view line,
                                             bool &in_block) {
  std::optional<std::size_t> found;
  char quote = 0;
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (in_block) {
      if (line.compare(i, 2, "*/") == 0) {
        in_block = false;
        ++i;
      } else if (!found && IsTodoAt(line, i)) {
        found = i;
      }
      continue;
    }
    if (quote != 0) {
      if (c == '\\') {
        ++i;
      } else if (c == quote) {
        quote = 0;
      }
      continue;
    }
    if (c == '"' || c == '\'' || c == '`') {
      quote = c;
      continue;
    }
    if (line.compare(i, 2, "//") == 0) {
      for (auto j = i + 2; j < line.size() && !found; ++j) {
        if (IsTodoAt(line, j)) {
          found = j;
        }
      }
      break;
    }
    if (line.compare(i, 2, "/*") == 0) {
      in_block = true;
      ++i;
    }
  }
  return found;
}

bool HasExtension(const std::string &rel_path,
                  std::initializer_list<std::string_view> extensions) {
  auto extension = std::filesystem::path(rel_path).extension().string();
  std::transform(
      extension.begin(), extension.end(), extension.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return std::find(extensions.begin(), extensions.end(), extension) !=
         extensions.end();
}

TechniqueResult FindTodoComments(std::string_view content,
                                 const std::string &rel_path) {
  std::vector<Occurrence> occurrences;
  bool in_block = false;
  unsigned line_number = 0;
  std::size_t begin = 0;
  while (begin <= content.size()) {
    auto end = content.find('\n', begin);
    if (end == std::string_view::npos) {
      end = content.size();
    }
    auto line = content.substr(begin, end - begin);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    ++line_number;

    if (const auto column = FindTodoInComment(line, in_block)) {
      Occurrence occurrence;
      occurrence.kind = "todo-pending";
      occurrence.severity = Severity::kInfo;
      occurrence.message = "TODO comment left in code";
      occurrence.file_path = rel_path;
      occurrence.line = line_number;
      occurrence.column = static_cast<unsigned>(*column + 1);
      occurrence.source_technique = "todo-comments";
      occurrences.push_back(std::move(occurrence));
    }
    begin = end + 1;
  }
  if (occurrences.empty()) {
    return std::nullopt;
  }
  return occurrences;
}

} // namespace

TechniqueDescriptor MakeTodoCommentsTechnique() {
  TechniqueDescriptor technique;
  technique.name = "todo-comments";
  technique.description = "Flags TODO markers left in comments";
  technique.file_predicate = [](const std::string &rel_path) {
    return HasExtension(rel_path, {".c", ".cc", ".cpp", ".cxx", ".h", ".hh",
                                   ".hpp", ".hxx", ".js", ".jsx", ".ts",
                                   ".tsx", ".mjs", ".cjs"});
  };
  technique.run = [](std::string_view content, const std::string &rel_path,
                     const SyntaxTree *, const std::string &,
                     const ExecutionContext &) {
    return FindTodoComments(content, rel_path);
  };
  return technique;
}

TechniqueDescriptor MakeLongFunctionsTechnique() {
  TechniqueDescriptor technique;
  technique.name = "long-functions";
  technique.description = "Flags function definitions longer than " +
                          std::to_string(kLongFunctionLineBudget) + " lines";
  technique.file_predicate = [](const std::string &rel_path) {
    return !LanguageForPath(rel_path).empty();
  };
  technique.run = [](std::string_view, const std::string &rel_path,
                     const SyntaxTree *syntax_tree, const std::string &,
                     const ExecutionContext &) -> TechniqueResult {
    const auto *tree = dynamic_cast<const ClangSyntaxTree *>(syntax_tree);
    if (tree == nullptr) {
      return std::nullopt;
    }
    std::vector<Occurrence> occurrences;
    for (const auto &function : tree->Functions()) {
      const auto lines = function.LineCount();
      if (lines <= kLongFunctionLineBudget) {
        continue;
      }
      Occurrence occurrence;
      occurrence.kind = "long-function";
      occurrence.severity = Severity::kWarning;
      occurrence.message = "Function '" + function.name + "' spans " +
                           std::to_string(lines) + " lines (limit " +
                           std::to_string(kLongFunctionLineBudget) + ")";
      occurrence.file_path = rel_path;
      occurrence.line = function.start_line;
      occurrence.source_technique = "long-functions";
      occurrences.push_back(std::move(occurrence));
    }
    if (occurrences.empty()) {
      return std::nullopt;
    }
    return occurrences;
  };
  return technique;
}

TechniqueDescriptor MakeDuplicateFilesTechnique() {
  TechniqueDescriptor technique;
  technique.name = "duplicate-files";
  technique.description = "Flags files whose content repeats an earlier file";
  technique.is_global = true;
  technique.run = [](std::string_view, const std::string &, const SyntaxTree *,
                     const std::string &,
                     const ExecutionContext &context) -> TechniqueResult {
    if (!context.files) {
      return std::nullopt;
    }
    std::vector<Occurrence> occurrences;
    std::map<std::string, std::string> first_by_fingerprint;
    for (const auto &file : *context.files) {
      if (!file.content || file.content->empty()) {
        continue;
      }
      const auto [found, inserted] = first_by_fingerprint.emplace(
          ContentFingerprint(*file.content), file.rel_path);
      if (inserted) {
        continue;
      }
      Occurrence occurrence;
      occurrence.kind = "duplicate-file";
      occurrence.severity = Severity::kWarning;
      occurrence.message = "Content duplicates " + found->second;
      occurrence.file_path = file.rel_path;
      occurrence.source_technique = "duplicate-files";
      occurrences.push_back(std::move(occurrence));
    }
    if (occurrences.empty()) {
      return std::nullopt;
    }
    return occurrences;
  };
  return technique;
}

void RegisterBuiltinTechniques(TechniqueRegistry &registry) {
  registry.Register(MakeTodoCommentsTechnique());
  registry.Register(MakeLongFunctionsTechnique());
  registry.Register(MakeDuplicateFilesTechnique());
}

} // namespace inquest
