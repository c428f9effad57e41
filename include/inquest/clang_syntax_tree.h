#pragma once

#include <inquest/interfaces.h>

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace inquest {

struct FunctionExtent {
  std::string name;
  unsigned start_line = 0;
  unsigned end_line = 0;

  unsigned LineCount() const {
    return end_line >= start_line ? end_line - start_line + 1 : 0;
  }
};

// Tree produced from a libclang translation unit. Only the facts techniques
// consume are kept; the translation unit itself is released after parsing.
class ClangSyntaxTree : public SyntaxTree {
public:
  ClangSyntaxTree(std::string language, std::vector<FunctionExtent> functions)
      : language_(std::move(language)), functions_(std::move(functions)) {}

  std::string Language() const override { return language_; }
  // Function definitions of the main file, in source order.
  const std::vector<FunctionExtent> &Functions() const { return functions_; }

private:
  std::string language_;
  std::vector<FunctionExtent> functions_;
};

// Parses C and C++ sources from memory. Other extensions yield null, as do
// sources libclang cannot turn into a translation unit.
class ClangSyntaxTreeBuilder : public SyntaxTreeBuilder {
public:
  explicit ClangSyntaxTreeBuilder(std::vector<std::string> extra_args = {});

  std::shared_ptr<const SyntaxTree>
  Build(std::string_view content, const std::string &rel_path) const override;

private:
  std::vector<std::string> extra_args_;
};

} // namespace inquest
