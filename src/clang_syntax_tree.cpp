#include <inquest/clang_syntax_tree.h>

#include <inquest/source_language.h>

#include <clang-c/Index.h>

#include <memory>
#include <utility>

namespace inquest {
namespace {

struct IndexDeleter {
  void operator()(void *index) const { clang_disposeIndex(index); }
};

struct TranslationUnitDeleter {
  void operator()(CXTranslationUnitImpl *unit) const {
    clang_disposeTranslationUnit(unit);
  }
};

using IndexHandle = std::unique_ptr<void, IndexDeleter>;
using TranslationUnitHandle =
    std::unique_ptr<CXTranslationUnitImpl, TranslationUnitDeleter>;

std::string ToString(CXString value) {
  std::string text;
  if (const auto *cstr = clang_getCString(value); cstr != nullptr) {
    text = cstr;
  }
  clang_disposeString(value);
  return text;
}

bool IsFunctionDefinition(CXCursor cursor) {
  switch (clang_getCursorKind(cursor)) {
  case CXCursor_FunctionDecl:
  case CXCursor_CXXMethod:
  case CXCursor_Constructor:
  case CXCursor_Destructor:
  case CXCursor_ConversionFunction:
  case CXCursor_FunctionTemplate:
    return clang_isCursorDefinition(cursor) != 0;
  default:
    return false;
  }
}

class FunctionCollector {
public:
  std::vector<FunctionExtent> Collect(CXCursor root) {
    clang_visitChildren(root, &FunctionCollector::Visit, this);
    return std::move(functions_);
  }

private:
  static CXChildVisitResult Visit(CXCursor cursor, CXCursor,
                                  CXClientData data) {
    auto *collector = static_cast<FunctionCollector *>(data);
    if (clang_Location_isFromMainFile(clang_getCursorLocation(cursor)) == 0) {
      return CXChildVisit_Continue;
    }
    if (IsFunctionDefinition(cursor)) {
      collector->Add(cursor);
    }
    return CXChildVisit_Recurse;
  }

  void Add(CXCursor cursor) {
    const auto extent = clang_getCursorExtent(cursor);
    unsigned start_line = 0;
    unsigned end_line = 0;
    clang_getSpellingLocation(clang_getRangeStart(extent), nullptr,
                              &start_line, nullptr, nullptr);
    clang_getSpellingLocation(clang_getRangeEnd(extent), nullptr, &end_line,
                              nullptr, nullptr);
    functions_.push_back(FunctionExtent{
        ToString(clang_getCursorSpelling(cursor)), start_line, end_line});
  }

  std::vector<FunctionExtent> functions_;
};

} // namespace

ClangSyntaxTreeBuilder::ClangSyntaxTreeBuilder(
    std::vector<std::string> extra_args)
    : extra_args_(std::move(extra_args)) {}

std::shared_ptr<const SyntaxTree>
ClangSyntaxTreeBuilder::Build(std::string_view content,
                              const std::string &rel_path) const {
  const auto language = LanguageForPath(rel_path);
  if (language.empty()) {
    return nullptr;
  }

  std::vector<std::string> args{"-x", language,
                                language == "c" ? "-std=c11" : "-std=c++20"};
  args.insert(args.end(), extra_args_.begin(), extra_args_.end());
  std::vector<const char *> arg_pointers;
  arg_pointers.reserve(args.size());
  for (const auto &arg : args) {
    arg_pointers.push_back(arg.c_str());
  }

  CXUnsavedFile unsaved{rel_path.c_str(), content.data(),
                        static_cast<unsigned long>(content.size())};

  // One index per build so concurrent callers never share libclang state.
  IndexHandle index(clang_createIndex(0, 0));
  CXTranslationUnit raw_unit = nullptr;
  const auto error = clang_parseTranslationUnit2(
      index.get(), rel_path.c_str(), arg_pointers.data(),
      static_cast<int>(arg_pointers.size()), &unsaved, 1,
      CXTranslationUnit_KeepGoing,
      &raw_unit);
  TranslationUnitHandle unit(raw_unit);
  if (error != CXError_Success || !unit) {
    return nullptr;
  }

  FunctionCollector collector;
  auto functions = collector.Collect(clang_getTranslationUnitCursor(unit.get()));
  return std::make_shared<ClangSyntaxTree>(language, std::move(functions));
}

} // namespace inquest
