#pragma once

#include <inquest/models.h>

#include <memory>
#include <string>
#include <string_view>

namespace inquest {

class SyntaxTreeBuilder {
public:
  virtual ~SyntaxTreeBuilder() = default;
  // Returns null when the file kind is unsupported or the parse failed.
  // Called concurrently from worker threads in parallel mode.
  virtual std::shared_ptr<const SyntaxTree>
  Build(std::string_view content, const std::string &rel_path) const = 0;
};

class ExecutionListener {
public:
  virtual ~ExecutionListener() = default;
  virtual void OnFileProcessed(const std::string &rel_path,
                               std::size_t occurrence_count) = 0;
  virtual void OnAnalysisComplete(const ExecutionResult &result) = 0;
};

} // namespace inquest
