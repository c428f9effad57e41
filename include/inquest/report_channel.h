#pragma once

#include <inquest/models.h>

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace inquest {

// Queue behind ExecutionContext::report. Exactly one invocation is open at a
// time; occurrences pushed from any other invocation (for instance one that
// was abandoned after a timeout) are dropped.
class ReportChannel {
public:
  // Tags the current thread with an invocation id for the scope's lifetime.
  class InvocationScope {
  public:
    explicit InvocationScope(std::uint64_t invocation_id);
    ~InvocationScope();
    InvocationScope(const InvocationScope &) = delete;
    InvocationScope &operator=(const InvocationScope &) = delete;

  private:
    std::uint64_t previous_;
  };

  // Starts accepting reports for a new invocation and returns its id.
  // Missing file_path and source_technique fields of pushed occurrences are
  // filled from these values.
  std::uint64_t Open(std::string rel_path, std::string technique);
  bool Push(Occurrence occurrence);
  // Stops accepting reports for the open invocation and drains the queue.
  std::vector<Occurrence> Close();

  std::size_t Dropped() const;

private:
  mutable std::mutex mutex_;
  std::uint64_t last_id_ = 0;
  std::uint64_t open_id_ = 0;
  std::string rel_path_;
  std::string technique_;
  std::vector<Occurrence> pending_;
  std::size_t dropped_ = 0;
};

} // namespace inquest
