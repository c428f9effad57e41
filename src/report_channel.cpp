#include <inquest/report_channel.h>

#include <utility>

namespace inquest {
namespace {

thread_local std::uint64_t current_invocation = 0;

} // namespace

ReportChannel::InvocationScope::InvocationScope(std::uint64_t invocation_id)
    : previous_(current_invocation) {
  current_invocation = invocation_id;
}

ReportChannel::InvocationScope::~InvocationScope() {
  current_invocation = previous_;
}

std::uint64_t ReportChannel::Open(std::string rel_path, std::string technique) {
  std::lock_guard<std::mutex> lock(mutex_);
  open_id_ = ++last_id_;
  rel_path_ = std::move(rel_path);
  technique_ = std::move(technique);
  pending_.clear();
  return open_id_;
}

bool ReportChannel::Push(Occurrence occurrence) {
  const auto caller = current_invocation;
  std::lock_guard<std::mutex> lock(mutex_);
  if (open_id_ == 0 || caller != open_id_) {
    ++dropped_;
    return false;
  }
  if (occurrence.file_path.empty()) {
    occurrence.file_path = rel_path_;
  }
  if (occurrence.source_technique.empty()) {
    occurrence.source_technique = technique_;
  }
  pending_.push_back(std::move(occurrence));
  return true;
}

std::vector<Occurrence> ReportChannel::Close() {
  std::lock_guard<std::mutex> lock(mutex_);
  open_id_ = 0;
  auto drained = std::move(pending_);
  pending_.clear();
  return drained;
}

std::size_t ReportChannel::Dropped() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return dropped_;
}

} // namespace inquest
