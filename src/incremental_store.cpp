#include <inquest/incremental_store.h>

#include <inquest/execution_options.h>
#include <inquest/persistence.h>

#include <utility>

namespace inquest {

IncrementalStore::IncrementalStore(bool enabled,
                                   std::shared_ptr<Logger> logger)
    : enabled_(enabled), logger_(EnsureLogger(std::move(logger))) {
  previous_.schema_version = kIncrementalSchemaVersion;
  next_.schema_version = kIncrementalSchemaVersion;
}

IncrementalStore IncrementalStore::Load(const std::filesystem::path &path,
                                        bool enabled,
                                        std::shared_ptr<Logger> logger) {
  IncrementalStore store(enabled, std::move(logger));
  if (!enabled) {
    return store;
  }

  auto loaded = LoadState<IncrementalState>(path, store.logger_);
  if (loaded.schema_version != kIncrementalSchemaVersion) {
    if (!loaded.records.empty() || loaded.schema_version != 0) {
      store.logger_->Log(
          LogLevel::kInfo, "incremental.schema.mismatch",
          {{"path", path.string()},
           {"found", std::to_string(loaded.schema_version)},
           {"expected", std::to_string(kIncrementalSchemaVersion)}});
    }
    return store;
  }

  store.logger_->Log(LogLevel::kDebug, "incremental.load.complete",
                     {{"path", path.string()},
                      {"records", std::to_string(loaded.records.size())}});
  store.Seed(std::move(loaded));
  return store;
}

const IncrementalRecord *
IncrementalStore::FindReusable(const std::string &rel_path,
                               const std::string &fingerprint) const {
  if (!enabled_) {
    return nullptr;
  }
  const auto found = previous_.records.find(rel_path);
  if (found == previous_.records.end() ||
      found->second.fingerprint != fingerprint) {
    return nullptr;
  }
  return &found->second;
}

void IncrementalStore::RecordReuse(const std::string &rel_path,
                                   const IncrementalRecord &previous) {
  if (!enabled_) {
    return;
  }
  auto record = previous;
  ++record.reuse_count;
  next_.records[rel_path] = std::move(record);
  ++next_.stats.total_reuses;
}

void IncrementalStore::RecordExecution(const std::string &rel_path,
                                       IncrementalRecord record) {
  if (!enabled_) {
    return;
  }
  record.reuse_count = 0;
  next_.records[rel_path] = std::move(record);
  ++next_.stats.total_processed;
}

void IncrementalStore::Finish(double duration_ms) {
  next_.stats.last_duration_ms = duration_ms;
}

bool IncrementalStore::Save(const std::filesystem::path &path) const {
  if (!enabled_) {
    return false;
  }
  const auto saved = SaveState(path, next_, logger_);
  if (saved) {
    logger_->Log(LogLevel::kInfo, "incremental.save.complete",
                 {{"path", path.string()},
                  {"records", std::to_string(next_.records.size())},
                  {"total_reuses", std::to_string(next_.stats.total_reuses)},
                  {"processed", std::to_string(next_.stats.total_processed)}});
  }
  return saved;
}

void IncrementalStore::Commit() {
  if (!enabled_) {
    return;
  }
  IncrementalState committed = std::move(next_);
  next_ = IncrementalState{};
  Seed(std::move(committed));
}

void IncrementalStore::Seed(IncrementalState previous) {
  previous_ = std::move(previous);
  previous_.schema_version = kIncrementalSchemaVersion;
  next_.schema_version = kIncrementalSchemaVersion;
  // Counters accumulate across runs; records are rebuilt from scratch.
  next_.stats.total_reuses = previous_.stats.total_reuses;
  next_.stats.total_processed = previous_.stats.total_processed;
}

} // namespace inquest
