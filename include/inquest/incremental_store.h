#pragma once

#include <inquest/logging.h>
#include <inquest/models.h>

#include <filesystem>
#include <memory>
#include <string>

namespace inquest {

// Holds the previous run's records (read-only during execution) and builds
// the replacement state for the current run. Lookups on the previous state
// are safe from several threads; recording is coordinator-only.
class IncrementalStore {
public:
  IncrementalStore(bool enabled, std::shared_ptr<Logger> logger);

  // Discards the loaded state when its schema version differs from
  // kIncrementalSchemaVersion.
  static IncrementalStore Load(const std::filesystem::path &path, bool enabled,
                               std::shared_ptr<Logger> logger);

  bool Enabled() const { return enabled_; }

  // Record of a previous run whose fingerprint equals `fingerprint`, or
  // null. Always null when the store is disabled.
  const IncrementalRecord *FindReusable(const std::string &rel_path,
                                        const std::string &fingerprint) const;

  void RecordReuse(const std::string &rel_path,
                   const IncrementalRecord &previous);
  void RecordExecution(const std::string &rel_path, IncrementalRecord record);
  void Finish(double duration_ms);

  bool Save(const std::filesystem::path &path) const;

  // Promotes the state built by the finished run to the previous state, so
  // a caller-owned store can serve the next run without touching disk.
  void Commit();

  const IncrementalState &Previous() const { return previous_; }
  const IncrementalState &Next() const { return next_; }

  // Replaces the previous state; used to seed a store without disk access.
  void Seed(IncrementalState previous);

private:
  bool enabled_;
  std::shared_ptr<Logger> logger_;
  IncrementalState previous_;
  IncrementalState next_;
};

} // namespace inquest
