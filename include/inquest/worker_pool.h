#pragma once

#include <inquest/logging.h>

#include <cstddef>
#include <functional>
#include <memory>

namespace inquest {

// Bounded set of threads pulling job indices from a shared counter. Threads
// live for the duration of one Run call.
class WorkerPool {
public:
  WorkerPool(unsigned worker_count, std::shared_ptr<Logger> logger);

  unsigned Size() const { return worker_count_; }

  // Calls `job(i)` exactly once for every i in [0, job_count). Blocks until
  // all jobs finished. The first exception thrown by a job is rethrown here
  // after every thread has joined; remaining jobs are skipped.
  void Run(std::size_t job_count,
           const std::function<void(std::size_t)> &job) const;

private:
  unsigned worker_count_;
  std::shared_ptr<Logger> logger_;
};

} // namespace inquest
