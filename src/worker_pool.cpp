#include <inquest/worker_pool.h>

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace inquest {

WorkerPool::WorkerPool(unsigned worker_count, std::shared_ptr<Logger> logger)
    : worker_count_(worker_count), logger_(EnsureLogger(std::move(logger))) {
  if (worker_count_ == 0) {
    throw std::invalid_argument("Worker pool needs at least one worker");
  }
}

void WorkerPool::Run(std::size_t job_count,
                     const std::function<void(std::size_t)> &job) const {
  if (job_count == 0) {
    return;
  }

  const auto thread_count =
      std::min<std::size_t>(worker_count_, job_count);
  logger_->Log(LogLevel::kDebug, "worker_pool.start",
               {{"workers", std::to_string(thread_count)},
                {"jobs", std::to_string(job_count)}});

  std::atomic<std::size_t> next_job{0};
  std::atomic<bool> failed{false};
  std::exception_ptr first_error;
  std::mutex error_mutex;

  auto work = [&]() {
    for (;;) {
      if (failed.load()) {
        break;
      }
      const std::size_t index = next_job.fetch_add(1);
      if (index >= job_count) {
        break;
      }
      try {
        job(index);
      } catch (...) {
        std::lock_guard<std::mutex> lock(error_mutex);
        if (!first_error) {
          first_error = std::current_exception();
        }
        failed = true;
      }
    }
  };

  std::vector<std::thread> workers;
  workers.reserve(thread_count);
  try {
    for (std::size_t i = 0; i < thread_count; ++i) {
      workers.emplace_back(work);
    }
  } catch (const std::system_error &) {
    failed = true;
    for (auto &worker : workers) {
      worker.join();
    }
    throw;
  }
  for (auto &worker : workers) {
    worker.join();
  }

  if (first_error) {
    std::rethrow_exception(first_error);
  }
}

} // namespace inquest
