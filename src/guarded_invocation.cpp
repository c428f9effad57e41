#include <inquest/guarded_invocation.h>

#include <future>
#include <memory>
#include <system_error>
#include <thread>
#include <utility>

namespace inquest {
namespace {

using Clock = std::chrono::steady_clock;

double ElapsedMs(Clock::time_point start) {
  return std::chrono::duration<double, std::milli>(Clock::now() - start)
      .count();
}

void Collect(TechniqueResult result, InvocationOutcome &outcome) {
  if (result) {
    outcome.occurrences = std::move(*result);
  }
}

InvocationOutcome InvokeInline(GuardedCall &call) {
  InvocationOutcome outcome;
  const auto start = Clock::now();
  try {
    Collect(call(), outcome);
  } catch (const std::exception &ex) {
    outcome.status = InvocationStatus::kFailed;
    outcome.error = ex.what();
  } catch (...) {
    outcome.status = InvocationStatus::kFailed;
    outcome.error = "unknown exception";
  }
  outcome.duration_ms = ElapsedMs(start);
  return outcome;
}

} // namespace

InvocationOutcome InvokeGuarded(GuardedCall call,
                                std::chrono::milliseconds timeout) {
  if (timeout.count() <= 0) {
    return InvokeInline(call);
  }

  InvocationOutcome outcome;
  const auto start = Clock::now();
  auto task =
      std::make_shared<std::packaged_task<TechniqueResult()>>(std::move(call));
  auto future = task->get_future();

  // One thread per guarded call, on top of any worker threads. Threads of
  // abandoned calls linger until their technique returns, so worker_count
  // bounds concurrent invocations, not the process's thread count.
  try {
    std::thread([task]() { (*task)(); }).detach();
  } catch (const std::system_error &ex) {
    outcome.status = InvocationStatus::kFailed;
    outcome.error = std::string("cannot start invocation thread: ") + ex.what();
    outcome.duration_ms = ElapsedMs(start);
    return outcome;
  }

  if (future.wait_for(timeout) == std::future_status::timeout) {
    outcome.status = InvocationStatus::kTimedOut;
    outcome.duration_ms = ElapsedMs(start);
    return outcome;
  }

  try {
    Collect(future.get(), outcome);
  } catch (const std::exception &ex) {
    outcome.status = InvocationStatus::kFailed;
    outcome.error = ex.what();
  } catch (...) {
    outcome.status = InvocationStatus::kFailed;
    outcome.error = "unknown exception";
  }
  outcome.duration_ms = ElapsedMs(start);
  return outcome;
}

} // namespace inquest
