#pragma once

#include <inquest/technique.h>

#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace inquest {

enum class InvocationStatus { kCompleted, kFailed, kTimedOut };

struct InvocationOutcome {
  InvocationStatus status = InvocationStatus::kCompleted;
  std::vector<Occurrence> occurrences;
  std::string error;
  double duration_ms = 0.0;
};

using GuardedCall = std::function<TechniqueResult()>;

// Races `call` against `timeout`. A zero timeout runs the call inline.
// When the timer wins the call is abandoned: it keeps running on its own
// thread, which owns everything the call captured, and its result is
// discarded. Exceptions of any type become kFailed.
InvocationOutcome InvokeGuarded(GuardedCall call,
                                std::chrono::milliseconds timeout);

} // namespace inquest
