#pragma once

#include "flowforge/core/error.hpp"
#include "flowforge/executor/executor.hpp"
#include "flowforge/run/run_state.hpp"
#include "flowforge/workflow/task_spec.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <vector>

namespace flowforge {

enum class OutcomeAction : std::uint8_t {
  Advance,          // success recorded, dependents re-evaluated
  Retry,            // failure absorbed, another attempt after retry_delay
  PermanentFailure, // attempts exhausted
};

struct OutcomeDecision {
  OutcomeAction action{OutcomeAction::Advance};
  std::chrono::milliseconds retry_delay{0};
};

// Pure scheduling decisions over one run's state. Callers hold the run's
// lock; nothing here suspends or touches other runs.
namespace scheduler {

/// Tasks that may be dispatched now. Empty once the run is cancelled or
/// terminal.
[[nodiscard]] auto eligible(const RunState &state) -> std::vector<NodeIndex>;

/// Exponential backoff with jitter for the delay after `failed_attempts`
/// failures, never shorter than `previous`.
[[nodiscard]] auto next_backoff(const RetryPolicy &policy,
                                std::uint32_t failed_attempts,
                                std::chrono::milliseconds previous)
    -> std::chrono::milliseconds;

/// Records an attempt outcome and decides what happens to the task next.
/// TimedOut follows the same retry path as Failed.
[[nodiscard]] auto apply_outcome(RunState &state, NodeIndex idx,
                                 std::uint32_t attempt,
                                 const TaskOutcome &outcome, TimePoint now)
    -> Result<OutcomeDecision>;

/// Moves the run to its terminal status when the failure policy or the
/// success rule says so. Returns the status it settled to, if any.
[[nodiscard]] auto settle(RunState &state, TimePoint now)
    -> std::optional<RunStatus>;

} // namespace scheduler
} // namespace flowforge
