#include "flowforge/scheduler/scheduler.hpp"

#include "flowforge/util/log.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <random>
#include <type_traits>

namespace flowforge::scheduler {

namespace {

auto jitter_factor(double jitter) -> double {
  if (jitter <= 0.0) {
    return 1.0;
  }
  thread_local std::mt19937_64 rng{std::random_device{}()};
  std::uniform_real_distribution<double> dist(0.0, 1.0);
  return 1.0 + jitter * dist(rng);
}

} // namespace

auto eligible(const RunState &state) -> std::vector<NodeIndex> {
  if (state.cancel_requested() || is_terminal(state.status())) {
    return {};
  }
  return state.ready_tasks();
}

auto next_backoff(const RetryPolicy &policy, std::uint32_t failed_attempts,
                  std::chrono::milliseconds previous)
    -> std::chrono::milliseconds {
  const auto base = static_cast<double>(policy.backoff_base.count());
  const auto cap = static_cast<double>(policy.backoff_cap.count());
  const auto exponent =
      static_cast<double>(failed_attempts > 0 ? failed_attempts - 1 : 0);

  auto raw = std::min(cap, base * std::pow(policy.multiplier, exponent));
  auto jittered = std::min(cap, raw * jitter_factor(policy.jitter));
  auto delay = std::chrono::milliseconds{
      static_cast<std::chrono::milliseconds::rep>(std::llround(jittered))};
  return std::max(delay, previous);
}

auto apply_outcome(RunState &state, NodeIndex idx, std::uint32_t attempt,
                   const TaskOutcome &outcome, TimePoint now)
    -> Result<OutcomeDecision> {
  const auto &spec = state.definition().task(idx);

  if (const auto *ok_outcome = std::get_if<TaskSucceeded>(&outcome)) {
    if (auto r = state.record_success(idx, attempt, ok_outcome->result, now);
        !r) {
      return fail(r.error());
    }
    log::debug("run {} task {} attempt {} succeeded", state.id(), spec.name,
               attempt);
    return OutcomeDecision{.action = OutcomeAction::Advance};
  }

  std::string error;
  int exit_code = 1;
  AttemptStatus status = AttemptStatus::Failed;
  std::visit(
      [&](const auto &o) {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, TaskFailed>) {
          error = o.error;
          exit_code = o.exit_code;
        } else if constexpr (std::is_same_v<T, TaskTimedOut>) {
          status = AttemptStatus::TimedOut;
          exit_code = kExitCodeTimeout;
          error = std::format("timed out after {}ms", o.after.count());
        }
      },
      outcome);

  const bool retry = attempt < spec.retry.max_attempts();
  const auto delay =
      retry ? next_backoff(spec.retry, attempt, state.last_backoff(idx))
            : std::chrono::milliseconds{0};

  if (auto r = state.record_failure(idx, attempt, status, error, exit_code,
                                    now, retry, delay);
      !r) {
    return fail(r.error());
  }

  if (retry) {
    log::info("run {} task {} attempt {}/{} {}: {}; retrying in {}ms",
              state.id(), spec.name, attempt, spec.retry.max_attempts(),
              to_string_view(status), error, delay.count());
    return OutcomeDecision{.action = OutcomeAction::Retry,
                           .retry_delay = delay};
  }
  log::warn("run {} task {} failed permanently after {} attempt(s): {}",
            state.id(), spec.name, attempt, error);
  return OutcomeDecision{.action = OutcomeAction::PermanentFailure};
}

auto settle(RunState &state, TimePoint now) -> std::optional<RunStatus> {
  if (is_terminal(state.status())) {
    state.settle_finish_time(now);
    return std::nullopt;
  }
  if (state.status() != RunStatus::Running) {
    return std::nullopt;
  }

  std::optional<RunStatus> next;
  std::string error;
  if (state.all_succeeded()) {
    next = RunStatus::Succeeded;
  } else if (state.failed_count() > 0) {
    const bool fail_fast =
        state.run().failure_policy == FailurePolicy::FailFast;
    if (fail_fast || !state.has_pending_work()) {
      next = RunStatus::Failed;
      error = std::format("{} task(s) failed", state.failed_count());
    }
  } else if (!state.has_pending_work()) {
    // Unreachable for a validated graph; reported instead of hanging.
    next = RunStatus::Failed;
    error = "no task can make progress";
  }

  if (!next) {
    return std::nullopt;
  }
  if (auto r = state.finish(*next, now, std::move(error)); !r) {
    log::error("run {} failed to settle to {}: {}", state.id(),
               to_string_view(*next), r.error().message());
    return std::nullopt;
  }
  return next;
}

} // namespace flowforge::scheduler
