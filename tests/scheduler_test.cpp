#include "flowforge/scheduler/scheduler.hpp"

#include "test_utils.hpp"

#include <chrono>

#include "gtest/gtest.h"

using namespace flowforge;
using namespace std::chrono_literals;

namespace {

auto make_running_state(WorkflowSpec spec, FailurePolicy policy)
    -> RunState {
  auto def = WorkflowDefinition::create(std::move(spec));
  if (!def) {
    throw std::runtime_error(def.error().message());
  }
  auto state = RunState::create(RunId{"sched-run"}, *def, policy);
  if (!state || !state->mark_started(Clock::now())) {
    throw std::runtime_error("cannot start run state");
  }
  return std::move(*state);
}

auto idx(const RunState &state, std::string_view name) -> NodeIndex {
  return state.definition().graph().index_of(test::task_name(name));
}

auto attempt(RunState &state, std::string_view name) -> std::uint32_t {
  auto a = state.begin_attempt(idx(state, name));
  if (!a) {
    throw std::runtime_error("begin_attempt failed");
  }
  return *a;
}

} // namespace

TEST(BackoffTest, GrowsExponentiallyUpToCap) {
  RetryPolicy policy{.max_retries = 10,
                     .backoff_base = 100ms,
                     .backoff_cap = 1000ms,
                     .multiplier = 2.0,
                     .jitter = 0.0};
  EXPECT_EQ(scheduler::next_backoff(policy, 1, 0ms), 100ms);
  EXPECT_EQ(scheduler::next_backoff(policy, 2, 0ms), 200ms);
  EXPECT_EQ(scheduler::next_backoff(policy, 3, 0ms), 400ms);
  EXPECT_EQ(scheduler::next_backoff(policy, 5, 0ms), 1000ms);
  EXPECT_EQ(scheduler::next_backoff(policy, 30, 0ms), 1000ms);
}

TEST(BackoffTest, JitterStaysWithinBoundsAndNeverShrinks) {
  RetryPolicy policy{.max_retries = 10,
                     .backoff_base = 100ms,
                     .backoff_cap = 5000ms,
                     .multiplier = 2.0,
                     .jitter = 0.5};
  for (int round = 0; round < 200; ++round) {
    auto previous = 0ms;
    for (std::uint32_t n = 1; n <= 8; ++n) {
      auto delay = scheduler::next_backoff(policy, n, previous);
      EXPECT_GE(delay, previous);
      EXPECT_LE(delay, policy.backoff_cap);
      previous = delay;
    }
  }
  auto first = scheduler::next_backoff(policy, 1, 0ms);
  EXPECT_GE(first, 100ms);
  EXPECT_LE(first, 150ms);
}

TEST(SchedulerTest, RetryThenPermanentFailure) {
  auto spec = test::make_workflow("retry", {"a", "b"}, {{"a", "b"}});
  spec.tasks[0].retry.max_retries = 1;
  auto state = make_running_state(std::move(spec), FailurePolicy::FailSlow);
  auto a = idx(state, "a");

  auto first = scheduler::apply_outcome(state, a, attempt(state, "a"),
                                        TaskFailed{.error = "x"},
                                        Clock::now());
  ASSERT_TRUE(first);
  EXPECT_EQ(first->action, OutcomeAction::Retry);
  EXPECT_GT(first->retry_delay, 0ms);
  EXPECT_TRUE(scheduler::eligible(state).empty());
  EXPECT_FALSE(scheduler::settle(state, Clock::now()));

  ASSERT_TRUE(state.mark_retry_ready(a));
  auto second = scheduler::apply_outcome(state, a, attempt(state, "a"),
                                         TaskFailed{.error = "y",
                                                    .exit_code = 3},
                                         Clock::now());
  ASSERT_TRUE(second);
  EXPECT_EQ(second->action, OutcomeAction::PermanentFailure);
  EXPECT_EQ(state.task_state(idx(state, "b")), TaskState::UpstreamFailed);
  EXPECT_EQ(state.records().back().exit_code, 3);
  EXPECT_GE(state.records().back().backoff, first->retry_delay);

  auto settled = scheduler::settle(state, Clock::now());
  ASSERT_TRUE(settled);
  EXPECT_EQ(*settled, RunStatus::Failed);
  EXPECT_EQ(state.run().error, "1 task(s) failed");
}

TEST(SchedulerTest, TimeoutTakesRetryPath) {
  auto spec = test::make_workflow("timeouts", {"a"}, {});
  spec.tasks[0].retry.max_retries = 2;
  auto state = make_running_state(std::move(spec), FailurePolicy::FailSlow);

  auto decision = scheduler::apply_outcome(
      state, idx(state, "a"), attempt(state, "a"), TaskTimedOut{.after = 50ms},
      Clock::now());
  ASSERT_TRUE(decision);
  EXPECT_EQ(decision->action, OutcomeAction::Retry);

  const auto &record = state.records().front();
  EXPECT_EQ(record.status, AttemptStatus::TimedOut);
  EXPECT_EQ(record.exit_code, kExitCodeTimeout);
  EXPECT_EQ(record.error, "timed out after 50ms");
}

TEST(SchedulerTest, SuccessAdvancesAndSettlesSucceeded) {
  auto state =
      make_running_state(test::chain_spec(), FailurePolicy::FailSlow);
  for (auto name : {"a", "b", "c"}) {
    ASSERT_EQ(scheduler::eligible(state),
              std::vector<NodeIndex>{idx(state, name)});
    auto decision = scheduler::apply_outcome(
        state, idx(state, name), attempt(state, name),
        TaskSucceeded{.result = name}, Clock::now());
    ASSERT_TRUE(decision);
    EXPECT_EQ(decision->action, OutcomeAction::Advance);
  }
  auto settled = scheduler::settle(state, Clock::now());
  ASSERT_TRUE(settled);
  EXPECT_EQ(*settled, RunStatus::Succeeded);
  EXPECT_NE(state.run().finished_at, TimePoint{});
  EXPECT_FALSE(scheduler::settle(state, Clock::now()));
}

TEST(SchedulerTest, FailSlowWaitsForIndependentBranch) {
  auto state = make_running_state(test::diamond_spec(),
                                  FailurePolicy::FailSlow);
  ASSERT_TRUE(scheduler::apply_outcome(state, idx(state, "a"),
                                       attempt(state, "a"), TaskSucceeded{},
                                       Clock::now()));
  auto b = attempt(state, "b");
  auto c = attempt(state, "c");
  ASSERT_TRUE(scheduler::apply_outcome(state, idx(state, "b"), b,
                                       TaskFailed{.error = "boom"},
                                       Clock::now()));
  EXPECT_FALSE(scheduler::settle(state, Clock::now()));
  EXPECT_EQ(state.status(), RunStatus::Running);

  ASSERT_TRUE(scheduler::apply_outcome(state, idx(state, "c"), c,
                                       TaskSucceeded{}, Clock::now()));
  auto settled = scheduler::settle(state, Clock::now());
  ASSERT_TRUE(settled);
  EXPECT_EQ(*settled, RunStatus::Failed);
  EXPECT_EQ(state.task_state(idx(state, "d")), TaskState::UpstreamFailed);
}

TEST(SchedulerTest, FailFastStopsOnFirstPermanentFailure) {
  auto state = make_running_state(test::diamond_spec("ff"),
                                  FailurePolicy::FailFast);
  ASSERT_TRUE(scheduler::apply_outcome(state, idx(state, "a"),
                                       attempt(state, "a"), TaskSucceeded{},
                                       Clock::now()));
  auto b = attempt(state, "b");
  auto c = attempt(state, "c");
  ASSERT_TRUE(scheduler::apply_outcome(state, idx(state, "b"), b,
                                       TaskFailed{.error = "boom"},
                                       Clock::now()));
  auto settled = scheduler::settle(state, Clock::now());
  ASSERT_TRUE(settled);
  EXPECT_EQ(*settled, RunStatus::Failed);
  // c is still in flight, so completion time waits for it.
  EXPECT_EQ(state.run().finished_at, TimePoint{});
  EXPECT_TRUE(scheduler::eligible(state).empty());

  ASSERT_TRUE(scheduler::apply_outcome(state, idx(state, "c"), c,
                                       TaskSucceeded{}, Clock::now()));
  EXPECT_NE(state.run().finished_at, TimePoint{});
  EXPECT_EQ(state.status(), RunStatus::Failed);
}

TEST(SchedulerTest, CancelledRunHasNothingEligible) {
  auto state =
      make_running_state(test::chain_spec(), FailurePolicy::FailSlow);
  EXPECT_FALSE(scheduler::eligible(state).empty());
  ASSERT_TRUE(state.request_cancel(Clock::now()));
  EXPECT_TRUE(scheduler::eligible(state).empty());
  EXPECT_FALSE(scheduler::settle(state, Clock::now()));
  EXPECT_EQ(state.status(), RunStatus::Cancelled);
}
