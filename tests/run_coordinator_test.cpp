#include "flowforge/engine/engine.hpp"

#include "test_utils.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "gtest/gtest.h"

using namespace flowforge;
using namespace std::chrono_literals;

namespace {

using SteadyTime = std::chrono::steady_clock::time_point;

// One-shot barrier a work unit blocks on until the test opens it.
class Gate {
public:
  auto open() -> void {
    {
      std::scoped_lock lock(mu_);
      open_ = true;
    }
    cv_.notify_all();
  }
  auto wait(std::chrono::milliseconds limit = 5s) -> bool {
    std::unique_lock lock(mu_);
    return cv_.wait_for(lock, limit, [this] { return open_; });
  }

private:
  std::mutex mu_;
  std::condition_variable cv_;
  bool open_{false};
};

struct Span {
  SteadyTime begin;
  SteadyTime end;
};

// Records when each task ran, from inside the work units.
class Timeline {
public:
  auto unit(std::string name, std::chrono::milliseconds work = 0ms)
      -> WorkUnit {
    return [this, name = std::move(name), work](const TaskContext &) {
      auto begin = std::chrono::steady_clock::now();
      if (work > 0ms) {
        std::this_thread::sleep_for(work);
      }
      auto end = std::chrono::steady_clock::now();
      std::scoped_lock lock(mu_);
      spans_[name] = Span{begin, end};
      order_.push_back(name);
      return WorkResult{name};
    };
  }

  auto span(const std::string &name) -> Span {
    std::scoped_lock lock(mu_);
    return spans_.at(name);
  }
  auto order() -> std::vector<std::string> {
    std::scoped_lock lock(mu_);
    return order_;
  }

private:
  std::mutex mu_;
  std::map<std::string, Span> spans_;
  std::vector<std::string> order_;
};

auto make_config(std::size_t max_in_flight = 16) -> EngineConfig {
  EngineConfig cfg;
  cfg.engine.shards = 2;
  cfg.engine.max_in_flight = max_in_flight;
  cfg.engine.worker_threads = 8;
  return cfg;
}

auto name(std::string_view s) -> TaskName { return test::task_name(s); }

} // namespace

class RunCoordinatorTest : public ::testing::Test {
protected:
  void SetUp() override { start_engine(make_config()); }
  void TearDown() override { engine_.reset(); }

  auto start_engine(EngineConfig cfg) -> void {
    engine_ = std::make_unique<Engine>(std::move(cfg));
    ASSERT_TRUE(engine_->start());
  }

  auto unit(std::string unit_name, WorkUnit fn) -> void {
    engine_->registry().set(std::move(unit_name), std::move(fn));
  }

  auto launch(WorkflowSpec spec, RunParams params = {},
              StartOptions options = {}) -> RunId {
    auto id = engine_->register_workflow(std::move(spec));
    EXPECT_TRUE(id) << id.error().message();
    auto run = engine_->start_run(*id, std::move(params), options);
    EXPECT_TRUE(run) << run.error().message();
    return *run;
  }

  auto finish(const RunId &run_id) -> RunSnapshot {
    auto snap = engine_->wait(run_id, 10s);
    EXPECT_TRUE(snap) << snap.error().message();
    return *snap;
  }

  auto state_of(const RunId &run_id, std::string_view task) -> TaskState {
    auto snap = engine_->query(run_id);
    return snap ? snap->state_of(name(task)) : TaskState::Pending;
  }

  std::unique_ptr<Engine> engine_;
};

TEST_F(RunCoordinatorTest, ChainRunsInDependencyOrder) {
  Timeline timeline;
  for (auto task : {"a", "b", "c"}) {
    unit(task, timeline.unit(task));
  }

  auto run_id = launch(test::chain_spec());
  auto snap = finish(run_id);

  EXPECT_EQ(snap.run.status, RunStatus::Succeeded);
  EXPECT_EQ(timeline.order(), (std::vector<std::string>{"a", "b", "c"}));
  ASSERT_EQ(snap.attempts.size(), 3u);
  for (const auto &record : snap.attempts) {
    EXPECT_EQ(record.status, AttemptStatus::Succeeded);
    EXPECT_EQ(record.attempt, 1u);
    EXPECT_EQ(record.result, record.task.str());
  }
  EXPECT_NE(snap.run.started_at, TimePoint{});
  EXPECT_GE(snap.run.finished_at, snap.run.started_at);
}

TEST_F(RunCoordinatorTest, DiamondBranchesOverlap) {
  Timeline timeline;
  unit("a", timeline.unit("a"));
  unit("b", timeline.unit("b", 150ms));
  unit("c", timeline.unit("c", 150ms));
  unit("d", timeline.unit("d"));

  auto snap = finish(launch(test::diamond_spec()));
  ASSERT_EQ(snap.run.status, RunStatus::Succeeded);

  auto a = timeline.span("a");
  auto b = timeline.span("b");
  auto c = timeline.span("c");
  auto d = timeline.span("d");
  EXPECT_GE(b.begin, a.end);
  EXPECT_GE(c.begin, a.end);
  EXPECT_LT(b.begin, c.end);
  EXPECT_LT(c.begin, b.end);
  EXPECT_GE(d.begin, std::max(b.end, c.end));
}

TEST_F(RunCoordinatorTest, RetriesUntilSuccessWithGrowingBackoff) {
  std::atomic<int> calls{0};
  unit("flaky", [&](const TaskContext &ctx) -> WorkResult {
    if (calls.fetch_add(1) < 2) {
      return std::unexpected(std::format("attempt {} failed", ctx.attempt));
    }
    return "recovered";
  });

  auto spec = WorkflowSpec::builder("flaky").build();
  spec.tasks.push_back(test::callable_task("flaky", "flaky", 3));
  auto snap = finish(launch(std::move(spec)));

  EXPECT_EQ(snap.run.status, RunStatus::Succeeded);
  auto records = snap.attempts_for(name("flaky"));
  ASSERT_EQ(records.size(), 3u);
  EXPECT_EQ(records[0].status, AttemptStatus::Failed);
  EXPECT_EQ(records[0].error, "attempt 1 failed");
  EXPECT_EQ(records[1].status, AttemptStatus::Failed);
  EXPECT_EQ(records[2].status, AttemptStatus::Succeeded);
  EXPECT_EQ(records[2].result, "recovered");

  EXPECT_EQ(records[0].backoff, 0ms);
  EXPECT_GT(records[1].backoff, 0ms);
  EXPECT_GE(records[2].backoff, records[1].backoff);
  for (std::size_t i = 1; i < records.size(); ++i) {
    EXPECT_EQ(records[i].attempt, i + 1);
    EXPECT_GE(records[i].started_at, records[i - 1].finished_at);
  }
}

TEST_F(RunCoordinatorTest, TimedOutAttemptsAreRetriedThenFail) {
  unit("hang", [](const TaskContext &ctx) -> WorkResult {
    while (!ctx.stop.stop_requested()) {
      std::this_thread::sleep_for(2ms);
    }
    return "interrupted";
  });
  auto spec = WorkflowSpec::builder("hangs").build();
  spec.tasks.push_back(test::callable_task("hang", "hang", 1, 50ms));

  auto snap = finish(launch(std::move(spec)));
  EXPECT_EQ(snap.run.status, RunStatus::Failed);
  ASSERT_EQ(snap.attempts.size(), 2u);
  for (const auto &record : snap.attempts) {
    EXPECT_EQ(record.status, AttemptStatus::TimedOut);
    EXPECT_EQ(record.exit_code, kExitCodeTimeout);
  }
  EXPECT_EQ(snap.state_of(name("hang")), TaskState::Failed);
}

TEST_F(RunCoordinatorTest, FailSlowWaitsForIndependentBranch) {
  Gate gate;
  std::atomic<bool> d_ran{false};
  unit("a", [](const TaskContext &) -> WorkResult { return "a"; });
  unit("b", [](const TaskContext &) -> WorkResult {
    return std::unexpected(std::string{"b broke"});
  });
  unit("c", [&](const TaskContext &) -> WorkResult {
    gate.wait();
    return "c";
  });
  unit("d", [&](const TaskContext &) -> WorkResult {
    d_ran.store(true);
    return "d";
  });

  auto run_id = launch(test::diamond_spec("fail_slow"));
  ASSERT_TRUE(test::poll_until(
      [&] { return state_of(run_id, "b") == TaskState::Failed; }, 5s));
  EXPECT_EQ(engine_->query(run_id)->run.status, RunStatus::Running);
  EXPECT_EQ(state_of(run_id, "c"), TaskState::Running);

  gate.open();
  auto snap = finish(run_id);
  EXPECT_EQ(snap.run.status, RunStatus::Failed);
  EXPECT_EQ(snap.run.error, "1 task(s) failed");
  EXPECT_EQ(snap.state_of(name("c")), TaskState::Succeeded);
  EXPECT_EQ(snap.state_of(name("d")), TaskState::UpstreamFailed);
  EXPECT_TRUE(snap.attempts_for(name("d")).empty());
  EXPECT_FALSE(d_ran.load());
  EXPECT_GE(snap.run.finished_at,
            snap.attempts_for(name("c")).front().finished_at);
}

TEST_F(RunCoordinatorTest, FailFastFailsRunWhileBranchInFlight) {
  Gate gate;
  unit("a", [](const TaskContext &) -> WorkResult { return "a"; });
  unit("b", [](const TaskContext &) -> WorkResult {
    return std::unexpected(std::string{"b broke"});
  });
  unit("c", [&](const TaskContext &) -> WorkResult {
    gate.wait();
    return "c";
  });
  unit("d", [](const TaskContext &) -> WorkResult { return "d"; });

  auto run_id = launch(test::diamond_spec("fail_fast", FailurePolicy::FailFast));
  ASSERT_TRUE(test::poll_until(
      [&] {
        auto snap = engine_->query(run_id);
        return snap && snap->run.status == RunStatus::Failed;
      },
      5s));
  EXPECT_EQ(state_of(run_id, "c"), TaskState::Running);

  gate.open();
  auto snap = finish(run_id);
  EXPECT_EQ(snap.run.status, RunStatus::Failed);
  // The in-flight attempt still reports back.
  auto c = snap.attempts_for(name("c"));
  ASSERT_EQ(c.size(), 1u);
  EXPECT_EQ(c.front().status, AttemptStatus::Succeeded);
  EXPECT_TRUE(snap.attempts_for(name("d")).empty());
}

TEST_F(RunCoordinatorTest, FailurePolicyOverridePerRun) {
  Gate gate;
  unit("a", [](const TaskContext &) -> WorkResult { return "a"; });
  unit("b", [](const TaskContext &) -> WorkResult {
    return std::unexpected(std::string{"no"});
  });
  unit("c", [&](const TaskContext &) -> WorkResult {
    gate.wait();
    return "c";
  });
  unit("d", [](const TaskContext &) -> WorkResult { return "d"; });

  auto run_id =
      launch(test::diamond_spec("override"), {},
             StartOptions{.failure_policy = FailurePolicy::FailFast});
  EXPECT_TRUE(test::poll_until(
      [&] {
        auto snap = engine_->query(run_id);
        return snap && snap->run.status == RunStatus::Failed;
      },
      5s));
  gate.open();
  EXPECT_EQ(finish(run_id).run.failure_policy, FailurePolicy::FailFast);
}

TEST_F(RunCoordinatorTest, CancelRecordsInFlightOutcomeAndStopsDispatch) {
  Gate gate;
  std::atomic<bool> a_started{false};
  std::atomic<int> later_calls{0};
  unit("a", [&](const TaskContext &) -> WorkResult {
    a_started.store(true);
    gate.wait();
    return "a";
  });
  for (auto task : {"b", "c"}) {
    unit(task, [&](const TaskContext &) -> WorkResult {
      later_calls.fetch_add(1);
      return "late";
    });
  }

  auto run_id = launch(test::chain_spec("cancel_me"));
  ASSERT_TRUE(test::poll_until([&] { return a_started.load(); }, 5s));

  ASSERT_TRUE(engine_->cancel(run_id));
  auto during = engine_->query(run_id);
  ASSERT_TRUE(during);
  EXPECT_EQ(during->run.status, RunStatus::Cancelled);
  EXPECT_TRUE(during->run.cancel_requested);
  EXPECT_EQ(during->run.finished_at, TimePoint{});

  gate.open();
  auto snap = finish(run_id);
  EXPECT_EQ(snap.run.status, RunStatus::Cancelled);
  auto a = snap.attempts_for(name("a"));
  ASSERT_EQ(a.size(), 1u);
  EXPECT_EQ(a.front().status, AttemptStatus::Succeeded);
  EXPECT_TRUE(snap.attempts_for(name("b")).empty());
  EXPECT_TRUE(snap.attempts_for(name("c")).empty());
  EXPECT_EQ(snap.state_of(name("b")), TaskState::Pending);
  EXPECT_EQ(later_calls.load(), 0);
  EXPECT_NE(snap.run.finished_at, TimePoint{});

  // Idempotent once terminal.
  EXPECT_TRUE(engine_->cancel(run_id));
  EXPECT_EQ(engine_->query(run_id)->run.status, RunStatus::Cancelled);
}

TEST_F(RunCoordinatorTest, WaitTimesOutThenWakesOnSettle) {
  Gate gate;
  unit("a", [&](const TaskContext &) -> WorkResult {
    gate.wait();
    return "a";
  });
  unit("b", [](const TaskContext &) -> WorkResult { return "b"; });
  unit("c", [](const TaskContext &) -> WorkResult { return "c"; });

  auto run_id = launch(test::chain_spec("waited"));
  auto early = engine_->wait(run_id, 50ms);
  ASSERT_FALSE(early);
  EXPECT_EQ(early.error(), Error::TaskTimeout);

  std::jthread opener([&] {
    std::this_thread::sleep_for(50ms);
    gate.open();
  });
  auto settled = engine_->wait(run_id, 5s);
  ASSERT_TRUE(settled) << settled.error().message();
  EXPECT_EQ(settled->run.status, RunStatus::Succeeded);
  EXPECT_NE(settled->run.finished_at, TimePoint{});

  auto unknown = engine_->wait(RunId{"no-such-run"}, 10ms);
  ASSERT_FALSE(unknown);
  EXPECT_EQ(unknown.error(), Error::NotFound);
}

TEST_F(RunCoordinatorTest, CancelUnknownRunIsNoOp) {
  EXPECT_TRUE(engine_->cancel(RunId{"no-such-run"}));
}

TEST_F(RunCoordinatorTest, StartRejectsDeprecatedAndUnknownDefinitions) {
  auto id = engine_->register_workflow(test::chain_spec("old"));
  ASSERT_TRUE(id);
  ASSERT_TRUE(engine_->deprecate(*id));

  auto deprecated = engine_->start_run(*id);
  ASSERT_FALSE(deprecated);
  EXPECT_EQ(deprecated.error(), Error::Deprecated);

  auto unknown = engine_->start_run(DefinitionId{WorkflowName{"ghost"}, 1});
  ASSERT_FALSE(unknown);
  EXPECT_EQ(unknown.error(), Error::NotFound);
  EXPECT_TRUE(engine_->list_runs().empty());
}

TEST_F(RunCoordinatorTest, StartRequiresRunningEngine) {
  Engine idle(make_config());
  auto id = idle.register_workflow(test::chain_spec());
  ASSERT_TRUE(id);
  auto run = idle.start_run(*id);
  ASSERT_FALSE(run);
  EXPECT_EQ(run.error(), Error::SystemNotRunning);
}

TEST_F(RunCoordinatorTest, ParamsReachEveryTask) {
  std::mutex mu;
  std::vector<std::string> seen;
  for (auto task : {"a", "b", "c"}) {
    unit(task, [&](const TaskContext &ctx) -> WorkResult {
      std::scoped_lock lock(mu);
      seen.emplace_back(ctx.param("date").value_or("missing"));
      return "ok";
    });
  }
  auto snap = finish(launch(test::chain_spec(), {{"date", "2024-06-01"}}));
  EXPECT_EQ(snap.run.status, RunStatus::Succeeded);
  EXPECT_EQ(snap.run.params.at("date"), "2024-06-01");
  EXPECT_EQ(seen, (std::vector<std::string>(3, "2024-06-01")));
}

TEST_F(RunCoordinatorTest, BranchSkipsUnselectedPath) {
  unit("pick", [](const TaskContext &) -> WorkResult { return "left"; });
  std::atomic<bool> right_ran{false};
  unit("left", [](const TaskContext &) -> WorkResult { return "l"; });
  unit("right", [&](const TaskContext &) -> WorkResult {
    right_ran.store(true);
    return "r";
  });

  auto spec = WorkflowSpec::builder("branching").build();
  auto pick = test::callable_task("pick", "pick");
  pick.branch = true;
  spec.tasks.push_back(std::move(pick));
  spec.tasks.push_back(test::callable_task("left", "left"));
  spec.tasks.push_back(test::callable_task("right", "right"));
  spec.edges.push_back({name("pick"), name("left"), "left"});
  spec.edges.push_back({name("pick"), name("right"), "right"});

  auto snap = finish(launch(std::move(spec)));
  EXPECT_EQ(snap.run.status, RunStatus::Succeeded);
  EXPECT_EQ(snap.state_of(name("right")), TaskState::Skipped);
  EXPECT_FALSE(right_ran.load());
}

TEST_F(RunCoordinatorTest, BranchArmsRejoinAtCommonTask) {
  unit("check", [](const TaskContext &) -> WorkResult { return "Yes"; });
  std::atomic<int> end_calls{0};
  unit("yes", [](const TaskContext &) -> WorkResult { return "y"; });
  unit("no", [](const TaskContext &) -> WorkResult { return "n"; });
  unit("end", [&](const TaskContext &) -> WorkResult {
    end_calls.fetch_add(1);
    return "done";
  });

  auto spec = WorkflowSpec::builder("rejoin").build();
  auto check = test::callable_task("check", "check");
  check.branch = true;
  spec.tasks.push_back(std::move(check));
  spec.tasks.push_back(test::callable_task("yes", "yes"));
  spec.tasks.push_back(test::callable_task("no", "no"));
  spec.tasks.push_back(test::callable_task("end", "end"));
  spec.edges.push_back({name("check"), name("yes"), "Yes"});
  spec.edges.push_back({name("check"), name("no"), "No"});
  spec.edges.push_back({name("yes"), name("end"), ""});
  spec.edges.push_back({name("no"), name("end"), ""});

  auto snap = finish(launch(std::move(spec)));
  EXPECT_EQ(snap.run.status, RunStatus::Succeeded);
  EXPECT_EQ(snap.state_of(name("no")), TaskState::Skipped);
  EXPECT_EQ(snap.state_of(name("end")), TaskState::Succeeded);
  EXPECT_EQ(end_calls.load(), 1);
}

TEST_F(RunCoordinatorTest, CallbacksSeeEveryAttemptAndTransition) {
  std::mutex mu;
  std::vector<std::string> attempts;
  std::vector<RunStatus> statuses;
  engine_->coordinator().set_callbacks(CoordinatorCallbacks{
      .on_attempt =
          [&](const TaskAttemptRecord &record) {
            std::scoped_lock lock(mu);
            attempts.push_back(std::format("{}#{}:{}", record.task,
                                           record.attempt,
                                           to_string_view(record.status)));
          },
      .on_run_status =
          [&](const RunId &, RunStatus status) {
            std::scoped_lock lock(mu);
            statuses.push_back(status);
          }});
  for (auto task : {"a", "b", "c"}) {
    unit(task, [](const TaskContext &) -> WorkResult { return "ok"; });
  }

  finish(launch(test::chain_spec()));
  std::scoped_lock lock(mu);
  EXPECT_EQ(attempts, (std::vector<std::string>{
                          "a#1:succeeded", "b#1:succeeded", "c#1:succeeded"}));
  EXPECT_EQ(statuses,
            (std::vector<RunStatus>{RunStatus::Running, RunStatus::Succeeded}));
}

TEST_F(RunCoordinatorTest, PurgeOnlyFinishedRuns) {
  Gate gate;
  unit("a", [&](const TaskContext &) -> WorkResult {
    gate.wait();
    return "a";
  });
  unit("b", [](const TaskContext &) -> WorkResult { return "b"; });
  unit("c", [](const TaskContext &) -> WorkResult { return "c"; });

  auto run_id = launch(test::chain_spec());
  auto busy = engine_->purge(run_id);
  ASSERT_FALSE(busy);
  EXPECT_EQ(busy.error(), Error::InvalidState);

  gate.open();
  finish(run_id);
  ASSERT_TRUE(test::poll_until(
      [&] { return engine_->coordinator().active_runs() == 0; }, 2s));
  ASSERT_TRUE(engine_->purge(run_id));
  auto gone = engine_->query(run_id);
  ASSERT_FALSE(gone);
  EXPECT_EQ(gone.error(), Error::NotFound);
}

TEST_F(RunCoordinatorTest, ManyConcurrentRunsAreIndependent) {
  for (auto task : {"a", "b", "c", "d"}) {
    unit(task, [](const TaskContext &ctx) -> WorkResult {
      std::this_thread::sleep_for(2ms);
      return std::format("{}@{}", ctx.task, ctx.run_id);
    });
  }
  auto id = engine_->register_workflow(test::diamond_spec("fanout"));
  ASSERT_TRUE(id);

  std::vector<RunId> runs;
  for (int i = 0; i < 20; ++i) {
    auto run = engine_->start_run(*id);
    ASSERT_TRUE(run);
    runs.push_back(*run);
  }
  for (const auto &run_id : runs) {
    auto snap = finish(run_id);
    EXPECT_EQ(snap.run.status, RunStatus::Succeeded);
    ASSERT_EQ(snap.attempts.size(), 4u);
    for (const auto &record : snap.attempts) {
      EXPECT_EQ(record.run_id, run_id);
      EXPECT_EQ(record.result, std::format("{}@{}", record.task, run_id));
    }
  }
  EXPECT_EQ(engine_->list_runs().size(), runs.size());
}

class WorkerCapTest : public RunCoordinatorTest {
protected:
  void SetUp() override { start_engine(make_config(2)); }
};

TEST_F(WorkerCapTest, NeverExceedsMaxInFlight) {
  std::atomic<int> running{0};
  std::atomic<int> max_running{0};
  auto busy = [&](const TaskContext &) -> WorkResult {
    auto now = running.fetch_add(1) + 1;
    auto seen = max_running.load();
    while (now > seen && !max_running.compare_exchange_weak(seen, now)) {
    }
    std::this_thread::sleep_for(30ms);
    running.fetch_sub(1);
    return "done";
  };
  unit("busy", busy);

  auto spec = WorkflowSpec::builder("wide").build();
  for (int i = 0; i < 6; ++i) {
    spec.tasks.push_back(test::callable_task(std::format("t{}", i), "busy"));
  }
  auto first = launch(spec);
  spec.name = WorkflowName{"wide2"};
  auto second = launch(std::move(spec));

  EXPECT_EQ(finish(first).run.status, RunStatus::Succeeded);
  EXPECT_EQ(finish(second).run.status, RunStatus::Succeeded);
  EXPECT_LE(max_running.load(), 2);
  EXPECT_LE(engine_->worker_pool().peak_in_flight(), 2u);
  EXPECT_EQ(engine_->worker_pool().capacity(), 2u);
}

class SingleSlotTest : public RunCoordinatorTest {
protected:
  void SetUp() override { start_engine(make_config(1)); }
};

TEST_F(SingleSlotTest, CancelledRunWaitingForSlotNeverExecutes) {
  Gate gate;
  std::atomic<bool> holding{false};
  std::atomic<int> waiter_calls{0};
  unit("hold", [&](const TaskContext &) -> WorkResult {
    holding.store(true);
    gate.wait();
    return "held";
  });
  unit("waiter", [&](const TaskContext &) -> WorkResult {
    waiter_calls.fetch_add(1);
    return "ran";
  });

  auto holder = launch(test::make_workflow("holder", {"hold"}, {}));
  ASSERT_TRUE(test::poll_until([&] { return holding.load(); }, 5s));

  auto blocked = launch(test::make_workflow("blocked", {"waiter"}, {}));
  // The root is claimed and parked on the worker pool.
  ASSERT_TRUE(test::poll_until(
      [&] {
        auto snap = engine_->query(blocked);
        return snap && snap->attempts.size() == 1 &&
               snap->attempts.front().status == AttemptStatus::Pending;
      },
      5s));
  EXPECT_EQ(engine_->query(blocked)->attempts.front().started_at,
            TimePoint{});

  ASSERT_TRUE(engine_->cancel(blocked));
  gate.open();

  EXPECT_EQ(finish(holder).run.status, RunStatus::Succeeded);
  auto snap = finish(blocked);
  EXPECT_EQ(snap.run.status, RunStatus::Cancelled);
  EXPECT_TRUE(snap.attempts.empty());
  EXPECT_EQ(snap.state_of(name("waiter")), TaskState::Pending);
  EXPECT_NE(snap.run.finished_at, TimePoint{});
  EXPECT_EQ(waiter_calls.load(), 0);
}

class RetentionTest : public RunCoordinatorTest {
protected:
  void SetUp() override {
    auto cfg = make_config();
    cfg.retention.run_ttl = 1s;
    cfg.retention.purge_interval = 1s;
    start_engine(std::move(cfg));
  }
};

TEST_F(RetentionTest, ReaperPurgesExpiredRuns) {
  for (auto task : {"a", "b", "c"}) {
    unit(task, [](const TaskContext &) -> WorkResult { return "ok"; });
  }
  auto run_id = launch(test::chain_spec("short_lived"));
  EXPECT_EQ(finish(run_id).run.status, RunStatus::Succeeded);

  EXPECT_TRUE(test::poll_until(
      [&] {
        auto snap = engine_->query(run_id);
        return !snap && snap.error() == Error::NotFound;
      },
      6s, 50ms));
}
