#include "flowforge/engine/run_coordinator.hpp"

#include "flowforge/scheduler/scheduler.hpp"
#include "flowforge/util/log.hpp"

#include <boost/asio/post.hpp>

#include <ranges>

namespace flowforge {

namespace {

// Every task contributes at most one completion or discard and one retry
// wake-up at a time; the extra slot is for the cancel notification.
[[nodiscard]] auto event_capacity(const WorkflowDefinition &def)
    -> std::size_t {
  return def.size() * 2 + 1;
}

[[nodiscard]] auto find_record(const RunState &state, const TaskName &task,
                               std::uint32_t attempt)
    -> std::optional<TaskAttemptRecord> {
  for (const auto &record : state.records() | std::views::reverse) {
    if (record.attempt == attempt && record.task == task) {
      return record;
    }
  }
  return std::nullopt;
}

} // namespace

RunCoordinator::RunCoordinator(Runtime &runtime, GraphStore &graphs,
                               RunStateStore &runs, TaskExecutor &executor)
    : runtime_(runtime), graphs_(graphs), runs_(runs), executor_(executor) {}

RunCoordinator::~RunCoordinator() {
  std::scoped_lock lock(active_mu_);
  for (auto &[_, events] : active_) {
    events->close();
  }
}

auto RunCoordinator::set_callbacks(CoordinatorCallbacks callbacks) -> void {
  std::scoped_lock lock(callback_mu_);
  callbacks_ = std::move(callbacks);
}

auto RunCoordinator::emit_attempt(const TaskAttemptRecord &record) -> void {
  std::scoped_lock lock(callback_mu_);
  if (callbacks_.on_attempt) {
    callbacks_.on_attempt(record);
  }
}

auto RunCoordinator::emit_run_status(const RunId &run_id, RunStatus status)
    -> void {
  std::scoped_lock lock(callback_mu_);
  if (callbacks_.on_run_status) {
    callbacks_.on_run_status(run_id, status);
  }
}

auto RunCoordinator::start(const DefinitionId &definition, RunParams params,
                           StartOptions options) -> Result<RunId> {
  if (!runtime_.is_running()) {
    return fail(Error::SystemNotRunning);
  }
  auto def = graphs_.get(definition);
  if (!def) {
    return fail(def.error());
  }
  if (auto deprecated = graphs_.is_deprecated(definition);
      deprecated && *deprecated) {
    log::warn("refusing to start run of deprecated workflow {}", definition);
    return fail(Error::Deprecated);
  }

  const auto policy =
      options.failure_policy.value_or((*def)->failure_policy());
  auto run_id = generate_run_id();
  auto shared_params = std::make_shared<const RunParams>(params);
  auto state =
      RunState::create(run_id, *def, policy, std::move(params));
  if (!state) {
    return fail(state.error());
  }
  if (auto r = runs_.insert(std::move(*state)); !r) {
    return fail(r.error());
  }

  const auto shard = runtime_.owner_of(run_id);
  auto events = std::make_shared<EventChannel>(runtime_.executor_for(shard),
                                               event_capacity(**def));
  {
    std::scoped_lock lock(active_mu_);
    active_.insert_or_assign(run_id, events);
  }
  active_runs_.fetch_add(1, std::memory_order_acq_rel);

  log::info("run {} created for {} ({}, shard {})", run_id, definition,
            to_string_view(policy), shard);
  runtime_.spawn_owned(run_id, drive(DriveContext{
                                   .run_id = run_id,
                                   .definition = *def,
                                   .params = std::move(shared_params),
                                   .events = std::move(events)}));
  return run_id;
}

auto RunCoordinator::cancel(const RunId &run_id) -> Result<void> {
  auto cancelled = runs_.request_cancel(run_id, Clock::now());
  if (!cancelled) {
    log::debug("cancel of unknown run {} ignored", run_id);
    return ok();
  }
  if (!*cancelled) {
    return ok();
  }

  log::info("run {} cancelled", run_id);
  emit_run_status(run_id, RunStatus::Cancelled);

  std::scoped_lock lock(active_mu_);
  if (auto it = active_.find(run_id); it != active_.end()) {
    // A full channel already holds a wake-up for the drive loop.
    if (!it->second->try_send(boost::system::error_code{},
                              RunEvent{CancelRequested{}})) {
      log::debug("run {} cancel notification coalesced", run_id);
    }
  }
  return ok();
}

auto RunCoordinator::status(const RunId &run_id) const -> Result<RunSnapshot> {
  return runs_.snapshot(run_id);
}

auto RunCoordinator::list_runs() const -> std::vector<RunId> {
  return runs_.list();
}

auto RunCoordinator::purge(const RunId &run_id) -> Result<void> {
  if (auto r = runs_.purge(run_id); !r) {
    return r;
  }
  log::debug("run {} purged", run_id);
  return ok();
}

auto RunCoordinator::purge_finished_before(TimePoint cutoff) -> std::size_t {
  const auto purged = runs_.purge_finished_before(cutoff);
  if (purged > 0) {
    log::info("retention purged {} run(s)", purged);
  }
  return purged;
}

auto RunCoordinator::drive(DriveContext ctx) -> spawn_task {
  auto started = runs_.modify(ctx.run_id, [](RunState &state) {
    return state.mark_started(Clock::now());
  });
  if (started) {
    emit_run_status(ctx.run_id, RunStatus::Running);
  } else {
    log::debug("run {} not started: {}", ctx.run_id,
               started.error().message());
  }

  while (true) {
    dispatch_ready(ctx);
    settle(ctx);

    auto status = runs_.status(ctx.run_id);
    if (!status) {
      log::warn("run {} vanished while being driven", ctx.run_id);
      break;
    }
    if (is_terminal(*status) && ctx.in_flight == 0) {
      break;
    }
    if (ctx.in_flight == 0 && ctx.pending_retries == 0) {
      log::error("run {} stalled with nothing in flight", ctx.run_id);
      auto stalled = runs_.modify(ctx.run_id, [](RunState &state) {
        return state.finish(RunStatus::Failed, Clock::now(),
                            "no task can make progress");
      });
      if (stalled) {
        emit_run_status(ctx.run_id, RunStatus::Failed);
      }
      break;
    }

    auto [ec, event] = co_await ctx.events->async_receive(use_nothrow);
    if (ec) {
      log::debug("run {} event channel closed: {}", ctx.run_id, ec.message());
      break;
    }
    handle_event(ctx, std::move(event));
  }

  finish_drive(ctx);
}

auto RunCoordinator::dispatch_ready(DriveContext &ctx) -> void {
  auto eligible = runs_.modify(
      ctx.run_id, [](RunState &state) -> Result<std::vector<NodeIndex>> {
        return ok(scheduler::eligible(state));
      });
  if (!eligible) {
    return;
  }

  for (auto idx : *eligible) {
    auto attempt = runs_.begin_attempt(ctx.run_id, idx);
    if (!attempt) {
      if (attempt.error() == Error::Conflict) {
        log::debug("run {} cancelled before {} was dispatched", ctx.run_id,
                   ctx.definition->task(idx).name);
        break;
      }
      log::warn("run {} could not dispatch {}: {}", ctx.run_id,
                ctx.definition->task(idx).name, attempt.error().message());
      continue;
    }
    ++ctx.in_flight;
    log::debug("run {} dispatching {} attempt {}", ctx.run_id,
               ctx.definition->task(idx).name, *attempt);
    co_spawn(ctx.events->get_executor(),
             run_attempt(ctx.run_id, idx, *attempt, ctx.definition,
                         ctx.params, ctx.events),
             detached);
  }
}

auto RunCoordinator::run_attempt(
    RunId run_id, NodeIndex idx, std::uint32_t attempt,
    std::shared_ptr<const WorkflowDefinition> definition,
    std::shared_ptr<const RunParams> params,
    std::shared_ptr<EventChannel> events) -> spawn_task {
  const auto &spec = definition->task(idx);
  TaskContext context{.run_id = run_id,
                      .task = spec.name,
                      .attempt = attempt,
                      .params = std::move(params)};
  auto outcome = co_await executor_.execute(
      spec, std::move(context),
      [this, &run_id, idx, attempt]() -> Result<void> {
        return runs_.confirm_dispatch(run_id, idx, attempt, Clock::now());
      });

  RunEvent event{AttemptDiscarded{.idx = idx, .attempt = attempt}};
  if (outcome) {
    event = TaskCompleted{
        .idx = idx, .attempt = attempt, .outcome = std::move(*outcome)};
  } else {
    log::debug("run {} withdrew {} attempt {}: {}", run_id, spec.name,
               attempt, outcome.error().message());
  }
  auto [ec] = co_await events->async_send(boost::system::error_code{},
                                          std::move(event), use_nothrow);
  if (ec) {
    log::debug("run {} outcome of {} attempt {} dropped: {}", run_id,
               spec.name, attempt, ec.message());
  }
}

auto RunCoordinator::arm_retry(NodeIndex idx, std::chrono::milliseconds delay,
                               std::shared_ptr<EventChannel> events)
    -> spawn_task {
  if (auto slept = co_await async_sleep(delay); !slept) {
    log::debug("retry timer interrupted: {}", slept.error().message());
  }
  auto [ec] = co_await events->async_send(boost::system::error_code{},
                                          RunEvent{RetryReady{.idx = idx}},
                                          use_nothrow);
  if (ec) {
    log::trace("retry wake-up dropped: {}", ec.message());
  }
}

auto RunCoordinator::handle_event(DriveContext &ctx, RunEvent event) -> void {
  if (auto *completed = std::get_if<TaskCompleted>(&event)) {
    --ctx.in_flight;
    const auto &task_name = ctx.definition->task(completed->idx).name;
    std::optional<TaskAttemptRecord> record;
    auto decision = runs_.modify(
        ctx.run_id, [&](RunState &state) -> Result<OutcomeDecision> {
          auto d = scheduler::apply_outcome(state, completed->idx,
                                            completed->attempt,
                                            completed->outcome, Clock::now());
          if (d) {
            record = find_record(state, task_name, completed->attempt);
          }
          return d;
        });
    if (!decision) {
      log::warn("run {} could not record {} attempt {}: {}", ctx.run_id,
                task_name, completed->attempt, decision.error().message());
      return;
    }
    if (record) {
      emit_attempt(*record);
    }
    if (decision->action != OutcomeAction::Retry) {
      return;
    }
    auto status = runs_.status(ctx.run_id);
    if (!status || is_terminal(*status)) {
      return;
    }
    ++ctx.pending_retries;
    co_spawn(ctx.events->get_executor(),
             arm_retry(completed->idx, decision->retry_delay, ctx.events),
             detached);
    return;
  }

  if (auto *retry = std::get_if<RetryReady>(&event)) {
    --ctx.pending_retries;
    auto armed = runs_.modify(ctx.run_id, [&](RunState &state) {
      return state.mark_retry_ready(retry->idx);
    });
    if (!armed) {
      log::debug("run {} retry of {} not armed: {}", ctx.run_id,
                 ctx.definition->task(retry->idx).name,
                 armed.error().message());
    }
    return;
  }

  if (std::holds_alternative<AttemptDiscarded>(event)) {
    --ctx.in_flight;
    return;
  }

  // CancelRequested: the loop re-reads the run status.
}

auto RunCoordinator::settle(DriveContext &ctx) -> void {
  auto settled = runs_.modify(
      ctx.run_id, [](RunState &state) -> Result<std::optional<RunStatus>> {
        return ok(scheduler::settle(state, Clock::now()));
      });
  if (settled && *settled) {
    log::info("run {} {}", ctx.run_id, to_string_view(**settled));
    emit_run_status(ctx.run_id, **settled);
  }
}

auto RunCoordinator::finish_drive(DriveContext &ctx) -> void {
  auto stamped = runs_.modify(ctx.run_id, [](RunState &state) -> Result<void> {
    state.settle_finish_time(Clock::now());
    return ok();
  });
  if (!stamped) {
    log::debug("run {} gone before completion stamp", ctx.run_id);
  }
  {
    std::scoped_lock lock(active_mu_);
    active_.erase(ctx.run_id);
  }
  ctx.events->close();
  active_runs_.fetch_sub(1, std::memory_order_acq_rel);
  {
    std::scoped_lock lock(settled_mu_);
  }
  settled_cv_.notify_all();
  log::debug("run {} drive loop exited", ctx.run_id);
}

auto RunCoordinator::wait_settled(const RunId &run_id,
                                  std::chrono::milliseconds timeout)
    -> Result<RunSnapshot> {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  std::unique_lock lock(settled_mu_);
  while (true) {
    auto snapshot = runs_.snapshot(run_id);
    if (!snapshot) {
      return snapshot;
    }
    if (is_terminal(snapshot->run.status) &&
        snapshot->run.finished_at != TimePoint{}) {
      return snapshot;
    }
    if (settled_cv_.wait_until(lock, deadline) == std::cv_status::timeout) {
      auto last = runs_.snapshot(run_id);
      if (last && is_terminal(last->run.status) &&
          last->run.finished_at != TimePoint{}) {
        return last;
      }
      return fail(Error::TaskTimeout);
    }
  }
}

} // namespace flowforge
