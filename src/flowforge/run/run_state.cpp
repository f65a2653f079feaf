#include "flowforge/run/run_state.hpp"

#include <boost/dynamic_bitset.hpp>

#include <ranges>

namespace flowforge {

struct RunState::Impl {
  Impl(WorkflowRun run, std::shared_ptr<const WorkflowDefinition> definition)
      : run_(std::move(run)), def_(std::move(definition)) {
    const auto n = def_->size();
    in_degree_.resize(n, 0);
    success_dep_count_.resize(n, 0);
    blocked_dep_count_.resize(n, 0);
    skipped_dep_count_.resize(n, 0);
    states_.resize(n, TaskState::Pending);
    attempts_.resize(n, 0);
    backoff_.resize(n, std::chrono::milliseconds{0});
    latest_record_.resize(n, kNoRecord);
    ready_mask_.resize(n);
    running_mask_.resize(n);
    retrying_mask_.resize(n);

    const auto &graph = def_->graph();
    for (auto i : std::views::iota(std::size_t{0}, n)) {
      auto idx = static_cast<NodeIndex>(i);
      in_degree_[i] = static_cast<int>(graph.deps(idx).size());
      if (in_degree_[i] == 0) {
        set_ready(idx);
      }
    }
  }

  static constexpr std::size_t kNoRecord = SIZE_MAX;

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return states_.size();
  }

  [[nodiscard]] auto in_range(NodeIndex idx) const noexcept -> bool {
    return static_cast<std::size_t>(idx) < states_.size();
  }

  auto set_ready(NodeIndex idx) -> void {
    states_[idx] = TaskState::Ready;
    ready_mask_.set(idx);
  }

  enum class Terminal { Succeeded, Blocked, Skipped };

  // Feeds a terminal task into its dependents' counters and resolves every
  // dependent whose fate is now known. Iterative so long chains of
  // UpstreamFailed or Skipped propagation cannot exhaust the stack.
  auto propagate(NodeIndex origin, Terminal kind,
                 std::string_view branch_result = {}) -> void {
    struct Item {
      NodeIndex node;
      Terminal kind;
    };
    std::vector<Item> work{{origin, kind}};
    const auto &graph = def_->graph();
    const bool is_branch = def_->task(origin).branch;

    while (!work.empty()) {
      auto [node, node_kind] = work.back();
      work.pop_back();

      for (NodeIndex dep : graph.dependents(node)) {
        auto edge_kind = node_kind;
        if (node == origin && is_branch && node_kind == Terminal::Succeeded &&
            !graph.edge_taken(node, dep, branch_result)) {
          edge_kind = Terminal::Skipped;
        }
        switch (edge_kind) {
        case Terminal::Succeeded:
          ++success_dep_count_[dep];
          break;
        case Terminal::Blocked:
          ++blocked_dep_count_[dep];
          break;
        case Terminal::Skipped:
          ++skipped_dep_count_[dep];
          break;
        }

        if (states_[dep] != TaskState::Pending) {
          continue;
        }
        if (blocked_dep_count_[dep] > 0) {
          states_[dep] = TaskState::UpstreamFailed;
          ++upstream_failed_count_;
          work.push_back({dep, Terminal::Blocked});
          continue;
        }
        if (skipped_dep_count_[dep] + success_dep_count_[dep] !=
            in_degree_[dep]) {
          continue;
        }
        // A join runs when at least one incoming path was taken.
        if (success_dep_count_[dep] == 0) {
          states_[dep] = TaskState::Skipped;
          ++skipped_count_;
          work.push_back({dep, Terminal::Skipped});
        } else if (!run_.cancel_requested) {
          set_ready(dep);
        }
      }
    }
  }

  [[nodiscard]] auto check_in_flight(NodeIndex idx, std::uint32_t attempt) const
      -> Result<void> {
    if (!in_range(idx)) {
      return fail(Error::NotFound);
    }
    if (!running_mask_.test(idx) || attempts_[idx] != attempt) {
      return fail(Error::InvalidState);
    }
    return ok();
  }

  // Withdraws a claimed attempt that never started: the record, the attempt
  // number and the in-flight bit are rolled back.
  auto discard_attempt(NodeIndex idx, TimePoint now) -> void {
    const auto pos = latest_record_[idx];
    records_.erase(records_.begin() + static_cast<std::ptrdiff_t>(pos));
    for (auto &latest : latest_record_) {
      if (latest != kNoRecord && latest > pos) {
        --latest;
      }
    }
    latest_record_[idx] = kNoRecord;
    const auto &name = def_->task(idx).name;
    for (auto i = pos; i-- > 0;) {
      if (records_[i].task == name) {
        latest_record_[idx] = i;
        break;
      }
    }
    --attempts_[idx];
    running_mask_.reset(idx);
    states_[idx] = TaskState::Pending;
    if (is_terminal(run_.status) && running_mask_.none() &&
        run_.finished_at == TimePoint{}) {
      run_.finished_at = now;
    }
  }

  auto close_record(NodeIndex idx, AttemptStatus status, TimePoint now)
      -> TaskAttemptRecord & {
    auto &record = records_[latest_record_[idx]];
    record.status = status;
    record.finished_at = now;
    running_mask_.reset(idx);
    if (is_terminal(run_.status) && running_mask_.none() &&
        run_.finished_at == TimePoint{}) {
      run_.finished_at = now;
    }
    return record;
  }

  WorkflowRun run_;
  std::shared_ptr<const WorkflowDefinition> def_;

  std::vector<int> in_degree_;
  std::vector<int> success_dep_count_;
  // Dependencies that failed permanently or were themselves blocked.
  std::vector<int> blocked_dep_count_;
  // Dependencies skipped by a branch decision.
  std::vector<int> skipped_dep_count_;

  std::vector<TaskState> states_;
  std::vector<std::uint32_t> attempts_;
  // Delay before the next attempt; also the floor for the one after it.
  std::vector<std::chrono::milliseconds> backoff_;
  std::vector<std::size_t> latest_record_;

  boost::dynamic_bitset<> ready_mask_;
  boost::dynamic_bitset<> running_mask_;
  boost::dynamic_bitset<> retrying_mask_;

  std::size_t succeeded_count_{0};
  std::size_t failed_count_{0};
  std::size_t upstream_failed_count_{0};
  std::size_t skipped_count_{0};

  std::vector<TaskAttemptRecord> records_;
};

RunState::RunState(PrivateTag, WorkflowRun run,
                   std::shared_ptr<const WorkflowDefinition> definition)
    : impl_(std::make_unique<Impl>(std::move(run), std::move(definition))) {}

RunState::~RunState() = default;
RunState::RunState(RunState &&) noexcept = default;
auto RunState::operator=(RunState &&) noexcept -> RunState & = default;

auto RunState::create(RunId run_id,
                      std::shared_ptr<const WorkflowDefinition> definition,
                      FailurePolicy policy, RunParams params)
    -> Result<RunState> {
  if (!definition || !run_id.valid()) {
    return fail(Error::InvalidArgument);
  }
  WorkflowRun run{.id = std::move(run_id),
                  .definition = definition->id(),
                  .status = RunStatus::Pending,
                  .failure_policy = policy,
                  .params = std::move(params),
                  .created_at = Clock::now()};
  return RunState(PrivateTag{}, std::move(run), std::move(definition));
}

auto RunState::id() const noexcept -> const RunId & { return impl_->run_.id; }

auto RunState::run() const noexcept -> const WorkflowRun & {
  return impl_->run_;
}

auto RunState::status() const noexcept -> RunStatus {
  return impl_->run_.status;
}

auto RunState::definition() const noexcept -> const WorkflowDefinition & {
  return *impl_->def_;
}

auto RunState::definition_ptr() const noexcept
    -> const std::shared_ptr<const WorkflowDefinition> & {
  return impl_->def_;
}

auto RunState::mark_started(TimePoint now) -> Result<void> {
  if (impl_->run_.status != RunStatus::Pending) {
    return fail(Error::InvalidState);
  }
  impl_->run_.status = RunStatus::Running;
  impl_->run_.started_at = now;
  return ok();
}

auto RunState::finish(RunStatus status, TimePoint now, std::string error)
    -> Result<void> {
  if (!is_terminal(status) || is_terminal(impl_->run_.status)) {
    return fail(Error::InvalidState);
  }
  impl_->run_.status = status;
  impl_->run_.error = std::move(error);
  if (impl_->running_mask_.none()) {
    impl_->run_.finished_at = now;
  }
  return ok();
}

auto RunState::request_cancel(TimePoint now) -> bool {
  auto &run = impl_->run_;
  if (run.cancel_requested || is_terminal(run.status)) {
    return false;
  }
  run.cancel_requested = true;
  run.status = RunStatus::Cancelled;
  if (impl_->running_mask_.none()) {
    run.finished_at = now;
  }
  return true;
}

auto RunState::cancel_requested() const noexcept -> bool {
  return impl_->run_.cancel_requested;
}

auto RunState::settle_finish_time(TimePoint now) -> void {
  auto &run = impl_->run_;
  if (is_terminal(run.status) && impl_->running_mask_.none() &&
      run.finished_at == TimePoint{}) {
    run.finished_at = now;
  }
}

auto RunState::ready_tasks() const -> std::vector<NodeIndex> {
  std::vector<NodeIndex> out;
  out.reserve(impl_->ready_mask_.count());
  for (auto i = impl_->ready_mask_.find_first();
       i != boost::dynamic_bitset<>::npos; i = impl_->ready_mask_.find_next(i)) {
    out.push_back(static_cast<NodeIndex>(i));
  }
  return out;
}

auto RunState::begin_attempt(NodeIndex idx) -> Result<std::uint32_t> {
  if (!impl_->in_range(idx)) {
    return fail(Error::NotFound);
  }
  if (impl_->run_.cancel_requested) {
    return fail(Error::Conflict);
  }
  if (is_terminal(impl_->run_.status)) {
    return fail(Error::InvalidState);
  }
  if (!impl_->ready_mask_.test(idx)) {
    return fail(Error::InvalidState);
  }

  impl_->ready_mask_.reset(idx);
  impl_->running_mask_.set(idx);
  impl_->states_[idx] = TaskState::Running;
  const auto attempt = ++impl_->attempts_[idx];

  impl_->latest_record_[idx] = impl_->records_.size();
  impl_->records_.push_back(TaskAttemptRecord{
      .run_id = impl_->run_.id,
      .task = impl_->def_->task(idx).name,
      .attempt = attempt,
      .status = AttemptStatus::Pending,
      .backoff = attempt > 1 ? impl_->backoff_[idx]
                             : std::chrono::milliseconds{0},
  });
  return ok(attempt);
}

auto RunState::confirm_dispatch(NodeIndex idx, std::uint32_t attempt,
                                TimePoint now) -> Result<void> {
  if (auto r = impl_->check_in_flight(idx, attempt); !r) {
    return r;
  }
  auto &record = impl_->records_[impl_->latest_record_[idx]];
  if (record.status != AttemptStatus::Pending) {
    return fail(Error::InvalidState);
  }
  if (impl_->run_.cancel_requested) {
    impl_->discard_attempt(idx, now);
    return fail(Error::Conflict);
  }
  record.status = AttemptStatus::Running;
  record.started_at = now;
  return ok();
}

auto RunState::record_success(NodeIndex idx, std::uint32_t attempt,
                              std::string result, TimePoint now)
    -> Result<void> {
  if (auto r = impl_->check_in_flight(idx, attempt); !r) {
    return r;
  }
  auto &record = impl_->close_record(idx, AttemptStatus::Succeeded, now);
  record.result = std::move(result);

  impl_->states_[idx] = TaskState::Succeeded;
  ++impl_->succeeded_count_;
  impl_->propagate(idx, Impl::Terminal::Succeeded, record.result);
  return ok();
}

auto RunState::record_failure(NodeIndex idx, std::uint32_t attempt,
                              AttemptStatus status, std::string error,
                              int exit_code, TimePoint now, bool retry,
                              std::chrono::milliseconds backoff)
    -> Result<void> {
  if (status != AttemptStatus::Failed && status != AttemptStatus::TimedOut) {
    return fail(Error::InvalidArgument);
  }
  if (auto r = impl_->check_in_flight(idx, attempt); !r) {
    return r;
  }
  auto &record = impl_->close_record(idx, status, now);
  record.error = std::move(error);
  record.exit_code = exit_code;

  if (retry) {
    impl_->states_[idx] = TaskState::Retrying;
    impl_->retrying_mask_.set(idx);
    impl_->backoff_[idx] = backoff;
    return ok();
  }

  impl_->states_[idx] = TaskState::Failed;
  ++impl_->failed_count_;
  impl_->propagate(idx, Impl::Terminal::Blocked);
  return ok();
}

auto RunState::mark_retry_ready(NodeIndex idx) -> Result<void> {
  if (!impl_->in_range(idx)) {
    return fail(Error::NotFound);
  }
  if (!impl_->retrying_mask_.test(idx)) {
    return fail(Error::InvalidState);
  }
  if (impl_->run_.cancel_requested) {
    return fail(Error::Conflict);
  }
  impl_->retrying_mask_.reset(idx);
  impl_->set_ready(idx);
  return ok();
}

auto RunState::task_state(NodeIndex idx) const -> TaskState {
  return impl_->in_range(idx) ? impl_->states_[idx] : TaskState::Pending;
}

auto RunState::attempt_count(NodeIndex idx) const -> std::uint32_t {
  return impl_->in_range(idx) ? impl_->attempts_[idx] : 0;
}

auto RunState::last_backoff(NodeIndex idx) const -> std::chrono::milliseconds {
  return impl_->in_range(idx) ? impl_->backoff_[idx]
                              : std::chrono::milliseconds{0};
}

auto RunState::ready_count() const noexcept -> std::size_t {
  return impl_->ready_mask_.count();
}

auto RunState::running_count() const noexcept -> std::size_t {
  return impl_->running_mask_.count();
}

auto RunState::retrying_count() const noexcept -> std::size_t {
  return impl_->retrying_mask_.count();
}

auto RunState::failed_count() const noexcept -> std::size_t {
  return impl_->failed_count_;
}

auto RunState::all_succeeded() const noexcept -> bool {
  return impl_->succeeded_count_ + impl_->skipped_count_ == impl_->size();
}

auto RunState::has_pending_work() const noexcept -> bool {
  return impl_->ready_mask_.any() || impl_->running_mask_.any() ||
         impl_->retrying_mask_.any();
}

auto RunState::records() const -> const std::vector<TaskAttemptRecord> & {
  return impl_->records_;
}

auto RunState::snapshot() const -> RunSnapshot {
  RunSnapshot out{.run = impl_->run_, .attempts = impl_->records_, .tasks = {}};
  out.tasks.reserve(impl_->size());
  for (auto i : std::views::iota(std::size_t{0}, impl_->size())) {
    auto idx = static_cast<NodeIndex>(i);
    out.tasks.push_back(TaskStatusView{.task = impl_->def_->task(idx).name,
                                       .state = impl_->states_[i],
                                       .attempts = impl_->attempts_[i]});
  }
  return out;
}

} // namespace flowforge
