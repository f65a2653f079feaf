#pragma once

#include "flowforge/core/error.hpp"
#include "flowforge/run/run_types.hpp"
#include "flowforge/workflow/definition.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace flowforge {

// Mutable state of one run: the run record, its attempt records, and the
// incremental dependency bookkeeping that makes eligibility O(ready).
// Not thread-safe; RunStateStore serializes access per run.
class RunState {
  struct PrivateTag {};

public:
  [[nodiscard]] static auto
  create(RunId run_id, std::shared_ptr<const WorkflowDefinition> definition,
         FailurePolicy policy, RunParams params = {}) -> Result<RunState>;

  RunState(PrivateTag, WorkflowRun run,
           std::shared_ptr<const WorkflowDefinition> definition);
  ~RunState();
  RunState(RunState &&) noexcept;
  auto operator=(RunState &&) noexcept -> RunState &;
  RunState(const RunState &) = delete;
  auto operator=(const RunState &) -> RunState & = delete;

  [[nodiscard]] auto id() const noexcept -> const RunId &;
  [[nodiscard]] auto run() const noexcept -> const WorkflowRun &;
  [[nodiscard]] auto status() const noexcept -> RunStatus;
  [[nodiscard]] auto definition() const noexcept -> const WorkflowDefinition &;
  [[nodiscard]] auto definition_ptr() const noexcept
      -> const std::shared_ptr<const WorkflowDefinition> &;

  // Run-level transitions.
  [[nodiscard]] auto mark_started(TimePoint now) -> Result<void>;
  [[nodiscard]] auto finish(RunStatus status, TimePoint now,
                            std::string error = {}) -> Result<void>;
  /// Returns false if cancellation was already requested or the run is
  /// terminal.
  [[nodiscard]] auto request_cancel(TimePoint now) -> bool;
  [[nodiscard]] auto cancel_requested() const noexcept -> bool;
  /// Stamps completion once the last in-flight attempt of a terminal run
  /// reported back.
  auto settle_finish_time(TimePoint now) -> void;

  // Task-level transitions. `attempt` must match the in-flight attempt.
  [[nodiscard]] auto ready_tasks() const -> std::vector<NodeIndex>;
  /// Claims a ready task and opens a Pending record for the new attempt.
  [[nodiscard]] auto begin_attempt(NodeIndex idx) -> Result<std::uint32_t>;
  /// Marks a claimed attempt Running once it holds a worker slot. If the run
  /// was cancelled meanwhile the attempt is withdrawn without a trace and
  /// Conflict is returned.
  [[nodiscard]] auto confirm_dispatch(NodeIndex idx, std::uint32_t attempt,
                                      TimePoint now) -> Result<void>;
  [[nodiscard]] auto record_success(NodeIndex idx, std::uint32_t attempt,
                                    std::string result, TimePoint now)
      -> Result<void>;
  /// Closes the attempt as Failed or TimedOut. With `retry` the task waits in
  /// Retrying for `backoff`; otherwise it fails permanently and every
  /// downstream task becomes UpstreamFailed.
  [[nodiscard]] auto record_failure(NodeIndex idx, std::uint32_t attempt,
                                    AttemptStatus status, std::string error,
                                    int exit_code, TimePoint now, bool retry,
                                    std::chrono::milliseconds backoff)
      -> Result<void>;
  [[nodiscard]] auto mark_retry_ready(NodeIndex idx) -> Result<void>;

  // Queries.
  [[nodiscard]] auto task_state(NodeIndex idx) const -> TaskState;
  [[nodiscard]] auto attempt_count(NodeIndex idx) const -> std::uint32_t;
  [[nodiscard]] auto last_backoff(NodeIndex idx) const
      -> std::chrono::milliseconds;
  [[nodiscard]] auto ready_count() const noexcept -> std::size_t;
  [[nodiscard]] auto running_count() const noexcept -> std::size_t;
  [[nodiscard]] auto retrying_count() const noexcept -> std::size_t;
  [[nodiscard]] auto failed_count() const noexcept -> std::size_t;
  /// Every task either succeeded or was skipped by a branch.
  [[nodiscard]] auto all_succeeded() const noexcept -> bool;
  /// Something is ready, running or waiting out a backoff.
  [[nodiscard]] auto has_pending_work() const noexcept -> bool;

  [[nodiscard]] auto records() const -> const std::vector<TaskAttemptRecord> &;
  [[nodiscard]] auto snapshot() const -> RunSnapshot;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace flowforge
