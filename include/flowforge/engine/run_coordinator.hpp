#pragma once

#include "flowforge/core/coroutine.hpp"
#include "flowforge/core/error.hpp"
#include "flowforge/core/runtime.hpp"
#include "flowforge/executor/executor.hpp"
#include "flowforge/executor/task_executor.hpp"
#include "flowforge/run/run_state_store.hpp"
#include "flowforge/run/run_types.hpp"
#include "flowforge/workflow/graph_store.hpp"

#include <ankerl/unordered_dense.h>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/system/error_code.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <variant>
#include <vector>

namespace flowforge {

struct StartOptions {
  // Overrides the definition's failure policy for this run only.
  std::optional<FailurePolicy> failure_policy;
};

// Invoked from shard threads, possibly concurrently for different runs.
struct CoordinatorCallbacks {
  std::move_only_function<void(const TaskAttemptRecord &record)> on_attempt;
  std::move_only_function<void(const RunId &run_id, RunStatus status)>
      on_run_status;
};

// Owns the lifecycle of every run: creates it, drives the scheduler on the
// run's owner shard until terminal, and serves cancel and status requests
// from any thread.
class RunCoordinator {
public:
  RunCoordinator(Runtime &runtime, GraphStore &graphs, RunStateStore &runs,
                 TaskExecutor &executor);
  ~RunCoordinator();

  RunCoordinator(const RunCoordinator &) = delete;
  auto operator=(const RunCoordinator &) -> RunCoordinator & = delete;

  /// Must be called before the first start().
  auto set_callbacks(CoordinatorCallbacks callbacks) -> void;

  [[nodiscard]] auto start(const DefinitionId &definition,
                           RunParams params = {}, StartOptions options = {})
      -> Result<RunId>;

  /// Idempotent; succeeds for unknown or already finished runs.
  auto cancel(const RunId &run_id) -> Result<void>;

  [[nodiscard]] auto status(const RunId &run_id) const -> Result<RunSnapshot>;
  [[nodiscard]] auto list_runs() const -> std::vector<RunId>;

  [[nodiscard]] auto purge(const RunId &run_id) -> Result<void>;
  [[nodiscard]] auto purge_finished_before(TimePoint cutoff) -> std::size_t;

  /// Blocks until the run is terminal with every attempt accounted for, or
  /// fails with TaskTimeout. Woken by drive loops as they exit.
  [[nodiscard]] auto wait_settled(const RunId &run_id,
                                  std::chrono::milliseconds timeout)
      -> Result<RunSnapshot>;

  /// Runs whose drive loop has not exited yet.
  [[nodiscard]] auto active_runs() const noexcept -> std::size_t {
    return active_runs_.load(std::memory_order_acquire);
  }

private:
  struct TaskCompleted {
    NodeIndex idx{kInvalidNode};
    std::uint32_t attempt{0};
    TaskOutcome outcome;
  };
  struct RetryReady {
    NodeIndex idx{kInvalidNode};
  };
  // The attempt was withdrawn after waiting for a worker slot.
  struct AttemptDiscarded {
    NodeIndex idx{kInvalidNode};
    std::uint32_t attempt{0};
  };
  struct CancelRequested {};

  using RunEvent = std::variant<TaskCompleted, RetryReady, AttemptDiscarded,
                                CancelRequested>;
  using EventChannel = boost::asio::experimental::concurrent_channel<void(
      boost::system::error_code, RunEvent)>;

  struct DriveContext {
    RunId run_id;
    std::shared_ptr<const WorkflowDefinition> definition;
    std::shared_ptr<const RunParams> params;
    std::shared_ptr<EventChannel> events;
    std::size_t in_flight{0};
    std::size_t pending_retries{0};
  };

  auto drive(DriveContext ctx) -> spawn_task;
  auto dispatch_ready(DriveContext &ctx) -> void;
  auto run_attempt(RunId run_id, NodeIndex idx, std::uint32_t attempt,
                   std::shared_ptr<const WorkflowDefinition> definition,
                   std::shared_ptr<const RunParams> params,
                   std::shared_ptr<EventChannel> events) -> spawn_task;
  auto arm_retry(NodeIndex idx, std::chrono::milliseconds delay,
                 std::shared_ptr<EventChannel> events) -> spawn_task;
  auto handle_event(DriveContext &ctx, RunEvent event) -> void;
  auto settle(DriveContext &ctx) -> void;
  auto finish_drive(DriveContext &ctx) -> void;

  auto emit_attempt(const TaskAttemptRecord &record) -> void;
  auto emit_run_status(const RunId &run_id, RunStatus status) -> void;

  Runtime &runtime_;
  GraphStore &graphs_;
  RunStateStore &runs_;
  TaskExecutor &executor_;
  CoordinatorCallbacks callbacks_;
  std::mutex callback_mu_;

  // Event channels of runs still being driven, for cancel notification.
  mutable std::mutex active_mu_;
  ankerl::unordered_dense::map<RunId, std::shared_ptr<EventChannel>>
      active_;
  std::atomic<std::size_t> active_runs_{0};

  std::mutex settled_mu_;
  std::condition_variable settled_cv_;
};

} // namespace flowforge
