#pragma once

#include "flowforge/config/engine_config.hpp"
#include "flowforge/core/error.hpp"
#include "flowforge/core/runtime.hpp"
#include "flowforge/engine/run_coordinator.hpp"
#include "flowforge/executor/composite_executor.hpp"
#include "flowforge/executor/task_executor.hpp"
#include "flowforge/executor/task_registry.hpp"
#include "flowforge/run/run_state_store.hpp"
#include "flowforge/workflow/graph_store.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace flowforge {

// Applies the [log] section to the process-wide logger.
[[nodiscard]] auto configure_logging(const LogSection &cfg) -> Result<void>;

// The boundary a thin API layer sits on: register, start, query, cancel and
// purge. Owns the whole component stack.
class Engine {
public:
  explicit Engine(EngineConfig config = {});
  ~Engine();

  Engine(const Engine &) = delete;
  auto operator=(const Engine &) -> Engine & = delete;

  [[nodiscard]] auto start() -> Result<void>;
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool {
    return runtime_->is_running();
  }

  /// Work units for tasks with the callable executor. Register before
  /// starting runs that use them.
  [[nodiscard]] auto registry() noexcept -> TaskRegistry & {
    return registry_;
  }

  [[nodiscard]] auto register_workflow(WorkflowSpec spec,
                                       std::string *diagnostic = nullptr)
      -> Result<DefinitionId>;
  [[nodiscard]] auto definition(const DefinitionId &id) const
      -> Result<std::shared_ptr<const WorkflowDefinition>>;
  [[nodiscard]] auto deprecate(const DefinitionId &id) -> Result<void>;

  [[nodiscard]] auto start_run(const DefinitionId &id, RunParams params = {},
                               StartOptions options = {}) -> Result<RunId>;
  [[nodiscard]] auto query(const RunId &run_id) const -> Result<RunSnapshot>;
  auto cancel(const RunId &run_id) -> Result<void>;
  [[nodiscard]] auto purge(const RunId &run_id) -> Result<void>;
  [[nodiscard]] auto list_runs() const -> std::vector<RunId>;

  /// Blocks until the run is terminal with no attempt still in flight, or
  /// the timeout passes (TaskTimeout).
  [[nodiscard]] auto wait(const RunId &run_id,
                          std::chrono::milliseconds timeout)
      -> Result<RunSnapshot>;

  [[nodiscard]] auto config() const noexcept -> const EngineConfig & {
    return config_;
  }
  [[nodiscard]] auto graphs() noexcept -> GraphStore & { return graphs_; }
  [[nodiscard]] auto runs() noexcept -> RunStateStore & { return runs_; }
  [[nodiscard]] auto coordinator() noexcept -> RunCoordinator & {
    return coordinator_;
  }
  [[nodiscard]] auto worker_pool() noexcept -> WorkerPool & { return pool_; }

private:
  auto retention_loop() -> spawn_task;

  EngineConfig config_;
  // Reset explicitly in the destructor, after the executors are joined and
  // before the pool its pending coroutines hold slots of.
  std::unique_ptr<Runtime> runtime_;
  TaskRegistry registry_;
  CompositeExecutor executor_;
  WorkerPool pool_;
  TaskExecutor task_executor_;
  GraphStore graphs_;
  RunStateStore runs_;
  RunCoordinator coordinator_;
  std::atomic<bool> reaper_running_{false};
};

} // namespace flowforge
