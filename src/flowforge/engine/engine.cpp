#include "flowforge/engine/engine.hpp"

#include "flowforge/util/log.hpp"

namespace flowforge {

auto configure_logging(const LogSection &cfg) -> Result<void> {
  if (!cfg.level.empty()) {
    log::set_level(cfg.level);
  }
  if (cfg.file.empty()) {
    log::set_output_stderr();
    return ok();
  }
  if (!log::set_output_file(cfg.file)) {
    return fail(Error::FileOpenFailed);
  }
  return ok();
}

Engine::Engine(EngineConfig config)
    : config_(std::move(config)),
      runtime_(std::make_unique<Runtime>(config_.engine.shards)),
      pool_(runtime_->executor_for(0), config_.engine.max_in_flight),
      task_executor_(executor_, pool_),
      coordinator_(*runtime_, graphs_, runs_, task_executor_) {
  executor_.register_executor(
      ExecutorType::Callable,
      create_callable_executor(*runtime_, registry_,
                               config_.engine.worker_threads));
  executor_.register_executor(ExecutorType::Shell,
                              create_shell_executor(*runtime_));
}

Engine::~Engine() {
  stop();
  // Executor threads may still post completions onto the shards.
  executor_.clear();
  runtime_.reset();
}

auto Engine::start() -> Result<void> {
  if (auto r = runtime_->start(); !r) {
    return r;
  }
  log::info("Engine started: {} shard(s), max_in_flight={}",
            runtime_->shard_count(), pool_.capacity());

  if (config_.retention.run_ttl.count() > 0 &&
      config_.retention.purge_interval.count() > 0) {
    reaper_running_.store(true, std::memory_order_release);
    runtime_->spawn_on(0, retention_loop());
  }
  return ok();
}

auto Engine::stop() -> void {
  if (!runtime_->is_running()) {
    return;
  }
  reaper_running_.store(false, std::memory_order_release);
  pool_.close();
  runtime_->stop();
  log::info("Engine stopped");
}

auto Engine::retention_loop() -> spawn_task {
  log::debug("retention reaper every {}s, ttl {}s",
             config_.retention.purge_interval.count(),
             config_.retention.run_ttl.count());
  while (reaper_running_.load(std::memory_order_acquire)) {
    if (auto slept = co_await async_sleep(config_.retention.purge_interval);
        !slept) {
      break;
    }
    const auto cutoff = Clock::now() - config_.retention.run_ttl;
    std::ignore = coordinator_.purge_finished_before(cutoff);
  }
}

auto Engine::register_workflow(WorkflowSpec spec, std::string *diagnostic)
    -> Result<DefinitionId> {
  return graphs_.register_definition(std::move(spec), diagnostic);
}

auto Engine::definition(const DefinitionId &id) const
    -> Result<std::shared_ptr<const WorkflowDefinition>> {
  return graphs_.get(id);
}

auto Engine::deprecate(const DefinitionId &id) -> Result<void> {
  return graphs_.deprecate(id);
}

auto Engine::start_run(const DefinitionId &id, RunParams params,
                       StartOptions options) -> Result<RunId> {
  return coordinator_.start(id, std::move(params), options);
}

auto Engine::query(const RunId &run_id) const -> Result<RunSnapshot> {
  return coordinator_.status(run_id);
}

auto Engine::cancel(const RunId &run_id) -> Result<void> {
  return coordinator_.cancel(run_id);
}

auto Engine::purge(const RunId &run_id) -> Result<void> {
  return coordinator_.purge(run_id);
}

auto Engine::list_runs() const -> std::vector<RunId> {
  return coordinator_.list_runs();
}

auto Engine::wait(const RunId &run_id, std::chrono::milliseconds timeout)
    -> Result<RunSnapshot> {
  return coordinator_.wait_settled(run_id, timeout);
}

} // namespace flowforge
