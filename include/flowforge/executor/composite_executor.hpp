#pragma once

#include "flowforge/executor/executor.hpp"

#include <memory>
#include <unordered_map>

namespace flowforge {

// Routes a request to the executor registered for its ExecutorType.
class CompositeExecutor : public IExecutor {
public:
  CompositeExecutor() = default;
  ~CompositeExecutor() override = default;

  CompositeExecutor(const CompositeExecutor &) = delete;
  auto operator=(const CompositeExecutor &) -> CompositeExecutor & = delete;

  auto register_executor(ExecutorType type, std::unique_ptr<IExecutor> executor)
      -> void;
  [[nodiscard]] auto has_executor(ExecutorType type) const -> bool;
  /// Destroys every registered executor, joining their worker threads.
  auto clear() -> void;

  auto start(ExecutorRequest req, ExecutionSink sink) -> Result<void> override;
  auto cancel(const AttemptId &attempt_id) -> void override;

private:
  // Populated before the engine starts; read-only afterwards.
  std::unordered_map<ExecutorType, std::unique_ptr<IExecutor>> executors_;
};

} // namespace flowforge
