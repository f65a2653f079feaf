#include "flowforge/executor/composite_executor.hpp"

#include "flowforge/util/log.hpp"

namespace flowforge {

auto CompositeExecutor::register_executor(ExecutorType type,
                                          std::unique_ptr<IExecutor> executor)
    -> void {
  executors_[type] = std::move(executor);
}

auto CompositeExecutor::has_executor(ExecutorType type) const -> bool {
  return executors_.contains(type);
}

auto CompositeExecutor::clear() -> void { executors_.clear(); }

auto CompositeExecutor::start(ExecutorRequest req, ExecutionSink sink)
    -> Result<void> {
  auto it = executors_.find(req.type);
  if (it == executors_.end()) {
    log::error("No executor registered for type {}", to_string_view(req.type));
    return fail(Error::InvalidArgument);
  }
  return it->second->start(std::move(req), std::move(sink));
}

auto CompositeExecutor::cancel(const AttemptId &attempt_id) -> void {
  // Child cancel is idempotent for unknown ids, so broadcasting avoids keeping
  // an attempt -> executor map.
  for (auto &[_, exec] : executors_) {
    exec->cancel(attempt_id);
  }
}

} // namespace flowforge
