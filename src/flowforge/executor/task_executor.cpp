#include "flowforge/executor/task_executor.hpp"

#include "flowforge/util/log.hpp"

#include <algorithm>

namespace flowforge {

WorkerPool::WorkerPool(boost::asio::any_io_executor ex, std::size_t capacity)
    : capacity_(std::max<std::size_t>(1, capacity)),
      slots_(std::move(ex), capacity_) {}

auto WorkerPool::acquire() -> task<Result<Slot>> {
  auto [ec] = co_await slots_.async_send(boost::system::error_code{},
                                         use_nothrow);
  if (ec) {
    co_return fail(Error::SystemNotRunning);
  }
  const auto now = in_flight_.fetch_add(1, std::memory_order_acq_rel) + 1;
  auto peak = peak_.load(std::memory_order_relaxed);
  while (now > peak &&
         !peak_.compare_exchange_weak(peak, now, std::memory_order_acq_rel)) {
  }
  co_return Slot{this};
}

auto WorkerPool::close() -> void { slots_.close(); }

auto WorkerPool::on_release() -> void {
  in_flight_.fetch_sub(1, std::memory_order_acq_rel);
  // Frees one buffered element, which admits one waiting sender.
  const bool freed =
      slots_.try_receive([](const boost::system::error_code &) {});
  if (!freed) {
    log::warn("worker pool released a slot that was not held");
  }
}

auto WorkerPool::Slot::release() -> void {
  if (auto *pool = std::exchange(pool_, nullptr)) {
    pool->on_release();
  }
}

auto TaskExecutor::execute(const TaskSpec &spec, TaskContext context)
    -> task<TaskOutcome> {
  auto outcome = co_await execute(spec, std::move(context),
                                  []() -> Result<void> { return ok(); });
  if (!outcome) {
    co_return TaskFailed{.error = outcome.error().message(), .exit_code = -1};
  }
  co_return std::move(*outcome);
}

auto TaskExecutor::execute(const TaskSpec &spec, TaskContext context,
                           Admission admit) -> task<Result<TaskOutcome>> {
  auto slot = co_await pool_->acquire();
  if (!slot) {
    co_return ok(TaskOutcome{
        TaskFailed{.error = "worker pool closed", .exit_code = -1}});
  }
  if (auto admitted = admit(); !admitted) {
    log::debug("{} attempt {} refused after slot acquired: {}", context.task,
               context.attempt, admitted.error().message());
    co_return fail(admitted.error());
  }

  ExecutorRequest req{
      .attempt_id = make_attempt_id(context.run_id, context.task,
                                    context.attempt),
      .type = spec.executor,
      .executable = spec.executable,
      .timeout = spec.timeout,
      .context = std::move(context),
  };
  co_return ok(co_await execute_async(*executor_, std::move(req)));
}

} // namespace flowforge
