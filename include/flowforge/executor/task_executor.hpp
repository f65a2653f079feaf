#pragma once

#include "flowforge/core/coroutine.hpp"
#include "flowforge/core/error.hpp"
#include "flowforge/executor/executor.hpp"
#include "flowforge/workflow/task_spec.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/system/error_code.hpp>

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>

namespace flowforge {

// Caps the number of task executions in flight across every run. A slot is
// a buffered element in a bounded channel: acquiring sends (suspending while
// the channel is full), releasing receives.
class WorkerPool {
  using SlotChannel = boost::asio::experimental::concurrent_channel<void(
      boost::system::error_code)>;

public:
  class Slot {
  public:
    Slot() = default;
    explicit Slot(WorkerPool *pool) : pool_(pool) {}
    ~Slot() { release(); }
    Slot(Slot &&other) noexcept : pool_(std::exchange(other.pool_, nullptr)) {}
    auto operator=(Slot &&other) noexcept -> Slot & {
      if (this != &other) {
        release();
        pool_ = std::exchange(other.pool_, nullptr);
      }
      return *this;
    }
    Slot(const Slot &) = delete;
    auto operator=(const Slot &) -> Slot & = delete;

    auto release() -> void;

  private:
    WorkerPool *pool_{nullptr};
  };

  WorkerPool(boost::asio::any_io_executor ex, std::size_t capacity);

  WorkerPool(const WorkerPool &) = delete;
  auto operator=(const WorkerPool &) -> WorkerPool & = delete;

  [[nodiscard]] auto acquire() -> task<Result<Slot>>;
  auto close() -> void;

  [[nodiscard]] auto capacity() const noexcept -> std::size_t {
    return capacity_;
  }
  [[nodiscard]] auto in_flight() const noexcept -> std::size_t {
    return in_flight_.load(std::memory_order_acquire);
  }
  [[nodiscard]] auto peak_in_flight() const noexcept -> std::size_t {
    return peak_.load(std::memory_order_acquire);
  }

private:
  auto on_release() -> void;

  std::size_t capacity_;
  SlotChannel slots_;
  std::atomic<std::size_t> in_flight_{0};
  std::atomic<std::size_t> peak_{0};
};

// The engine-facing Task Executor: takes a pool slot, runs the task through
// the executor selected by its type, and returns the three-way outcome.
class TaskExecutor {
public:
  // Runs once the pool slot is held; an error aborts the attempt before the
  // executor sees it.
  using Admission = std::move_only_function<Result<void>()>;

  TaskExecutor(IExecutor &executor, WorkerPool &pool)
      : executor_(&executor), pool_(&pool) {}

  [[nodiscard]] auto execute(const TaskSpec &spec, TaskContext context)
      -> task<TaskOutcome>;
  /// Like execute(), but consults `admit` after the slot is acquired and
  /// returns its error without running anything if it refuses.
  [[nodiscard]] auto execute(const TaskSpec &spec, TaskContext context,
                             Admission admit) -> task<Result<TaskOutcome>>;

  auto cancel(const AttemptId &attempt_id) -> void {
    executor_->cancel(attempt_id);
  }

  [[nodiscard]] auto pool() noexcept -> WorkerPool & { return *pool_; }

private:
  IExecutor *executor_;
  WorkerPool *pool_;
};

} // namespace flowforge
