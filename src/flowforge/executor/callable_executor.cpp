#include "flowforge/core/runtime.hpp"
#include "flowforge/executor/executor.hpp"
#include "flowforge/executor/task_registry.hpp"
#include "flowforge/util/log.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <exception>
#include <memory>
#include <mutex>
#include <stop_token>
#include <unordered_map>

namespace flowforge {

namespace {

// Shared between the pool thread running the work unit and the timeout timer.
// Whichever side claims first reports the outcome.
struct CallState {
  CallState(boost::asio::any_io_executor ex, AttemptId id, ExecutionSink s)
      : attempt_id(std::move(id)), sink(std::move(s)), timer(std::move(ex)) {}

  [[nodiscard]] auto claim() noexcept -> bool {
    return !done.exchange(true, std::memory_order_acq_rel);
  }

  auto complete(TaskOutcome outcome) -> void {
    if (sink.on_complete) {
      sink.on_complete(attempt_id, std::move(outcome));
    }
  }

  AttemptId attempt_id;
  ExecutionSink sink;
  boost::asio::steady_timer timer;
  std::stop_source stop;
  std::atomic<bool> done{false};
};

[[nodiscard]] auto invoke_unit(const WorkUnit &unit, const TaskContext &ctx)
    -> TaskOutcome {
  try {
    auto result = unit(ctx);
    if (result) {
      return TaskSucceeded{.result = std::move(*result)};
    }
    return TaskFailed{.error = std::move(result.error())};
  } catch (const std::exception &ex) {
    return TaskFailed{.error = std::format("work unit threw: {}", ex.what())};
  } catch (...) {
    return TaskFailed{.error = "work unit threw a non-standard exception"};
  }
}

} // namespace

class CallableExecutor final : public IExecutor {
public:
  CallableExecutor(Runtime &rt, const TaskRegistry &registry,
                   std::size_t threads)
      : runtime_{&rt}, registry_{&registry}, pool_{threads} {}

  ~CallableExecutor() override {
    pool_.stop();
    pool_.join();
  }

  CallableExecutor(const CallableExecutor &) = delete;
  auto operator=(const CallableExecutor &) -> CallableExecutor & = delete;

  auto start(ExecutorRequest req, ExecutionSink sink) -> Result<void> override {
    auto unit = registry_->find(req.executable);
    if (!unit) {
      log::warn("No work unit registered as '{}' for {}", req.executable,
                req.attempt_id);
      return fail(Error::NotFound);
    }

    auto owner = runtime_->owner_of(req.attempt_id);
    auto call = std::make_shared<CallState>(runtime_->executor_for(owner),
                                            req.attempt_id, std::move(sink));
    req.context.stop = call->stop.get_token();
    track(call);

    // Armed on the timer's own shard so it is ordered before the cancel the
    // worker posts there on completion.
    const auto timeout = req.timeout;
    boost::asio::post(call->timer.get_executor(), [this, call, timeout] {
      call->timer.expires_after(timeout);
      call->timer.async_wait(
          [this, call, timeout](const boost::system::error_code &ec) {
            if (ec || !call->claim()) {
              return;
            }
            call->stop.request_stop();
            untrack(call->attempt_id);
            log::warn("{} timed out after {}ms", call->attempt_id,
                      timeout.count());
            call->complete(TaskTimedOut{.after = timeout});
          });
    });

    boost::asio::post(pool_, [this, call, unit = std::move(*unit),
                              ctx = std::move(req.context)] {
      auto outcome = invoke_unit(unit, ctx);
      if (!call->claim()) {
        log::debug("{} finished after its timeout; outcome dropped",
                   call->attempt_id);
        return;
      }
      boost::asio::post(call->timer.get_executor(),
                        [call] { call->timer.cancel(); });
      untrack(call->attempt_id);
      call->complete(std::move(outcome));
    });
    return ok();
  }

  // Work units cannot be interrupted; this only signals their stop token.
  auto cancel(const AttemptId &attempt_id) -> void override {
    std::scoped_lock lock(mu_);
    if (auto it = active_.find(attempt_id); it != active_.end()) {
      it->second->stop.request_stop();
    }
  }

private:
  auto track(const std::shared_ptr<CallState> &call) -> void {
    std::scoped_lock lock(mu_);
    active_[call->attempt_id] = call;
  }

  auto untrack(const AttemptId &attempt_id) -> void {
    std::scoped_lock lock(mu_);
    active_.erase(attempt_id);
  }

  Runtime *runtime_;
  const TaskRegistry *registry_;
  boost::asio::thread_pool pool_;
  std::mutex mu_;
  std::unordered_map<AttemptId, std::shared_ptr<CallState>> active_;
};

auto create_callable_executor(Runtime &rt, const TaskRegistry &registry,
                              std::size_t threads)
    -> std::unique_ptr<IExecutor> {
  return std::make_unique<CallableExecutor>(rt, registry,
                                            std::max<std::size_t>(1, threads));
}

} // namespace flowforge
