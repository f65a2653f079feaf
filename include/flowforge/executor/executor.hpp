#pragma once

#include "flowforge/core/coroutine.hpp"
#include "flowforge/core/error.hpp"
#include "flowforge/run/run_types.hpp"
#include "flowforge/util/id.hpp"
#include "flowforge/workflow/task_spec.hpp"

#include <boost/asio/associated_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <boost/asio/execution/outstanding_work.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/prefer.hpp>

#include <chrono>
#include <cstdint>
#include <format>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <variant>

namespace flowforge {

inline constexpr int kExitCodeTimeout = 124;

struct TaskSucceeded {
  std::string result;
};

struct TaskFailed {
  std::string error;
  int exit_code{1};
};

struct TaskTimedOut {
  std::chrono::milliseconds after{0};
};

// The only thing the engine observes about a task's work.
using TaskOutcome = std::variant<TaskSucceeded, TaskFailed, TaskTimedOut>;

[[nodiscard]] inline auto to_attempt_status(const TaskOutcome &outcome)
    -> AttemptStatus {
  switch (outcome.index()) {
  case 0:
    return AttemptStatus::Succeeded;
  case 1:
    return AttemptStatus::Failed;
  default:
    return AttemptStatus::TimedOut;
  }
}

// Handed to every work unit. `stop` is requested once the attempt's timeout
// fires so cooperative work can bail out early.
struct TaskContext {
  RunId run_id;
  TaskName task;
  std::uint32_t attempt{1};
  std::shared_ptr<const RunParams> params;
  std::stop_token stop;

  [[nodiscard]] auto param(std::string_view key) const
      -> std::optional<std::string_view> {
    if (!params) {
      return std::nullopt;
    }
    auto it = params->find(key);
    if (it == params->end()) {
      return std::nullopt;
    }
    return std::string_view{it->second};
  }
};

struct ExecutorRequest {
  AttemptId attempt_id;
  ExecutorType type{ExecutorType::Callable};
  std::string executable;
  std::chrono::milliseconds timeout{task_defaults::kTimeout};
  TaskContext context;
};

struct ExecutionSink {
  std::move_only_function<void(const AttemptId &attempt_id,
                               TaskOutcome outcome)>
      on_complete;
};

class Runtime;

// Implementations enforce `ExecutorRequest::timeout` themselves and call
// `on_complete` exactly once per successfully started request.
class IExecutor {
public:
  virtual ~IExecutor() = default;

  virtual auto start(ExecutorRequest req, ExecutionSink sink)
      -> Result<void> = 0;

  virtual auto cancel(const AttemptId &attempt_id) -> void = 0;
};

/// Awaitable wrapper over IExecutor::start. The outcome is delivered on the
/// awaiting coroutine's executor whichever thread produced it; a start
/// failure becomes a Failed outcome.
inline auto execute_async(IExecutor &executor, ExecutorRequest req)
    -> task<TaskOutcome> {
  auto outcome =
      co_await boost::asio::async_initiate<const boost::asio::use_awaitable_t<>,
                                           void(TaskOutcome)>(
          [&executor, req = std::move(req)](auto handler) mutable {
            // Keeps the awaiting executor alive until the outcome arrives.
            auto work = boost::asio::prefer(
                boost::asio::get_associated_executor(handler),
                boost::asio::execution::outstanding_work.tracked);
            auto shared_h =
                std::make_shared<decltype(handler)>(std::move(handler));
            ExecutionSink sink;
            sink.on_complete = [shared_h, work](const AttemptId &,
                                                TaskOutcome result) mutable {
              boost::asio::post(work, [shared_h,
                                       result = std::move(result)]() mutable {
                std::move(*shared_h)(std::move(result));
              });
            };

            auto attempt_id = req.attempt_id;
            auto start_res = executor.start(std::move(req), std::move(sink));
            if (!start_res) {
              // on_complete will never fire.
              boost::asio::post(
                  work, [shared_h, message = start_res.error().message(),
                         attempt_id]() mutable {
                    std::move(*shared_h)(TaskOutcome{TaskFailed{
                        .error = std::format("attempt {} failed to start: {}",
                                             attempt_id, message),
                        .exit_code = -1}});
                  });
            }
          },
          boost::asio::use_awaitable);

  co_return outcome;
}

[[nodiscard]] auto create_shell_executor(Runtime &rt)
    -> std::unique_ptr<IExecutor>;

} // namespace flowforge
