#pragma once

#include "flowforge/util/enum.hpp"
#include "flowforge/util/id.hpp"
#include "flowforge/workflow/definition.hpp"
#include "flowforge/workflow/task_spec.hpp"

#include <boost/describe/enum.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace flowforge {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Opaque key/value bag handed through to every task of a run.
using RunParams = std::map<std::string, std::string, std::less<>>;

enum class RunStatus : std::uint8_t {
  Pending,
  Running,
  Succeeded,
  Failed,
  Cancelled,
};
BOOST_DESCRIBE_ENUM(RunStatus, Pending, Running, Succeeded, Failed, Cancelled)
FLOWFORGE_DEFINE_ENUM_SERDE(RunStatus, RunStatus::Pending)

[[nodiscard]] constexpr auto is_terminal(RunStatus s) noexcept -> bool {
  return s == RunStatus::Succeeded || s == RunStatus::Failed ||
         s == RunStatus::Cancelled;
}

enum class AttemptStatus : std::uint8_t {
  Pending,
  Running,
  Succeeded,
  Failed,
  TimedOut,
};
BOOST_DESCRIBE_ENUM(AttemptStatus, Pending, Running, Succeeded, Failed,
                    TimedOut)
FLOWFORGE_DEFINE_ENUM_SERDE(AttemptStatus, AttemptStatus::Pending)

// Derived per-task position in a run; never persisted on its own.
enum class TaskState : std::uint8_t {
  Pending,
  Ready,
  Running,
  Retrying,
  Succeeded,
  Failed,
  UpstreamFailed,
  Skipped,
};
BOOST_DESCRIBE_ENUM(TaskState, Pending, Ready, Running, Retrying, Succeeded,
                    Failed, UpstreamFailed, Skipped)
FLOWFORGE_DEFINE_ENUM_SERDE(TaskState, TaskState::Pending)

[[nodiscard]] constexpr auto is_terminal(TaskState s) noexcept -> bool {
  return s == TaskState::Succeeded || s == TaskState::Failed ||
         s == TaskState::UpstreamFailed || s == TaskState::Skipped;
}

struct TaskAttemptRecord {
  RunId run_id;
  TaskName task;
  std::uint32_t attempt{1};
  AttemptStatus status{AttemptStatus::Pending};
  TimePoint started_at;
  TimePoint finished_at;
  // Delay waited after the previous attempt's failure; zero for attempt 1.
  std::chrono::milliseconds backoff{0};
  std::string result;
  std::string error;
  int exit_code{0};
};

struct WorkflowRun {
  RunId id;
  DefinitionId definition;
  RunStatus status{RunStatus::Pending};
  FailurePolicy failure_policy{FailurePolicy::FailSlow};
  RunParams params;
  bool cancel_requested{false};
  TimePoint created_at;
  TimePoint started_at;
  TimePoint finished_at;
  std::string error;
};

struct TaskStatusView {
  TaskName task;
  TaskState state{TaskState::Pending};
  std::uint32_t attempts{0};
};

/// Consistent copy of a run taken under its lock.
struct RunSnapshot {
  WorkflowRun run;
  std::vector<TaskAttemptRecord> attempts;
  std::vector<TaskStatusView> tasks;

  [[nodiscard]] auto attempts_for(const TaskName &task) const
      -> std::vector<TaskAttemptRecord> {
    std::vector<TaskAttemptRecord> out;
    for (const auto &record : attempts) {
      if (record.task == task) {
        out.push_back(record);
      }
    }
    return out;
  }

  [[nodiscard]] auto state_of(const TaskName &task) const -> TaskState {
    for (const auto &view : tasks) {
      if (view.task == task) {
        return view.state;
      }
    }
    return TaskState::Pending;
  }
};

} // namespace flowforge
