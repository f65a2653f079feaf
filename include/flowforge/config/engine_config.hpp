#pragma once

#include "flowforge/workflow/task_spec.hpp"

#include <chrono>
#include <cstddef>
#include <string>

namespace flowforge {

struct EngineSection {
  unsigned shards{0}; // 0 = hardware_concurrency
  std::size_t max_in_flight{64};
  std::size_t worker_threads{4};

  auto operator==(const EngineSection &) const -> bool = default;
};

struct LogSection {
  std::string level{"info"};
  std::string file; // empty = stderr

  auto operator==(const LogSection &) const -> bool = default;
};

struct RetentionSection {
  std::chrono::seconds run_ttl{0}; // 0 = keep finished runs forever
  std::chrono::seconds purge_interval{60};

  auto operator==(const RetentionSection &) const -> bool = default;
};

// Fallbacks for tasks that leave a knob unset in their workflow file.
struct TaskDefaults {
  FailurePolicy failure_policy{FailurePolicy::FailSlow};
  std::chrono::milliseconds timeout{task_defaults::kTimeout};
  RetryPolicy retry{};

  auto operator==(const TaskDefaults &) const -> bool = default;
};

struct EngineConfig {
  EngineSection engine;
  LogSection log;
  RetentionSection retention;
  TaskDefaults defaults;

  auto operator==(const EngineConfig &) const -> bool = default;
};

} // namespace flowforge
