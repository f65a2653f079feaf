#pragma once

#include "flowforge/core/error.hpp"
#include "flowforge/util/enum.hpp"
#include "flowforge/util/id.hpp"

#include <boost/describe/enum.hpp>

#include <chrono>
#include <cstdint>
#include <string>

namespace flowforge {

namespace task_defaults {
inline constexpr std::chrono::seconds kTimeout{3600};
inline constexpr int kMaxRetries{3};
inline constexpr std::chrono::milliseconds kBackoffBase{1000};
inline constexpr std::chrono::milliseconds kBackoffCap{60000};
inline constexpr double kBackoffMultiplier{2.0};
inline constexpr double kBackoffJitter{0.2};
} // namespace task_defaults

enum class ExecutorType : std::uint8_t {
  Callable, // in-process work unit looked up in a TaskRegistry
  Shell,    // /bin/sh -c <executable>
};
BOOST_DESCRIBE_ENUM(ExecutorType, Callable, Shell)
FLOWFORGE_DEFINE_ENUM_SERDE(ExecutorType, ExecutorType::Callable)

enum class FailurePolicy : std::uint8_t {
  FailSlow, // let independent branches finish, then fail the run
  FailFast, // fail the run on the first permanent task failure
};
BOOST_DESCRIBE_ENUM(FailurePolicy, FailSlow, FailFast)
FLOWFORGE_DEFINE_ENUM_SERDE(FailurePolicy, FailurePolicy::FailSlow)

// max_retries counts attempts beyond the first: max_retries = 2 allows
// attempts 1, 2 and 3.
struct RetryPolicy {
  int max_retries{task_defaults::kMaxRetries};
  std::chrono::milliseconds backoff_base{task_defaults::kBackoffBase};
  std::chrono::milliseconds backoff_cap{task_defaults::kBackoffCap};
  double multiplier{task_defaults::kBackoffMultiplier};
  double jitter{task_defaults::kBackoffJitter};

  [[nodiscard]] auto max_attempts() const noexcept -> std::uint32_t {
    return static_cast<std::uint32_t>(max_retries < 0 ? 1 : max_retries + 1);
  }

  [[nodiscard]] static auto none() -> RetryPolicy {
    return RetryPolicy{.max_retries = 0};
  }

  [[nodiscard]] auto validate() const -> Result<void> {
    if (max_retries < 0 || backoff_base.count() < 0 ||
        backoff_cap < backoff_base || multiplier < 1.0 || jitter < 0.0 ||
        jitter > 1.0) {
      return fail(Error::InvalidArgument);
    }
    return ok();
  }

  auto operator==(const RetryPolicy &) const -> bool = default;
};

struct TaskSpec {
  struct Builder;
  static auto builder() -> Builder;

  TaskName name;
  std::string description;
  // Opaque to the graph; resolved by the executor selected by `executor`.
  std::string executable;
  ExecutorType executor{ExecutorType::Callable};
  RetryPolicy retry;
  std::chrono::milliseconds timeout{task_defaults::kTimeout};
  // A branch task's result selects which labelled outgoing edges proceed.
  bool branch{false};

  auto operator==(const TaskSpec &) const -> bool = default;
};

struct TaskSpec::Builder {
  TaskSpec spec_;

  auto name(std::string n) -> Builder && {
    spec_.name = TaskName{std::move(n)};
    return std::move(*this);
  }

  auto description(std::string d) -> Builder && {
    spec_.description = std::move(d);
    return std::move(*this);
  }

  auto callable(std::string key) -> Builder && {
    spec_.executor = ExecutorType::Callable;
    spec_.executable = std::move(key);
    return std::move(*this);
  }

  auto shell(std::string command) -> Builder && {
    spec_.executor = ExecutorType::Shell;
    spec_.executable = std::move(command);
    return std::move(*this);
  }

  auto retry(RetryPolicy policy) -> Builder && {
    spec_.retry = policy;
    return std::move(*this);
  }

  auto max_retries(int n) -> Builder && {
    spec_.retry.max_retries = n;
    return std::move(*this);
  }

  auto backoff(std::chrono::milliseconds base, std::chrono::milliseconds cap,
               double jitter = task_defaults::kBackoffJitter) -> Builder && {
    spec_.retry.backoff_base = base;
    spec_.retry.backoff_cap = cap;
    spec_.retry.jitter = jitter;
    return std::move(*this);
  }

  auto timeout(std::chrono::milliseconds t) -> Builder && {
    spec_.timeout = t;
    return std::move(*this);
  }

  auto branch(bool is_branch = true) -> Builder && {
    spec_.branch = is_branch;
    return std::move(*this);
  }

  [[nodiscard]] auto build() && -> Result<TaskSpec> {
    if (!spec_.name.valid() || spec_.executable.empty()) {
      return fail(Error::InvalidArgument);
    }
    if (spec_.timeout.count() <= 0) {
      return fail(Error::InvalidArgument);
    }
    if (auto r = spec_.retry.validate(); !r) {
      return fail(r.error());
    }
    return ok(std::move(spec_));
  }
};

inline auto TaskSpec::builder() -> Builder { return {}; }

} // namespace flowforge
