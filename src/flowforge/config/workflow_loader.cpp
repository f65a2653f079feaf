#include "flowforge/config/workflow_loader.hpp"
#include "flowforge/config/toml_util.hpp"

#include "flowforge/util/log.hpp"

#include <glaze/toml.hpp>

#include <chrono>
#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace flowforge {
namespace detail {

struct TaskDependencyToml {
  std::string task;
  std::string label;
};

// Negative numbers mean "not set".
struct WorkflowDefaultsToml {
  std::string executor;
  std::int64_t timeout_sec{-1};
  int max_retries{-1};
  std::int64_t backoff_base_ms{-1};
  std::int64_t backoff_cap_ms{-1};
  double backoff_multiplier{-1.0};
  double backoff_jitter{-1.0};
};

struct TaskToml {
  std::string name;
  std::string description;
  std::string command;
  std::string executor;
  std::int64_t timeout_sec{-1};
  int max_retries{-1};
  std::int64_t backoff_base_ms{-1};
  std::int64_t backoff_cap_ms{-1};
  double backoff_multiplier{-1.0};
  double backoff_jitter{-1.0};
  bool branch{false};
  std::vector<std::variant<std::string, TaskDependencyToml>> dependencies;
};

struct WorkflowToml {
  std::string name;
  std::uint32_t version{0};
  std::string description;
  std::string failure_policy;
  WorkflowDefaultsToml defaults{};
  std::vector<TaskToml> tasks;
};

} // namespace detail
} // namespace flowforge

namespace glz {
template <> struct meta<flowforge::detail::TaskDependencyToml> {
  using T = flowforge::detail::TaskDependencyToml;
  static constexpr auto value = object("task", &T::task, "label", &T::label);
};

template <> struct meta<flowforge::detail::WorkflowDefaultsToml> {
  using T = flowforge::detail::WorkflowDefaultsToml;
  static constexpr auto value = object(
      "executor", &T::executor, "timeout_sec", &T::timeout_sec, "max_retries",
      &T::max_retries, "backoff_base_ms", &T::backoff_base_ms,
      "backoff_cap_ms", &T::backoff_cap_ms, "backoff_multiplier",
      &T::backoff_multiplier, "backoff_jitter", &T::backoff_jitter);
};

template <> struct meta<flowforge::detail::TaskToml> {
  using T = flowforge::detail::TaskToml;
  static constexpr auto value = object(
      "name", &T::name, "description", &T::description, "command",
      &T::command, "executor", &T::executor, "timeout_sec", &T::timeout_sec,
      "max_retries", &T::max_retries, "backoff_base_ms", &T::backoff_base_ms,
      "backoff_cap_ms", &T::backoff_cap_ms, "backoff_multiplier",
      &T::backoff_multiplier, "backoff_jitter", &T::backoff_jitter, "branch",
      &T::branch, "dependencies", &T::dependencies);
};

template <> struct meta<flowforge::detail::WorkflowToml> {
  using T = flowforge::detail::WorkflowToml;
  static constexpr auto value =
      object("name", &T::name, "version", &T::version, "description",
             &T::description, "failure_policy", &T::failure_policy,
             "defaults", &T::defaults, "tasks", &T::tasks);
};
} // namespace glz

namespace flowforge {
namespace {

auto set_diagnostic(std::string *diagnostic, std::string message) -> void {
  if (diagnostic) {
    *diagnostic = std::move(message);
  }
}

// First non-negative of task value, file default; else the engine default.
template <typename T, typename U>
[[nodiscard]] auto pick(T task_value, T file_value, U engine_value) -> U {
  if (task_value >= T{}) {
    return U{task_value};
  }
  if (file_value >= T{}) {
    return U{file_value};
  }
  return engine_value;
}

[[nodiscard]] auto resolve_executor(std::string_view task_value,
                                    std::string_view file_value)
    -> std::optional<ExecutorType> {
  auto token = !task_value.empty() ? task_value : file_value;
  if (token.empty()) {
    return ExecutorType::Shell;
  }
  if (!util::is_known_enum_token<ExecutorType>(token)) {
    return std::nullopt;
  }
  return parse<ExecutorType>(token);
}

[[nodiscard]] auto build_task(const detail::TaskToml &raw,
                              const detail::WorkflowDefaultsToml &file,
                              const TaskDefaults &engine,
                              std::string *diagnostic) -> Result<TaskSpec> {
  auto executor = resolve_executor(raw.executor, file.executor);
  if (!executor) {
    set_diagnostic(diagnostic,
                   std::format("task '{}': unknown executor '{}'", raw.name,
                               raw.executor.empty() ? file.executor
                                                    : raw.executor));
    return fail(Error::InvalidArgument);
  }

  RetryPolicy retry{
      .max_retries = pick(raw.max_retries, file.max_retries,
                          engine.retry.max_retries),
      .backoff_base = pick(raw.backoff_base_ms, file.backoff_base_ms,
                           engine.retry.backoff_base),
      .backoff_cap = pick(raw.backoff_cap_ms, file.backoff_cap_ms,
                          engine.retry.backoff_cap),
      .multiplier = pick(raw.backoff_multiplier, file.backoff_multiplier,
                         engine.retry.multiplier),
      .jitter = pick(raw.backoff_jitter, file.backoff_jitter,
                     engine.retry.jitter),
  };
  const auto timeout = pick(raw.timeout_sec, file.timeout_sec,
                            std::chrono::duration_cast<std::chrono::seconds>(
                                engine.timeout));

  auto builder = TaskSpec::builder()
                     .name(raw.name)
                     .description(raw.description)
                     .retry(retry)
                     .timeout(timeout)
                     .branch(raw.branch);
  auto spec = *executor == ExecutorType::Shell
                  ? std::move(builder).shell(raw.command).build()
                  : std::move(builder).callable(raw.command).build();
  if (!spec) {
    set_diagnostic(diagnostic,
                   std::format("task '{}': missing name or command, "
                               "non-positive timeout or invalid retry policy",
                               raw.name));
    return fail(spec.error());
  }
  return spec;
}

[[nodiscard]] auto convert(detail::WorkflowToml raw, const TaskDefaults &engine,
                           std::string *diagnostic) -> Result<WorkflowSpec> {
  if (raw.name.empty()) {
    set_diagnostic(diagnostic, "workflow has no name");
    return fail(Error::InvalidArgument);
  }

  auto policy = engine.failure_policy;
  if (!raw.failure_policy.empty()) {
    if (!util::is_known_enum_token<FailurePolicy>(raw.failure_policy)) {
      set_diagnostic(diagnostic, std::format("unknown failure_policy '{}'",
                                             raw.failure_policy));
      return fail(Error::InvalidArgument);
    }
    policy = parse<FailurePolicy>(raw.failure_policy);
  }

  WorkflowSpec spec{.name = WorkflowName{raw.name},
                    .version = raw.version,
                    .description = std::move(raw.description),
                    .failure_policy = policy,
                    .tasks = {},
                    .edges = {}};
  spec.tasks.reserve(raw.tasks.size());

  for (const auto &task : raw.tasks) {
    auto task_spec = build_task(task, raw.defaults, engine, diagnostic);
    if (!task_spec) {
      return fail(task_spec.error());
    }
    spec.tasks.push_back(std::move(*task_spec));

    for (const auto &dep : task.dependencies) {
      if (const auto *name = std::get_if<std::string>(&dep)) {
        spec.edges.push_back(
            Edge{TaskName{*name}, TaskName{task.name}, std::string{}});
      } else {
        const auto &labelled = std::get<detail::TaskDependencyToml>(dep);
        spec.edges.push_back(Edge{TaskName{labelled.task},
                                  TaskName{task.name}, labelled.label});
      }
    }
  }
  return ok(std::move(spec));
}

auto convert_logged(detail::WorkflowToml raw, const TaskDefaults &defaults,
                    std::string *diagnostic) -> Result<WorkflowSpec> {
  auto spec = convert(std::move(raw), defaults, diagnostic);
  if (spec) {
    log::debug("loaded workflow {} with {} task(s)", spec->name,
               spec->tasks.size());
  }
  return spec;
}

} // namespace

auto WorkflowLoader::load_file(std::string_view path,
                               std::string *diagnostic) const
    -> Result<WorkflowSpec> {
  return toml_util::load<detail::WorkflowToml>(path, diagnostic)
      .and_then([&](detail::WorkflowToml raw) {
        return convert_logged(std::move(raw), defaults_, diagnostic);
      });
}

auto WorkflowLoader::load_string(std::string_view toml,
                                 std::string *diagnostic) const
    -> Result<WorkflowSpec> {
  return toml_util::parse<detail::WorkflowToml>(toml, {}, diagnostic)
      .and_then([&](detail::WorkflowToml raw) {
        return convert_logged(std::move(raw), defaults_, diagnostic);
      });
}

} // namespace flowforge
