#include "flowforge/run/run_json.hpp"

#include "flowforge/util/time.hpp"

#include <glaze/json.hpp>

#include <cstdint>
#include <format>
#include <map>
#include <string>
#include <vector>

namespace flowforge {
namespace detail {

struct AttemptJson {
  std::string task;
  std::uint32_t attempt{0};
  std::string status;
  std::string started_at;
  std::string finished_at;
  std::int64_t backoff_ms{0};
  int exit_code{0};
  std::string result;
  std::string error;
};

struct TaskJson {
  std::string task;
  std::string state;
  std::uint32_t attempts{0};
};

struct RunJson {
  std::string id;
  std::string workflow;
  std::uint32_t version{0};
  std::string status;
  std::string failure_policy;
  bool cancel_requested{false};
  std::string created_at;
  std::string started_at;
  std::string finished_at;
  std::string error;
  std::map<std::string, std::string> params;
  std::vector<TaskJson> tasks;
  std::vector<AttemptJson> attempts;
};

} // namespace detail
} // namespace flowforge

namespace glz {
template <> struct meta<flowforge::detail::AttemptJson> {
  using T = flowforge::detail::AttemptJson;
  static constexpr auto value =
      object("task", &T::task, "attempt", &T::attempt, "status", &T::status,
             "started_at", &T::started_at, "finished_at", &T::finished_at,
             "backoff_ms", &T::backoff_ms, "exit_code", &T::exit_code,
             "result", &T::result, "error", &T::error);
};

template <> struct meta<flowforge::detail::TaskJson> {
  using T = flowforge::detail::TaskJson;
  static constexpr auto value =
      object("task", &T::task, "state", &T::state, "attempts", &T::attempts);
};

template <> struct meta<flowforge::detail::RunJson> {
  using T = flowforge::detail::RunJson;
  static constexpr auto value = object(
      "id", &T::id, "workflow", &T::workflow, "version", &T::version,
      "status", &T::status, "failure_policy", &T::failure_policy,
      "cancel_requested", &T::cancel_requested, "created_at", &T::created_at,
      "started_at", &T::started_at, "finished_at", &T::finished_at, "error",
      &T::error, "params", &T::params, "tasks", &T::tasks, "attempts",
      &T::attempts);
};
} // namespace glz

namespace flowforge {

auto to_json(const RunSnapshot &snapshot, bool pretty) -> Result<std::string> {
  const auto &run = snapshot.run;
  detail::RunJson doc{
      .id = run.id.str(),
      .workflow = run.definition.name.str(),
      .version = run.definition.version,
      .status = std::string(to_string_view(run.status)),
      .failure_policy = std::string(to_string_view(run.failure_policy)),
      .cancel_requested = run.cancel_requested,
      .created_at = util::format_iso8601(run.created_at),
      .started_at = util::format_iso8601(run.started_at),
      .finished_at = util::format_iso8601(run.finished_at),
      .error = run.error,
      .params = {run.params.begin(), run.params.end()},
      .tasks = {},
      .attempts = {},
  };

  doc.tasks.reserve(snapshot.tasks.size());
  for (const auto &view : snapshot.tasks) {
    doc.tasks.push_back(detail::TaskJson{
        .task = view.task.str(),
        .state = std::string(to_string_view(view.state)),
        .attempts = view.attempts,
    });
  }

  doc.attempts.reserve(snapshot.attempts.size());
  for (const auto &record : snapshot.attempts) {
    doc.attempts.push_back(detail::AttemptJson{
        .task = record.task.str(),
        .attempt = record.attempt,
        .status = std::string(to_string_view(record.status)),
        .started_at = util::format_iso8601(record.started_at),
        .finished_at = util::format_iso8601(record.finished_at),
        .backoff_ms = record.backoff.count(),
        .exit_code = record.exit_code,
        .result = record.result,
        .error = record.error,
    });
  }

  std::string out;
  const auto ec = pretty ? glz::write<glz::opts{.prettify = true}>(doc, out)
                         : glz::write<glz::opts{}>(doc, out);
  if (ec) {
    return fail(Error::Unknown);
  }
  return ok(std::move(out));
}

} // namespace flowforge
