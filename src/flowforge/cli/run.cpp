#include "flowforge/cli/commands.hpp"
#include "flowforge/cli/formatting.hpp"
#include "flowforge/config/config.hpp"
#include "flowforge/config/workflow_loader.hpp"
#include "flowforge/engine/engine.hpp"
#include "flowforge/run/run_json.hpp"
#include "flowforge/util/log.hpp"
#include "flowforge/util/time.hpp"

#include <chrono>
#include <format>
#include <print>
#include <string>

namespace flowforge::cli {

namespace {

auto print_table(const RunSnapshot &snapshot) -> void {
  const auto &run = snapshot.run;
  std::println("Run {} of {}: {}", run.id, run.definition,
               fmt::colorize_run_status(to_string_view(run.status)));
  if (!run.error.empty()) {
    std::println("  {}", run.error);
  }
  std::println("");

  fmt::Table attempts({{"TASK", 20},
                       {"#", 3, true},
                       {"STATUS", 10},
                       {"BACKOFF", 8, true},
                       {"ELAPSED", 8, true},
                       {"EXIT", 5, true},
                       {"OUTPUT", 40}});
  attempts.print_header();
  for (const auto &record : snapshot.attempts) {
    const auto &detail = record.error.empty() ? record.result : record.error;
    attempts.print_row({
        fmt::truncate(record.task.value(), 20),
        std::to_string(record.attempt),
        fmt::colorize_attempt_status(to_string_view(record.status)),
        std::format("{}ms", record.backoff.count()),
        util::format_elapsed(record.started_at, record.finished_at),
        std::to_string(record.exit_code),
        fmt::truncate(detail, 40),
    });
  }

  bool untouched = false;
  for (const auto &view : snapshot.tasks) {
    untouched = untouched || view.attempts == 0;
  }
  if (!untouched) {
    return;
  }
  std::println("");
  fmt::Table tasks({{"TASK", 20}, {"STATE", 16}});
  tasks.print_header();
  for (const auto &view : snapshot.tasks) {
    if (view.attempts == 0) {
      tasks.print_row({fmt::truncate(view.task.value(), 20),
                       fmt::colorize_task_state(to_string_view(view.state))});
    }
  }
}

} // namespace

auto parse_param(std::string_view text)
    -> Result<std::pair<std::string, std::string>> {
  auto eq = text.find('=');
  if (eq == std::string_view::npos || eq == 0) {
    return fail(Error::InvalidArgument);
  }
  return ok(std::pair{std::string(text.substr(0, eq)),
                      std::string(text.substr(eq + 1))});
}

auto cmd_run(const RunOptions &opts) -> int {
  std::string diagnostic;
  auto cfg = opts.config_file.empty()
                 ? ConfigLoader::load_defaults(&diagnostic)
                 : ConfigLoader::load_from_file(opts.config_file, &diagnostic);
  if (!cfg) {
    std::println(stderr, "Error: config: {}",
                 diagnostic.empty() ? cfg.error().message() : diagnostic);
    return 1;
  }
  if (!opts.config_file.empty()) {
    if (auto r = configure_logging(cfg->log); !r) {
      std::println(stderr, "Error: cannot open log file {}: {}", cfg->log.file,
                   r.error().message());
      return 1;
    }
  }
  if (opts.log_level) {
    log::set_level(*opts.log_level);
  }

  RunParams params;
  for (const auto &text : opts.params) {
    auto kv = parse_param(text);
    if (!kv) {
      std::println(stderr, "Error: parameter '{}' is not key=value", text);
      return 1;
    }
    params.insert_or_assign(std::move(kv->first), std::move(kv->second));
  }

  WorkflowLoader loader{cfg->defaults};
  auto spec = loader.load_file(opts.file, &diagnostic);
  if (!spec) {
    std::println(stderr, "Error: {}: {}", opts.file,
                 diagnostic.empty() ? spec.error().message() : diagnostic);
    return 1;
  }

  log::start();
  Engine engine{*cfg};
  if (auto r = engine.start(); !r) {
    std::println(stderr, "Error: engine failed to start: {}",
                 r.error().message());
    log::stop();
    return 1;
  }

  auto finish = [&](int code) {
    engine.stop();
    log::stop();
    return code;
  };

  auto id = engine.register_workflow(std::move(*spec), &diagnostic);
  if (!id) {
    std::println(stderr, "Invalid: {}: {}", opts.file,
                 diagnostic.empty() ? id.error().message() : diagnostic);
    return finish(1);
  }

  StartOptions options;
  if (opts.fail_fast) {
    options.failure_policy = FailurePolicy::FailFast;
  }
  auto run_id = engine.start_run(*id, std::move(params), options);
  if (!run_id) {
    std::println(stderr, "Error: cannot start run: {}",
                 run_id.error().message());
    return finish(1);
  }

  const auto timeout = opts.timeout_sec > 0
                           ? std::chrono::milliseconds{std::chrono::seconds{
                                 opts.timeout_sec}}
                           : std::chrono::milliseconds{std::chrono::hours{
                                 24 * 365}};
  auto snapshot = engine.wait(*run_id, timeout);
  if (!snapshot) {
    std::println(stderr, "Error: run {} did not finish: {}", *run_id,
                 snapshot.error().message());
    std::ignore = engine.cancel(*run_id);
    return finish(1);
  }

  if (opts.json) {
    auto doc = to_json(*snapshot, true);
    if (!doc) {
      std::println(stderr, "Error: cannot serialize run: {}",
                   doc.error().message());
      return finish(1);
    }
    std::println("{}", *doc);
  } else {
    print_table(*snapshot);
  }
  return finish(snapshot->run.status == RunStatus::Succeeded ? 0 : 1);
}

} // namespace flowforge::cli
