#include "flowforge/cli/commands.hpp"
#include "flowforge/config/config.hpp"
#include "flowforge/config/workflow_loader.hpp"
#include "flowforge/util/log.hpp"
#include "flowforge/workflow/definition.hpp"

#include <glaze/json.hpp>

#include <cstdio>
#include <filesystem>
#include <optional>
#include <print>
#include <string>
#include <vector>

namespace flowforge::cli {

namespace {

// `--json` output. Absent optionals are omitted from the document.
struct ValidateReport {
  std::string file;
  bool valid{false};
  std::optional<std::string> workflow;
  std::optional<std::vector<std::string>> order;
  std::optional<std::string> error;
};

auto load_task_defaults(const std::string &config_file, std::string *diagnostic)
    -> Result<TaskDefaults> {
  auto cfg = config_file.empty()
                 ? ConfigLoader::load_defaults(diagnostic)
                 : ConfigLoader::load_from_file(config_file, diagnostic);
  if (!cfg) {
    return fail(cfg.error());
  }
  return ok(std::move(cfg->defaults));
}

} // namespace

auto cmd_validate(const ValidateOptions &opts) -> int {
  log::set_output_stderr();
  if (!std::filesystem::exists(opts.file)) {
    std::println(stderr, "Error: File does not exist: {}", opts.file);
    return 1;
  }

  std::string diagnostic;
  auto defaults = load_task_defaults(opts.config_file, &diagnostic);
  if (!defaults) {
    std::println(stderr, "Error: config: {}",
                 diagnostic.empty() ? defaults.error().message() : diagnostic);
    return 1;
  }

  WorkflowLoader loader{*defaults};
  auto definition =
      loader.load_file(opts.file, &diagnostic)
          .and_then([&](WorkflowSpec spec) {
            return WorkflowDefinition::create(std::move(spec), &diagnostic);
          });

  if (opts.json) {
    ValidateReport report{.file = opts.file, .valid = definition.has_value()};
    if (definition) {
      const auto &def = **definition;
      report.workflow = def.id().name.str();
      report.order.emplace();
      for (auto idx : def.topological_order()) {
        report.order->push_back(def.task(idx).name.str());
      }
    } else {
      report.error =
          diagnostic.empty() ? definition.error().message() : diagnostic;
    }
    auto doc = glz::write_json(report);
    std::println("{}", doc ? *doc : std::string{"null"});
    return definition ? 0 : 1;
  }

  if (!definition) {
    std::println(stderr, "Invalid: {}: {}", opts.file,
                 diagnostic.empty() ? definition.error().message()
                                    : diagnostic);
    return 1;
  }

  const auto &def = **definition;
  std::println("Valid: {} ({} task(s), {} edge(s))", def.id().name,
               def.size(), def.spec().edges.size());
  std::size_t position = 1;
  for (auto idx : def.topological_order()) {
    std::println("  {:>3}. {}", position++, def.task(idx).name);
  }
  return 0;
}

} // namespace flowforge::cli
