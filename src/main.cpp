#include "flowforge/cli/commands.hpp"
#include "flowforge/util/log.hpp"

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <string>

namespace {
auto default_config() -> std::string {
  if (const char *env = std::getenv("FLOWFORGE_CONFIG"); env && *env) {
    return env;
  }
  return {};
}
} // namespace

int main(int argc, char *argv[]) {
  // Keep CLI output clean by default; -c or --log-level raise verbosity.
  flowforge::log::set_output_stderr();
  flowforge::log::set_level(flowforge::log::Level::Warn);

  CLI::App app{"flowforge", "A workflow orchestration engine"};
  app.require_subcommand(1);
  app.footer("\nExamples:\n"
             "  flowforge validate pipeline.toml\n"
             "  flowforge run pipeline.toml -p date=2024-01-01 --fail-fast\n"
             "\nTip: Set FLOWFORGE_CONFIG=engine.toml to skip -c on every "
             "command.");

  const std::string env_config = default_config();

  flowforge::cli::ValidateOptions validate_opts;
  auto *validate = app.add_subcommand(
      "validate", "Check a workflow file and print its topological order");
  validate_opts.config_file = env_config;
  validate->add_option("file", validate_opts.file, "Workflow TOML file")
      ->required()
      ->check(CLI::ExistingFile);
  validate
      ->add_option("-c,--config", validate_opts.config_file,
                   "Engine config file")
      ->check(CLI::ExistingFile);
  validate->add_flag("--json", validate_opts.json, "Output JSON");
  validate->callback([&validate_opts]() {
    std::exit(flowforge::cli::cmd_validate(validate_opts));
  });

  flowforge::cli::RunOptions run_opts;
  auto *run = app.add_subcommand(
      "run", "Run a workflow file to completion and print its attempts");
  run->footer("\nExit status is 0 when the run succeeded and 1 otherwise.");
  run_opts.config_file = env_config;
  run->add_option("file", run_opts.file, "Workflow TOML file")
      ->required()
      ->check(CLI::ExistingFile);
  run->add_option("-c,--config", run_opts.config_file, "Engine config file")
      ->check(CLI::ExistingFile);
  run->add_option("-p,--param", run_opts.params,
                  "Run parameter key=value (repeatable)");
  run->add_flag("--fail-fast", run_opts.fail_fast,
                "Fail the run on the first permanent task failure");
  run->add_flag("--json", run_opts.json, "Output the run snapshot as JSON");
  run->add_option("--timeout", run_opts.timeout_sec,
                  "Seconds to wait for the run (0 = no limit)");
  run->add_option("--log-level", run_opts.log_level,
                  "Log level override: trace|debug|info|warn|error");
  run->callback(
      [&run_opts]() { std::exit(flowforge::cli::cmd_run(run_opts)); });

  CLI11_PARSE(app, argc, argv);
  return 0;
}
