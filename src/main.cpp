#include "devtasks/cli/commands.hpp"
#include "devtasks/config/task_file.hpp"
#include "devtasks/util/log.hpp"

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <string>

namespace {
auto default_task_file() -> std::string {
  if (const char *env = std::getenv(devtasks::kTaskFileEnv.data());
      env && *env) {
    return env;
  }
  return std::string(devtasks::kDefaultTaskFile);
}
} // namespace

int main(int argc, char *argv[]) {
  devtasks::log::set_output_stderr();
  devtasks::log::set_level(devtasks::log::Level::Warn);

  CLI::App app{"devtasks", "Run interdependent development tasks"};
  app.require_subcommand(1);
  app.footer("\nExamples:\n"
             "  devtasks run build test\n"
             "  devtasks run -f ci/devtasks.toml --no-cache lint\n"
             "  devtasks list --json\n"
             "\nTip: Set DEVTASKS_FILE=path/to/devtasks.toml to skip -f on "
             "every command.");

  const std::string task_file = default_task_file();

  devtasks::cli::RunOptions run_opts;
  auto *run = app.add_subcommand("run", "Run tasks and their dependencies");
  run_opts.file = task_file;
  run->add_option("roots", run_opts.roots,
                  "Tasks to run (default: every task)");
  run->add_option("-f,--file", run_opts.file, "Task file")
      ->check(CLI::ExistingFile);
  auto *quiet = run->add_flag("-q,--quiet", run_opts.quiet,
                              "Only report failures");
  run->add_flag("-v,--verbose", run_opts.verbose,
                "Stream task output and debug logs")
      ->excludes(quiet);
  auto *cache_opt = run->add_option("--cache", run_opts.cache_path,
                                    "Cache file path");
  run->add_flag("--no-cache", run_opts.no_cache,
                "Use an in-memory cache for this run")
      ->excludes(cache_opt);
  run->add_option("--log-level", run_opts.log_level,
                  "Log level: trace|debug|info|warn|error");
  run->add_option("--log-file", run_opts.log_file, "Append logs to a file");
  run->add_flag("--json", run_opts.json, "Print the run result as JSON");
  run->callback(
      [&run_opts]() { std::exit(devtasks::cli::cmd_run(run_opts)); });

  devtasks::cli::ListOptions list_opts;
  auto *list = app.add_subcommand("list", "List tasks in dependency order");
  list_opts.file = task_file;
  list->add_option("-f,--file", list_opts.file, "Task file")
      ->check(CLI::ExistingFile);
  list->add_flag("--json", list_opts.json, "Output JSON");
  list->callback(
      [&list_opts]() { std::exit(devtasks::cli::cmd_list(list_opts)); });

  devtasks::cli::ValidateOptions validate_opts;
  auto *validate =
      app.add_subcommand("validate", "Check a task file and its graph");
  validate_opts.file = task_file;
  validate->add_option("-f,--file", validate_opts.file, "Task file");
  validate->add_flag("--json", validate_opts.json, "Output JSON");
  validate->callback([&validate_opts]() {
    std::exit(devtasks::cli::cmd_validate(validate_opts));
  });

  CLI11_PARSE(app, argc, argv);
  return 0;
}
