#include "devtasks/cli/commands.hpp"
#include "devtasks/cli/formatting.hpp"
#include "devtasks/cli/task_reporter.hpp"
#include "devtasks/engine/engine.hpp"
#include "devtasks/util/json.hpp"
#include "devtasks/util/log.hpp"

#include <cstdint>
#include <filesystem>
#include <print>
#include <string>
#include <vector>

namespace devtasks::cli {

namespace {

auto apply_log_level(const RunOptions &opts, const TaskFileSettings &settings)
    -> bool {
  if (opts.log_level) {
    if (!log::set_level(*opts.log_level)) {
      std::println(stderr, "Error: unknown log level '{}'", *opts.log_level);
      return false;
    }
    return true;
  }
  if (opts.verbose) {
    log::set_level(log::Level::Debug);
  } else if (settings.log_level) {
    log::set_level(*settings.log_level);
  }
  return true;
}

auto resolve_verbosity(const RunOptions &opts,
                       const TaskFileSettings &settings) -> Verbosity {
  if (opts.quiet) {
    return Verbosity::Quiet;
  }
  if (opts.verbose) {
    return Verbosity::Verbose;
  }
  return settings.verbosity.value_or(Verbosity::Normal);
}

// The engine never writes to the cache; fingerprints of tasks that
// succeeded are recorded here so the next run can skip them.
auto record_successes(const Engine &engine) -> void {
  const auto &graph = engine.graph();
  std::size_t recorded = 0;
  for (auto idx : graph.tasks_order()) {
    if (graph.cell(idx).read().kind() != StatusKind::Succeeded) {
      continue;
    }
    auto fingerprint = engine.fingerprint_of(idx);
    if (!fingerprint) {
      continue;
    }
    if (auto res = engine.cache()->record(*fingerprint); !res) {
      log::warn("Failed to record cache entry for {}: {}", graph.name(idx),
                res.error().message());
      continue;
    }
    ++recorded;
  }
  log::debug("Recorded {} cache entries", recorded);
}

auto run_to_json(const Engine &engine, const RunResult &result) -> JsonValue {
  const auto &graph = engine.graph();
  JsonValue tasks = std::vector<JsonValue>{};
  for (auto idx : graph.tasks_order()) {
    tasks.get_array().emplace_back(JsonValue{
        {"name", graph.name(idx).str()},
        {"status",
         std::string(to_string_view(graph.cell(idx).read().kind()))},
    });
  }

  JsonValue outputs = JsonValue::object_t{};
  for (const auto &[name, value] : result.outputs) {
    outputs.get_object().emplace(name.str(), value);
  }

  const auto &s = result.summary;
  return JsonValue{
      {"summary",
       JsonValue{
           {"succeeded", static_cast<std::int64_t>(s.succeeded)},
           {"failed", static_cast<std::int64_t>(s.failed)},
           {"skipped", static_cast<std::int64_t>(s.skipped)},
           {"dependency_failed",
            static_cast<std::int64_t>(s.dependency_failed)},
       }},
      {"tasks", std::move(tasks)},
      {"outputs", std::move(outputs)},
  };
}

auto run_tasks(const RunOptions &opts, TaskFile file) -> int {
  const auto verbosity = resolve_verbosity(opts, file.settings);
  const bool tty = fmt::ansi::is_tty(stderr);

  EngineOptions options;
  if (opts.no_cache) {
    options.cache = std::make_shared<MemoryCache>();
  } else if (opts.cache_path) {
    options.cache_path = std::filesystem::path{*opts.cache_path};
  } else if (file.settings.cache_path) {
    options.cache_path = *file.settings.cache_path;
  } else {
    options.cache_path =
        std::filesystem::absolute(file.path).parent_path() / kDefaultCachePath;
  }
  if (verbosity == Verbosity::Verbose) {
    options.on_line = TaskReporter::line_printer(stderr, tty);
  }

  EngineConfig config{.tasks = std::move(file.tasks), .roots = {}};
  for (const auto &root : opts.roots) {
    config.roots.emplace_back(root);
  }

  std::string diagnostic;
  auto engine = Engine::create(std::move(config), verbosity,
                               std::move(options), &diagnostic);
  if (!engine) {
    std::println(stderr, "Error: {}{}{}", engine.error().message(),
                 diagnostic.empty() ? "" : ": ", diagnostic);
    return 1;
  }

  TaskReporter reporter(*engine, stderr, tty);
  auto result = reporter.run();
  if (!result) {
    std::println(stderr, "Error: {}", result.error().message());
    return 1;
  }

  record_successes(**engine);

  if (opts.json) {
    std::println("{}", dump_json(run_to_json(**engine, *result)));
  }
  return result->summary.has_failures() ? 1 : 0;
}

} // namespace

auto cmd_run(const RunOptions &opts) -> int {
  log::set_output_stderr();

  auto file = load_task_file(opts.file);
  if (!file) {
    return 1;
  }
  if (!apply_log_level(opts, file->settings)) {
    return 1;
  }
  if (opts.log_file && !log::set_output_file(*opts.log_file)) {
    std::println(stderr, "Error: cannot open log file {}", *opts.log_file);
    return 1;
  }

  log::start();
  const int rc = run_tasks(opts, std::move(*file));
  log::stop();
  return rc;
}

} // namespace devtasks::cli
