#include "devtasks/cli/commands.hpp"
#include "devtasks/cli/formatting.hpp"
#include "devtasks/config/task_file.hpp"
#include "devtasks/graph/task_graph.hpp"
#include "devtasks/util/json.hpp"
#include "devtasks/util/log.hpp"

#include <format>
#include <print>
#include <string>

namespace devtasks::cli {

namespace {

struct ValidationResult {
  bool valid{false};
  std::size_t task_count{0};
  std::string error;
};

auto validate_file(const std::string &file) -> ValidationResult {
  ValidationResult vr;
  std::string diagnostic;
  auto res = TaskFileLoader::load_from_file(file, &diagnostic)
                 .and_then([&](TaskFile &&loaded) -> Result<std::size_t> {
                   return TaskGraph::build(std::move(loaded.tasks), {},
                                           &diagnostic)
                       .transform([](const auto &graph) {
                         return graph->size();
                       });
                 });
  vr.valid = res.has_value();
  if (vr.valid) {
    vr.task_count = *res;
  } else {
    vr.error = diagnostic.empty() ? res.error().message()
                                  : std::format("{}: {}",
                                                res.error().message(),
                                                diagnostic);
  }
  return vr;
}

} // namespace

auto cmd_validate(const ValidateOptions &opts) -> int {
  log::set_output_stderr();
  auto vr = validate_file(opts.file);

  if (opts.json) {
    JsonValue output{
        {"file", opts.file},
        {"valid", vr.valid},
        {"tasks", static_cast<std::int64_t>(vr.task_count)},
    };
    if (!vr.valid) {
      output.get_object().emplace("error", vr.error);
    }
    std::println("{}", dump_json(output));
  } else if (vr.valid) {
    const bool color = fmt::ansi::is_tty(stdout);
    std::println("{} {} ({} tasks)",
                 fmt::ansi::colorize("✓", fmt::ansi::kGreen, color),
                 opts.file, vr.task_count);
  } else {
    const bool color = fmt::ansi::is_tty(stdout);
    std::println("{} {}: {}",
                 fmt::ansi::colorize("✗", fmt::ansi::kRed, color),
                 opts.file, vr.error);
  }
  return vr.valid ? 0 : 1;
}

} // namespace devtasks::cli
