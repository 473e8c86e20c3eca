#include "devtasks/cli/commands.hpp"
#include "devtasks/cli/formatting.hpp"
#include "devtasks/graph/task_graph.hpp"
#include "devtasks/util/json.hpp"
#include "devtasks/util/log.hpp"

#include <algorithm>
#include <print>
#include <string>
#include <vector>

namespace devtasks::cli {

namespace {

auto join_deps(const TaskGraph &graph, NodeIndex idx) -> std::string {
  std::string out;
  for (auto dep : graph.deps_view(idx)) {
    if (!out.empty()) {
      out += ", ";
    }
    out += graph.name(dep).str();
  }
  return out;
}

} // namespace

auto cmd_list(const ListOptions &opts) -> int {
  log::set_output_stderr();
  auto file = load_task_file(opts.file);
  if (!file) {
    return 1;
  }

  std::string diagnostic;
  auto graph_res = TaskGraph::build(std::move(file->tasks), {}, &diagnostic);
  if (!graph_res) {
    std::println(stderr, "Error: {}: {}", graph_res.error().message(),
                 diagnostic);
    return 1;
  }
  const auto &graph = **graph_res;

  if (opts.json) {
    JsonValue arr = std::vector<JsonValue>{};
    for (auto idx : graph.tasks_order()) {
      const auto &def = graph.definition(idx);
      JsonValue deps = std::vector<JsonValue>{};
      for (auto dep : graph.deps_view(idx)) {
        deps.get_array().emplace_back(graph.name(dep).str());
      }
      JsonValue obj{
          {"name", def.name.str()},
          {"description", def.description},
          {"depends", std::move(deps)},
      };
      if (def.command) {
        obj.get_object().emplace("command", *def.command);
      }
      arr.get_array().emplace_back(std::move(obj));
    }
    std::println("{}", dump_json(arr));
    return 0;
  }

  if (graph.empty()) {
    std::println("No tasks defined in {}", opts.file);
    return 0;
  }

  const auto name_width = std::max<std::size_t>(graph.longest_task_name(), 4);
  fmt::Table table({{"TASK", name_width},
                    {"DEPENDS ON", 30},
                    {"DESCRIPTION", 40}});
  table.print_header();
  for (auto idx : graph.tasks_order()) {
    const auto &def = graph.definition(idx);
    auto deps = join_deps(graph, idx);
    table.print_row({def.name.str(), deps.empty() ? "-" : deps,
                     def.description.empty()
                         ? (def.command ? "" : "(not implemented)")
                         : def.description});
  }
  return 0;
}

} // namespace devtasks::cli
