#include "devtasks/graph/task_graph.hpp"

#include "devtasks/util/log.hpp"

#include <algorithm>
#include <format>
#include <functional>
#include <queue>
#include <ranges>
#include <utility>

namespace devtasks {

namespace {

auto set_diagnostic(std::string *out, std::string message) -> void {
  log::debug("Task graph rejected: {}", message);
  if (out) {
    *out = std::move(message);
  }
}

using IndexMap = ankerl::unordered_dense::map<TaskName, std::size_t>;
using Adjacency = std::vector<std::vector<std::size_t>>;

// Iterative three-colour DFS. On a back edge, returns the cycle as a path of
// indices starting and ending at the same node.
auto find_cycle(const Adjacency &deps) -> std::vector<std::size_t> {
  enum : std::uint8_t { kWhite, kGrey, kBlack };
  std::vector<std::uint8_t> state(deps.size(), kWhite);
  std::vector<std::pair<std::size_t, std::size_t>> stack;
  stack.reserve(deps.size());

  for (std::size_t start = 0; start < deps.size(); ++start) {
    if (state[start] != kWhite) {
      continue;
    }
    stack.emplace_back(start, 0);
    state[start] = kGrey;

    while (!stack.empty()) {
      auto &[node, child_idx] = stack.back();
      const auto &edges = deps[node];
      if (child_idx < edges.size()) {
        std::size_t child = edges[child_idx++];
        if (state[child] == kGrey) {
          std::vector<std::size_t> cycle;
          auto it = std::ranges::find_if(
              stack, [&](const auto &frame) { return frame.first == child; });
          for (; it != stack.end(); ++it) {
            cycle.push_back(it->first);
          }
          cycle.push_back(child);
          return cycle;
        }
        if (state[child] == kWhite) {
          state[child] = kGrey;
          stack.emplace_back(child, 0);
        }
      } else {
        state[node] = kBlack;
        stack.pop_back();
      }
    }
  }
  return {};
}

} // namespace

auto TaskGraph::build(std::vector<TaskDefinition> definitions,
                      const std::vector<TaskName> &roots,
                      std::string *diagnostic)
    -> Result<std::unique_ptr<TaskGraph>> {
  IndexMap index;
  index.reserve(definitions.size());
  for (auto [i, def] : std::views::enumerate(definitions)) {
    if (!is_valid_id_text(def.name.value())) {
      set_diagnostic(diagnostic,
                     std::format("task #{} has an empty or invalid name", i));
      return fail(Error::InvalidArgument);
    }
    if (!index.emplace(def.name, static_cast<std::size_t>(i)).second) {
      set_diagnostic(diagnostic,
                     std::format("duplicate task name '{}'", def.name));
      return fail(Error::DuplicateTask);
    }
  }

  // Resolve and dedupe edges over the full definition set.
  Adjacency deps(definitions.size());
  for (auto [i, def] : std::views::enumerate(definitions)) {
    auto &edges = deps[static_cast<std::size_t>(i)];
    for (const auto &dep : def.dependencies) {
      auto it = index.find(dep);
      if (it == index.end()) {
        set_diagnostic(diagnostic,
                       std::format("task '{}' depends on unknown task '{}'",
                                   def.name, dep));
        return fail(Error::UnknownDependency);
      }
      if (std::ranges::find(edges, it->second) == edges.end()) {
        edges.push_back(it->second);
      }
    }
  }

  if (auto cycle = find_cycle(deps); !cycle.empty()) {
    std::string path;
    for (auto [n, idx] : std::views::enumerate(cycle)) {
      if (n > 0) {
        path += " -> ";
      }
      path += definitions[idx].name.str();
    }
    set_diagnostic(diagnostic, std::format("dependency cycle: {}", path));
    return fail(Error::CycleDetected);
  }

  // Root selection.
  std::vector<TaskName> root_names;
  std::vector<bool> selected(definitions.size(), roots.empty());
  if (roots.empty()) {
    for (const auto &def : definitions) {
      root_names.push_back(def.name);
    }
  } else {
    std::vector<std::size_t> frontier;
    for (const auto &root : roots) {
      auto it = index.find(root);
      if (it == index.end()) {
        set_diagnostic(diagnostic, std::format("unknown task '{}'", root));
        return fail(Error::UnknownTask);
      }
      if (std::ranges::find(root_names, root) == root_names.end()) {
        root_names.push_back(root);
      }
      if (!selected[it->second]) {
        selected[it->second] = true;
        frontier.push_back(it->second);
      }
    }
    while (!frontier.empty()) {
      auto current = frontier.back();
      frontier.pop_back();
      for (auto dep : deps[current]) {
        if (!selected[dep]) {
          selected[dep] = true;
          frontier.push_back(dep);
        }
      }
    }
  }

  auto graph = std::unique_ptr<TaskGraph>(new TaskGraph());
  graph->roots_ = std::move(root_names);

  std::vector<NodeIndex> remap(definitions.size(), kInvalidNode);
  for (std::size_t i = 0; i < definitions.size(); ++i) {
    if (selected[i]) {
      remap[i] = static_cast<NodeIndex>(graph->definitions_.size());
      graph->definitions_.push_back(std::move(definitions[i]));
    }
  }

  const auto count = graph->definitions_.size();
  graph->nodes_.resize(count);
  graph->cells_.reserve(count);
  graph->name_to_idx_.reserve(count);
  for (std::size_t i = 0; i < definitions.size(); ++i) {
    if (remap[i] == kInvalidNode) {
      continue;
    }
    auto idx = remap[i];
    for (auto dep : deps[i]) {
      graph->nodes_[idx].deps.push_back(remap[dep]);
      graph->nodes_[remap[dep]].dependents.push_back(idx);
    }
  }
  for (auto [i, def] : std::views::enumerate(graph->definitions_)) {
    graph->name_to_idx_.emplace(def.name, static_cast<NodeIndex>(i));
    graph->cells_.push_back(std::make_unique<TaskStateCell>(def));
    graph->longest_name_ = std::max(graph->longest_name_, def.name.size());
  }

  // Kahn's algorithm; the min-heap breaks ties by definition order.
  std::vector<std::size_t> in_degree;
  in_degree.reserve(count);
  for (const auto &node : graph->nodes_) {
    in_degree.push_back(node.deps.size());
  }
  std::priority_queue<NodeIndex, std::vector<NodeIndex>, std::greater<>> ready;
  for (auto [i, deg] : std::views::enumerate(in_degree)) {
    if (deg == 0) {
      ready.push(static_cast<NodeIndex>(i));
    }
  }
  graph->order_.reserve(count);
  while (!ready.empty()) {
    NodeIndex current = ready.top();
    ready.pop();
    graph->order_.push_back(current);
    for (NodeIndex dependent : graph->nodes_[current].dependents) {
      if (--in_degree[dependent] == 0) {
        ready.push(dependent);
      }
    }
  }

  log::debug("Task graph built: {} of {} tasks selected, {} roots", count,
             definitions.size(), graph->roots_.size());
  return ok(std::move(graph));
}

auto TaskGraph::get_index(const TaskName &name) const -> NodeIndex {
  auto it = name_to_idx_.find(name);
  return it != name_to_idx_.end() ? it->second : kInvalidNode;
}

auto TaskGraph::name(NodeIndex idx) const -> const TaskName & {
  return definitions_.at(idx).name;
}

auto TaskGraph::definition(NodeIndex idx) const -> const TaskDefinition & {
  return definitions_.at(idx);
}

auto TaskGraph::cell(NodeIndex idx) const -> const TaskStateCell & {
  return *cells_.at(idx);
}

auto TaskGraph::deps_view(NodeIndex idx) const noexcept
    -> std::span<const NodeIndex> {
  if (idx >= nodes_.size()) {
    return {};
  }
  return nodes_[idx].deps;
}

auto TaskGraph::dependents_view(NodeIndex idx) const noexcept
    -> std::span<const NodeIndex> {
  if (idx >= nodes_.size()) {
    return {};
  }
  return nodes_[idx].dependents;
}

} // namespace devtasks
