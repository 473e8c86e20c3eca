#pragma once

#include "devtasks/core/error.hpp"
#include "devtasks/task/task_definition.hpp"
#include "devtasks/task/task_state_cell.hpp"
#include "devtasks/util/id.hpp"

#include <ankerl/unordered_dense.h>

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace devtasks {

class Engine;

using NodeIndex = std::uint32_t;
constexpr NodeIndex kInvalidNode = UINT32_MAX;

// Immutable dependency graph of the tasks selected for one run, plus the
// per-task state cells. Node indices follow definition order.
class TaskGraph {
public:
  // Validates the full definition set, then keeps `roots` and their
  // transitive dependencies. Empty `roots` selects every task.
  [[nodiscard]] static auto build(std::vector<TaskDefinition> definitions,
                                  const std::vector<TaskName> &roots,
                                  std::string *diagnostic = nullptr)
      -> Result<std::unique_ptr<TaskGraph>>;

  TaskGraph(const TaskGraph &) = delete;
  auto operator=(const TaskGraph &) -> TaskGraph & = delete;

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return nodes_.size();
  }
  [[nodiscard]] auto empty() const noexcept -> bool { return nodes_.empty(); }

  [[nodiscard]] auto tasks_order() const noexcept
      -> std::span<const NodeIndex> {
    return order_;
  }
  [[nodiscard]] auto root_names() const noexcept
      -> std::span<const TaskName> {
    return roots_;
  }
  [[nodiscard]] auto longest_task_name() const noexcept -> std::size_t {
    return longest_name_;
  }

  [[nodiscard]] auto get_index(const TaskName &name) const -> NodeIndex;
  [[nodiscard]] auto name(NodeIndex idx) const -> const TaskName &;
  [[nodiscard]] auto definition(NodeIndex idx) const -> const TaskDefinition &;
  [[nodiscard]] auto cell(NodeIndex idx) const -> const TaskStateCell &;

  [[nodiscard]] auto deps_view(NodeIndex idx) const noexcept
      -> std::span<const NodeIndex>;
  [[nodiscard]] auto dependents_view(NodeIndex idx) const noexcept
      -> std::span<const NodeIndex>;

private:
  friend class Engine;

  TaskGraph() = default;

  [[nodiscard]] auto mutable_cell(NodeIndex idx) -> TaskStateCell & {
    return *cells_.at(idx);
  }

  struct Node {
    std::vector<NodeIndex> deps;
    std::vector<NodeIndex> dependents;
  };

  std::vector<TaskDefinition> definitions_;
  std::vector<Node> nodes_;
  std::vector<std::unique_ptr<TaskStateCell>> cells_;
  std::vector<NodeIndex> order_;
  std::vector<TaskName> roots_;
  ankerl::unordered_dense::map<TaskName, NodeIndex> name_to_idx_;
  std::size_t longest_name_{0};
};

} // namespace devtasks
