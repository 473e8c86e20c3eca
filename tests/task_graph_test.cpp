#include "devtasks/graph/task_graph.hpp"
#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <algorithm>
#include <string>
#include <vector>

using namespace devtasks;
using devtasks::test::make_task;
using devtasks::test::task_name;

namespace {

auto order_names(const TaskGraph &graph) -> std::vector<std::string> {
  std::vector<std::string> names;
  for (auto idx : graph.tasks_order()) {
    names.push_back(graph.name(idx).str());
  }
  return names;
}

auto position(const std::vector<std::string> &order, std::string_view name)
    -> std::ptrdiff_t {
  return std::ranges::find(order, std::string(name)) - order.begin();
}

} // namespace

TEST(TaskGraphTest, EmptyDefinitionsBuildEmptyGraph) {
  auto graph = TaskGraph::build({}, {});
  ASSERT_TRUE(graph.has_value());
  EXPECT_TRUE((*graph)->empty());
  EXPECT_EQ((*graph)->size(), 0);
  EXPECT_TRUE((*graph)->tasks_order().empty());
}

TEST(TaskGraphTest, DiamondOrderPutsDependenciesFirst) {
  std::vector<TaskDefinition> defs;
  defs.push_back(make_task("deploy", {"test", "lint"}));
  defs.push_back(make_task("test", {"build"}));
  defs.push_back(make_task("lint", {"build"}));
  defs.push_back(make_task("build"));

  auto graph = TaskGraph::build(std::move(defs), {});
  ASSERT_TRUE(graph.has_value());
  auto order = order_names(**graph);
  ASSERT_EQ(order.size(), 4);
  EXPECT_EQ(order.front(), "build");
  EXPECT_EQ(order.back(), "deploy");
  EXPECT_LT(position(order, "build"), position(order, "test"));
  EXPECT_LT(position(order, "build"), position(order, "lint"));
}

TEST(TaskGraphTest, IndependentTasksKeepDefinitionOrder) {
  std::vector<TaskDefinition> defs;
  defs.push_back(make_task("c"));
  defs.push_back(make_task("a"));
  defs.push_back(make_task("b"));

  auto graph = TaskGraph::build(std::move(defs), {});
  ASSERT_TRUE(graph.has_value());
  EXPECT_EQ(order_names(**graph), (std::vector<std::string>{"c", "a", "b"}));
}

TEST(TaskGraphTest, EdgesAreVisibleInBothDirections) {
  std::vector<TaskDefinition> defs;
  defs.push_back(make_task("build"));
  defs.push_back(make_task("test", {"build"}));

  auto graph = TaskGraph::build(std::move(defs), {});
  ASSERT_TRUE(graph.has_value());
  const auto &g = **graph;
  auto build = g.get_index(task_name("build"));
  auto test = g.get_index(task_name("test"));
  ASSERT_NE(build, kInvalidNode);
  ASSERT_NE(test, kInvalidNode);

  ASSERT_EQ(g.deps_view(test).size(), 1);
  EXPECT_EQ(g.deps_view(test)[0], build);
  ASSERT_EQ(g.dependents_view(build).size(), 1);
  EXPECT_EQ(g.dependents_view(build)[0], test);
  EXPECT_TRUE(g.deps_view(build).empty());
}

TEST(TaskGraphTest, DuplicateDependencyIsCollapsed) {
  std::vector<TaskDefinition> defs;
  defs.push_back(make_task("build"));
  defs.push_back(make_task("test", {"build", "build"}));

  auto graph = TaskGraph::build(std::move(defs), {});
  ASSERT_TRUE(graph.has_value());
  auto test = (*graph)->get_index(task_name("test"));
  EXPECT_EQ((*graph)->deps_view(test).size(), 1);
}

TEST(TaskGraphTest, DuplicateNameIsRejected) {
  std::vector<TaskDefinition> defs;
  defs.push_back(make_task("build"));
  defs.push_back(make_task("build"));

  std::string diagnostic;
  auto graph = TaskGraph::build(std::move(defs), {}, &diagnostic);
  ASSERT_FALSE(graph.has_value());
  EXPECT_EQ(graph.error(), make_error_code(Error::DuplicateTask));
  EXPECT_NE(diagnostic.find("build"), std::string::npos);
}

TEST(TaskGraphTest, UnknownDependencyIsRejected) {
  std::vector<TaskDefinition> defs;
  defs.push_back(make_task("test", {"build"}));

  std::string diagnostic;
  auto graph = TaskGraph::build(std::move(defs), {}, &diagnostic);
  ASSERT_FALSE(graph.has_value());
  EXPECT_EQ(graph.error(), make_error_code(Error::UnknownDependency));
  EXPECT_NE(diagnostic.find("'build'"), std::string::npos);
}

TEST(TaskGraphTest, CycleIsRejectedWithPath) {
  std::vector<TaskDefinition> defs;
  defs.push_back(make_task("a", {"b"}));
  defs.push_back(make_task("b", {"c"}));
  defs.push_back(make_task("c", {"a"}));

  std::string diagnostic;
  auto graph = TaskGraph::build(std::move(defs), {}, &diagnostic);
  ASSERT_FALSE(graph.has_value());
  EXPECT_EQ(graph.error(), make_error_code(Error::CycleDetected));
  EXPECT_EQ(diagnostic, "dependency cycle: a -> b -> c -> a");
}

TEST(TaskGraphTest, SelfDependencyIsACycle) {
  std::vector<TaskDefinition> defs;
  defs.push_back(make_task("a", {"a"}));

  auto graph = TaskGraph::build(std::move(defs), {});
  ASSERT_FALSE(graph.has_value());
  EXPECT_EQ(graph.error(), make_error_code(Error::CycleDetected));
}

TEST(TaskGraphTest, CycleOutsideSelectedRootsStillFails) {
  std::vector<TaskDefinition> defs;
  defs.push_back(make_task("ok"));
  defs.push_back(make_task("x", {"y"}));
  defs.push_back(make_task("y", {"x"}));

  auto graph = TaskGraph::build(std::move(defs), {task_name("ok")});
  ASSERT_FALSE(graph.has_value());
  EXPECT_EQ(graph.error(), make_error_code(Error::CycleDetected));
}

TEST(TaskGraphTest, RootsSelectTransitiveDependenciesOnly) {
  std::vector<TaskDefinition> defs;
  defs.push_back(make_task("build"));
  defs.push_back(make_task("test", {"build"}));
  defs.push_back(make_task("docs"));
  defs.push_back(make_task("release", {"test"}));

  auto graph = TaskGraph::build(std::move(defs), {task_name("release")});
  ASSERT_TRUE(graph.has_value());
  EXPECT_EQ(order_names(**graph),
            (std::vector<std::string>{"build", "test", "release"}));
  EXPECT_EQ((*graph)->get_index(task_name("docs")), kInvalidNode);
  ASSERT_EQ((*graph)->root_names().size(), 1);
  EXPECT_EQ((*graph)->root_names()[0], "release");
}

TEST(TaskGraphTest, RepeatedRootsAreDeduplicated) {
  std::vector<TaskDefinition> defs;
  defs.push_back(make_task("build"));
  defs.push_back(make_task("test", {"build"}));

  auto graph = TaskGraph::build(
      std::move(defs), {task_name("test"), task_name("test")});
  ASSERT_TRUE(graph.has_value());
  EXPECT_EQ((*graph)->root_names().size(), 1);
  EXPECT_EQ((*graph)->size(), 2);
}

TEST(TaskGraphTest, UnknownRootIsRejected) {
  std::vector<TaskDefinition> defs;
  defs.push_back(make_task("build"));

  std::string diagnostic;
  auto graph =
      TaskGraph::build(std::move(defs), {task_name("missing")}, &diagnostic);
  ASSERT_FALSE(graph.has_value());
  EXPECT_EQ(graph.error(), make_error_code(Error::UnknownTask));
  EXPECT_EQ(diagnostic, "unknown task 'missing'");
}

TEST(TaskGraphTest, EmptyRootsSelectEveryTask) {
  std::vector<TaskDefinition> defs;
  defs.push_back(make_task("a"));
  defs.push_back(make_task("b"));

  auto graph = TaskGraph::build(std::move(defs), {});
  ASSERT_TRUE(graph.has_value());
  EXPECT_EQ((*graph)->root_names().size(), 2);
}

TEST(TaskGraphTest, CellsStartPendingAndPointAtDefinitions) {
  std::vector<TaskDefinition> defs;
  defs.push_back(make_task("compile", {}, std::nullopt));

  auto graph = TaskGraph::build(std::move(defs), {});
  ASSERT_TRUE(graph.has_value());
  const auto &cell = (*graph)->cell(0);
  auto view = cell.read();
  EXPECT_EQ(view.kind(), StatusKind::Pending);
  EXPECT_EQ(view.definition().name, "compile");
  EXPECT_FALSE(view.definition().has_command());
  EXPECT_EQ((*graph)->longest_task_name(), 7);
}
