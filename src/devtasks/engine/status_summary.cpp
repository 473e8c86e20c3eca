#include "devtasks/engine/status_summary.hpp"

#include "devtasks/graph/task_graph.hpp"

#include <array>
#include <format>
#include <utility>

namespace devtasks {

auto StatusSummary::add(StatusKind kind) noexcept -> void {
  switch (kind) {
  case StatusKind::Pending:
    ++pending;
    break;
  case StatusKind::Running:
    ++running;
    break;
  case StatusKind::Succeeded:
    ++succeeded;
    break;
  case StatusKind::Failed:
    ++failed;
    break;
  case StatusKind::Cached:
  case StatusKind::NotImplemented:
    ++skipped;
    break;
  case StatusKind::DependencyFailed:
    ++dependency_failed;
    break;
  }
}

auto StatusSummary::describe() const -> std::string {
  const std::array<std::pair<std::size_t, std::string_view>, 6> parts{{
      {pending, "Pending"},
      {running, "Running"},
      {succeeded, "Succeeded"},
      {failed, "Failed"},
      {skipped, "Skipped"},
      {dependency_failed, "Dependency Failed"},
  }};
  std::string out;
  for (const auto &[count, label] : parts) {
    if (count == 0) {
      continue;
    }
    if (!out.empty()) {
      out += ", ";
    }
    out += std::format("{} {}", count, label);
  }
  return out;
}

auto summarize(const TaskGraph &graph) -> StatusSummary {
  StatusSummary summary;
  for (auto idx : graph.tasks_order()) {
    summary.add(graph.cell(idx).read().kind());
  }
  return summary;
}

} // namespace devtasks
