#pragma once

#include "devtasks/task/task_status.hpp"

#include <cstddef>
#include <string>

namespace devtasks {

class TaskGraph;

struct StatusSummary {
  std::size_t pending{0};
  std::size_t running{0};
  std::size_t succeeded{0};
  std::size_t failed{0};
  std::size_t skipped{0};
  std::size_t dependency_failed{0};

  auto add(StatusKind kind) noexcept -> void;

  [[nodiscard]] auto total() const noexcept -> std::size_t {
    return pending + running + succeeded + failed + skipped +
           dependency_failed;
  }
  [[nodiscard]] auto has_failures() const noexcept -> bool {
    return failed > 0 || dependency_failed > 0;
  }
  [[nodiscard]] auto is_finished() const noexcept -> bool {
    return pending == 0 && running == 0;
  }

  // "2 Succeeded, 1 Failed"; zero counts are left out.
  [[nodiscard]] auto describe() const -> std::string;

  auto operator==(const StatusSummary &) const -> bool = default;
};

// Counts every node of `graph` by its current status.
[[nodiscard]] auto summarize(const TaskGraph &graph) -> StatusSummary;

} // namespace devtasks
