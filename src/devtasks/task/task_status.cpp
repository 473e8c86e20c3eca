#include "devtasks/task/task_status.hpp"

#include "devtasks/util/util.hpp"

namespace devtasks {

auto kind_of(const TaskOutcome &outcome) noexcept -> StatusKind {
  return std::visit(
      overloaded{
          [](const outcome::Success &) { return StatusKind::Succeeded; },
          [](const outcome::Failed &) { return StatusKind::Failed; },
          [](const outcome::Skipped &s) {
            return std::holds_alternative<outcome::Cached>(s.reason)
                       ? StatusKind::Cached
                       : StatusKind::NotImplemented;
          },
          [](const outcome::DependencyFailed &) {
            return StatusKind::DependencyFailed;
          },
      },
      outcome);
}

auto kind_of(const TaskStatus &status) noexcept -> StatusKind {
  return std::visit(
      overloaded{
          [](const status::Pending &) { return StatusKind::Pending; },
          [](const status::Running &) { return StatusKind::Running; },
          [](const status::Completed &c) { return kind_of(c.outcome); },
      },
      status);
}

} // namespace devtasks
