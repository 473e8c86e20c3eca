#include "devtasks/task/task_state_cell.hpp"

#include "devtasks/util/log.hpp"

namespace devtasks {

TaskStateCell::TaskStateCell(const TaskDefinition &definition)
    : definition_(definition) {}

auto TaskStateCell::snapshot() const -> TaskStatus {
  std::shared_lock lock(mutex_);
  return status_;
}

auto TaskStateCell::begin_run(Clock::time_point now) -> Result<void> {
  std::unique_lock lock(mutex_);
  if (!std::holds_alternative<status::Pending>(status_)) {
    log::error("Task {} cannot start from state {}", definition_.name,
               to_string_view(kind_of(status_)));
    return fail(Error::InvalidState);
  }
  status_ = status::Running{.started_at = now};
  return ok();
}

auto TaskStateCell::complete(TaskOutcome outcome) -> Result<void> {
  std::unique_lock lock(mutex_);
  if (is_completed(status_)) {
    log::error("Task {} is already completed as {}", definition_.name,
               to_string_view(kind_of(status_)));
    return fail(Error::InvalidState);
  }
  // Success and Failed follow an attempt; the skip outcomes never do.
  const bool attempted = std::holds_alternative<outcome::Success>(outcome) ||
                         std::holds_alternative<outcome::Failed>(outcome);
  if (attempted != std::holds_alternative<status::Running>(status_)) {
    log::error("Task {} cannot complete as {} from state {}", definition_.name,
               to_string_view(kind_of(outcome)),
               to_string_view(kind_of(status_)));
    return fail(Error::InvalidState);
  }
  status_ = status::Completed{.outcome = std::move(outcome)};
  return ok();
}

} // namespace devtasks
