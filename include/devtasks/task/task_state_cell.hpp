#pragma once

#include "devtasks/core/error.hpp"
#include "devtasks/task/task_definition.hpp"
#include "devtasks/task/task_status.hpp"

#include <mutex>
#include <shared_mutex>

namespace devtasks {

// Status record for one task. Readers take a shared lock, the scheduler takes
// an exclusive one for each transition. TaskGraph only hands out const
// references to observers, so the mutators are reachable by the engine alone.
class TaskStateCell {
public:
  // Consistent view of the cell; holds the shared lock for its lifetime.
  class ReadView {
  public:
    [[nodiscard]] auto status() const noexcept -> const TaskStatus & {
      return cell_->status_;
    }
    [[nodiscard]] auto definition() const noexcept -> const TaskDefinition & {
      return cell_->definition_;
    }
    [[nodiscard]] auto kind() const noexcept -> StatusKind {
      return kind_of(cell_->status_);
    }

  private:
    friend class TaskStateCell;
    explicit ReadView(const TaskStateCell &cell)
        : cell_(&cell), lock_(cell.mutex_) {}

    const TaskStateCell *cell_;
    std::shared_lock<std::shared_mutex> lock_;
  };

  explicit TaskStateCell(const TaskDefinition &definition);

  TaskStateCell(const TaskStateCell &) = delete;
  auto operator=(const TaskStateCell &) -> TaskStateCell & = delete;

  [[nodiscard]] auto read() const -> ReadView { return ReadView{*this}; }

  // Copy of the current status taken under the shared lock.
  [[nodiscard]] auto snapshot() const -> TaskStatus;

  // The definition is immutable; no lock is needed.
  [[nodiscard]] auto definition() const noexcept -> const TaskDefinition & {
    return definition_;
  }

  // Pending -> Running(now). InvalidState unless Pending.
  [[nodiscard]] auto begin_run(Clock::time_point now) -> Result<void>;

  // Running -> Completed(Success|Failed), Pending -> Completed(Skipped|
  // DependencyFailed). Any other transition is InvalidState.
  [[nodiscard]] auto complete(TaskOutcome outcome) -> Result<void>;

private:
  const TaskDefinition &definition_;
  mutable std::shared_mutex mutex_;
  TaskStatus status_{status::Pending{}};
};

} // namespace devtasks
