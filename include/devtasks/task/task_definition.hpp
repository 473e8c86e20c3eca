#pragma once

#include "devtasks/core/error.hpp"
#include "devtasks/util/id.hpp"

#include <optional>
#include <string>
#include <vector>

namespace devtasks {

struct TaskDefinition {
  struct Builder;
  static auto builder(std::string name) -> Builder;

  TaskName name;
  std::string description;
  // No command means the task has no runnable action.
  std::optional<std::string> command;
  std::string working_dir;
  std::vector<std::string> env; // KEY=VALUE
  std::vector<TaskName> dependencies;
  std::vector<std::string> inputs;

  [[nodiscard]] auto has_command() const noexcept -> bool {
    return command.has_value();
  }
};

struct TaskDefinition::Builder {
  TaskDefinition def_;

  auto description(std::string d) -> Builder && {
    def_.description = std::move(d);
    return std::move(*this);
  }

  auto command(std::string cmd) -> Builder && {
    def_.command = std::move(cmd);
    return std::move(*this);
  }

  auto working_dir(std::string dir) -> Builder && {
    def_.working_dir = std::move(dir);
    return std::move(*this);
  }

  auto env(std::string assignment) -> Builder && {
    def_.env.push_back(std::move(assignment));
    return std::move(*this);
  }

  auto depends_on(std::string dep) -> Builder && {
    def_.dependencies.emplace_back(std::move(dep));
    return std::move(*this);
  }

  auto input(std::string path) -> Builder && {
    def_.inputs.push_back(std::move(path));
    return std::move(*this);
  }

  [[nodiscard]] auto build() && -> Result<TaskDefinition> {
    if (!is_valid_id_text(def_.name.value())) {
      return fail(Error::InvalidArgument);
    }
    return ok(std::move(def_));
  }
};

inline auto TaskDefinition::builder(std::string name) -> Builder {
  Builder b;
  b.def_.name = TaskName{std::move(name)};
  return b;
}

} // namespace devtasks
