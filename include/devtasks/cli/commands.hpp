#pragma once

#include "devtasks/config/task_file.hpp"

#include <optional>
#include <string>
#include <vector>

namespace devtasks::cli {

struct RunOptions {
  std::string file;
  std::vector<std::string> roots; // empty: every task
  bool quiet{false};
  bool verbose{false};
  std::optional<std::string> cache_path;
  bool no_cache{false};
  std::optional<std::string> log_level;
  std::optional<std::string> log_file;
  bool json{false};
};

struct ListOptions {
  std::string file;
  bool json{false};
};

struct ValidateOptions {
  std::string file;
  bool json{false};
};

[[nodiscard]] auto cmd_run(const RunOptions &opts) -> int;
[[nodiscard]] auto cmd_list(const ListOptions &opts) -> int;
[[nodiscard]] auto cmd_validate(const ValidateOptions &opts) -> int;

// Loads a task file, printing the error to stderr on failure.
[[nodiscard]] auto load_task_file(const std::string &file)
    -> std::optional<TaskFile>;

} // namespace devtasks::cli
