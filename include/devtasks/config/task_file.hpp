#pragma once

#include "devtasks/core/error.hpp"
#include "devtasks/engine/verbosity.hpp"
#include "devtasks/task/task_definition.hpp"
#include "devtasks/util/log.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace devtasks {

inline constexpr std::string_view kDefaultTaskFile = "devtasks.toml";
inline constexpr std::string_view kTaskFileEnv = "DEVTASKS_FILE";

// `[settings]` table; unset keys leave the caller's defaults alone.
struct TaskFileSettings {
  std::optional<log::Level> log_level;
  std::optional<std::filesystem::path> cache_path;
  std::optional<Verbosity> verbosity;
};

struct TaskFile {
  std::filesystem::path path;
  TaskFileSettings settings;
  std::vector<TaskDefinition> tasks;
};

class TaskFileLoader {
public:
  [[nodiscard]] static auto load_from_file(const std::filesystem::path &path,
                                           std::string *diagnostic = nullptr)
      -> Result<TaskFile>;

  // Relative paths resolve against `base_dir`; left untouched when it is
  // empty.
  [[nodiscard]] static auto
  load_from_string(std::string_view text,
                   const std::filesystem::path &base_dir = {},
                   std::string *diagnostic = nullptr) -> Result<TaskFile>;
};

} // namespace devtasks
