#include "devtasks/config/task_file.hpp"
#include "devtasks/config/toml_util.hpp"

#include "devtasks/executor/executor_utils.hpp"
#include "devtasks/util/log.hpp"

#include <glaze/toml.hpp>

#include <format>
#include <ranges>
#include <string>
#include <string_view>
#include <vector>

namespace devtasks {
namespace detail {

struct SettingsToml {
  std::string log_level;
  std::string cache_path;
  std::string verbosity;
};

struct TaskToml {
  std::string name;
  std::string description;
  std::string command;
  std::string working_dir;
  std::vector<std::string> depends;
  std::vector<std::string> inputs;
  std::vector<std::string> env;
};

struct TaskFileToml {
  SettingsToml settings{};
  std::vector<TaskToml> tasks;
};

} // namespace detail
} // namespace devtasks

namespace glz {
template <> struct meta<devtasks::detail::SettingsToml> {
  using T = devtasks::detail::SettingsToml;
  static constexpr auto value =
      object("log_level", &T::log_level, "cache_path", &T::cache_path,
             "verbosity", &T::verbosity);
};

template <> struct meta<devtasks::detail::TaskToml> {
  using T = devtasks::detail::TaskToml;
  static constexpr auto value =
      object("name", &T::name, "description", &T::description, "command",
             &T::command, "working_dir", &T::working_dir, "depends",
             &T::depends, "inputs", &T::inputs, "env", &T::env);
};

template <> struct meta<devtasks::detail::TaskFileToml> {
  using T = devtasks::detail::TaskFileToml;
  static constexpr auto value =
      object("settings", &T::settings, "tasks", &T::tasks);
};
} // namespace glz

namespace devtasks {
namespace {

namespace fs = std::filesystem;

[[nodiscard]] auto resolve(const fs::path &base_dir, std::string_view raw)
    -> std::string {
  fs::path path{raw};
  if (base_dir.empty() || path.is_absolute()) {
    return path.string();
  }
  return (base_dir / path).lexically_normal().string();
}

[[nodiscard]] auto parse_settings(const detail::SettingsToml &raw,
                                  const fs::path &base_dir,
                                  std::vector<std::string> &errors)
    -> TaskFileSettings {
  TaskFileSettings settings;
  if (!raw.log_level.empty()) {
    settings.log_level = log::parse_level(raw.log_level);
    if (!settings.log_level) {
      errors.emplace_back(
          std::format("settings.log_level: unknown level '{}'", raw.log_level));
    }
  }
  if (!raw.verbosity.empty()) {
    settings.verbosity = parse<Verbosity>(raw.verbosity);
    if (!settings.verbosity) {
      errors.emplace_back(std::format(
          "settings.verbosity: unknown verbosity '{}'", raw.verbosity));
    }
  }
  if (!raw.cache_path.empty()) {
    settings.cache_path = resolve(base_dir, raw.cache_path);
  }
  return settings;
}

[[nodiscard]] auto parse_task(const detail::TaskToml &raw,
                              const fs::path &base_dir,
                              std::vector<std::string> &errors)
    -> TaskDefinition {
  TaskDefinition task{};
  task.name = TaskName{raw.name};
  task.description = raw.description;
  if (!raw.command.empty()) {
    task.command = raw.command;
  }
  task.working_dir = raw.working_dir.empty() && !base_dir.empty()
                         ? base_dir.string()
                         : resolve(base_dir, raw.working_dir);
  for (const auto &dep : raw.depends) {
    task.dependencies.emplace_back(dep);
  }
  for (const auto &input : raw.inputs) {
    task.inputs.push_back(resolve(base_dir, input));
  }
  for (const auto &assignment : raw.env) {
    if (!split_env_assignment(assignment)) {
      errors.emplace_back(std::format(
          "task '{}': env entry '{}' is not KEY=VALUE with a valid key",
          raw.name, assignment));
      continue;
    }
    task.env.push_back(assignment);
  }
  return task;
}

auto validate_names(const std::vector<TaskDefinition> &tasks,
                    std::vector<std::string> &errors) -> void {
  for (const auto &[i, task] : std::views::enumerate(tasks)) {
    if (task.name.empty()) {
      errors.emplace_back(std::format("task #{}: name cannot be empty", i));
    } else if (!is_valid_id_text(task.name.value())) {
      errors.emplace_back(std::format(
          "task '{}': name contains control characters", task.name));
    }
  }
}

} // namespace

auto TaskFileLoader::load_from_file(const fs::path &path,
                                    std::string *diagnostic)
    -> Result<TaskFile> {
  auto text = toml_util::read_file(path.string());
  if (!text) {
    if (diagnostic) {
      *diagnostic = std::format("cannot read task file {}", path.string());
    }
    return fail(text.error());
  }

  std::error_code ec;
  auto absolute = fs::absolute(path, ec);
  auto base_dir = (ec ? path : absolute).parent_path();

  return load_from_string(*text, base_dir, diagnostic)
      .transform([&](TaskFile &&file) {
        file.path = path;
        log::debug("Loaded {} task(s) from {}", file.tasks.size(),
                   path.string());
        return std::move(file);
      });
}

auto TaskFileLoader::load_from_string(std::string_view text,
                                      const fs::path &base_dir,
                                      std::string *diagnostic)
    -> Result<TaskFile> {
  auto raw = toml_util::parse_toml<detail::TaskFileToml>(text, diagnostic);
  if (!raw) {
    return fail(raw.error());
  }

  std::vector<std::string> errors;
  TaskFile file;
  file.settings = parse_settings(raw->settings, base_dir, errors);
  file.tasks.reserve(raw->tasks.size());
  for (const auto &task : raw->tasks) {
    file.tasks.push_back(parse_task(task, base_dir, errors));
  }
  validate_names(file.tasks, errors);

  if (!errors.empty()) {
    std::string joined;
    for (const auto &[i, e] : std::views::enumerate(errors)) {
      if (i > 0) {
        joined += "; ";
      }
      joined += e;
    }
    log::debug("Task file rejected: {}", joined);
    if (diagnostic) {
      *diagnostic = std::move(joined);
    }
    return fail(Error::InvalidArgument);
  }
  return ok(std::move(file));
}

} // namespace devtasks
