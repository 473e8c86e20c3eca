#include "devtasks/cli/commands.hpp"
#include "devtasks/util/log.hpp"

#include <print>

namespace devtasks::cli {

auto load_task_file(const std::string &file) -> std::optional<TaskFile> {
  std::string diagnostic;
  auto res = TaskFileLoader::load_from_file(file, &diagnostic);
  if (!res) {
    std::println(stderr, "Error: {}: {}", file,
                 diagnostic.empty() ? res.error().message() : diagnostic);
    return std::nullopt;
  }
  return std::move(*res);
}

} // namespace devtasks::cli
