#pragma once

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace devtasks {

/// Truncate a command string for log preview (max 80 chars).
[[nodiscard]] inline auto cmd_preview(std::string_view cmd) -> std::string {
  if (cmd.size() <= 80)
    return std::string(cmd);
  return std::string(cmd.substr(0, 80)) + "...";
}

/// Validate an environment variable key (POSIX: [A-Za-z_][A-Za-z0-9_]*).
[[nodiscard]] inline auto is_valid_env_key(std::string_view key) -> bool {
  if (key.empty())
    return false;
  if (!std::isalpha(static_cast<unsigned char>(key[0])) && key[0] != '_')
    return false;
  return std::ranges::all_of(key, [](char c) {
    const auto uc = static_cast<unsigned char>(c);
    return std::isalnum(uc) != 0 || c == '_';
  });
}

/// Split "KEY=VALUE"; nullopt when there is no '=' or the key is invalid.
[[nodiscard]] inline auto split_env_assignment(std::string_view assignment)
    -> std::optional<std::pair<std::string, std::string>> {
  auto eq = assignment.find('=');
  if (eq == std::string_view::npos) {
    return std::nullopt;
  }
  auto key = assignment.substr(0, eq);
  if (!is_valid_env_key(key)) {
    return std::nullopt;
  }
  return std::pair{std::string(key), std::string(assignment.substr(eq + 1))};
}

} // namespace devtasks
