#pragma once

#include "devtasks/task/task_status.hpp"

#include <cstdio>
#include <format>
#include <print>
#include <string>
#include <string_view>
#include <unistd.h>
#include <vector>

namespace devtasks::cli::fmt {

namespace ansi {

inline auto is_tty(std::FILE *stream) noexcept -> bool {
  return ::isatty(::fileno(stream)) != 0;
}

inline constexpr std::string_view kReset = "\033[0m";
inline constexpr std::string_view kBold = "\033[1m";
inline constexpr std::string_view kDim = "\033[2m";

inline constexpr std::string_view kGreen = "\033[32m";
inline constexpr std::string_view kRed = "\033[31m";
inline constexpr std::string_view kBlue = "\033[34m";
inline constexpr std::string_view kMagenta = "\033[35m";

inline auto colorize(std::string_view text, std::string_view color,
                     bool enabled) -> std::string {
  if (!enabled) {
    return std::string(text);
  }
  return std::format("{}{}{}", color, text, kReset);
}

inline auto bold(std::string_view text, bool enabled) -> std::string {
  return colorize(text, kBold, enabled);
}

// Moves the cursor up `lines` rows and clears everything below it.
inline auto rewind(std::size_t lines) -> std::string {
  if (lines == 0) {
    return {};
  }
  return std::format("\033[{}A\033[J", lines);
}

inline auto ansi_visible_width(std::string_view s) -> std::size_t {
  std::size_t width = 0;
  bool in_escape = false;
  for (char c : s) {
    if (in_escape) {
      if (c == 'm')
        in_escape = false;
    } else if (c == '\033') {
      in_escape = true;
    } else {
      ++width;
    }
  }
  return width;
}

} // namespace ansi

// Label shown in the status column.
inline auto status_label(StatusKind kind) -> std::string_view {
  switch (kind) {
  case StatusKind::Pending:
    return "Pending";
  case StatusKind::Running:
    return "Running";
  case StatusKind::Succeeded:
    return "Succeeded";
  case StatusKind::Failed:
    return "Failed";
  case StatusKind::Cached:
    return "Cached";
  case StatusKind::NotImplemented:
    return "Not implemented";
  case StatusKind::DependencyFailed:
    return "Dependency failed";
  }
  return "Unknown";
}

inline auto status_color(StatusKind kind) -> std::string_view {
  switch (kind) {
  case StatusKind::Succeeded:
    return ansi::kGreen;
  case StatusKind::Failed:
    return ansi::kRed;
  case StatusKind::DependencyFailed:
    return ansi::kMagenta;
  default:
    return ansi::kBlue;
  }
}

// Pads before colouring so escape codes do not count towards the width.
inline auto styled_status(StatusKind kind, bool color) -> std::string {
  auto padded = std::format("{:17}", status_label(kind));
  return ansi::colorize(padded, std::format("{}{}", ansi::kBold,
                                            status_color(kind)),
                        color);
}

class Table {
public:
  struct Column {
    std::string header;
    std::size_t width;
    bool right_align{false};
  };

  explicit Table(std::vector<Column> columns) : columns_(std::move(columns)) {}

  auto print_header() const -> void {
    for (std::size_t i = 0; i < columns_.size(); ++i) {
      if (i > 0)
        std::print(" ");
      const auto &col = columns_[i];
      if (col.right_align) {
        std::print("{:>{}}", col.header, col.width);
      } else {
        std::print("{:<{}}", col.header, col.width);
      }
    }
    std::println("");

    std::size_t total_width = 0;
    for (const auto &col : columns_)
      total_width += col.width;
    total_width += columns_.size() - 1;
    std::println("{}", std::string(total_width, '-'));
  }

  auto print_row(const std::vector<std::string> &values) const -> void {
    for (std::size_t i = 0; i < columns_.size() && i < values.size(); ++i) {
      if (i > 0)
        std::print(" ");
      const auto &col = columns_[i];
      const auto &val = values[i];
      auto visible = ansi::ansi_visible_width(val);
      auto pad = visible < col.width ? col.width - visible : 0;
      if (col.right_align) {
        std::print("{}{}", std::string(pad, ' '), val);
      } else {
        std::print("{}{}", val, std::string(pad, ' '));
      }
    }
    std::println("");
  }

private:
  std::vector<Column> columns_;
};

} // namespace devtasks::cli::fmt
