#pragma once

#include "devtasks/core/error.hpp"
#include "devtasks/engine/engine.hpp"
#include "devtasks/engine/status_summary.hpp"

#include <cstdio>
#include <memory>
#include <string>
#include <vector>

namespace devtasks::cli {

struct StatusFrame {
  std::vector<std::string> lines; // one per non-pending task, tasks_order
  StatusSummary summary;
};

// Renders the progress of an engine run to a terminal stream.
//   Quiet:   nothing but failure reports.
//   Normal:  live redraw on a TTY, one line per status change otherwise.
//   Verbose: status changes; task output is streamed by line_printer().
class TaskReporter {
public:
  TaskReporter(std::shared_ptr<Engine> engine, std::FILE *out, bool is_tty);

  // Runs the engine on a worker thread and renders until every task is
  // terminal. Returns what Engine::run() returned.
  [[nodiscard]] auto run() -> Result<RunResult>;

  [[nodiscard]] auto frame() const -> StatusFrame;
  [[nodiscard]] auto format_summary(const StatusSummary &summary) const
      -> std::string;
  // One block per failed task in tasks_order; empty when nothing failed.
  [[nodiscard]] auto format_task_errors() const -> std::string;

  // Line observer for EngineOptions::on_line that prints "name | text".
  [[nodiscard]] static auto line_printer(std::FILE *out, bool color)
      -> LineCallback;

private:
  auto write_line(std::string_view text) -> void;
  auto render_tty(const StatusFrame &frame, Clock::duration elapsed) -> void;
  auto render_changes(const StatusFrame &frame, bool finished) -> void;

  std::shared_ptr<Engine> engine_;
  std::FILE *out_;
  bool tty_;
  std::size_t last_frame_height_{0};
  std::vector<StatusKind> last_kind_;
};

} // namespace devtasks::cli
