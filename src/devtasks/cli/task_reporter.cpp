#include "devtasks/cli/task_reporter.hpp"

#include "devtasks/cli/formatting.hpp"
#include "devtasks/util/log.hpp"
#include "devtasks/util/time.hpp"
#include "devtasks/util/util.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <exception>
#include <format>
#include <mutex>
#include <optional>
#include <ranges>
#include <thread>
#include <tuple>
#include <variant>

namespace devtasks::cli {

namespace {

inline constexpr auto kRedrawInterval = std::chrono::milliseconds(100);

// 850.12ms, 1.23s
auto format_elapsed(Clock::duration d) -> std::string {
  auto seconds = util::to_seconds(d);
  if (seconds < 1.0) {
    return std::format("{:.2f}ms", seconds * 1000.0);
  }
  return std::format("{:.2f}s", seconds);
}

auto append_lines(std::string &out, const std::vector<OutputLine> &lines,
                  Clock::time_point started_at) -> void {
  for (const auto &line : lines) {
    auto offset = util::to_seconds(line.at - started_at);
    out += std::format("{:07.2f}: {}\n", offset, line.text);
  }
}

} // namespace

TaskReporter::TaskReporter(std::shared_ptr<Engine> engine, std::FILE *out,
                           bool is_tty)
    : engine_(std::move(engine)), out_(out), tty_(is_tty),
      last_kind_(engine_->graph().size(), StatusKind::Pending) {}

auto TaskReporter::frame() const -> StatusFrame {
  StatusFrame frame;
  const auto &graph = engine_->graph();
  const auto now = Clock::now();
  for (auto idx : graph.tasks_order()) {
    auto view = graph.cell(idx).read();
    auto kind = view.kind();
    frame.summary.add(kind);
    if (kind == StatusKind::Pending) {
      continue;
    }

    std::optional<Clock::duration> duration = std::visit(
        overloaded{
            [](const status::Pending &) -> std::optional<Clock::duration> {
              return std::nullopt;
            },
            [&](const status::Running &r) -> std::optional<Clock::duration> {
              return now - r.started_at;
            },
            [](const status::Completed &c) -> std::optional<Clock::duration> {
              if (const auto *s = std::get_if<outcome::Success>(&c.outcome)) {
                return s->duration;
              }
              if (const auto *f = std::get_if<outcome::Failed>(&c.outcome)) {
                return f->duration;
              }
              return std::nullopt;
            },
        },
        view.status());

    auto name = std::format("{:40}", view.definition().name);
    frame.lines.push_back(std::format(
        "{} {} {:10}", fmt::styled_status(kind, tty_),
        fmt::ansi::bold(name, tty_),
        duration ? std::format("{}ms", util::to_millis(*duration))
                 : std::string{}));
  }
  return frame;
}

auto TaskReporter::format_summary(const StatusSummary &summary) const
    -> std::string {
  const std::array<std::tuple<std::size_t, std::string_view, std::string_view>,
                   6>
      parts{{
          {summary.pending, "Pending", fmt::ansi::kBlue},
          {summary.running, "Running", fmt::ansi::kBlue},
          {summary.skipped, "Skipped", fmt::ansi::kBlue},
          {summary.succeeded, "Succeeded", fmt::ansi::kGreen},
          {summary.failed, "Failed", fmt::ansi::kRed},
          {summary.dependency_failed, "Dependency Failed", fmt::ansi::kRed},
      }};
  std::string out;
  for (const auto &[count, label, color] : parts) {
    if (count == 0) {
      continue;
    }
    if (!out.empty()) {
      out += ", ";
    }
    out += std::format("{} {}", count,
                       fmt::ansi::colorize(label, color, tty_));
  }
  return out;
}

auto TaskReporter::format_task_errors() const -> std::string {
  std::string errors;
  const auto &graph = engine_->graph();
  for (auto idx : graph.tasks_order()) {
    auto view = graph.cell(idx).read();
    const auto *completed = std::get_if<status::Completed>(&view.status());
    if (!completed) {
      continue;
    }
    const auto *failed = std::get_if<outcome::Failed>(&completed->outcome);
    if (!failed) {
      continue;
    }
    const auto &name = view.definition().name;
    const auto &failure = failed->failure;
    errors += std::format("\n--- {} failed with error: {}\n", name,
                          failure.error);
    errors += std::format("--- {} stdout:\n", name);
    append_lines(errors, failure.stdout_lines, failure.started_at);
    errors += std::format("--- {} stderr:\n", name);
    append_lines(errors, failure.stderr_lines, failure.started_at);
    errors += "---\n";
  }
  return errors;
}

auto TaskReporter::line_printer(std::FILE *out, bool color) -> LineCallback {
  auto mutex = std::make_shared<std::mutex>();
  return [out, color, mutex](const TaskName &task, OutputStream stream,
                             const OutputLine &line) {
    auto prefix = fmt::ansi::colorize(
        task.value(),
        stream == OutputStream::Stderr ? fmt::ansi::kRed : fmt::ansi::kDim,
        color);
    std::lock_guard lock(*mutex);
    std::println(out, "{} | {}", prefix, line.text);
  };
}

auto TaskReporter::write_line(std::string_view text) -> void {
  std::println(out_, "{}", text);
  std::fflush(out_);
}

auto TaskReporter::render_tty(const StatusFrame &frame,
                              Clock::duration elapsed) -> void {
  if (frame.lines.empty()) {
    return;
  }
  auto summary = format_summary(frame.summary);
  auto width = 19 + engine_->graph().longest_task_name();
  auto visible = fmt::ansi::ansi_visible_width(summary);
  auto pad = std::max<std::size_t>(visible < width ? width - visible : 0, 1);

  std::string output = fmt::ansi::rewind(last_frame_height_);
  for (const auto &line : frame.lines) {
    output += line;
    output += '\n';
  }
  output += std::format("{}{}{}", summary, std::string(pad, ' '),
                        format_elapsed(elapsed));
  write_line(output);
  last_frame_height_ = frame.lines.size() + 1;
}

auto TaskReporter::render_changes(const StatusFrame &frame, bool finished)
    -> void {
  const auto &graph = engine_->graph();
  for (auto idx : graph.tasks_order()) {
    auto view = graph.cell(idx).read();
    auto kind = view.kind();
    if (kind == last_kind_[idx] || kind == StatusKind::Pending) {
      continue;
    }
    last_kind_[idx] = kind;

    std::string duration;
    if (const auto *completed =
            std::get_if<status::Completed>(&view.status())) {
      if (const auto *s = std::get_if<outcome::Success>(&completed->outcome)) {
        duration = std::format(" ({})", format_elapsed(s->duration));
      } else if (const auto *f =
                     std::get_if<outcome::Failed>(&completed->outcome)) {
        duration = std::format(" ({})", format_elapsed(f->duration));
      }
    }
    write_line(std::format("{} {}{}", fmt::styled_status(kind, tty_),
                           fmt::ansi::bold(view.definition().name.value(), tty_),
                           duration));
  }
  if (finished) {
    write_line(format_summary(frame.summary));
  }
}

auto TaskReporter::run() -> Result<RunResult> {
  std::optional<Result<RunResult>> result;
  std::atomic<bool> done{false};
  auto engine = engine_;

  std::jthread worker([engine, &result, &done] {
    try {
      result = engine->run_blocking();
    } catch (const std::exception &ex) {
      log::error("Task run aborted: {}", ex.what());
      result = fail(Error::Unknown);
    }
    done.store(true, std::memory_order_release);
    engine->notifier().notify();
  });

  auto &notifier = engine_->notifier();
  const auto verbosity = engine_->verbosity();

  if (verbosity == Verbosity::Quiet) {
    auto gen = notifier.subscribe();
    while (!frame().summary.is_finished() &&
           !done.load(std::memory_order_acquire)) {
      gen = notifier.wait(gen);
    }
  } else {
    std::string roots;
    for (const auto &[i, name] : std::views::enumerate(engine_->root_names())) {
      if (i > 0) {
        roots += ", ";
      }
      roots += name.str();
    }
    write_line(std::format("{:17} {}\n", "Running tasks",
                           fmt::ansi::bold(roots, tty_)));

    const bool live = tty_ && verbosity != Verbosity::Verbose;
    const auto started = Clock::now();
    while (true) {
      auto gen = notifier.subscribe();
      auto current = frame();
      const bool finished = current.summary.is_finished() ||
                            done.load(std::memory_order_acquire);
      if (live) {
        render_tty(current, Clock::now() - started);
      } else {
        render_changes(current, finished);
      }
      if (finished) {
        break;
      }
      if (live) {
        (void)notifier.wait_for(gen, kRedrawInterval);
      } else {
        (void)notifier.wait(gen);
      }
    }
  }

  worker.join();

  if (auto errors = format_task_errors(); !errors.empty()) {
    write_line(errors);
  }
  return std::move(*result);
}

} // namespace devtasks::cli
