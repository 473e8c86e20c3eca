#include "devtasks/core/coroutine.hpp"
#include "devtasks/executor/executor.hpp"
#include "devtasks/executor/executor_utils.hpp"
#include "devtasks/util/json.hpp"
#include "devtasks/util/log.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/readable_pipe.hpp>
#include <boost/process/v2/environment.hpp>
#include <boost/process/v2/process.hpp>
#include <boost/process/v2/start_dir.hpp>
#include <boost/process/v2/stdio.hpp>

#include <unistd.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace devtasks {

namespace {

namespace bp = boost::process::v2;
namespace fs = std::filesystem;

inline constexpr std::size_t kMaxOutputSize = 10UZ * 1024 * 1024;
inline constexpr std::size_t kReadBufferSize = 4096;

[[nodiscard]] auto
build_process_env(const std::vector<std::pair<std::string, std::string>> &custom)
    -> bp::process_environment {
  std::vector<bp::environment::key_value_pair> env_vec;
  env_vec.reserve(64);

  auto overridden = [&](std::string_view key) {
    return std::ranges::any_of(
        custom, [&](const auto &kv) { return kv.first == key; });
  };

  for (const auto &entry : bp::environment::current()) {
    auto key_sv = entry.key();
    if (overridden(std::string_view(key_sv.data(), key_sv.size()))) {
      continue;
    }
    env_vec.emplace_back(entry);
  }

  for (const auto &[k, v] : custom) {
    env_vec.emplace_back(bp::environment::key{k}, bp::environment::value{v});
  }

  return bp::process_environment(std::move(env_vec));
}

[[nodiscard]] auto make_output_file() -> Result<fs::path> {
  static std::atomic<std::uint64_t> counter{0};
  std::error_code ec;
  auto dir = fs::temp_directory_path(ec);
  if (ec) {
    return fail(Error::FileOpenFailed);
  }
  auto path = dir / std::format("devtasks-{}-{}.json", ::getpid(),
                                counter.fetch_add(1));
  std::ofstream touch(path, std::ios::trunc);
  if (!touch) {
    return fail(Error::FileOpenFailed);
  }
  return ok(std::move(path));
}

// Empty or whitespace-only files mean "no output".
[[nodiscard]] auto read_output_document(const fs::path &path)
    -> Result<JsonValue> {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return ok(JsonValue{});
  }
  std::string text((std::istreambuf_iterator<char>(in)),
                   std::istreambuf_iterator<char>());
  if (std::ranges::all_of(text, [](unsigned char c) {
        return std::isspace(c) != 0;
      })) {
    return ok(JsonValue{});
  }
  return parse_json(text);
}

// Splits the pipe into lines, stamping each with its arrival time.
[[nodiscard]] auto read_lines(boost::asio::readable_pipe &pipe,
                              OutputStream stream, const TaskName &task,
                              std::vector<OutputLine> &lines,
                              const LineCallback &on_line) -> task<void> {
  std::array<char, kReadBufferSize> buffer{};
  std::string partial;
  std::size_t stored = 0;

  auto emit = [&](std::string text) {
    if (!text.empty() && text.back() == '\r') {
      text.pop_back();
    }
    OutputLine line{.at = Clock::now(), .text = std::move(text)};
    if (on_line) {
      on_line(task, stream, line);
    }
    if (stored < kMaxOutputSize) {
      stored += line.text.size();
      lines.push_back(std::move(line));
    }
  };

  while (true) {
    auto [ec, bytes] = co_await pipe.async_read_some(
        boost::asio::buffer(buffer.data(), buffer.size()), use_nothrow);
    if (bytes > 0) {
      std::string_view chunk(buffer.data(), bytes);
      std::size_t pos = 0;
      while (true) {
        auto nl = chunk.find('\n', pos);
        if (nl == std::string_view::npos) {
          partial.append(chunk.substr(pos));
          break;
        }
        partial.append(chunk.substr(pos, nl - pos));
        emit(std::exchange(partial, {}));
        pos = nl + 1;
      }
    }
    if (ec) {
      break;
    }
  }
  if (!partial.empty()) {
    emit(std::move(partial));
  }
}

struct ShellJob {
  ExecutorRequest req;
  std::optional<bp::process_environment> env;
  fs::path output_file;
  ExecutionSink sink;
};

auto execute_command(std::shared_ptr<ShellJob> job) -> spawn_task {
  auto executor = job->req.executor;
  boost::asio::readable_pipe stdout_pipe(executor);
  boost::asio::readable_pipe stderr_pipe(executor);
  ExecutorResult result;

  std::optional<bp::process> proc;
  try {
    std::vector<std::string> args{"-c", job->req.command};
    auto stdio = bp::process_stdio{
        .in = nullptr, .out = stdout_pipe, .err = stderr_pipe};
    if (!job->req.working_dir.empty()) {
      proc.emplace(executor, "/bin/sh", args, std::move(stdio),
                   bp::process_start_dir{job->req.working_dir},
                   std::move(*job->env));
    } else {
      proc.emplace(executor, "/bin/sh", args, std::move(stdio),
                   std::move(*job->env));
    }
  } catch (const std::exception &ex) {
    log::error("Failed to spawn task {}: {}", job->req.task, ex.what());
    result.exit_code = -1;
    result.error = std::format("failed to spawn process: {}", ex.what());
    std::error_code ignored;
    fs::remove(job->output_file, ignored);
    job->sink.on_complete(job->req.task, std::move(result));
    co_return;
  }

  log::debug("shell process started pid={} task={}", proc->id(),
             job->req.task);

  auto wait_exit = [](bp::process &p) -> task<int> {
    auto [ec, exit_code] = co_await p.async_wait(use_nothrow);
    if (ec) {
      co_return -1;
    }
    co_return exit_code;
  };

  using namespace awaitable_ops;
  result.exit_code = co_await (
      read_lines(stdout_pipe, OutputStream::Stdout, job->req.task,
                 result.stdout_lines, job->sink.on_line) &&
      read_lines(stderr_pipe, OutputStream::Stderr, job->req.task,
                 result.stderr_lines, job->sink.on_line) &&
      wait_exit(*proc));

  if (result.exit_code != 0) {
    result.error = std::format("exited with status {}", result.exit_code);
  } else if (auto doc = read_output_document(job->output_file); !doc) {
    result.error = std::format("{} does not contain a valid JSON document",
                               kOutputFileEnv);
  } else {
    result.output = std::move(*doc);
  }

  std::error_code ignored;
  fs::remove(job->output_file, ignored);

  log::debug("shell finish: task={} exit_code={} err='{}'", job->req.task,
             result.exit_code, result.error);
  job->sink.on_complete(job->req.task, std::move(result));
}

} // namespace

class ShellExecutor final : public IExecutor {
public:
  ShellExecutor() = default;

  ShellExecutor(const ShellExecutor &) = delete;
  ShellExecutor &operator=(const ShellExecutor &) = delete;

  auto start(ExecutorRequest req, ExecutionSink sink) -> Result<void> override {
    log::info("ShellExecutor start: task={} cmd='{}'", req.task,
              cmd_preview(req.command));

    std::vector<std::pair<std::string, std::string>> vars;
    vars.reserve(req.env.size() + 2);
    for (const auto &assignment : req.env) {
      auto kv = split_env_assignment(assignment);
      if (!kv) {
        log::error("Invalid environment assignment for {}: {}", req.task,
                   assignment);
        return fail(Error::InvalidArgument);
      }
      vars.push_back(std::move(*kv));
    }

    auto output_file = make_output_file();
    if (!output_file) {
      log::error("Cannot create output file for {}", req.task);
      return fail(output_file.error());
    }
    vars.emplace_back(std::string(kOutputFileEnv), output_file->string());
    vars.emplace_back(std::string(kInputsEnv), dump_json(req.inputs));

    auto job = std::make_shared<ShellJob>(ShellJob{
        .req = std::move(req),
        .env = build_process_env(vars),
        .output_file = std::move(*output_file),
        .sink = std::move(sink),
    });
    auto executor = job->req.executor;
    co_spawn(executor, execute_command(std::move(job)), detached);
    return ok();
  }
};

auto create_shell_executor() -> std::unique_ptr<IExecutor> {
  return std::make_unique<ShellExecutor>();
}

} // namespace devtasks
