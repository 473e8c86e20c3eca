#pragma once

#include "devtasks/core/coroutine.hpp"
#include "devtasks/core/error.hpp"
#include "devtasks/task/task_status.hpp"
#include "devtasks/util/id.hpp"
#include "devtasks/util/json.hpp"

#include <boost/asio/async_result.hpp>
#include <boost/asio/post.hpp>

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace devtasks {

// Environment variables handed to every executed task.
inline constexpr std::string_view kOutputFileEnv = "DEVTASKS_OUTPUT_FILE";
inline constexpr std::string_view kInputsEnv = "DEVTASKS_INPUTS";

struct ExecutorResult {
  int exit_code{0};
  // Non-empty when the attempt failed for a reason other than the exit code
  // (spawn failure, unreadable output document).
  std::string error;
  std::vector<OutputLine> stdout_lines;
  std::vector<OutputLine> stderr_lines;
  JsonValue output{};

  [[nodiscard]] auto succeeded() const noexcept -> bool {
    return exit_code == 0 && error.empty();
  }
};

struct ExecutorRequest {
  // Executor the attempt runs on; completion is delivered here too.
  executor_type executor;
  TaskName task;
  std::string command;
  std::string working_dir;
  std::vector<std::string> env; // KEY=VALUE
  // Outputs of the direct dependencies, keyed by task name.
  JsonValue inputs{};
};

using LineCallback = std::function<void(const TaskName &task,
                                        OutputStream stream,
                                        const OutputLine &line)>;

struct ExecutionSink {
  LineCallback on_line;
  std::move_only_function<void(const TaskName &task, ExecutorResult result)>
      on_complete;
};

class IExecutor {
public:
  virtual ~IExecutor() = default;

  // Starts one attempt. on_complete fires exactly once when start() succeeds
  // and never when it fails.
  virtual auto start(ExecutorRequest req, ExecutionSink sink)
      -> Result<void> = 0;
};

// Runs commands through /bin/sh -c.
[[nodiscard]] auto create_shell_executor() -> std::unique_ptr<IExecutor>;

inline auto execute_async(IExecutor &executor, ExecutorRequest req,
                          LineCallback on_line = {}) -> task<ExecutorResult> {
  auto result =
      co_await boost::asio::async_initiate<const boost::asio::use_awaitable_t<>,
                                           void(ExecutorResult)>(
          [&executor, &on_line, req = std::move(req)](auto handler) mutable {
            auto resume_on = req.executor;
            // Shared so the handler can be invoked on start failure too.
            auto shared_h =
                std::make_shared<decltype(handler)>(std::move(handler));

            ExecutionSink sink;
            sink.on_line = std::move(on_line);
            sink.on_complete = [shared_h, resume_on](const TaskName &,
                                                     ExecutorResult res) {
              boost::asio::post(resume_on,
                                [shared_h, res = std::move(res)]() mutable {
                                  std::move (*shared_h)(std::move(res));
                                });
            };

            auto start_res = executor.start(std::move(req), std::move(sink));
            if (!start_res) {
              ExecutorResult err_result;
              err_result.exit_code = -1;
              err_result.error = start_res.error().message();
              boost::asio::post(resume_on, [shared_h, err_result = std::move(
                                                          err_result)]() mutable {
                std::move (*shared_h)(std::move(err_result));
              });
            }
          },
          boost::asio::use_awaitable);

  co_return result;
}

} // namespace devtasks
