#pragma once

#include "devtasks/cache/cache_oracle.hpp"
#include "devtasks/cache/fingerprint.hpp"
#include "devtasks/core/coroutine.hpp"
#include "devtasks/core/error.hpp"
#include "devtasks/engine/change_notifier.hpp"
#include "devtasks/engine/status_summary.hpp"
#include "devtasks/engine/verbosity.hpp"
#include "devtasks/executor/executor.hpp"
#include "devtasks/graph/task_graph.hpp"
#include "devtasks/task/task_definition.hpp"
#include "devtasks/util/json.hpp"

#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <system_error>
#include <vector>

namespace devtasks {

struct EngineConfig {
  std::vector<TaskDefinition> tasks;
  // Empty selects every task.
  std::vector<TaskName> roots;
};

// Called on the scheduler strand after each status transition.
using StatusCallback =
    std::function<void(const TaskName &task, StatusKind status)>;

struct EngineOptions {
  // Opens a FileCache here when `cache` is not given.
  std::optional<std::filesystem::path> cache_path;
  std::shared_ptr<ICacheOracle> cache;
  std::shared_ptr<IExecutor> executor;
  Fingerprinter fingerprinter;
  // Receives every captured line as it arrives, from any thread.
  LineCallback on_line;
  StatusCallback on_status;
};

using Outputs = std::map<TaskName, JsonValue>;

struct RunResult {
  StatusSummary summary;
  Outputs outputs;
};

// Drives one run of a task graph. Every node gets its own coroutine on a
// strand; a node waits for the completion latches of its dependencies and
// then decides to skip, run, or propagate a dependency failure. Each state
// transition is followed by a notification.
class Engine : public std::enable_shared_from_this<Engine> {
  struct PrivateTag {};

public:
  // Builds the graph and resolves defaults: a MemoryCache (or a FileCache
  // when `cache_path` is set), the shell executor and fingerprint_inputs.
  [[nodiscard]] static auto create(EngineConfig config, Verbosity verbosity,
                                   EngineOptions options = {},
                                   std::string *diagnostic = nullptr)
      -> Result<std::shared_ptr<Engine>>;

  Engine(PrivateTag, std::unique_ptr<TaskGraph> graph, Verbosity verbosity,
         EngineOptions options);

  Engine(const Engine &) = delete;
  auto operator=(const Engine &) -> Engine & = delete;

  [[nodiscard]] auto graph() const noexcept -> const TaskGraph & {
    return *graph_;
  }
  [[nodiscard]] auto tasks_order() const noexcept
      -> std::span<const NodeIndex> {
    return graph_->tasks_order();
  }
  [[nodiscard]] auto root_names() const noexcept
      -> std::span<const TaskName> {
    return graph_->root_names();
  }
  [[nodiscard]] auto notifier() noexcept -> ChangeNotifier & {
    return notifier_;
  }
  [[nodiscard]] auto verbosity() const noexcept -> Verbosity {
    return verbosity_;
  }
  [[nodiscard]] auto cache() const noexcept
      -> const std::shared_ptr<ICacheOracle> & {
    return cache_;
  }
  [[nodiscard]] auto fingerprint_of(NodeIndex idx) const
      -> std::optional<Fingerprint>;

  // Drives every node to a terminal status. Fails with AlreadyStarted on a
  // second call, or with the first infrastructure error once all nodes are
  // terminal.
  [[nodiscard]] auto run() -> task<Result<RunResult>>;

  // run() on a private io_context, for callers without an event loop.
  [[nodiscard]] auto run_blocking() -> Result<RunResult>;

private:
  // Set-once event awaited by dependents. Strand-confined.
  class CompletionLatch {
  public:
    explicit CompletionLatch(const executor_type &ex)
        : timer_(ex, boost::asio::steady_timer::time_point::max()) {}

    auto set() -> void {
      done_ = true;
      timer_.cancel();
    }

    auto wait() -> task<void> {
      while (!done_) {
        auto [ec] = co_await timer_.async_wait(use_nothrow);
        (void)ec;
      }
    }

  private:
    boost::asio::steady_timer timer_;
    bool done_{false};
  };

  auto coordinate() -> task<Result<RunResult>>;
  auto run_node(NodeIndex idx) -> task<void>;
  auto execute_node(NodeIndex idx, const Fingerprint *fingerprint)
      -> task<void>;

  auto finish(NodeIndex idx, TaskOutcome outcome) -> void;
  auto fail_node(NodeIndex idx, std::string error) -> void;
  auto transitioned(NodeIndex idx) -> void;
  auto record_error(std::error_code ec) -> void;
  [[nodiscard]] auto dependency_inputs(NodeIndex idx) const -> JsonValue;
  [[nodiscard]] auto collect_outputs() const -> Outputs;

  std::unique_ptr<TaskGraph> graph_;
  Verbosity verbosity_;
  std::shared_ptr<ICacheOracle> cache_;
  std::shared_ptr<IExecutor> executor_;
  Fingerprinter fingerprinter_;
  LineCallback on_line_;
  StatusCallback on_status_;
  ChangeNotifier notifier_;

  std::atomic<bool> started_{false};
  // Strand-confined while run() is active.
  std::vector<std::unique_ptr<CompletionLatch>> latches_;
  std::vector<std::optional<Fingerprint>> fingerprints_;
  std::optional<std::error_code> first_error_;
};

} // namespace devtasks
