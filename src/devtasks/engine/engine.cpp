#include "devtasks/engine/engine.hpp"

#include "devtasks/util/log.hpp"
#include "devtasks/util/time.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_future.hpp>

#include <exception>
#include <format>
#include <utility>

namespace devtasks {

auto Engine::create(EngineConfig config, Verbosity verbosity,
                    EngineOptions options, std::string *diagnostic)
    -> Result<std::shared_ptr<Engine>> {
  auto graph =
      TaskGraph::build(std::move(config.tasks), config.roots, diagnostic);
  if (!graph) {
    return fail(graph.error());
  }

  if (!options.cache) {
    if (options.cache_path) {
      auto file_cache = FileCache::open(*options.cache_path);
      if (!file_cache) {
        if (diagnostic) {
          *diagnostic = std::format("cannot open cache store {}",
                                    options.cache_path->string());
        }
        return fail(Error::CacheUnavailable);
      }
      options.cache = std::move(*file_cache);
    } else {
      options.cache = std::make_shared<MemoryCache>();
    }
  }
  if (!options.executor) {
    options.executor = create_shell_executor();
  }
  if (!options.fingerprinter) {
    options.fingerprinter = fingerprint_inputs;
  }

  log::debug("Engine created with {} tasks, verbosity {}", (*graph)->size(),
             to_string_view(verbosity));
  return ok(std::make_shared<Engine>(PrivateTag{}, std::move(*graph),
                                     verbosity, std::move(options)));
}

Engine::Engine(PrivateTag, std::unique_ptr<TaskGraph> graph,
               Verbosity verbosity, EngineOptions options)
    : graph_(std::move(graph)), verbosity_(verbosity),
      cache_(std::move(options.cache)), executor_(std::move(options.executor)),
      fingerprinter_(std::move(options.fingerprinter)),
      on_line_(std::move(options.on_line)),
      on_status_(std::move(options.on_status)) {}

auto Engine::fingerprint_of(NodeIndex idx) const
    -> std::optional<Fingerprint> {
  if (idx >= fingerprints_.size()) {
    return std::nullopt;
  }
  return fingerprints_[idx];
}

auto Engine::run() -> task<Result<RunResult>> {
  if (started_.exchange(true, std::memory_order_acq_rel)) {
    co_return fail(Error::AlreadyStarted);
  }
  auto self = shared_from_this();
  auto strand = boost::asio::make_strand(co_await boost::asio::this_coro::executor);
  co_return co_await co_spawn(strand, self->coordinate(), use_awaitable);
}

auto Engine::run_blocking() -> Result<RunResult> {
  boost::asio::io_context io;
  auto future = co_spawn(io, run(), boost::asio::use_future);
  io.run();
  return future.get();
}

auto Engine::coordinate() -> task<Result<RunResult>> {
  auto strand = co_await boost::asio::this_coro::executor;
  const auto count = graph_->size();
  latches_.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    latches_.push_back(std::make_unique<CompletionLatch>(strand));
  }
  fingerprints_.assign(count, std::nullopt);

  const auto started = Clock::now();
  log::info("Running {} tasks", count);

  for (auto idx : graph_->tasks_order()) {
    co_spawn(strand, run_node(idx), detached);
  }
  for (auto idx : graph_->tasks_order()) {
    co_await latches_[idx]->wait();
  }

  RunResult result{.summary = summarize(*graph_),
                   .outputs = collect_outputs()};
  log::info("Run finished in {}: {}",
            util::format_duration(Clock::now() - started),
            result.summary.describe());

  if (first_error_) {
    co_return fail(*first_error_);
  }
  co_return ok(std::move(result));
}

auto Engine::run_node(NodeIndex idx) -> task<void> {
  for (auto dep : graph_->deps_view(idx)) {
    co_await latches_[dep]->wait();
  }

  const auto &def = graph_->definition(idx);
  try {
    for (auto dep : graph_->deps_view(idx)) {
      if (is_failure(graph_->cell(dep).snapshot())) {
        log::debug("Task {} skipped: dependency {} failed", def.name,
                   graph_->name(dep));
        finish(idx, outcome::DependencyFailed{});
        latches_[idx]->set();
        co_return;
      }
    }

    fingerprints_[idx] = fingerprinter_(def);
    if (const auto &fp = fingerprints_[idx]) {
      auto hit = co_await cache_->lookup(*fp);
      if (!hit) {
        log::error("Cache lookup for {} failed: {}", def.name,
                   hit.error().message());
        record_error(hit.error());
        fail_node(idx, std::format("cache lookup failed: {}",
                                   hit.error().message()));
        latches_[idx]->set();
        co_return;
      }
      if (*hit) {
        log::debug("Task {} cached ({})", def.name, *fp);
        finish(idx, outcome::Skipped{.reason = outcome::Cached{*fp}});
        latches_[idx]->set();
        co_return;
      }
    }

    if (!def.has_command()) {
      finish(idx, outcome::Skipped{.reason = outcome::NotImplemented{}});
      latches_[idx]->set();
      co_return;
    }

    co_await execute_node(idx, fingerprints_[idx] ? &*fingerprints_[idx]
                                                  : nullptr);
  } catch (const std::exception &ex) {
    log::error("Task {} aborted: {}", def.name, ex.what());
    if (!is_completed(graph_->cell(idx).snapshot())) {
      fail_node(idx, ex.what());
    }
  }
  latches_[idx]->set();
}

auto Engine::execute_node(NodeIndex idx, const Fingerprint *fingerprint)
    -> task<void> {
  const auto &def = graph_->definition(idx);
  auto &cell = graph_->mutable_cell(idx);

  const auto started_at = Clock::now();
  if (auto res = cell.begin_run(started_at); !res) {
    record_error(res.error());
    co_return;
  }
  transitioned(idx);
  log::debug("Task {} running{}", def.name,
             fingerprint ? std::format(" (fingerprint {})", *fingerprint)
                         : std::string{});

  ExecutorRequest req{
      .executor = co_await boost::asio::this_coro::executor,
      .task = def.name,
      .command = *def.command,
      .working_dir = def.working_dir,
      .env = def.env,
      .inputs = dependency_inputs(idx),
  };
  auto result = co_await execute_async(*executor_, std::move(req), on_line_);
  const auto duration = Clock::now() - started_at;

  if (result.succeeded()) {
    finish(idx, outcome::Success{.duration = duration,
                                 .output = std::move(result.output)});
    co_return;
  }
  log::debug("Task {} failed: {}", def.name, result.error);
  finish(idx, outcome::Failed{
                  .duration = duration,
                  .failure = TaskFailure{
                      .error = std::move(result.error),
                      .stdout_lines = std::move(result.stdout_lines),
                      .stderr_lines = std::move(result.stderr_lines),
                      .started_at = started_at}});
}

auto Engine::finish(NodeIndex idx, TaskOutcome outcome) -> void {
  if (auto res = graph_->mutable_cell(idx).complete(std::move(outcome));
      !res) {
    record_error(res.error());
    return;
  }
  transitioned(idx);
}

auto Engine::transitioned(NodeIndex idx) -> void {
  if (on_status_) {
    on_status_(graph_->name(idx), graph_->cell(idx).read().kind());
  }
  notifier_.notify();
}

// Failures outside the executor still pass through Running.
auto Engine::fail_node(NodeIndex idx, std::string error) -> void {
  auto &cell = graph_->mutable_cell(idx);
  auto started_at = Clock::now();
  if (const auto current = cell.snapshot();
      const auto *running = std::get_if<status::Running>(&current)) {
    started_at = running->started_at;
  } else if (auto res = cell.begin_run(started_at); !res) {
    record_error(res.error());
    return;
  } else {
    transitioned(idx);
  }
  finish(idx, outcome::Failed{.duration = Clock::now() - started_at,
                              .failure = TaskFailure{
                                  .error = std::move(error),
                                  .started_at = started_at}});
}

auto Engine::record_error(std::error_code ec) -> void {
  if (!first_error_) {
    first_error_ = ec;
  }
}

auto Engine::dependency_inputs(NodeIndex idx) const -> JsonValue {
  JsonValue inputs = JsonValue::object_t{};
  for (auto dep : graph_->deps_view(idx)) {
    auto view = graph_->cell(dep).read();
    const auto *completed = std::get_if<status::Completed>(&view.status());
    if (!completed) {
      continue;
    }
    if (const auto *success =
            std::get_if<outcome::Success>(&completed->outcome)) {
      inputs.get_object().emplace(graph_->name(dep).str(), success->output);
    }
  }
  return inputs;
}

auto Engine::collect_outputs() const -> Outputs {
  Outputs outputs;
  for (auto idx : graph_->tasks_order()) {
    auto view = graph_->cell(idx).read();
    const auto *completed = std::get_if<status::Completed>(&view.status());
    if (!completed) {
      continue;
    }
    if (const auto *success =
            std::get_if<outcome::Success>(&completed->outcome)) {
      outputs.emplace(graph_->name(idx), success->output);
    }
  }
  return outputs;
}

} // namespace devtasks
