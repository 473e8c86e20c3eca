#include "devtasks/engine/engine.hpp"
#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <format>
#include <map>
#include <memory>
#include <mutex>
#include <ranges>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace devtasks;
using namespace std::chrono_literals;
using devtasks::test::FakeExecutor;
using devtasks::test::make_task;
using devtasks::test::task_name;

namespace {

// Fingerprints every task with a command by its name.
auto name_fingerprinter(const TaskDefinition &def)
    -> std::optional<Fingerprint> {
  if (!def.has_command()) {
    return std::nullopt;
  }
  return Fingerprint{"fp-" + def.name.str()};
}

class FailingCache final : public ICacheOracle {
public:
  auto lookup(const Fingerprint &) -> task<Result<bool>> override {
    co_return fail(Error::CacheUnavailable);
  }
  auto record(const Fingerprint &) -> Result<void> override {
    return fail(Error::CacheUnavailable);
  }
};

// Every transition in strand order, as reported through on_status.
class TransitionLog {
public:
  auto callback() -> StatusCallback {
    return [this](const TaskName &task, StatusKind kind) {
      std::lock_guard lock(mutex_);
      events_.emplace_back(task.str(), kind);
    };
  }

  [[nodiscard]] auto sequence(std::string_view task) const
      -> std::vector<StatusKind> {
    std::lock_guard lock(mutex_);
    std::vector<StatusKind> seq{StatusKind::Pending};
    for (const auto &[name, kind] : events_) {
      if (name == task) {
        seq.push_back(kind);
      }
    }
    return seq;
  }

  // Position of the first `kind` event for `task`, or -1.
  [[nodiscard]] auto position(std::string_view task, StatusKind kind) const
      -> int {
    std::lock_guard lock(mutex_);
    for (const auto &[i, event] : std::views::enumerate(events_)) {
      if (event.first == task && event.second == kind) {
        return static_cast<int>(i);
      }
    }
    return -1;
  }

private:
  mutable std::mutex mutex_;
  std::vector<std::pair<std::string, StatusKind>> events_;
};

// Pending -> Running -> Succeeded|Failed, or Pending straight to a skip.
auto is_legal_sequence(const std::vector<StatusKind> &seq) -> bool {
  if (seq.size() == 3) {
    return seq[0] == StatusKind::Pending && seq[1] == StatusKind::Running &&
           (seq[2] == StatusKind::Succeeded || seq[2] == StatusKind::Failed);
  }
  if (seq.size() == 2) {
    return seq[0] == StatusKind::Pending &&
           (seq[1] == StatusKind::Cached ||
            seq[1] == StatusKind::NotImplemented ||
            seq[1] == StatusKind::DependencyFailed);
  }
  return false;
}

auto describe(const std::vector<StatusKind> &seq) -> std::string {
  std::string out;
  for (auto kind : seq) {
    if (!out.empty()) {
      out += " -> ";
    }
    out += to_string_view(kind);
  }
  return out;
}

} // namespace

class EngineTest : public ::testing::Test {
protected:
  auto make_engine(std::vector<TaskDefinition> tasks,
                   std::vector<TaskName> roots = {},
                   Verbosity verbosity = Verbosity::Quiet)
      -> std::shared_ptr<Engine> {
    EngineOptions options;
    options.executor = executor_;
    options.cache = cache_;
    options.fingerprinter = name_fingerprinter;
    options.on_status = transitions_.callback();
    auto engine = Engine::create(
        EngineConfig{.tasks = std::move(tasks), .roots = std::move(roots)},
        verbosity, std::move(options));
    if (!engine) {
      ADD_FAILURE() << "Engine::create failed: " << engine.error().message();
      return nullptr;
    }
    return std::move(*engine);
  }

  auto kind(const Engine &engine, std::string_view name) -> StatusKind {
    auto idx = engine.graph().get_index(task_name(name));
    return engine.graph().cell(idx).read().kind();
  }

  std::shared_ptr<FakeExecutor> executor_ = std::make_shared<FakeExecutor>();
  std::shared_ptr<MemoryCache> cache_ = std::make_shared<MemoryCache>();
  TransitionLog transitions_;
};

TEST_F(EngineTest, DiamondRunsEverythingInDependencyOrder) {
  std::vector<TaskDefinition> tasks;
  tasks.push_back(make_task("build"));
  tasks.push_back(make_task("test", {"build"}));
  tasks.push_back(make_task("lint", {"build"}));
  tasks.push_back(make_task("deploy", {"test", "lint"}));
  auto engine = make_engine(std::move(tasks));
  ASSERT_NE(engine, nullptr);

  auto result = engine->run_blocking();
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->summary.succeeded, 4);
  EXPECT_FALSE(result->summary.has_failures());

  auto finished = executor_->finished();
  ASSERT_EQ(finished.size(), 4);
  EXPECT_EQ(finished.front(), "build");
  EXPECT_EQ(finished.back(), "deploy");

  auto deploy_started = transitions_.position("deploy", StatusKind::Running);
  ASSERT_GE(deploy_started, 0);
  for (auto dep : {"test", "lint"}) {
    auto dep_done = transitions_.position(dep, StatusKind::Succeeded);
    ASSERT_GE(dep_done, 0) << dep;
    EXPECT_LT(dep_done, deploy_started) << dep;
  }
}

TEST_F(EngineTest, DiamondFailureSkipsJoinButSiblingCompletes) {
  executor_->fail("test");
  std::vector<TaskDefinition> tasks;
  tasks.push_back(make_task("build"));
  tasks.push_back(make_task("test", {"build"}));
  tasks.push_back(make_task("lint", {"build"}));
  tasks.push_back(make_task("deploy", {"test", "lint"}));
  auto engine = make_engine(std::move(tasks));
  ASSERT_NE(engine, nullptr);

  auto result = engine->run_blocking();
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(kind(*engine, "build"), StatusKind::Succeeded);
  EXPECT_EQ(kind(*engine, "test"), StatusKind::Failed);
  EXPECT_EQ(kind(*engine, "lint"), StatusKind::Succeeded);
  EXPECT_EQ(kind(*engine, "deploy"), StatusKind::DependencyFailed);
  EXPECT_FALSE(executor_->ran("deploy"));
  EXPECT_EQ(transitions_.position("deploy", StatusKind::Running), -1);
  EXPECT_EQ(result->summary.succeeded, 2);
  EXPECT_EQ(result->summary.failed, 1);
  EXPECT_EQ(result->summary.dependency_failed, 1);
}

TEST_F(EngineTest, IndependentTasksRunConcurrently) {
  executor_->delay_all(50ms);
  std::vector<TaskDefinition> tasks;
  for (auto name : {"a", "b", "c", "d"}) {
    tasks.push_back(make_task(name));
  }
  auto engine = make_engine(std::move(tasks));
  ASSERT_NE(engine, nullptr);

  auto result = engine->run_blocking();
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->summary.succeeded, 4);
  EXPECT_EQ(executor_->max_active(), 4);
}

TEST_F(EngineTest, FailurePropagatesToTransitiveDependents) {
  executor_->fail("build");
  std::vector<TaskDefinition> tasks;
  tasks.push_back(make_task("build"));
  tasks.push_back(make_task("test", {"build"}));
  tasks.push_back(make_task("deploy", {"test"}));
  tasks.push_back(make_task("docs"));
  auto engine = make_engine(std::move(tasks));
  ASSERT_NE(engine, nullptr);

  auto result = engine->run_blocking();
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(kind(*engine, "build"), StatusKind::Failed);
  EXPECT_EQ(kind(*engine, "test"), StatusKind::DependencyFailed);
  EXPECT_EQ(kind(*engine, "deploy"), StatusKind::DependencyFailed);
  EXPECT_EQ(kind(*engine, "docs"), StatusKind::Succeeded);
  EXPECT_FALSE(executor_->ran("test"));
  EXPECT_FALSE(executor_->ran("deploy"));

  EXPECT_EQ(result->summary.failed, 1);
  EXPECT_EQ(result->summary.dependency_failed, 2);
  EXPECT_TRUE(result->summary.has_failures());
}

TEST_F(EngineTest, FailureKeepsCapturedOutput) {
  FakeExecutor::Script script;
  script.result.exit_code = 2;
  script.result.error = "exited with status 2";
  script.stdout_lines = {"compiling", "error: nope"};
  executor_->script("build", std::move(script));

  std::vector<TaskDefinition> tasks;
  tasks.push_back(make_task("build"));
  auto engine = make_engine(std::move(tasks));
  ASSERT_NE(engine, nullptr);
  ASSERT_TRUE(engine->run_blocking().has_value());

  auto status = engine->graph().cell(0).snapshot();
  const auto &completed = std::get<status::Completed>(status);
  const auto &failed = std::get<outcome::Failed>(completed.outcome);
  EXPECT_EQ(failed.failure.error, "exited with status 2");
  ASSERT_EQ(failed.failure.stdout_lines.size(), 2);
  EXPECT_EQ(failed.failure.stdout_lines[1].text, "error: nope");
  EXPECT_LE(failed.failure.started_at, failed.failure.stdout_lines[0].at);
}

TEST_F(EngineTest, ExecutorStartFailureMarksTaskFailed) {
  executor_->refuse("build");
  std::vector<TaskDefinition> tasks;
  tasks.push_back(make_task("build"));
  tasks.push_back(make_task("test", {"build"}));
  auto engine = make_engine(std::move(tasks));
  ASSERT_NE(engine, nullptr);

  auto result = engine->run_blocking();
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(kind(*engine, "build"), StatusKind::Failed);
  EXPECT_EQ(kind(*engine, "test"), StatusKind::DependencyFailed);
}

TEST_F(EngineTest, CachedTaskIsSkippedAndDependentsRun) {
  ASSERT_TRUE(cache_->record(Fingerprint{"fp-build"}).has_value());
  std::vector<TaskDefinition> tasks;
  tasks.push_back(make_task("build"));
  tasks.push_back(make_task("test", {"build"}));
  auto engine = make_engine(std::move(tasks));
  ASSERT_NE(engine, nullptr);

  auto result = engine->run_blocking();
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(kind(*engine, "build"), StatusKind::Cached);
  EXPECT_EQ(kind(*engine, "test"), StatusKind::Succeeded);
  EXPECT_FALSE(executor_->ran("build"));
  EXPECT_EQ(result->summary.skipped, 1);
  EXPECT_EQ(result->summary.succeeded, 1);
}

TEST_F(EngineTest, EngineDoesNotRecordIntoCache) {
  std::vector<TaskDefinition> tasks;
  tasks.push_back(make_task("build"));
  auto engine = make_engine(std::move(tasks));
  ASSERT_NE(engine, nullptr);
  ASSERT_TRUE(engine->run_blocking().has_value());

  EXPECT_EQ(cache_->size(), 0);
  auto fp = engine->fingerprint_of(0);
  ASSERT_TRUE(fp.has_value());
  EXPECT_EQ(*fp, "fp-build");
}

TEST_F(EngineTest, TaskWithoutCommandIsNotImplemented) {
  std::vector<TaskDefinition> tasks;
  tasks.push_back(make_task("placeholder", {}, std::nullopt));
  tasks.push_back(make_task("after", {"placeholder"}));
  auto engine = make_engine(std::move(tasks));
  ASSERT_NE(engine, nullptr);

  auto result = engine->run_blocking();
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(kind(*engine, "placeholder"), StatusKind::NotImplemented);
  EXPECT_EQ(kind(*engine, "after"), StatusKind::Succeeded);
  EXPECT_EQ(result->summary.skipped, 1);
}

TEST_F(EngineTest, CacheLookupErrorFailsTaskAndRun) {
  std::vector<TaskDefinition> tasks;
  tasks.push_back(make_task("build"));
  tasks.push_back(make_task("test", {"build"}));

  EngineOptions options;
  options.executor = executor_;
  options.cache = std::make_shared<FailingCache>();
  options.fingerprinter = name_fingerprinter;
  options.on_status = transitions_.callback();
  auto engine = Engine::create(EngineConfig{.tasks = std::move(tasks)},
                               Verbosity::Quiet, std::move(options));
  ASSERT_TRUE(engine.has_value());

  auto result = (*engine)->run_blocking();
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::CacheUnavailable));
  EXPECT_EQ(kind(**engine, "build"), StatusKind::Failed);
  EXPECT_EQ(kind(**engine, "test"), StatusKind::DependencyFailed);
  EXPECT_TRUE(executor_->started().empty());

  EXPECT_EQ(transitions_.sequence("build"),
            (std::vector{StatusKind::Pending, StatusKind::Running,
                         StatusKind::Failed}));
  EXPECT_EQ(transitions_.sequence("test"),
            (std::vector{StatusKind::Pending, StatusKind::DependencyFailed}));

  auto idx = (*engine)->graph().get_index(task_name("build"));
  auto view = (*engine)->graph().cell(idx).read();
  const auto &failed = std::get<outcome::Failed>(
      std::get<status::Completed>(view.status()).outcome);
  EXPECT_TRUE(failed.failure.error.starts_with("cache lookup failed"));
}

TEST_F(EngineTest, OutputsFlowToDependentsAndResult) {
  FakeExecutor::Script script;
  script.result.output = JsonValue::object_t{};
  script.result.output.get_object().emplace("version", std::string{"1.2.3"});
  executor_->script("build", std::move(script));

  std::vector<TaskDefinition> tasks;
  tasks.push_back(make_task("build"));
  tasks.push_back(make_task("publish", {"build"}));
  auto engine = make_engine(std::move(tasks));
  ASSERT_NE(engine, nullptr);

  auto result = engine->run_blocking();
  ASSERT_TRUE(result.has_value());

  auto requests = executor_->requests();
  auto publish = std::ranges::find_if(
      requests, [](const auto &r) { return r.task == "publish"; });
  ASSERT_NE(publish, requests.end());
  ASSERT_TRUE(publish->inputs.is_object());
  EXPECT_EQ(dump_json(publish->inputs), R"({"build":{"version":"1.2.3"}})");

  auto build = std::ranges::find_if(
      requests, [](const auto &r) { return r.task == "build"; });
  ASSERT_NE(build, requests.end());
  EXPECT_EQ(dump_json(build->inputs), "{}");

  ASSERT_EQ(result->outputs.size(), 2);
  EXPECT_EQ(dump_json(result->outputs.at(task_name("build"))),
            R"({"version":"1.2.3"})");
  EXPECT_TRUE(is_null_json(result->outputs.at(task_name("publish"))));
}

TEST_F(EngineTest, RootsLimitWhatRuns) {
  std::vector<TaskDefinition> tasks;
  tasks.push_back(make_task("build"));
  tasks.push_back(make_task("test", {"build"}));
  tasks.push_back(make_task("docs"));
  auto engine = make_engine(std::move(tasks), {task_name("test")});
  ASSERT_NE(engine, nullptr);

  ASSERT_TRUE(engine->run_blocking().has_value());
  EXPECT_FALSE(executor_->ran("docs"));
  EXPECT_EQ(engine->graph().size(), 2);
  ASSERT_EQ(engine->root_names().size(), 1);
  EXPECT_EQ(engine->root_names()[0], "test");
}

TEST_F(EngineTest, NothingIsPendingOrRunningAfterRun) {
  executor_->fail("b");
  std::vector<TaskDefinition> tasks;
  tasks.push_back(make_task("a"));
  tasks.push_back(make_task("b", {"a"}));
  tasks.push_back(make_task("c", {"b"}));
  tasks.push_back(make_task("d", {}, std::nullopt));
  auto engine = make_engine(std::move(tasks));
  ASSERT_NE(engine, nullptr);

  auto result = engine->run_blocking();
  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->summary.is_finished());
  EXPECT_EQ(result->summary.total(), 4);
  for (auto idx : engine->tasks_order()) {
    EXPECT_TRUE(is_completed(engine->graph().cell(idx).snapshot()));
  }
}

TEST_F(EngineTest, EveryTaskFollowsALegalStatusSequence) {
  ASSERT_TRUE(cache_->record(Fingerprint{"fp-fetch"}).has_value());
  executor_->delay_all(5ms);
  executor_->fail("compile");
  std::vector<TaskDefinition> tasks;
  tasks.push_back(make_task("fetch"));
  tasks.push_back(make_task("configure", {"fetch"}));
  tasks.push_back(make_task("compile", {"configure"}));
  tasks.push_back(make_task("package", {"compile"}));
  tasks.push_back(make_task("docs", {}, std::nullopt));
  auto engine = make_engine(std::move(tasks));
  ASSERT_NE(engine, nullptr);

  std::atomic<bool> done{false};
  std::atomic<int> regressions{0};
  std::jthread observer([&] {
    std::vector<bool> completed(engine->graph().size(), false);
    auto seen = engine->notifier().subscribe();
    while (!done.load()) {
      seen = engine->notifier().wait_for(seen, 10ms);
      for (auto idx : engine->tasks_order()) {
        auto now_completed = is_completed(engine->graph().cell(idx).snapshot());
        if (completed[idx] && !now_completed) {
          regressions.fetch_add(1);
        }
        completed[idx] = now_completed;
      }
    }
  });

  auto result = engine->run_blocking();
  done.store(true);
  observer.join();
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(regressions.load(), 0);

  for (auto name : {"fetch", "configure", "compile", "package", "docs"}) {
    auto seq = transitions_.sequence(name);
    EXPECT_TRUE(is_legal_sequence(seq)) << name << ": " << describe(seq);
  }
  EXPECT_EQ(transitions_.sequence("fetch").back(), StatusKind::Cached);
  EXPECT_EQ(transitions_.sequence("configure").back(), StatusKind::Succeeded);
  EXPECT_EQ(transitions_.sequence("compile").back(), StatusKind::Failed);
  EXPECT_EQ(transitions_.sequence("package").back(),
            StatusKind::DependencyFailed);
  EXPECT_EQ(transitions_.sequence("docs").back(), StatusKind::NotImplemented);
}

TEST_F(EngineTest, SecondRunIsRejected) {
  std::vector<TaskDefinition> tasks;
  tasks.push_back(make_task("a"));
  auto engine = make_engine(std::move(tasks));
  ASSERT_NE(engine, nullptr);

  ASSERT_TRUE(engine->run_blocking().has_value());
  auto again = engine->run_blocking();
  ASSERT_FALSE(again.has_value());
  EXPECT_EQ(again.error(), make_error_code(Error::AlreadyStarted));
}

TEST_F(EngineTest, LineCallbackReceivesOutput) {
  FakeExecutor::Script script;
  script.stdout_lines = {"hello"};
  executor_->script("greet", std::move(script));

  std::mutex mutex;
  std::vector<std::string> lines;
  EngineOptions options;
  options.executor = executor_;
  options.on_line = [&](const TaskName &task, OutputStream stream,
                        const OutputLine &line) {
    std::lock_guard lock(mutex);
    lines.push_back(std::format("{}:{}:{}", task, to_string_view(stream),
                                line.text));
  };
  std::vector<TaskDefinition> tasks;
  tasks.push_back(make_task("greet"));
  auto engine = Engine::create(EngineConfig{.tasks = std::move(tasks)},
                               Verbosity::Verbose, std::move(options));
  ASSERT_TRUE(engine.has_value());
  ASSERT_TRUE((*engine)->run_blocking().has_value());

  ASSERT_EQ(lines.size(), 1);
  EXPECT_EQ(lines[0], "greet:stdout:hello");
}

TEST_F(EngineTest, CreateRejectsInvalidGraph) {
  std::vector<TaskDefinition> tasks;
  tasks.push_back(make_task("a", {"b"}));
  tasks.push_back(make_task("b", {"a"}));

  std::string diagnostic;
  auto engine = Engine::create(EngineConfig{.tasks = std::move(tasks)},
                               Verbosity::Normal, {}, &diagnostic);
  ASSERT_FALSE(engine.has_value());
  EXPECT_EQ(engine.error(), make_error_code(Error::CycleDetected));
  EXPECT_FALSE(diagnostic.empty());
}

TEST_F(EngineTest, CreateReportsUnusableCachePath) {
  test::TempDir dir;
  auto blocker = dir.path() / "file";
  test::write_file(blocker, "not a directory");

  std::vector<TaskDefinition> tasks;
  tasks.push_back(make_task("a"));
  EngineOptions options;
  options.executor = executor_;
  options.cache_path = blocker / "sub" / "cache.json";
  auto engine = Engine::create(EngineConfig{.tasks = std::move(tasks)},
                               Verbosity::Quiet, std::move(options));
  ASSERT_FALSE(engine.has_value());
  EXPECT_EQ(engine.error(), make_error_code(Error::CacheUnavailable));
}
