#pragma once

#include "devtasks/util/enum.hpp"
#include "devtasks/util/id.hpp"
#include "devtasks/util/json.hpp"

#include <boost/describe/enum.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace devtasks {

using Clock = std::chrono::steady_clock;

enum class OutputStream : std::uint8_t { Stdout, Stderr };
BOOST_DESCRIBE_ENUM(OutputStream, Stdout, Stderr)
DEVTASKS_DEFINE_ENUM_SERDE(OutputStream)

struct OutputLine {
  Clock::time_point at;
  std::string text;
};

struct TaskFailure {
  std::string error;
  std::vector<OutputLine> stdout_lines;
  std::vector<OutputLine> stderr_lines;
  Clock::time_point started_at;
};

namespace outcome {

struct Success {
  Clock::duration duration{};
  JsonValue output{};
};

struct Failed {
  Clock::duration duration{};
  TaskFailure failure;
};

struct Cached {
  Fingerprint fingerprint;
};

struct NotImplemented {};

using SkipReason = std::variant<Cached, NotImplemented>;

struct Skipped {
  SkipReason reason;
};

struct DependencyFailed {};

} // namespace outcome

using TaskOutcome = std::variant<outcome::Success, outcome::Failed,
                                 outcome::Skipped, outcome::DependencyFailed>;

namespace status {

struct Pending {};

struct Running {
  Clock::time_point started_at;
};

struct Completed {
  TaskOutcome outcome;
};

} // namespace status

using TaskStatus =
    std::variant<status::Pending, status::Running, status::Completed>;

// Flattened view of a TaskStatus for reporting and serialization.
enum class StatusKind : std::uint8_t {
  Pending,
  Running,
  Succeeded,
  Failed,
  Cached,
  NotImplemented,
  DependencyFailed,
};
BOOST_DESCRIBE_ENUM(StatusKind, Pending, Running, Succeeded, Failed, Cached,
                    NotImplemented, DependencyFailed)
DEVTASKS_DEFINE_ENUM_SERDE(StatusKind)

[[nodiscard]] auto kind_of(const TaskOutcome &outcome) noexcept -> StatusKind;
[[nodiscard]] auto kind_of(const TaskStatus &status) noexcept -> StatusKind;

[[nodiscard]] inline auto is_completed(const TaskStatus &status) noexcept
    -> bool {
  return std::holds_alternative<status::Completed>(status);
}

// Failed or DependencyFailed; dependents of such a node never run.
[[nodiscard]] inline auto is_failure(const TaskOutcome &outcome) noexcept
    -> bool {
  return std::holds_alternative<outcome::Failed>(outcome) ||
         std::holds_alternative<outcome::DependencyFailed>(outcome);
}

[[nodiscard]] inline auto is_failure(const TaskStatus &status) noexcept
    -> bool {
  const auto *completed = std::get_if<status::Completed>(&status);
  return completed && is_failure(completed->outcome);
}

} // namespace devtasks
