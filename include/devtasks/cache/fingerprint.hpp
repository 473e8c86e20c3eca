#pragma once

#include "devtasks/task/task_definition.hpp"
#include "devtasks/util/id.hpp"

#include <functional>
#include <optional>

namespace devtasks {

// Computes the cache key of a task just before it would run. No value means
// the task is never cached.
using Fingerprinter =
    std::function<std::optional<Fingerprint>(const TaskDefinition &)>;

// Default fingerprinter. Tasks without inputs get no fingerprint. Otherwise
// the name, command, working directory, environment and the content of every
// input are hashed; directories are walked recursively in sorted order.
[[nodiscard]] auto fingerprint_inputs(const TaskDefinition &definition)
    -> std::optional<Fingerprint>;

} // namespace devtasks
