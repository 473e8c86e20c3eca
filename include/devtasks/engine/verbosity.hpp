#pragma once

#include "devtasks/util/enum.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>

namespace devtasks {

// Only affects rendering; the engine behaves the same at every level.
enum class Verbosity : std::uint8_t { Quiet, Normal, Verbose };
BOOST_DESCRIBE_ENUM(Verbosity, Quiet, Normal, Verbose)
DEVTASKS_DEFINE_ENUM_SERDE(Verbosity)

} // namespace devtasks
