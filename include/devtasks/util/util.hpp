#pragma once

#include "devtasks/util/enum.hpp"
#include "devtasks/util/hash.hpp"
#include "devtasks/util/time.hpp"

namespace devtasks {

template <class... Ts> struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace devtasks
