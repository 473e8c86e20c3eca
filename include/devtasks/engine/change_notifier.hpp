#pragma once

#include "devtasks/core/coroutine.hpp"

#include <boost/asio/experimental/concurrent_channel.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace devtasks {

// Level-triggered broadcast without payload. A waiter takes the current
// generation with subscribe(); any later notify() makes that token stale and
// wakes every waiter holding it. Waiting on a stale token returns at once.
class ChangeNotifier {
public:
  using Generation = std::uint64_t;

  ChangeNotifier() = default;
  ChangeNotifier(const ChangeNotifier &) = delete;
  auto operator=(const ChangeNotifier &) -> ChangeNotifier & = delete;

  [[nodiscard]] auto subscribe() const -> Generation;

  auto notify() -> void;

  // Blocks until the generation differs from `seen`; returns the new one.
  auto wait(Generation seen) const -> Generation;

  // Like wait(), but gives up after `timeout` and returns the current
  // generation, which equals `seen` on timeout.
  auto wait_for(Generation seen, std::chrono::milliseconds timeout) const
      -> Generation;

  // Coroutine flavour of wait(). Resumes on the awaiting executor.
  [[nodiscard]] auto async_wait(Generation seen) -> task<Generation>;

private:
  using Wakeup = boost::asio::experimental::concurrent_channel<
      void(boost::system::error_code)>;

  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  Generation generation_{0};
  std::vector<std::shared_ptr<Wakeup>> waiters_;
};

} // namespace devtasks
