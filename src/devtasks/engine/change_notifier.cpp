#include "devtasks/engine/change_notifier.hpp"

#include <boost/asio/this_coro.hpp>

#include <utility>

namespace devtasks {

auto ChangeNotifier::subscribe() const -> Generation {
  std::lock_guard lock(mutex_);
  return generation_;
}

auto ChangeNotifier::notify() -> void {
  std::vector<std::shared_ptr<Wakeup>> waiters;
  {
    std::lock_guard lock(mutex_);
    ++generation_;
    waiters.swap(waiters_);
  }
  cv_.notify_all();
  for (auto &waiter : waiters) {
    // Capacity 1 and a single send per registration; cannot be full.
    (void)waiter->try_send(boost::system::error_code{});
  }
}

auto ChangeNotifier::wait(Generation seen) const -> Generation {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [&] { return generation_ != seen; });
  return generation_;
}

auto ChangeNotifier::wait_for(Generation seen,
                              std::chrono::milliseconds timeout) const
    -> Generation {
  std::unique_lock lock(mutex_);
  cv_.wait_for(lock, timeout, [&] { return generation_ != seen; });
  return generation_;
}

auto ChangeNotifier::async_wait(Generation seen) -> task<Generation> {
  auto executor = co_await boost::asio::this_coro::executor;
  auto wakeup = std::make_shared<Wakeup>(executor, 1);
  {
    std::lock_guard lock(mutex_);
    if (generation_ != seen) {
      co_return generation_;
    }
    waiters_.push_back(wakeup);
  }

  auto [ec] = co_await wakeup->async_receive(use_nothrow);
  (void)ec;
  co_return subscribe();
}

} // namespace devtasks
