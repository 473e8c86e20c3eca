#include "devtasks/engine/change_notifier.hpp"
#include "test_utils.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>

#include "gtest/gtest.h"

#include <atomic>
#include <chrono>
#include <thread>

using namespace devtasks;
using namespace std::chrono_literals;

TEST(ChangeNotifierTest, NotifyAdvancesGeneration) {
  ChangeNotifier notifier;
  auto g0 = notifier.subscribe();
  notifier.notify();
  EXPECT_NE(notifier.subscribe(), g0);
}

TEST(ChangeNotifierTest, StaleTokenReturnsImmediately) {
  ChangeNotifier notifier;
  auto seen = notifier.subscribe();
  notifier.notify();
  EXPECT_NE(notifier.wait(seen), seen);
  EXPECT_NE(notifier.wait_for(seen, 1ms), seen);
}

TEST(ChangeNotifierTest, WaitForTimesOutWithoutNotify) {
  ChangeNotifier notifier;
  auto seen = notifier.subscribe();
  EXPECT_EQ(notifier.wait_for(seen, 10ms), seen);
}

TEST(ChangeNotifierTest, WaitWakesOnNotifyFromAnotherThread) {
  ChangeNotifier notifier;
  auto seen = notifier.subscribe();
  std::jthread producer([&] {
    std::this_thread::sleep_for(10ms);
    notifier.notify();
  });
  EXPECT_NE(notifier.wait(seen), seen);
}

TEST(ChangeNotifierTest, EveryWaiterWakes) {
  ChangeNotifier notifier;
  auto seen = notifier.subscribe();
  std::atomic<int> woken{0};
  std::vector<std::jthread> waiters;
  for (int i = 0; i < 3; ++i) {
    waiters.emplace_back([&] {
      notifier.wait(seen);
      woken.fetch_add(1);
    });
  }
  std::this_thread::sleep_for(10ms);
  notifier.notify();
  waiters.clear();
  EXPECT_EQ(woken.load(), 3);
}

TEST(ChangeNotifierTest, AsyncWaitOnStaleTokenCompletes) {
  ChangeNotifier notifier;
  auto seen = notifier.subscribe();
  notifier.notify();
  auto next = test::run_coro(notifier.async_wait(seen), 1s);
  EXPECT_NE(next, seen);
}

TEST(ChangeNotifierTest, AsyncWaitResumesAfterNotify) {
  ChangeNotifier notifier;
  boost::asio::io_context io;
  auto seen = notifier.subscribe();
  std::optional<ChangeNotifier::Generation> got;

  boost::asio::co_spawn(
      io,
      [&]() -> task<void> { got = co_await notifier.async_wait(seen); },
      boost::asio::detached);
  io.run_for(5ms);
  EXPECT_FALSE(got.has_value());

  std::jthread producer([&] { notifier.notify(); });
  producer.join();
  io.restart();
  io.run_for(1s);
  ASSERT_TRUE(got.has_value());
  EXPECT_NE(*got, seen);
}
