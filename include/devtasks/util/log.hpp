#pragma once

#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <format>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace devtasks::log {

enum class Level : std::uint8_t { Trace, Debug, Info, Warn, Error };

inline constexpr std::array<std::string_view, 5> level_names = {
    "trace", "debug", "info", "warn", "error"};

inline constexpr std::array<std::string_view, 5> level_colors = {
    "\033[90m", // trace: gray
    "\033[36m", // debug: cyan
    "\033[32m", // info: green
    "\033[33m", // warn: yellow
    "\033[31m"  // error: red
};

[[nodiscard]] inline auto level_name(Level level) -> std::string_view {
  return level_names.at(std::to_underlying(level));
}

[[nodiscard]] inline auto level_color(Level level) -> std::string_view {
  return level_colors.at(std::to_underlying(level));
}

[[nodiscard]] inline auto parse_level(std::string_view name)
    -> std::optional<Level> {
  const auto *it = std::ranges::find(level_names, name);
  if (it == level_names.end()) {
    return std::nullopt;
  }
  return static_cast<Level>(std::distance(level_names.begin(), it));
}

// Lines are formatted on the calling thread and handed to a writer thread
// through a bounded channel. When the logger is not started, or the channel
// is full, the line is written synchronously.
class Logger {
  static constexpr std::size_t kQueueCapacity = 4096;
  static constexpr std::size_t kMaxBatch = 64;
  using LogChannel = boost::asio::experimental::concurrent_channel<
      boost::asio::io_context::executor_type,
      void(boost::system::error_code, std::string)>;

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> running_{false};
  std::atomic<FILE *> output_{stderr};
  std::mutex write_mutex_;
  FILE *file_{nullptr};
  boost::asio::io_context queue_ctx_{1};
  std::atomic<std::shared_ptr<LogChannel>> queue_;
  std::jthread writer_;

  auto write_batch(const std::vector<std::string> &batch) -> void {
    std::lock_guard lock(write_mutex_);
    auto *out = output_.load(std::memory_order_acquire);
    for (const auto &line : batch) {
      std::fwrite(line.data(), 1, line.size(), out);
    }
    std::fflush(out);
  }

  auto write_now(std::string_view line) -> void {
    std::lock_guard lock(write_mutex_);
    auto *out = output_.load(std::memory_order_acquire);
    std::fwrite(line.data(), 1, line.size(), out);
    std::fflush(out);
  }

  auto writer_loop(std::shared_ptr<LogChannel> queue) -> void {
    std::vector<std::string> batch;
    batch.reserve(kMaxBatch);

    for (;;) {
      std::optional<std::string> first;
      boost::system::error_code recv_ec;
      queue->async_receive(
          [&](const boost::system::error_code &ec, std::string item) {
            recv_ec = ec;
            if (!ec) {
              first = std::move(item);
            }
          });
      queue_ctx_.restart();
      (void)queue_ctx_.run_one();
      if (recv_ec || !first) {
        break;
      }

      batch.clear();
      batch.push_back(std::move(*first));
      while (batch.size() < kMaxBatch) {
        std::optional<std::string> more;
        const bool received = queue->try_receive(
            [&](const boost::system::error_code &ec, std::string item) {
              if (!ec) {
                more = std::move(item);
              }
            });
        if (!received || !more) {
          break;
        }
        batch.push_back(std::move(*more));
      }
      write_batch(batch);
    }

    // Channel closed: flush what is still buffered.
    batch.clear();
    for (;;) {
      std::optional<std::string> rest;
      const bool received = queue->try_receive(
          [&](const boost::system::error_code &ec, std::string item) {
            if (!ec) {
              rest = std::move(item);
            }
          });
      if (!received) {
        break;
      }
      if (rest) {
        batch.push_back(std::move(*rest));
      }
    }
    if (!batch.empty()) {
      write_batch(batch);
    }
  }

public:
  Logger() = default;
  ~Logger() {
    stop();
    if (file_) {
      std::fclose(file_);
    }
  }

  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  auto start() -> void {
    if (running_.exchange(true, std::memory_order_acq_rel)) {
      return;
    }
    queue_ctx_.restart();
    auto channel = std::make_shared<LogChannel>(queue_ctx_.get_executor(),
                                                kQueueCapacity);
    queue_.store(channel, std::memory_order_release);
    writer_ = std::jthread(
        [this, channel = std::move(channel)] { writer_loop(channel); });
  }

  auto stop() -> void {
    if (!running_.exchange(false, std::memory_order_acq_rel)) {
      return;
    }
    auto queue = queue_.exchange(nullptr, std::memory_order_acq_rel);
    if (queue) {
      queue->close();
    }
    if (writer_.joinable()) {
      writer_.join();
    }
  }

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  auto set_output_stderr() noexcept -> void {
    output_.store(stderr, std::memory_order_release);
  }

  auto set_output_stdout() noexcept -> void {
    output_.store(stdout, std::memory_order_release);
  }

  auto set_output_file(std::string_view path) -> bool {
    FILE *f = std::fopen(std::string(path).c_str(), "a");
    if (!f) {
      return false;
    }
    std::setvbuf(f, nullptr, _IOLBF, 0);
    std::lock_guard lock(write_mutex_);
    output_.store(f, std::memory_order_release);
    if (file_) {
      std::fclose(file_);
    }
    file_ = f;
    return true;
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args &&...args)
      -> void {
    if (level < level_.load(std::memory_order_acquire)) {
      return;
    }

    const auto now =
        std::chrono::floor<std::chrono::milliseconds>(
            std::chrono::system_clock::now());
    const auto tid =
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;

    std::string line;
    line.reserve(256);
    std::format_to(std::back_inserter(line),
                   "[{:%Y-%m-%d %H:%M:%S}] [{}{}\033[0m] [{}] {}\n", now,
                   level_color(level), level_name(level), tid,
                   std::format(fmt, std::forward<Args>(args)...));

    auto queue = queue_.load(std::memory_order_acquire);
    if (queue && queue->try_send(boost::system::error_code{}, line)) {
      return;
    }
    write_now(line);
  }
};

inline Logger &logger() {
  static Logger instance;
  return instance;
}

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

/// Unknown names leave the current level untouched and return false.
inline auto set_level(std::string_view name) noexcept -> bool {
  if (auto level = parse_level(name)) {
    logger().set_level(*level);
    return true;
  }
  return false;
}

inline auto set_output_file(std::string_view path) -> bool {
  return logger().set_output_file(path);
}

inline auto set_output_stderr() noexcept -> void {
  logger().set_output_stderr();
}

inline auto start() -> void { logger().start(); }
inline auto stop() -> void { logger().stop(); }

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

} // namespace devtasks::log
