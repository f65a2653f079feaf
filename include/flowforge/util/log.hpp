#pragma once

#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <format>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

namespace flowforge::log {

enum class Level : std::uint8_t { Trace, Debug, Info, Warn, Error, Off };

inline constexpr std::array<std::string_view, 6> level_names = {
    "trace", "debug", "info", "warn", "error", "off"};

inline constexpr std::array<std::string_view, 6> level_colors = {
    "\o{33}[90m", "\o{33}[36m", "\o{33}[32m",
    "\o{33}[33m", "\o{33}[31m", "\o{33}[0m"};

[[nodiscard]] inline auto level_name(Level level) -> std::string_view {
  return level_names.at(std::to_underlying(level));
}

[[nodiscard]] auto parse_level(std::string_view name) noexcept -> Level;

// Log lines are formatted on the calling thread and handed to a single writer
// thread through a bounded channel. When the channel is full or the writer is
// not running the line is written synchronously.
class Logger {
public:
  static constexpr std::size_t kQueueCapacity = 8192;

  Logger() = default;
  ~Logger();

  Logger(const Logger &) = delete;
  auto operator=(const Logger &) -> Logger & = delete;

  auto start() -> void;
  auto stop() -> void;

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }
  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }
  [[nodiscard]] auto enabled(Level level) const noexcept -> bool {
    return level >= this->level() && level != Level::Off;
  }

  auto set_output_stderr() -> void;
  [[nodiscard]] auto set_output_file(std::string_view path) -> bool;

  [[nodiscard]] auto dropped_messages() const noexcept -> std::uint64_t {
    return dropped_.load(std::memory_order_relaxed);
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args &&...args)
      -> void {
    if (!enabled(level)) {
      return;
    }
    auto time = std::chrono::floor<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    auto tid =
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;
    submit(std::format("[{:%Y-%m-%d %H:%M:%S}] [{}{}\o{33}[0m] [{}] {}\n", time,
                       level_colors.at(std::to_underlying(level)),
                       level_name(level), tid,
                       std::format(fmt, std::forward<Args>(args)...)));
  }

private:
  using LogChannel = boost::asio::experimental::concurrent_channel<
      boost::asio::io_context::executor_type,
      void(boost::system::error_code, std::string)>;

  auto submit(std::string line) -> void;
  auto write_line(std::string_view line) -> void;
  auto writer_loop(std::shared_ptr<LogChannel> queue) -> void;

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> dropped_{0};

  std::mutex output_mu_;
  FILE *output_{stderr};
  FILE *file_{nullptr};

  boost::asio::io_context queue_ctx_{1};
  std::atomic<std::shared_ptr<LogChannel>> queue_;
  std::jthread writer_;
};

[[nodiscard]] auto logger() -> Logger &;

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}
inline auto set_level(std::string_view name) noexcept -> void {
  logger().set_level(parse_level(name));
}
[[nodiscard]] inline auto set_output_file(std::string_view path) -> bool {
  return logger().set_output_file(path);
}
inline auto set_output_stderr() -> void { logger().set_output_stderr(); }
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

} // namespace flowforge::log
