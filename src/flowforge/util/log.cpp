#include "flowforge/util/log.hpp"

#include <optional>
#include <vector>

namespace flowforge::log {

auto parse_level(std::string_view name) noexcept -> Level {
  const auto *it = std::ranges::find(level_names, name);
  if (it == level_names.end()) {
    return Level::Info;
  }
  return static_cast<Level>(std::distance(level_names.begin(), it));
}

auto logger() -> Logger & {
  static Logger instance;
  return instance;
}

Logger::~Logger() {
  stop();
  if (file_ != nullptr) {
    std::fclose(file_);
  }
}

auto Logger::start() -> void {
  if (running_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }
  queue_ctx_.restart();
  auto channel =
      std::make_shared<LogChannel>(queue_ctx_.get_executor(), kQueueCapacity);
  queue_.store(channel, std::memory_order_release);
  writer_ = std::jthread(
      [this, channel = std::move(channel)] { writer_loop(channel); });
}

auto Logger::stop() -> void {
  if (!running_.exchange(false, std::memory_order_acq_rel)) {
    return;
  }
  if (auto queue = queue_.exchange(nullptr, std::memory_order_acq_rel)) {
    queue->close();
  }
  if (writer_.joinable()) {
    writer_.join();
  }
}

auto Logger::set_output_stderr() -> void {
  std::scoped_lock lock(output_mu_);
  output_ = stderr;
  if (file_ != nullptr) {
    std::fclose(file_);
    file_ = nullptr;
  }
}

auto Logger::set_output_file(std::string_view path) -> bool {
  if (path.empty()) {
    set_output_stderr();
    return true;
  }
  FILE *f = std::fopen(std::string(path).c_str(), "a");
  if (f == nullptr) {
    return false;
  }
  std::setvbuf(f, nullptr, _IOLBF, 0);
  std::scoped_lock lock(output_mu_);
  if (file_ != nullptr) {
    std::fclose(file_);
  }
  file_ = f;
  output_ = f;
  return true;
}

auto Logger::write_line(std::string_view line) -> void {
  std::scoped_lock lock(output_mu_);
  std::fwrite(line.data(), 1, line.size(), output_);
}

auto Logger::submit(std::string line) -> void {
  auto queue = queue_.load(std::memory_order_acquire);
  if (queue && queue->try_send(boost::system::error_code{}, std::move(line))) {
    return;
  }
  if (!queue) {
    write_line(line);
    std::scoped_lock lock(output_mu_);
    std::fflush(output_);
    return;
  }
  // Queue full: runtime threads must never block on the log sink.
  dropped_.fetch_add(1, std::memory_order_relaxed);
}

auto Logger::writer_loop(std::shared_ptr<LogChannel> queue) -> void {
  std::vector<std::string> batch;
  batch.reserve(64);

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
    queue_ctx_.run_one();
    if (recv_ec || !first) {
      break;
    }

    batch.clear();
    batch.push_back(std::move(*first));
    while (batch.size() < 64) {
      std::optional<std::string> more;
      const bool got = queue->try_receive(
          [&](const boost::system::error_code &ec, std::string item) {
            if (!ec) {
              more = std::move(item);
            }
          });
      if (!got || !more) {
        break;
      }
      batch.push_back(std::move(*more));
    }

    std::scoped_lock lock(output_mu_);
    for (const auto &line : batch) {
      std::fwrite(line.data(), 1, line.size(), output_);
    }
    std::fflush(output_);
  }

  // Lines still buffered when the channel closed.
  std::scoped_lock lock(output_mu_);
  for (;;) {
    std::optional<std::string> rest;
    const bool got = queue->try_receive(
        [&](const boost::system::error_code &ec, std::string item) {
          if (!ec) {
            rest = std::move(item);
          }
        });
    if (!got) {
      break;
    }
    if (rest) {
      std::fwrite(rest->data(), 1, rest->size(), output_);
    }
  }
  std::fflush(output_);
}

} // namespace flowforge::log
