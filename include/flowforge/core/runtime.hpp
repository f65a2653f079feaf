#pragma once

#include "flowforge/core/coroutine.hpp"
#include "flowforge/core/error.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <cassert>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

namespace flowforge {

using shard_id = unsigned;

inline constexpr shard_id kInvalidShard = std::numeric_limits<shard_id>::max();

// One event loop per shard, one thread per event loop. State owned by a shard
// is only ever touched from that shard's thread.
class Shard {
public:
  explicit Shard(shard_id id) : id_(id) {}

  Shard(const Shard &) = delete;
  auto operator=(const Shard &) -> Shard & = delete;

  [[nodiscard]] auto id() const noexcept -> shard_id { return id_; }
  [[nodiscard]] auto ctx() noexcept -> boost::asio::io_context & {
    return ctx_;
  }

private:
  shard_id id_;
  boost::asio::io_context ctx_{1};
};

class Runtime {
public:
  explicit Runtime(unsigned num_shards = 0);
  ~Runtime() noexcept;

  Runtime(const Runtime &) = delete;
  auto operator=(const Runtime &) -> Runtime & = delete;

  [[nodiscard]] auto start() -> Result<void>;
  auto stop() noexcept -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool;

  template <typename T> auto spawn_on(shard_id target, task<T> coro) -> void {
    assert(target < num_shards_);
    co_spawn(shards_[target]->ctx().get_executor(), std::move(coro), detached);
  }

  template <typename F> auto post_to(shard_id target, F &&fn) -> void {
    assert(target < num_shards_);
    boost::asio::post(shards_[target]->ctx().get_executor(),
                      std::forward<F>(fn));
  }

  [[nodiscard]] auto executor_for(shard_id id)
      -> boost::asio::io_context::executor_type {
    assert(id < num_shards_);
    return shards_[id]->ctx().get_executor();
  }

  [[nodiscard]] auto shard_count() const noexcept -> unsigned {
    return num_shards_;
  }

  /// Shard that owns all mutable state for the given key.
  template <typename Key>
  [[nodiscard]] auto owner_of(const Key &key) const noexcept -> shard_id {
    return static_cast<shard_id>(std::hash<Key>{}(key) % num_shards_);
  }

  /// Spawns on the owning shard of `key` and returns that shard.
  template <typename Key, typename T>
  auto spawn_owned(const Key &key, task<T> coro) -> shard_id {
    auto shard = owner_of(key);
    spawn_on(shard, std::move(coro));
    return shard;
  }

  [[nodiscard]] auto current_shard() const noexcept -> shard_id;
  [[nodiscard]] auto is_current_shard() const noexcept -> bool;
  /// Exceptions that escaped a handler since construction.
  [[nodiscard]] auto handler_failures() const noexcept -> std::uint64_t;

private:
  auto run_shard(shard_id id) -> void;

  alignas(64) std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> handler_failures_{0};
  unsigned num_shards_;
  std::vector<std::unique_ptr<Shard>> shards_;
  std::vector<std::optional<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>>
      work_guards_;
  std::vector<std::jthread> threads_;
};

namespace detail {
inline thread_local shard_id current_shard_id = kInvalidShard;
inline thread_local const Runtime *current_runtime = nullptr;
} // namespace detail

/// Suspend the calling coroutine on its own executor.
template <typename Rep, typename Period>
[[nodiscard]] auto async_sleep(std::chrono::duration<Rep, Period> duration)
    -> task<Result<void>> {
  boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);
  timer.expires_after(duration);
  co_return as_result(co_await timer.async_wait(use_nothrow));
}

} // namespace flowforge
