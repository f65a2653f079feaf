#include "flowforge/core/runtime.hpp"

#include "flowforge/util/log.hpp"

#include <pthread.h>

#include <algorithm>
#include <exception>
#include <format>
#include <ranges>

namespace flowforge {

namespace {

// Linux caps thread names at 15 characters.
auto name_current_thread(shard_id id) -> void {
  auto name = std::format("flowforge-s{}", id);
  name.resize(std::min<std::size_t>(name.size(), 15));
  ::pthread_setname_np(::pthread_self(), name.c_str());
}

} // namespace

Runtime::Runtime(unsigned num_shards)
    : num_shards_(num_shards == 0
                      ? std::max(1U, std::thread::hardware_concurrency())
                      : num_shards) {
  shards_.reserve(num_shards_);
  for (auto i : std::views::iota(0U, num_shards_)) {
    shards_.emplace_back(std::make_unique<Shard>(i));
  }
  work_guards_.resize(num_shards_);
}

Runtime::~Runtime() noexcept { stop(); }

auto Runtime::start() -> Result<void> {
  if (running_.exchange(true)) {
    return ok();
  }
  threads_.reserve(num_shards_);
  for (auto &shard : shards_) {
    auto &ctx = shard->ctx();
    ctx.restart();
    work_guards_[shard->id()].emplace(boost::asio::make_work_guard(ctx));
    threads_.emplace_back([this, id = shard->id()] { run_shard(id); });
  }
  log::info("runtime started with {} shard(s)", num_shards_);
  return ok();
}

auto Runtime::stop() noexcept -> void {
  if (!running_.exchange(false)) {
    return;
  }
  // Drive loops still parked on a channel are abandoned with their context.
  for (auto &guard : work_guards_) {
    guard.reset();
  }
  for (auto &shard : shards_) {
    shard->ctx().stop();
  }
  threads_.clear();
  log::debug("runtime stopped ({} handler failure(s))",
             handler_failures_.load(std::memory_order_relaxed));
}

auto Runtime::is_running() const noexcept -> bool {
  return running_.load(std::memory_order_acquire);
}

auto Runtime::current_shard() const noexcept -> shard_id {
  return detail::current_runtime == this ? detail::current_shard_id
                                         : kInvalidShard;
}

auto Runtime::is_current_shard() const noexcept -> bool {
  return current_shard() != kInvalidShard;
}

auto Runtime::handler_failures() const noexcept -> std::uint64_t {
  return handler_failures_.load(std::memory_order_relaxed);
}

auto Runtime::run_shard(shard_id id) -> void {
  name_current_thread(id);
  detail::current_shard_id = id;
  detail::current_runtime = this;

  // A handler that throws unwinds out of run(); the loop resumes where it
  // stopped so one bad callback cannot take down every run on the shard.
  auto &ctx = shards_[id]->ctx();
  for (;;) {
    try {
      ctx.run();
      break;
    } catch (const std::exception &e) {
      handler_failures_.fetch_add(1, std::memory_order_relaxed);
      log::error("shard {} handler threw: {}", id, e.what());
    }
  }

  detail::current_shard_id = kInvalidShard;
  detail::current_runtime = nullptr;
}

} // namespace flowforge
