#include "flowforge/core/coroutine.hpp"
#include "flowforge/core/runtime.hpp"
#include "flowforge/executor/executor.hpp"
#include "flowforge/util/log.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/cancel_after.hpp>
#include <boost/asio/readable_pipe.hpp>
#include <boost/process/v2/environment.hpp>
#include <boost/process/v2/process.hpp>
#include <boost/process/v2/stdio.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <format>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <signal.h>
#include <sys/types.h>
#include <unistd.h>

namespace flowforge {

namespace {

namespace bp = boost::process::v2;

inline constexpr std::size_t kMaxOutputSize = 4UZ * 1024 * 1024;
inline constexpr std::size_t kReadBufferSize = 4096;
inline constexpr std::size_t kCommandPreview = 80;

// "batch-date" -> "FLOWFORGE_PARAM_BATCH_DATE"
[[nodiscard]] auto param_env_key(std::string_view key) -> std::string {
  std::string out{"FLOWFORGE_PARAM_"};
  for (char c : key) {
    const auto uc = static_cast<unsigned char>(c);
    out.push_back(std::isalnum(uc) != 0
                      ? static_cast<char>(std::toupper(uc))
                      : '_');
  }
  return out;
}

[[nodiscard]] auto build_process_env(const TaskContext &ctx)
    -> bp::process_environment {
  std::vector<std::pair<std::string, std::string>> custom{
      {"FLOWFORGE_RUN_ID", ctx.run_id.str()},
      {"FLOWFORGE_TASK", ctx.task.str()},
      {"FLOWFORGE_ATTEMPT", std::to_string(ctx.attempt)},
  };
  if (ctx.params) {
    for (const auto &[k, v] : *ctx.params) {
      custom.emplace_back(param_env_key(k), v);
    }
  }

  std::vector<bp::environment::key_value_pair> env_vec;
  env_vec.reserve(64);
  for (const auto &entry : bp::environment::current()) {
    auto key_view = entry.key();
    std::string key(key_view.data(), key_view.size());
    if (std::ranges::any_of(custom,
                            [&](const auto &kv) { return kv.first == key; })) {
      continue;
    }
    env_vec.emplace_back(entry);
  }
  for (const auto &[k, v] : custom) {
    env_vec.emplace_back(bp::environment::key{k}, bp::environment::value{v});
  }
  return bp::process_environment(std::move(env_vec));
}

[[nodiscard]] auto preview(std::string_view cmd) -> std::string_view {
  return cmd.substr(0, std::min(cmd.size(), kCommandPreview));
}

[[nodiscard]] auto trim_trailing_newlines(std::string s) -> std::string {
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) {
    s.pop_back();
  }
  return s;
}

struct WaitResult {
  int exit_code{-1};
  bool timed_out{false};
};

// Puts the shell at the head of its own process group, so a timeout or
// cancel reaches every process the command started.
struct NewProcessGroup {
  template <typename Launcher, typename CommandLine>
  auto on_exec_setup(Launcher &, const bp::filesystem::path &,
                     CommandLine &) const -> boost::system::error_code {
    if (::setpgid(0, 0) != 0) {
      return {errno, boost::system::system_category()};
    }
    return {};
  }
};

auto kill_group(pid_t pgid) -> void {
  if (pgid <= 0) {
    return;
  }
  if (::killpg(pgid, SIGKILL) != 0 && errno != ESRCH) {
    log::warn("killpg {} failed: {}", pgid, std::strerror(errno));
  }
}

struct OutputPipes {
  explicit OutputPipes(const boost::asio::any_io_executor &ex)
      : out(ex), err(ex) {}

  // Aborts pending reads even while some descendant still holds the write
  // ends.
  auto close() -> void {
    for (auto *pipe : {&out, &err}) {
      boost::system::error_code ec;
      pipe->close(ec);
      if (ec) {
        log::debug("closing output pipe: {}", ec.message());
      }
    }
  }

  boost::asio::readable_pipe out;
  boost::asio::readable_pipe err;
};

[[nodiscard]] auto read_pipe_all(boost::asio::readable_pipe &pipe,
                                 std::string &out) -> task<void> {
  std::array<char, kReadBufferSize> buffer{};
  for (;;) {
    auto [ec, bytes] = co_await pipe.async_read_some(
        boost::asio::buffer(buffer), use_nothrow);
    if (ec) {
      co_return;
    }
    if (out.size() < kMaxOutputSize) {
      out.append(buffer.data(),
                 std::min<std::size_t>(kMaxOutputSize - out.size(), bytes));
    }
  }
}

[[nodiscard]] auto wait_with_timeout(bp::process &proc,
                                     std::chrono::milliseconds timeout,
                                     OutputPipes &pipes) -> task<WaitResult> {
  const auto pgid = static_cast<pid_t>(proc.id());
  auto [ec, exit_code] =
      co_await proc.async_wait(boost::asio::cancel_after(timeout, use_nothrow));
  if (!ec) {
    // Background jobs the command left behind would hold the pipes open.
    kill_group(pgid);
    co_return WaitResult{.exit_code = exit_code, .timed_out = false};
  }

  kill_group(pgid);
  pipes.close();
  if (ec != boost::asio::error::operation_aborted) {
    log::error("waiting for pid {} failed: {}", pgid, ec.message());
    co_return WaitResult{};
  }
  auto [reap_ec, reaped] = co_await proc.async_wait(use_nothrow);
  if (reap_ec) {
    log::debug("reaping pid {} after timeout: {}", pgid, reap_ec.message());
  }
  co_return WaitResult{.exit_code = kExitCodeTimeout, .timed_out = true};
}

} // namespace

class ShellExecutor final : public IExecutor {
public:
  explicit ShellExecutor(Runtime &rt)
      : runtime_{&rt}, active_(rt.shard_count()) {}

  ShellExecutor(const ShellExecutor &) = delete;
  auto operator=(const ShellExecutor &) -> ShellExecutor & = delete;

  auto start(ExecutorRequest req, ExecutionSink sink) -> Result<void> override {
    if (req.executable.empty()) {
      return fail(Error::InvalidArgument);
    }
    log::debug("shell start {} timeout={}ms cmd='{}'", req.attempt_id,
               req.timeout.count(), preview(req.executable));

    auto owner = runtime_->owner_of(req.attempt_id);
    runtime_->spawn_on(owner, run(owner, std::move(req), std::move(sink)));
    return ok();
  }

  auto cancel(const AttemptId &attempt_id) -> void override {
    auto owner = runtime_->owner_of(attempt_id);
    runtime_->post_to(owner, [this, owner, attempt_id] {
      auto it = active_[owner].find(attempt_id);
      if (it == active_[owner].end() || it->second <= 0) {
        return;
      }
      if (::killpg(it->second, SIGKILL) != 0) {
        log::warn("kill process group {} for {} failed: {}", it->second,
                  attempt_id, std::strerror(errno));
        return;
      }
      log::info("Killed process group for {}", attempt_id);
    });
  }

private:
  auto run(shard_id owner, ExecutorRequest req, ExecutionSink sink)
      -> spawn_task {
    auto ex = co_await boost::asio::this_coro::executor;
    OutputPipes pipes(ex);
    std::string out;
    std::string err;

    auto finish = [&](TaskOutcome outcome) {
      if (sink.on_complete) {
        sink.on_complete(req.attempt_id, std::move(outcome));
      }
    };

    std::optional<bp::process> proc;
    try {
      std::vector<std::string> args{"-c", req.executable};
      proc.emplace(ex, "/bin/sh", args,
                   bp::process_stdio{.in = nullptr,
                                     .out = pipes.out,
                                     .err = pipes.err},
                   build_process_env(req.context), NewProcessGroup{});
    } catch (const std::exception &e) {
      log::error("failed to spawn {}: {}", req.attempt_id, e.what());
      finish(TaskFailed{.error = std::format("spawn failed: {}", e.what()),
                        .exit_code = -1});
      co_return;
    }

    const auto pid = static_cast<pid_t>(proc->id());
    // Also set from the parent so the group exists before the first kill.
    if (::setpgid(pid, pid) != 0 && errno != EACCES) {
      log::debug("setpgid {} from parent: {}", pid, std::strerror(errno));
    }
    active_[owner][req.attempt_id] = pid;

    using namespace awaitable_ops;
    auto waited = co_await (read_pipe_all(pipes.out, out) &&
                            read_pipe_all(pipes.err, err) &&
                            wait_with_timeout(*proc, req.timeout, pipes));

    active_[owner].erase(req.attempt_id);
    log::debug("shell finish {} exit_code={} timed_out={}", req.attempt_id,
               waited.exit_code, waited.timed_out);

    if (waited.timed_out) {
      finish(TaskTimedOut{.after = req.timeout});
    } else if (waited.exit_code == 0) {
      finish(TaskSucceeded{.result = trim_trailing_newlines(std::move(out))});
    } else {
      auto detail = trim_trailing_newlines(std::move(err));
      finish(TaskFailed{
          .error = detail.empty()
                       ? std::format("exit code {}", waited.exit_code)
                       : std::format("exit code {}: {}", waited.exit_code,
                                     detail),
          .exit_code = waited.exit_code});
    }
  }

  Runtime *runtime_;
  // Per-shard pid table, only touched from its owning shard.
  std::vector<std::unordered_map<AttemptId, pid_t>> active_;
};

auto create_shell_executor(Runtime &rt) -> std::unique_ptr<IExecutor> {
  return std::make_unique<ShellExecutor>(rt);
}

} // namespace flowforge
