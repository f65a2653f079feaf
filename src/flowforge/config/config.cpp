#include "flowforge/config/config.hpp"
#include "flowforge/config/toml_util.hpp"

#include "flowforge/util/log.hpp"

#include <boost/lexical_cast.hpp>

#include <cstdint>
#include <cstdlib>
#include <format>
#include <string>
#include <string_view>
#include <type_traits>

namespace flowforge {
namespace detail {

struct EngineToml {
  unsigned shards{0};
  std::size_t max_in_flight{64};
  std::size_t worker_threads{4};
};

struct LogToml {
  std::string level{"info"};
  std::string file;
};

struct RetentionToml {
  std::int64_t run_ttl_sec{0};
  std::int64_t purge_interval_sec{60};
};

struct DefaultsToml {
  std::string failure_policy{"fail_slow"};
  std::int64_t timeout_sec{task_defaults::kTimeout.count()};
  int max_retries{task_defaults::kMaxRetries};
  std::int64_t backoff_base_ms{task_defaults::kBackoffBase.count()};
  std::int64_t backoff_cap_ms{task_defaults::kBackoffCap.count()};
  double backoff_multiplier{task_defaults::kBackoffMultiplier};
  double backoff_jitter{task_defaults::kBackoffJitter};
};

struct ConfigToml {
  EngineToml engine{};
  LogToml log{};
  RetentionToml retention{};
  DefaultsToml defaults{};
};

} // namespace detail
} // namespace flowforge

namespace glz {
template <> struct meta<flowforge::detail::EngineToml> {
  using T = flowforge::detail::EngineToml;
  static constexpr auto value =
      object("shards", &T::shards, "max_in_flight", &T::max_in_flight,
             "worker_threads", &T::worker_threads);
};

template <> struct meta<flowforge::detail::LogToml> {
  using T = flowforge::detail::LogToml;
  static constexpr auto value = object("level", &T::level, "file", &T::file);
};

template <> struct meta<flowforge::detail::RetentionToml> {
  using T = flowforge::detail::RetentionToml;
  static constexpr auto value =
      object("run_ttl_sec", &T::run_ttl_sec, "purge_interval_sec",
             &T::purge_interval_sec);
};

template <> struct meta<flowforge::detail::DefaultsToml> {
  using T = flowforge::detail::DefaultsToml;
  static constexpr auto value = object(
      "failure_policy", &T::failure_policy, "timeout_sec", &T::timeout_sec,
      "max_retries", &T::max_retries, "backoff_base_ms", &T::backoff_base_ms,
      "backoff_cap_ms", &T::backoff_cap_ms, "backoff_multiplier",
      &T::backoff_multiplier, "backoff_jitter", &T::backoff_jitter);
};

template <> struct meta<flowforge::detail::ConfigToml> {
  using T = flowforge::detail::ConfigToml;
  static constexpr auto value =
      object("engine", &T::engine, "log", &T::log, "retention", &T::retention,
             "defaults", &T::defaults);
};
} // namespace glz

namespace flowforge {
namespace {

template <typename T> auto env_override(const char *name, T &target) -> void {
  if (const char *v = std::getenv(name); v != nullptr) {
    if constexpr (std::is_same_v<T, std::string>) {
      target = v;
    } else {
      target = boost::lexical_cast<T>(v);
    }
  }
}

auto apply_env_overrides(detail::ConfigToml &raw) -> void {
  env_override("FLOWFORGE_SHARDS", raw.engine.shards);
  env_override("FLOWFORGE_MAX_IN_FLIGHT", raw.engine.max_in_flight);
  env_override("FLOWFORGE_WORKER_THREADS", raw.engine.worker_threads);
  env_override("FLOWFORGE_LOG_LEVEL", raw.log.level);
  env_override("FLOWFORGE_LOG_FILE", raw.log.file);
  env_override("FLOWFORGE_RUN_TTL_SEC", raw.retention.run_ttl_sec);
  env_override("FLOWFORGE_PURGE_INTERVAL_SEC",
               raw.retention.purge_interval_sec);
  env_override("FLOWFORGE_FAILURE_POLICY", raw.defaults.failure_policy);
  env_override("FLOWFORGE_MAX_RETRIES", raw.defaults.max_retries);
  env_override("FLOWFORGE_TIMEOUT_SEC", raw.defaults.timeout_sec);
}

auto set_diagnostic(std::string *diagnostic, std::string message) -> void {
  if (diagnostic) {
    *diagnostic = std::move(message);
  }
}

[[nodiscard]] auto convert(detail::ConfigToml raw, std::string *diagnostic)
    -> Result<EngineConfig> {
  apply_env_overrides(raw);

  if (!util::is_known_enum_token<FailurePolicy>(raw.defaults.failure_policy)) {
    set_diagnostic(diagnostic, std::format("unknown failure_policy '{}'",
                                           raw.defaults.failure_policy));
    return fail(Error::InvalidArgument);
  }
  if (raw.retention.run_ttl_sec < 0 || raw.retention.purge_interval_sec < 0 ||
      raw.defaults.timeout_sec <= 0 || raw.defaults.backoff_base_ms < 0) {
    set_diagnostic(diagnostic, "durations must not be negative and the "
                               "default timeout must be positive");
    return fail(Error::InvalidArgument);
  }

  EngineConfig cfg{};
  cfg.engine.shards = raw.engine.shards;
  cfg.engine.max_in_flight = raw.engine.max_in_flight;
  cfg.engine.worker_threads = raw.engine.worker_threads;

  cfg.log.level = std::move(raw.log.level);
  cfg.log.file = std::move(raw.log.file);

  cfg.retention.run_ttl = std::chrono::seconds{raw.retention.run_ttl_sec};
  cfg.retention.purge_interval =
      std::chrono::seconds{raw.retention.purge_interval_sec};

  cfg.defaults.failure_policy =
      parse<FailurePolicy>(raw.defaults.failure_policy);
  cfg.defaults.timeout = std::chrono::seconds{raw.defaults.timeout_sec};
  cfg.defaults.retry = RetryPolicy{
      .max_retries = raw.defaults.max_retries,
      .backoff_base = std::chrono::milliseconds{raw.defaults.backoff_base_ms},
      .backoff_cap = std::chrono::milliseconds{raw.defaults.backoff_cap_ms},
      .multiplier = raw.defaults.backoff_multiplier,
      .jitter = raw.defaults.backoff_jitter,
  };

  if (auto r = validate_config(cfg, diagnostic); !r) {
    return fail(r.error());
  }
  return ok(std::move(cfg));
}

[[nodiscard]] auto convert_guarded(detail::ConfigToml raw,
                                   std::string *diagnostic)
    -> Result<EngineConfig> {
  try {
    return convert(std::move(raw), diagnostic);
  } catch (const boost::bad_lexical_cast &e) {
    log::error("Invalid FLOWFORGE_* environment override: {}", e.what());
    set_diagnostic(diagnostic,
                   std::format("invalid environment override: {}", e.what()));
    return fail(Error::ParseError);
  }
}

} // namespace

auto validate_config(const EngineConfig &cfg, std::string *diagnostic)
    -> Result<void> {
  if (cfg.engine.max_in_flight == 0) {
    set_diagnostic(diagnostic, "engine.max_in_flight must be at least 1");
    return fail(Error::InvalidArgument);
  }
  if (cfg.engine.worker_threads == 0) {
    set_diagnostic(diagnostic, "engine.worker_threads must be at least 1");
    return fail(Error::InvalidArgument);
  }
  if (cfg.defaults.retry.backoff_cap < cfg.defaults.retry.backoff_base) {
    set_diagnostic(diagnostic,
                   "defaults.backoff_cap_ms is below defaults.backoff_base_ms");
    return fail(Error::InvalidArgument);
  }
  if (cfg.defaults.retry.multiplier < 1.0) {
    set_diagnostic(diagnostic, "defaults.backoff_multiplier must be >= 1");
    return fail(Error::InvalidArgument);
  }
  if (cfg.defaults.retry.jitter < 0.0 || cfg.defaults.retry.jitter > 1.0) {
    set_diagnostic(diagnostic, "defaults.backoff_jitter must be in [0, 1]");
    return fail(Error::InvalidArgument);
  }
  if (cfg.defaults.retry.max_retries < 0) {
    set_diagnostic(diagnostic, "defaults.max_retries must not be negative");
    return fail(Error::InvalidArgument);
  }
  return ok();
}

auto ConfigLoader::load_from_file(std::string_view path,
                                  std::string *diagnostic)
    -> Result<EngineConfig> {
  return toml_util::load<detail::ConfigToml>(path, diagnostic)
      .and_then([&](detail::ConfigToml raw) {
        return convert_guarded(std::move(raw), diagnostic);
      });
}

auto ConfigLoader::load_from_string(std::string_view toml_str,
                                    std::string *diagnostic)
    -> Result<EngineConfig> {
  auto raw = toml_util::parse<detail::ConfigToml>(toml_str, {}, diagnostic);
  if (!raw) {
    return fail(raw.error());
  }
  return convert_guarded(std::move(*raw), diagnostic);
}

auto ConfigLoader::load_defaults(std::string *diagnostic)
    -> Result<EngineConfig> {
  return convert_guarded(detail::ConfigToml{}, diagnostic);
}

} // namespace flowforge
