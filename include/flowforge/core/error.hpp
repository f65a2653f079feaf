#pragma once

#include <array>
#include <concepts>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace flowforge {

enum class Error : std::uint8_t {
  Success,
  FileNotFound,
  FileOpenFailed,
  ParseError,
  InvalidArgument,
  ValidationError,
  NotFound,
  AlreadyExists,
  Conflict,
  Deprecated,
  TaskFailure,
  TaskTimeout,
  Cancelled,
  CycleDetected,
  DanglingEdge,
  DuplicateTask,
  InvalidState,
  SystemNotRunning,
  ProcessForkFailed,
  ResourceExhausted,
  Unknown,
};

class ErrorCategory : public std::error_category {
  static constexpr std::array<std::string_view, 21> messages = {
      "success",
      "file not found",
      "failed to open file",
      "parse error",
      "invalid argument",
      "workflow validation failed",
      "not found",
      "already exists",
      "conflicting concurrent mutation",
      "workflow definition is deprecated",
      "task failed",
      "task timed out",
      "cancelled",
      "cycle detected in workflow graph",
      "edge references unknown task",
      "duplicate task name",
      "invalid state transition",
      "system not running",
      "failed to fork process",
      "resource exhausted",
      "unknown error",
  };

public:
  [[nodiscard]] auto name() const noexcept -> const char * override {
    return "flowforge";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    auto idx = static_cast<std::size_t>(ev);
    if (idx >= std::size(messages)) {
      return "unrecognized error";
    }
    return std::string{messages.at(idx)};
  }
};

inline auto error_category() -> const ErrorCategory & {
  static const ErrorCategory instance;
  return instance;
}

inline auto make_error_code(Error e) -> std::error_code {
  return {std::to_underlying(e), error_category()};
}

// Graph rejections all surface as ValidationError to callers that only care
// about the kind; the specific code is kept for diagnostics.
[[nodiscard]] inline auto is_validation_error(std::error_code ec) noexcept
    -> bool {
  if (ec.category() != error_category()) {
    return false;
  }
  switch (static_cast<Error>(ec.value())) {
  case Error::ValidationError:
  case Error::CycleDetected:
  case Error::DanglingEdge:
  case Error::DuplicateTask:
    return true;
  default:
    return false;
  }
}

template <typename T>
concept ResultValue = std::destructible<T> || std::is_void_v<T>;

template <typename T> using Result = std::expected<T, std::error_code>;

template <typename T>
  requires ResultValue<std::decay_t<T>>
[[nodiscard]] constexpr auto ok(T &&value) -> Result<std::decay_t<T>> {
  return std::forward<T>(value);
}

[[nodiscard]] constexpr auto ok() -> Result<void> { return {}; }

[[nodiscard]] inline auto fail(Error e) -> std::unexpected<std::error_code> {
  return std::unexpected{make_error_code(e)};
}

[[nodiscard]] inline auto fail(std::error_code ec)
    -> std::unexpected<std::error_code> {
  return std::unexpected{ec};
}

} // namespace flowforge

template <> struct std::is_error_code_enum<flowforge::Error> : std::true_type {};
