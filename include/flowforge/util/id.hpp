#pragma once

#include <algorithm>
#include <cctype>
#include <concepts>
#include <cstdint>
#include <format>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace flowforge {

[[nodiscard]] inline auto has_control_chars(std::string_view value) noexcept
    -> bool {
  return std::any_of(value.begin(), value.end(),
                     [](unsigned char ch) { return std::iscntrl(ch) != 0; });
}

[[nodiscard]] inline auto is_valid_id_text(std::string_view value) noexcept
    -> bool {
  return !value.empty() && !has_control_chars(value);
}

struct WorkflowTag {};
struct TaskTag {};
struct RunTag {};
struct AttemptTag {};

// Phantom-typed string identity. Mixing a run id with a task name is a
// compile error rather than a lookup miss.
template <typename Tag> class TypedId {
public:
  explicit TypedId(std::string value) : value_(std::move(value)) {}
  explicit TypedId(std::string_view value) : value_(value) {}
  explicit TypedId(const char *value) : value_(value ? value : "") {}

  TypedId() = default;

  [[nodiscard]] auto value() const noexcept -> std::string_view {
    return value_;
  }
  [[nodiscard]] auto str() const noexcept -> const std::string & {
    return value_;
  }

  [[nodiscard]] friend auto operator<=>(const TypedId &lhs,
                                        const TypedId &rhs) = default;
  [[nodiscard]] friend auto operator==(const TypedId &lhs, const TypedId &rhs)
      -> bool = default;

  [[nodiscard]] friend auto operator==(const TypedId &lhs,
                                       std::string_view rhs) noexcept -> bool {
    return lhs.value_ == rhs;
  }

  [[nodiscard]] auto empty() const noexcept -> bool { return value_.empty(); }
  [[nodiscard]] auto valid() const noexcept -> bool {
    return is_valid_id_text(value_);
  }

private:
  std::string value_;
};

using WorkflowName = TypedId<WorkflowTag>;
using TaskName = TypedId<TaskTag>;
using RunId = TypedId<RunTag>;
using AttemptId = TypedId<AttemptTag>;

template <typename T>
concept IsTypedId = requires(T id) {
  { id.value() } -> std::convertible_to<std::string_view>;
  { id.empty() } -> std::convertible_to<bool>;
};

template <typename Tag>
inline auto operator<<(std::ostream &os, const TypedId<Tag> &id)
    -> std::ostream & {
  return os << id.value();
}

} // namespace flowforge

// `is_avalanching` makes ankerl::unordered_dense::hash use this specialization
// instead of hashing the object bytes.
template <typename Tag> struct std::hash<flowforge::TypedId<Tag>> {
  using is_avalanching = void;
  auto operator()(const flowforge::TypedId<Tag> &id) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(id.value());
  }
};

template <typename Tag>
struct std::formatter<flowforge::TypedId<Tag>>
    : std::formatter<std::string_view> {
  auto format(const flowforge::TypedId<Tag> &id, auto &ctx) const {
    return std::formatter<std::string_view>::format(id.value(), ctx);
  }
};

namespace flowforge {

namespace detail {
[[nodiscard]] auto generate_uuid_v7_like() -> std::string;
} // namespace detail

// Time-ordered so lexicographic order of run ids follows creation order.
[[nodiscard]] inline auto generate_run_id() -> RunId {
  return RunId{detail::generate_uuid_v7_like()};
}

[[nodiscard]] inline auto make_attempt_id(const RunId &run_id,
                                          const TaskName &task,
                                          std::uint32_t attempt) -> AttemptId {
  return AttemptId{std::format("{}/{}#{}", run_id, task, attempt)};
}

} // namespace flowforge
