#pragma once

#include <cstdio>
#include <format>
#include <print>
#include <string>
#include <string_view>
#include <unistd.h>
#include <vector>

namespace flowforge::cli::fmt {

namespace ansi {

inline auto is_tty() noexcept -> bool {
  static const bool tty = ::isatty(::fileno(stdout));
  return tty;
}

inline constexpr std::string_view kReset = "\033[0m";
inline constexpr std::string_view kDim = "\033[2m";

inline constexpr std::string_view kGreen = "\033[32m";
inline constexpr std::string_view kRed = "\033[31m";
inline constexpr std::string_view kYellow = "\033[33m";
inline constexpr std::string_view kBlue = "\033[34m";
inline constexpr std::string_view kCyan = "\033[36m";

inline auto colorize(std::string_view text, std::string_view color)
    -> std::string {
  if (!is_tty()) {
    return std::string(text);
  }
  return std::format("{}{}{}", color, text, kReset);
}

inline auto ansi_visible_width(std::string_view s) -> std::size_t {
  std::size_t width = 0;
  bool in_escape = false;
  for (char c : s) {
    if (in_escape) {
      if (c == 'm')
        in_escape = false;
    } else if (c == '\033') {
      in_escape = true;
    } else {
      ++width;
    }
  }
  return width;
}

} // namespace ansi

inline auto colorize_run_status(std::string_view status) -> std::string {
  if (status == "succeeded")
    return ansi::colorize(status, ansi::kGreen);
  if (status == "failed")
    return ansi::colorize(status, ansi::kRed);
  if (status == "running")
    return ansi::colorize(status, ansi::kYellow);
  if (status == "cancelled")
    return ansi::colorize(status, ansi::kDim);
  return std::string(status);
}

inline auto colorize_attempt_status(std::string_view status) -> std::string {
  if (status == "succeeded")
    return ansi::colorize(status, ansi::kGreen);
  if (status == "failed")
    return ansi::colorize(status, ansi::kRed);
  if (status == "timed_out")
    return ansi::colorize(status, ansi::kYellow);
  if (status == "running")
    return ansi::colorize(status, ansi::kBlue);
  return std::string(status);
}

inline auto colorize_task_state(std::string_view state) -> std::string {
  if (state == "succeeded")
    return ansi::colorize(state, ansi::kGreen);
  if (state == "failed" || state == "upstream_failed")
    return ansi::colorize(state, ansi::kRed);
  if (state == "skipped")
    return ansi::colorize(state, ansi::kCyan);
  if (state == "pending")
    return ansi::colorize(state, ansi::kDim);
  return std::string(state);
}

class Table {
public:
  struct Column {
    std::string header;
    std::size_t width;
    bool right_align{false};
  };

  explicit Table(std::vector<Column> columns) : columns_(std::move(columns)) {}

  auto print_header() const -> void {
    for (std::size_t i = 0; i < columns_.size(); ++i) {
      if (i > 0)
        std::print(" ");
      const auto &col = columns_[i];
      if (col.right_align) {
        std::print("{:>{}}", col.header, col.width);
      } else {
        std::print("{:<{}}", col.header, col.width);
      }
    }
    std::println("");

    std::size_t total_width = 0;
    for (const auto &col : columns_)
      total_width += col.width;
    total_width += columns_.size() - 1;
    std::println("{}", std::string(total_width, '-'));
  }

  auto print_row(const std::vector<std::string> &values) const -> void {
    for (std::size_t i = 0; i < columns_.size() && i < values.size(); ++i) {
      if (i > 0)
        std::print(" ");
      const auto &col = columns_[i];
      const auto &val = values[i];
      auto visible = ansi::ansi_visible_width(val);
      auto pad = visible < col.width ? col.width - visible : 0;
      if (col.right_align) {
        std::print("{}{}", std::string(pad, ' '), val);
      } else {
        std::print("{}{}", val, std::string(pad, ' '));
      }
    }
    std::println("");
  }

private:
  std::vector<Column> columns_;
};

// Cuts long single-line output for table cells.
inline auto truncate(std::string_view text, std::size_t width) -> std::string {
  std::string out;
  for (char c : text) {
    out.push_back(c == '\n' ? ' ' : c);
  }
  if (out.size() > width && width > 3) {
    out.resize(width - 3);
    out += "...";
  }
  return out;
}

} // namespace flowforge::cli::fmt
