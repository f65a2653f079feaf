#pragma once

#include "flowforge/core/error.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace flowforge::cli {

struct ValidateOptions {
  std::string file;
  std::string config_file;
  bool json{false};
};

struct RunOptions {
  std::string file;
  std::string config_file;
  std::vector<std::string> params; // key=value
  bool fail_fast{false};
  bool json{false};
  int timeout_sec{0}; // 0 = wait forever
  std::optional<std::string> log_level;
};

/// Splits "key=value"; the key must be non-empty.
[[nodiscard]] auto parse_param(std::string_view text)
    -> Result<std::pair<std::string, std::string>>;

[[nodiscard]] auto cmd_validate(const ValidateOptions &opts) -> int;
[[nodiscard]] auto cmd_run(const RunOptions &opts) -> int;

} // namespace flowforge::cli
