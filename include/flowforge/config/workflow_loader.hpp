#pragma once

#include "flowforge/config/engine_config.hpp"
#include "flowforge/core/error.hpp"
#include "flowforge/workflow/definition.hpp"

#include <string>
#include <string_view>

namespace flowforge {

// Reads workflow definitions from TOML. Knobs a task leaves unset fall back
// to the file's [defaults] table, then to the engine-wide `defaults`.
class WorkflowLoader {
public:
  explicit WorkflowLoader(TaskDefaults defaults = {})
      : defaults_(std::move(defaults)) {}

  [[nodiscard]] auto load_file(std::string_view path,
                               std::string *diagnostic = nullptr) const
      -> Result<WorkflowSpec>;
  [[nodiscard]] auto load_string(std::string_view toml,
                                 std::string *diagnostic = nullptr) const
      -> Result<WorkflowSpec>;

private:
  TaskDefaults defaults_;
};

} // namespace flowforge
