#pragma once

#include "flowforge/core/error.hpp"
#include "flowforge/run/run_types.hpp"

#include <string>

namespace flowforge {

/// JSON document of a run and its attempt records. Enums are snake_case
/// strings and timestamps ISO 8601 UTC (empty when unset).
[[nodiscard]] auto to_json(const RunSnapshot &snapshot, bool pretty = false)
    -> Result<std::string>;

} // namespace flowforge
