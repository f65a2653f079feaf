#pragma once

#include "flowforge/core/error.hpp"
#include "flowforge/executor/executor.hpp"

#include <ankerl/unordered_dense.h>

#include <expected>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace flowforge {

// Value on success, error detail on failure.
using WorkResult = std::expected<std::string, std::string>;
using WorkUnit = std::function<WorkResult(const TaskContext &)>;

// Resolves a callable task's executable reference to an in-process work unit.
class TaskRegistry {
public:
  [[nodiscard]] auto add(std::string name, WorkUnit unit) -> Result<void>;
  /// Replaces an existing unit of the same name.
  auto set(std::string name, WorkUnit unit) -> void;
  [[nodiscard]] auto find(std::string_view name) const
      -> std::optional<WorkUnit>;
  [[nodiscard]] auto contains(std::string_view name) const -> bool;
  [[nodiscard]] auto names() const -> std::vector<std::string>;

private:
  mutable std::shared_mutex mu_;
  ankerl::unordered_dense::map<std::string, WorkUnit> units_;
};

class Runtime;

[[nodiscard]] auto create_callable_executor(Runtime &rt,
                                            const TaskRegistry &registry,
                                            std::size_t threads)
    -> std::unique_ptr<IExecutor>;

} // namespace flowforge
