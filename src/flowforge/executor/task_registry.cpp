#include "flowforge/executor/task_registry.hpp"

#include <algorithm>
#include <mutex>

namespace flowforge {

auto TaskRegistry::add(std::string name, WorkUnit unit) -> Result<void> {
  if (name.empty() || !unit) {
    return fail(Error::InvalidArgument);
  }
  std::unique_lock lock(mu_);
  auto [_, inserted] = units_.try_emplace(std::move(name), std::move(unit));
  if (!inserted) {
    return fail(Error::AlreadyExists);
  }
  return ok();
}

auto TaskRegistry::set(std::string name, WorkUnit unit) -> void {
  std::unique_lock lock(mu_);
  units_.insert_or_assign(std::move(name), std::move(unit));
}

auto TaskRegistry::find(std::string_view name) const
    -> std::optional<WorkUnit> {
  std::shared_lock lock(mu_);
  auto it = units_.find(std::string(name));
  if (it == units_.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto TaskRegistry::contains(std::string_view name) const -> bool {
  std::shared_lock lock(mu_);
  return units_.contains(std::string(name));
}

auto TaskRegistry::names() const -> std::vector<std::string> {
  std::shared_lock lock(mu_);
  std::vector<std::string> out;
  out.reserve(units_.size());
  for (const auto &[name, _] : units_) {
    out.push_back(name);
  }
  std::ranges::sort(out);
  return out;
}

} // namespace flowforge
