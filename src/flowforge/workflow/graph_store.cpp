#include "flowforge/workflow/graph_store.hpp"

#include "flowforge/util/log.hpp"

#include <algorithm>

namespace flowforge {

GraphStore::GraphStore() : state_(std::make_shared<const State>()) {}

auto GraphStore::register_definition(WorkflowSpec spec,
                                     std::string *diagnostic)
    -> Result<DefinitionId> {
  std::scoped_lock lock(write_mu_);
  auto current = snapshot();

  if (spec.version == 0) {
    auto it = current->latest_version.find(spec.name);
    spec.version = it == current->latest_version.end() ? 1 : it->second + 1;
  }

  DefinitionId id{spec.name, spec.version};
  if (auto it = current->definitions.find(id);
      it != current->definitions.end()) {
    if (it->second.definition->spec() == spec) {
      log::debug("Workflow {} already registered with identical structure",
                 id);
      return ok(std::move(id));
    }
    if (diagnostic != nullptr) {
      *diagnostic = std::format("workflow {} is already registered", id);
    }
    return fail(Error::AlreadyExists);
  }

  auto definition = WorkflowDefinition::create(std::move(spec), diagnostic);
  if (!definition) {
    log::warn("Rejected workflow {}: {}", id,
              diagnostic != nullptr ? *diagnostic
                                    : definition.error().message());
    return fail(definition.error());
  }

  auto next = std::make_shared<State>(*current);
  next->definitions.emplace(id, Entry{std::move(*definition), false});
  auto &latest = next->latest_version[id.name];
  latest = std::max(latest, id.version);
  state_.store(std::move(next), std::memory_order_release);

  log::info("Registered workflow {}", id);
  return ok(std::move(id));
}

auto GraphStore::get(const DefinitionId &id) const
    -> Result<std::shared_ptr<const WorkflowDefinition>> {
  auto current = snapshot();
  auto it = current->definitions.find(id);
  if (it == current->definitions.end()) {
    return fail(Error::NotFound);
  }
  return ok(it->second.definition);
}

auto GraphStore::latest(const WorkflowName &name) const
    -> Result<DefinitionId> {
  auto current = snapshot();
  auto it = current->latest_version.find(name);
  if (it == current->latest_version.end()) {
    return fail(Error::NotFound);
  }
  return ok(DefinitionId{name, it->second});
}

auto GraphStore::list() const -> std::vector<DefinitionId> {
  auto current = snapshot();
  std::vector<DefinitionId> out;
  out.reserve(current->definitions.size());
  for (const auto &[id, _] : current->definitions) {
    out.push_back(id);
  }
  std::ranges::sort(out);
  return out;
}

auto GraphStore::deprecate(const DefinitionId &id) -> Result<void> {
  std::scoped_lock lock(write_mu_);
  auto current = snapshot();
  auto it = current->definitions.find(id);
  if (it == current->definitions.end()) {
    return fail(Error::NotFound);
  }
  if (it->second.deprecated) {
    return ok();
  }
  auto next = std::make_shared<State>(*current);
  next->definitions[id].deprecated = true;
  state_.store(std::move(next), std::memory_order_release);
  log::info("Deprecated workflow {}", id);
  return ok();
}

auto GraphStore::is_deprecated(const DefinitionId &id) const -> Result<bool> {
  auto current = snapshot();
  auto it = current->definitions.find(id);
  if (it == current->definitions.end()) {
    return fail(Error::NotFound);
  }
  return ok(it->second.deprecated);
}

auto GraphStore::size() const -> std::size_t {
  return snapshot()->definitions.size();
}

} // namespace flowforge
