#pragma once

#include "flowforge/core/error.hpp"
#include "flowforge/workflow/definition.hpp"

#include <ankerl/unordered_dense.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace flowforge {

// Registry of immutable workflow definitions keyed by (name, version).
// Readers load a copy-on-write snapshot and never block; registrations are
// serialized by a writer mutex and publish a new snapshot.
class GraphStore {
public:
  GraphStore();
  ~GraphStore() = default;

  GraphStore(const GraphStore &) = delete;
  auto operator=(const GraphStore &) -> GraphStore & = delete;

  /// Validates and registers. On rejection `diagnostic` names the offending
  /// cycle, edge or task.
  [[nodiscard]] auto register_definition(WorkflowSpec spec,
                                         std::string *diagnostic = nullptr)
      -> Result<DefinitionId>;

  [[nodiscard]] auto get(const DefinitionId &id) const
      -> Result<std::shared_ptr<const WorkflowDefinition>>;
  [[nodiscard]] auto latest(const WorkflowName &name) const
      -> Result<DefinitionId>;
  [[nodiscard]] auto list() const -> std::vector<DefinitionId>;

  /// Soft-deprecation: the definition stays readable for existing runs but
  /// new runs are refused.
  [[nodiscard]] auto deprecate(const DefinitionId &id) -> Result<void>;
  [[nodiscard]] auto is_deprecated(const DefinitionId &id) const
      -> Result<bool>;

  [[nodiscard]] auto size() const -> std::size_t;

private:
  struct Entry {
    std::shared_ptr<const WorkflowDefinition> definition;
    bool deprecated{false};
  };

  struct State {
    ankerl::unordered_dense::map<DefinitionId, Entry> definitions;
    ankerl::unordered_dense::map<WorkflowName, std::uint32_t> latest_version;
  };

  [[nodiscard]] auto snapshot() const -> std::shared_ptr<const State> {
    return state_.load(std::memory_order_acquire);
  }

  std::mutex write_mu_;
  std::atomic<std::shared_ptr<const State>> state_;
};

} // namespace flowforge
