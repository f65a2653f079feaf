#pragma once

#include "flowforge/core/error.hpp"
#include "flowforge/util/id.hpp"
#include "flowforge/workflow/graph.hpp"
#include "flowforge/workflow/task_spec.hpp"

#include <cstdint>
#include <format>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace flowforge {

struct DefinitionId {
  WorkflowName name;
  std::uint32_t version{0};

  auto operator==(const DefinitionId &) const -> bool = default;
  auto operator<=>(const DefinitionId &) const = default;
};

// `to` runs only after `from` succeeded.
struct Edge {
  TaskName from;
  TaskName to;
  std::string label;

  auto operator==(const Edge &) const -> bool = default;
};

// Unvalidated input to the graph store.
struct WorkflowSpec {
  struct Builder;
  static auto builder(std::string name) -> Builder;

  WorkflowName name;
  // 0 asks the graph store for the next free version.
  std::uint32_t version{0};
  std::string description;
  FailurePolicy failure_policy{FailurePolicy::FailSlow};
  std::vector<TaskSpec> tasks;
  std::vector<Edge> edges;

  auto operator==(const WorkflowSpec &) const -> bool = default;
};

struct WorkflowSpec::Builder {
  WorkflowSpec spec_;

  auto version(std::uint32_t v) -> Builder && {
    spec_.version = v;
    return std::move(*this);
  }

  auto description(std::string d) -> Builder && {
    spec_.description = std::move(d);
    return std::move(*this);
  }

  auto failure_policy(FailurePolicy p) -> Builder && {
    spec_.failure_policy = p;
    return std::move(*this);
  }

  auto task(TaskSpec t) -> Builder && {
    spec_.tasks.push_back(std::move(t));
    return std::move(*this);
  }

  auto edge(std::string from, std::string to, std::string label = {})
      -> Builder && {
    spec_.edges.push_back(
        {TaskName{std::move(from)}, TaskName{std::move(to)}, std::move(label)});
    return std::move(*this);
  }

  [[nodiscard]] auto build() && -> WorkflowSpec { return std::move(spec_); }
};

inline auto WorkflowSpec::builder(std::string name) -> Builder {
  Builder b;
  b.spec_.name = WorkflowName{std::move(name)};
  return b;
}

// A WorkflowSpec that passed validation. Only `create` can construct one, so
// holding a WorkflowDefinition proves the graph is acyclic and fully
// connected by name.
class WorkflowDefinition {
  struct PrivateTag {};

public:
  [[nodiscard]] static auto create(WorkflowSpec spec,
                                   std::string *diagnostic = nullptr)
      -> Result<std::shared_ptr<const WorkflowDefinition>>;

  WorkflowDefinition(PrivateTag, WorkflowSpec spec, Graph graph,
                     std::vector<NodeIndex> order);

  [[nodiscard]] auto id() const -> DefinitionId {
    return {spec_.name, spec_.version};
  }
  [[nodiscard]] auto spec() const noexcept -> const WorkflowSpec & {
    return spec_;
  }
  [[nodiscard]] auto graph() const noexcept -> const Graph & { return graph_; }
  [[nodiscard]] auto failure_policy() const noexcept -> FailurePolicy {
    return spec_.failure_policy;
  }
  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return spec_.tasks.size();
  }
  /// Task specs are indexed by the graph's NodeIndex.
  [[nodiscard]] auto task(NodeIndex idx) const -> const TaskSpec & {
    return spec_.tasks.at(idx);
  }
  [[nodiscard]] auto topological_order() const noexcept
      -> const std::vector<NodeIndex> & {
    return order_;
  }

private:
  WorkflowSpec spec_;
  Graph graph_;
  std::vector<NodeIndex> order_;
};

/// Validates and builds the adjacency structure without registering anything.
[[nodiscard]] auto validate_workflow(const WorkflowSpec &spec,
                                     std::string *diagnostic = nullptr)
    -> Result<Graph>;

} // namespace flowforge

template <> struct std::hash<flowforge::DefinitionId> {
  using is_avalanching = void;
  auto operator()(const flowforge::DefinitionId &id) const noexcept
      -> std::size_t {
    auto h = std::hash<std::string_view>{}(id.name.value());
    return h ^ (std::hash<std::uint32_t>{}(id.version) + 0x9e3779b97f4a7c15ULL +
                (h << 6) + (h >> 2));
  }
};

template <>
struct std::formatter<flowforge::DefinitionId> : std::formatter<std::string> {
  auto format(const flowforge::DefinitionId &id, auto &ctx) const {
    return std::formatter<std::string>::format(
        std::format("{}@v{}", id.name, id.version), ctx);
  }
};
