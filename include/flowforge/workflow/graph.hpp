#pragma once

#include "flowforge/core/error.hpp"
#include "flowforge/util/id.hpp"

#include <ankerl/unordered_dense.h>

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace flowforge {

using NodeIndex = std::uint32_t;
constexpr NodeIndex kInvalidNode = UINT32_MAX;

// Adjacency-list DAG over task names. Nodes are dense indices in insertion
// order, which keeps per-run state in flat vectors and bitsets.
class Graph {
public:
  [[nodiscard]] auto add_node(const TaskName &name) -> Result<NodeIndex>;
  /// Edges are keyed by (from, to, label). A second label for the same pair
  /// widens the condition under which a branch takes it; the dependency is
  /// still counted once.
  [[nodiscard]] auto add_edge(const TaskName &from, const TaskName &to,
                              std::string label = {}) -> Result<void>;

  [[nodiscard]] auto has_node(const TaskName &name) const -> bool;

  /// Kahn's algorithm. On a cycle returns CycleDetected and, if requested,
  /// writes the cycle as "a -> b -> a" to `diagnostic`.
  [[nodiscard]] auto topological_order(std::string *diagnostic = nullptr) const
      -> Result<std::vector<NodeIndex>>;

  [[nodiscard]] auto deps(NodeIndex idx) const noexcept
      -> std::span<const NodeIndex>;
  [[nodiscard]] auto dependents(NodeIndex idx) const noexcept
      -> std::span<const NodeIndex>;
  /// Labels on `from -> to`; an empty string marks an unlabelled edge. Empty
  /// span for a missing edge.
  [[nodiscard]] auto edge_labels(NodeIndex from, NodeIndex to) const
      -> std::span<const std::string>;
  /// Whether a branch at `from` that produced `result` proceeds to `to`.
  [[nodiscard]] auto edge_taken(NodeIndex from, NodeIndex to,
                                std::string_view result) const -> bool;

  [[nodiscard]] auto index_of(const TaskName &name) const -> NodeIndex;
  [[nodiscard]] auto name_of(NodeIndex idx) const -> const TaskName &;

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return nodes_.size();
  }
  [[nodiscard]] auto empty() const noexcept -> bool { return nodes_.empty(); }
  [[nodiscard]] auto roots() const -> std::vector<NodeIndex>;

private:
  [[nodiscard]] auto find_edge(NodeIndex from, NodeIndex to) const noexcept
      -> std::optional<std::size_t>;
  [[nodiscard]] auto describe_cycle(const std::vector<int> &in_degree) const
      -> std::string;

  struct Node {
    std::vector<NodeIndex> deps;
    std::vector<NodeIndex> dependents;
    // Parallel to `dependents`.
    std::vector<std::vector<std::string>> labels;
  };

  std::vector<Node> nodes_;
  std::vector<TaskName> keys_;
  ankerl::unordered_dense::map<TaskName, NodeIndex> key_to_idx_;
};

} // namespace flowforge
