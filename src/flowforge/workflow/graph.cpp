#include "flowforge/workflow/graph.hpp"

#include <algorithm>
#include <format>
#include <iterator>
#include <ranges>

namespace flowforge {

auto Graph::add_node(const TaskName &name) -> Result<NodeIndex> {
  if (!name.valid()) {
    return fail(Error::InvalidArgument);
  }
  if (key_to_idx_.contains(name)) {
    return fail(Error::DuplicateTask);
  }
  if (nodes_.size() >= 1'000'000) {
    return fail(Error::ResourceExhausted);
  }

  auto idx = static_cast<NodeIndex>(nodes_.size());
  nodes_.emplace_back();
  keys_.emplace_back(name);
  key_to_idx_.emplace(name, idx);
  return ok(idx);
}

auto Graph::add_edge(const TaskName &from, const TaskName &to,
                     std::string label) -> Result<void> {
  NodeIndex from_idx = index_of(from);
  NodeIndex to_idx = index_of(to);
  if (from_idx == kInvalidNode || to_idx == kInvalidNode) [[unlikely]] {
    return fail(Error::DanglingEdge);
  }
  if (from_idx == to_idx) [[unlikely]] {
    return fail(Error::CycleDetected);
  }
  if (auto pos = find_edge(from_idx, to_idx)) {
    auto &labels = nodes_[from_idx].labels[*pos];
    if (std::ranges::find(labels, label) == labels.end()) {
      labels.emplace_back(std::move(label));
    }
    return ok();
  }

  nodes_[to_idx].deps.emplace_back(from_idx);
  nodes_[from_idx].dependents.emplace_back(to_idx);
  nodes_[from_idx].labels.emplace_back().emplace_back(std::move(label));
  return ok();
}

auto Graph::find_edge(NodeIndex from, NodeIndex to) const noexcept
    -> std::optional<std::size_t> {
  if (from >= nodes_.size() || to >= nodes_.size()) [[unlikely]] {
    return std::nullopt;
  }
  const auto &dependents = nodes_[from].dependents;
  auto it = std::ranges::find(dependents, to);
  if (it == dependents.end()) {
    return std::nullopt;
  }
  return static_cast<std::size_t>(std::distance(dependents.begin(), it));
}

auto Graph::has_node(const TaskName &name) const -> bool {
  return key_to_idx_.contains(name);
}

auto Graph::topological_order(std::string *diagnostic) const
    -> Result<std::vector<NodeIndex>> {
  std::vector<int> in_degree;
  in_degree.reserve(nodes_.size());
  for (const auto &node : nodes_) {
    in_degree.emplace_back(static_cast<int>(node.deps.size()));
  }

  std::vector<NodeIndex> order;
  order.reserve(nodes_.size());
  for (NodeIndex i = 0; i < nodes_.size(); ++i) {
    if (in_degree[i] == 0) {
      order.emplace_back(i);
    }
  }

  // `order` doubles as the FIFO queue.
  std::size_t head = 0;
  while (head < order.size()) {
    NodeIndex current = order[head++];
    for (NodeIndex dep : nodes_[current].dependents) {
      if (--in_degree[dep] == 0) {
        order.emplace_back(dep);
      }
    }
  }

  if (order.size() != nodes_.size()) {
    if (diagnostic != nullptr) {
      *diagnostic = describe_cycle(in_degree);
    }
    return fail(Error::CycleDetected);
  }
  return ok(std::move(order));
}

// Every node left with a positive in-degree after Kahn's pass lies on or
// downstream of a cycle. Walking backwards along unresolved deps must revisit a
// node, and the revisited segment is a cycle.
auto Graph::describe_cycle(const std::vector<int> &in_degree) const
    -> std::string {
  auto start = std::ranges::find_if(in_degree, [](int d) { return d > 0; });
  if (start == in_degree.end()) {
    return {};
  }

  std::vector<NodeIndex> path;
  std::vector<std::size_t> position(nodes_.size(), SIZE_MAX);
  auto current =
      static_cast<NodeIndex>(std::distance(in_degree.begin(), start));
  while (position[current] == SIZE_MAX) {
    position[current] = path.size();
    path.push_back(current);
    for (NodeIndex dep : nodes_[current].deps) {
      if (in_degree[dep] > 0) {
        current = dep;
        break;
      }
    }
  }

  // path[position[current]..] walks the cycle against edge direction.
  std::vector<NodeIndex> cycle(path.begin() + static_cast<std::ptrdiff_t>(
                                                  position[current]),
                               path.end());
  std::ranges::reverse(cycle);
  std::string out;
  for (NodeIndex idx : cycle) {
    out += std::format("{} -> ", keys_[idx]);
  }
  out += keys_[cycle.front()].str();
  return out;
}

auto Graph::deps(NodeIndex idx) const noexcept -> std::span<const NodeIndex> {
  if (idx >= nodes_.size()) {
    return {};
  }
  return nodes_[idx].deps;
}

auto Graph::dependents(NodeIndex idx) const noexcept
    -> std::span<const NodeIndex> {
  if (idx >= nodes_.size()) {
    return {};
  }
  return nodes_[idx].dependents;
}

auto Graph::edge_labels(NodeIndex from, NodeIndex to) const
    -> std::span<const std::string> {
  auto pos = find_edge(from, to);
  if (!pos) {
    return {};
  }
  return nodes_[from].labels[*pos];
}

auto Graph::edge_taken(NodeIndex from, NodeIndex to,
                       std::string_view result) const -> bool {
  return std::ranges::any_of(edge_labels(from, to), [&](const auto &label) {
    return label.empty() || label == result;
  });
}

auto Graph::index_of(const TaskName &name) const -> NodeIndex {
  auto it = key_to_idx_.find(name);
  return it != key_to_idx_.end() ? it->second : kInvalidNode;
}

auto Graph::name_of(NodeIndex idx) const -> const TaskName & {
  static const TaskName kEmpty;
  if (idx >= keys_.size()) {
    return kEmpty;
  }
  return keys_[idx];
}

auto Graph::roots() const -> std::vector<NodeIndex> {
  std::vector<NodeIndex> out;
  for (NodeIndex i = 0; i < nodes_.size(); ++i) {
    if (nodes_[i].deps.empty()) {
      out.emplace_back(i);
    }
  }
  return out;
}

} // namespace flowforge
