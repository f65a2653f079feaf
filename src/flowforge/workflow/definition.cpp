#include "flowforge/workflow/definition.hpp"

#include <format>

namespace flowforge {

namespace {

auto set_diagnostic(std::string *diagnostic, std::string text) -> void {
  if (diagnostic != nullptr) {
    *diagnostic = std::move(text);
  }
}

} // namespace

auto validate_workflow(const WorkflowSpec &spec, std::string *diagnostic)
    -> Result<Graph> {
  if (!spec.name.valid()) {
    set_diagnostic(diagnostic, "workflow name is empty or malformed");
    return fail(Error::ValidationError);
  }
  if (spec.tasks.empty()) {
    set_diagnostic(diagnostic, "workflow has no tasks");
    return fail(Error::ValidationError);
  }

  Graph graph;
  for (const auto &task : spec.tasks) {
    if (task.executable.empty()) {
      set_diagnostic(diagnostic,
                     std::format("task '{}' has no executable", task.name));
      return fail(Error::ValidationError);
    }
    if (auto r = task.retry.validate(); !r) {
      set_diagnostic(diagnostic,
                     std::format("task '{}' has an invalid retry policy",
                                 task.name));
      return fail(Error::ValidationError);
    }
    if (auto r = graph.add_node(task.name); !r) {
      if (r.error() == Error::DuplicateTask) {
        set_diagnostic(diagnostic,
                       std::format("duplicate task name '{}'", task.name));
      } else {
        set_diagnostic(diagnostic,
                       std::format("invalid task name '{}'", task.name));
      }
      return fail(r.error() == Error::DuplicateTask ? Error::DuplicateTask
                                                    : Error::ValidationError);
    }
  }

  for (const auto &edge : spec.edges) {
    if (auto r = graph.add_edge(edge.from, edge.to, edge.label); !r) {
      if (r.error() == Error::DanglingEdge) {
        const auto &missing = graph.has_node(edge.from) ? edge.to : edge.from;
        set_diagnostic(diagnostic,
                       std::format("edge {} -> {} references unknown task '{}'",
                                   edge.from, edge.to, missing));
      } else {
        set_diagnostic(diagnostic,
                       std::format("self-edge on task '{}'", edge.from));
      }
      return fail(r.error());
    }
  }

  std::string cycle;
  if (auto order = graph.topological_order(&cycle); !order) {
    set_diagnostic(diagnostic, std::format("cycle detected: {}", cycle));
    return fail(order.error());
  }
  return ok(std::move(graph));
}

auto WorkflowDefinition::create(WorkflowSpec spec, std::string *diagnostic)
    -> Result<std::shared_ptr<const WorkflowDefinition>> {
  auto graph = validate_workflow(spec, diagnostic);
  if (!graph) {
    return fail(graph.error());
  }
  auto order = graph->topological_order();
  if (!order) {
    return fail(order.error());
  }
  return ok(std::make_shared<const WorkflowDefinition>(
      PrivateTag{}, std::move(spec), std::move(*graph), std::move(*order)));
}

WorkflowDefinition::WorkflowDefinition(PrivateTag, WorkflowSpec spec,
                                       Graph graph,
                                       std::vector<NodeIndex> order)
    : spec_(std::move(spec)), graph_(std::move(graph)),
      order_(std::move(order)) {}

} // namespace flowforge
