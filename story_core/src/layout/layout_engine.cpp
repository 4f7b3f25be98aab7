#include "Plotline/layout/layout_engine.hpp"
#include "Plotline/core/logger.hpp"

#include <unordered_map>

namespace Plotline::layout {

const char* toString(LayoutStrategy strategy) {
  switch (strategy) {
  case LayoutStrategy::Manual:
    return "manual";
  case LayoutStrategy::Hierarchical:
    return "hierarchical";
  case LayoutStrategy::ForceDirected:
    return "force";
  case LayoutStrategy::Circular:
    return "circular";
  case LayoutStrategy::Timeline:
    return "timeline";
  }
  return "manual";
}

std::optional<LayoutStrategy> parseLayoutStrategy(std::string_view name) {
  if (name == "manual")
    return LayoutStrategy::Manual;
  if (name == "hierarchical")
    return LayoutStrategy::Hierarchical;
  if (name == "force" || name == "force_directed")
    return LayoutStrategy::ForceDirected;
  if (name == "circular")
    return LayoutStrategy::Circular;
  if (name == "timeline")
    return LayoutStrategy::Timeline;
  return std::nullopt;
}

std::vector<std::vector<const GraphNode*>> groupByBranch(const std::vector<GraphNode>& nodes) {
  std::vector<std::vector<const GraphNode*>> groups;
  std::unordered_map<std::string, usize> groupIndex;

  for (const auto& node : nodes) {
    auto [it, inserted] = groupIndex.try_emplace(node.branchId, groups.size());
    if (inserted) {
      groups.emplace_back();
    }
    groups[it->second].push_back(&node);
  }
  return groups;
}

PositionMap manualLayout(const std::vector<GraphNode>& nodes) {
  PositionMap positions;
  positions.reserve(nodes.size());
  for (const auto& node : nodes) {
    positions[node.id] = node.position;
  }
  return positions;
}

PositionMap computeLayout(const std::vector<GraphNode>& nodes,
                          const std::vector<GraphEdge>& edges, const LayoutConfig& config) {
  PLOTLINE_LOG_DEBUG("Layout: running '{}' over {} node(s)", toString(config.strategy),
                     nodes.size());

  switch (config.strategy) {
  case LayoutStrategy::Manual:
    return manualLayout(nodes);
  case LayoutStrategy::Hierarchical:
    return hierarchicalLayout(nodes, config.branchClustering, config.hierarchical);
  case LayoutStrategy::ForceDirected:
    return forceDirectedLayout(nodes, edges, config.force);
  case LayoutStrategy::Circular:
    return circularLayout(nodes, config.branchClustering, config.circular);
  case LayoutStrategy::Timeline:
    return timelineLayout(nodes, config.timeline);
  }
  return manualLayout(nodes);
}

} // namespace Plotline::layout
