#include "Plotline/layout/layout_engine.hpp"

#include <algorithm>

namespace Plotline::layout {

PositionMap hierarchicalLayout(const std::vector<GraphNode>& nodes, bool branchClustering,
                               const HierarchicalParams& params) {
  PositionMap positions;
  if (nodes.empty()) {
    return positions;
  }

  std::vector<std::vector<const GraphNode*>> groups;
  if (branchClustering) {
    groups = groupByBranch(nodes);
  } else {
    std::vector<const GraphNode*> all;
    all.reserve(nodes.size());
    for (const auto& node : nodes) {
      all.push_back(&node);
    }
    groups.push_back(std::move(all));
  }

  const i32 perLevel = std::max(params.nodesPerLevel, 1);
  f64 branchOffsetX = 0.0;

  for (const auto& group : groups) {
    const i32 maxLevel = static_cast<i32>(group.size() - 1) / perLevel;
    f64 groupMaxX = branchOffsetX;

    for (usize i = 0; i < group.size(); ++i) {
      const i32 level = static_cast<i32>(i) / perLevel;
      const i32 indexInLevel = static_cast<i32>(i) % perLevel;

      Position pos;
      pos.x = branchOffsetX + level * params.levelWidth;
      pos.y = indexInLevel * params.levelHeight + (maxLevel > 0 ? level * params.levelSkew : 0.0);
      positions[group[i]->id] = pos;
      groupMaxX = std::max(groupMaxX, pos.x);
    }

    branchOffsetX = groupMaxX + params.groupGapLevels * params.levelWidth;
  }

  return positions;
}

} // namespace Plotline::layout
