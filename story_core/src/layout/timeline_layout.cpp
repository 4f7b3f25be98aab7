#include "Plotline/layout/layout_engine.hpp"

#include <algorithm>

namespace Plotline::layout {

PositionMap timelineLayout(const std::vector<GraphNode>& nodes, const TimelineParams& params) {
  std::vector<const GraphNode*> ordered;
  ordered.reserve(nodes.size());
  for (const auto& node : nodes) {
    ordered.push_back(&node);
  }

  // Nodes sharing an x keep their model order
  std::stable_sort(ordered.begin(), ordered.end(), [](const GraphNode* a, const GraphNode* b) {
    return a->position.x < b->position.x;
  });

  PositionMap positions;
  positions.reserve(ordered.size());
  for (usize i = 0; i < ordered.size(); ++i) {
    const f64 x = params.startX + static_cast<f64>(i) * params.stepX;
    const f64 y = params.baseY + (i % 2 == 1 ? params.alternateOffsetY : 0.0);
    positions[ordered[i]->id] = {x, y};
  }
  return positions;
}

} // namespace Plotline::layout
