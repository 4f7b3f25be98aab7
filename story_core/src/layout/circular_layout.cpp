#include "Plotline/layout/layout_engine.hpp"

#include <cmath>
#include <numbers>

namespace Plotline::layout {

namespace {

void placeRing(const std::vector<const GraphNode*>& ring, const Position& center, f64 radius,
               PositionMap& positions) {
  if (ring.empty()) {
    return;
  }

  const f64 step = 2.0 * std::numbers::pi / static_cast<f64>(ring.size());
  for (usize i = 0; i < ring.size(); ++i) {
    // First node at 12 o'clock
    const f64 angle = static_cast<f64>(i) * step - std::numbers::pi / 2.0;
    positions[ring[i]->id] = {center.x + radius * std::cos(angle),
                              center.y + radius * std::sin(angle)};
  }
}

} // namespace

PositionMap circularLayout(const std::vector<GraphNode>& nodes, bool branchClustering,
                           const CircularParams& params) {
  PositionMap positions;
  if (nodes.empty()) {
    return positions;
  }

  if (!branchClustering) {
    std::vector<const GraphNode*> ring;
    ring.reserve(nodes.size());
    for (const auto& node : nodes) {
      ring.push_back(&node);
    }
    placeRing(ring, params.center, params.radius, positions);
    return positions;
  }

  const auto groups = groupByBranch(nodes);
  for (usize g = 0; g < groups.size(); ++g) {
    const f64 radius =
        params.clusterBaseRadius + params.clusterRingSpacing * static_cast<f64>(g);
    placeRing(groups[g], params.center, radius, positions);
  }
  return positions;
}

} // namespace Plotline::layout
