#include "Plotline/layout/layout_engine.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <unordered_map>

namespace Plotline::layout {

namespace {

struct NodePhysics {
  Position position;
  f64 velocityX = 0.0;
  f64 velocityY = 0.0;
  f64 forceX = 0.0;
  f64 forceY = 0.0;
};

bool isUnsetPosition(const Position& p, OriginSeeding policy) {
  return policy == OriginSeeding::TreatOriginAsUnset && p.x == 0.0 && p.y == 0.0;
}

} // namespace

PositionMap forceDirectedLayout(const std::vector<GraphNode>& nodes,
                                const std::vector<GraphEdge>& edges, const ForceParams& params) {
  PositionMap positions;
  if (nodes.empty()) {
    return positions;
  }

  std::mt19937 rng(params.seed ? *params.seed : std::random_device{}());
  std::uniform_real_distribution<f64> seedX(0.0, params.seedWidth);
  std::uniform_real_distribution<f64> seedY(0.0, params.seedHeight);

  std::vector<NodePhysics> physics(nodes.size());
  std::unordered_map<std::string, usize> indexOf;
  indexOf.reserve(nodes.size());

  for (usize i = 0; i < nodes.size(); ++i) {
    indexOf[nodes[i].id] = i;
    if (isUnsetPosition(nodes[i].position, params.originSeeding)) {
      physics[i].position.x = seedX(rng);
      physics[i].position.y = seedY(rng);
    } else {
      physics[i].position = nodes[i].position;
    }
  }

  // Resolve edges once; dangling references are dropped
  std::vector<std::pair<usize, usize>> springs;
  springs.reserve(edges.size());
  for (const auto& edge : edges) {
    auto s = indexOf.find(edge.source);
    auto t = indexOf.find(edge.target);
    if (s != indexOf.end() && t != indexOf.end() && s->second != t->second) {
      springs.emplace_back(s->second, t->second);
    }
  }

  const usize n = physics.size();
  for (i32 iteration = 0; iteration < params.iterations; ++iteration) {
    for (auto& p : physics) {
      p.forceX = 0.0;
      p.forceY = 0.0;
    }

    // Repulsion between every ordered pair
    for (usize a = 0; a < n; ++a) {
      for (usize b = 0; b < n; ++b) {
        if (a == b) {
          continue;
        }
        const f64 dx = physics[a].position.x - physics[b].position.x;
        const f64 dy = physics[a].position.y - physics[b].position.y;
        const f64 distance = std::max(std::sqrt(dx * dx + dy * dy), params.minDistance);
        const f64 force = params.repulsion / (distance * distance);
        physics[a].forceX += (dx / distance) * force;
        physics[a].forceY += (dy / distance) * force;
      }
    }

    // Spring attraction toward the natural length
    for (const auto& [s, t] : springs) {
      const f64 dx = physics[t].position.x - physics[s].position.x;
      const f64 dy = physics[t].position.y - physics[s].position.y;
      const f64 distance = std::max(std::sqrt(dx * dx + dy * dy), params.minDistance);
      const f64 force = (distance - params.springLength) * params.springStiffness;
      const f64 fx = (dx / distance) * force;
      const f64 fy = (dy / distance) * force;
      physics[s].forceX += fx;
      physics[s].forceY += fy;
      physics[t].forceX -= fx;
      physics[t].forceY -= fy;
    }

    for (auto& p : physics) {
      p.velocityX = (p.velocityX + p.forceX) * params.damping;
      p.velocityY = (p.velocityY + p.forceY) * params.damping;
      p.position.x += p.velocityX;
      p.position.y += p.velocityY;
    }
  }

  positions.reserve(n);
  for (usize i = 0; i < n; ++i) {
    positions[nodes[i].id] = physics[i].position;
  }
  return positions;
}

} // namespace Plotline::layout
