#include "Plotline/graph/directional_selection.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace Plotline::graph {

const char* toString(Direction direction) {
  switch (direction) {
  case Direction::Up:
    return "up";
  case Direction::Down:
    return "down";
  case Direction::Left:
    return "left";
  case Direction::Right:
    return "right";
  }
  return "up";
}

namespace {

// Returns the score of a candidate, or nullopt if the offset does not qualify
std::optional<f64> scoreCandidate(f64 dx, f64 dy, Direction direction,
                                  const DirectionalSelectionParams& params) {
  f64 primary = 0.0;
  f64 secondary = 0.0;

  switch (direction) {
  case Direction::Up:
    primary = -dy;
    secondary = dx;
    break;
  case Direction::Down:
    primary = dy;
    secondary = dx;
    break;
  case Direction::Left:
    primary = -dx;
    secondary = dy;
    break;
  case Direction::Right:
    primary = dx;
    secondary = dy;
    break;
  }

  if (primary <= params.threshold || std::abs(secondary) >= primary) {
    return std::nullopt;
  }
  return primary + std::abs(secondary) * params.secondaryWeight;
}

} // namespace

std::optional<std::string> findDirectionalNeighbor(const std::vector<GraphNode>& nodes,
                                                   const std::string& currentId,
                                                   Direction direction,
                                                   const DirectionalSelectionParams& params) {
  auto current = std::find_if(nodes.begin(), nodes.end(),
                              [&currentId](const GraphNode& n) { return n.id == currentId; });
  if (current == nodes.end()) {
    return std::nullopt;
  }

  const GraphNode* best = nullptr;
  f64 bestScore = std::numeric_limits<f64>::infinity();

  for (const auto& node : nodes) {
    if (node.id == currentId) {
      continue;
    }

    const f64 dx = node.position.x - current->position.x;
    const f64 dy = node.position.y - current->position.y;
    auto score = scoreCandidate(dx, dy, direction, params);
    if (score && *score < bestScore) {
      bestScore = *score;
      best = &node;
    }
  }

  if (!best) {
    return std::nullopt;
  }
  return best->id;
}

bool navigateSelection(const std::vector<GraphNode>& nodes, Direction direction,
                       const SelectionGetter& getSelection,
                       const SelectionSetter& setSelection,
                       const DirectionalSelectionParams& params) {
  if (nodes.empty()) {
    return false;
  }

  auto selected = getSelection ? getSelection() : std::nullopt;
  if (!selected) {
    setSelection(nodes.front().id);
    return true;
  }

  auto next = findDirectionalNeighbor(nodes, *selected, direction, params);
  if (!next) {
    return false;
  }

  setSelection(*next);
  return true;
}

} // namespace Plotline::graph
