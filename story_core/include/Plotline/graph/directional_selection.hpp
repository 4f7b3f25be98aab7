#pragma once

/**
 * @file directional_selection.hpp
 * @brief Keyboard-style nearest-neighbor selection over a node set
 *
 * A single implementation used by every owner of a selection. The node list
 * and the selection accessors are injected so the same rule applies whether
 * the selection lives in a GraphModel or in a view-local container.
 */

#include "Plotline/core/types.hpp"
#include "Plotline/graph/graph_types.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace Plotline::graph {

enum class Direction { Up, Down, Left, Right };

[[nodiscard]] const char* toString(Direction direction);

/**
 * @brief Tuning of the directional candidate filter and score
 */
struct DirectionalSelectionParams {
  /// Minimum offset along the primary axis for a node to be a candidate
  f64 threshold = 50.0;
  /// Weight of the secondary-axis offset in the score
  f64 secondaryWeight = 0.5;
};

using SelectionGetter = std::function<std::optional<std::string>()>;
using SelectionSetter = std::function<void(const std::string&)>;

/**
 * @brief Find the best neighbor of @p currentId in @p direction
 *
 * A node qualifies when its offset along the primary axis exceeds the
 * threshold in the requested direction and its secondary-axis offset is
 * strictly smaller in magnitude than the primary one. The lowest
 * `primary + secondaryWeight * |secondary|` wins; ties keep the earlier node.
 *
 * @return Neighbor id, or std::nullopt if none qualifies or @p currentId is unknown
 */
[[nodiscard]] std::optional<std::string>
findDirectionalNeighbor(const std::vector<GraphNode>& nodes, const std::string& currentId,
                        Direction direction, const DirectionalSelectionParams& params = {});

/**
 * @brief Move the selection one step in @p direction
 *
 * With no current selection the first node is selected. With an empty node
 * list, or no qualifying neighbor, the setter is not called.
 *
 * @return true if the setter was invoked
 */
bool navigateSelection(const std::vector<GraphNode>& nodes, Direction direction,
                       const SelectionGetter& getSelection,
                       const SelectionSetter& setSelection,
                       const DirectionalSelectionParams& params = {});

} // namespace Plotline::graph
