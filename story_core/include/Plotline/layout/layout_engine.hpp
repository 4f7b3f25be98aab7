#pragma once

/**
 * @file layout_engine.hpp
 * @brief Automatic layout strategies for the story graph
 *
 * Every strategy is a pure function of (nodes, edges, parameters): it reads
 * current positions only as seeds and returns a fresh id -> position map.
 * Nothing is written back to the graph; callers commit the result (see
 * GraphModel::applyPositions).
 */

#include "Plotline/core/types.hpp"
#include "Plotline/graph/graph_model.hpp"
#include "Plotline/graph/graph_types.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Plotline::layout {

using graph::GraphEdge;
using graph::GraphNode;
using graph::Position;
using graph::PositionMap;

enum class LayoutStrategy { Manual, Hierarchical, ForceDirected, Circular, Timeline };

[[nodiscard]] const char* toString(LayoutStrategy strategy);
[[nodiscard]] std::optional<LayoutStrategy> parseLayoutStrategy(std::string_view name);

struct HierarchicalParams {
  i32 nodesPerLevel = 3;
  f64 levelWidth = 200.0;
  f64 levelHeight = 100.0;
  /// Vertical offset per level, applied only when a group spans several levels
  f64 levelSkew = 50.0;
  /// Horizontal gap between branch groups, in multiples of levelWidth
  f64 groupGapLevels = 2.0;
};

/**
 * @brief How a node sitting at exactly (0, 0) is treated by the force layout
 */
enum class OriginSeeding {
  TreatOriginAsUnset, ///< reseed randomly inside the seed box
  HonorOrigin         ///< keep (0, 0) as a real starting position
};

struct ForceParams {
  i32 iterations = 100;
  f64 repulsion = 500.0;
  f64 springLength = 100.0;
  f64 springStiffness = 0.01;
  f64 damping = 0.9;
  f64 minDistance = 1.0;
  f64 seedWidth = 800.0;
  f64 seedHeight = 600.0;
  OriginSeeding originSeeding = OriginSeeding::TreatOriginAsUnset;
  /// Fixed RNG seed for reproducible results; random when unset
  std::optional<u32> seed;
};

struct CircularParams {
  Position center{400.0, 300.0};
  f64 radius = 200.0;
  f64 clusterBaseRadius = 150.0;
  f64 clusterRingSpacing = 100.0;
};

struct TimelineParams {
  f64 startX = 100.0;
  f64 stepX = 150.0;
  f64 baseY = 300.0;
  f64 alternateOffsetY = 100.0;
};

struct LayoutConfig {
  LayoutStrategy strategy = LayoutStrategy::Manual;
  /// Group nodes by branch (hierarchical and circular)
  bool branchClustering = true;
  /// Presentation hint for the rendering surface; not interpreted here
  bool animate = true;

  HierarchicalParams hierarchical;
  ForceParams force;
  CircularParams circular;
  TimelineParams timeline;
};

/**
 * @brief Group nodes by branchId, groups ordered by first appearance and
 * nodes keeping their relative order
 */
[[nodiscard]] std::vector<std::vector<const GraphNode*>>
groupByBranch(const std::vector<GraphNode>& nodes);

/**
 * @brief Run the strategy selected in @p config
 */
[[nodiscard]] PositionMap computeLayout(const std::vector<GraphNode>& nodes,
                                        const std::vector<GraphEdge>& edges,
                                        const LayoutConfig& config);

/**
 * @brief Current positions, unchanged
 */
[[nodiscard]] PositionMap manualLayout(const std::vector<GraphNode>& nodes);

/**
 * @brief Column-per-level layout
 *
 * Within a group, node i goes to level i / nodesPerLevel at
 * x = offset + level * levelWidth and
 * y = indexInLevel * levelHeight (+ level * levelSkew for multi-level groups).
 * The next group starts at the previous group's max x + groupGapLevels * levelWidth.
 */
[[nodiscard]] PositionMap hierarchicalLayout(const std::vector<GraphNode>& nodes,
                                             bool branchClustering,
                                             const HierarchicalParams& params = {});

/**
 * @brief Spring embedder with all-pairs repulsion
 *
 * Runs exactly params.iterations steps with no convergence test, so cost is
 * O(n^2 * iterations); intended for graphs of a few hundred nodes at most.
 * Edges whose endpoints are not in @p nodes are ignored.
 */
[[nodiscard]] PositionMap forceDirectedLayout(const std::vector<GraphNode>& nodes,
                                              const std::vector<GraphEdge>& edges,
                                              const ForceParams& params = {});

/**
 * @brief Nodes on one ring, or one concentric ring per branch group
 */
[[nodiscard]] PositionMap circularLayout(const std::vector<GraphNode>& nodes,
                                         bool branchClustering,
                                         const CircularParams& params = {});

/**
 * @brief Left-to-right by current x with alternating rows
 */
[[nodiscard]] PositionMap timelineLayout(const std::vector<GraphNode>& nodes,
                                         const TimelineParams& params = {});

} // namespace Plotline::layout
