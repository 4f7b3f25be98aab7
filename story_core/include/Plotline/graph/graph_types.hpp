#pragma once

/**
 * @file graph_types.hpp
 * @brief Node, edge and enumeration types of the story graph
 */

#include "Plotline/core/types.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace Plotline::graph {

/**
 * @brief Graph-space coordinate (independent of zoom and pan)
 */
struct Position {
  f64 x = 0.0;
  f64 y = 0.0;

  bool operator==(const Position& other) const = default;
};

enum class NodeType { Chapter, Scene, Beat, Dialogue, Manga };

enum class EdgeType { Causal, Temporal, Parallel };

enum class LineStyle { Solid, Dashed, Dotted };

/**
 * @brief A single story node
 *
 * Nodes never own edges; edges refer to nodes by id.
 */
struct GraphNode {
  std::string id;
  std::string label = "New Node";
  Position position;
  std::string branchId = "main";
  f64 importance = 0.5; ///< 0..1
  NodeType type = NodeType::Scene;
};

/**
 * @brief Visual and semantic attributes of an edge, shared by creation and update
 */
struct EdgeAttributes {
  EdgeType type = EdgeType::Causal;
  LineStyle style = LineStyle::Solid;
  std::optional<std::string> color;
  std::optional<f64> weight;
  std::optional<std::string> label;
};

/**
 * @brief Directed relationship between two distinct nodes
 */
struct GraphEdge {
  std::string id;
  std::string source;
  std::string target;
  EdgeType type = EdgeType::Causal;
  LineStyle style = LineStyle::Solid;
  std::optional<std::string> color;
  std::optional<f64> weight;
  std::optional<std::string> label;
};

[[nodiscard]] const char* toString(NodeType type);
[[nodiscard]] const char* toString(EdgeType type);
[[nodiscard]] const char* toString(LineStyle style);

[[nodiscard]] std::optional<NodeType> parseNodeType(std::string_view name);
[[nodiscard]] std::optional<EdgeType> parseEdgeType(std::string_view name);
[[nodiscard]] std::optional<LineStyle> parseLineStyle(std::string_view name);

} // namespace Plotline::graph
