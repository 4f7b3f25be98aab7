#pragma once

/**
 * @file graph_model.hpp
 * @brief Story graph topology: nodes, edges and the current selection
 *
 * GraphModel is a plain container owned by its composition root; nothing in
 * it is global. Mutations are reported through a single change callback so
 * an editor layer can bridge them onto an event bus.
 *
 * Topology rules:
 * - node ids are unique and non-empty
 * - an edge never connects a node to itself
 * - at most one edge per ordered (source, target) pair; the reverse pair is
 *   a different edge and is allowed
 * - removing a node removes every edge that references it
 */

#include "Plotline/core/types.hpp"
#include "Plotline/graph/directional_selection.hpp"
#include "Plotline/graph/graph_types.hpp"
#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace Plotline::graph {

using PositionMap = std::unordered_map<std::string, Position>;

enum class GraphChangeKind {
  NodeAdded,
  NodeRemoved,
  NodeUpdated,
  NodeMoved,
  EdgeAdded,
  EdgeRemoved,
  EdgeUpdated,
  SelectionChanged,
  PositionsApplied,
  HistoryRestored
};

/**
 * @brief Describes one model mutation
 *
 * nodeId / edgeId are empty when not applicable. For SelectionChanged,
 * nodeId holds the new selection (empty when cleared) and previousNodeId the
 * old one.
 */
struct GraphChange {
  GraphChangeKind kind = GraphChangeKind::NodeAdded;
  std::string nodeId;
  std::string edgeId;
  std::string previousNodeId;
};

using GraphChangeCallback = std::function<void(const GraphChange&)>;

class GraphModel {
public:
  static constexpr usize MAX_HISTORY_SIZE = 200;

  GraphModel() = default;

  // =========================================================================
  // Nodes
  // =========================================================================

  /**
   * @brief Append a node
   * @return false if the id is empty or already used (model unchanged)
   */
  bool addNode(const GraphNode& node);

  /**
   * @brief Remove a node, every edge touching it and, if it was selected,
   * the selection
   */
  bool removeNode(const std::string& nodeId);

  /**
   * @brief Replace label, branch, importance and type of an existing node
   *
   * The position is left untouched; use updateNodePosition for that.
   */
  bool updateNode(const GraphNode& node);

  /**
   * @brief Move a node; no bounds checking is applied
   */
  bool updateNodePosition(const std::string& nodeId, f64 x, f64 y);

  /**
   * @brief Commit a batch of positions (e.g. a layout result) as one edit
   *
   * Ids that are not in the model are ignored.
   * @return Number of nodes moved
   */
  usize applyPositions(const PositionMap& positions);

  [[nodiscard]] const GraphNode* findNode(const std::string& nodeId) const;
  [[nodiscard]] bool hasNode(const std::string& nodeId) const;
  [[nodiscard]] const std::vector<GraphNode>& nodes() const { return m_nodes; }
  [[nodiscard]] usize nodeCount() const { return m_nodes.size(); }

  // =========================================================================
  // Edges
  // =========================================================================

  /**
   * @brief Create the edge source -> target
   * @return Id of the new edge, or std::nullopt for a self-loop, an unknown
   * endpoint or an existing source -> target edge
   */
  std::optional<std::string> addEdge(const std::string& source, const std::string& target,
                                     const EdgeAttributes& attributes = {});

  bool removeEdge(const std::string& edgeId);
  bool updateEdge(const std::string& edgeId, const EdgeAttributes& attributes);

  /**
   * @brief True if an edge exists in exactly this direction
   */
  [[nodiscard]] bool hasEdge(const std::string& source, const std::string& target) const;

  [[nodiscard]] const GraphEdge* findEdge(const std::string& edgeId) const;
  [[nodiscard]] std::vector<GraphEdge> edgesForNode(const std::string& nodeId) const;
  [[nodiscard]] const std::vector<GraphEdge>& edges() const { return m_edges; }
  [[nodiscard]] usize edgeCount() const { return m_edges.size(); }

  /**
   * @brief Ids of every node reachable from @p nodeId along outgoing edges,
   * sorted, excluding @p nodeId itself
   */
  [[nodiscard]] std::vector<std::string> descendants(const std::string& nodeId) const;

  // =========================================================================
  // Selection
  // =========================================================================

  /**
   * @brief Select a node, or clear the selection with std::nullopt
   * @return false if the id is unknown
   */
  bool selectNode(const std::optional<std::string>& nodeId);
  void clearSelection();
  [[nodiscard]] const std::optional<std::string>& selectedNodeId() const {
    return m_selectedNodeId;
  }

  /**
   * @brief Move the selection to the nearest node in @p direction
   * @return true if the selection changed
   */
  bool selectDirectional(Direction direction);

  void setSelectionParams(const DirectionalSelectionParams& params) {
    m_selectionParams = params;
  }
  [[nodiscard]] const DirectionalSelectionParams& selectionParams() const {
    return m_selectionParams;
  }

  // =========================================================================
  // History
  // =========================================================================

  [[nodiscard]] bool canUndo() const { return !m_undoStack.empty(); }
  [[nodiscard]] bool canRedo() const { return !m_redoStack.empty(); }
  bool undo();
  bool redo();
  void clearHistory();

  // =========================================================================
  // Notifications
  // =========================================================================

  void setOnGraphChanged(GraphChangeCallback callback);

private:
  struct Snapshot {
    std::vector<GraphNode> nodes;
    std::vector<GraphEdge> edges;
  };

  GraphNode* findNodeMutable(const std::string& nodeId);
  GraphEdge* findEdgeMutable(const std::string& edgeId);

  void pushUndo();
  void restore(Snapshot snapshot);
  void notify(GraphChangeKind kind, const std::string& nodeId = {},
              const std::string& edgeId = {}, const std::string& previousNodeId = {});

  std::vector<GraphNode> m_nodes;
  std::vector<GraphEdge> m_edges;
  std::optional<std::string> m_selectedNodeId;
  DirectionalSelectionParams m_selectionParams;

  std::deque<Snapshot> m_undoStack;
  std::vector<Snapshot> m_redoStack;

  u64 m_nextEdgeId = 1;
  GraphChangeCallback m_onGraphChanged;
};

} // namespace Plotline::graph
