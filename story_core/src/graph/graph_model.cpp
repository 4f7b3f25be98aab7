#include "Plotline/graph/graph_model.hpp"
#include "Plotline/core/logger.hpp"

#include <algorithm>
#include <queue>
#include <unordered_set>

namespace Plotline::graph {

// ============================================================================
// Nodes
// ============================================================================

bool GraphModel::addNode(const GraphNode& node) {
  if (node.id.empty()) {
    PLOTLINE_LOG_DEBUG("GraphModel: rejected node with empty id");
    return false;
  }
  if (hasNode(node.id)) {
    PLOTLINE_LOG_DEBUG("GraphModel: rejected duplicate node id '" + node.id + "'");
    return false;
  }

  pushUndo();
  m_nodes.push_back(node);
  m_nodes.back().importance = std::clamp(node.importance, 0.0, 1.0);
  notify(GraphChangeKind::NodeAdded, node.id);
  return true;
}

bool GraphModel::removeNode(const std::string& nodeId) {
  auto it = std::find_if(m_nodes.begin(), m_nodes.end(),
                         [&nodeId](const GraphNode& n) { return n.id == nodeId; });
  if (it == m_nodes.end()) {
    return false;
  }

  pushUndo();

  std::vector<std::string> removedEdges;
  for (const auto& edge : m_edges) {
    if (edge.source == nodeId || edge.target == nodeId) {
      removedEdges.push_back(edge.id);
    }
  }
  m_edges.erase(std::remove_if(m_edges.begin(), m_edges.end(),
                               [&nodeId](const GraphEdge& e) {
                                 return e.source == nodeId || e.target == nodeId;
                               }),
                m_edges.end());
  m_nodes.erase(it);

  for (const auto& edgeId : removedEdges) {
    notify(GraphChangeKind::EdgeRemoved, {}, edgeId);
  }
  notify(GraphChangeKind::NodeRemoved, nodeId);

  if (m_selectedNodeId && *m_selectedNodeId == nodeId) {
    m_selectedNodeId.reset();
    notify(GraphChangeKind::SelectionChanged, {}, {}, nodeId);
  }
  return true;
}

bool GraphModel::updateNode(const GraphNode& node) {
  GraphNode* existing = findNodeMutable(node.id);
  if (!existing) {
    return false;
  }

  pushUndo();
  existing->label = node.label;
  existing->branchId = node.branchId;
  existing->importance = std::clamp(node.importance, 0.0, 1.0);
  existing->type = node.type;
  notify(GraphChangeKind::NodeUpdated, node.id);
  return true;
}

bool GraphModel::updateNodePosition(const std::string& nodeId, f64 x, f64 y) {
  GraphNode* node = findNodeMutable(nodeId);
  if (!node) {
    return false;
  }

  // Drag updates arrive per pointer move and are not recorded in history
  node->position = {x, y};
  notify(GraphChangeKind::NodeMoved, nodeId);
  return true;
}

usize GraphModel::applyPositions(const PositionMap& positions) {
  usize known = 0;
  for (const auto& node : m_nodes) {
    if (positions.count(node.id) != 0) {
      ++known;
    }
  }
  if (known == 0) {
    return 0;
  }

  pushUndo();
  for (auto& node : m_nodes) {
    auto it = positions.find(node.id);
    if (it != positions.end()) {
      node.position = it->second;
    }
  }
  notify(GraphChangeKind::PositionsApplied);
  return known;
}

const GraphNode* GraphModel::findNode(const std::string& nodeId) const {
  auto it = std::find_if(m_nodes.begin(), m_nodes.end(),
                         [&nodeId](const GraphNode& n) { return n.id == nodeId; });
  return it != m_nodes.end() ? &(*it) : nullptr;
}

bool GraphModel::hasNode(const std::string& nodeId) const {
  return findNode(nodeId) != nullptr;
}

GraphNode* GraphModel::findNodeMutable(const std::string& nodeId) {
  auto it = std::find_if(m_nodes.begin(), m_nodes.end(),
                         [&nodeId](const GraphNode& n) { return n.id == nodeId; });
  return it != m_nodes.end() ? &(*it) : nullptr;
}

// ============================================================================
// Edges
// ============================================================================

std::optional<std::string> GraphModel::addEdge(const std::string& source,
                                               const std::string& target,
                                               const EdgeAttributes& attributes) {
  if (source == target) {
    PLOTLINE_LOG_DEBUG("GraphModel: rejected self-loop on '" + source + "'");
    return std::nullopt;
  }
  if (!hasNode(source) || !hasNode(target)) {
    PLOTLINE_LOG_DEBUG("GraphModel: rejected edge with unknown endpoint '" + source +
                       "' -> '" + target + "'");
    return std::nullopt;
  }
  if (hasEdge(source, target)) {
    PLOTLINE_LOG_DEBUG("GraphModel: rejected duplicate edge '" + source + "' -> '" +
                       target + "'");
    return std::nullopt;
  }

  pushUndo();

  GraphEdge edge;
  edge.id = "edge-" + std::to_string(m_nextEdgeId++);
  edge.source = source;
  edge.target = target;
  edge.type = attributes.type;
  edge.style = attributes.style;
  edge.color = attributes.color;
  edge.weight = attributes.weight;
  edge.label = attributes.label;
  m_edges.push_back(edge);

  notify(GraphChangeKind::EdgeAdded, {}, edge.id);
  return edge.id;
}

bool GraphModel::removeEdge(const std::string& edgeId) {
  auto it = std::find_if(m_edges.begin(), m_edges.end(),
                         [&edgeId](const GraphEdge& e) { return e.id == edgeId; });
  if (it == m_edges.end()) {
    return false;
  }

  pushUndo();
  m_edges.erase(it);
  notify(GraphChangeKind::EdgeRemoved, {}, edgeId);
  return true;
}

bool GraphModel::updateEdge(const std::string& edgeId, const EdgeAttributes& attributes) {
  GraphEdge* edge = findEdgeMutable(edgeId);
  if (!edge) {
    return false;
  }

  pushUndo();
  edge->type = attributes.type;
  edge->style = attributes.style;
  edge->color = attributes.color;
  edge->weight = attributes.weight;
  edge->label = attributes.label;
  notify(GraphChangeKind::EdgeUpdated, {}, edgeId);
  return true;
}

bool GraphModel::hasEdge(const std::string& source, const std::string& target) const {
  return std::any_of(m_edges.begin(), m_edges.end(), [&](const GraphEdge& e) {
    return e.source == source && e.target == target;
  });
}

const GraphEdge* GraphModel::findEdge(const std::string& edgeId) const {
  auto it = std::find_if(m_edges.begin(), m_edges.end(),
                         [&edgeId](const GraphEdge& e) { return e.id == edgeId; });
  return it != m_edges.end() ? &(*it) : nullptr;
}

GraphEdge* GraphModel::findEdgeMutable(const std::string& edgeId) {
  auto it = std::find_if(m_edges.begin(), m_edges.end(),
                         [&edgeId](const GraphEdge& e) { return e.id == edgeId; });
  return it != m_edges.end() ? &(*it) : nullptr;
}

std::vector<GraphEdge> GraphModel::edgesForNode(const std::string& nodeId) const {
  std::vector<GraphEdge> result;
  for (const auto& edge : m_edges) {
    if (edge.source == nodeId || edge.target == nodeId) {
      result.push_back(edge);
    }
  }
  return result;
}

std::vector<std::string> GraphModel::descendants(const std::string& nodeId) const {
  std::unordered_map<std::string, std::vector<std::string>> adjacency;
  for (const auto& edge : m_edges) {
    adjacency[edge.source].push_back(edge.target);
  }

  std::unordered_set<std::string> visited;
  std::queue<std::string> queue;
  queue.push(nodeId);

  while (!queue.empty()) {
    std::string current = queue.front();
    queue.pop();

    auto it = adjacency.find(current);
    if (it == adjacency.end()) {
      continue;
    }
    for (const auto& next : it->second) {
      if (next != nodeId && visited.insert(next).second) {
        queue.push(next);
      }
    }
  }

  std::vector<std::string> result(visited.begin(), visited.end());
  std::sort(result.begin(), result.end());
  return result;
}

// ============================================================================
// Selection
// ============================================================================

bool GraphModel::selectNode(const std::optional<std::string>& nodeId) {
  if (nodeId && !hasNode(*nodeId)) {
    return false;
  }
  if (m_selectedNodeId == nodeId) {
    return true;
  }

  std::string previous = m_selectedNodeId.value_or(std::string());
  m_selectedNodeId = nodeId;
  notify(GraphChangeKind::SelectionChanged, nodeId.value_or(std::string()), {}, previous);
  return true;
}

void GraphModel::clearSelection() {
  selectNode(std::nullopt);
}

bool GraphModel::selectDirectional(Direction direction) {
  const auto before = m_selectedNodeId;
  navigateSelection(
      m_nodes, direction, [this]() { return m_selectedNodeId; },
      [this](const std::string& id) { selectNode(id); }, m_selectionParams);
  return m_selectedNodeId != before;
}

// ============================================================================
// History
// ============================================================================

void GraphModel::pushUndo() {
  m_undoStack.push_back({m_nodes, m_edges});
  if (m_undoStack.size() > MAX_HISTORY_SIZE) {
    m_undoStack.pop_front();
  }
  m_redoStack.clear();
}

bool GraphModel::undo() {
  if (m_undoStack.empty()) {
    return false;
  }

  m_redoStack.push_back({m_nodes, m_edges});
  Snapshot snapshot = std::move(m_undoStack.back());
  m_undoStack.pop_back();
  restore(std::move(snapshot));
  return true;
}

bool GraphModel::redo() {
  if (m_redoStack.empty()) {
    return false;
  }

  m_undoStack.push_back({m_nodes, m_edges});
  Snapshot snapshot = std::move(m_redoStack.back());
  m_redoStack.pop_back();
  restore(std::move(snapshot));
  return true;
}

void GraphModel::clearHistory() {
  m_undoStack.clear();
  m_redoStack.clear();
}

void GraphModel::restore(Snapshot snapshot) {
  m_nodes = std::move(snapshot.nodes);
  m_edges = std::move(snapshot.edges);
  notify(GraphChangeKind::HistoryRestored);

  if (m_selectedNodeId && !hasNode(*m_selectedNodeId)) {
    std::string previous = *m_selectedNodeId;
    m_selectedNodeId.reset();
    notify(GraphChangeKind::SelectionChanged, {}, {}, previous);
  }
}

// ============================================================================
// Notifications
// ============================================================================

void GraphModel::setOnGraphChanged(GraphChangeCallback callback) {
  m_onGraphChanged = std::move(callback);
}

void GraphModel::notify(GraphChangeKind kind, const std::string& nodeId,
                        const std::string& edgeId, const std::string& previousNodeId) {
  if (m_onGraphChanged) {
    m_onGraphChanged(GraphChange{kind, nodeId, edgeId, previousNodeId});
  }
}

} // namespace Plotline::graph
