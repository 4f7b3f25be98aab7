#include "Plotline/editor/mediators/graph_selection_mediator.hpp"
#include "Plotline/core/logger.hpp"

namespace Plotline::editor::mediators {

GraphSelectionMediator::GraphSelectionMediator(graph::GraphModel &graph,
                                               EdgeInteractionController &edges,
                                               branch::BranchManager &branches,
                                               EventBus &bus)
    : m_graph(graph), m_edges(edges), m_branches(branches), m_bus(bus) {}

GraphSelectionMediator::~GraphSelectionMediator() { shutdown(); }

void GraphSelectionMediator::initialize() {
  if (m_initialized) {
    return;
  }

  m_graph.setOnGraphChanged(
      [this](const graph::GraphChange &change) { onGraphChanged(change); });

  m_branches.setOnBranchChanged([this](const branch::Branch &branch) {
    events::BranchChangedEvent event;
    event.branch = branch;
    m_bus.publish(event);
  });

  m_edges.setOnSessionFinished([this](const EdgeCreationResult &result) {
    events::EdgeCreationFinishedEvent event;
    event.outcome = result.outcome;
    event.sourceNodeId = result.sourceNodeId;
    event.targetNodeId = result.targetNodeId.value_or(std::string());
    event.edgeId = result.edgeId.value_or(std::string());
    m_bus.publish(event);
  });

  m_initialized = true;
}

void GraphSelectionMediator::shutdown() {
  if (!m_initialized) {
    return;
  }

  m_graph.setOnGraphChanged(nullptr);
  m_branches.setOnBranchChanged(nullptr);
  m_edges.setOnSessionFinished(nullptr);

  m_initialized = false;
}

void GraphSelectionMediator::onGraphChanged(const graph::GraphChange &change) {
  switch (change.kind) {
  case graph::GraphChangeKind::NodeAdded: {
    events::NodeAddedEvent event;
    event.nodeId = change.nodeId;
    m_bus.publish(event);
    break;
  }
  case graph::GraphChangeKind::NodeRemoved: {
    cancelSessionUsing(change.nodeId);
    events::NodeRemovedEvent event;
    event.nodeId = change.nodeId;
    m_bus.publish(event);
    break;
  }
  case graph::GraphChangeKind::NodeUpdated: {
    events::NodeUpdatedEvent event;
    event.nodeId = change.nodeId;
    m_bus.publish(event);
    break;
  }
  case graph::GraphChangeKind::NodeMoved: {
    events::NodeMovedEvent event;
    event.nodeId = change.nodeId;
    if (const auto *node = m_graph.findNode(change.nodeId)) {
      event.position = node->position;
    }
    m_bus.publish(event);
    break;
  }
  case graph::GraphChangeKind::EdgeAdded: {
    events::EdgeAddedEvent event;
    event.edgeId = change.edgeId;
    if (const auto *edge = m_graph.findEdge(change.edgeId)) {
      event.sourceNodeId = edge->source;
      event.targetNodeId = edge->target;
    }
    m_bus.publish(event);
    break;
  }
  case graph::GraphChangeKind::EdgeRemoved: {
    events::EdgeRemovedEvent event;
    event.edgeId = change.edgeId;
    m_bus.publish(event);
    break;
  }
  case graph::GraphChangeKind::EdgeUpdated: {
    events::EdgeUpdatedEvent event;
    event.edgeId = change.edgeId;
    m_bus.publish(event);
    break;
  }
  case graph::GraphChangeKind::SelectionChanged: {
    events::NodeSelectedEvent event;
    event.nodeId = change.nodeId;
    event.previousNodeId = change.previousNodeId;
    m_bus.publish(event);
    refreshImpactPreview(change.nodeId);
    break;
  }
  case graph::GraphChangeKind::PositionsApplied:
    // Published by the workspace together with the strategy that produced it
    break;
  case graph::GraphChangeKind::HistoryRestored:
    cancelStaleSession();
    m_bus.publish(events::GraphHistoryRestoredEvent{});
    break;
  }
}

void GraphSelectionMediator::refreshImpactPreview(const std::string &nodeId) {
  // Always a fresh request; an empty id just clears the previous estimate
  auto estimate = m_branches.previewImpact(nodeId);

  events::ImpactPreviewUpdatedEvent preview;
  preview.nodeId = nodeId;
  preview.estimate = estimate;
  m_bus.publish(preview);
}

void GraphSelectionMediator::cancelSessionUsing(const std::string &nodeId) {
  const auto &session = m_edges.session();
  if (!session) {
    return;
  }

  if (session->sourceNodeId == nodeId || session->candidateTargetNodeId == nodeId) {
    PLOTLINE_LOG_DEBUG("GraphSelectionMediator: node '" + nodeId +
                       "' removed during edge creation, cancelling");
    m_edges.cancel();
  }
}

void GraphSelectionMediator::cancelStaleSession() {
  const auto &session = m_edges.session();
  if (!session) {
    return;
  }

  const bool sourceGone = !m_graph.hasNode(session->sourceNodeId);
  const bool candidateGone =
      session->candidateTargetNodeId && !m_graph.hasNode(*session->candidateTargetNodeId);
  if (sourceGone || candidateGone) {
    m_edges.cancel();
  }
}

} // namespace Plotline::editor::mediators
