#include "Plotline/editor/edge_interaction_controller.hpp"
#include "Plotline/core/logger.hpp"

#include <cmath>

namespace Plotline::editor {

graph::Position screenToGraph(const graph::Position &screen, f64 zoom) {
  if (zoom <= 0.0) {
    return screen;
  }
  return {screen.x / zoom, screen.y / zoom};
}

EdgeInteractionController::EdgeInteractionController(graph::GraphModel &model,
                                                     EdgeCreationSettings settings)
    : m_model(model), m_settings(std::move(settings)) {}

bool EdgeInteractionController::start(const std::string &sourceNodeId) {
  if (m_session) {
    PLOTLINE_LOG_DEBUG("EdgeInteraction: restarting, previous session from '" +
                       m_session->sourceNodeId + "' cancelled");
    cancel();
  }

  if (!m_model.hasNode(sourceNodeId)) {
    PLOTLINE_LOG_DEBUG("EdgeInteraction: unknown source node '" + sourceNodeId + "'");
    return false;
  }

  EdgeCreationSession session;
  session.sourceNodeId = sourceNodeId;
  m_session = std::move(session);
  return true;
}

void EdgeInteractionController::updatePosition(f64 x, f64 y) {
  if (!m_session) {
    return;
  }

  m_session->cursorPosition = {x, y};
  m_session->candidateTargetNodeId =
      findSnapTarget(m_session->cursorPosition, m_session->sourceNodeId);
}

std::optional<std::string> EdgeInteractionController::complete() {
  if (!m_session) {
    return std::nullopt;
  }

  EdgeCreationResult result;
  result.sourceNodeId = m_session->sourceNodeId;
  result.targetNodeId = m_session->candidateTargetNodeId;

  if (!result.targetNodeId || *result.targetNodeId == result.sourceNodeId) {
    result.outcome = events::EdgeCreationOutcome::NoTarget;
  } else if (m_model.hasEdge(result.sourceNodeId, *result.targetNodeId)) {
    result.outcome = events::EdgeCreationOutcome::Duplicate;
  } else {
    result.edgeId =
        m_model.addEdge(result.sourceNodeId, *result.targetNodeId, m_settings.defaults);
    result.outcome = result.edgeId ? events::EdgeCreationOutcome::Created
                                   : events::EdgeCreationOutcome::Rejected;
  }

  auto edgeId = result.edgeId;
  finish(std::move(result));
  return edgeId;
}

void EdgeInteractionController::cancel() {
  if (!m_session) {
    return;
  }

  EdgeCreationResult result;
  result.outcome = events::EdgeCreationOutcome::Cancelled;
  result.sourceNodeId = m_session->sourceNodeId;
  result.targetNodeId = m_session->candidateTargetNodeId;
  finish(std::move(result));
}

void EdgeInteractionController::handleInput(const InputEvent &event) {
  switch (event.kind) {
  case InputEventKind::PointerMove:
    updatePosition(event.position.x, event.position.y);
    break;
  case InputEventKind::PointerUp:
    updatePosition(event.position.x, event.position.y);
    complete();
    break;
  case InputEventKind::CancelKey:
  case InputEventKind::Abort:
    cancel();
    break;
  }
}

void EdgeInteractionController::setOnSessionFinished(EdgeCreationCallback callback) {
  m_onSessionFinished = std::move(callback);
}

std::optional<std::string>
EdgeInteractionController::findSnapTarget(const graph::Position &cursor,
                                          const std::string &sourceId) const {
  for (const auto &node : m_model.nodes()) {
    if (node.id == sourceId) {
      continue;
    }
    const f64 dx = node.position.x - cursor.x;
    const f64 dy = node.position.y - cursor.y;
    if (std::sqrt(dx * dx + dy * dy) <= m_settings.snapRadius) {
      return node.id;
    }
  }
  return std::nullopt;
}

void EdgeInteractionController::finish(EdgeCreationResult result) {
  // Reset before notifying so callbacks observe Idle and may start a new session
  m_session.reset();

  PLOTLINE_LOG_DEBUG("EdgeInteraction: session from '" + result.sourceNodeId + "' ended (" +
                     events::toString(result.outcome) + ")");

  if (m_onSessionFinished) {
    m_onSessionFinished(result);
  }
}

} // namespace Plotline::editor
