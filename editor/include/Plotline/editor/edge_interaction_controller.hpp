#pragma once

/**
 * @file edge_interaction_controller.hpp
 * @brief Pointer-driven edge creation
 *
 * State machine for drawing a new edge from a node:
 *
 *   Idle --start()--> Creating --complete()/cancel()--> Idle
 *
 * While Creating, pointer moves update the cursor and the snap candidate:
 * the first node (model order) within the snap radius of the cursor that is
 * not the source. Releasing over a candidate creates source -> candidate
 * unless that directed edge already exists. Every session ends in Idle.
 *
 * All coordinates are graph-space. The rendering surface owns the
 * zoom/pan transform and converts before calling in (see screenToGraph).
 */

#include "Plotline/editor/events/graph_events.hpp"
#include "Plotline/graph/graph_model.hpp"
#include "Plotline/graph/graph_types.hpp"

#include <functional>
#include <optional>
#include <string>

namespace Plotline::editor {

enum class EdgeCreationState { Idle, Creating };

/**
 * @brief The single in-flight edge-creation gesture
 */
struct EdgeCreationSession {
  std::string sourceNodeId;
  graph::Position cursorPosition;
  std::optional<std::string> candidateTargetNodeId;
};

struct EdgeCreationSettings {
  f64 snapRadius = 40.0;
  graph::EdgeAttributes defaults{graph::EdgeType::Causal, graph::LineStyle::Solid,
                                 std::string("#888888"), 1.0, std::nullopt};
};

enum class InputEventKind { PointerMove, PointerUp, CancelKey, Abort };

/**
 * @brief One event from the input surface, already in graph space
 */
struct InputEvent {
  InputEventKind kind = InputEventKind::PointerMove;
  graph::Position position;
};

/**
 * @brief graphCoord = screenCoord / zoom; a non-positive zoom leaves the
 * coordinates unchanged
 */
[[nodiscard]] graph::Position screenToGraph(const graph::Position &screen, f64 zoom);

/**
 * @brief Result reported when a session ends
 */
struct EdgeCreationResult {
  events::EdgeCreationOutcome outcome = events::EdgeCreationOutcome::Cancelled;
  std::string sourceNodeId;
  std::optional<std::string> targetNodeId;
  std::optional<std::string> edgeId;
};

using EdgeCreationCallback = std::function<void(const EdgeCreationResult &)>;

class EdgeInteractionController {
public:
  explicit EdgeInteractionController(graph::GraphModel &model,
                                     EdgeCreationSettings settings = {});

  EdgeInteractionController(const EdgeInteractionController &) = delete;
  EdgeInteractionController &operator=(const EdgeInteractionController &) = delete;

  /**
   * @brief Begin a session from @p sourceNodeId
   *
   * A session already in progress is cancelled first. The cursor starts at
   * the origin with no candidate.
   * @return false (and stay Idle) if the node is not in the model
   */
  bool start(const std::string &sourceNodeId);

  /**
   * @brief Move the cursor and recompute the snap candidate; ignored when Idle
   */
  void updatePosition(f64 x, f64 y);

  /**
   * @brief Release: create the edge if a valid candidate exists, then reset
   * @return Id of the created edge; std::nullopt when nothing was created
   */
  std::optional<std::string> complete();

  /**
   * @brief Abandon the session (escape key or external abort); no-op when Idle
   */
  void cancel();

  /**
   * @brief Route an input-surface event to updatePosition/complete/cancel
   */
  void handleInput(const InputEvent &event);

  [[nodiscard]] EdgeCreationState state() const {
    return m_session ? EdgeCreationState::Creating : EdgeCreationState::Idle;
  }
  [[nodiscard]] bool isCreating() const { return m_session.has_value(); }
  [[nodiscard]] const std::optional<EdgeCreationSession> &session() const {
    return m_session;
  }

  void setDefaults(const graph::EdgeAttributes &defaults) {
    m_settings.defaults = defaults;
  }
  [[nodiscard]] const graph::EdgeAttributes &defaults() const {
    return m_settings.defaults;
  }

  void setSnapRadius(f64 radius) { m_settings.snapRadius = radius; }
  [[nodiscard]] f64 snapRadius() const { return m_settings.snapRadius; }

  /**
   * @brief Called once per finished session, after the controller is Idle
   */
  void setOnSessionFinished(EdgeCreationCallback callback);

private:
  [[nodiscard]] std::optional<std::string> findSnapTarget(const graph::Position &cursor,
                                                          const std::string &sourceId) const;
  void finish(EdgeCreationResult result);

  graph::GraphModel &m_model;
  EdgeCreationSettings m_settings;
  std::optional<EdgeCreationSession> m_session;
  EdgeCreationCallback m_onSessionFinished;
};

} // namespace Plotline::editor
