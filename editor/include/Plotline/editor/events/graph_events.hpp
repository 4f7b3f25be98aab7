#pragma once

/**
 * @file graph_events.hpp
 * @brief Events published while editing a story graph
 *
 * Usage:
 * - Publishers: bus.publish(events::NodeSelectedEvent{...});
 * - Subscribers: bus.subscribe<events::NodeSelectedEvent>([](const auto &e){...});
 */

#include "Plotline/branch/branch_types.hpp"
#include "Plotline/editor/event_bus.hpp"
#include "Plotline/graph/graph_types.hpp"
#include "Plotline/layout/layout_engine.hpp"

#include <optional>
#include <string>

namespace Plotline::editor::events {

// ============================================================================
// Graph Structure Events
// ============================================================================

struct NodeAddedEvent : EditorEvent {
  std::string nodeId;

  NodeAddedEvent() : EditorEvent(EditorEventType::NodeAdded) {}

  [[nodiscard]] std::string getDescription() const override {
    return "Node added: " + nodeId;
  }
};

/**
 * @brief Emitted after a node and its incident edges are gone
 */
struct NodeRemovedEvent : EditorEvent {
  std::string nodeId;

  NodeRemovedEvent() : EditorEvent(EditorEventType::NodeRemoved) {}

  [[nodiscard]] std::string getDescription() const override {
    return "Node removed: " + nodeId;
  }
};

struct NodeUpdatedEvent : EditorEvent {
  std::string nodeId;

  NodeUpdatedEvent() : EditorEvent(EditorEventType::NodeUpdated) {}

  [[nodiscard]] std::string getDescription() const override {
    return "Node updated: " + nodeId;
  }
};

struct NodeMovedEvent : EditorEvent {
  std::string nodeId;
  graph::Position position;

  NodeMovedEvent() : EditorEvent(EditorEventType::NodeMoved) {}

  [[nodiscard]] std::string getDescription() const override {
    return "Node moved: " + nodeId;
  }
};

struct EdgeAddedEvent : EditorEvent {
  std::string edgeId;
  std::string sourceNodeId;
  std::string targetNodeId;

  EdgeAddedEvent() : EditorEvent(EditorEventType::EdgeAdded) {}

  [[nodiscard]] std::string getDescription() const override {
    return "Edge added: " + sourceNodeId + " -> " + targetNodeId;
  }
};

struct EdgeRemovedEvent : EditorEvent {
  std::string edgeId;

  EdgeRemovedEvent() : EditorEvent(EditorEventType::EdgeRemoved) {}

  [[nodiscard]] std::string getDescription() const override {
    return "Edge removed: " + edgeId;
  }
};

struct EdgeUpdatedEvent : EditorEvent {
  std::string edgeId;

  EdgeUpdatedEvent() : EditorEvent(EditorEventType::EdgeUpdated) {}

  [[nodiscard]] std::string getDescription() const override {
    return "Edge updated: " + edgeId;
  }
};

/**
 * @brief Emitted after undo/redo replaced the whole graph
 */
struct GraphHistoryRestoredEvent : EditorEvent {
  GraphHistoryRestoredEvent() : EditorEvent(EditorEventType::HistoryRestored) {}

  [[nodiscard]] std::string getDescription() const override {
    return "Graph history restored";
  }
};

// ============================================================================
// Interaction Events
// ============================================================================

/**
 * @brief Emitted when the selected node changes; nodeId is empty when the
 * selection was cleared
 */
struct NodeSelectedEvent : EditorEvent {
  std::string nodeId;
  std::string previousNodeId;

  NodeSelectedEvent() : EditorEvent(EditorEventType::SelectionChanged) {}

  [[nodiscard]] std::string getDescription() const override {
    return nodeId.empty() ? "Selection cleared" : "Node selected: " + nodeId;
  }
};

struct LayoutAppliedEvent : EditorEvent {
  layout::LayoutStrategy strategy = layout::LayoutStrategy::Manual;
  usize movedNodeCount = 0;
  bool animate = true;

  LayoutAppliedEvent() : EditorEvent(EditorEventType::LayoutApplied) {}

  [[nodiscard]] std::string getDescription() const override {
    return std::string("Layout applied: ") + layout::toString(strategy) + " (" +
           std::to_string(movedNodeCount) + " nodes)";
  }
};

enum class EdgeCreationOutcome { Created, NoTarget, Duplicate, Rejected, Cancelled };

[[nodiscard]] inline const char *toString(EdgeCreationOutcome outcome) {
  switch (outcome) {
  case EdgeCreationOutcome::Created:
    return "created";
  case EdgeCreationOutcome::NoTarget:
    return "no target";
  case EdgeCreationOutcome::Duplicate:
    return "duplicate";
  case EdgeCreationOutcome::Rejected:
    return "rejected";
  case EdgeCreationOutcome::Cancelled:
    return "cancelled";
  }
  return "cancelled";
}

/**
 * @brief Emitted whenever an edge-creation session ends
 */
struct EdgeCreationFinishedEvent : EditorEvent {
  EdgeCreationOutcome outcome = EdgeCreationOutcome::Cancelled;
  std::string sourceNodeId;
  std::string targetNodeId;
  std::string edgeId;

  EdgeCreationFinishedEvent() : EditorEvent(EditorEventType::EdgeCreationFinished) {}

  [[nodiscard]] std::string getDescription() const override {
    return "Edge creation from " + sourceNodeId + ": " + toString(outcome);
  }
};

// ============================================================================
// Branch Events
// ============================================================================

struct BranchChangedEvent : EditorEvent {
  branch::Branch branch;

  BranchChangedEvent() : EditorEvent(EditorEventType::BranchChanged) {}

  [[nodiscard]] std::string getDescription() const override {
    return "Branch " + branch.branchId + ": " + branch::toString(branch.status) + " (" +
           branch::toString(branch.syncState) + ")";
  }
};

/**
 * @brief Emitted after every impact preview request; estimate is empty when
 * the request failed or the selection was cleared
 */
struct ImpactPreviewUpdatedEvent : EditorEvent {
  std::string nodeId;
  std::optional<branch::ImpactEstimate> estimate;

  ImpactPreviewUpdatedEvent() : EditorEvent(EditorEventType::ImpactPreviewUpdated) {}

  [[nodiscard]] std::string getDescription() const override {
    return estimate ? "Impact preview: " + estimate->summary
                    : "Impact preview unavailable for " + nodeId;
  }
};

} // namespace Plotline::editor::events
