#pragma once

/**
 * @file graph_selection_mediator.hpp
 * @brief Mediator wiring the graph, edge interaction and branch components
 *
 * The GraphSelectionMediator handles:
 * - Requesting a fresh impact preview whenever the selected node changes
 * - Cancelling an edge-creation session whose source or candidate node
 *   disappears from the graph
 * - Republishing component callbacks as EventBus events
 *
 * It reacts to its own graph's callbacks only, never to events on the bus,
 * which may be shared with other workspaces.
 */

#include "Plotline/branch/branch_manager.hpp"
#include "Plotline/editor/edge_interaction_controller.hpp"
#include "Plotline/editor/event_bus.hpp"
#include "Plotline/editor/events/graph_events.hpp"
#include "Plotline/graph/graph_model.hpp"

#include <string>

namespace Plotline::editor::mediators {

class GraphSelectionMediator {
public:
  GraphSelectionMediator(graph::GraphModel &graph, EdgeInteractionController &edges,
                         branch::BranchManager &branches, EventBus &bus);

  ~GraphSelectionMediator();

  GraphSelectionMediator(const GraphSelectionMediator &) = delete;
  GraphSelectionMediator &operator=(const GraphSelectionMediator &) = delete;

  /**
   * @brief Install the component callbacks
   */
  void initialize();

  /**
   * @brief Remove everything initialize() installed
   */
  void shutdown();

  [[nodiscard]] bool isInitialized() const { return m_initialized; }

private:
  void onGraphChanged(const graph::GraphChange &change);
  void refreshImpactPreview(const std::string &nodeId);
  void cancelSessionUsing(const std::string &nodeId);
  void cancelStaleSession();

  graph::GraphModel &m_graph;
  EdgeInteractionController &m_edges;
  branch::BranchManager &m_branches;
  EventBus &m_bus;

  bool m_initialized = false;
};

} // namespace Plotline::editor::mediators
