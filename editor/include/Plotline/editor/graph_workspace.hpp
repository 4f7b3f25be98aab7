#pragma once

/**
 * @file graph_workspace.hpp
 * @brief Composition root for one open story graph
 *
 * Owns the graph, the edge interaction controller, the branch manager and
 * the mediator that connects them through an EventBus. Nothing here is
 * global: each workspace is an independent editing session.
 */

#include "Plotline/branch/IBranchService.hpp"
#include "Plotline/branch/branch_manager.hpp"
#include "Plotline/editor/edge_interaction_controller.hpp"
#include "Plotline/editor/editor_config.hpp"
#include "Plotline/editor/event_bus.hpp"
#include "Plotline/editor/mediators/graph_selection_mediator.hpp"
#include "Plotline/graph/graph_model.hpp"
#include "Plotline/layout/layout_engine.hpp"

#include <memory>

namespace Plotline::editor {

class GraphWorkspace {
public:
  /**
   * @brief Workspace backed by an in-process LocalBranchService
   */
  explicit GraphWorkspace(EventBus &bus, const EditorConfig &config = {});

  /**
   * @brief Workspace using an external branch service
   */
  GraphWorkspace(branch::IBranchService &service, EventBus &bus,
                 const EditorConfig &config = {});

  ~GraphWorkspace();

  GraphWorkspace(const GraphWorkspace &) = delete;
  GraphWorkspace &operator=(const GraphWorkspace &) = delete;

  [[nodiscard]] graph::GraphModel &graph() { return m_graph; }
  [[nodiscard]] const graph::GraphModel &graph() const { return m_graph; }
  [[nodiscard]] EdgeInteractionController &edgeInteraction() { return m_edgeController; }
  [[nodiscard]] branch::BranchManager &branches() { return m_branchManager; }
  [[nodiscard]] EventBus &bus() { return m_bus; }
  [[nodiscard]] const EditorConfig &config() const { return m_config; }

  /**
   * @brief Apply new settings to every owned component
   *
   * The branch root id is fixed for the lifetime of the workspace; only the
   * mutation policy is taken from @p config.branches.
   */
  void applyConfig(const EditorConfig &config);

  /**
   * @brief Run the configured layout strategy and commit the result
   * @return Number of nodes moved
   */
  usize applyLayout();

  /**
   * @brief Run @p strategy with the configured parameters and commit the result
   */
  usize applyLayout(layout::LayoutStrategy strategy);

private:
  EditorConfig m_config;
  EventBus &m_bus;
  graph::GraphModel m_graph;
  std::unique_ptr<branch::IBranchService> m_ownedService;
  branch::IBranchService *m_service = nullptr;
  EdgeInteractionController m_edgeController;
  branch::BranchManager m_branchManager;
  mediators::GraphSelectionMediator m_mediator;
};

} // namespace Plotline::editor
