#include "Plotline/editor/graph_workspace.hpp"
#include "Plotline/branch/local_branch_service.hpp"
#include "Plotline/core/logger.hpp"
#include "Plotline/editor/events/graph_events.hpp"

namespace Plotline::editor {

GraphWorkspace::GraphWorkspace(EventBus &bus, const EditorConfig &config)
    : m_config(config), m_bus(bus),
      m_ownedService(std::make_unique<branch::LocalBranchService>(
          m_graph, config.branches.rootBranchId, config.branches.rootLabel)),
      m_service(m_ownedService.get()), m_edgeController(m_graph, config.edgeCreation),
      m_branchManager(*m_service, config.branches),
      m_mediator(m_graph, m_edgeController, m_branchManager, m_bus) {
  m_graph.setSelectionParams(m_config.selection);
  m_mediator.initialize();
}

GraphWorkspace::GraphWorkspace(branch::IBranchService &service, EventBus &bus,
                               const EditorConfig &config)
    : m_config(config), m_bus(bus), m_service(&service),
      m_edgeController(m_graph, config.edgeCreation),
      m_branchManager(*m_service, config.branches),
      m_mediator(m_graph, m_edgeController, m_branchManager, m_bus) {
  m_graph.setSelectionParams(m_config.selection);
  m_mediator.initialize();
}

GraphWorkspace::~GraphWorkspace() { m_mediator.shutdown(); }

void GraphWorkspace::applyConfig(const EditorConfig &config) {
  const std::string rootBranchId = m_config.branches.rootBranchId;
  const std::string rootLabel = m_config.branches.rootLabel;

  m_config = config;
  m_config.branches.rootBranchId = rootBranchId;
  m_config.branches.rootLabel = rootLabel;

  m_graph.setSelectionParams(m_config.selection);
  m_edgeController.setSnapRadius(m_config.edgeCreation.snapRadius);
  m_edgeController.setDefaults(m_config.edgeCreation.defaults);
  m_branchManager.setMutationPolicy(m_config.branches.mutationPolicy);
}

usize GraphWorkspace::applyLayout() { return applyLayout(m_config.layout.strategy); }

usize GraphWorkspace::applyLayout(layout::LayoutStrategy strategy) {
  layout::LayoutConfig layoutConfig = m_config.layout;
  layoutConfig.strategy = strategy;

  if (strategy == layout::LayoutStrategy::Manual) {
    return 0;
  }

  auto positions = layout::computeLayout(m_graph.nodes(), m_graph.edges(), layoutConfig);
  const usize moved = m_graph.applyPositions(positions);

  PLOTLINE_LOG_INFO("GraphWorkspace: applied {} layout to {} node(s)",
                    layout::toString(strategy), moved);

  events::LayoutAppliedEvent event;
  event.strategy = strategy;
  event.movedNodeCount = moved;
  event.animate = layoutConfig.animate;
  m_bus.publish(event);
  return moved;
}

} // namespace Plotline::editor
