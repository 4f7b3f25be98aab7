#pragma once

/**
 * @file editor_config.hpp
 * @brief Editor configuration structures
 *
 * Defines every tunable of the graph editor:
 * - Layout strategy and per-strategy parameters
 * - Directional selection threshold
 * - Edge creation snap radius and default edge attributes
 * - Branch root and optimistic-mutation policy
 * - Logging
 *
 * Built-in defaults reproduce the stock editor behavior.
 */

#include "Plotline/branch/branch_manager.hpp"
#include "Plotline/editor/edge_interaction_controller.hpp"
#include "Plotline/graph/directional_selection.hpp"
#include "Plotline/layout/layout_engine.hpp"

#include <string>

namespace Plotline::editor {

/**
 * @brief Logging settings
 */
struct LoggingSettings {
  std::string logLevel = "info"; // trace, debug, info, warning, error, fatal, off
  bool logToFile = false;
  std::string logDirectory = "logs";
  std::string logFileName = "plotline.log";
};

/**
 * @brief Complete editor configuration
 */
struct EditorConfig {
  std::string version = "1.0";

  layout::LayoutConfig layout;
  graph::DirectionalSelectionParams selection;
  EdgeCreationSettings edgeCreation;
  branch::BranchManagerSettings branches;
  LoggingSettings logging;
};

} // namespace Plotline::editor
