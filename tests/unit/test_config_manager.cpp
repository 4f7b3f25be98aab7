/**
 * @file test_config_manager.cpp
 * @brief Unit tests for EditorConfig defaults and ConfigManager layering
 */

#include <catch2/catch_test_macros.hpp>

#include "Plotline/core/logger.hpp"
#include "Plotline/editor/config_manager.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;
using namespace Plotline;
using namespace Plotline::editor;

// Helper to create a temporary test directory
class TestDirectory {
public:
  explicit TestDirectory(const std::string &name) {
    m_path = fs::temp_directory_path() / ("plotline_test_" + name);
    std::error_code ec;
    fs::remove_all(m_path, ec);
    fs::create_directories(m_path / "config");
  }

  ~TestDirectory() {
    std::error_code ec;
    fs::remove_all(m_path, ec);
  }

  std::string path() const { return m_path.string(); }

  void writeFile(const std::string &relativePath, const std::string &content) {
    std::ofstream file(m_path / relativePath);
    file << content;
  }

  std::string readFile(const std::string &relativePath) const {
    std::ifstream file(m_path / relativePath);
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
  }

private:
  fs::path m_path;
};

// ===========================================================================
// EditorConfig defaults
// ===========================================================================

TEST_CASE("EditorConfig has stock defaults", "[config_manager]") {
  EditorConfig config;

  SECTION("Layout") {
    REQUIRE(config.layout.strategy == layout::LayoutStrategy::Manual);
    REQUIRE(config.layout.branchClustering == true);
    REQUIRE(config.layout.animate == true);
    REQUIRE(config.layout.hierarchical.nodesPerLevel == 3);
    REQUIRE(config.layout.force.iterations == 100);
    REQUIRE(config.layout.force.repulsion == 500.0);
    REQUIRE_FALSE(config.layout.force.seed.has_value());
    REQUIRE(config.layout.circular.radius == 200.0);
    REQUIRE(config.layout.timeline.stepX == 150.0);
  }

  SECTION("Interaction") {
    REQUIRE(config.selection.threshold == 50.0);
    REQUIRE(config.selection.secondaryWeight == 0.5);
    REQUIRE(config.edgeCreation.snapRadius == 40.0);
    REQUIRE(config.edgeCreation.defaults.type == graph::EdgeType::Causal);
    REQUIRE(config.edgeCreation.defaults.style == graph::LineStyle::Solid);
    REQUIRE(config.edgeCreation.defaults.color == std::optional<std::string>("#888888"));
  }

  SECTION("Branches and logging") {
    REQUIRE(config.branches.rootBranchId == "main");
    REQUIRE(config.branches.rootLabel == "Main Timeline");
    REQUIRE(config.branches.mutationPolicy == branch::MutationPolicy::KeepOptimistic);
    REQUIRE(config.logging.logLevel == "info");
    REQUIRE(config.logging.logToFile == false);
  }
}

// ===========================================================================
// ConfigManager
// ===========================================================================

TEST_CASE("ConfigManager initialization", "[config_manager]") {
  TestDirectory testDir("init");
  ConfigManager manager;

  SECTION("Loading before initialize fails") {
    REQUIRE(manager.loadConfig().isError());
    REQUIRE(manager.saveUserConfig().isError());
  }

  SECTION("Directories are created") {
    REQUIRE(manager.initialize(testDir.path()).isOk());
    REQUIRE(fs::exists(testDir.path() + "/config"));
    REQUIRE(fs::exists(testDir.path() + "/logs"));
    REQUIRE(manager.getConfigPath() == testDir.path() + "/config/");
  }

  SECTION("Missing files leave the defaults") {
    REQUIRE(manager.initialize(testDir.path()).isOk());
    REQUIRE(manager.loadConfig().isOk());
    REQUIRE(manager.getConfig().layout.strategy == layout::LayoutStrategy::Manual);
    REQUIRE(manager.getConfig().edgeCreation.snapRadius == 40.0);
  }
}

TEST_CASE("ConfigManager loads the project file", "[config_manager]") {
  TestDirectory testDir("project");
  testDir.writeFile("config/plotline_config.json", R"({
  "version": "2.0",
  "layout": {
    "strategy": "force",
    "branch_clustering": false,
    "animate": false,
    "hierarchical_params": { "nodes_per_level": 4, "level_width": 250 },
    "force_params": {
      "iterations": 30,
      "origin_seeding": "honor_origin",
      "seed": 7
    },
    "circular_params": { "center_x": 10, "center_y": 20, "radius": 90 },
    "timeline_params": { "step_x": 80 }
  },
  "selection": { "threshold": 25, "secondary_weight": 0.75 },
  "edge_creation": {
    "snap_radius": 12.5,
    "edge_type": "temporal",
    "line_style": "dashed",
    "color": "#00ff00",
    "weight": 2
  },
  "branches": {
    "root_branch_id": "trunk",
    "root_label": "Trunk",
    "mutation_policy": "rollback_on_failure"
  },
  "logging": { "level": "debug", "directory": "diagnostics" }
})");

  ConfigManager manager;
  REQUIRE(manager.initialize(testDir.path()).isOk());
  REQUIRE(manager.loadConfig().isOk());
  const auto &config = manager.getConfig();

  REQUIRE(config.version == "2.0");
  REQUIRE(config.layout.strategy == layout::LayoutStrategy::ForceDirected);
  REQUIRE(config.layout.branchClustering == false);
  REQUIRE(config.layout.animate == false);
  REQUIRE(config.layout.hierarchical.nodesPerLevel == 4);
  REQUIRE(config.layout.hierarchical.levelWidth == 250.0);
  REQUIRE(config.layout.hierarchical.levelHeight == 100.0);
  REQUIRE(config.layout.force.iterations == 30);
  REQUIRE(config.layout.force.originSeeding == layout::OriginSeeding::HonorOrigin);
  REQUIRE(config.layout.force.seed == std::optional<u32>(7u));
  REQUIRE(config.layout.circular.center == graph::Position{10, 20});
  REQUIRE(config.layout.circular.radius == 90.0);
  REQUIRE(config.layout.timeline.stepX == 80.0);
  REQUIRE(config.selection.threshold == 25.0);
  REQUIRE(config.selection.secondaryWeight == 0.75);
  REQUIRE(config.edgeCreation.snapRadius == 12.5);
  REQUIRE(config.edgeCreation.defaults.type == graph::EdgeType::Temporal);
  REQUIRE(config.edgeCreation.defaults.style == graph::LineStyle::Dashed);
  REQUIRE(config.edgeCreation.defaults.color == std::optional<std::string>("#00ff00"));
  REQUIRE(config.edgeCreation.defaults.weight == std::optional<f64>(2.0));
  REQUIRE(config.branches.rootBranchId == "trunk");
  REQUIRE(config.branches.rootLabel == "Trunk");
  REQUIRE(config.branches.mutationPolicy == branch::MutationPolicy::RollbackOnFailure);
  REQUIRE(config.logging.logLevel == "debug");
  REQUIRE(config.logging.logDirectory == "diagnostics");
  REQUIRE(manager.getLogsPath() == testDir.path() + "/diagnostics/");
}

TEST_CASE("ConfigManager unknown names keep the previous value", "[config_manager]") {
  TestDirectory testDir("unknown");
  testDir.writeFile("config/plotline_config.json", R"({
  "layout": { "strategy": "spiral" },
  "edge_creation": { "edge_type": "sideways" },
  "branches": { "mutation_policy": "sometimes" }
})");

  ConfigManager manager;
  REQUIRE(manager.initialize(testDir.path()).isOk());
  REQUIRE(manager.loadConfig().isOk());
  REQUIRE(manager.getConfig().layout.strategy == layout::LayoutStrategy::Manual);
  REQUIRE(manager.getConfig().edgeCreation.defaults.type == graph::EdgeType::Causal);
  REQUIRE(manager.getConfig().branches.mutationPolicy ==
          branch::MutationPolicy::KeepOptimistic);
}

TEST_CASE("ConfigManager user file overrides the project file", "[config_manager]") {
  TestDirectory testDir("layering");
  testDir.writeFile("config/plotline_config.json", R"({
  "layout": { "strategy": "hierarchical" },
  "edge_creation": { "snap_radius": 30 }
})");
  testDir.writeFile("config/plotline_user.json", R"({
  "edge_creation": { "snap_radius": 60 }
})");

  ConfigManager manager;
  REQUIRE(manager.initialize(testDir.path()).isOk());
  REQUIRE(manager.loadConfig().isOk());

  REQUIRE(manager.getConfig().layout.strategy == layout::LayoutStrategy::Hierarchical);
  REQUIRE(manager.getConfig().edgeCreation.snapRadius == 60.0);

  SECTION("Resetting user settings restores the project layer") {
    manager.resetUserSettings();
    REQUIRE(manager.getConfig().edgeCreation.snapRadius == 30.0);
    REQUIRE(manager.getConfig().layout.strategy == layout::LayoutStrategy::Hierarchical);
  }

  SECTION("Resetting to defaults drops both layers") {
    manager.resetToDefaults();
    REQUIRE(manager.getConfig().edgeCreation.snapRadius == 40.0);
    REQUIRE(manager.getConfig().layout.strategy == layout::LayoutStrategy::Manual);
  }
}

TEST_CASE("ConfigManager saves and reloads user settings", "[config_manager]") {
  TestDirectory testDir("save");
  testDir.writeFile("config/plotline_config.json", R"({
  "branches": { "root_branch_id": "trunk" }
})");

  {
    ConfigManager manager;
    REQUIRE(manager.initialize(testDir.path()).isOk());
    REQUIRE(manager.loadConfig().isOk());

    manager.setLayoutStrategy(layout::LayoutStrategy::Circular);
    manager.setBranchClustering(false);
    manager.setSnapRadius(25.0);
    manager.setSelectionThreshold(-3.0);
    manager.getConfigMutable().layout.force.seed = 99u;

    graph::EdgeAttributes attrs;
    attrs.type = graph::EdgeType::Parallel;
    attrs.style = graph::LineStyle::Dotted;
    attrs.color = "#123456";
    attrs.weight = 0.5;
    manager.setDefaultEdgeAttributes(attrs);

    REQUIRE(manager.getConfig().selection.threshold == 0.0);
    REQUIRE(manager.saveUserConfig().isOk());
  }

  REQUIRE(fs::exists(testDir.path() + "/config/plotline_user.json"));
  REQUIRE_FALSE(fs::exists(testDir.path() + "/config/plotline_user.json.tmp"));

  // Branch identity is project-owned and never written to the user file
  const std::string saved = testDir.readFile("config/plotline_user.json");
  REQUIRE(saved.find("root_branch_id") == std::string::npos);

  ConfigManager reloaded;
  REQUIRE(reloaded.initialize(testDir.path()).isOk());
  REQUIRE(reloaded.loadConfig().isOk());
  const auto &config = reloaded.getConfig();

  REQUIRE(config.layout.strategy == layout::LayoutStrategy::Circular);
  REQUIRE(config.layout.branchClustering == false);
  REQUIRE(config.layout.force.seed == std::optional<u32>(99u));
  REQUIRE(config.edgeCreation.snapRadius == 25.0);
  REQUIRE(config.selection.threshold == 0.0);
  REQUIRE(config.edgeCreation.defaults.type == graph::EdgeType::Parallel);
  REQUIRE(config.edgeCreation.defaults.style == graph::LineStyle::Dotted);
  REQUIRE(config.edgeCreation.defaults.color == std::optional<std::string>("#123456"));
  REQUIRE(config.edgeCreation.defaults.weight == std::optional<f64>(0.5));
  REQUIRE(config.branches.rootBranchId == "trunk");
}

TEST_CASE("ConfigManager keeps full precision across a save", "[config_manager]") {
  TestDirectory testDir("precision");

  {
    ConfigManager manager;
    REQUIRE(manager.initialize(testDir.path()).isOk());
    REQUIRE(manager.loadConfig().isOk());

    auto &force = manager.getConfigMutable().layout.force;
    force.seed = 4000000000u;
    force.springStiffness = 0.0123456789012345;
    manager.getConfigMutable().layout.circular.center.x = 1.0 / 3.0;
    REQUIRE(manager.saveUserConfig().isOk());
  }

  ConfigManager reloaded;
  REQUIRE(reloaded.initialize(testDir.path()).isOk());
  REQUIRE(reloaded.loadConfig().isOk());
  const auto &config = reloaded.getConfig();

  REQUIRE(config.layout.force.seed == std::optional<u32>(4000000000u));
  REQUIRE(config.layout.force.springStiffness == 0.0123456789012345);
  REQUIRE(config.layout.circular.center.x == 1.0 / 3.0);
}

TEST_CASE("ConfigManager ignores a seed outside the u32 range", "[config_manager]") {
  TestDirectory testDir("seed_range");
  testDir.writeFile("config/plotline_config.json", R"({
  "layout": { "force_params": { "seed": 12 } }
})");
  testDir.writeFile("config/plotline_user.json", R"({
  "layout": { "force_params": { "seed": 99999999999 } }
})");

  ConfigManager manager;
  REQUIRE(manager.initialize(testDir.path()).isOk());
  REQUIRE(manager.loadConfig().isOk());
  REQUIRE(manager.getConfig().layout.force.seed == std::optional<u32>(12u));
}

TEST_CASE("ConfigManager change notifications", "[config_manager]") {
  TestDirectory testDir("notify");
  ConfigManager manager;
  REQUIRE(manager.initialize(testDir.path()).isOk());

  int notifications = 0;
  layout::LayoutStrategy seen = layout::LayoutStrategy::Manual;
  manager.setOnConfigChanged([&](const EditorConfig &config) {
    notifications++;
    seen = config.layout.strategy;
  });

  REQUIRE(manager.loadConfig().isOk());
  REQUIRE(notifications == 1);

  manager.setLayoutStrategy(layout::LayoutStrategy::Timeline);
  REQUIRE(notifications == 2);
  REQUIRE(seen == layout::LayoutStrategy::Timeline);
}

TEST_CASE("ConfigManager applies logging settings", "[config_manager]") {
  auto &logger = core::Logger::instance();
  const core::LogLevel previous = logger.getLevel();

  ConfigManager manager;

  SECTION("Known level") {
    manager.setLogLevel("error");
    REQUIRE(manager.applyLoggingSettings().isOk());
    REQUIRE(logger.getLevel() == core::LogLevel::Error);
  }

  SECTION("Unknown level is rejected and leaves the logger alone") {
    logger.setLevel(core::LogLevel::Warning);
    manager.setLogLevel("chatty");
    auto result = manager.applyLoggingSettings();
    REQUIRE(result.isError());
    REQUIRE(result.error().find("chatty") != std::string::npos);
    REQUIRE(logger.getLevel() == core::LogLevel::Warning);
  }

  logger.setLevel(previous);
}
