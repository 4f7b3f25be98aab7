/**
 * @file config_manager.cpp
 * @brief Configuration Manager implementation
 */

#include "Plotline/editor/config_manager.hpp"
#include "Plotline/core/logger.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace Plotline::editor {

// Minimal JSON helpers; keys are looked up by exact quoted name inside the
// object text they are given.
namespace json {

inline std::string extractString(const std::string &json, const std::string &key) {
  auto keyPos = json.find("\"" + key + "\"");
  if (keyPos == std::string::npos)
    return "";

  auto colonPos = json.find(':', keyPos);
  if (colonPos == std::string::npos)
    return "";

  auto valueStart = json.find('"', colonPos);
  if (valueStart == std::string::npos)
    return "";

  auto valueEnd = json.find('"', valueStart + 1);
  if (valueEnd == std::string::npos)
    return "";

  return json.substr(valueStart + 1, valueEnd - valueStart - 1);
}

inline std::string extractRawValue(const std::string &json, const std::string &key) {
  auto keyPos = json.find("\"" + key + "\"");
  if (keyPos == std::string::npos)
    return "";

  auto colonPos = json.find(':', keyPos);
  if (colonPos == std::string::npos)
    return "";

  auto valueStart = json.find_first_not_of(" \t\n\r", colonPos + 1);
  if (valueStart == std::string::npos)
    return "";

  return json.substr(valueStart);
}

inline f64 extractDouble(const std::string &json, const std::string &key, f64 defaultVal) {
  std::string raw = extractRawValue(json, key);
  if (raw.empty())
    return defaultVal;

  try {
    return std::stod(raw);
  } catch (const std::invalid_argument &) {
    return defaultVal;
  } catch (const std::out_of_range &) {
    return defaultVal;
  }
}

inline i32 extractInt(const std::string &json, const std::string &key, i32 defaultVal) {
  std::string raw = extractRawValue(json, key);
  if (raw.empty())
    return defaultVal;

  try {
    return std::stoi(raw);
  } catch (const std::invalid_argument &) {
    return defaultVal;
  } catch (const std::out_of_range &) {
    return defaultVal;
  }
}

inline i64 extractInt64(const std::string &json, const std::string &key, i64 defaultVal) {
  std::string raw = extractRawValue(json, key);
  if (raw.empty())
    return defaultVal;

  try {
    return std::stoll(raw);
  } catch (const std::invalid_argument &) {
    return defaultVal;
  } catch (const std::out_of_range &) {
    return defaultVal;
  }
}

inline bool extractBool(const std::string &json, const std::string &key, bool defaultVal) {
  std::string raw = extractRawValue(json, key);
  if (raw.rfind("true", 0) == 0)
    return true;
  if (raw.rfind("false", 0) == 0)
    return false;
  return defaultVal;
}

inline std::string extractObject(const std::string &json, const std::string &key) {
  auto keyPos = json.find("\"" + key + "\"");
  if (keyPos == std::string::npos)
    return "";

  auto braceStart = json.find('{', keyPos);
  if (braceStart == std::string::npos)
    return "";

  int depth = 1;
  size_t pos = braceStart + 1;
  while (pos < json.size() && depth > 0) {
    if (json[pos] == '{')
      depth++;
    else if (json[pos] == '}')
      depth--;
    pos++;
  }

  return json.substr(braceStart, pos - braceStart);
}

inline const char *boolString(bool value) { return value ? "true" : "false"; }

} // namespace json

ConfigManager::ConfigManager() = default;
ConfigManager::~ConfigManager() = default;

Result<void> ConfigManager::initialize(const std::string &basePath) {
  m_basePath = basePath;

  if (!m_basePath.empty() && m_basePath.back() != '/' && m_basePath.back() != '\\') {
    m_basePath += '/';
  }

  auto dirResult = ensureDirectories();
  if (dirResult.isError()) {
    return dirResult;
  }

  m_initialized = true;
  return Result<void>::ok();
}

Result<void> ConfigManager::loadConfig() {
  if (!m_initialized) {
    return Result<void>::error("ConfigManager not initialized");
  }

  m_config = EditorConfig();
  m_baseConfig = EditorConfig();

  std::string projectConfigPath = getConfigPath() + PROJECT_CONFIG_FILE;
  auto baseResult = loadFromFile(projectConfigPath);
  if (baseResult.isError()) {
    PLOTLINE_LOG_WARN(std::string("Could not load ") + PROJECT_CONFIG_FILE + ": " +
                      baseResult.error() + " - using defaults");
  } else {
    m_baseConfig = m_config;
  }

  std::string userConfigPath = getConfigPath() + USER_CONFIG_FILE;
  auto userResult = loadFromFile(userConfigPath);
  if (userResult.isError()) {
    PLOTLINE_LOG_INFO("No user config found, using project config");
  }

  PLOTLINE_LOG_INFO("Configuration loaded successfully");
  notifyConfigChanged();
  return Result<void>::ok();
}

Result<void> ConfigManager::saveUserConfig() {
  if (!m_initialized) {
    return Result<void>::error("ConfigManager not initialized");
  }

  std::string userConfigPath = getConfigPath() + USER_CONFIG_FILE;
  std::string content = serializeToJson(m_config, true);

  try {
    fs::create_directories(getConfigPath());

    std::string tempPath = userConfigPath + ".tmp";
    {
      std::ofstream file(tempPath);
      if (!file.is_open()) {
        return Result<void>::error("Cannot open file for writing: " + userConfigPath);
      }
      file << content;
    }

    fs::rename(tempPath, userConfigPath);

    PLOTLINE_LOG_INFO("User configuration saved to " + userConfigPath);
    return Result<void>::ok();

  } catch (const std::exception &e) {
    return Result<void>::error(std::string("Failed to save config: ") + e.what());
  }
}

void ConfigManager::resetToDefaults() {
  m_config = EditorConfig();
  notifyConfigChanged();
}

void ConfigManager::resetUserSettings() {
  m_config = m_baseConfig;
  notifyConfigChanged();
}

void ConfigManager::setOnConfigChanged(ConfigChangeCallback callback) {
  m_onConfigChanged = std::move(callback);
}

void ConfigManager::notifyConfigChanged() {
  if (m_onConfigChanged) {
    m_onConfigChanged(m_config);
  }
}

Result<void> ConfigManager::applyLoggingSettings() const {
  auto level = core::logLevelFromString(m_config.logging.logLevel);
  if (!level) {
    return Result<void>::error("Unknown log level: " + m_config.logging.logLevel);
  }

  auto &logger = core::Logger::instance();
  logger.setLevel(*level);

  if (m_config.logging.logToFile && m_initialized) {
    logger.setOutputFile(getLogsPath() + m_config.logging.logFileName);
  } else {
    logger.closeOutputFile();
  }
  return Result<void>::ok();
}

Result<void> ConfigManager::ensureDirectories() {
  try {
    fs::create_directories(getConfigPath());
    fs::create_directories(getLogsPath());
    return Result<void>::ok();
  } catch (const std::exception &e) {
    return Result<void>::error(std::string("Failed to create directories: ") + e.what());
  }
}

std::string ConfigManager::getConfigPath() const { return m_basePath + "config/"; }

std::string ConfigManager::getLogsPath() const {
  return m_basePath + m_config.logging.logDirectory + "/";
}

// Convenience setters
void ConfigManager::setLayoutStrategy(layout::LayoutStrategy strategy) {
  m_config.layout.strategy = strategy;
  notifyConfigChanged();
}

void ConfigManager::setBranchClustering(bool enabled) {
  m_config.layout.branchClustering = enabled;
  notifyConfigChanged();
}

void ConfigManager::setSnapRadius(f64 radius) {
  m_config.edgeCreation.snapRadius = std::max(radius, 0.0);
  notifyConfigChanged();
}

void ConfigManager::setSelectionThreshold(f64 threshold) {
  m_config.selection.threshold = std::max(threshold, 0.0);
  notifyConfigChanged();
}

void ConfigManager::setDefaultEdgeAttributes(const graph::EdgeAttributes &attributes) {
  m_config.edgeCreation.defaults = attributes;
  notifyConfigChanged();
}

void ConfigManager::setLogLevel(const std::string &level) {
  m_config.logging.logLevel = level;
  notifyConfigChanged();
}

Result<void> ConfigManager::loadFromFile(const std::string &path) {
  if (!fs::exists(path)) {
    return Result<void>::error("File not found: " + path);
  }

  try {
    std::ifstream file(path);
    if (!file.is_open()) {
      return Result<void>::error("Cannot open file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parseJson(buffer.str(), m_config);

  } catch (const std::exception &e) {
    return Result<void>::error(std::string("Failed to read file: ") + e.what());
  }
}

Result<void> ConfigManager::parseJson(const std::string &jsonStr, EditorConfig &config) {
  std::string version = json::extractString(jsonStr, "version");
  if (!version.empty()) {
    config.version = version;
  }

  // Layout
  std::string layoutObj = json::extractObject(jsonStr, "layout");
  if (!layoutObj.empty()) {
    auto &layoutCfg = config.layout;

    std::string strategy = json::extractString(layoutObj, "strategy");
    if (!strategy.empty()) {
      if (auto parsed = layout::parseLayoutStrategy(strategy)) {
        layoutCfg.strategy = *parsed;
      } else {
        PLOTLINE_LOG_WARN("Unknown layout strategy '" + strategy + "', keeping " +
                          layout::toString(layoutCfg.strategy));
      }
    }
    layoutCfg.branchClustering =
        json::extractBool(layoutObj, "branch_clustering", layoutCfg.branchClustering);
    layoutCfg.animate = json::extractBool(layoutObj, "animate", layoutCfg.animate);

    std::string hierObj = json::extractObject(layoutObj, "hierarchical_params");
    if (!hierObj.empty()) {
      auto &h = layoutCfg.hierarchical;
      h.nodesPerLevel = std::max(json::extractInt(hierObj, "nodes_per_level", h.nodesPerLevel), 1);
      h.levelWidth = json::extractDouble(hierObj, "level_width", h.levelWidth);
      h.levelHeight = json::extractDouble(hierObj, "level_height", h.levelHeight);
      h.levelSkew = json::extractDouble(hierObj, "level_skew", h.levelSkew);
      h.groupGapLevels = json::extractDouble(hierObj, "group_gap_levels", h.groupGapLevels);
    }

    std::string forceObj = json::extractObject(layoutObj, "force_params");
    if (!forceObj.empty()) {
      auto &f = layoutCfg.force;
      f.iterations = std::max(json::extractInt(forceObj, "iterations", f.iterations), 0);
      f.repulsion = json::extractDouble(forceObj, "repulsion", f.repulsion);
      f.springLength = json::extractDouble(forceObj, "spring_length", f.springLength);
      f.springStiffness = json::extractDouble(forceObj, "spring_stiffness", f.springStiffness);
      f.damping = json::extractDouble(forceObj, "damping", f.damping);
      f.minDistance = json::extractDouble(forceObj, "min_distance", f.minDistance);
      f.seedWidth = json::extractDouble(forceObj, "seed_width", f.seedWidth);
      f.seedHeight = json::extractDouble(forceObj, "seed_height", f.seedHeight);

      std::string seeding = json::extractString(forceObj, "origin_seeding");
      if (seeding == "honor_origin") {
        f.originSeeding = layout::OriginSeeding::HonorOrigin;
      } else if (seeding == "treat_origin_as_unset") {
        f.originSeeding = layout::OriginSeeding::TreatOriginAsUnset;
      }

      // -1 clears the seed; anything beyond u32 keeps the previous value
      const i64 seed =
          json::extractInt64(forceObj, "seed", f.seed ? static_cast<i64>(*f.seed) : -1);
      if (seed < 0) {
        f.seed.reset();
      } else if (seed <= static_cast<i64>(std::numeric_limits<u32>::max())) {
        f.seed = static_cast<u32>(seed);
      }
    }

    std::string circObj = json::extractObject(layoutObj, "circular_params");
    if (!circObj.empty()) {
      auto &c = layoutCfg.circular;
      c.center.x = json::extractDouble(circObj, "center_x", c.center.x);
      c.center.y = json::extractDouble(circObj, "center_y", c.center.y);
      c.radius = json::extractDouble(circObj, "radius", c.radius);
      c.clusterBaseRadius = json::extractDouble(circObj, "cluster_base_radius", c.clusterBaseRadius);
      c.clusterRingSpacing =
          json::extractDouble(circObj, "cluster_ring_spacing", c.clusterRingSpacing);
    }

    std::string timeObj = json::extractObject(layoutObj, "timeline_params");
    if (!timeObj.empty()) {
      auto &t = layoutCfg.timeline;
      t.startX = json::extractDouble(timeObj, "start_x", t.startX);
      t.stepX = json::extractDouble(timeObj, "step_x", t.stepX);
      t.baseY = json::extractDouble(timeObj, "base_y", t.baseY);
      t.alternateOffsetY = json::extractDouble(timeObj, "alternate_offset_y", t.alternateOffsetY);
    }
  }

  // Directional selection
  std::string selectionObj = json::extractObject(jsonStr, "selection");
  if (!selectionObj.empty()) {
    config.selection.threshold =
        std::max(json::extractDouble(selectionObj, "threshold", config.selection.threshold), 0.0);
    config.selection.secondaryWeight =
        json::extractDouble(selectionObj, "secondary_weight", config.selection.secondaryWeight);
  }

  // Edge creation
  std::string edgeObj = json::extractObject(jsonStr, "edge_creation");
  if (!edgeObj.empty()) {
    auto &e = config.edgeCreation;
    e.snapRadius = std::max(json::extractDouble(edgeObj, "snap_radius", e.snapRadius), 0.0);

    if (auto type = graph::parseEdgeType(json::extractString(edgeObj, "edge_type"))) {
      e.defaults.type = *type;
    }
    if (auto style = graph::parseLineStyle(json::extractString(edgeObj, "line_style"))) {
      e.defaults.style = *style;
    }
    std::string color = json::extractString(edgeObj, "color");
    if (!color.empty()) {
      e.defaults.color = color;
    }
    e.defaults.weight = json::extractDouble(edgeObj, "weight", e.defaults.weight.value_or(1.0));
  }

  // Branches
  std::string branchObj = json::extractObject(jsonStr, "branches");
  if (!branchObj.empty()) {
    auto &b = config.branches;
    std::string rootId = json::extractString(branchObj, "root_branch_id");
    if (!rootId.empty())
      b.rootBranchId = rootId;

    std::string rootLabel = json::extractString(branchObj, "root_label");
    if (!rootLabel.empty())
      b.rootLabel = rootLabel;

    std::string policy = json::extractString(branchObj, "mutation_policy");
    if (!policy.empty()) {
      if (auto parsed = branch::parseMutationPolicy(policy)) {
        b.mutationPolicy = *parsed;
      } else {
        PLOTLINE_LOG_WARN("Unknown mutation policy '" + policy + "'");
      }
    }
  }

  // Logging
  std::string loggingObj = json::extractObject(jsonStr, "logging");
  if (!loggingObj.empty()) {
    auto &l = config.logging;
    std::string level = json::extractString(loggingObj, "level");
    if (!level.empty())
      l.logLevel = level;

    l.logToFile = json::extractBool(loggingObj, "log_to_file", l.logToFile);

    std::string dir = json::extractString(loggingObj, "directory");
    if (!dir.empty())
      l.logDirectory = dir;

    std::string fileName = json::extractString(loggingObj, "file_name");
    if (!fileName.empty())
      l.logFileName = fileName;
  }

  return Result<void>::ok();
}

std::string ConfigManager::serializeToJson(const EditorConfig &config,
                                           bool userSettingsOnly) const {
  const auto &layoutCfg = config.layout;
  const auto &f = layoutCfg.force;
  const auto &e = config.edgeCreation;

  std::ostringstream out;
  out << std::setprecision(17);
  out << "{\n";
  out << "  \"version\": \"" << config.version << "\",\n";

  out << "  \"layout\": {\n";
  out << "    \"strategy\": \"" << layout::toString(layoutCfg.strategy) << "\",\n";
  out << "    \"branch_clustering\": " << json::boolString(layoutCfg.branchClustering) << ",\n";
  out << "    \"animate\": " << json::boolString(layoutCfg.animate) << ",\n";
  out << "    \"hierarchical_params\": {\n";
  out << "      \"nodes_per_level\": " << layoutCfg.hierarchical.nodesPerLevel << ",\n";
  out << "      \"level_width\": " << layoutCfg.hierarchical.levelWidth << ",\n";
  out << "      \"level_height\": " << layoutCfg.hierarchical.levelHeight << ",\n";
  out << "      \"level_skew\": " << layoutCfg.hierarchical.levelSkew << ",\n";
  out << "      \"group_gap_levels\": " << layoutCfg.hierarchical.groupGapLevels << "\n";
  out << "    },\n";
  out << "    \"force_params\": {\n";
  out << "      \"iterations\": " << f.iterations << ",\n";
  out << "      \"repulsion\": " << f.repulsion << ",\n";
  out << "      \"spring_length\": " << f.springLength << ",\n";
  out << "      \"spring_stiffness\": " << f.springStiffness << ",\n";
  out << "      \"damping\": " << f.damping << ",\n";
  out << "      \"min_distance\": " << f.minDistance << ",\n";
  out << "      \"seed_width\": " << f.seedWidth << ",\n";
  out << "      \"seed_height\": " << f.seedHeight << ",\n";
  out << "      \"origin_seeding\": \""
      << (f.originSeeding == layout::OriginSeeding::HonorOrigin ? "honor_origin"
                                                                : "treat_origin_as_unset")
      << "\",\n";
  out << "      \"seed\": " << (f.seed ? static_cast<i64>(*f.seed) : -1) << "\n";
  out << "    },\n";
  out << "    \"circular_params\": {\n";
  out << "      \"center_x\": " << layoutCfg.circular.center.x << ",\n";
  out << "      \"center_y\": " << layoutCfg.circular.center.y << ",\n";
  out << "      \"radius\": " << layoutCfg.circular.radius << ",\n";
  out << "      \"cluster_base_radius\": " << layoutCfg.circular.clusterBaseRadius << ",\n";
  out << "      \"cluster_ring_spacing\": " << layoutCfg.circular.clusterRingSpacing << "\n";
  out << "    },\n";
  out << "    \"timeline_params\": {\n";
  out << "      \"start_x\": " << layoutCfg.timeline.startX << ",\n";
  out << "      \"step_x\": " << layoutCfg.timeline.stepX << ",\n";
  out << "      \"base_y\": " << layoutCfg.timeline.baseY << ",\n";
  out << "      \"alternate_offset_y\": " << layoutCfg.timeline.alternateOffsetY << "\n";
  out << "    }\n";
  out << "  },\n";

  out << "  \"selection\": {\n";
  out << "    \"threshold\": " << config.selection.threshold << ",\n";
  out << "    \"secondary_weight\": " << config.selection.secondaryWeight << "\n";
  out << "  },\n";

  out << "  \"edge_creation\": {\n";
  out << "    \"snap_radius\": " << e.snapRadius << ",\n";
  out << "    \"edge_type\": \"" << graph::toString(e.defaults.type) << "\",\n";
  out << "    \"line_style\": \"" << graph::toString(e.defaults.style) << "\",\n";
  out << "    \"color\": \"" << e.defaults.color.value_or("") << "\",\n";
  out << "    \"weight\": " << e.defaults.weight.value_or(1.0) << "\n";
  out << "  },\n";

  // Branch identity belongs to the project, not the user
  if (!userSettingsOnly) {
    out << "  \"branches\": {\n";
    out << "    \"root_branch_id\": \"" << config.branches.rootBranchId << "\",\n";
    out << "    \"root_label\": \"" << config.branches.rootLabel << "\",\n";
    out << "    \"mutation_policy\": \"" << branch::toString(config.branches.mutationPolicy)
        << "\"\n";
    out << "  },\n";
  }

  out << "  \"logging\": {\n";
  out << "    \"level\": \"" << config.logging.logLevel << "\",\n";
  out << "    \"log_to_file\": " << json::boolString(config.logging.logToFile) << ",\n";
  out << "    \"directory\": \"" << config.logging.logDirectory << "\",\n";
  out << "    \"file_name\": \"" << config.logging.logFileName << "\"\n";
  out << "  }\n";

  out << "}\n";
  return out.str();
}

} // namespace Plotline::editor
