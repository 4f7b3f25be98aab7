#pragma once

/**
 * @file config_manager.hpp
 * @brief Configuration Manager - Load/Save editor configuration
 *
 * Handles:
 * - Loading plotline_config.json (project configuration)
 * - Loading/Saving plotline_user.json (user overrides)
 * - Merging configurations with proper precedence
 * - Applying the logging section to the Logger
 */

#include "Plotline/core/result.hpp"
#include "Plotline/core/types.hpp"
#include "Plotline/editor/editor_config.hpp"

#include <functional>
#include <string>

namespace Plotline::editor {

/**
 * @brief Callback for configuration changes
 */
using ConfigChangeCallback = std::function<void(const EditorConfig &)>;

/**
 * @brief Configuration Manager
 *
 * Implements a layered configuration system:
 * 1. Defaults (built-in)
 * 2. config/plotline_config.json (project, read-only)
 * 3. config/plotline_user.json (user overrides, read-write)
 *
 * Missing files are not errors; the previous layer stays in effect.
 */
class ConfigManager {
public:
  static constexpr const char *PROJECT_CONFIG_FILE = "plotline_config.json";
  static constexpr const char *USER_CONFIG_FILE = "plotline_user.json";

  ConfigManager();
  ~ConfigManager();

  ConfigManager(const ConfigManager &) = delete;
  ConfigManager &operator=(const ConfigManager &) = delete;

  /**
   * @brief Initialize with a base directory
   * @param basePath Project root (where config/ is located)
   * @return Success or error message
   */
  Result<void> initialize(const std::string &basePath);

  /**
   * @brief Load configuration: defaults, then project file, then user file
   * @return Success or error message
   */
  Result<void> loadConfig();

  /**
   * @brief Save user-adjustable settings to plotline_user.json
   *
   * Written to a temporary file first and renamed into place.
   */
  Result<void> saveUserConfig();

  [[nodiscard]] const EditorConfig &getConfig() const { return m_config; }
  EditorConfig &getConfigMutable() { return m_config; }

  /**
   * @brief Reset configuration to built-in defaults
   */
  void resetToDefaults();

  /**
   * @brief Drop user overrides, keeping the project configuration
   */
  void resetUserSettings();

  void setOnConfigChanged(ConfigChangeCallback callback);
  void notifyConfigChanged();

  /**
   * @brief Push the logging section into the Logger
   * @return Error if the level name is not recognized (level left unchanged)
   */
  Result<void> applyLoggingSettings() const;

  // =========================================================================
  // Directory Management
  // =========================================================================

  /**
   * @brief Ensure config/ and the log directory exist
   */
  Result<void> ensureDirectories();

  [[nodiscard]] const std::string &getBasePath() const { return m_basePath; }
  [[nodiscard]] std::string getConfigPath() const;
  [[nodiscard]] std::string getLogsPath() const;

  // =========================================================================
  // Individual Setting Accessors
  // =========================================================================

  void setLayoutStrategy(layout::LayoutStrategy strategy);
  void setBranchClustering(bool enabled);
  void setSnapRadius(f64 radius);
  void setSelectionThreshold(f64 threshold);
  void setDefaultEdgeAttributes(const graph::EdgeAttributes &attributes);
  void setLogLevel(const std::string &level);

private:
  Result<void> loadFromFile(const std::string &path);
  Result<void> parseJson(const std::string &json, EditorConfig &config);
  [[nodiscard]] std::string serializeToJson(const EditorConfig &config,
                                            bool userSettingsOnly) const;

  std::string m_basePath;
  EditorConfig m_config;
  EditorConfig m_baseConfig; // Project configuration without user overrides
  ConfigChangeCallback m_onConfigChanged;
  bool m_initialized = false;
};

} // namespace Plotline::editor
