/**
 * @file ConfigManager.hpp
 * @brief Configuration manager - loads and provides access to configuration
 */

#pragma once

#include <string>
#include <mutex>
#include "AnnotatorConfig.hpp"

namespace gcode_annotator {
namespace config {

/**
 * Configuration Manager (Singleton)
 *
 * Holds defaults until loadConfig() succeeds. Thread-safe for reading
 * after initialization.
 */
class ConfigManager {
public:
    /**
     * Get singleton instance
     */
    static ConfigManager& instance();

    // Delete copy/move
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;
    ConfigManager(ConfigManager&&) = delete;
    ConfigManager& operator=(ConfigManager&&) = delete;

    /**
     * Load configuration from YAML file
     * @param filepath Path to annotator.yaml
     * @return true if loaded successfully; on failure defaults are kept
     */
    bool loadConfig(const std::string& filepath);

    /**
     * Save configuration to YAML file
     */
    bool saveConfig(const std::string& filepath) const;

    /**
     * Restore built-in defaults
     */
    void resetToDefaults();

    /**
     * Get configuration (copy, safe against concurrent reloads)
     */
    AnnotatorConfig config() const;

    /**
     * Check if a configuration file has been loaded
     */
    bool isLoaded() const { return m_loaded; }

private:
    ConfigManager() = default;
    ~ConfigManager() = default;

    AnnotatorConfig m_config;
    bool m_loaded = false;
    mutable std::mutex m_mutex;
};

} // namespace config
} // namespace gcode_annotator
