/**
 * @file ConfigManager.cpp
 * @brief Configuration manager implementation
 */

#include "ConfigManager.hpp"
#include "../logging/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <filesystem>

namespace gcode_annotator {
namespace config {

namespace fs = std::filesystem;

ConfigManager& ConfigManager::instance() {
    static ConfigManager instance;
    return instance;
}

bool ConfigManager::loadConfig(const std::string& filepath) {
    std::lock_guard<std::mutex> lock(m_mutex);

    try {
        if (!fs::exists(filepath)) {
            LOG_ERROR("Config file not found: {}", filepath);
            return false;
        }

        LOG_INFO("Loading config from: {}", filepath);

        YAML::Node root = YAML::LoadFile(filepath);
        AnnotatorConfig loaded;

        // Engine settings
        if (root["annotator"]) {
            auto annotator = root["annotator"];
            loaded.engine.profiles_dir = annotator["profiles_dir"].as<std::string>("profiles");
            loaded.engine.default_profile = annotator["default_profile"].as<std::string>("default");
            loaded.engine.batch_size = annotator["batch_size"].as<int>(256);
        }

        // Logging settings
        if (root["logging"]) {
            auto logging = root["logging"];
            loaded.logging.level = logging["level"].as<std::string>("info");
            loaded.logging.file = logging["file"].as<std::string>("logs/annotator.log");
            loaded.logging.max_size_mb = logging["max_size_mb"].as<int>(10);
            loaded.logging.max_files = logging["max_files"].as<int>(5);
            loaded.logging.file_enabled = logging["file_enabled"].as<bool>(true);
        }

        if (loaded.engine.batch_size <= 0) {
            LOG_WARN("Invalid batch_size {}, using 256", loaded.engine.batch_size);
            loaded.engine.batch_size = 256;
        }

        m_config = loaded;
        m_loaded = true;

        LOG_INFO("Config loaded: profiles_dir={}, default_profile={}",
                 m_config.engine.profiles_dir, m_config.engine.default_profile);
        return true;

    } catch (const YAML::Exception& e) {
        LOG_ERROR("YAML parse error in config: {}", e.what());
        return false;
    } catch (const std::exception& e) {
        LOG_ERROR("Error loading config: {}", e.what());
        return false;
    }
}

bool ConfigManager::saveConfig(const std::string& filepath) const {
    std::lock_guard<std::mutex> lock(m_mutex);

    try {
        YAML::Emitter out;
        out << YAML::BeginMap;

        out << YAML::Key << "annotator" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "profiles_dir" << YAML::Value << m_config.engine.profiles_dir;
        out << YAML::Key << "default_profile" << YAML::Value << m_config.engine.default_profile;
        out << YAML::Key << "batch_size" << YAML::Value << m_config.engine.batch_size;
        out << YAML::EndMap;

        out << YAML::Key << "logging" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "level" << YAML::Value << m_config.logging.level;
        out << YAML::Key << "file" << YAML::Value << m_config.logging.file;
        out << YAML::Key << "max_size_mb" << YAML::Value << m_config.logging.max_size_mb;
        out << YAML::Key << "max_files" << YAML::Value << m_config.logging.max_files;
        out << YAML::Key << "file_enabled" << YAML::Value << m_config.logging.file_enabled;
        out << YAML::EndMap;

        out << YAML::EndMap;

        std::ofstream file(filepath);
        if (!file.is_open()) {
            LOG_ERROR("Cannot open config file for writing: {}", filepath);
            return false;
        }
        file << out.c_str();

        LOG_INFO("Config saved to: {}", filepath);
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("Error saving config: {}", e.what());
        return false;
    }
}

void ConfigManager::resetToDefaults() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_config = AnnotatorConfig{};
    m_loaded = false;
}

AnnotatorConfig ConfigManager::config() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_config;
}

} // namespace config
} // namespace gcode_annotator
