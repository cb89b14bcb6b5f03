/**
 * @file AnnotatorConfig.hpp
 * @brief Annotator configuration data structures
 */

#pragma once

#include <string>

namespace gcode_annotator {
namespace config {

/**
 * Logging configuration
 */
struct LoggingConfig {
    std::string level = "info";
    std::string file = "logs/annotator.log";
    int max_size_mb = 10;
    int max_files = 5;
    bool file_enabled = true;
};

/**
 * Engine and profile settings
 */
struct EngineConfig {
    std::string profiles_dir = "profiles";
    std::string default_profile = "default";
    int batch_size = 256;   // lines per progress callback
};

/**
 * Complete annotator configuration
 */
struct AnnotatorConfig {
    EngineConfig engine;
    LoggingConfig logging;
};

} // namespace config
} // namespace gcode_annotator
