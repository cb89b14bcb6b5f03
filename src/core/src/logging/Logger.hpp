/**
 * @file Logger.hpp
 * @brief Logging wrapper around spdlog for the annotation engine
 */

#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>
#include <string>

namespace gcode_annotator {

class Logger {
public:
    /**
     * Initialize the logging system
     * @param log_file Path to log file (empty = console only)
     * @param level Log level (trace, debug, info, warn, error, off)
     * @param max_size Maximum file size in bytes (default 10MB)
     * @param max_files Maximum number of rotated files
     */
    static void init(const std::string& log_file = "logs/annotator.log",
                     const std::string& level = "info",
                     size_t max_size = 10 * 1024 * 1024,
                     size_t max_files = 5);

    /**
     * Change the level of an already initialized logger
     */
    static void setLevel(const std::string& level);

    /**
     * Get the logger instance
     */
    static std::shared_ptr<spdlog::logger> get();

private:
    static spdlog::level::level_enum parseLevel(const std::string& level);

    static std::shared_ptr<spdlog::logger> s_logger;
    static bool s_initialized;
};

} // namespace gcode_annotator

// Convenience macros
#define LOG_TRACE(...) ::gcode_annotator::Logger::get()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) ::gcode_annotator::Logger::get()->debug(__VA_ARGS__)
#define LOG_INFO(...)  ::gcode_annotator::Logger::get()->info(__VA_ARGS__)
#define LOG_WARN(...)  ::gcode_annotator::Logger::get()->warn(__VA_ARGS__)
#define LOG_ERROR(...) ::gcode_annotator::Logger::get()->error(__VA_ARGS__)
