/**
 * @file main.cpp
 * @brief gcode_annotate - prints a G-code file with per-line annotations
 *
 * Usage: gcode_annotate <file> [--profile NAME] [--config PATH] [--profiles DIR]
 */

#include <iostream>
#include <fstream>
#include <sstream>
#include <csignal>
#include <atomic>
#include <string>

#include "gcode_annotator/annotator.hpp"

using namespace gcode_annotator;
using namespace gcode_annotator::config;

// Set by SIGINT/SIGTERM; polled by the annotation pass between lines
std::atomic<bool> g_cancel{false};

void signalHandler(int) {
    g_cancel = true;
}

namespace {

void printUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0
              << " <file> [--profile NAME] [--config PATH] [--profiles DIR]" << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    std::string input_path;
    std::string config_path = "config/annotator.yaml";
    std::string profile_override;
    std::string profiles_override;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "--profile" || arg == "--config" || arg == "--profiles") && i + 1 < argc) {
            std::string value = argv[++i];
            if (arg == "--profile") profile_override = value;
            else if (arg == "--config") config_path = value;
            else profiles_override = value;
        } else if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (input_path.empty() && arg[0] != '-') {
            input_path = arg;
        } else {
            printUsage(argv[0]);
            return 2;
        }
    }

    if (input_path.empty()) {
        printUsage(argv[0]);
        return 2;
    }

    // Console logging until the config says otherwise
    Logger::init("", "warn");

    auto& configManager = ConfigManager::instance();
    if (!configManager.loadConfig(config_path)) {
        LOG_WARN("Using default configuration");
    }
    AnnotatorConfig cfg = configManager.config();

    if (cfg.logging.file_enabled) {
        Logger::init(cfg.logging.file, cfg.logging.level,
                     static_cast<size_t>(cfg.logging.max_size_mb) * 1024 * 1024,
                     static_cast<size_t>(cfg.logging.max_files));
    } else {
        Logger::setLevel(cfg.logging.level);
    }

    std::string profiles_dir = profiles_override.empty() ? cfg.engine.profiles_dir : profiles_override;
    std::string profile = profile_override.empty() ? cfg.engine.default_profile : profile_override;

    dictionary::ProfileStore store;
    if (!store.loadFromDirectory(profiles_dir)) {
        LOG_WARN("No profiles loaded from {}; every word will be annotated as unknown", profiles_dir);
    }
    if (!store.hasProfile(profile)) {
        LOG_WARN("Profile '{}' not found", profile);
    }

    std::ifstream in(input_path);
    if (!in.is_open()) {
        LOG_ERROR("Cannot open input file: {}", input_path);
        return 1;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    engine::AnnotationEngine annotator;
    annotator.setActiveDictionary(store.lookupEntries(profile));

    engine::AnnotationOptions options;
    options.cancel = &g_cancel;
    options.batchSize = static_cast<size_t>(cfg.engine.batch_size);
    options.onBatch = [](const std::vector<engine::LineAnnotation>& batch, size_t, size_t) {
        for (const auto& line : batch) {
            std::cout << line.lineNumber << ": " << engine::AnnotationEngine::formatLine(line) << "\n";
            for (auto warning : line.warnings) {
                std::cout << "    ! " << tokenizer::lineWarningToString(warning) << "\n";
            }
        }
        std::cout.flush();
    };

    auto document = annotator.annotateDocument(buffer.str(), options);
    if (!document) {
        LOG_WARN("Interrupted");
        return 130;
    }

    LOG_INFO("Annotated {} lines of {} with profile '{}'", document->size(), input_path, profile);
    return 0;
}
