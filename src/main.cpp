/**
 * modeld - model file download daemon
 *
 * Main entry point for the application.
 * Loads configuration, builds the core application and runs it until
 * SIGINT or SIGTERM arrives.
 *
 * @version 1.0.0
 */

#include <memory>
#include <iostream>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "core/Application.hpp"
#include "core/Logger.hpp"
#include "core/Config.hpp"
#include "utils/PathUtils.hpp"
#include "utils/StringUtils.hpp"

namespace fs = std::filesystem;

// Global application instance for signal handling
std::unique_ptr<modeld::core::Application> g_app;

/**
 * Signal handler for graceful shutdown
 */
void signalHandler(int) {
    if (g_app) {
        g_app->requestShutdown();
    }
}

/**
 * Setup signal handlers for graceful shutdown
 */
void setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    // A closed record-server socket must not kill the daemon
    std::signal(SIGPIPE, SIG_IGN);
}

/**
 * Initialize application directories
 */
bool initializeDirectories() {
    auto& logger = modeld::core::Logger::instance();
    auto& config = modeld::core::Config::instance();
    using modeld::utils::PathUtils;

    try {
        std::vector<fs::path> directories = {
            PathUtils::getDataPath(),
            PathUtils::orDefault(config.get<std::string>("paths.cacheDir", ""), PathUtils::getCachePath()),
            PathUtils::orDefault(config.get<std::string>("paths.logDir", ""), PathUtils::getLogsPath())
        };

        for (const auto& dir : directories) {
            if (!fs::exists(dir)) {
                fs::create_directories(dir);
                logger.debug("Created directory: {}", dir.string());
            }
        }

        return true;
    } catch (const std::exception& e) {
        logger.error("Failed to initialize directories: {}", e.what());
        return false;
    }
}

/**
 * Load and apply configuration
 * @param path Explicit config file, or empty for the default location
 */
bool loadConfiguration(const std::string& path) {
    auto& logger = modeld::core::Logger::instance();
    auto& config = modeld::core::Config::instance();

    try {
        fs::path configPath = path.empty() ? modeld::utils::PathUtils::getConfigPath() : fs::path(path);

        if (fs::exists(configPath)) {
            if (!config.load(configPath.string())) {
                logger.error("Cannot parse configuration {}", configPath.string());
                return false;
            }
            logger.info("Configuration loaded from {}", configPath.string());
        } else {
            config.setDefaults();
            if (!config.save(configPath.string())) {
                logger.warn("Cannot write default configuration to {}", configPath.string());
            } else {
                logger.info("Default configuration created at {}", configPath.string());
            }
        }

        return true;
    } catch (const std::exception& e) {
        logger.error("Failed to load configuration: {}", e.what());
        return false;
    }
}

void printUsage(const char* program) {
    std::cout << "modeld - model file download daemon\n"
              << "\nUsage: " << program << " [options]\n"
              << "\nOptions:\n"
              << "  -c, --config <path>    Configuration file (default: "
              << modeld::utils::PathUtils::getConfigPath().string() << ")\n"
              << "  -w, --worker-id <id>   Worker id to serve (overrides worker.id)\n"
              << "  -d, --debug            Enable debug logging\n"
              << "  -h, --help             Show this help message\n"
              << "  -v, --version          Show version information\n"
              << std::endl;
}

/**
 * Main application entry point
 */
int main(int argc, char* argv[]) {
    using modeld::core::Application;
    using modeld::core::LogLevel;

    // Parse command line arguments
    bool debugMode = false;
    std::string configPath;
    std::optional<int64_t> workerId;

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == "--debug" || arg == "-d") {
            debugMode = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 >= argc) {
                std::cerr << arg << " requires a path" << std::endl;
                return 2;
            }
            configPath = argv[++i];
        } else if (arg == "--worker-id" || arg == "-w") {
            if (i + 1 >= argc) {
                std::cerr << arg << " requires a number" << std::endl;
                return 2;
            }
            std::string value(argv[++i]);
            int64_t parsed = modeld::utils::StringUtils::parseLong(value, -1);
            if (parsed < 0) {
                std::cerr << "Invalid worker id: " << value << std::endl;
                return 2;
            }
            workerId = parsed;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--version" || arg == "-v") {
            std::cout << Application::getName() << " v" << Application::getVersion() << std::endl;
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            printUsage(argv[0]);
            return 2;
        }
    }

    auto level = debugMode ? LogLevel::Debug : LogLevel::Info;

    // Initialize logger
    modeld::core::Logger::instance().initialize(level, modeld::utils::PathUtils::getLogsPath().string());

    auto& logger = modeld::core::Logger::instance();
    logger.info("{} v{} starting...", Application::getName(), Application::getVersion());

    // Load configuration
    if (!loadConfiguration(configPath)) {
        logger.critical("Failed to load configuration");
        return 1;
    }

    auto& config = modeld::core::Config::instance();
    if (workerId) {
        config.set("worker.id", *workerId);
    }

    // Initialize directories
    if (!initializeDirectories()) {
        logger.critical("Failed to initialize application directories");
        return 1;
    }

    // Reopen the log file where the configuration wants it
    auto logDir = config.get<std::string>("paths.logDir", "");
    if (!logDir.empty()) {
        logger.initialize(level, logDir);
    }

    // Initialize application
    try {
        g_app = std::make_unique<Application>();

        if (!g_app->initialize()) {
            logger.critical("Failed to initialize application");
            return 1;
        }

        setupSignalHandlers();
        logger.info("Application initialized successfully");

        g_app->run();

        // Cleanup
        g_app->shutdown();
        g_app.reset();

        logger.info("{} shutdown complete", Application::getName());
        return 0;

    } catch (const std::exception& e) {
        logger.critical("Unhandled exception: {}", e.what());
        return 1;
    }
}
