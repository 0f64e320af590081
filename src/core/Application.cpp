/**
 * Application.cpp
 *
 * Implementation of the core Application class.
 */

#include "Application.hpp"
#include "Logger.hpp"
#include "Config.hpp"
#include "records/HttpChangeFeed.hpp"
#include "records/HttpRecordStore.hpp"
#include "sources/HuggingFaceDriver.hpp"
#include "sources/LocalPathDriver.hpp"
#include "sources/ModelScopeDriver.hpp"
#include "sources/OllamaDriver.hpp"
#include "../utils/FileUtils.hpp"
#include "../utils/HttpClient.hpp"

#include <chrono>
#include <thread>

namespace modeld::core {

const char* toString(AppState state) {
    switch (state) {
        case AppState::Uninitialized: return "uninitialized";
        case AppState::Initializing:  return "initializing";
        case AppState::Running:       return "running";
        case AppState::ShuttingDown:  return "shutting down";
        case AppState::Error:         return "error";
    }
    return "unknown";
}

Application::Application() {
    Logger::instance().debug("Application instance created");
}

Application::~Application() {
    if (m_state != AppState::Uninitialized && m_state != AppState::ShuttingDown) {
        shutdown();
    }
    Logger::instance().debug("Application instance destroyed");
}

bool Application::initialize() {
    if (m_state != AppState::Uninitialized) {
        Logger::instance().warn("Application already initialized");
        return false;
    }

    setState(AppState::Initializing);
    Logger::instance().info("Initializing {}...", getName());

    auto startTime = std::chrono::steady_clock::now();

    utils::CurlGlobalInit::init();

    if (!initializeRecords()) {
        Logger::instance().error("Failed to initialize record clients");
        setState(AppState::Error);
        return false;
    }

    if (!initializeDrivers()) {
        Logger::instance().error("Failed to initialize source drivers");
        setState(AppState::Error);
        return false;
    }

    if (!initializeScheduler()) {
        Logger::instance().error("Failed to initialize download scheduler");
        setState(AppState::Error);
        return false;
    }

    if (!initializeWatcher()) {
        Logger::instance().error("Failed to initialize change watcher");
        setState(AppState::Error);
        return false;
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime);
    Logger::instance().info("Application initialized in {}ms", duration.count());
    return true;
}

void Application::run() {
    if (!m_watcher) {
        Logger::instance().error("Cannot run: application not initialized");
        return;
    }

    setState(AppState::Running);
    m_watcher->start();

    while (!m_shutdownRequested.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    Logger::instance().info("Shutdown requested");
}

void Application::requestShutdown() {
    m_shutdownRequested.store(true);
}

void Application::shutdown() {
    if (m_state == AppState::ShuttingDown || m_state == AppState::Uninitialized) {
        return;
    }

    setState(AppState::ShuttingDown);
    Logger::instance().info("Shutting down application...");

    // Reverse construction order
    if (m_watcher) {
        m_watcher->stop();
        m_watcher.reset();
    }
    if (m_scheduler) {
        m_scheduler->shutdown();
        m_scheduler.reset();
    }
    m_changeFeed.reset();
    m_recordStore.reset();

    utils::CurlGlobalInit::cleanup();

    Logger::instance().info("Application shutdown complete");
    setState(AppState::Uninitialized);
}

void Application::onStateChange(std::function<void(AppState)> callback) {
    std::lock_guard<std::mutex> lock(m_callbackMutex);
    m_stateCallbacks.push_back(std::move(callback));
}

void Application::setState(AppState state) {
    m_state = state;

    std::lock_guard<std::mutex> lock(m_callbackMutex);
    for (const auto& callback : m_stateCallbacks) {
        try {
            callback(state);
        } catch (const std::exception& e) {
            Logger::instance().error("State callback error: {}", e.what());
        }
    }
}

bool Application::initializeRecords() {
    try {
        auto& config = Config::instance();
        auto serverUrl = config.get<std::string>("server.url", "http://127.0.0.1:80");
        auto token = config.get<std::string>("server.token", "");
        auto timeoutMs = config.get<int>("server.timeout", 30000);

        m_recordStore = std::make_unique<records::HttpRecordStore>(serverUrl, token, timeoutMs);
        m_changeFeed = std::make_unique<records::HttpChangeFeed>(serverUrl, token);

        Logger::instance().info("Record server: {}", serverUrl);
        return true;
    } catch (const std::exception& e) {
        Logger::instance().error("Record client initialization error: {}", e.what());
        return false;
    }
}

bool Application::initializeDrivers() {
    try {
        auto& config = Config::instance();

        m_drivers.add(std::make_shared<sources::HuggingFaceDriver>(
            config.get<std::string>("sources.huggingface.endpoint", "https://huggingface.co"),
            config.get<std::string>("sources.huggingface.token", "")));
        m_drivers.add(std::make_shared<sources::ModelScopeDriver>(
            config.get<std::string>("sources.modelscope.endpoint", "https://modelscope.cn")));
        m_drivers.add(std::make_shared<sources::OllamaDriver>(
            config.get<std::string>("sources.ollama.registry", "https://registry.ollama.ai")));
        m_drivers.add(std::make_shared<sources::LocalPathDriver>());

        Logger::instance().debug("Registered {} source drivers", m_drivers.size());
        return true;
    } catch (const std::exception& e) {
        Logger::instance().error("Driver initialization error: {}", e.what());
        return false;
    }
}

bool Application::initializeScheduler() {
    try {
        auto options = downloader::DownloadOptions::fromConfig();

        std::error_code ec;
        if (!utils::FileUtils::createDirectories(options.cacheDir, ec)) {
            Logger::instance().error("Cannot create cache directory {}: {}", options.cacheDir, ec.message());
            return false;
        }

        m_scheduler = std::make_unique<downloader::DownloadScheduler>(*m_recordStore, m_drivers, options);
        return true;
    } catch (const std::exception& e) {
        Logger::instance().error("Scheduler initialization error: {}", e.what());
        return false;
    }
}

bool Application::initializeWatcher() {
    try {
        auto& config = Config::instance();
        auto workerId = config.get<int64_t>("worker.id", 0);
        auto retryDelay = std::chrono::milliseconds(config.get<int>("watch.retryDelay", 5000));

        m_watcher = std::make_unique<downloader::ChangeWatcher>(*m_changeFeed, *m_scheduler, workerId, retryDelay);
        Logger::instance().info("Worker id: {}", workerId);
        return true;
    } catch (const std::exception& e) {
        Logger::instance().error("Watcher initialization error: {}", e.what());
        return false;
    }
}

} // namespace modeld::core
