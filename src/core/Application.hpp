#pragma once

/**
 * Application.hpp
 *
 * Core application class that manages the lifecycle of the daemon.
 * Builds the record clients, source drivers, download scheduler and
 * change watcher from the configuration and tears them down in order.
 */

#include "downloader/ChangeWatcher.hpp"
#include "downloader/DownloadScheduler.hpp"
#include "records/ChangeFeed.hpp"
#include "records/RecordStore.hpp"
#include "sources/SourceDriver.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace modeld::core {

/**
 * Application state enum
 */
enum class AppState {
    Uninitialized,
    Initializing,
    Running,
    ShuttingDown,
    Error
};

const char* toString(AppState state);

/**
 * Main application class
 *
 * Startup: record store + feed -> drivers -> scheduler -> watcher.
 * Shutdown runs the other way round: the watcher stops first so no new
 * work arrives while the scheduler drains.
 */
class Application {
public:
    Application();
    ~Application();

    // Disable copy and move
    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;
    Application(Application&&) = delete;
    Application& operator=(Application&&) = delete;

    /**
     * Initialize all subsystems from Config
     * @return true if initialization successful
     */
    bool initialize();

    /**
     * Start watching and block until requestShutdown() is called
     */
    void run();

    /**
     * Ask run() to return. Only stores a lock-free flag, so it may be
     * called from a signal handler.
     */
    void requestShutdown();

    /**
     * Shutdown the application gracefully
     */
    void shutdown();

    AppState getState() const { return m_state.load(); }
    bool isRunning() const { return m_state.load() == AppState::Running; }

    downloader::DownloadScheduler* getScheduler() const { return m_scheduler.get(); }

    /**
     * Register state change callback
     * @param callback Function to call on state change
     */
    void onStateChange(std::function<void(AppState)> callback);

    static std::string getVersion() { return "1.0.0"; }
    static std::string getName() { return "modeld"; }

private:
    void setState(AppState state);

    bool initializeRecords();
    bool initializeDrivers();
    bool initializeScheduler();
    bool initializeWatcher();

private:
    std::atomic<AppState> m_state{AppState::Uninitialized};

    std::vector<std::function<void(AppState)>> m_stateCallbacks;
    std::mutex m_callbackMutex;

    std::atomic<bool> m_shutdownRequested{false};

    // Subsystems, declared in construction order
    std::unique_ptr<records::RecordStore> m_recordStore;
    std::unique_ptr<records::ChangeFeed> m_changeFeed;
    sources::DriverRegistry m_drivers;
    std::unique_ptr<downloader::DownloadScheduler> m_scheduler;
    std::unique_ptr<downloader::ChangeWatcher> m_watcher;
};

} // namespace modeld::core
