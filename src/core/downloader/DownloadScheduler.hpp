#pragma once

/**
 * DownloadScheduler.hpp
 *
 * Owns the active-task table and the bounded execution pool, reconciles
 * create/update/delete events against it, and is the only writer of
 * terminal record state.
 *
 * Features:
 * - At most one execution per work item id
 * - Pool admission bounded by downloads.maxConcurrent
 * - Queued executions cancel without ever starting
 * - Running executions cancel cooperatively, with a grace period after
 *   which cleanup is forced and a worker process is killed
 */

#include "CancellationSignal.hpp"
#include "CleanupCoordinator.hpp"
#include "DownloadWorker.hpp"
#include "Execution.hpp"
#include "WorkItemSink.hpp"
#include "WorkerOutcome.hpp"
#include "../ThreadPool.hpp"
#include "../records/RecordStore.hpp"
#include "../sources/SourceDriver.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace modeld::core::downloader {

enum class IsolationMode {
    Process,    // fork a child per execution
    Thread      // run on the pool thread
};

const char* toString(IsolationMode mode);

struct DownloadOptions {
    size_t maxConcurrent{5};
    std::chrono::milliseconds progressInterval{2000};
    std::chrono::milliseconds cancelGracePeriod{5000};
    IsolationMode isolation{IsolationMode::Process};
    std::string cacheDir;

    /**
     * Snapshot of the downloads.* and paths.cacheDir settings
     */
    static DownloadOptions fromConfig();
};

class DownloadScheduler : public WorkItemSink {
public:
    DownloadScheduler(records::RecordStore& store,
                      const sources::DriverRegistry& drivers,
                      DownloadOptions options,
                      ProgressReporter::Clock clock = {});

    ~DownloadScheduler() override;

    DownloadScheduler(const DownloadScheduler&) = delete;
    DownloadScheduler& operator=(const DownloadScheduler&) = delete;

    void ensureRunning(const WorkItem& item) override;
    void ensureCancelled(const WorkItem& item) override;

    /**
     * Cancel the execution for id, if any. Non-blocking.
     * @return true if an active task was removed
     */
    bool cancel(int64_t id);

    size_t activeCount() const;
    bool hasActiveTask(int64_t id) const;

    /**
     * Executions currently running (not queued)
     */
    size_t runningCount() const { return m_running.load(); }

    /**
     * Highest runningCount() observed since construction
     */
    size_t peakRunning() const { return m_peakRunning.load(); }

    size_t getPoolSize() const;

    /**
     * Block until every queued, running and maintenance job has finished
     */
    void waitForIdle();

    /**
     * Stop accepting work, stop every execution and join the pools.
     * Worker processes are killed without cleanup so partial files stay
     * available for resume; in-thread executions are cancelled.
     */
    void shutdown();

private:
    struct ActiveTask {
        WorkItem item;
        std::shared_ptr<ExecutionHandle> handle;
        std::shared_ptr<CancellationSignal> signal;
        std::chrono::system_clock::time_point startedAt;
    };

    /**
     * Forwards worker writes to the record store
     */
    class StoreReporter : public WorkerReporter {
    public:
        explicit StoreReporter(records::RecordStore& store) : m_store(store) {}

        void reportSize(int64_t itemId, int64_t size) override;
        void reportProgress(int64_t itemId, double percent) override;

    private:
        records::RecordStore& m_store;
    };

    void execute(const std::shared_ptr<ActiveTask>& task);
    void complete(const std::shared_ptr<ActiveTask>& task, const WorkerOutcome& outcome);
    std::shared_ptr<ActiveTask> popTask(int64_t id);

    /**
     * Signal the task; true if it was running and needs the grace wait
     */
    bool signalTask(const ActiveTask& task);

    /**
     * Grace wait, then kill the worker process if it is still alive
     */
    void awaitStop(const ActiveTask& task);

    void deleteResolvedPaths(const WorkItem& item);
    void writeTerminal(int64_t id, const json& fields);

    records::RecordStore& m_store;
    const sources::DriverRegistry& m_drivers;
    DownloadOptions m_options;
    CleanupCoordinator m_cleanup;
    DownloadWorker m_worker;
    StoreReporter m_reporter;

    mutable std::mutex m_mutex;
    std::unordered_map<int64_t, std::shared_ptr<ActiveTask>> m_activeTasks;

    std::atomic<size_t> m_running{0};
    std::atomic<size_t> m_peakRunning{0};
    std::atomic<bool> m_shuttingDown{false};

    std::unique_ptr<ThreadPool> m_pool;
    std::unique_ptr<ThreadPool> m_maintenance;
};

} // namespace modeld::core::downloader
