/**
 * DownloadScheduler.cpp
 */

#include "DownloadScheduler.hpp"
#include "../Config.hpp"
#include "../Errors.hpp"
#include "../Logger.hpp"
#include "../../utils/PathUtils.hpp"
#include "../../utils/StringUtils.hpp"

#include <algorithm>
#include <system_error>
#include <thread>
#include <vector>

namespace modeld::core::downloader {

namespace {

constexpr size_t MAINTENANCE_THREADS = 4;
constexpr std::chrono::seconds KILL_SETTLE_TIME{1};

} // namespace

const char* toString(IsolationMode mode) {
    switch (mode) {
        case IsolationMode::Process: return "process";
        case IsolationMode::Thread:  return "thread";
    }
    return "process";
}

DownloadOptions DownloadOptions::fromConfig() {
    auto& config = Config::instance();
    DownloadOptions options;

    int maxConcurrent = config.get<int>("downloads.maxConcurrent", 5);
    options.maxConcurrent = static_cast<size_t>(std::max(maxConcurrent, 1));
    options.progressInterval = std::chrono::milliseconds(config.get<int>("downloads.progressInterval", 2000));
    options.cancelGracePeriod = std::chrono::milliseconds(config.get<int>("downloads.cancelGracePeriod", 5000));

    auto isolation = utils::StringUtils::toLower(config.get<std::string>("downloads.isolation", "process"));
    if (isolation == "thread") {
        options.isolation = IsolationMode::Thread;
    } else {
        if (isolation != "process") {
            LOG_WARN("Unknown downloads.isolation '{}', using process", isolation);
        }
        options.isolation = IsolationMode::Process;
    }

    options.cacheDir = utils::PathUtils::orDefault(
        config.get<std::string>("paths.cacheDir", ""), utils::PathUtils::getCachePath()).string();
    return options;
}

// -- StoreReporter --

void DownloadScheduler::StoreReporter::reportSize(int64_t itemId, int64_t size) {
    m_store.update(itemId, json{{"size", size}});
}

void DownloadScheduler::StoreReporter::reportProgress(int64_t itemId, double percent) {
    m_store.update(itemId, json{{"download_progress", percent}});
}

// -- DownloadScheduler --

DownloadScheduler::DownloadScheduler(records::RecordStore& store,
                                     const sources::DriverRegistry& drivers,
                                     DownloadOptions options,
                                     ProgressReporter::Clock clock)
    : m_store(store)
    , m_drivers(drivers)
    , m_options(std::move(options))
    , m_cleanup(StorageLayout(m_options.cacheDir))
    , m_worker(m_drivers, m_cleanup, m_options.progressInterval, std::move(clock))
    , m_reporter(store) {

    size_t poolSize = std::max<size_t>(m_options.maxConcurrent, 1);
    if (auto cores = std::thread::hardware_concurrency(); cores > 0) {
        poolSize = std::min<size_t>(poolSize, cores);
    }

    m_pool = std::make_unique<ThreadPool>(poolSize, "download");
    m_maintenance = std::make_unique<ThreadPool>(MAINTENANCE_THREADS, "maintenance");

    LOG_INFO("Download scheduler ready: {} slot(s), {} isolation, cache {}",
             poolSize, toString(m_options.isolation), m_options.cacheDir);
}

DownloadScheduler::~DownloadScheduler() {
    shutdown();
}

size_t DownloadScheduler::getPoolSize() const {
    return m_pool ? m_pool->size() : 0;
}

size_t DownloadScheduler::activeCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_activeTasks.size();
}

bool DownloadScheduler::hasActiveTask(int64_t id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_activeTasks.count(id) > 0;
}

void DownloadScheduler::ensureRunning(const WorkItem& item) {
    if (m_shuttingDown) {
        return;
    }
    if (item.state != WorkItemState::Downloading) {
        LOG_DEBUG("Model file {} ({}) is {}, nothing to run", item.id, item.readableSource(), toString(item.state));
        return;
    }

    std::shared_ptr<ActiveTask> task;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_activeTasks.count(item.id) > 0) {
            LOG_DEBUG("Model file {} ({}) already has a download task", item.id, item.readableSource());
            return;
        }

        task = std::make_shared<ActiveTask>();
        task->item = item;
        task->handle = std::make_shared<ExecutionHandle>();
        try {
            task->signal = CancellationSignal::create();
        } catch (const std::system_error& e) {
            LOG_ERROR("Cannot schedule model file {} ({}): {}", item.id, item.readableSource(), e.what());
            return;
        }
        task->startedAt = std::chrono::system_clock::now();
        m_activeTasks.emplace(item.id, task);
    }

    try {
        m_pool->post([this, task] { execute(task); });
    } catch (const std::runtime_error& e) {
        LOG_ERROR("Cannot queue model file {} ({}): {}", item.id, item.readableSource(), e.what());
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_activeTasks.find(item.id);
        if (it != m_activeTasks.end() && it->second == task) {
            m_activeTasks.erase(it);
        }
        return;
    }

    LOG_INFO("Created download task for model file {} ({})", item.id, item.readableSource());
}

std::shared_ptr<DownloadScheduler::ActiveTask> DownloadScheduler::popTask(int64_t id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_activeTasks.find(id);
    if (it == m_activeTasks.end()) {
        return nullptr;
    }
    auto task = std::move(it->second);
    m_activeTasks.erase(it);
    return task;
}

bool DownloadScheduler::signalTask(const ActiveTask& task) {
    task.signal->cancel();
    if (task.handle->tryCancel()) {
        LOG_INFO("Download task for model file {} ({}) cancelled before starting",
                 task.item.id, task.item.readableSource());
        return false;
    }
    LOG_INFO("Requested cancellation of running download for model file {} ({})",
             task.item.id, task.item.readableSource());
    return true;
}

void DownloadScheduler::awaitStop(const ActiveTask& task) {
    if (task.handle->waitDone(m_options.cancelGracePeriod)) {
        LOG_DEBUG("Download for model file {} stopped ({})", task.item.id, toString(task.signal->state()));
        return;
    }

    LOG_WARN("Download for model file {} ({}) still running after {} ms; forcing cleanup",
             task.item.id, task.item.readableSource(), m_options.cancelGracePeriod.count());
    if (task.handle->killChild()) {
        LOG_WARN("Killed worker process of model file {}", task.item.id);
        task.handle->waitDone(KILL_SETTLE_TIME);
    }
}

bool DownloadScheduler::cancel(int64_t id) {
    if (m_shuttingDown) {
        return false;
    }
    auto task = popTask(id);
    if (!task) {
        return false;
    }

    if (signalTask(*task)) {
        try {
            m_maintenance->post([this, task] {
                awaitStop(*task);
                m_cleanup.cleanup(task->item);
            });
        } catch (const std::runtime_error& e) {
            LOG_ERROR("Cannot schedule cleanup for model file {}: {}", id, e.what());
        }
    }
    return true;
}

void DownloadScheduler::ensureCancelled(const WorkItem& item) {
    if (m_shuttingDown) {
        return;
    }
    auto task = popTask(item.id);
    if (!task && !item.cleanupOnDelete) {
        LOG_DEBUG("Model file {} ({}) deleted; nothing to clean", item.id, item.readableSource());
        return;
    }

    bool running = task && signalTask(*task);

    try {
        m_maintenance->post([this, item, task, running] {
            if (running) {
                awaitStop(*task);
            }
            // Only an interrupted download leaves orphaned bytes; a finished
            // item's files belong to resolved_paths and cleanup_on_delete.
            if (task) {
                m_cleanup.cleanup(item);
            }
            if (item.cleanupOnDelete) {
                deleteResolvedPaths(item);
            }
        });
    } catch (const std::runtime_error& e) {
        LOG_ERROR("Cannot schedule deletion of model file {}: {}", item.id, e.what());
    }
}

void DownloadScheduler::deleteResolvedPaths(const WorkItem& item) {
    try {
        m_cleanup.deleteResolvedPaths(item.resolvedPaths);
        LOG_INFO("Deleted model file {} ({})", item.id, item.readableSource());
    } catch (const CleanupError& e) {
        LOG_ERROR("Failed to delete model file {} ({}): {}", item.id, item.readableSource(), e.what());
        try {
            m_store.update(item.id, json{
                {"state", toString(WorkItemState::Error)},
                {"state_message", std::string("Deletion failed: ") + e.what()}
            });
        } catch (const std::exception& ue) {
            LOG_WARN("Could not record deletion failure of model file {}: {}", item.id, ue.what());
        }
    }
}

void DownloadScheduler::execute(const std::shared_ptr<ActiveTask>& task) {
    if (!task->handle->tryStart()) {
        LOG_DEBUG("Skipping cancelled download task for model file {}", task->item.id);
        return;
    }

    size_t running = ++m_running;
    size_t peak = m_peakRunning.load();
    while (running > peak && !m_peakRunning.compare_exchange_weak(peak, running)) {
    }

    WorkerOutcome outcome;
    try {
        if (m_options.isolation == IsolationMode::Thread) {
            outcome = m_worker.run(task->item, *task->signal, m_reporter);
        } else {
            outcome = ProcessRunner::run(
                std::to_string(task->item.id),
                [this, &task](WorkerReporter& reporter) {
                    return m_worker.run(task->item, *task->signal, reporter);
                },
                m_reporter, *task->handle, *task->signal);
        }
    } catch (const std::exception& e) {
        outcome = WorkerOutcome::transferFailed(e.what());
    }

    --m_running;
    task->handle->markFinished();
    complete(task, outcome);
}

void DownloadScheduler::complete(const std::shared_ptr<ActiveTask>& task, const WorkerOutcome& outcome) {
    const auto& item = task->item;
    bool current = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_activeTasks.find(item.id);
        if (it != m_activeTasks.end() && it->second == task) {
            m_activeTasks.erase(it);
            current = true;
        }
    }

    // Cancelled meanwhile: the cancel path owns cleanup and nothing is written
    if (!current) {
        LOG_INFO("Discarding {} outcome of cancelled model file {} ({})",
                 toString(outcome.kind), item.id, item.readableSource());
        return;
    }

    switch (outcome.kind) {
        case OutcomeKind::Success:
            LOG_INFO("Download task completed successfully: model file {} ({}) -> {}",
                     item.id, item.readableSource(), utils::StringUtils::join(outcome.resolvedPaths, ", "));
            writeTerminal(item.id, json{
                {"state", toString(WorkItemState::Ready)},
                {"download_progress", 100},
                {"resolved_paths", outcome.resolvedPaths},
                {"state_message", nullptr}
            });
            break;

        case OutcomeKind::TransferFailed:
            LOG_ERROR("Download task failed: model file {} ({}): {}",
                      item.id, item.readableSource(), outcome.message);
            writeTerminal(item.id, json{
                {"state", toString(WorkItemState::Error)},
                {"state_message", outcome.message}
            });
            break;

        case OutcomeKind::Cancelled:
            LOG_INFO("Download task cancelled: model file {} ({})", item.id, item.readableSource());
            break;

        case OutcomeKind::SizeProbeFailed:
            LOG_WARN("Model file {} ({}) left downloading after size probe failure: {}",
                     item.id, item.readableSource(), outcome.message);
            break;
    }
}

void DownloadScheduler::writeTerminal(int64_t id, const json& fields) {
    try {
        m_store.update(id, fields);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to update model file {}: {}", id, e.what());
    }
}

void DownloadScheduler::waitForIdle() {
    if (m_pool) {
        m_pool->waitAll();
    }
    if (m_maintenance) {
        m_maintenance->waitAll();
    }
}

void DownloadScheduler::shutdown() {
    if (m_shuttingDown.exchange(true)) {
        return;
    }

    std::vector<std::shared_ptr<ActiveTask>> tasks;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto& [id, task] : m_activeTasks) {
            tasks.push_back(task);
        }
        m_activeTasks.clear();
    }

    if (!tasks.empty()) {
        LOG_INFO("Stopping {} download task(s)", tasks.size());
    }
    for (const auto& task : tasks) {
        if (task->handle->tryCancel()) {
            continue;
        }
        if (m_options.isolation == IsolationMode::Process && task->handle->killChild()) {
            continue;
        }
        task->signal->cancel();
    }

    m_pool.reset();
    m_maintenance.reset();
    LOG_INFO("Download scheduler stopped");
}

} // namespace modeld::core::downloader
