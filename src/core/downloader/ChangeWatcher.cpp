/**
 * ChangeWatcher.cpp
 */

#include "ChangeWatcher.hpp"
#include "../Logger.hpp"

namespace modeld::core::downloader {

ChangeWatcher::ChangeWatcher(records::ChangeFeed& feed,
                             WorkItemSink& sink,
                             int64_t workerId,
                             std::chrono::milliseconds retryDelay)
    : m_feed(feed)
    , m_sink(sink)
    , m_workerId(workerId)
    , m_retryDelay(retryDelay) {
}

ChangeWatcher::~ChangeWatcher() {
    stop();
}

void ChangeWatcher::start() {
    if (m_running.exchange(true)) {
        return;
    }
    m_stopRequested = false;
    m_thread = std::thread([this] { run(); });
}

void ChangeWatcher::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopRequested = true;
    }
    m_wakeup.notify_all();

    if (m_thread.joinable()) {
        m_thread.join();
    }
    m_running = false;
}

void ChangeWatcher::handleEvent(const ChangeEvent& event) {
    const auto& item = event.item;
    if (!item.workerId || *item.workerId != m_workerId) {
        return;
    }

    LOG_DEBUG("Received model file event: {} {} ({}) {}",
              toString(event.type), item.id, item.readableSource(), toString(item.state));

    try {
        switch (event.type) {
            case ChangeType::Deleted:
                m_sink.ensureCancelled(item);
                break;
            case ChangeType::Created:
            case ChangeType::Updated:
                // Non-downloading updates are echoes of our own writes
                if (item.state == WorkItemState::Downloading) {
                    m_sink.ensureRunning(item);
                }
                break;
            case ChangeType::Heartbeat:
                break;
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to handle {} event for model file {} ({}): {}",
                  toString(event.type), item.id, item.readableSource(), e.what());
    }
}

void ChangeWatcher::run() {
    LOG_INFO("Watching model files for worker {}", m_workerId);

    while (!m_stopRequested) {
        ++m_subscriptions;
        try {
            LOG_DEBUG("Started watching model files");
            m_feed.watch(
                [this](const ChangeEvent& event) { handleEvent(event); },
                [this] { return m_stopRequested.load(); });
        } catch (const std::exception& e) {
            LOG_ERROR("Failed to watch model files: {}", e.what());
        }

        if (!waitBeforeRetry()) {
            break;
        }
    }

    LOG_INFO("Stopped watching model files");
}

bool ChangeWatcher::waitBeforeRetry() {
    std::unique_lock<std::mutex> lock(m_mutex);
    return !m_wakeup.wait_for(lock, m_retryDelay, [this] { return m_stopRequested.load(); });
}

} // namespace modeld::core::downloader
