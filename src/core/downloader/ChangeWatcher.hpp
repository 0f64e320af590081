#pragma once

/**
 * ChangeWatcher.hpp
 *
 * Keeps a subscription to the change feed open on its own thread and
 * dispatches this worker's events to a WorkItemSink. Feed failures are
 * logged and retried after a fixed delay, forever.
 */

#include "WorkItemSink.hpp"
#include "../records/ChangeFeed.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

namespace modeld::core::downloader {

class ChangeWatcher {
public:
    ChangeWatcher(records::ChangeFeed& feed,
                  WorkItemSink& sink,
                  int64_t workerId,
                  std::chrono::milliseconds retryDelay);

    ~ChangeWatcher();

    ChangeWatcher(const ChangeWatcher&) = delete;
    ChangeWatcher& operator=(const ChangeWatcher&) = delete;

    void start();

    /**
     * Interrupt the subscription and the retry wait, then join
     */
    void stop();

    bool isRunning() const { return m_running.load(); }

    /**
     * Number of subscriptions opened so far
     */
    size_t getSubscriptionCount() const { return m_subscriptions.load(); }

    /**
     * Filter and dispatch one event. Never throws.
     */
    void handleEvent(const ChangeEvent& event);

private:
    void run();
    bool waitBeforeRetry();

    records::ChangeFeed& m_feed;
    WorkItemSink& m_sink;
    int64_t m_workerId;
    std::chrono::milliseconds m_retryDelay;

    std::thread m_thread;
    std::atomic<bool> m_running{false};
    std::atomic<bool> m_stopRequested{false};
    std::atomic<size_t> m_subscriptions{0};

    std::mutex m_mutex;
    std::condition_variable m_wakeup;
};

} // namespace modeld::core::downloader
