#pragma once

/**
 * ThreadPool.hpp
 *
 * Fixed-size thread pool. The number of worker threads is the admission
 * bound for download executions: a job occupies its thread for the whole
 * transfer, so at most size() executions run at once and the rest wait
 * in FIFO order.
 */

#include "Logger.hpp"

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <atomic>
#include <stdexcept>
#include <string>

namespace modeld::core {

class ThreadPool {
public:
    /**
     * Constructor
     * @param numThreads Number of worker threads (0 = hardware concurrency)
     * @param name Pool name used in log lines
     */
    explicit ThreadPool(size_t numThreads = 0, std::string name = "pool")
        : m_name(std::move(name)), m_stop(false), m_activeJobs(0) {

        if (numThreads == 0) {
            numThreads = std::thread::hardware_concurrency();
            if (numThreads == 0) numThreads = 4; // Fallback
        }

        m_workers.reserve(numThreads);

        for (size_t i = 0; i < numThreads; ++i) {
            m_workers.emplace_back([this] {
                workerLoop();
            });
        }
    }

    /**
     * Destructor - drains queued jobs, then joins
     */
    ~ThreadPool() {
        {
            std::unique_lock<std::mutex> lock(m_queueMutex);
            m_stop = true;
        }

        m_condition.notify_all();

        for (auto& worker : m_workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    /**
     * Fire-and-forget job. Exceptions escaping the job are logged.
     * @param job Job to run
     */
    void post(std::function<void()> job) {
        enqueue(std::move(job));
    }

    /**
     * Get number of worker threads
     */
    size_t size() const {
        return m_workers.size();
    }

    /**
     * Wait until no job is queued or running
     */
    void waitAll() {
        std::unique_lock<std::mutex> lock(m_queueMutex);
        m_idleCondition.wait(lock, [this] {
            return m_tasks.empty() && m_activeJobs == 0;
        });
    }

private:
    void enqueue(std::function<void()> job) {
        {
            std::unique_lock<std::mutex> lock(m_queueMutex);

            if (m_stop) {
                throw std::runtime_error("Cannot submit to stopped ThreadPool " + m_name);
            }

            m_tasks.emplace(std::move(job));
        }

        m_condition.notify_one();
    }

    void workerLoop() {
        while (true) {
            std::function<void()> task;

            {
                std::unique_lock<std::mutex> lock(m_queueMutex);

                m_condition.wait(lock, [this] {
                    return m_stop || !m_tasks.empty();
                });

                if (m_stop && m_tasks.empty()) {
                    return;
                }

                task = std::move(m_tasks.front());
                m_tasks.pop();
                ++m_activeJobs;
            }

            try {
                task();
            } catch (const std::exception& e) {
                Logger::instance().error("Unhandled exception in {} job: {}", m_name, e.what());
            }

            {
                std::unique_lock<std::mutex> lock(m_queueMutex);
                --m_activeJobs;
                if (m_tasks.empty() && m_activeJobs == 0) {
                    m_idleCondition.notify_all();
                }
            }
        }
    }

private:
    std::string m_name;
    std::vector<std::thread> m_workers;
    std::queue<std::function<void()>> m_tasks;

    mutable std::mutex m_queueMutex;
    std::condition_variable m_condition;
    std::condition_variable m_idleCondition;

    std::atomic<bool> m_stop;
    std::atomic<size_t> m_activeJobs;
};

} // namespace modeld::core
