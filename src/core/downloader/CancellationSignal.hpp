#pragma once

/**
 * CancellationSignal.hpp
 *
 * Tri-state cancellation cell shared between the scheduler and one
 * download execution. The cell lives in an anonymous shared mapping so
 * a forked worker process observes the parent's cancel() without any
 * further IPC.
 */

#include <atomic>
#include <memory>

namespace modeld::core::downloader {

class CancellationSignal {
public:
    enum class State : int {
        Armed = 0,
        Cancelled = 1,
        Acknowledged = 2
    };

    /**
     * Allocate a fresh armed signal
     * @throws std::system_error if the shared mapping cannot be created
     */
    static std::shared_ptr<CancellationSignal> create();

    ~CancellationSignal();

    CancellationSignal(const CancellationSignal&) = delete;
    CancellationSignal& operator=(const CancellationSignal&) = delete;

    /**
     * Request cancellation. Idempotent.
     * @return true if this call moved the signal out of Armed
     */
    bool cancel();

    /**
     * Worker side: the execution has stopped after a cancel request
     */
    void acknowledge();

    bool isCancelled() const { return state() != State::Armed; }
    bool isAcknowledged() const { return state() == State::Acknowledged; }
    State state() const;

private:
    explicit CancellationSignal(std::atomic<int>* cell);

    std::atomic<int>* m_cell;
};

const char* toString(CancellationSignal::State state);

} // namespace modeld::core::downloader
