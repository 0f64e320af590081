#pragma once

/**
 * Execution.hpp
 *
 * Handle on one scheduled download execution and the runner that hosts
 * it in a forked child process.
 */

#include "CancellationSignal.hpp"
#include "WorkerOutcome.hpp"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <sys/types.h>

namespace modeld::core::downloader {

/**
 * Execution lifecycle, shared by the scheduler and the pool job.
 *
 *   Pending --tryStart--> Running --markFinished--> Finished
 *   Pending --tryCancel--> Cancelled
 *
 * A job that loses the race against tryCancel() never runs.
 */
class ExecutionHandle {
public:
    enum class State {
        Pending,
        Running,
        Finished,
        Cancelled
    };

    bool tryStart();
    bool tryCancel();
    void markFinished();

    /**
     * Block until the execution is no longer Running or Pending
     * @return false on timeout
     */
    bool waitDone(std::chrono::milliseconds timeout);

    State getState() const;

    // Process isolation only
    void setChildPid(pid_t pid);
    void clearChildPid();

    /**
     * SIGKILL the child process, if one is running
     * @return true if a signal was sent
     */
    bool killChild();

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_done;
    State m_state{State::Pending};
    pid_t m_childPid{0};
};

const char* toString(ExecutionHandle::State state);

/**
 * Runs a worker body in a forked child.
 *
 * The child reports through a pipe, one JSON object per line:
 *   {"event":"size","id":..,"value":..}
 *   {"event":"progress","id":..,"value":..}
 *   {"event":"outcome","outcome":{...}}
 * The parent replays size/progress into its own reporter, so record
 * writes only ever happen in the orchestrator process.
 */
class ProcessRunner {
public:
    using Body = std::function<WorkerOutcome(WorkerReporter& reporter)>;

    /**
     * @param tag Identifies the child in its log lines
     * @param body Work to run inside the child
     * @param reporter Parent-side reporter receiving replayed writes
     * @param handle Receives the child's pid so it can be killed
     * @param cancel Consulted when the child dies without an outcome
     */
    static WorkerOutcome run(const std::string& tag,
                             const Body& body,
                             WorkerReporter& reporter,
                             ExecutionHandle& handle,
                             const CancellationSignal& cancel);
};

} // namespace modeld::core::downloader
