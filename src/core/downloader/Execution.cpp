/**
 * Execution.cpp
 */

#include "Execution.hpp"
#include "../Logger.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <optional>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace modeld::core::downloader {

// -- ExecutionHandle --

bool ExecutionHandle::tryStart() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state != State::Pending) {
        return false;
    }
    m_state = State::Running;
    return true;
}

bool ExecutionHandle::tryCancel() {
    bool cancelled = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state == State::Pending) {
            m_state = State::Cancelled;
            cancelled = true;
        }
    }
    if (cancelled) {
        m_done.notify_all();
    }
    return cancelled;
}

void ExecutionHandle::markFinished() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state == State::Running) {
            m_state = State::Finished;
        }
    }
    m_done.notify_all();
}

bool ExecutionHandle::waitDone(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_done.wait_for(lock, timeout, [this] {
        return m_state == State::Finished || m_state == State::Cancelled;
    });
}

ExecutionHandle::State ExecutionHandle::getState() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

void ExecutionHandle::setChildPid(pid_t pid) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_childPid = pid;
}

void ExecutionHandle::clearChildPid() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_childPid = 0;
}

bool ExecutionHandle::killChild() {
    std::lock_guard<std::mutex> lock(m_mutex);
    // The pid stays valid while set: it is cleared before the child is reaped
    if (m_childPid <= 0) {
        return false;
    }
    return ::kill(m_childPid, SIGKILL) == 0;
}

const char* toString(ExecutionHandle::State state) {
    switch (state) {
        case ExecutionHandle::State::Pending:   return "pending";
        case ExecutionHandle::State::Running:   return "running";
        case ExecutionHandle::State::Finished:  return "finished";
        case ExecutionHandle::State::Cancelled: return "cancelled";
    }
    return "unknown";
}

// -- ProcessRunner --

namespace {

constexpr int POLL_INTERVAL_MS = 200;

/**
 * Child-side reporter: one JSON line per write
 */
class PipeReporter : public WorkerReporter {
public:
    explicit PipeReporter(int fd) : m_fd(fd) {}

    void reportSize(int64_t itemId, int64_t size) override {
        send(json{{"event", "size"}, {"id", itemId}, {"value", size}});
    }

    void reportProgress(int64_t itemId, double percent) override {
        send(json{{"event", "progress"}, {"id", itemId}, {"value", percent}});
    }

    void sendOutcome(const WorkerOutcome& outcome) {
        send(json{{"event", "outcome"}, {"outcome", outcome}});
    }

private:
    void send(const json& message) {
        std::string line = message.dump() + "\n";
        const char* data = line.data();
        size_t remaining = line.size();
        while (remaining > 0) {
            ssize_t written = ::write(m_fd, data, remaining);
            if (written < 0) {
                if (errno == EINTR) continue;
                throw std::runtime_error(std::string("pipe write failed: ") + std::strerror(errno));
            }
            data += written;
            remaining -= static_cast<size_t>(written);
        }
    }

    int m_fd;
};

[[noreturn]] void runChild(int writeFd, const std::string& tag, const ProcessRunner::Body& body) {
    // The orchestrator decides when a worker stops
    std::signal(SIGINT, SIG_IGN);
    std::signal(SIGTERM, SIG_DFL);

    Logger::instance().detachForChild(tag);

    PipeReporter reporter(writeFd);
    WorkerOutcome outcome;
    try {
        outcome = body(reporter);
    } catch (const std::exception& e) {
        outcome = WorkerOutcome::transferFailed(e.what());
    }

    int code = 0;
    try {
        reporter.sendOutcome(outcome);
    } catch (const std::exception& e) {
        Logger::instance().error("Could not report outcome to orchestrator: {}", e.what());
        code = 1;
    }

    Logger::instance().flush();
    ::close(writeFd);
    ::_exit(code);
}

class ParentChannel {
public:
    ParentChannel(WorkerReporter& reporter, const std::string& tag)
        : m_reporter(reporter), m_tag(tag) {}

    void consume(const char* data, size_t size) {
        m_buffer.append(data, size);
        size_t pos;
        while ((pos = m_buffer.find('\n')) != std::string::npos) {
            std::string line = m_buffer.substr(0, pos);
            m_buffer.erase(0, pos + 1);
            if (!line.empty()) {
                handleLine(line);
            }
        }
    }

    std::optional<WorkerOutcome>& getOutcome() { return m_outcome; }

private:
    void handleLine(const std::string& line) {
        try {
            auto message = json::parse(line);
            auto event = message.value("event", "");
            if (event == "size") {
                m_reporter.reportSize(message.at("id").get<int64_t>(), message.at("value").get<int64_t>());
            } else if (event == "progress") {
                m_reporter.reportProgress(message.at("id").get<int64_t>(), message.at("value").get<double>());
            } else if (event == "outcome") {
                m_outcome = message.at("outcome").get<WorkerOutcome>();
            } else {
                LOG_WARN("Worker {} sent unknown event '{}'", m_tag, event);
            }
        } catch (const std::exception& e) {
            LOG_WARN("Worker {} message not handled: {}", m_tag, e.what());
        }
    }

    WorkerReporter& m_reporter;
    std::string m_tag;
    std::string m_buffer;
    std::optional<WorkerOutcome> m_outcome;
};

bool childHasExited(pid_t pid) {
    siginfo_t info{};
    // WNOWAIT leaves the child reapable so its pid cannot be reused yet
    if (::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT) != 0) {
        return errno == ECHILD;
    }
    return info.si_pid == pid;
}

void drainNonBlocking(int fd, ParentChannel& channel) {
    int flags = ::fcntl(fd, F_GETFL);
    if (flags >= 0) {
        ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
    char chunk[4096];
    while (true) {
        ssize_t n = ::read(fd, chunk, sizeof(chunk));
        if (n > 0) {
            channel.consume(chunk, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        break;
    }
}

std::string describeStatus(int status) {
    if (WIFSIGNALED(status)) {
        return "killed by signal " + std::to_string(WTERMSIG(status));
    }
    if (WIFEXITED(status)) {
        return "exit code " + std::to_string(WEXITSTATUS(status));
    }
    return "status " + std::to_string(status);
}

} // namespace

WorkerOutcome ProcessRunner::run(const std::string& tag,
                                 const Body& body,
                                 WorkerReporter& reporter,
                                 ExecutionHandle& handle,
                                 const CancellationSignal& cancel) {
    int fds[2];
    if (::pipe(fds) != 0) {
        return WorkerOutcome::transferFailed(std::string("cannot create worker pipe: ") + std::strerror(errno));
    }

    Logger::instance().flush();
    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        ::close(fds[0]);
        ::close(fds[1]);
        return WorkerOutcome::transferFailed(std::string("cannot fork worker process: ") + std::strerror(err));
    }

    if (pid == 0) {
        ::close(fds[0]);
        runChild(fds[1], tag, body);
    }

    ::close(fds[1]);
    handle.setChildPid(pid);
    LOG_DEBUG("Worker {} running in process {}", tag, pid);

    // Other children may hold a copy of the write end, so EOF alone does
    // not prove this child is gone; poll and check its status too.
    ParentChannel channel(reporter, tag);
    char chunk[4096];
    while (true) {
        pollfd pfd{fds[0], POLLIN, 0};
        int rc = ::poll(&pfd, 1, POLL_INTERVAL_MS);
        if (rc < 0) {
            if (errno == EINTR) continue;
            LOG_WARN("Polling worker {} failed: {}", tag, std::strerror(errno));
            break;
        }
        if (rc > 0) {
            ssize_t n = ::read(fds[0], chunk, sizeof(chunk));
            if (n > 0) {
                channel.consume(chunk, static_cast<size_t>(n));
                continue;
            }
            if (n == 0) break;
            if (errno == EINTR || errno == EAGAIN) continue;
            LOG_WARN("Reading from worker {} failed: {}", tag, std::strerror(errno));
            break;
        }
        if (childHasExited(pid)) {
            drainNonBlocking(fds[0], channel);
            break;
        }
    }
    ::close(fds[0]);

    handle.clearChildPid();
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }

    if (auto& outcome = channel.getOutcome()) {
        return *outcome;
    }
    if (cancel.isCancelled()) {
        return WorkerOutcome::cancelled();
    }
    return WorkerOutcome::transferFailed("worker process exited unexpectedly (" + describeStatus(status) + ")");
}

} // namespace modeld::core::downloader
