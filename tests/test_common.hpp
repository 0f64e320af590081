#pragma once

/**
 * test_common.hpp
 *
 * Shared fakes and helpers for the modeld test suite.
 */

#include "core/Errors.hpp"
#include "core/downloader/CancellationSignal.hpp"
#include "core/downloader/WorkItemSink.hpp"
#include "core/downloader/WorkerOutcome.hpp"
#include "core/models/WorkItem.hpp"
#include "core/records/ChangeFeed.hpp"
#include "core/records/RecordStore.hpp"
#include "core/sources/SourceDriver.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <unistd.h>

namespace modeld::test {

namespace fs = std::filesystem;
using json = nlohmann::json;

// =============================================================================
// HELPERS
// =============================================================================

/**
 * Poll pred every few milliseconds until it holds or timeout expires
 */
inline bool waitUntil(const std::function<bool()>& pred,
                      std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

/**
 * Unique directory under the system temp dir, removed on destruction
 */
class TempDir {
public:
    TempDir() {
        std::string pattern = (fs::temp_directory_path() / "modeld-test-XXXXXX").string();
        if (::mkdtemp(pattern.data()) == nullptr) {
            throw std::runtime_error("mkdtemp failed for " + pattern);
        }
        m_path = pattern;
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(m_path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return m_path; }
    fs::path operator/(const std::string& name) const { return m_path / name; }

private:
    fs::path m_path;
};

inline void writeFile(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline void writeBytes(const fs::path& path, size_t count) {
    writeFile(path, std::string(count, 'x'));
}

inline WorkItem makeRepoItem(int64_t id, const fs::path& localDir, std::optional<int64_t> size = std::nullopt) {
    WorkItem item;
    item.id = id;
    item.workerId = 1;
    item.source = HuggingFaceSource{"org/model-" + std::to_string(id), ""};
    item.localDir = localDir.string();
    item.size = size;
    item.state = WorkItemState::Downloading;
    return item;
}

// =============================================================================
// RECORD STORE
// =============================================================================

/**
 * Keeps records as wire-format JSON and logs every update
 */
class InMemoryRecordStore : public core::records::RecordStore {
public:
    void put(const WorkItem& item) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_records[item.id] = json(item);
    }

    WorkItem get(int64_t id) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_records.find(id);
        if (it == m_records.end()) {
            throw core::RecordStoreError("model file " + std::to_string(id) + " not found", 404);
        }
        return it->second.get<WorkItem>();
    }

    void update(int64_t id, const json& fields) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_updates.emplace_back(id, fields);
        auto it = m_records.find(id);
        if (it == m_records.end()) {
            throw core::RecordStoreError("model file " + std::to_string(id) + " not found", 404);
        }
        for (const auto& [key, value] : fields.items()) {
            it->second[key] = value;
        }
    }

    json record(int64_t id) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_records.find(id);
        return it == m_records.end() ? json() : it->second;
    }

    std::vector<json> updatesFor(int64_t id) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<json> result;
        for (const auto& [updatedId, fields] : m_updates) {
            if (updatedId == id) {
                result.push_back(fields);
            }
        }
        return result;
    }

    std::vector<double> progressFor(int64_t id) const {
        std::vector<double> result;
        for (const auto& fields : updatesFor(id)) {
            if (fields.contains("download_progress") && !fields.contains("state")) {
                result.push_back(fields["download_progress"].get<double>());
            }
        }
        return result;
    }

    bool hasStateWrite(int64_t id) const {
        for (const auto& fields : updatesFor(id)) {
            if (fields.contains("state")) {
                return true;
            }
        }
        return false;
    }

private:
    mutable std::mutex m_mutex;
    std::map<int64_t, json> m_records;
    std::vector<std::pair<int64_t, json>> m_updates;
};

// =============================================================================
// SOURCE DRIVER
// =============================================================================

/**
 * Writes a configurable number of chunks into destination/model.bin
 */
class ScriptedDriver : public core::sources::SourceDriver {
public:
    struct Script {
        int64_t size{100};
        int chunks{4};
        std::chrono::milliseconds chunkDelay{0};
        std::string failWith;           // non-empty: throw TransferError after the first chunk
        bool probeFails{false};
        bool blockUntilCancelled{false};
        std::chrono::milliseconds stallFor{0};  // after the last chunk, ignoring the signal
        bool holdAfterLastChunk{false};         // ignore the signal until release()
        std::string pidFile;                    // non-empty: write the transferring pid here
    };

    explicit ScriptedDriver(Script script, SourceKind kind = SourceKind::HuggingFace)
        : m_script(std::move(script)), m_kind(kind) {}

    SourceKind getKind() const override { return m_kind; }

    int64_t probeSize(const WorkItem& item) override {
        ++m_probes;
        if (m_script.probeFails) {
            throw core::SizeProbeError("size probe failed for " + item.readableSource());
        }
        return m_script.size;
    }

    std::vector<std::string> transfer(const WorkItem& item,
                                      const fs::path& destination,
                                      const core::sources::ProgressCallback& onProgress,
                                      const core::downloader::CancellationSignal& cancel) override {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_started.insert(item.id);
            m_peakConcurrent = std::max(m_peakConcurrent, ++m_concurrent);
        }
        struct Leave {
            ScriptedDriver& driver;
            ~Leave() {
                std::lock_guard<std::mutex> lock(driver.m_mutex);
                --driver.m_concurrent;
            }
        } leave{*this};

        auto target = destination / "model.bin";
        fs::create_directories(destination);
        std::ofstream out(target, std::ios::binary | std::ios::app);

        int64_t remaining = m_script.size;
        int64_t chunkSize = m_script.chunks > 0 ? m_script.size / m_script.chunks : m_script.size;
        for (int i = 0; i < m_script.chunks && remaining > 0; ++i) {
            if (cancel.isCancelled()) {
                throw core::CancellationError();
            }
            int64_t n = (i == m_script.chunks - 1) ? remaining : chunkSize;
            out << std::string(static_cast<size_t>(n), 'm');
            out.flush();
            remaining -= n;
            onProgress(n);

            if (!m_script.failWith.empty()) {
                throw core::TransferError(m_script.failWith);
            }
            if (m_script.chunkDelay.count() > 0) {
                std::this_thread::sleep_for(m_script.chunkDelay);
            }
        }

        if (!m_script.pidFile.empty()) {
            writeFile(m_script.pidFile, std::to_string(::getpid()));
        }
        if (m_script.stallFor.count() > 0) {
            std::this_thread::sleep_for(m_script.stallFor);
        }
        if (m_script.holdAfterLastChunk) {
            m_holding = true;
            while (!m_released) {
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            }
        }

        while (m_script.blockUntilCancelled) {
            if (cancel.isCancelled()) {
                throw core::CancellationError();
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }

        return {destination.string()};
    }

    bool started(int64_t id) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_started.count(id) > 0;
    }

    size_t startedCount() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_started.size();
    }

    int peakConcurrent() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_peakConcurrent;
    }

    int probes() const { return m_probes.load(); }

    bool isHolding() const { return m_holding.load(); }
    void release() { m_released = true; }

private:
    Script m_script;
    SourceKind m_kind;

    mutable std::mutex m_mutex;
    std::set<int64_t> m_started;
    int m_concurrent{0};
    int m_peakConcurrent{0};
    std::atomic<int> m_probes{0};
    std::atomic<bool> m_holding{false};
    std::atomic<bool> m_released{false};
};

// =============================================================================
// CHANGE FEED
// =============================================================================

/**
 * Each watch() call plays the next session; once they run out, watch()
 * blocks until asked to stop.
 */
class ScriptedChangeFeed : public core::records::ChangeFeed {
public:
    struct Session {
        std::vector<ChangeEvent> events;
        bool failAfter{false};
    };

    void addSession(Session session) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_sessions.push_back(std::move(session));
    }

    void watch(const core::records::EventCallback& onEvent,
               const core::records::StopPredicate& stopRequested) override {
        ++m_watchCalls;
        std::optional<Session> session;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!m_sessions.empty()) {
                session = std::move(m_sessions.front());
                m_sessions.pop_front();
            }
        }

        if (session) {
            for (const auto& event : session->events) {
                onEvent(event);
            }
            if (session->failAfter) {
                throw core::FeedError("connection reset by peer");
            }
            return;
        }

        m_idle = true;
        while (!stopRequested()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }

    int watchCalls() const { return m_watchCalls.load(); }
    bool isIdle() const { return m_idle.load(); }

private:
    std::mutex m_mutex;
    std::deque<Session> m_sessions;
    std::atomic<int> m_watchCalls{0};
    std::atomic<bool> m_idle{false};
};

// =============================================================================
// REPORTERS AND SINKS
// =============================================================================

class RecordingReporter : public core::downloader::WorkerReporter {
public:
    void reportSize(int64_t, int64_t size) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        sizes.push_back(size);
    }

    void reportProgress(int64_t, double percent) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        progress.push_back(percent);
    }

    std::vector<int64_t> sizes;
    std::vector<double> progress;

private:
    std::mutex m_mutex;
};

class RecordingSink : public core::downloader::WorkItemSink {
public:
    void ensureRunning(const WorkItem& item) override {
        if (item.id == throwOnId) {
            throw std::runtime_error("sink rejected model file " + std::to_string(item.id));
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        running.push_back(item.id);
    }

    void ensureCancelled(const WorkItem& item) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        cancelled.push_back(item.id);
    }

    std::vector<int64_t> runningIds() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return running;
    }

    std::vector<int64_t> cancelledIds() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return cancelled;
    }

    int64_t throwOnId{-1};

private:
    mutable std::mutex m_mutex;
    std::vector<int64_t> running;
    std::vector<int64_t> cancelled;
};

} // namespace modeld::test
