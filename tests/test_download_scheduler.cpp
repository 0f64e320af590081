/**
 * @file test_download_scheduler.cpp
 * @brief Tests for task reconciliation, cancellation and terminal writes
 */

#include <gtest/gtest.h>

#include <cerrno>
#include <csignal>
#include <fstream>
#include <memory>

#include "core/downloader/DownloadScheduler.hpp"
#include "test_common.hpp"

using modeld::WorkItem;
using modeld::WorkItemState;
using modeld::core::downloader::DownloadOptions;
using modeld::core::downloader::DownloadScheduler;
using modeld::core::downloader::IsolationMode;
using modeld::core::sources::DriverRegistry;
using modeld::test::InMemoryRecordStore;
using modeld::test::ScriptedDriver;
using modeld::test::TempDir;
using modeld::test::makeRepoItem;
using modeld::test::waitUntil;
using modeld::test::writeBytes;
using modeld::test::writeFile;

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

class DownloadSchedulerTest : public ::testing::Test {
protected:
    DownloadOptions options(size_t maxConcurrent = 4,
                            IsolationMode isolation = IsolationMode::Thread,
                            std::chrono::milliseconds grace = 2000ms) const {
        DownloadOptions opts;
        opts.maxConcurrent = maxConcurrent;
        opts.progressInterval = 0ms;
        opts.cancelGracePeriod = grace;
        opts.isolation = isolation;
        opts.cacheDir = (m_root / "cache").string();
        return opts;
    }

    std::shared_ptr<ScriptedDriver> useDriver(ScriptedDriver::Script script) {
        auto driver = std::make_shared<ScriptedDriver>(std::move(script));
        m_drivers.add(driver);
        return driver;
    }

    WorkItem addItem(int64_t id, std::optional<int64_t> size = std::nullopt) {
        auto item = makeRepoItem(id, m_root / ("item-" + std::to_string(id)), size);
        m_store.put(item);
        return item;
    }

    TempDir m_root;
    InMemoryRecordStore m_store;
    DriverRegistry m_drivers;
};

} // namespace

// =============================================================================
// COMPLETION
// =============================================================================

TEST_F(DownloadSchedulerTest, UnknownSizeIsProbedPersistedAndCompleted) {
    auto driver = useDriver({});
    DownloadScheduler scheduler(m_store, m_drivers, options());
    auto item = addItem(1);

    scheduler.ensureRunning(item);
    scheduler.waitForIdle();

    auto updates = m_store.updatesFor(1);
    ASSERT_FALSE(updates.empty());
    EXPECT_EQ(updates.front(), (nlohmann::json{{"size", 100}})) << "size must be persisted before any progress";

    auto record = m_store.record(1);
    EXPECT_EQ(record["state"], "ready");
    EXPECT_EQ(record["size"], 100);
    EXPECT_DOUBLE_EQ(record["download_progress"].get<double>(), 100.0);
    ASSERT_EQ(record["resolved_paths"].size(), 1u);
    EXPECT_EQ(record["resolved_paths"][0], *item.localDir);
    EXPECT_TRUE(record["state_message"].is_null());
    EXPECT_FALSE(scheduler.hasActiveTask(1));
    EXPECT_EQ(driver->probes(), 1);
}

TEST_F(DownloadSchedulerTest, KnownSizeIsNotProbed) {
    auto driver = useDriver({});
    DownloadScheduler scheduler(m_store, m_drivers, options());

    scheduler.ensureRunning(addItem(1, 100));
    scheduler.waitForIdle();

    EXPECT_EQ(driver->probes(), 0);
    EXPECT_EQ(m_store.record(1)["state"], "ready");
}

TEST_F(DownloadSchedulerTest, ProgressResumesFromBytesOnDisk) {
    useDriver({60, 3});
    DownloadScheduler scheduler(m_store, m_drivers, options());
    auto item = addItem(1, 100);
    writeBytes(fs::path(*item.localDir) / "existing.bin", 40);

    scheduler.ensureRunning(item);
    scheduler.waitForIdle();

    auto progress = m_store.progressFor(1);
    ASSERT_FALSE(progress.empty());
    EXPECT_DOUBLE_EQ(progress.front(), 40.0);
    EXPECT_DOUBLE_EQ(progress.back(), 100.0);
    for (size_t i = 1; i < progress.size(); ++i) {
        EXPECT_GT(progress[i], progress[i - 1]);
    }
}

TEST_F(DownloadSchedulerTest, TransferErrorMarksItemFailed) {
    ScriptedDriver::Script script;
    script.failWith = "connection reset by peer";
    useDriver(script);
    DownloadScheduler scheduler(m_store, m_drivers, options());
    auto item = addItem(1, 100);

    scheduler.ensureRunning(item);
    scheduler.waitForIdle();

    auto record = m_store.record(1);
    EXPECT_EQ(record["state"], "error");
    EXPECT_NE(record["state_message"].get<std::string>().find("connection reset by peer"), std::string::npos);
    EXPECT_FALSE(fs::exists(*item.localDir)) << "partial data must be cleaned after a failure";
}

TEST_F(DownloadSchedulerTest, SizeProbeFailureWritesNoTerminalState) {
    ScriptedDriver::Script script;
    script.probeFails = true;
    auto driver = useDriver(script);
    DownloadScheduler scheduler(m_store, m_drivers, options());

    scheduler.ensureRunning(addItem(1));
    scheduler.waitForIdle();

    EXPECT_FALSE(m_store.hasStateWrite(1));
    EXPECT_EQ(m_store.record(1)["state"], "downloading");
    EXPECT_FALSE(driver->started(1));
    EXPECT_FALSE(scheduler.hasActiveTask(1));
}

TEST_F(DownloadSchedulerTest, MissingDriverFailsItem) {
    DownloadScheduler scheduler(m_store, m_drivers, options());

    scheduler.ensureRunning(addItem(1, 100));
    scheduler.waitForIdle();

    EXPECT_EQ(m_store.record(1)["state"], "error");
}

TEST_F(DownloadSchedulerTest, CompletesInWorkerProcess) {
    useDriver({});
    DownloadScheduler scheduler(m_store, m_drivers, options(2, IsolationMode::Process));
    auto item = addItem(1);

    scheduler.ensureRunning(item);
    scheduler.waitForIdle();

    auto record = m_store.record(1);
    EXPECT_EQ(record["state"], "ready");
    EXPECT_EQ(record["size"], 100);
    EXPECT_EQ(fs::file_size(fs::path(*item.localDir) / "model.bin"), 100u);
}

// =============================================================================
// RECONCILIATION
// =============================================================================

TEST_F(DownloadSchedulerTest, EnsureRunningIsIdempotent) {
    ScriptedDriver::Script script;
    script.blockUntilCancelled = true;
    auto driver = useDriver(script);
    DownloadScheduler scheduler(m_store, m_drivers, options());
    auto item = addItem(1, 100);

    scheduler.ensureRunning(item);
    scheduler.ensureRunning(item);
    ASSERT_TRUE(waitUntil([&] { return driver->started(1); }));
    scheduler.ensureRunning(item);

    EXPECT_EQ(scheduler.activeCount(), 1u);

    EXPECT_TRUE(scheduler.cancel(1));
    scheduler.waitForIdle();
    EXPECT_EQ(driver->startedCount(), 1u);
}

TEST_F(DownloadSchedulerTest, IgnoresItemsThatAreNotDownloading) {
    auto driver = useDriver({});
    DownloadScheduler scheduler(m_store, m_drivers, options());
    auto item = addItem(1, 100);
    item.state = WorkItemState::Ready;

    scheduler.ensureRunning(item);
    scheduler.waitForIdle();

    EXPECT_EQ(scheduler.activeCount(), 0u);
    EXPECT_FALSE(driver->started(1));
}

TEST_F(DownloadSchedulerTest, ConcurrencyStaysWithinPool) {
    ScriptedDriver::Script script;
    script.chunkDelay = 10ms;
    auto driver = useDriver(script);
    DownloadScheduler scheduler(m_store, m_drivers, options(2));

    for (int64_t id = 1; id <= 6; ++id) {
        scheduler.ensureRunning(addItem(id, 100));
    }
    scheduler.waitForIdle();

    EXPECT_LE(scheduler.peakRunning(), scheduler.getPoolSize());
    EXPECT_LE(static_cast<size_t>(driver->peakConcurrent()), scheduler.getPoolSize());
    EXPECT_LE(scheduler.getPoolSize(), 2u);
    for (int64_t id = 1; id <= 6; ++id) {
        EXPECT_EQ(m_store.record(id)["state"], "ready") << "model file " << id;
    }
}

// =============================================================================
// CANCELLATION
// =============================================================================

TEST_F(DownloadSchedulerTest, QueuedTaskCancelsWithoutStarting) {
    ScriptedDriver::Script script;
    script.blockUntilCancelled = true;
    auto driver = useDriver(script);
    DownloadScheduler scheduler(m_store, m_drivers, options(1));
    auto first = addItem(1, 100);
    auto queued = addItem(2, 100);

    scheduler.ensureRunning(first);
    ASSERT_TRUE(waitUntil([&] { return driver->started(1); }));
    scheduler.ensureRunning(queued);

    scheduler.ensureCancelled(queued);
    EXPECT_FALSE(scheduler.hasActiveTask(2));

    scheduler.cancel(1);
    scheduler.waitForIdle();

    EXPECT_FALSE(driver->started(2));
    EXPECT_TRUE(m_store.updatesFor(2).empty());
    EXPECT_FALSE(fs::exists(*queued.localDir));
}

TEST_F(DownloadSchedulerTest, CancelRunningRemovesPartialData) {
    ScriptedDriver::Script script;
    script.blockUntilCancelled = true;
    auto driver = useDriver(script);
    DownloadScheduler scheduler(m_store, m_drivers, options());
    auto item = addItem(1, 200);

    scheduler.ensureRunning(item);
    ASSERT_TRUE(waitUntil([&] { return driver->started(1); }));
    ASSERT_TRUE(waitUntil([&] { return fs::exists(fs::path(*item.localDir) / "model.bin"); }));

    scheduler.ensureCancelled(item);
    EXPECT_FALSE(scheduler.hasActiveTask(1));
    scheduler.waitForIdle();

    EXPECT_FALSE(fs::exists(*item.localDir));
    EXPECT_FALSE(m_store.hasStateWrite(1)) << "a cancelled download must not write a terminal state";
}

TEST_F(DownloadSchedulerTest, UnresponsiveThreadIsCleanedAfterGracePeriod) {
    constexpr auto kGrace = 200ms;
    constexpr auto kStall = 1500ms;
    ScriptedDriver::Script script;
    script.chunks = 1;
    script.stallFor = kStall;
    useDriver(script);
    DownloadScheduler scheduler(m_store, m_drivers, options(4, IsolationMode::Thread, kGrace));
    auto item = addItem(1, 100);

    scheduler.ensureRunning(item);
    ASSERT_TRUE(waitUntil([&] {
        auto progress = m_store.progressFor(1);
        return !progress.empty() && progress.back() == 100.0;
    }));

    auto cancelledAt = std::chrono::steady_clock::now();
    scheduler.ensureCancelled(item);
    ASSERT_TRUE(waitUntil([&] { return !fs::exists(*item.localDir); }, 1000ms));
    auto elapsed = std::chrono::steady_clock::now() - cancelledAt;

    EXPECT_GE(elapsed, kGrace) << "cleanup must wait out the grace period";
    EXPECT_LT(elapsed, kStall) << "cleanup must not wait for the worker to acknowledge";

    scheduler.waitForIdle();
    EXPECT_FALSE(fs::exists(*item.localDir));
    EXPECT_FALSE(m_store.hasStateWrite(1));
}

TEST_F(DownloadSchedulerTest, UnresponsiveWorkerProcessIsKilledAndCleaned) {
    ScriptedDriver::Script script;
    script.chunks = 1;
    script.stallFor = 30s;
    script.pidFile = (m_root / "worker.pid").string();
    useDriver(script);
    DownloadScheduler scheduler(m_store, m_drivers, options(2, IsolationMode::Process, 200ms));
    auto item = addItem(1, 100);

    scheduler.ensureRunning(item);
    ASSERT_TRUE(waitUntil([&] {
        return fs::exists(script.pidFile) && fs::exists(fs::path(*item.localDir) / "model.bin");
    }));
    pid_t pid = 0;
    ASSERT_TRUE(waitUntil([&] {
        std::ifstream in(script.pidFile);
        return static_cast<bool>(in >> pid) && pid > 0;
    }));

    scheduler.ensureCancelled(item);

    EXPECT_TRUE(waitUntil([&] { return !fs::exists(*item.localDir); }, 3000ms));
    EXPECT_TRUE(waitUntil([&] { return ::kill(pid, 0) == -1 && errno == ESRCH; }, 3000ms))
        << "worker process " << pid << " must be killed after the grace period";

    scheduler.waitForIdle();
    EXPECT_FALSE(m_store.hasStateWrite(1));
}

TEST_F(DownloadSchedulerTest, CancelOfUnknownItemIsNoop) {
    DownloadScheduler scheduler(m_store, m_drivers, options());
    EXPECT_FALSE(scheduler.cancel(42));
}

// =============================================================================
// DELETION
// =============================================================================

TEST_F(DownloadSchedulerTest, DeleteRacingFinishedTransferWritesNoReady) {
    ScriptedDriver::Script script;
    script.holdAfterLastChunk = true;
    auto driver = useDriver(script);
    DownloadScheduler scheduler(m_store, m_drivers, options());
    auto item = addItem(1, 100);

    scheduler.ensureRunning(item);
    ASSERT_TRUE(waitUntil([&] { return driver->isHolding(); }));
    ASSERT_EQ(fs::file_size(fs::path(*item.localDir) / "model.bin"), 100u);

    item.cleanupOnDelete = false;
    scheduler.ensureCancelled(item);
    EXPECT_FALSE(scheduler.hasActiveTask(1));
    driver->release();
    scheduler.waitForIdle();

    EXPECT_FALSE(m_store.hasStateWrite(1)) << "a deleted item must never be marked ready";
    EXPECT_EQ(m_store.record(1)["state"], "downloading");
    EXPECT_FALSE(fs::exists(*item.localDir));
}

TEST_F(DownloadSchedulerTest, DeleteKeepsFilesWithoutCleanupFlag) {
    DownloadScheduler scheduler(m_store, m_drivers, options());
    auto item = addItem(1, 10);
    auto file = m_root / "models" / "model.gguf";
    writeBytes(file, 10);
    item.state = WorkItemState::Ready;
    item.resolvedPaths = {file.string()};
    item.cleanupOnDelete = false;

    scheduler.ensureCancelled(item);
    scheduler.waitForIdle();

    EXPECT_TRUE(fs::exists(file));
    EXPECT_TRUE(m_store.updatesFor(1).empty());
}

TEST_F(DownloadSchedulerTest, DeleteRemovesResolvedPathsAndGlobs) {
    DownloadScheduler scheduler(m_store, m_drivers, options());
    auto item = addItem(1, 10);
    auto dir = m_root / "models";
    writeFile(dir / "model-00001.gguf", "a");
    writeFile(dir / "model-00002.gguf", "b");
    writeFile(dir / "README.md", "keep");
    writeFile(m_root / "single.bin", "c");
    item.state = WorkItemState::Ready;
    item.resolvedPaths = {(dir / "*.gguf").string(), (m_root / "single.bin").string()};
    item.cleanupOnDelete = true;

    scheduler.ensureCancelled(item);
    scheduler.waitForIdle();

    EXPECT_FALSE(fs::exists(dir / "model-00001.gguf"));
    EXPECT_FALSE(fs::exists(dir / "model-00002.gguf"));
    EXPECT_FALSE(fs::exists(m_root / "single.bin"));
    EXPECT_TRUE(fs::exists(dir / "README.md"));
    EXPECT_FALSE(m_store.hasStateWrite(1));
}

TEST_F(DownloadSchedulerTest, ShutdownStopsRunningDownloads) {
    ScriptedDriver::Script script;
    script.blockUntilCancelled = true;
    auto driver = useDriver(script);
    auto scheduler = std::make_unique<DownloadScheduler>(m_store, m_drivers, options());

    scheduler->ensureRunning(addItem(1, 100));
    ASSERT_TRUE(waitUntil([&] { return driver->started(1); }));

    scheduler->shutdown();
    EXPECT_EQ(scheduler->activeCount(), 0u);
    EXPECT_FALSE(m_store.hasStateWrite(1));

    scheduler->ensureRunning(addItem(2, 100));
    EXPECT_EQ(scheduler->activeCount(), 0u) << "no new work after shutdown";
}
