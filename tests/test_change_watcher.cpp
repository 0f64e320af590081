/**
 * @file test_change_watcher.cpp
 * @brief Tests for event filtering, dispatch and resubscription
 */

#include <gtest/gtest.h>

#include "core/downloader/ChangeWatcher.hpp"
#include "test_common.hpp"

using modeld::ChangeEvent;
using modeld::ChangeType;
using modeld::HuggingFaceSource;
using modeld::WorkItemState;
using modeld::core::downloader::ChangeWatcher;
using modeld::test::RecordingSink;
using modeld::test::ScriptedChangeFeed;
using modeld::test::waitUntil;

using namespace std::chrono_literals;

namespace {

constexpr int64_t kWorkerId = 7;

ChangeEvent event(ChangeType type, int64_t id, int64_t workerId,
                  WorkItemState state = WorkItemState::Downloading) {
    ChangeEvent e;
    e.type = type;
    e.item.id = id;
    e.item.workerId = workerId;
    e.item.source = HuggingFaceSource{"org/model", "model.gguf"};
    e.item.state = state;
    return e;
}

} // namespace

TEST(ChangeWatcher, DispatchesOnlyThisWorkersItems) {
    ScriptedChangeFeed feed;
    RecordingSink sink;
    feed.addSession({{
        event(ChangeType::Created, 1, kWorkerId),
        event(ChangeType::Created, 2, kWorkerId + 1),
        event(ChangeType::Deleted, 3, kWorkerId + 1),
        event(ChangeType::Deleted, 4, kWorkerId),
    }});

    ChangeWatcher watcher(feed, sink, kWorkerId, 10ms);
    watcher.start();
    ASSERT_TRUE(waitUntil([&] { return feed.isIdle(); }));
    watcher.stop();

    EXPECT_EQ(sink.runningIds(), std::vector<int64_t>{1});
    EXPECT_EQ(sink.cancelledIds(), std::vector<int64_t>{4});
}

TEST(ChangeWatcher, IgnoresUpdatesThatAreNotDownloading) {
    ScriptedChangeFeed feed;
    RecordingSink sink;
    feed.addSession({{
        event(ChangeType::Updated, 1, kWorkerId, WorkItemState::Ready),
        event(ChangeType::Updated, 2, kWorkerId, WorkItemState::Error),
        event(ChangeType::Updated, 3, kWorkerId),
    }});

    ChangeWatcher watcher(feed, sink, kWorkerId, 10ms);
    watcher.start();
    ASSERT_TRUE(waitUntil([&] { return feed.isIdle(); }));
    watcher.stop();

    EXPECT_EQ(sink.runningIds(), std::vector<int64_t>{3});
    EXPECT_TRUE(sink.cancelledIds().empty());
}

TEST(ChangeWatcher, ResubscribesAfterFeedFailure) {
    ScriptedChangeFeed feed;
    RecordingSink sink;
    feed.addSession({{event(ChangeType::Created, 1, kWorkerId)}, true});
    feed.addSession({{event(ChangeType::Created, 2, kWorkerId)}, false});

    ChangeWatcher watcher(feed, sink, kWorkerId, 10ms);
    watcher.start();
    ASSERT_TRUE(waitUntil([&] { return feed.isIdle(); }));

    EXPECT_GE(watcher.getSubscriptionCount(), 3u);
    watcher.stop();

    EXPECT_EQ(sink.runningIds(), (std::vector<int64_t>{1, 2}));
    EXPECT_GE(feed.watchCalls(), 3);
}

TEST(ChangeWatcher, KeepsGoingWhenHandlerFails) {
    ScriptedChangeFeed feed;
    RecordingSink sink;
    sink.throwOnId = 1;
    feed.addSession({{
        event(ChangeType::Created, 1, kWorkerId),
        event(ChangeType::Created, 2, kWorkerId),
    }});

    ChangeWatcher watcher(feed, sink, kWorkerId, 10ms);
    watcher.start();
    ASSERT_TRUE(waitUntil([&] { return feed.isIdle(); }));
    watcher.stop();

    EXPECT_EQ(sink.runningIds(), std::vector<int64_t>{2});
}

TEST(ChangeWatcher, StopsPromptlyWhileWaitingToRetry) {
    ScriptedChangeFeed feed;
    RecordingSink sink;
    feed.addSession({{}, true});

    ChangeWatcher watcher(feed, sink, kWorkerId, std::chrono::milliseconds(60000));
    watcher.start();
    ASSERT_TRUE(waitUntil([&] { return feed.watchCalls() == 1; }));

    auto before = std::chrono::steady_clock::now();
    watcher.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - before, std::chrono::seconds(5));
    EXPECT_FALSE(watcher.isRunning());
}

TEST(ChangeWatcher, UnassignedItemsAreIgnored) {
    ScriptedChangeFeed feed;
    RecordingSink sink;
    ChangeWatcher watcher(feed, sink, kWorkerId, 10ms);

    auto unassigned = event(ChangeType::Created, 1, kWorkerId);
    unassigned.item.workerId.reset();
    watcher.handleEvent(unassigned);
    watcher.handleEvent(event(ChangeType::Heartbeat, 2, kWorkerId));

    EXPECT_TRUE(sink.runningIds().empty());
    EXPECT_TRUE(sink.cancelledIds().empty());
}
