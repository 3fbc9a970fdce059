#include <gtest/gtest.h>
#include "upload/ProgressPublisher.hpp"
#include "upload/ProgressPoller.hpp"
#include "upload/TaskStore.hpp"
#include "storage/MemoryKeyValueStore.hpp"

#include <atomic>
#include <thread>

using namespace wb::upload;
using namespace wb::types;

class ProgressPublisherTest : public ::testing::Test {
protected:
    std::shared_ptr<TaskStore> store = std::make_shared<TaskStore>(std::make_shared<wb::storage::MemoryKeyValueStore>());
    std::shared_ptr<ProgressPublisher> publisher = std::make_shared<ProgressPublisher>(store);
};

TEST_F(ProgressPublisherTest, RefreshDeliversFullSnapshot) {
    store->add({"a", "/a", "a", "dropbox"});
    store->add({"b", "/b", "b", "dropbox"});
    store->updateProgress("b", 5, 10, "sid");

    std::vector<ProgressPublisher::Snapshot> seen;
    auto sub = publisher->subscribe([&](const ProgressPublisher::Snapshot& s) { seen.push_back(s); });

    publisher->refresh();

    ASSERT_EQ(seen.size(), 1u);
    ASSERT_EQ(seen[0].size(), 2u);
    EXPECT_EQ(seen[0][1].uploadedBytes, 5u);
    EXPECT_EQ(publisher->latest().size(), 2u);
}

TEST_F(ProgressPublisherTest, SubscriptionEndsWithItsHandle) {
    int calls = 0;
    {
        auto sub = publisher->subscribe([&](const ProgressPublisher::Snapshot&) { ++calls; });
        publisher->refresh();
        EXPECT_EQ(publisher->subscriberCount(), 1u);
    }
    publisher->refresh();
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(publisher->subscriberCount(), 0u);
}

TEST_F(ProgressPublisherTest, SubscriptionMayOutliveThePublisher) {
    auto sub = publisher->subscribe([](const ProgressPublisher::Snapshot&) {});
    publisher.reset();
    EXPECT_NO_THROW(sub.reset());
}

TEST_F(ProgressPublisherTest, ThrowingListenerDoesNotStarveOthers) {
    int delivered = 0;
    auto bad = publisher->subscribe([](const ProgressPublisher::Snapshot&) { throw std::runtime_error("listener bug"); });
    auto good = publisher->subscribe([&](const ProgressPublisher::Snapshot&) { ++delivered; });

    EXPECT_NO_THROW(publisher->refresh());
    EXPECT_EQ(delivered, 1);
}

TEST_F(ProgressPublisherTest, PollerRefreshesPeriodically) {
    std::atomic<int> refreshes{0};
    auto sub = publisher->subscribe([&](const ProgressPublisher::Snapshot&) { ++refreshes; });

    ProgressPoller poller(publisher, std::chrono::milliseconds(10));
    poller.start();
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    poller.stop();

    EXPECT_GE(refreshes.load(), 3);
    EXPECT_FALSE(poller.isRunning());
}
