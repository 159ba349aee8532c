#include <gtest/gtest.h>

#include <chartdl/downloader/progress_channel.h>
#include <chartdl/downloader/progress_tracker.h>

#include <chrono>
#include <thread>

using namespace chartdl::downloader;

TEST(ProgressChannelTest, FansOutToEverySubscriber) {
    ProgressChannel<int> ch;
    auto a = ch.subscribe();
    auto b = ch.subscribe();
    ch.publish(1);
    ch.publish(2);

    EXPECT_EQ(a->tryNext(), std::optional<int>(1));
    EXPECT_EQ(a->tryNext(), std::optional<int>(2));
    EXPECT_FALSE(a->tryNext().has_value());
    EXPECT_EQ(b->tryNext(), std::optional<int>(1));
    EXPECT_EQ(ch.subscriberCount(), 2u);
}

TEST(ProgressChannelTest, LateSubscriberMissesEarlierValues) {
    ProgressChannel<int> ch;
    ch.publish(7);
    auto s = ch.subscribe();
    EXPECT_FALSE(s->tryNext().has_value());
}

TEST(ProgressChannelTest, FullSubscriberDropsOldest) {
    ProgressChannel<int> ch(2);
    auto s = ch.subscribe();
    ch.publish(1);
    ch.publish(2);
    ch.publish(3);
    EXPECT_EQ(s->dropped(), 1u);
    EXPECT_EQ(s->tryNext(), std::optional<int>(2));
    EXPECT_EQ(s->tryNext(), std::optional<int>(3));
}

TEST(ProgressChannelTest, ReleasedSubscriptionsArePruned) {
    ProgressChannel<int> ch;
    {
        auto s = ch.subscribe();
        EXPECT_EQ(ch.subscriberCount(), 1u);
    }
    ch.publish(1);
    EXPECT_EQ(ch.subscriberCount(), 0u);
}

TEST(ProgressChannelTest, CloseEndsStreamsAfterDrain) {
    ProgressChannel<int> ch;
    auto s = ch.subscribe();
    ch.publish(5);
    ch.close();
    ch.publish(6);

    EXPECT_FALSE(s->closed());
    EXPECT_EQ(s->tryNext(), std::optional<int>(5));
    EXPECT_TRUE(s->closed());
    EXPECT_TRUE(ch.subscribe()->closed());
}

TEST(ProgressChannelTest, WaitNextTimesOutOrWakes) {
    ProgressChannel<int> ch;
    auto s = ch.subscribe();
    EXPECT_FALSE(s->waitNext(std::chrono::milliseconds(10)).has_value());

    std::thread producer([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        ch.publish(42);
    });
    auto v = s->waitNext(std::chrono::seconds(5));
    producer.join();
    EXPECT_EQ(v, std::optional<int>(42));
}

TEST(ProgressTrackerTest, ProgressNeverMovesBackwards) {
    ProgressTracker tracker(std::chrono::milliseconds(0));
    tracker.begin("C1", "http://x/C1.zip");
    tracker.reportBytes("C1", 60, 100);
    tracker.reportBytes("C1", 40, 100);
    EXPECT_DOUBLE_EQ(tracker.get("C1")->progress, 0.6);
    EXPECT_EQ(tracker.get("C1")->downloadedBytes, std::optional<std::uint64_t>(40));
}

TEST(ProgressTrackerTest, ThrottleHoldsBackByteReportsButNotTransitions) {
    ProgressTracker tracker(std::chrono::hours(1));
    auto s = tracker.subscribe("C1");
    tracker.begin("C1", "http://x/C1.zip");
    tracker.reportBytes("C1", 10, 100);
    tracker.reportBytes("C1", 20, 100);
    tracker.markCompleted("C1", 100);

    auto first = s->tryNext();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->status, DownloadStatus::Downloading);
    auto second = s->tryNext();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->status, DownloadStatus::Completed);
    EXPECT_DOUBLE_EQ(second->progress, 1.0);
    EXPECT_FALSE(s->tryNext().has_value());
}

TEST(ProgressTrackerTest, BytesIgnoredUnlessDownloading) {
    ProgressTracker tracker(std::chrono::milliseconds(0));
    tracker.markQueued("C1", std::string("http://x/C1.zip"));
    tracker.reportBytes("C1", 10, 100);
    EXPECT_DOUBLE_EQ(tracker.get("C1")->progress, 0.0);
    EXPECT_EQ(tracker.get("C1")->status, DownloadStatus::Queued);
}

TEST(ProgressTrackerTest, FailureCarriesCategory) {
    ProgressTracker tracker;
    tracker.begin("C1", "http://x/C1.zip");
    tracker.markFailed("C1", Error{ErrorCode::InsufficientDiskSpace, "disk full"});
    auto p = tracker.get("C1");
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->status, DownloadStatus::Failed);
    EXPECT_EQ(p->errorCategory, std::optional<std::string>("disk"));
    EXPECT_EQ(p->errorMessage, std::optional<std::string>("disk full"));
}

TEST(ProgressTrackerTest, RestoreKeepsLiveEntries) {
    ProgressTracker tracker;
    tracker.markQueued("C1", std::nullopt);
    DownloadProgress stale;
    stale.status = DownloadStatus::Failed;
    stale.progress = 3.0;
    tracker.restore({{"C1", stale}, {"C2", stale}});
    EXPECT_EQ(tracker.get("C1")->status, DownloadStatus::Queued);
    EXPECT_EQ(tracker.get("C2")->status, DownloadStatus::Failed);
    EXPECT_DOUBLE_EQ(tracker.get("C2")->progress, 1.0);
    EXPECT_EQ(tracker.get("C2")->chartId, "C2");
}

TEST(ProgressTrackerTest, ChannelsOnlyLiveWhileSubscribed) {
    ProgressTracker tracker(std::chrono::milliseconds(0));
    tracker.begin("C1", "http://x/C1.zip");
    tracker.begin("C2", "http://x/C2.zip");
    EXPECT_EQ(tracker.channelCount(), 0u);

    auto keep = tracker.subscribe("C1");
    auto gone = tracker.subscribe("C2");
    EXPECT_EQ(tracker.channelCount(), 2u);

    gone.reset();
    EXPECT_TRUE(tracker.clear("C2"));
    EXPECT_EQ(tracker.channelCount(), 1u);

    EXPECT_TRUE(tracker.clear("C1"));
    EXPECT_EQ(tracker.channelCount(), 1u);
    tracker.markQueued("C1", std::nullopt);
    auto v = keep->tryNext();
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->status, DownloadStatus::Queued);
}
