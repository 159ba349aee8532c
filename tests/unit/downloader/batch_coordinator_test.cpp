#include <gtest/gtest.h>

#include <chartdl/downloader/batch_coordinator.h>
#include <chartdl/downloader/metrics_collector.h>

#include <map>

using namespace chartdl::downloader;

namespace {

class BatchCoordinatorTest : public ::testing::Test {
protected:
    BatchCoordinatorTest()
        : batches_([this](std::string_view id) -> std::optional<DownloadProgress> {
              auto it = charts_.find(std::string(id));
              if (it == charts_.end())
                  return std::nullopt;
              return it->second;
          }) {}

    void set(const std::string& id, DownloadStatus status, double progress) {
        DownloadProgress p;
        p.chartId = id;
        p.status = status;
        p.progress = progress;
        charts_[id] = p;
        batches_.onChartUpdate(p);
    }

    std::map<std::string, DownloadProgress> charts_;
    BatchCoordinator batches_;
};

} // namespace

TEST_F(BatchCoordinatorTest, AggregatesMembers) {
    auto id = batches_.create({"A", "B", "C"});
    set("A", DownloadStatus::Completed, 1.0);
    set("B", DownloadStatus::Failed, 0.2);

    auto p = batches_.progress(id);
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->batchId, id);
    EXPECT_EQ(p->totalCharts, 3u);
    EXPECT_EQ(p->completedCharts, 1u);
    EXPECT_EQ(p->failedCharts, 1u);
    // C has no entry yet and counts as zero
    EXPECT_DOUBLE_EQ(p->overallProgress, 1.2 / 3.0);
    EXPECT_EQ(p->status, BatchStatus::InProgress);
}

TEST_F(BatchCoordinatorTest, CompletesWhenAllMembersAreTerminal) {
    auto id = batches_.create({"A", "B"});
    auto stream = batches_.subscribe(id);
    set("A", DownloadStatus::Completed, 1.0);
    set("B", DownloadStatus::Cancelled, 0.5);

    EXPECT_EQ(batches_.progress(id)->status, BatchStatus::Completed);
    std::optional<BatchDownloadProgress> last;
    while (auto v = stream->tryNext())
        last = v;
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last->status, BatchStatus::Completed);
}

TEST_F(BatchCoordinatorTest, ExplicitStatusIsNotOverridden) {
    auto id = batches_.create({"A"});
    EXPECT_TRUE(batches_.setStatus(id, BatchStatus::Cancelled));
    set("A", DownloadStatus::Cancelled, 0.0);
    EXPECT_EQ(batches_.progress(id)->status, BatchStatus::Cancelled);
    EXPECT_FALSE(batches_.setStatus("batch-unknown", BatchStatus::Paused));
}

TEST_F(BatchCoordinatorTest, UnrelatedUpdatesDoNotPublish) {
    auto id = batches_.create({"A"});
    auto stream = batches_.subscribe(id);
    set("Z", DownloadStatus::Completed, 1.0);
    EXPECT_FALSE(stream->tryNext().has_value());
}

TEST_F(BatchCoordinatorTest, UnknownBatchStreamIsClosed) {
    EXPECT_FALSE(batches_.progress("nope").has_value());
    EXPECT_FALSE(batches_.members("nope").has_value());
    EXPECT_TRUE(batches_.subscribe("nope")->closed());
}

TEST_F(BatchCoordinatorTest, IdsAreUnique) {
    auto a = batches_.create({"A"});
    auto b = batches_.create({"A"});
    EXPECT_NE(a, b);
    EXPECT_EQ(a.rfind("batch-", 0), 0u);
    EXPECT_EQ(batches_.batchIds().size(), 2u);
}

TEST_F(BatchCoordinatorTest, CloseAllClosesStreams) {
    auto id = batches_.create({"A"});
    auto stream = batches_.subscribe(id);
    batches_.closeAll();
    EXPECT_TRUE(stream->closed());
    auto later = batches_.create({"B"});
    EXPECT_TRUE(batches_.subscribe(later)->closed());
}

TEST(MetricsCollectorTest, CountsFinishedTransfersOnly) {
    MetricsCollector m;
    m.start("A");
    m.incrementRetry("A");
    m.completeSuccess("A");
    m.start("B");
    m.completeFailure("B", "timeout");
    m.start("C");
    m.discard("C");
    m.completeSuccess("never-started");

    auto snap = m.snapshot();
    EXPECT_EQ(snap.successCount, 1u);
    EXPECT_EQ(snap.failureCount, 1u);
    EXPECT_EQ(snap.retryCount, 1u);
    EXPECT_EQ(snap.failureByCategory.at("timeout"), 1u);
}
