#include <gtest/gtest.h>

#include <chartdl/downloader/resume_registry.h>
#include <chartdl/downloader/snapshot_writer.h>

#include "support/temp_dir_scope.hpp"

#include <atomic>
#include <mutex>
#include <thread>

using namespace chartdl::downloader;
using chartdl::test_support::TempDirScope;

namespace {

PersistedState stateWith(const std::string& chartId) {
    PersistedState st;
    DownloadTask t;
    t.chartId = chartId;
    t.url = "http://x/" + chartId + ".zip";
    st.queue.push_back(t);
    return st;
}

} // namespace

TEST(SnapshotWriterTest, RequestEventuallyWritesLatestState) {
    auto dir = TempDirScope::unique_under("chartdl-writer");
    StateStore store(dir.path());
    std::atomic<int> provided{0};
    SnapshotWriter writer(store, [&] {
        ++provided;
        return stateWith("C1");
    });
    writer.start();
    for (int i = 0; i < 10; ++i)
        writer.request();

    LoadResult loaded;
    for (int i = 0; i < 500; ++i) {
        loaded = store.load();
        if (loaded.outcome == LoadOutcome::Loaded)
            break;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    writer.stop();
    ASSERT_EQ(loaded.outcome, LoadOutcome::Loaded);
    ASSERT_EQ(loaded.state.queue.size(), 1u);
    EXPECT_EQ(loaded.state.queue[0].chartId, "C1");
    EXPECT_LT(provided.load(), 10);
}

TEST(SnapshotWriterTest, FlushWritesSynchronously) {
    auto dir = TempDirScope::unique_under("chartdl-writer");
    StateStore store(dir.path());
    SnapshotWriter writer(store, [] { return stateWith("C2"); });
    ASSERT_TRUE(writer.flush().ok());
    auto loaded = store.load();
    EXPECT_EQ(loaded.outcome, LoadOutcome::Loaded);
    EXPECT_EQ(loaded.state.queue.at(0).chartId, "C2");
}

TEST(SnapshotWriterTest, FlushLandsAfterSlowBackgroundWrite) {
    auto dir = TempDirScope::unique_under("chartdl-writer");
    StateStore store(dir.path());

    std::mutex stateMutex;
    std::string current = "C1";
    std::atomic<int> calls{0};
    std::atomic<bool> backgroundRead{false};
    SnapshotWriter writer(
        store,
        [&] {
            std::string id;
            {
                std::lock_guard<std::mutex> lk(stateMutex);
                id = current;
            }
            if (calls.fetch_add(1) == 0) {
                backgroundRead = true;
                // hold the old snapshot while the state moves on
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
            return stateWith(id);
        },
        std::chrono::milliseconds(0));
    writer.start();
    writer.request();

    for (int i = 0; i < 500 && !backgroundRead; ++i)
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    ASSERT_TRUE(backgroundRead.load());
    {
        std::lock_guard<std::mutex> lk(stateMutex);
        current = "C2";
    }
    ASSERT_TRUE(writer.flush().ok());
    writer.stop();

    auto loaded = store.load();
    ASSERT_EQ(loaded.outcome, LoadOutcome::Loaded);
    ASSERT_EQ(loaded.state.queue.size(), 1u);
    EXPECT_EQ(loaded.state.queue[0].chartId, "C2");
}

TEST(SnapshotWriterTest, RequestsAfterStopAreIgnored) {
    auto dir = TempDirScope::unique_under("chartdl-writer");
    StateStore store(dir.path());
    SnapshotWriter writer(store, [] { return stateWith("C3"); });
    writer.start();
    writer.stop();
    writer.request();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(store.load().outcome, LoadOutcome::Missing);
}

TEST(ResumeRegistryTest, PutUpdateErase) {
    ResumeRegistry reg;
    ResumeRecord r;
    r.chartId = "C1";
    r.originalUrl = "http://x/C1.zip";
    r.downloadedBytes = 10;
    reg.put(r);

    auto updated = reg.update("C1", [](ResumeRecord& rec) { rec.downloadedBytes = 20; });
    ASSERT_TRUE(updated.has_value());
    EXPECT_EQ(updated->downloadedBytes, 20u);
    EXPECT_EQ(reg.get("C1")->downloadedBytes, 20u);
    EXPECT_FALSE(reg.update("C9", [](ResumeRecord&) {}).has_value());

    EXPECT_TRUE(reg.erase("C1"));
    EXPECT_FALSE(reg.erase("C1"));
    EXPECT_TRUE(reg.all().empty());
}

TEST(ResumeRegistryTest, ReplaceAllSwapsTable) {
    ResumeRegistry reg;
    ResumeRecord a;
    a.chartId = "A";
    reg.put(a);
    ResumeRecord b;
    b.chartId = "B";
    reg.replaceAll({{"B", b}});
    EXPECT_FALSE(reg.get("A").has_value());
    EXPECT_TRUE(reg.get("B").has_value());
}
