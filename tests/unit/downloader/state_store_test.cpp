#include <gtest/gtest.h>

#include <chartdl/downloader/state_store.h>

#include "support/temp_dir_scope.hpp"

#include <filesystem>
#include <limits>
#include <string>

namespace fs = std::filesystem;
using namespace chartdl::downloader;
using chartdl::test_support::TempDirScope;
using chartdl::test_support::write_file;

namespace {

std::chrono::system_clock::time_point at(std::int64_t ms) {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

ResumeRecord record(const std::string& id, std::uint64_t bytes) {
    ResumeRecord r;
    r.chartId = id;
    r.originalUrl = "http://x/" + id + ".zip";
    r.downloadedBytes = bytes;
    r.lastAttempt = at(1714566600250);
    return r;
}

} // namespace

TEST(StateStoreTest, TimestampsAreIsoUtcWithMillis) {
    auto tp = at(1714566600250);
    auto text = formatTimestamp(tp);
    EXPECT_EQ(text, "2024-05-01T12:30:00.250Z");
    auto back = parseTimestamp(text);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(*back, tp);
    EXPECT_FALSE(parseTimestamp("yesterday").has_value());
}

TEST(StateStoreTest, SaveThenLoadRoundTrips) {
    auto dir = TempDirScope::unique_under("chartdl-state");
    StateStore store(dir.path());

    PersistedState st;
    DownloadTask t;
    t.chartId = "C2";
    t.url = "http://x/C2.zip";
    t.priority = DownloadPriority::High;
    t.expectedChecksum = "sha256:abc";
    t.addedAt = at(1714566600000);
    st.queue.push_back(t);

    DownloadProgress p;
    p.chartId = "C1";
    p.status = DownloadStatus::Paused;
    p.progress = 0.25;
    p.totalBytes = 400;
    p.downloadedBytes = 100;
    p.lastUpdated = at(1714566601000);
    p.url = "http://x/C1.zip";
    st.downloads["C1"] = p;

    auto rec = record("C1", 100);
    rec.supportsRange = true;
    rec.attempts = 2;
    rec.lastErrorCode = "networkTimeout";
    st.resumeData["C1"] = rec;

    ASSERT_TRUE(store.save(st).ok());
    EXPECT_TRUE(fs::exists(dir / ".download_state.json"));
    EXPECT_FALSE(fs::exists(dir / ".download_state.json.tmp"));

    auto loaded = store.load();
    ASSERT_EQ(loaded.outcome, LoadOutcome::Loaded);
    ASSERT_EQ(loaded.state.queue.size(), 1u);
    EXPECT_EQ(loaded.state.queue[0].chartId, "C2");
    EXPECT_EQ(loaded.state.queue[0].priority, DownloadPriority::High);
    EXPECT_EQ(loaded.state.queue[0].expectedChecksum, std::optional<std::string>("sha256:abc"));
    EXPECT_EQ(loaded.state.queue[0].addedAt, t.addedAt);

    ASSERT_EQ(loaded.state.downloads.count("C1"), 1u);
    const auto& lp = loaded.state.downloads.at("C1");
    EXPECT_EQ(lp.status, DownloadStatus::Paused);
    EXPECT_DOUBLE_EQ(lp.progress, 0.25);
    EXPECT_EQ(lp.totalBytes, std::optional<std::uint64_t>(400));
    EXPECT_EQ(lp.downloadedBytes, std::optional<std::uint64_t>(100));
    EXPECT_EQ(lp.url, p.url);
    EXPECT_EQ(lp.lastUpdated, p.lastUpdated);

    ASSERT_EQ(loaded.state.resumeData.count("C1"), 1u);
    const auto& lr = loaded.state.resumeData.at("C1");
    EXPECT_EQ(lr.originalUrl, rec.originalUrl);
    EXPECT_EQ(lr.downloadedBytes, 100u);
    EXPECT_EQ(lr.supportsRange, std::optional<bool>(true));
    EXPECT_EQ(lr.attempts, 2);
    EXPECT_EQ(lr.lastErrorCode, std::optional<std::string>("networkTimeout"));
    EXPECT_FALSE(lr.checksum.has_value());
}

TEST(StateStoreTest, MissingFileYieldsEmptyState) {
    auto dir = TempDirScope::unique_under("chartdl-state");
    StateStore store(dir.path());
    auto loaded = store.load();
    EXPECT_EQ(loaded.outcome, LoadOutcome::Missing);
    EXPECT_TRUE(loaded.state.queue.empty());
    EXPECT_TRUE(loaded.state.downloads.empty());
    EXPECT_TRUE(loaded.state.resumeData.empty());
}

TEST(StateStoreTest, CorruptFileYieldsEmptyState) {
    auto dir = TempDirScope::unique_under("chartdl-state");
    write_file(dir / ".download_state.json", "{ \"queue\": [ truncated");
    StateStore store(dir.path());
    auto loaded = store.load();
    EXPECT_EQ(loaded.outcome, LoadOutcome::Corrupt);
    EXPECT_TRUE(loaded.state.queue.empty());
    EXPECT_TRUE(loaded.state.resumeData.empty());
}

TEST(StateStoreTest, MalformedEntriesAreSkipped) {
    auto dir = TempDirScope::unique_under("chartdl-state");
    write_file(dir / ".download_state.json", R"({
        "queue": [ {"chartId": "A", "url": "http://x/A.zip", "priority": "low"}, {"url": 3} ],
        "downloads": { "B": {"status": "sideways"}, "C": {"status": "failed", "progress": 7} },
        "resumeData": { "D": {"downloadedBytes": 3} }
    })");
    StateStore store(dir.path());
    auto loaded = store.load();
    ASSERT_EQ(loaded.outcome, LoadOutcome::Loaded);
    ASSERT_EQ(loaded.state.queue.size(), 1u);
    EXPECT_EQ(loaded.state.queue[0].priority, DownloadPriority::Low);
    EXPECT_EQ(loaded.state.downloads.count("B"), 0u);
    ASSERT_EQ(loaded.state.downloads.count("C"), 1u);
    EXPECT_DOUBLE_EQ(loaded.state.downloads.at("C").progress, 1.0);
    EXPECT_TRUE(loaded.state.resumeData.empty());
}

TEST(StateStoreTest, OversizedAttemptCountIsClamped) {
    auto dir = TempDirScope::unique_under("chartdl-state");
    write_file(dir / ".download_state.json", R"({
        "resumeData": {
            "A": {"originalUrl": "http://x/A.zip", "attempts": 9223372036854775807},
            "B": {"originalUrl": "http://x/B.zip", "attempts": -4}
        }
    })");
    StateStore store(dir.path());
    auto loaded = store.load();
    ASSERT_EQ(loaded.outcome, LoadOutcome::Loaded);
    EXPECT_EQ(loaded.state.resumeData.at("A").attempts, std::numeric_limits<int>::max());
    EXPECT_EQ(loaded.state.resumeData.at("B").attempts, 0);
}

TEST(RecoverySweepTest, RepairsStaleByteCount) {
    auto dir = TempDirScope::unique_under("chartdl-sweep");
    write_file(dir / "C1.zip.part", std::string(50, 'x'));
    std::map<std::string, ResumeRecord> records{{"C1", record("C1", 10)}};

    auto report = sweepResumeRecords(records, dir.path());
    ASSERT_EQ(records.count("C1"), 1u);
    EXPECT_EQ(records.at("C1").downloadedBytes, 50u);
    EXPECT_EQ(report.repaired, std::vector<std::string>{"C1"});
}

TEST(RecoverySweepTest, ZeroLengthPartialIsPurged) {
    auto dir = TempDirScope::unique_under("chartdl-sweep");
    write_file(dir / "C1.zip.part", "");
    std::map<std::string, ResumeRecord> records{{"C1", record("C1", 42)}};

    auto report = sweepResumeRecords(records, dir.path());
    EXPECT_TRUE(records.empty());
    EXPECT_FALSE(fs::exists(dir / "C1.zip.part"));
    EXPECT_EQ(report.corrupt, std::vector<std::string>{"C1"});
}

TEST(RecoverySweepTest, OrphanRecordIsDropped) {
    auto dir = TempDirScope::unique_under("chartdl-sweep");
    std::map<std::string, ResumeRecord> records{{"C1", record("C1", 10)}};

    auto report = sweepResumeRecords(records, dir.path());
    EXPECT_TRUE(records.empty());
    EXPECT_EQ(report.orphaned, std::vector<std::string>{"C1"});
}

TEST(RecoverySweepTest, FinishedChartDropsRecordAndStalePartial) {
    auto dir = TempDirScope::unique_under("chartdl-sweep");
    write_file(dir / "C1.zip", "12345");
    write_file(dir / "C1.zip.part", "12");
    std::map<std::string, ResumeRecord> records{{"C1", record("C1", 2)}};

    auto report = sweepResumeRecords(records, dir.path());
    EXPECT_TRUE(records.empty());
    EXPECT_TRUE(fs::exists(dir / "C1.zip"));
    EXPECT_FALSE(fs::exists(dir / "C1.zip.part"));
    EXPECT_EQ(report.completed, std::vector<std::string>{"C1"});
}

TEST(RecoverySweepTest, SecondRunChangesNothing) {
    auto dir = TempDirScope::unique_under("chartdl-sweep");
    write_file(dir / "A.zip.part", std::string(30, 'a'));
    write_file(dir / "B.zip.part", "");
    write_file(dir / "C.zip", "done");
    write_file(dir / "D.zip.part", std::string(7, 'd'));
    std::map<std::string, ResumeRecord> records{{"A", record("A", 5)},
                                                {"B", record("B", 5)},
                                                {"C", record("C", 4)},
                                                {"D", record("D", 7)},
                                                {"E", record("E", 9)}};

    sweepResumeRecords(records, dir.path());
    auto once = records;
    auto second = sweepResumeRecords(records, dir.path());

    EXPECT_TRUE(second.empty());
    ASSERT_EQ(records.size(), once.size());
    for (const auto& [id, r] : once) {
        ASSERT_EQ(records.count(id), 1u);
        EXPECT_EQ(records.at(id).downloadedBytes, r.downloadedBytes);
    }
    EXPECT_EQ(records.size(), 2u);
    EXPECT_EQ(records.at("A").downloadedBytes, 30u);
    EXPECT_EQ(records.at("D").downloadedBytes, 7u);
}
