#include <gtest/gtest.h>

#include <chartdl/downloader/file_finalizer.h>

#include "support/temp_dir_scope.hpp"

#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;
using namespace chartdl::downloader;
using chartdl::test_support::read_file;
using chartdl::test_support::TempDirScope;
using chartdl::test_support::write_file;

TEST(FileFinalizerTest, RenamesPartialOntoDestination) {
    auto dir = TempDirScope::unique_under("chartdl-fin");
    auto partial = dir / "C1.zip.part";
    auto dest = dir / "C1.zip";
    write_file(partial, "12345");

    FileFinalizer fin;
    auto r = fin.commit(partial, dest);
    ASSERT_TRUE(r.ok()) << r.error().message;
    EXPECT_FALSE(fs::exists(partial));
    EXPECT_EQ(read_file(dest), "12345");
}

TEST(FileFinalizerTest, ReplacesExistingDestination) {
    auto dir = TempDirScope::unique_under("chartdl-fin");
    auto partial = dir / "C1.zip.part";
    auto dest = dir / "C1.zip";
    write_file(dest, "old");
    write_file(partial, "new-content");

    FileFinalizer fin;
    ASSERT_TRUE(fin.commit(partial, dest).ok());
    EXPECT_EQ(read_file(dest), "new-content");
}

TEST(FileFinalizerTest, FallsBackToCopyAfterRenameRetries) {
    auto dir = TempDirScope::unique_under("chartdl-fin");
    auto partial = dir / "C1.zip.part";
    auto dest = dir / "C1.zip";
    write_file(partial, "abcdef");

    int renameCalls = 0;
    FileFinalizer fin(3, std::chrono::milliseconds(1));
    fin.setRenameFunction([&](const fs::path&, const fs::path&, std::error_code& ec) {
        ++renameCalls;
        ec = std::make_error_code(std::errc::device_or_resource_busy);
    });

    auto r = fin.commit(partial, dest);
    ASSERT_TRUE(r.ok()) << r.error().message;
    EXPECT_EQ(renameCalls, 3);
    EXPECT_FALSE(fs::exists(partial));
    EXPECT_EQ(read_file(dest), "abcdef");
}

TEST(FileFinalizerTest, CrossDeviceSkipsRemainingRenames) {
    auto dir = TempDirScope::unique_under("chartdl-fin");
    auto partial = dir / "C1.zip.part";
    auto dest = dir / "C1.zip";
    write_file(partial, "xyz");

    int renameCalls = 0;
    FileFinalizer fin(5, std::chrono::milliseconds(1));
    fin.setRenameFunction([&](const fs::path&, const fs::path&, std::error_code& ec) {
        ++renameCalls;
        ec = std::make_error_code(std::errc::cross_device_link);
    });

    ASSERT_TRUE(fin.commit(partial, dest).ok());
    EXPECT_EQ(renameCalls, 1);
    EXPECT_EQ(read_file(dest), "xyz");
    EXPECT_FALSE(fs::exists(partial));
}

TEST(FileFinalizerTest, MissingPartialIsNotFound) {
    auto dir = TempDirScope::unique_under("chartdl-fin");
    FileFinalizer fin;
    auto r = fin.commit(dir / "absent.part", dir / "absent");
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, ErrorCode::NotFound);
}
