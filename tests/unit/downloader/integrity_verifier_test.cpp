#include <gtest/gtest.h>

#include <chartdl/downloader/integrity_verifier.h>

#include "support/temp_dir_scope.hpp"

#include <filesystem>

using namespace chartdl::downloader;
using chartdl::test_support::TempDirScope;
using chartdl::test_support::write_file;

namespace {
constexpr const char* kHelloSha256 =
    "2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824";
constexpr const char* kHelloMd5 = "5d41402abc4b2a76b9719d911017c592";
} // namespace

TEST(IntegrityVerifierTest, ParsesPrefixedAndBareDigests) {
    auto a = parseChecksum(std::string("sha256:") + kHelloSha256);
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->algo, HashAlgo::Sha256);

    auto b = parseChecksum(kHelloMd5);
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(b->algo, HashAlgo::Md5);

    auto upper = parseChecksum("MD5:5D41402ABC4B2A76B9719D911017C592");
    ASSERT_TRUE(upper.has_value());
    EXPECT_EQ(upper->hex, kHelloMd5);

    EXPECT_FALSE(parseChecksum("crc32:abcd").has_value());
    EXPECT_FALSE(parseChecksum("xyz").has_value());
    EXPECT_FALSE(parseChecksum("abcdef").has_value());
    EXPECT_FALSE(parseChecksum("").has_value());
    EXPECT_FALSE(parseChecksum("sha256:abc").has_value());
    EXPECT_FALSE(parseChecksum(std::string("sha512:") + kHelloSha256).has_value());
}

TEST(IntegrityVerifierTest, StreamingDigestMatchesKnownValue) {
    auto v = makeIntegrityVerifier(HashAlgo::Sha256);
    const char* parts[] = {"he", "ll", "o"};
    for (const char* p : parts) {
        v->update(std::span<const std::byte>(reinterpret_cast<const std::byte*>(p),
                                             std::char_traits<char>::length(p)));
    }
    EXPECT_EQ(v->finalize().hex, kHelloSha256);
}

TEST(IntegrityVerifierTest, MatchingFileIsKept) {
    auto dir = TempDirScope::unique_under("chartdl-iv");
    auto file = dir / "C1.zip.part";
    write_file(file, "hello");

    auto r = verifyFileChecksum(file, kHelloSha256);
    EXPECT_TRUE(r.ok());
    EXPECT_TRUE(std::filesystem::exists(file));

    auto md5 = computeFileDigest(file, HashAlgo::Md5);
    ASSERT_TRUE(md5.ok());
    EXPECT_EQ(md5.value().hex, kHelloMd5);
}

TEST(IntegrityVerifierTest, MismatchDeletesFile) {
    auto dir = TempDirScope::unique_under("chartdl-iv");
    auto file = dir / "C1.zip.part";
    write_file(file, "hellO");

    auto r = verifyFileChecksum(file, kHelloSha256);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, ErrorCode::ChecksumMismatch);
    EXPECT_FALSE(std::filesystem::exists(file));
}

TEST(IntegrityVerifierTest, EmptyExpectationSkipsAndGarbageIsRejected) {
    auto dir = TempDirScope::unique_under("chartdl-iv");
    auto file = dir / "C1.zip.part";
    write_file(file, "hello");

    EXPECT_TRUE(verifyFileChecksum(file, "").ok());

    auto bad = verifyFileChecksum(file, "not-a-digest");
    ASSERT_FALSE(bad.ok());
    EXPECT_EQ(bad.error().code, ErrorCode::InvalidArgument);
    EXPECT_TRUE(std::filesystem::exists(file));
}

TEST(IntegrityVerifierTest, MissingFileIsIoError) {
    auto dir = TempDirScope::unique_under("chartdl-iv");
    auto r = computeFileDigest(dir / "nope", HashAlgo::Sha256);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, ErrorCode::IoError);
}
