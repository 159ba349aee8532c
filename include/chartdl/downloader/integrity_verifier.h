#pragma once

#include <chartdl/downloader/downloader.hpp>

#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace chartdl::downloader {

/**
 * Checksum descriptor (algorithm + lower-case hex digest).
 */
struct Checksum {
    HashAlgo algo{HashAlgo::Sha256};
    std::string hex;
};

/**
 * Streaming hash calculator.
 */
class IIntegrityVerifier {
public:
    virtual ~IIntegrityVerifier() = default;
    virtual void reset(HashAlgo algo) = 0;
    virtual void update(std::span<const std::byte> data) = 0;
    virtual Checksum finalize() = 0;
};

std::unique_ptr<IIntegrityVerifier> makeIntegrityVerifier(HashAlgo algo = HashAlgo::Sha256);

/**
 * Parse an expected digest. Accepts "sha256:<hex>", "sha512:<hex>", "md5:<hex>" or a bare
 * hex string whose length selects the algorithm (64, 128 or 32 characters).
 * Returns nullopt for anything else.
 */
[[nodiscard]] std::optional<Checksum> parseChecksum(std::string_view text);

/**
 * Digest of a whole file, read in fixed-size chunks.
 */
Expected<Checksum> computeFileDigest(const std::filesystem::path& file, HashAlgo algo);

/**
 * Compare the digest of file with expected (case-insensitive).
 * On mismatch the file is deleted and ErrorCode::ChecksumMismatch is returned.
 * An empty expected string skips verification.
 */
Expected<void> verifyFileChecksum(const std::filesystem::path& file, std::string_view expected);

} // namespace chartdl::downloader
