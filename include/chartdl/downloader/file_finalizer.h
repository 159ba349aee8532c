#pragma once

#include <chartdl/downloader/downloader.hpp>

#include <chrono>
#include <filesystem>
#include <functional>
#include <system_error>

namespace chartdl::downloader {

/**
 * Moves a finished "<final>.part" onto "<final>".
 *
 * Tries an atomic rename up to maxAttempts times, then copies, fsyncs, checks the
 * size and removes the partial. Whatever the path taken, exactly one of the two
 * files exists when commit() returns.
 */
class FileFinalizer {
public:
    using RenameFn = std::function<void(const std::filesystem::path& from,
                                        const std::filesystem::path& to, std::error_code& ec)>;

    explicit FileFinalizer(int maxAttempts = 3,
                           std::chrono::milliseconds retryDelay = std::chrono::milliseconds{50});

    /// Replace the rename primitive (tests simulate contention with it).
    void setRenameFunction(RenameFn fn) { rename_ = std::move(fn); }

    Expected<void> commit(const std::filesystem::path& partial,
                          const std::filesystem::path& destination) const;

private:
    Expected<void> copyThenDelete(const std::filesystem::path& partial,
                                  const std::filesystem::path& destination) const;

    int maxAttempts_;
    std::chrono::milliseconds retryDelay_;
    RenameFn rename_;
};

/// fsync a file; POSIX only, a no-op elsewhere.
Expected<void> syncFile(const std::filesystem::path& p);

/// fsync a directory so a new entry survives a crash; POSIX only.
Expected<void> syncDirectory(const std::filesystem::path& dir);

} // namespace chartdl::downloader
