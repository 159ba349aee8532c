/*
 * FileFinalizer:
 * - atomic rename of "<final>.part" onto "<final>", retried to absorb contention
 * - copy + fsync + delete fallback when rename keeps failing (e.g. EXDEV)
 * - rollback of the copied destination if the partial cannot be removed
 */

#include <chartdl/downloader/file_finalizer.h>

#include <spdlog/spdlog.h>

#include <fstream>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#if !defined(_WIN32)
#include <fcntl.h>
#include <unistd.h>
#endif

namespace chartdl::downloader {

namespace fs = std::filesystem;

Expected<void> syncFile(const fs::path& p) {
#if defined(_WIN32)
    (void)p;
    return Expected<void>{};
#else
    int fd = ::open(p.c_str(), O_RDONLY);
    if (fd < 0) {
        return Error{ErrorCode::IoError, "open() failed for fsync: " + p.string()};
    }
    if (::fsync(fd) != 0) {
        ::close(fd);
        return Error{ErrorCode::IoError, "fsync() failed for: " + p.string()};
    }
    ::close(fd);
    return Expected<void>{};
#endif
}

Expected<void> syncDirectory(const fs::path& dir) {
#if defined(_WIN32)
    (void)dir;
    return Expected<void>{};
#else
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        return Error{ErrorCode::IoError, "open(O_DIRECTORY) failed for: " + dir.string()};
    }
    if (::fsync(fd) != 0) {
        ::close(fd);
        return Error{ErrorCode::IoError, "fsync(dir) failed for: " + dir.string()};
    }
    ::close(fd);
    return Expected<void>{};
#endif
}

FileFinalizer::FileFinalizer(int maxAttempts, std::chrono::milliseconds retryDelay)
    : maxAttempts_(maxAttempts < 1 ? 1 : maxAttempts), retryDelay_(retryDelay),
      rename_([](const fs::path& from, const fs::path& to, std::error_code& ec) {
          fs::rename(from, to, ec);
      }) {}

Expected<void> FileFinalizer::commit(const fs::path& partial, const fs::path& destination) const {
    std::error_code ec;
    if (!fs::exists(partial, ec)) {
        return Error{ErrorCode::NotFound, "Partial file missing: " + partial.string()};
    }

    auto rs = syncFile(partial);
    if (!rs.ok()) {
        spdlog::debug("fsync before finalize failed (continuing): {}", rs.error().message);
    }

    std::error_code renameEc;
    for (int attempt = 1; attempt <= maxAttempts_; ++attempt) {
        renameEc.clear();
        rename_(partial, destination, renameEc);
        if (!renameEc) {
            auto rd = syncDirectory(destination.parent_path());
            if (!rd.ok()) {
                spdlog::debug("fsync on charts dir failed (continuing): {}", rd.error().message);
            }
            return Expected<void>{};
        }
        spdlog::debug("Rename attempt {}/{} failed for {}: {}", attempt, maxAttempts_,
                      destination.string(), renameEc.message());
        if (renameEc == std::errc::cross_device_link)
            break;
        if (attempt < maxAttempts_)
            std::this_thread::sleep_for(retryDelay_);
    }

    spdlog::warn("Rename failed ({}); falling back to copy for {}", renameEc.message(),
                 destination.string());
    return copyThenDelete(partial, destination);
}

Expected<void> FileFinalizer::copyThenDelete(const fs::path& partial,
                                             const fs::path& destination) const {
    std::error_code ec;
    auto expectedSize = fs::file_size(partial, ec);
    if (ec) {
        return Error{ErrorCode::IoError, "stat failed for " + partial.string() + ": " + ec.message()};
    }

    auto discardCopy = [&destination]() {
        std::error_code rm;
        fs::remove(destination, rm);
        if (rm) {
            spdlog::warn("Failed to remove incomplete copy {}: {}", destination.string(),
                         rm.message());
        }
    };

    {
        std::ifstream is(partial, std::ios::binary);
        if (!is.good()) {
            return Error{ErrorCode::IoError, "copy: failed to open source: " + partial.string()};
        }
        std::ofstream os(destination, std::ios::binary | std::ios::trunc);
        if (!os.good()) {
            return Error{ErrorCode::IoError,
                         "copy: failed to open destination: " + destination.string()};
        }
        std::vector<char> buffer(1 << 20);
        while (is.good()) {
            is.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            std::streamsize got = is.gcount();
            if (got > 0) {
                os.write(buffer.data(), got);
                if (!os.good()) {
                    os.close();
                    discardCopy();
                    return Error{ErrorCode::IoError,
                                 "copy: write failed for destination: " + destination.string()};
                }
            }
        }
        if (!is.eof()) {
            os.close();
            discardCopy();
            return Error{ErrorCode::IoError, "copy: read failed for source: " + partial.string()};
        }
    }

    auto rf = syncFile(destination);
    if (!rf.ok()) {
        discardCopy();
        return rf;
    }

    auto copiedSize = fs::file_size(destination, ec);
    if (ec || copiedSize != expectedSize) {
        discardCopy();
        return Error{ErrorCode::IoError, "copy: size mismatch for " + destination.string()};
    }

    fs::remove(partial, ec);
    if (ec) {
        // keep the partial as the single surviving file
        discardCopy();
        return Error{ErrorCode::IoError,
                     "copy: could not remove partial " + partial.string() + ": " + ec.message()};
    }

    auto rd = syncDirectory(destination.parent_path());
    if (!rd.ok()) {
        spdlog::debug("fsync on charts dir failed (continuing): {}", rd.error().message);
    }
    return Expected<void>{};
}

} // namespace chartdl::downloader
