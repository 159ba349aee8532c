#pragma once

#include <chartdl/downloader/downloader.hpp>
#include <chartdl/downloader/file_finalizer.h>

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>

namespace chartdl::downloader {

class MetricsCollector;
class ProgressTracker;
class ResumeRegistry;

/**
 * Drives one chart download from admission to a terminal state:
 * HEAD preflight, disk-space check, resumable streamed transfer into
 * "<final>.part", retry with exponential backoff, checksum verification and
 * finalization.
 *
 * The resume record always mirrors the real partial file size when execute()
 * returns. Progress transitions are published through the tracker.
 */
class TransferEngine {
public:
    using SaveRequest = std::function<void()>;

    TransferEngine(ITransportClient& transport, ResumeRegistry& resume, ProgressTracker& progress,
                   const DownloaderConfig& config, SaveRequest requestSave,
                   MetricsCollector* metrics = nullptr);

    /**
     * Run task until it completes, fails, or the token stops it.
     * A stopped transfer returns Paused, Cancelled or Interrupted; any failure
     * returns exactly one classified Error.
     */
    Expected<TransferOutcome> execute(const DownloadTask& task, const CancelToken& token);

    /// Delay before retry number `attempt` (1-based).
    [[nodiscard]] std::chrono::milliseconds backoffFor(int attempt) const;

    [[nodiscard]] std::filesystem::path finalPath(const DownloadTask& task) const {
        return finalPathFor(config_.chartsDir, task.chartId, task.url);
    }

private:
    Expected<TransferOutcome> fail(const DownloadTask& task, const std::filesystem::path& partial,
                                   Error error);
    TransferOutcome stop(const DownloadTask& task, const std::filesystem::path& partial,
                         CancelReason reason);
    std::uint64_t syncRecordWithFile(const std::string& chartId,
                                     const std::filesystem::path& partial);
    std::optional<Error> checkDiskSpace(std::uint64_t expectedTotal, std::uint64_t alreadyOnDisk);
    void probeRangeSupport(const DownloadTask& task);

    ITransportClient& transport_;
    ResumeRegistry& resume_;
    ProgressTracker& progress_;
    const DownloaderConfig& config_;
    SaveRequest requestSave_;
    MetricsCollector* metrics_;
    FileFinalizer finalizer_;
};

} // namespace chartdl::downloader
