#pragma once

#include <chartdl/downloader/batch_coordinator.h>
#include <chartdl/downloader/download_queue.h>
#include <chartdl/downloader/downloader.hpp>
#include <chartdl/downloader/metrics_collector.h>
#include <chartdl/downloader/progress_tracker.h>
#include <chartdl/downloader/resume_registry.h>
#include <chartdl/downloader/snapshot_writer.h>
#include <chartdl/downloader/state_store.h>
#include <chartdl/downloader/transfer_engine.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace chartdl::downloader {

struct ManagerOptions {
    DownloaderConfig config{};
    /// Hold admissions until resumeQueue() is called.
    bool startPaused{false};
    /// Receives terminal failures; defaults to logging at error level.
    ErrorHook errorHook{};
};

enum class NotificationKind { Completed, Failed };

struct DownloadNotification {
    std::string chartId;
    NotificationKind kind{NotificationKind::Completed};
    std::string message;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct RecoveryReport {
    LoadOutcome load{LoadOutcome::Missing};
    SweepReport sweep{};
    std::vector<std::string> requeued;
};

/**
 * Owns the queue, progress, resume records and batches for one charts directory.
 *
 * Construction loads the state file and runs the recovery sweep before the
 * scheduler thread may admit anything. A scheduler thread admits queued tasks
 * while fewer than maxConcurrent transfers run; each admitted task runs on its
 * own worker thread. dispose() (or the destructor) stops everything and writes
 * a final snapshot.
 */
class DownloadManager {
public:
    using Result = Expected<TransferOutcome>;

    DownloadManager(ManagerOptions options, std::shared_ptr<ITransportClient> transport);
    ~DownloadManager();

    DownloadManager(const DownloadManager&) = delete;
    DownloadManager& operator=(const DownloadManager&) = delete;

    // ----- queue -----

    /// Returns false when the chart is already queued or running.
    bool enqueue(DownloadTask task);
    bool addToQueue(const std::string& chartId, const std::string& url,
                    DownloadPriority priority = DownloadPriority::Normal,
                    std::optional<std::string> expectedChecksum = std::nullopt);
    bool removeFromQueue(std::string_view chartId);
    void clearQueue();
    [[nodiscard]] std::vector<DownloadTask> getDetailedQueue() const;

    void pauseQueue();
    void resumeQueue();
    [[nodiscard]] bool isQueuePaused() const;

    // ----- single downloads -----

    /// Enqueue (if needed) and block until the chart reaches a terminal or stopped state.
    Result downloadChart(const std::string& chartId, const std::string& url,
                         std::optional<std::string> expectedChecksum = std::nullopt,
                         DownloadPriority priority = DownloadPriority::Normal);

    /// Future for the next outcome of a queued or running chart.
    std::shared_future<Result> awaitCompletion(const std::string& chartId);

    Expected<void> pauseDownload(const std::string& chartId);
    Expected<void> resumeDownload(const std::string& chartId,
                                  std::optional<std::string> url = std::nullopt);
    Expected<void> cancelDownload(const std::string& chartId);

    // ----- progress -----

    [[nodiscard]] std::optional<DownloadProgress> getProgress(std::string_view chartId) const;
    [[nodiscard]] std::map<std::string, DownloadProgress> getAllProgress() const;
    std::shared_ptr<ProgressStream> subscribeProgress(const std::string& chartId);
    bool clearProgress(std::string_view chartId);

    // ----- batches -----

    Expected<std::string> startBatchDownload(const std::vector<std::string>& chartIds,
                                             const std::vector<std::string>& urls,
                                             DownloadPriority priority = DownloadPriority::Normal);
    [[nodiscard]] std::optional<BatchDownloadProgress> getBatchProgress(
        std::string_view batchId) const;
    std::shared_ptr<BatchProgressStream> subscribeBatchProgress(const std::string& batchId);
    Expected<void> pauseBatch(const std::string& batchId);
    Expected<void> resumeBatch(const std::string& batchId);
    Expected<void> cancelBatch(const std::string& batchId);

    // ----- concurrency -----

    [[nodiscard]] std::size_t getMaxConcurrentDownloads() const;
    void setMaxConcurrentDownloads(std::size_t n);
    [[nodiscard]] std::size_t activeDownloadCount() const;

    // ----- persistence / recovery -----

    /**
     * Merge progress the host remembers from a previous run. Downloading or queued
     * entries with a known URL are queued again; paused entries stay paused.
     */
    RecoveryReport recoverDownloads(const std::vector<DownloadProgress>& previouslyKnown);
    [[nodiscard]] const RecoveryReport& startupReport() const noexcept { return startup_; }

    [[nodiscard]] std::optional<ResumeRecord> getResumeData(std::string_view chartId) const;
    [[nodiscard]] PersistedState currentState() const;
    Expected<void> saveState();

    // ----- extras -----

    void enableNotifications(bool enabled);
    std::vector<DownloadNotification> takePendingNotifications();
    [[nodiscard]] DownloadMetricsSnapshot metrics() const;

    /// Re-enqueue failed downloads whose cause was the network. Returns how many.
    std::size_t requeueTransientFailures();

    /// True once the queue is empty and nothing runs, false on timeout.
    bool waitForIdle(std::chrono::milliseconds timeout);

    void dispose();

    [[nodiscard]] const DownloaderConfig& config() const noexcept { return options_.config; }

private:
    // What to do once a paused transfer has actually stopped.
    enum class FollowUp { None, Resume, Cancel };

    struct ActiveTransfer {
        DownloadTask task;
        CancelToken token;
        std::thread worker;
        bool finished{false};
        FollowUp followUp{FollowUp::None};
    };

    void restoreFromDisk();
    void schedulerLoop();
    void reapFinishedLocked(std::vector<std::thread>& joinable);
    std::size_t runningCountLocked() const;
    void startTransferLocked(DownloadTask task, std::vector<std::thread>& joinable);
    void runTransfer(DownloadTask task, CancelToken token);
    void completeWaitersLocked(const std::string& chartId, const Result& result);
    void handleOutcome(const DownloadTask& task, const Result& result);
    void notify(NotificationKind kind, const std::string& chartId, const std::string& message);
    void wakeScheduler();
    std::optional<std::string> knownUrl(const std::string& chartId) const;
    void discardPartial(const std::string& chartId);

    ManagerOptions options_;
    std::shared_ptr<ITransportClient> transport_;

    StateStore store_;
    DownloadQueue queue_;
    ResumeRegistry resume_;
    ProgressTracker progress_;
    MetricsCollector metrics_;
    BatchCoordinator batches_;
    TransferEngine engine_;
    SnapshotWriter writer_;
    RecoveryReport startup_;

    mutable std::mutex schedMutex_;
    std::condition_variable schedCv_;
    std::condition_variable idleCv_;
    std::map<std::string, ActiveTransfer> active_;
    std::map<std::string, std::shared_ptr<std::promise<Result>>> waiters_;
    std::map<std::string, std::shared_future<Result>> waiterFutures_;
    bool wake_{false};
    bool stopping_{false};
    bool queuePaused_{false};
    std::thread scheduler_;

    std::mutex notifyMutex_;
    bool notificationsEnabled_{false};
    std::vector<DownloadNotification> notifications_;

    std::atomic<bool> disposed_{false};
};

} // namespace chartdl::downloader
