#pragma once

#include <chartdl/downloader/downloader.hpp>
#include <chartdl/downloader/progress_channel.h>

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chartdl::downloader {

using BatchProgressStream = ProgressSubscription<BatchDownloadProgress>;

/**
 * Groups chart downloads under one batch id and aggregates their progress.
 * Member state is read through a lookup so the tracker stays the single source.
 */
class BatchCoordinator {
public:
    using ProgressLookup = std::function<std::optional<DownloadProgress>(std::string_view)>;

    explicit BatchCoordinator(ProgressLookup lookup);

    std::string create(std::vector<std::string> chartIds);

    [[nodiscard]] std::optional<std::vector<std::string>> members(std::string_view batchId) const;
    [[nodiscard]] std::optional<BatchDownloadProgress> progress(std::string_view batchId) const;
    [[nodiscard]] std::vector<std::string> batchIds() const;

    bool setStatus(std::string_view batchId, BatchStatus status);

    /// Recompute and publish every batch containing the chart.
    void onChartUpdate(const DownloadProgress& update);

    std::shared_ptr<BatchProgressStream> subscribe(const std::string& batchId);
    void closeAll();

private:
    struct Batch {
        std::vector<std::string> chartIds;
        BatchStatus status{BatchStatus::InProgress};
        std::shared_ptr<ProgressChannel<BatchDownloadProgress>> channel;
    };

    BatchDownloadProgress aggregateLocked(const std::string& batchId, const Batch& batch) const;
    void publishLocked(const std::string& batchId, Batch& batch,
                       std::vector<std::pair<std::shared_ptr<ProgressChannel<BatchDownloadProgress>>,
                                             BatchDownloadProgress>>& out);

    ProgressLookup lookup_;
    mutable std::mutex mutex_;
    std::map<std::string, Batch, std::less<>> batches_;
    std::uint64_t counter_{0};
    bool closed_{false};
};

} // namespace chartdl::downloader
