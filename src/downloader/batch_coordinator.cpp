#include <chartdl/downloader/batch_coordinator.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>

namespace chartdl::downloader {

namespace {

std::string makeBatchId(std::uint64_t counter) {
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      std::chrono::system_clock::now().time_since_epoch())
                      .count();
    std::string id{"batch-"};
    id.append(std::to_string(now_ms));
    id.push_back('-');
    id.append(std::to_string(counter));
    return id;
}

} // namespace

BatchCoordinator::BatchCoordinator(ProgressLookup lookup) : lookup_(std::move(lookup)) {}

std::string BatchCoordinator::create(std::vector<std::string> chartIds) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto id = makeBatchId(++counter_);
    Batch b;
    b.chartIds = std::move(chartIds);
    b.channel = std::make_shared<ProgressChannel<BatchDownloadProgress>>();
    if (closed_)
        b.channel->close();
    spdlog::info("Batch {} started with {} charts", id, b.chartIds.size());
    batches_.emplace(id, std::move(b));
    return id;
}

std::optional<std::vector<std::string>> BatchCoordinator::members(std::string_view batchId) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = batches_.find(batchId);
    if (it == batches_.end())
        return std::nullopt;
    return it->second.chartIds;
}

std::optional<BatchDownloadProgress> BatchCoordinator::progress(std::string_view batchId) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = batches_.find(batchId);
    if (it == batches_.end())
        return std::nullopt;
    return aggregateLocked(it->first, it->second);
}

std::vector<std::string> BatchCoordinator::batchIds() const {
    std::lock_guard<std::mutex> lk(mutex_);
    std::vector<std::string> ids;
    ids.reserve(batches_.size());
    for (const auto& [id, b] : batches_)
        ids.push_back(id);
    return ids;
}

bool BatchCoordinator::setStatus(std::string_view batchId, BatchStatus status) {
    std::vector<std::pair<std::shared_ptr<ProgressChannel<BatchDownloadProgress>>,
                          BatchDownloadProgress>>
        out;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = batches_.find(batchId);
        if (it == batches_.end())
            return false;
        it->second.status = status;
        publishLocked(it->first, it->second, out);
    }
    for (auto& [ch, snap] : out)
        ch->publish(snap);
    return true;
}

void BatchCoordinator::onChartUpdate(const DownloadProgress& update) {
    std::vector<std::pair<std::shared_ptr<ProgressChannel<BatchDownloadProgress>>,
                          BatchDownloadProgress>>
        out;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        for (auto& [id, batch] : batches_) {
            if (std::find(batch.chartIds.begin(), batch.chartIds.end(), update.chartId) ==
                batch.chartIds.end())
                continue;
            publishLocked(id, batch, out);
        }
    }
    for (auto& [ch, snap] : out)
        ch->publish(snap);
}

std::shared_ptr<BatchProgressStream> BatchCoordinator::subscribe(const std::string& batchId) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = batches_.find(batchId);
    if (it == batches_.end()) {
        // unknown batch: hand back a stream that is already finished
        ProgressChannel<BatchDownloadProgress> dead;
        dead.close();
        return dead.subscribe();
    }
    return it->second.channel->subscribe();
}

void BatchCoordinator::closeAll() {
    std::vector<std::shared_ptr<ProgressChannel<BatchDownloadProgress>>> channels;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        closed_ = true;
        for (auto& [id, b] : batches_)
            channels.push_back(b.channel);
    }
    for (auto& ch : channels)
        ch->close();
}

BatchDownloadProgress BatchCoordinator::aggregateLocked(const std::string& batchId,
                                                        const Batch& batch) const {
    BatchDownloadProgress agg;
    agg.batchId = batchId;
    agg.totalCharts = batch.chartIds.size();
    agg.status = batch.status;
    double sum = 0.0;
    for (const auto& chartId : batch.chartIds) {
        auto p = lookup_ ? lookup_(chartId) : std::nullopt;
        if (!p)
            continue;
        sum += std::clamp(p->progress, 0.0, 1.0);
        if (p->status == DownloadStatus::Completed)
            ++agg.completedCharts;
        else if (p->status == DownloadStatus::Failed)
            ++agg.failedCharts;
    }
    agg.overallProgress = agg.totalCharts ? sum / static_cast<double>(agg.totalCharts) : 0.0;
    return agg;
}

void BatchCoordinator::publishLocked(
    const std::string& batchId, Batch& batch,
    std::vector<std::pair<std::shared_ptr<ProgressChannel<BatchDownloadProgress>>,
                          BatchDownloadProgress>>& out) {
    if (batch.status == BatchStatus::InProgress) {
        bool allTerminal = !batch.chartIds.empty();
        for (const auto& chartId : batch.chartIds) {
            auto p = lookup_ ? lookup_(chartId) : std::nullopt;
            if (!p || !isTerminal(p->status)) {
                allTerminal = false;
                break;
            }
        }
        if (allTerminal) {
            batch.status = BatchStatus::Completed;
            spdlog::info("Batch {} finished", batchId);
        }
    }
    out.emplace_back(batch.channel, aggregateLocked(batchId, batch));
}

} // namespace chartdl::downloader
