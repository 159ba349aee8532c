#include <chartdl/downloader/progress_tracker.h>

#include <algorithm>

namespace chartdl::downloader {

ProgressTracker::ProgressTracker(std::chrono::milliseconds throttle) : throttle_(throttle) {}

void ProgressTracker::setListener(Listener listener) {
    std::lock_guard<std::mutex> lk(mutex_);
    listener_ = std::move(listener);
}

template <typename Fn> void ProgressTracker::transition(const std::string& chartId, Fn&& mutate) {
    DownloadProgress snapshot;
    std::shared_ptr<ProgressChannel<DownloadProgress>> channel;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto& entry = entries_[chartId];
        entry.progress.chartId = chartId;
        mutate(entry);
        entry.progress.lastUpdated = std::chrono::system_clock::now();
        entry.lastPublish = std::chrono::steady_clock::now();
        snapshot = entry.progress;
        channel = findChannelLocked(chartId);
    }
    publish(channel, snapshot);
}

void ProgressTracker::begin(const std::string& chartId, const std::string& url) {
    transition(chartId, [&](Entry& e) {
        e.progress.status = DownloadStatus::Downloading;
        e.progress.progress = 0.0;
        e.progress.totalBytes.reset();
        e.progress.downloadedBytes = 0;
        e.progress.errorMessage.reset();
        e.progress.errorCategory.reset();
        e.progress.bytesPerSecond.reset();
        e.progress.etaSeconds.reset();
        e.progress.url = url;
        e.rateSampleAt = std::chrono::steady_clock::now();
        e.rateSampleBytes = 0;
    });
}

void ProgressTracker::reportBytes(const std::string& chartId, std::uint64_t downloaded,
                                  std::optional<std::uint64_t> total) {
    DownloadProgress snapshot;
    std::shared_ptr<ProgressChannel<DownloadProgress>> channel;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = entries_.find(chartId);
        if (it == entries_.end() || it->second.progress.status != DownloadStatus::Downloading)
            return;
        auto& e = it->second;
        auto now = std::chrono::steady_clock::now();

        if (total && *total > 0)
            e.progress.totalBytes = total;
        e.progress.downloadedBytes = downloaded;

        const auto& knownTotal = e.progress.totalBytes;
        bool reachedEnd = knownTotal && downloaded >= *knownTotal;
        if (!reachedEnd && now - e.lastPublish < throttle_)
            return;

        if (knownTotal && *knownTotal > 0) {
            double ratio = static_cast<double>(downloaded) / static_cast<double>(*knownTotal);
            ratio = std::clamp(ratio, 0.0, 1.0);
            e.progress.progress = std::max(e.progress.progress, ratio);
        }

        auto elapsed = std::chrono::duration<double>(now - e.rateSampleAt).count();
        if (elapsed > 0.0 && downloaded >= e.rateSampleBytes) {
            double bps = static_cast<double>(downloaded - e.rateSampleBytes) / elapsed;
            e.progress.bytesPerSecond = bps;
            if (knownTotal && bps > 0.0 && *knownTotal >= downloaded) {
                e.progress.etaSeconds =
                    static_cast<std::uint64_t>(static_cast<double>(*knownTotal - downloaded) / bps);
            }
        }
        e.rateSampleAt = now;
        e.rateSampleBytes = downloaded;

        e.lastPublish = now;
        e.progress.lastUpdated = std::chrono::system_clock::now();
        snapshot = e.progress;
        channel = findChannelLocked(chartId);
    }
    publish(channel, snapshot);
}

void ProgressTracker::markQueued(const std::string& chartId, const std::optional<std::string>& url) {
    transition(chartId, [&](Entry& e) {
        e.progress.status = DownloadStatus::Queued;
        e.progress.errorMessage.reset();
        e.progress.errorCategory.reset();
        if (url)
            e.progress.url = url;
    });
}

void ProgressTracker::markCompleted(const std::string& chartId, std::uint64_t bytes) {
    transition(chartId, [&](Entry& e) {
        e.progress.status = DownloadStatus::Completed;
        e.progress.progress = 1.0;
        e.progress.downloadedBytes = bytes;
        if (!e.progress.totalBytes || *e.progress.totalBytes < bytes)
            e.progress.totalBytes = bytes;
        e.progress.etaSeconds = 0;
        e.progress.errorMessage.reset();
        e.progress.errorCategory.reset();
    });
}

void ProgressTracker::markPaused(const std::string& chartId) {
    transition(chartId, [](Entry& e) {
        e.progress.status = DownloadStatus::Paused;
        e.progress.bytesPerSecond.reset();
        e.progress.etaSeconds.reset();
    });
}

void ProgressTracker::markCancelled(const std::string& chartId) {
    transition(chartId, [](Entry& e) {
        e.progress.status = DownloadStatus::Cancelled;
        e.progress.bytesPerSecond.reset();
        e.progress.etaSeconds.reset();
        e.progress.errorCategory = std::string(errorCategory(ErrorCode::Cancelled));
    });
}

void ProgressTracker::markFailed(const std::string& chartId, const Error& error) {
    transition(chartId, [&](Entry& e) {
        e.progress.status = DownloadStatus::Failed;
        e.progress.bytesPerSecond.reset();
        e.progress.etaSeconds.reset();
        e.progress.errorMessage = error.message;
        e.progress.errorCategory = std::string(errorCategory(error.code));
    });
}

std::optional<DownloadProgress> ProgressTracker::get(std::string_view chartId) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = entries_.find(chartId);
    if (it == entries_.end())
        return std::nullopt;
    return it->second.progress;
}

std::map<std::string, DownloadProgress> ProgressTracker::all() const {
    std::lock_guard<std::mutex> lk(mutex_);
    std::map<std::string, DownloadProgress> out;
    for (const auto& [id, e] : entries_)
        out.emplace(id, e.progress);
    return out;
}

void ProgressTracker::restore(const std::map<std::string, DownloadProgress>& entries) {
    std::lock_guard<std::mutex> lk(mutex_);
    for (const auto& [id, p] : entries) {
        if (entries_.find(id) != entries_.end())
            continue;
        Entry e;
        e.progress = p;
        e.progress.chartId = id;
        e.progress.progress = std::clamp(e.progress.progress, 0.0, 1.0);
        entries_.emplace(id, std::move(e));
    }
}

bool ProgressTracker::clear(std::string_view chartId) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = entries_.find(chartId);
    if (it == entries_.end())
        return false;
    entries_.erase(it);
    pruneChannelsLocked();
    return true;
}

std::shared_ptr<ProgressStream> ProgressTracker::subscribe(const std::string& chartId) {
    std::lock_guard<std::mutex> lk(mutex_);
    pruneChannelsLocked();
    return channelLocked(chartId)->subscribe();
}

std::size_t ProgressTracker::channelCount() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return channels_.size();
}

void ProgressTracker::closeAll() {
    std::map<std::string, std::shared_ptr<ProgressChannel<DownloadProgress>>, std::less<>> channels;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        closed_ = true;
        channels = channels_;
    }
    for (auto& [id, ch] : channels)
        ch->close();
}

std::shared_ptr<ProgressChannel<DownloadProgress>>
ProgressTracker::findChannelLocked(std::string_view chartId) const {
    auto it = channels_.find(chartId);
    return it == channels_.end() ? nullptr : it->second;
}

// Channels nobody listens to are dropped; closed ones are kept so late subscribers see the close.
void ProgressTracker::pruneChannelsLocked() {
    if (closed_)
        return;
    for (auto it = channels_.begin(); it != channels_.end();) {
        if (it->second->subscriberCount() == 0)
            it = channels_.erase(it);
        else
            ++it;
    }
}

std::shared_ptr<ProgressChannel<DownloadProgress>>
ProgressTracker::channelLocked(const std::string& chartId) {
    auto it = channels_.find(chartId);
    if (it != channels_.end())
        return it->second;
    auto ch = std::make_shared<ProgressChannel<DownloadProgress>>();
    if (closed_)
        ch->close();
    channels_.emplace(chartId, ch);
    return ch;
}

void ProgressTracker::publish(const std::shared_ptr<ProgressChannel<DownloadProgress>>& channel,
                              const DownloadProgress& snapshot) {
    Listener listener;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        listener = listener_;
    }
    if (channel)
        channel->publish(snapshot);
    if (listener)
        listener(snapshot);
}

} // namespace chartdl::downloader
