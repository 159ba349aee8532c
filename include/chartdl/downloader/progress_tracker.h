#pragma once

#include <chartdl/downloader/downloader.hpp>
#include <chartdl/downloader/progress_channel.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace chartdl::downloader {

using ProgressStream = ProgressSubscription<DownloadProgress>;

/**
 * In-memory progress map plus one ProgressChannel per chart.
 *
 * Byte reports are throttled per chart and the normalized progress never moves
 * backwards while a transfer is running. State transitions are never throttled.
 * The listener is called after each published change, outside the map lock.
 */
class ProgressTracker {
public:
    using Listener = std::function<void(const DownloadProgress&)>;

    explicit ProgressTracker(std::chrono::milliseconds throttle = std::chrono::milliseconds{100});

    void setListener(Listener listener);

    /// Transfer admitted: status downloading, progress 0.0, published immediately.
    void begin(const std::string& chartId, const std::string& url);

    void reportBytes(const std::string& chartId, std::uint64_t downloaded,
                     std::optional<std::uint64_t> total);

    void markQueued(const std::string& chartId, const std::optional<std::string>& url);
    void markCompleted(const std::string& chartId, std::uint64_t bytes);
    void markPaused(const std::string& chartId);
    void markCancelled(const std::string& chartId);
    void markFailed(const std::string& chartId, const Error& error);

    [[nodiscard]] std::optional<DownloadProgress> get(std::string_view chartId) const;
    [[nodiscard]] std::map<std::string, DownloadProgress> all() const;

    /// Adopt entries loaded from disk or handed in by the host; existing entries win.
    void restore(const std::map<std::string, DownloadProgress>& entries);

    bool clear(std::string_view chartId);

    std::shared_ptr<ProgressStream> subscribe(const std::string& chartId);

    /// Channels currently held; only charts with live subscribers keep one.
    [[nodiscard]] std::size_t channelCount() const;

    /// Close every channel; later subscriptions are born closed.
    void closeAll();

private:
    struct Entry {
        DownloadProgress progress;
        std::chrono::steady_clock::time_point lastPublish{};
        std::chrono::steady_clock::time_point rateSampleAt{};
        std::uint64_t rateSampleBytes{0};
    };

    template <typename Fn> void transition(const std::string& chartId, Fn&& mutate);
    std::shared_ptr<ProgressChannel<DownloadProgress>> channelLocked(const std::string& chartId);
    std::shared_ptr<ProgressChannel<DownloadProgress>> findChannelLocked(
        std::string_view chartId) const;
    void pruneChannelsLocked();
    void publish(const std::shared_ptr<ProgressChannel<DownloadProgress>>& channel,
                 const DownloadProgress& snapshot);

    mutable std::mutex mutex_;
    std::map<std::string, Entry, std::less<>> entries_;
    std::map<std::string, std::shared_ptr<ProgressChannel<DownloadProgress>>, std::less<>>
        channels_;
    std::chrono::milliseconds throttle_;
    Listener listener_;
    bool closed_{false};
};

} // namespace chartdl::downloader
