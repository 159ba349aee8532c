#pragma once

#include <chartdl/downloader/downloader.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chartdl::downloader {

/**
 * Pending work ordered by priority (high first), then insertion order.
 *
 * Thread-safe. The change hook runs after every successful mutation, outside the
 * queue lock, so it may read the queue back (the manager uses it to schedule a
 * snapshot write).
 */
class DownloadQueue {
public:
    using ChangeHook = std::function<void()>;

    explicit DownloadQueue(std::size_t maxConcurrent = 3);

    void setChangeHook(ChangeHook hook);

    /// Insert at the end of the task's priority tier. Returns false if the chart is already queued.
    bool enqueue(DownloadTask task);

    /// Head of the queue, but only while activeCount is below the concurrency cap.
    std::optional<DownloadTask> dequeueNext(std::size_t activeCount);

    bool remove(std::string_view chartId);
    void clear();

    [[nodiscard]] bool contains(std::string_view chartId) const;
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] bool empty() const;
    [[nodiscard]] std::vector<DownloadTask> snapshot() const;

    /// Affects future admissions only.
    void setMaxConcurrent(std::size_t n);
    [[nodiscard]] std::size_t maxConcurrent() const;

private:
    void checkOrderLocked() const;
    void notifyChanged() const;

    mutable std::mutex mutex_;
    std::vector<DownloadTask> items_;
    std::uint64_t nextSequence_{1};
    std::size_t maxConcurrent_;
    ChangeHook onChange_;
};

} // namespace chartdl::downloader
