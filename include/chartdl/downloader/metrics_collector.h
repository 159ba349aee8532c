#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace chartdl::downloader {

struct DownloadMetricsSnapshot {
    std::size_t successCount{0};
    std::size_t failureCount{0};
    std::map<std::string, std::size_t> failureByCategory;
    double averageDurationSeconds{0.0};
    double medianDurationSeconds{0.0};
    std::size_t retryCount{0};
};

/**
 * In-process counters for finished transfers. Paused or cancelled runs are
 * discarded rather than counted.
 */
class MetricsCollector {
public:
    void start(std::string_view chartId);
    void incrementRetry(std::string_view chartId);
    void completeSuccess(std::string_view chartId);
    void completeFailure(std::string_view chartId, std::string_view category);
    void discard(std::string_view chartId);

    [[nodiscard]] DownloadMetricsSnapshot snapshot() const;

private:
    struct Attempt {
        std::chrono::steady_clock::time_point start;
        std::chrono::steady_clock::time_point end;
        bool success{false};
        std::string failureCategory;
        std::size_t retries{0};
    };

    void finish(std::string_view chartId, bool success, std::string_view category);

    mutable std::mutex mutex_;
    std::map<std::string, Attempt, std::less<>> active_;
    std::vector<Attempt> completed_;
};

} // namespace chartdl::downloader
