#include <chartdl/downloader/metrics_collector.h>

#include <algorithm>
#include <numeric>

namespace chartdl::downloader {

void MetricsCollector::start(std::string_view chartId) {
    std::lock_guard<std::mutex> lk(mutex_);
    Attempt a;
    a.start = std::chrono::steady_clock::now();
    active_.insert_or_assign(std::string(chartId), a);
}

void MetricsCollector::incrementRetry(std::string_view chartId) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = active_.find(chartId);
    if (it != active_.end())
        ++it->second.retries;
}

void MetricsCollector::completeSuccess(std::string_view chartId) {
    finish(chartId, true, {});
}

void MetricsCollector::completeFailure(std::string_view chartId, std::string_view category) {
    finish(chartId, false, category.empty() ? std::string_view{"unknown"} : category);
}

void MetricsCollector::discard(std::string_view chartId) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = active_.find(chartId);
    if (it != active_.end())
        active_.erase(it);
}

void MetricsCollector::finish(std::string_view chartId, bool success, std::string_view category) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = active_.find(chartId);
    if (it == active_.end())
        return;
    Attempt a = it->second;
    active_.erase(it);
    a.end = std::chrono::steady_clock::now();
    a.success = success;
    a.failureCategory = std::string(category);
    completed_.push_back(std::move(a));
}

DownloadMetricsSnapshot MetricsCollector::snapshot() const {
    std::lock_guard<std::mutex> lk(mutex_);
    DownloadMetricsSnapshot snap;
    std::vector<double> durations;
    for (const auto& a : completed_) {
        if (a.success) {
            ++snap.successCount;
        } else {
            ++snap.failureCount;
            ++snap.failureByCategory[a.failureCategory];
        }
        snap.retryCount += a.retries;
        double d = std::chrono::duration<double>(a.end - a.start).count();
        if (d > 0.0)
            durations.push_back(d);
    }
    if (!durations.empty()) {
        std::sort(durations.begin(), durations.end());
        snap.averageDurationSeconds =
            std::accumulate(durations.begin(), durations.end(), 0.0) /
            static_cast<double>(durations.size());
        auto n = durations.size();
        snap.medianDurationSeconds =
            (n % 2 == 1) ? durations[n / 2] : (durations[n / 2 - 1] + durations[n / 2]) / 2.0;
    }
    return snap;
}

} // namespace chartdl::downloader
