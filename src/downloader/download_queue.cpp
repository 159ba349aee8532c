#include <chartdl/downloader/download_queue.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

namespace chartdl::downloader {

namespace {

int rank(DownloadPriority p) {
    switch (p) {
        case DownloadPriority::High:
            return 0;
        case DownloadPriority::Normal:
            return 1;
        case DownloadPriority::Low:
        default:
            return 2;
    }
}

bool ordered(const DownloadTask& a, const DownloadTask& b) {
    if (rank(a.priority) != rank(b.priority))
        return rank(a.priority) < rank(b.priority);
    return a.sequence < b.sequence;
}

} // namespace

DownloadQueue::DownloadQueue(std::size_t maxConcurrent) : maxConcurrent_(maxConcurrent) {}

void DownloadQueue::setChangeHook(ChangeHook hook) {
    std::lock_guard<std::mutex> lk(mutex_);
    onChange_ = std::move(hook);
}

bool DownloadQueue::enqueue(DownloadTask task) {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto dup = std::find_if(items_.begin(), items_.end(),
                                [&](const DownloadTask& t) { return t.chartId == task.chartId; });
        if (dup != items_.end()) {
            spdlog::debug("Chart {} already queued; ignoring duplicate enqueue", task.chartId);
            return false;
        }
        task.sequence = nextSequence_++;
        auto pos = std::upper_bound(items_.begin(), items_.end(), task, ordered);
        items_.insert(pos, std::move(task));
        checkOrderLocked();
    }
    notifyChanged();
    return true;
}

std::optional<DownloadTask> DownloadQueue::dequeueNext(std::size_t activeCount) {
    std::optional<DownloadTask> next;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (items_.empty() || activeCount >= maxConcurrent_)
            return std::nullopt;
        checkOrderLocked();
        next = std::move(items_.front());
        items_.erase(items_.begin());
    }
    notifyChanged();
    return next;
}

bool DownloadQueue::remove(std::string_view chartId) {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = std::find_if(items_.begin(), items_.end(),
                               [&](const DownloadTask& t) { return t.chartId == chartId; });
        if (it == items_.end())
            return false;
        items_.erase(it);
    }
    notifyChanged();
    return true;
}

void DownloadQueue::clear() {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (items_.empty())
            return;
        items_.clear();
    }
    notifyChanged();
}

bool DownloadQueue::contains(std::string_view chartId) const {
    std::lock_guard<std::mutex> lk(mutex_);
    return std::any_of(items_.begin(), items_.end(),
                       [&](const DownloadTask& t) { return t.chartId == chartId; });
}

std::size_t DownloadQueue::size() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return items_.size();
}

bool DownloadQueue::empty() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return items_.empty();
}

std::vector<DownloadTask> DownloadQueue::snapshot() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return items_;
}

void DownloadQueue::setMaxConcurrent(std::size_t n) {
    std::lock_guard<std::mutex> lk(mutex_);
    maxConcurrent_ = n;
}

std::size_t DownloadQueue::maxConcurrent() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return maxConcurrent_;
}

void DownloadQueue::checkOrderLocked() const {
    if (!std::is_sorted(items_.begin(), items_.end(), ordered)) {
        throw std::logic_error("download queue lost priority/FIFO ordering");
    }
}

void DownloadQueue::notifyChanged() const {
    ChangeHook hook;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        hook = onChange_;
    }
    if (hook)
        hook();
}

} // namespace chartdl::downloader
