/*
 * DownloadManager:
 * - startup: load state file, sweep resume records, restore queue and progress
 * - scheduler thread admits queued work up to maxConcurrent, one worker thread per transfer
 * - pause / resume / cancel per chart and per batch via cooperative tokens
 * - snapshot writes requested on every queue or record change, final flush on dispose
 */

#include <chartdl/downloader/download_manager.h>
#include <chartdl/downloader/integrity_verifier.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace chartdl::downloader {

namespace fs = std::filesystem;

namespace {

ITransportClient& requireTransport(const std::shared_ptr<ITransportClient>& transport) {
    if (!transport) {
        throw std::invalid_argument("DownloadManager requires a transport client");
    }
    return *transport;
}

bool hasUsableChecksum(const DownloadTask& task) {
    return !task.expectedChecksum || task.expectedChecksum->empty() ||
           parseChecksum(*task.expectedChecksum).has_value();
}

std::shared_future<DownloadManager::Result> readyFuture(DownloadManager::Result r) {
    std::promise<DownloadManager::Result> p;
    p.set_value(std::move(r));
    return p.get_future().share();
}

} // namespace

DownloadManager::DownloadManager(ManagerOptions options, std::shared_ptr<ITransportClient> transport)
    : options_(std::move(options)), transport_(std::move(transport)),
      store_(options_.config.chartsDir, options_.config.stateFileName),
      queue_(std::max<std::size_t>(1, options_.config.maxConcurrent)),
      progress_(options_.config.progressThrottle),
      batches_([this](std::string_view chartId) { return progress_.get(chartId); }),
      engine_(requireTransport(transport_), resume_, progress_, options_.config,
              [this] { writer_.request(); }, &metrics_),
      writer_(store_, [this] { return currentState(); }) {
    if (!options_.errorHook) {
        options_.errorHook = [](std::string_view chartId, const Error& error) {
            spdlog::error("Download {} failed [{}]: {}", chartId, errorCodeToString(error.code),
                          error.message);
        };
    }
    queuePaused_ = options_.startPaused;

    restoreFromDisk();

    queue_.setChangeHook([this] { writer_.request(); });
    progress_.setListener([this](const DownloadProgress& p) { batches_.onChartUpdate(p); });
    writer_.start();
    scheduler_ = std::thread(&DownloadManager::schedulerLoop, this);
    wakeScheduler();
}

DownloadManager::~DownloadManager() {
    dispose();
}

void DownloadManager::restoreFromDisk() {
    auto loaded = store_.load();
    startup_.load = loaded.outcome;

    auto records = std::move(loaded.state.resumeData);
    startup_.sweep = sweepResumeRecords(records, options_.config.chartsDir);
    resume_.replaceAll(records);

    const auto& completedOnDisk = startup_.sweep.completed;
    auto isCompletedOnDisk = [&](const std::string& id) {
        return std::find(completedOnDisk.begin(), completedOnDisk.end(), id) !=
               completedOnDisk.end();
    };

    for (const auto& task : loaded.state.queue) {
        if (isCompletedOnDisk(task.chartId))
            continue;
        queue_.enqueue(task);
    }

    // Transfers that were running when the process died go back into the queue.
    auto downloads = std::move(loaded.state.downloads);
    for (auto& [id, p] : downloads) {
        if (isCompletedOnDisk(id)) {
            p.status = DownloadStatus::Completed;
            p.progress = 1.0;
            continue;
        }
        if (p.status != DownloadStatus::Downloading)
            continue;

        auto rec = resume_.get(id);
        std::optional<std::string> url = p.url;
        if (!url && rec)
            url = rec->originalUrl;
        if (!url) {
            spdlog::warn("Interrupted download {} has no known source; leaving it paused", id);
            p.status = DownloadStatus::Paused;
            continue;
        }
        DownloadTask t;
        t.chartId = id;
        t.url = *url;
        if (rec)
            t.expectedChecksum = rec->checksum;
        if (queue_.enqueue(std::move(t)))
            startup_.requeued.push_back(id);
        p.status = DownloadStatus::Queued;
    }
    progress_.restore(downloads);

    if (startup_.load == LoadOutcome::Loaded || !startup_.sweep.empty()) {
        auto r = store_.save(currentState());
        if (!r.ok()) {
            spdlog::warn("Failed to persist recovered download state: {}", r.error().message);
        }
    }
    if (!startup_.requeued.empty()) {
        spdlog::info("Requeued {} interrupted downloads", startup_.requeued.size());
    }
}

// ----- scheduler -----

void DownloadManager::wakeScheduler() {
    {
        std::lock_guard<std::mutex> lk(schedMutex_);
        wake_ = true;
    }
    schedCv_.notify_all();
}

void DownloadManager::schedulerLoop() {
    std::vector<std::thread> joinable;
    while (true) {
        {
            std::unique_lock<std::mutex> lk(schedMutex_);
            schedCv_.wait(lk, [&] { return stopping_ || wake_; });
            wake_ = false;
            reapFinishedLocked(joinable);
            if (stopping_)
                break;
            if (!queuePaused_) {
                while (auto next = queue_.dequeueNext(runningCountLocked())) {
                    startTransferLocked(std::move(*next), joinable);
                }
            }
        }
        for (auto& t : joinable)
            t.join();
        joinable.clear();
        idleCv_.notify_all();
    }
    for (auto& t : joinable)
        t.join();
}

void DownloadManager::reapFinishedLocked(std::vector<std::thread>& joinable) {
    for (auto it = active_.begin(); it != active_.end();) {
        if (it->second.finished) {
            if (it->second.worker.joinable())
                joinable.push_back(std::move(it->second.worker));
            it = active_.erase(it);
        } else {
            ++it;
        }
    }
}

std::size_t DownloadManager::runningCountLocked() const {
    return static_cast<std::size_t>(std::count_if(
        active_.begin(), active_.end(), [](const auto& kv) { return !kv.second.finished; }));
}

void DownloadManager::startTransferLocked(DownloadTask task, std::vector<std::thread>& joinable) {
    auto existing = active_.find(task.chartId);
    if (existing != active_.end()) {
        // finished but not reaped yet; joined once the lock is released
        if (existing->second.worker.joinable())
            joinable.push_back(std::move(existing->second.worker));
        active_.erase(existing);
    }

    spdlog::debug("Admitting {} ({} priority)", task.chartId, toString(task.priority));
    auto& slot = active_[task.chartId];
    slot.task = task;
    slot.finished = false;
    slot.worker = std::thread(&DownloadManager::runTransfer, this, std::move(task), slot.token);
}

void DownloadManager::runTransfer(DownloadTask task, CancelToken token) {
    Result result = engine_.execute(task, token);
    handleOutcome(task, result);

    const bool paused = result.ok() && result.value() == TransferOutcome::Paused;
    auto takeFollowUpLocked = [&] {
        auto it = active_.find(task.chartId);
        if (!paused || it == active_.end())
            return FollowUp::None;
        return std::exchange(it->second.followUp, FollowUp::None);
    };
    auto cancelStopped = [&] {
        discardPartial(task.chartId);
        progress_.markCancelled(task.chartId);
        writer_.request();
        result = TransferOutcome::Cancelled;
    };

    // A cancel that arrived while pausing is applied before the slot is released.
    FollowUp followUp = FollowUp::None;
    {
        std::lock_guard<std::mutex> lk(schedMutex_);
        followUp = takeFollowUpLocked();
    }
    if (followUp == FollowUp::Cancel)
        cancelStopped();

    bool requeued = false;
    {
        std::lock_guard<std::mutex> lk(schedMutex_);
        if (followUp == FollowUp::None)
            followUp = takeFollowUpLocked();
        auto it = active_.find(task.chartId);
        if (it != active_.end())
            it->second.finished = true;
        if (followUp == FollowUp::Resume && !stopping_) {
            requeued = queue_.enqueue(task);
        } else {
            completeWaitersLocked(task.chartId, result);
        }
        wake_ = true;
    }
    if (requeued) {
        progress_.markQueued(task.chartId, task.url);
    } else if (followUp == FollowUp::Cancel && result.ok() &&
               result.value() == TransferOutcome::Paused) {
        cancelStopped();
    }
    schedCv_.notify_all();
    idleCv_.notify_all();
}

void DownloadManager::handleOutcome(const DownloadTask& task, const Result& result) {
    if (!result.ok()) {
        options_.errorHook(task.chartId, result.error());
        notify(NotificationKind::Failed, task.chartId, result.error().message);
        return;
    }
    switch (result.value()) {
        case TransferOutcome::Completed:
            notify(NotificationKind::Completed, task.chartId, "Download complete");
            break;
        case TransferOutcome::Interrupted:
            // shutdown: keep it queued for the next start
            queue_.enqueue(task);
            progress_.markQueued(task.chartId, task.url);
            break;
        case TransferOutcome::Paused:
        case TransferOutcome::Cancelled:
            break;
    }
}

void DownloadManager::completeWaitersLocked(const std::string& chartId, const Result& result) {
    auto it = waiters_.find(chartId);
    if (it == waiters_.end())
        return;
    it->second->set_value(result);
    waiters_.erase(it);
    waiterFutures_.erase(chartId);
}

// ----- queue -----

bool DownloadManager::enqueue(DownloadTask task) {
    if (disposed_.load())
        return false;
    if (task.chartId.empty() || task.url.empty()) {
        spdlog::warn("Ignoring download task without chart id or url");
        return false;
    }
    if (!hasUsableChecksum(task)) {
        spdlog::warn("Ignoring {}: unrecognized checksum '{}'", task.chartId,
                     *task.expectedChecksum);
        return false;
    }
    auto chartId = task.chartId;
    auto url = task.url;
    {
        std::lock_guard<std::mutex> lk(schedMutex_);
        auto it = active_.find(chartId);
        if (it != active_.end() && !it->second.finished) {
            spdlog::debug("Chart {} is already downloading", chartId);
            return false;
        }
        if (!queue_.enqueue(std::move(task)))
            return false;
    }
    progress_.markQueued(chartId, url);
    wakeScheduler();
    return true;
}

bool DownloadManager::addToQueue(const std::string& chartId, const std::string& url,
                                 DownloadPriority priority,
                                 std::optional<std::string> expectedChecksum) {
    DownloadTask t;
    t.chartId = chartId;
    t.url = url;
    t.priority = priority;
    t.expectedChecksum = std::move(expectedChecksum);
    t.addedAt = std::chrono::system_clock::now();
    return enqueue(std::move(t));
}

bool DownloadManager::removeFromQueue(std::string_view chartId) {
    bool removed = false;
    {
        std::lock_guard<std::mutex> lk(schedMutex_);
        removed = queue_.remove(chartId);
        if (removed) {
            completeWaitersLocked(std::string(chartId),
                                  Error{ErrorCode::Cancelled, "Removed from queue"});
        }
    }
    if (removed) {
        auto p = progress_.get(chartId);
        if (p && p->status == DownloadStatus::Queued)
            progress_.clear(chartId);
    }
    return removed;
}

void DownloadManager::clearQueue() {
    std::vector<DownloadTask> dropped;
    {
        std::lock_guard<std::mutex> lk(schedMutex_);
        dropped = queue_.snapshot();
        queue_.clear();
        for (const auto& t : dropped)
            completeWaitersLocked(t.chartId, Error{ErrorCode::Cancelled, "Queue cleared"});
    }
    for (const auto& t : dropped) {
        auto p = progress_.get(t.chartId);
        if (p && p->status == DownloadStatus::Queued)
            progress_.clear(t.chartId);
    }
}

std::vector<DownloadTask> DownloadManager::getDetailedQueue() const {
    return queue_.snapshot();
}

void DownloadManager::pauseQueue() {
    std::lock_guard<std::mutex> lk(schedMutex_);
    queuePaused_ = true;
}

void DownloadManager::resumeQueue() {
    {
        std::lock_guard<std::mutex> lk(schedMutex_);
        queuePaused_ = false;
        wake_ = true;
    }
    schedCv_.notify_all();
}

bool DownloadManager::isQueuePaused() const {
    std::lock_guard<std::mutex> lk(schedMutex_);
    return queuePaused_;
}

// ----- single downloads -----

DownloadManager::Result DownloadManager::downloadChart(const std::string& chartId,
                                                       const std::string& url,
                                                       std::optional<std::string> expectedChecksum,
                                                       DownloadPriority priority) {
    if (disposed_.load())
        return Error{ErrorCode::Cancelled, "Download manager has been disposed"};

    DownloadTask t;
    t.chartId = chartId;
    t.url = url;
    t.priority = priority;
    t.expectedChecksum = std::move(expectedChecksum);
    if (!hasUsableChecksum(t)) {
        return Error{ErrorCode::InvalidArgument,
                     "Unrecognized checksum format: " + *t.expectedChecksum};
    }

    std::shared_future<Result> done;
    bool queued = false;
    {
        std::lock_guard<std::mutex> lk(schedMutex_);
        auto it = active_.find(chartId);
        bool running = it != active_.end() && !it->second.finished;
        if (!running && !queue_.contains(chartId)) {
            queued = queue_.enqueue(t);
        }
        auto fit = waiterFutures_.find(chartId);
        if (fit != waiterFutures_.end()) {
            done = fit->second;
        } else {
            auto promise = std::make_shared<std::promise<Result>>();
            done = promise->get_future().share();
            waiters_[chartId] = promise;
            waiterFutures_[chartId] = done;
        }
    }
    if (queued)
        progress_.markQueued(chartId, url);
    wakeScheduler();
    return done.get();
}

std::shared_future<DownloadManager::Result> DownloadManager::awaitCompletion(
    const std::string& chartId) {
    std::lock_guard<std::mutex> lk(schedMutex_);
    auto fit = waiterFutures_.find(chartId);
    if (fit != waiterFutures_.end())
        return fit->second;

    auto it = active_.find(chartId);
    bool running = it != active_.end() && !it->second.finished;
    if (!running && !queue_.contains(chartId)) {
        return readyFuture(Error{ErrorCode::NotFound, "Chart " + chartId + " is not scheduled"});
    }
    auto promise = std::make_shared<std::promise<Result>>();
    auto fut = promise->get_future().share();
    waiters_[chartId] = promise;
    waiterFutures_[chartId] = fut;
    return fut;
}

Expected<void> DownloadManager::pauseDownload(const std::string& chartId) {
    bool wasQueued = false;
    {
        std::lock_guard<std::mutex> lk(schedMutex_);
        auto it = active_.find(chartId);
        if (it != active_.end() && !it->second.finished) {
            it->second.token.cancel(CancelReason::Pause);
            if (it->second.followUp == FollowUp::Resume)
                it->second.followUp = FollowUp::None;
            return {};
        }
        wasQueued = queue_.remove(chartId);
        if (wasQueued)
            completeWaitersLocked(chartId, TransferOutcome::Paused);
    }
    if (!wasQueued)
        return Error{ErrorCode::NotFound, "Chart " + chartId + " is not queued or downloading"};
    progress_.markPaused(chartId);
    return {};
}

Expected<void> DownloadManager::resumeDownload(const std::string& chartId,
                                               std::optional<std::string> url) {
    {
        std::lock_guard<std::mutex> lk(schedMutex_);
        auto it = active_.find(chartId);
        if (it != active_.end() && !it->second.finished) {
            if (it->second.token.reason() == CancelReason::Pause)
                it->second.followUp = FollowUp::Resume;
            return {};
        }
        if (queue_.contains(chartId))
            return {};
    }
    if (!url)
        url = knownUrl(chartId);
    if (!url) {
        return Error{ErrorCode::InvalidArgument, "No source URL known for chart " + chartId};
    }

    DownloadTask t;
    t.chartId = chartId;
    t.url = *url;
    if (auto rec = resume_.get(chartId))
        t.expectedChecksum = rec->checksum;
    if (!enqueue(std::move(t))) {
        if (disposed_.load())
            return Error{ErrorCode::Cancelled, "Download manager has been disposed"};
    }
    return {};
}

Expected<void> DownloadManager::cancelDownload(const std::string& chartId) {
    bool wasQueued = false;
    {
        std::lock_guard<std::mutex> lk(schedMutex_);
        auto it = active_.find(chartId);
        if (it != active_.end() && !it->second.finished) {
            if (it->second.token.reason() == CancelReason::Pause)
                it->second.followUp = FollowUp::Cancel;
            it->second.token.cancel(CancelReason::Cancel);
            return {};
        }
        wasQueued = queue_.remove(chartId);
        if (wasQueued)
            completeWaitersLocked(chartId, TransferOutcome::Cancelled);
    }

    bool known = wasQueued || progress_.get(chartId).has_value() || resume_.get(chartId).has_value();
    if (!known)
        return Error{ErrorCode::NotFound, "Chart " + chartId + " is not known"};

    discardPartial(chartId);
    progress_.markCancelled(chartId);
    writer_.request();
    return {};
}

void DownloadManager::discardPartial(const std::string& chartId) {
    std::optional<std::string> url;
    if (auto rec = resume_.get(chartId))
        url = rec->originalUrl;
    else if (auto p = progress_.get(chartId))
        url = p->url;
    resume_.erase(chartId);
    if (!url)
        return;
    auto partial = partialPathFor(finalPathFor(options_.config.chartsDir, chartId, *url));
    std::error_code ec;
    fs::remove(partial, ec);
    if (ec) {
        spdlog::warn("Failed to delete partial file {}: {}", partial.string(), ec.message());
    }
}

std::optional<std::string> DownloadManager::knownUrl(const std::string& chartId) const {
    if (auto rec = resume_.get(chartId))
        return rec->originalUrl;
    if (auto p = progress_.get(chartId); p && p->url)
        return p->url;
    return std::nullopt;
}

// ----- progress -----

std::optional<DownloadProgress> DownloadManager::getProgress(std::string_view chartId) const {
    return progress_.get(chartId);
}

std::map<std::string, DownloadProgress> DownloadManager::getAllProgress() const {
    return progress_.all();
}

std::shared_ptr<ProgressStream> DownloadManager::subscribeProgress(const std::string& chartId) {
    return progress_.subscribe(chartId);
}

bool DownloadManager::clearProgress(std::string_view chartId) {
    bool cleared = progress_.clear(chartId);
    if (cleared)
        writer_.request();
    return cleared;
}

// ----- batches -----

Expected<std::string> DownloadManager::startBatchDownload(const std::vector<std::string>& chartIds,
                                                         const std::vector<std::string>& urls,
                                                         DownloadPriority priority) {
    if (chartIds.empty() || chartIds.size() != urls.size()) {
        return Error{ErrorCode::InvalidArgument,
                     "Batch needs the same non-zero number of chart ids and urls"};
    }
    if (disposed_.load())
        return Error{ErrorCode::Cancelled, "Download manager has been disposed"};

    auto batchId = batches_.create(chartIds);
    for (std::size_t i = 0; i < chartIds.size(); ++i) {
        if (!addToQueue(chartIds[i], urls[i], priority)) {
            spdlog::debug("Batch {}: chart {} already scheduled", batchId, chartIds[i]);
        }
    }
    return batchId;
}

std::optional<BatchDownloadProgress> DownloadManager::getBatchProgress(
    std::string_view batchId) const {
    return batches_.progress(batchId);
}

std::shared_ptr<BatchProgressStream> DownloadManager::subscribeBatchProgress(
    const std::string& batchId) {
    return batches_.subscribe(batchId);
}

Expected<void> DownloadManager::pauseBatch(const std::string& batchId) {
    auto members = batches_.members(batchId);
    if (!members)
        return Error{ErrorCode::NotFound, "Unknown batch " + batchId};
    batches_.setStatus(batchId, BatchStatus::Paused);
    for (const auto& id : *members) {
        auto r = pauseDownload(id);
        if (!r.ok())
            spdlog::debug("Batch {}: nothing to pause for {}", batchId, id);
    }
    return {};
}

Expected<void> DownloadManager::resumeBatch(const std::string& batchId) {
    auto members = batches_.members(batchId);
    if (!members)
        return Error{ErrorCode::NotFound, "Unknown batch " + batchId};
    batches_.setStatus(batchId, BatchStatus::InProgress);
    for (const auto& id : *members) {
        auto p = progress_.get(id);
        if (p && p->status == DownloadStatus::Completed)
            continue;
        auto r = resumeDownload(id);
        if (!r.ok())
            spdlog::warn("Batch {}: cannot resume {}: {}", batchId, id, r.error().message);
    }
    return {};
}

Expected<void> DownloadManager::cancelBatch(const std::string& batchId) {
    auto members = batches_.members(batchId);
    if (!members)
        return Error{ErrorCode::NotFound, "Unknown batch " + batchId};
    batches_.setStatus(batchId, BatchStatus::Cancelled);
    for (const auto& id : *members) {
        auto p = progress_.get(id);
        if (p && p->status == DownloadStatus::Completed)
            continue;
        auto r = cancelDownload(id);
        if (!r.ok())
            spdlog::debug("Batch {}: nothing to cancel for {}", batchId, id);
    }
    return {};
}

// ----- concurrency -----

std::size_t DownloadManager::getMaxConcurrentDownloads() const {
    return queue_.maxConcurrent();
}

void DownloadManager::setMaxConcurrentDownloads(std::size_t n) {
    queue_.setMaxConcurrent(std::max<std::size_t>(1, n));
    wakeScheduler();
}

std::size_t DownloadManager::activeDownloadCount() const {
    std::lock_guard<std::mutex> lk(schedMutex_);
    return runningCountLocked();
}

// ----- persistence / recovery -----

RecoveryReport DownloadManager::recoverDownloads(const std::vector<DownloadProgress>& previouslyKnown) {
    RecoveryReport report;
    report.load = startup_.load;
    report.sweep = startup_.sweep;

    for (const auto& p : previouslyKnown) {
        if (p.chartId.empty())
            continue;
        if (!progress_.get(p.chartId))
            progress_.restore({{p.chartId, p}});

        if (p.status != DownloadStatus::Downloading && p.status != DownloadStatus::Queued)
            continue;

        auto url = p.url ? p.url : knownUrl(p.chartId);
        if (!url) {
            spdlog::warn("Cannot recover {}: no source URL known", p.chartId);
            continue;
        }
        DownloadTask t;
        t.chartId = p.chartId;
        t.url = *url;
        if (auto rec = resume_.get(p.chartId))
            t.expectedChecksum = rec->checksum;
        if (enqueue(std::move(t)))
            report.requeued.push_back(p.chartId);
    }
    writer_.request();
    return report;
}

std::optional<ResumeRecord> DownloadManager::getResumeData(std::string_view chartId) const {
    return resume_.get(chartId);
}

PersistedState DownloadManager::currentState() const {
    PersistedState st;
    st.queue = queue_.snapshot();
    st.downloads = progress_.all();
    st.resumeData = resume_.all();
    return st;
}

Expected<void> DownloadManager::saveState() {
    return writer_.flush();
}

// ----- extras -----

void DownloadManager::enableNotifications(bool enabled) {
    std::lock_guard<std::mutex> lk(notifyMutex_);
    notificationsEnabled_ = enabled;
}

std::vector<DownloadNotification> DownloadManager::takePendingNotifications() {
    std::lock_guard<std::mutex> lk(notifyMutex_);
    std::vector<DownloadNotification> out;
    out.swap(notifications_);
    return out;
}

void DownloadManager::notify(NotificationKind kind, const std::string& chartId,
                             const std::string& message) {
    std::lock_guard<std::mutex> lk(notifyMutex_);
    if (!notificationsEnabled_)
        return;
    notifications_.push_back(
        DownloadNotification{chartId, kind, message, std::chrono::system_clock::now()});
}

DownloadMetricsSnapshot DownloadManager::metrics() const {
    return metrics_.snapshot();
}

std::size_t DownloadManager::requeueTransientFailures() {
    std::size_t count = 0;
    for (const auto& [id, p] : progress_.all()) {
        if (p.status != DownloadStatus::Failed || !p.errorCategory)
            continue;
        if (*p.errorCategory != errorCategory(ErrorCode::NetworkError) &&
            *p.errorCategory != errorCategory(ErrorCode::Timeout))
            continue;
        auto r = resumeDownload(id);
        if (r.ok()) {
            ++count;
        } else {
            spdlog::warn("Cannot requeue {}: {}", id, r.error().message);
        }
    }
    if (count > 0)
        spdlog::info("Network restored: requeued {} failed downloads", count);
    return count;
}

bool DownloadManager::waitForIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(schedMutex_);
    return idleCv_.wait_for(lk, timeout,
                            [&] { return queue_.empty() && runningCountLocked() == 0; });
}

void DownloadManager::dispose() {
    if (disposed_.exchange(true))
        return;

    {
        std::lock_guard<std::mutex> lk(schedMutex_);
        stopping_ = true;
        for (auto& [id, at] : active_) {
            if (!at.finished)
                at.token.cancel(CancelReason::Shutdown);
        }
    }
    schedCv_.notify_all();
    if (scheduler_.joinable())
        scheduler_.join();

    std::vector<std::thread> workers;
    {
        std::lock_guard<std::mutex> lk(schedMutex_);
        for (auto& [id, at] : active_) {
            if (at.worker.joinable())
                workers.push_back(std::move(at.worker));
        }
    }
    for (auto& t : workers)
        t.join();

    {
        std::lock_guard<std::mutex> lk(schedMutex_);
        active_.clear();
        for (auto& [id, promise] : waiters_)
            promise->set_value(TransferOutcome::Interrupted);
        waiters_.clear();
        waiterFutures_.clear();
    }
    idleCv_.notify_all();

    writer_.stop();
    auto r = writer_.flush();
    if (!r.ok()) {
        spdlog::warn("Final save of download state failed: {}", r.error().message);
    }
    progress_.closeAll();
    batches_.closeAll();
    spdlog::debug("Download manager for {} disposed", options_.config.chartsDir.string());
}

} // namespace chartdl::downloader
