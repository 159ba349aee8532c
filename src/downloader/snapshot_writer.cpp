#include <chartdl/downloader/snapshot_writer.h>

#include <spdlog/spdlog.h>

namespace chartdl::downloader {

SnapshotWriter::SnapshotWriter(StateStore& store, Provider provider,
                               std::chrono::milliseconds coalesce)
    : store_(store), provider_(std::move(provider)), coalesce_(coalesce) {}

SnapshotWriter::~SnapshotWriter() {
    stop();
}

void SnapshotWriter::start() {
    std::lock_guard<std::mutex> lk(mutex_);
    if (worker_.joinable())
        return;
    stopRequested_ = false;
    worker_ = std::thread(&SnapshotWriter::workerLoop, this);
}

void SnapshotWriter::request() {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (stopRequested_)
            return;
        dirty_ = true;
    }
    cv_.notify_one();
}

Expected<void> SnapshotWriter::flush() {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        dirty_ = false;
    }
    return writeSnapshot();
}

Expected<void> SnapshotWriter::writeSnapshot() {
    // read and write as one step so an older snapshot never lands after a newer one
    std::lock_guard<std::mutex> lk(writeMutex_);
    return store_.save(provider_());
}

void SnapshotWriter::stop() {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        stopRequested_ = true;
        dirty_ = false;
    }
    cv_.notify_one();
    if (worker_.joinable())
        worker_.join();
}

void SnapshotWriter::workerLoop() {
    while (true) {
        {
            std::unique_lock<std::mutex> lk(mutex_);
            cv_.wait(lk, [&] { return stopRequested_ || dirty_; });
            if (stopRequested_)
                break;
            if (coalesce_.count() > 0) {
                cv_.wait_for(lk, coalesce_, [&] { return stopRequested_; });
                if (stopRequested_)
                    break;
            }
            dirty_ = false;
        }

        auto r = writeSnapshot();
        if (!r.ok()) {
            spdlog::warn("Background save of download state failed: {}", r.error().message);
        }
    }
}

} // namespace chartdl::downloader
