#pragma once

#include <chartdl/downloader/state_store.h>

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace chartdl::downloader {

/**
 * Single background writer for the state file.
 *
 * request() marks the snapshot dirty and returns immediately. Bursts of requests
 * within the coalesce window collapse into one write of the latest state. Write
 * failures are logged and otherwise ignored.
 */
class SnapshotWriter {
public:
    using Provider = std::function<PersistedState()>;

    SnapshotWriter(StateStore& store, Provider provider,
                   std::chrono::milliseconds coalesce = std::chrono::milliseconds{25});
    ~SnapshotWriter();

    SnapshotWriter(const SnapshotWriter&) = delete;
    SnapshotWriter& operator=(const SnapshotWriter&) = delete;

    void start();
    void request();

    /// Write the current state on the calling thread, after any in-flight background write.
    Expected<void> flush();

    /// Stop the thread; pending requests are dropped. flush() still works afterwards.
    void stop();

private:
    void workerLoop();
    Expected<void> writeSnapshot();

    StateStore& store_;
    Provider provider_;
    std::chrono::milliseconds coalesce_;

    std::mutex mutex_;
    std::mutex writeMutex_;
    std::condition_variable cv_;
    bool dirty_{false};
    bool stopRequested_{false};
    std::thread worker_;
};

} // namespace chartdl::downloader
