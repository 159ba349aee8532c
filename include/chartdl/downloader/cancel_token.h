#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace chartdl::downloader {

/**
 * Why a transfer was asked to stop. The engine maps each reason to a distinct
 * terminal status instead of unwinding with an exception.
 */
enum class CancelReason { None, Pause, Cancel, Shutdown };

/**
 * Cooperative cancellation handle shared between the manager and one transfer.
 * Copies refer to the same underlying state. The first reason set wins.
 */
class CancelToken {
public:
    CancelToken() : state_(std::make_shared<State>()) {}

    void cancel(CancelReason reason) {
        {
            std::lock_guard<std::mutex> lk(state_->mutex);
            if (state_->reason != CancelReason::None || reason == CancelReason::None)
                return;
            state_->reason = reason;
        }
        state_->cv.notify_all();
    }

    [[nodiscard]] bool isCancelled() const {
        std::lock_guard<std::mutex> lk(state_->mutex);
        return state_->reason != CancelReason::None;
    }

    [[nodiscard]] CancelReason reason() const {
        std::lock_guard<std::mutex> lk(state_->mutex);
        return state_->reason;
    }

    /**
     * Sleep for up to d. Returns true when woken by cancellation.
     */
    template <typename Rep, typename Period>
    bool waitFor(std::chrono::duration<Rep, Period> d) const {
        std::unique_lock<std::mutex> lk(state_->mutex);
        return state_->cv.wait_for(lk, d, [&] { return state_->reason != CancelReason::None; });
    }

private:
    struct State {
        mutable std::mutex mutex;
        std::condition_variable cv;
        CancelReason reason{CancelReason::None};
    };

    std::shared_ptr<State> state_;
};

} // namespace chartdl::downloader
