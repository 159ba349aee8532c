#pragma once

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace chartdl::downloader {

template <typename T> class ProgressChannel;

/**
 * One observer's view of a ProgressChannel: a bounded queue that drops the
 * oldest value when full. Values pushed before subscribing are not delivered.
 */
template <typename T> class ProgressSubscription {
public:
    explicit ProgressSubscription(std::size_t capacity) : cap_(capacity ? capacity : 1) {}

    /// Pop without blocking.
    std::optional<T> tryNext() {
        std::lock_guard<std::mutex> lk(mu_);
        return popLocked();
    }

    /// Block until a value arrives, the channel closes, or timeout elapses.
    template <typename Rep, typename Period>
    std::optional<T> waitNext(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lk(mu_);
        cv_.wait_for(lk, timeout, [&] { return !buf_.empty() || closed_; });
        return popLocked();
    }

    /// Closed and fully drained.
    [[nodiscard]] bool closed() const {
        std::lock_guard<std::mutex> lk(mu_);
        return closed_ && buf_.empty();
    }

    [[nodiscard]] std::size_t dropped() const {
        std::lock_guard<std::mutex> lk(mu_);
        return dropped_;
    }

private:
    friend class ProgressChannel<T>;

    void push(const T& v) {
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (closed_)
                return;
            if (buf_.size() >= cap_) {
                buf_.pop_front();
                ++dropped_;
            }
            buf_.push_back(v);
        }
        cv_.notify_all();
    }

    void close() {
        {
            std::lock_guard<std::mutex> lk(mu_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    std::optional<T> popLocked() {
        if (buf_.empty())
            return std::nullopt;
        T v = std::move(buf_.front());
        buf_.pop_front();
        return v;
    }

    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::deque<T> buf_;
    const std::size_t cap_;
    std::size_t dropped_{0};
    bool closed_{false};
};

/**
 * Fan-out stream of values. Any number of subscribers; subscriptions the caller
 * has released are pruned on the next publish.
 */
template <typename T> class ProgressChannel {
public:
    explicit ProgressChannel(std::size_t subscriberCapacity = 256)
        : capacity_(subscriberCapacity) {}

    std::shared_ptr<ProgressSubscription<T>> subscribe() {
        auto sub = std::make_shared<ProgressSubscription<T>>(capacity_);
        std::lock_guard<std::mutex> lk(mu_);
        if (closed_) {
            sub->close();
        } else {
            subs_.push_back(sub);
        }
        return sub;
    }

    void publish(const T& value) {
        std::vector<std::shared_ptr<ProgressSubscription<T>>> live;
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (closed_)
                return;
            subs_.erase(std::remove_if(subs_.begin(), subs_.end(),
                                       [](const auto& w) { return w.expired(); }),
                        subs_.end());
            for (auto& w : subs_) {
                if (auto s = w.lock())
                    live.push_back(std::move(s));
            }
        }
        for (auto& s : live)
            s->push(value);
    }

    void close() {
        std::vector<std::weak_ptr<ProgressSubscription<T>>> subs;
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (closed_)
                return;
            closed_ = true;
            subs.swap(subs_);
        }
        for (auto& w : subs) {
            if (auto s = w.lock())
                s->close();
        }
    }

    [[nodiscard]] bool closed() const {
        std::lock_guard<std::mutex> lk(mu_);
        return closed_;
    }

    [[nodiscard]] std::size_t subscriberCount() const {
        std::lock_guard<std::mutex> lk(mu_);
        return static_cast<std::size_t>(std::count_if(
            subs_.begin(), subs_.end(), [](const auto& w) { return !w.expired(); }));
    }

private:
    mutable std::mutex mu_;
    std::vector<std::weak_ptr<ProgressSubscription<T>>> subs_;
    std::size_t capacity_;
    bool closed_{false};
};

} // namespace chartdl::downloader
