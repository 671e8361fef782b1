#pragma once
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace cantrace::dispatch {

// What a subscription does when its queue is full
enum class OverflowPolicy : uint8_t {
    kDropOldest,  // evict the oldest queued frame, keep the new one
    kDropNewest,  // refuse the new frame
    kUnbounded    // never drop; capacity is ignored
};

enum class PushResult : uint8_t { kQueued, kDroppedOldest, kDroppedNewest, kClosed };

// Single-consumer queue owned by one subscription. Push never blocks, so a
// slow consumer cannot stall the producer.
template <typename T>
class FrameQueue {
public:
    FrameQueue(std::size_t capacity, OverflowPolicy policy)
        : capacity_(capacity == 0 ? 1 : capacity), policy_(policy) {}

    PushResult Push(T item) {
        PushResult res = PushResult::kQueued;
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (closed_) return PushResult::kClosed;
            if (policy_ != OverflowPolicy::kUnbounded && items_.size() >= capacity_) {
                if (policy_ == OverflowPolicy::kDropNewest) return PushResult::kDroppedNewest;
                items_.pop_front();
                res = PushResult::kDroppedOldest;
            }
            items_.push_back(std::move(item));
        }
        cv_.notify_one();
        return res;
    }

    // Blocks until an item is available. Returns nullopt once closed.
    // Every returned item must be acknowledged with Done().
    std::optional<T> Pop() {
        std::unique_lock<std::mutex> lk(mu_);
        cv_.wait(lk, [this] { return closed_ || !items_.empty(); });
        if (closed_) return std::nullopt;
        T item = std::move(items_.front());
        items_.pop_front();
        ++in_flight_;
        return item;
    }

    void Done() {
        std::lock_guard<std::mutex> lk(mu_);
        if (in_flight_ > 0) --in_flight_;
    }

    // Wakes the consumer and discards whatever is still queued
    void Close() {
        {
            std::lock_guard<std::mutex> lk(mu_);
            closed_ = true;
            items_.clear();
        }
        cv_.notify_all();
    }

    bool Idle() const {
        std::lock_guard<std::mutex> lk(mu_);
        return items_.empty() && in_flight_ == 0;
    }

    std::size_t Size() const {
        std::lock_guard<std::mutex> lk(mu_);
        return items_.size();
    }

    std::size_t Capacity() const noexcept { return capacity_; }
    OverflowPolicy Policy() const noexcept { return policy_; }

private:
    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::deque<T> items_;
    std::size_t in_flight_{0};
    bool closed_{false};
    const std::size_t capacity_;
    const OverflowPolicy policy_;
};

} // namespace cantrace::dispatch
