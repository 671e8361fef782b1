#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <cantrace/core/frame.hpp>
#include <cantrace/core/result.hpp>
#include <dispatch/frame_queue.hpp>

namespace cantrace::dispatch {

struct SubscriptionHandle {
    uint64_t value{0};
    bool IsValid() const noexcept { return value != 0; }
    bool operator==(const SubscriptionHandle& o) const noexcept { return value == o.value; }
    bool operator!=(const SubscriptionHandle& o) const noexcept { return value != o.value; }
};

// Identifier filter: one exact id, or every frame
struct Filter {
    enum class Kind : uint8_t { kExact, kAll };
    Kind kind{Kind::kAll};
    uint32_t id{0};

    static Filter Exact(uint32_t id) { return Filter{Kind::kExact, id}; }
    static Filter All() { return Filter{Kind::kAll, 0}; }

    bool Matches(const core::Frame& f) const noexcept {
        return kind == Kind::kAll || f.Id() == id;
    }
};

struct SubscriptionOptions {
    std::string name{};
    std::size_t queue_capacity{0};   // 0: dispatcher default
    OverflowPolicy overflow{OverflowPolicy::kDropOldest};
};

struct SubscriptionStats {
    uint64_t delivered{0};
    uint64_t dropped{0};
    uint64_t faults{0};
    std::size_t queued{0};
};

// Raised when a delivery target throws; carried on the error channel
struct DeliveryError {
    SubscriptionHandle handle{};
    std::string subscription{};
    std::string message{};
    core::Frame frame{};
};

using DeliveryTarget = std::function<void(const core::Frame&)>;
using ErrorHandler = std::function<void(const DeliveryError&)>;

// Fan-out from one producer to N subscriptions. Dispatch only enqueues;
// each subscription drains its own queue on its own thread, in dispatch
// order. The subscription table is copy-on-write: Subscribe/Unsubscribe
// publish a new table, Dispatch reads whichever table it loaded.
class MessageDispatcher {
public:
    static constexpr std::size_t kDefaultQueueCapacity = 1024;

    explicit MessageDispatcher(std::size_t default_queue_capacity = kDefaultQueueCapacity,
                               OverflowPolicy default_overflow = OverflowPolicy::kDropOldest);
    ~MessageDispatcher();

    MessageDispatcher(const MessageDispatcher&) = delete;
    MessageDispatcher& operator=(const MessageDispatcher&) = delete;

    core::Result<SubscriptionHandle> Subscribe(Filter filter, DeliveryTarget target);
    core::Result<SubscriptionHandle> Subscribe(Filter filter, DeliveryTarget target,
                                               SubscriptionOptions options);

    // Safe while Dispatch runs and from inside a delivery target. Queued
    // frames of the subscription are discarded; once this returns from any
    // other thread the target is not called again.
    core::Result<void> Unsubscribe(SubscriptionHandle handle);

    // Producer side. Never blocks on a consumer.
    void Dispatch(const core::Frame& frame);
    void DispatchBatch(const std::vector<core::Frame>& frames);

    void SetErrorHandler(ErrorHandler handler);

    core::Result<SubscriptionStats> Stats(SubscriptionHandle handle) const;
    std::size_t SubscriberCount() const;

    // True once every queue is empty and no target is running
    bool WaitUntilIdle(std::chrono::milliseconds timeout) const;

    // Closes every subscription and joins the draining threads. Called from
    // inside a target, that target's drain is detached instead; after the
    // target returns it touches no dispatcher state, so the dispatcher may
    // be destroyed from there too.
    void Shutdown();

private:
    struct Subscription;
    using SubscriptionList = std::vector<std::shared_ptr<Subscription>>;

    void Enqueue(const SubscriptionList& subs, const core::Frame& frame);
    void DrainLoop(const std::shared_ptr<Subscription>& sub);
    void ReportFault(Subscription& sub, const core::Frame& frame, const std::string& what);
    void ReapRetiredLocked();   // control_mu_ held
    static void JoinDrain(Subscription& sub);
    void NotifyIdle() const;

    const std::size_t default_capacity_;
    const OverflowPolicy default_overflow_;

    std::mutex control_mu_;                      // Subscribe/Unsubscribe/Shutdown
    std::shared_ptr<const SubscriptionList> subs_;
    std::vector<std::shared_ptr<Subscription>> retired_;   // drains that unsubscribed themselves
    uint64_t next_handle_{0};
    bool shut_down_{false};

    mutable std::mutex error_mu_;
    ErrorHandler on_error_{};

    mutable std::mutex idle_mu_;
    mutable std::condition_variable idle_cv_;
};

} // namespace cantrace::dispatch
