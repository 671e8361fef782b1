#include <dispatch/message_dispatcher.hpp>
#include <algorithm>
#include <exception>
#include <optional>
#include <log.hpp>

namespace cantrace::dispatch {

namespace {

log::Logger& DispatchLog() {
    static log::Logger lg = log::Logger::CreateLogger("DISP", "Message dispatcher");
    return lg;
}

} // namespace

struct MessageDispatcher::Subscription {
    Subscription(SubscriptionHandle h, Filter f, DeliveryTarget t, std::string n,
                 std::size_t capacity, OverflowPolicy policy)
        : handle(h), filter(f), target(std::move(t)), name(std::move(n)), queue(capacity, policy) {}

    const SubscriptionHandle handle;
    const Filter filter;
    const DeliveryTarget target;
    const std::string name;
    FrameQueue<core::Frame> queue;
    std::thread worker;
    std::atomic<bool> exited{false};     // DrainLoop returned; join does not block
    std::atomic<bool> detached{false};   // Shutdown ran inside this subscription's target

    std::atomic<uint64_t> delivered{0};
    std::atomic<uint64_t> dropped{0};
    std::atomic<uint64_t> faults{0};
};

MessageDispatcher::MessageDispatcher(std::size_t default_queue_capacity,
                                     OverflowPolicy default_overflow)
    : default_capacity_(default_queue_capacity == 0 ? kDefaultQueueCapacity : default_queue_capacity),
      default_overflow_(default_overflow),
      subs_(std::make_shared<const SubscriptionList>()) {}

MessageDispatcher::~MessageDispatcher() {
    Shutdown();
}

core::Result<SubscriptionHandle> MessageDispatcher::Subscribe(Filter filter, DeliveryTarget target) {
    SubscriptionOptions opt;
    opt.overflow = default_overflow_;
    return Subscribe(filter, std::move(target), std::move(opt));
}

core::Result<SubscriptionHandle> MessageDispatcher::Subscribe(Filter filter, DeliveryTarget target,
                                                              SubscriptionOptions options) {
    if (!target) {
        return core::ErrorCode(core::Errc::kInvalidArgument, "subscription without delivery target");
    }
    if (filter.kind == Filter::Kind::kExact && filter.id > core::kMaxExtendedId) {
        return core::ErrorCode(core::Errc::kInvalidArgument,
                               "filter id out of range: " + std::to_string(filter.id));
    }

    std::lock_guard<std::mutex> lk(control_mu_);
    if (shut_down_) {
        return core::ErrorCode(core::Errc::kStateError, "dispatcher is shut down");
    }
    ReapRetiredLocked();

    SubscriptionHandle handle{++next_handle_};
    std::string name = options.name.empty() ? "sub-" + std::to_string(handle.value) : options.name;
    const std::size_t capacity = options.queue_capacity == 0 ? default_capacity_ : options.queue_capacity;

    auto sub = std::make_shared<Subscription>(handle, filter, std::move(target), std::move(name),
                                              capacity, options.overflow);
    sub->worker = std::thread([this, sub] { DrainLoop(sub); });

    auto next = std::make_shared<SubscriptionList>(*std::atomic_load(&subs_));
    next->push_back(sub);
    std::atomic_store(&subs_, std::shared_ptr<const SubscriptionList>(std::move(next)));

    if (filter.kind == Filter::Kind::kExact) {
        CANTRACE_LOGDEBUG(DispatchLog(), "subscribed '{}' to id {} (queue {})", sub->name, filter.id, capacity);
    } else {
        CANTRACE_LOGDEBUG(DispatchLog(), "subscribed '{}' to all ids (queue {})", sub->name, capacity);
    }
    return handle;
}

core::Result<void> MessageDispatcher::Unsubscribe(SubscriptionHandle handle) {
    std::shared_ptr<Subscription> sub;
    bool own_thread = false;
    {
        std::lock_guard<std::mutex> lk(control_mu_);
        auto current = std::atomic_load(&subs_);
        auto it = std::find_if(current->begin(), current->end(),
                               [&](const auto& s) { return s->handle == handle; });
        if (it == current->end()) {
            return core::ErrorCode(core::Errc::kNotFound,
                                   "no subscription with handle " + std::to_string(handle.value));
        }
        sub = *it;
        auto next = std::make_shared<SubscriptionList>();
        next->reserve(current->size() - 1);
        for (const auto& s : *current) {
            if (s != sub) next->push_back(s);
        }
        std::atomic_store(&subs_, std::shared_ptr<const SubscriptionList>(std::move(next)));

        sub->queue.Close();
        ReapRetiredLocked();
        own_thread = sub->worker.get_id() == std::this_thread::get_id();
        if (own_thread) {
            // called from the subscription's own target: it exits after returning
            retired_.push_back(sub);
        }
    }
    if (!own_thread && sub->worker.joinable()) sub->worker.join();
    NotifyIdle();
    CANTRACE_LOGDEBUG(DispatchLog(), "unsubscribed '{}' (delivered {}, dropped {})", sub->name,
                      sub->delivered.load(), sub->dropped.load());
    return {};
}

void MessageDispatcher::Dispatch(const core::Frame& frame) {
    auto subs = std::atomic_load(&subs_);
    Enqueue(*subs, frame);
}

void MessageDispatcher::DispatchBatch(const std::vector<core::Frame>& frames) {
    auto subs = std::atomic_load(&subs_);
    for (const auto& f : frames) Enqueue(*subs, f);
}

void MessageDispatcher::Enqueue(const SubscriptionList& subs, const core::Frame& frame) {
    for (const auto& sub : subs) {
        if (!sub->filter.Matches(frame)) continue;
        switch (sub->queue.Push(frame)) {
            case PushResult::kQueued:
            case PushResult::kClosed:
                break;
            case PushResult::kDroppedOldest:
            case PushResult::kDroppedNewest:
                if (sub->dropped.fetch_add(1, std::memory_order_relaxed) == 0) {
                    CANTRACE_LOGWARN(DispatchLog(), "'{}' queue full ({}), frames are being dropped",
                                     sub->name, sub->queue.Capacity());
                }
                break;
        }
    }
}

void MessageDispatcher::DrainLoop(const std::shared_ptr<Subscription>& sub) {
    while (auto frame = sub->queue.Pop()) {
        std::optional<std::string> fault;
        try {
            sub->target(*frame);
            sub->delivered.fetch_add(1, std::memory_order_relaxed);
        } catch (const std::exception& e) {
            fault = e.what();
        } catch (...) {
            fault = "non-standard exception";
        }
        // A target that shut the dispatcher down may also have destroyed it.
        // From here on only the subscription, which this thread co-owns, is
        // touched.
        if (sub->detached.load(std::memory_order_acquire)) return;
        if (fault) ReportFault(*sub, *frame, *fault);
        sub->queue.Done();
        NotifyIdle();
    }
    sub->exited.store(true, std::memory_order_release);
}

void MessageDispatcher::ReapRetiredLocked() {
    auto done = std::stable_partition(retired_.begin(), retired_.end(),
                                      [](const auto& s) { return !s->exited.load(std::memory_order_acquire); });
    for (auto it = done; it != retired_.end(); ++it) {
        if ((*it)->worker.joinable()) (*it)->worker.join();
    }
    retired_.erase(done, retired_.end());
}

void MessageDispatcher::JoinDrain(Subscription& sub) {
    if (!sub.worker.joinable()) return;
    if (sub.worker.get_id() == std::this_thread::get_id()) {
        sub.detached.store(true, std::memory_order_release);
        sub.worker.detach();
    } else {
        sub.worker.join();
    }
}

void MessageDispatcher::ReportFault(Subscription& sub, const core::Frame& frame, const std::string& what) {
    sub.faults.fetch_add(1, std::memory_order_relaxed);
    CANTRACE_LOGWARN(DispatchLog(), "delivery to '{}' failed for id 0x{}: {}", sub.name, frame.IdHex(), what);

    ErrorHandler handler;
    {
        std::lock_guard<std::mutex> lk(error_mu_);
        handler = on_error_;
    }
    if (!handler) return;
    DeliveryError err{sub.handle, sub.name, what, frame};
    try {
        handler(err);
    } catch (const std::exception& e) {
        CANTRACE_LOGERROR(DispatchLog(), "error handler threw: {}", e.what());
    } catch (...) {
        CANTRACE_LOGERROR(DispatchLog(), "error handler threw a non-standard exception");
    }
}

void MessageDispatcher::NotifyIdle() const {
    { std::lock_guard<std::mutex> lk(idle_mu_); }
    idle_cv_.notify_all();
}

void MessageDispatcher::SetErrorHandler(ErrorHandler handler) {
    std::lock_guard<std::mutex> lk(error_mu_);
    on_error_ = std::move(handler);
}

core::Result<SubscriptionStats> MessageDispatcher::Stats(SubscriptionHandle handle) const {
    auto subs = std::atomic_load(&subs_);
    for (const auto& s : *subs) {
        if (s->handle != handle) continue;
        SubscriptionStats st;
        st.delivered = s->delivered.load(std::memory_order_relaxed);
        st.dropped = s->dropped.load(std::memory_order_relaxed);
        st.faults = s->faults.load(std::memory_order_relaxed);
        st.queued = s->queue.Size();
        return st;
    }
    return core::ErrorCode(core::Errc::kNotFound, "no subscription with handle " + std::to_string(handle.value));
}

std::size_t MessageDispatcher::SubscriberCount() const {
    return std::atomic_load(&subs_)->size();
}

bool MessageDispatcher::WaitUntilIdle(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lk(idle_mu_);
    return idle_cv_.wait_for(lk, timeout, [this] {
        auto subs = std::atomic_load(&subs_);
        return std::all_of(subs->begin(), subs->end(),
                           [](const auto& s) { return s->queue.Idle(); });
    });
}

void MessageDispatcher::Shutdown() {
    std::shared_ptr<const SubscriptionList> subs;
    std::vector<std::shared_ptr<Subscription>> retired;
    {
        std::lock_guard<std::mutex> lk(control_mu_);
        if (shut_down_) return;
        shut_down_ = true;
        subs = std::atomic_load(&subs_);
        std::atomic_store(&subs_, std::make_shared<const SubscriptionList>());
        retired.swap(retired_);
    }
    for (const auto& s : *subs) s->queue.Close();
    // shut down from inside a target: that drain is detached and exits on its own
    for (const auto& s : *subs) JoinDrain(*s);
    for (const auto& s : retired) JoinDrain(*s);
    NotifyIdle();
    CANTRACE_LOGDEBUG(DispatchLog(), "shut down, {} subscriptions closed", subs->size());
}

} // namespace cantrace::dispatch
