#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vsomeip/vsomeip.hpp>
#include <cantrace/core/result.hpp>
#include <config/options.hpp>
#include <dispatch/message_dispatcher.hpp>

namespace cantrace::com {

// Forwards dispatched frames to remote tools as SOME/IP notifications.
// It is a plain dispatcher consumer: slow SOME/IP peers only fill its own
// queue.
class SomeipFramePublisher {
public:
    SomeipFramePublisher(dispatch::MessageDispatcher& dispatcher, config::SomeipOptions options,
                         std::string app_name = "cantrace");
    ~SomeipFramePublisher();

    SomeipFramePublisher(const SomeipFramePublisher&) = delete;
    SomeipFramePublisher& operator=(const SomeipFramePublisher&) = delete;

    core::Result<void> Start(dispatch::Filter filter = dispatch::Filter::All());
    void Stop();

    uint64_t Published() const noexcept { return published_.load(std::memory_order_relaxed); }

private:
    void Publish(const core::Frame& frame);

    dispatch::MessageDispatcher& dispatcher_;
    const config::SomeipOptions options_;
    const std::string app_name_;

    std::mutex mu_;
    std::shared_ptr<vsomeip::application> app_;
    std::thread app_thread_;
    dispatch::SubscriptionHandle handle_{};
    std::atomic<uint64_t> published_{0};
};

} // namespace cantrace::com
