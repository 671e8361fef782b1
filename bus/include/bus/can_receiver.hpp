#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <bus/bus_adapter.hpp>
#include <dispatch/message_dispatcher.hpp>

namespace cantrace::bus {

// Live producer: pulls frames from an adapter on its own thread and hands
// them to the dispatcher in arrival order.
class CanReceiver {
public:
    using FaultHandler = std::function<void(const core::ErrorCode&)>;

    static constexpr std::chrono::milliseconds kPollInterval{50};

    CanReceiver(std::shared_ptr<IBusAdapter> adapter, dispatch::MessageDispatcher& dispatcher);
    ~CanReceiver();

    CanReceiver(const CanReceiver&) = delete;
    CanReceiver& operator=(const CanReceiver&) = delete;

    core::Result<void> Start();
    // Returns after the receive thread made its last Dispatch call
    void Stop();
    bool IsRunning() const noexcept { return running_.load(std::memory_order_acquire); }

    void SetFaultHandler(FaultHandler cb);

    uint64_t Received() const noexcept { return received_.load(std::memory_order_relaxed); }
    uint64_t Faults() const noexcept { return faults_.load(std::memory_order_relaxed); }

private:
    void Loop();
    void ReportFault(const core::ErrorCode& err);

    std::shared_ptr<IBusAdapter> adapter_;
    dispatch::MessageDispatcher& dispatcher_;

    std::mutex control_mu_;
    std::thread thread_;
    std::atomic<bool> stop_{false};
    std::atomic<bool> running_{false};

    std::mutex fault_mu_;
    FaultHandler on_fault_{};

    std::atomic<uint64_t> received_{0};
    std::atomic<uint64_t> faults_{0};
};

} // namespace cantrace::bus
