#include <bus/can_receiver.hpp>
#include <exception>
#include <log.hpp>

namespace cantrace::bus {

namespace {

log::Logger& ReceiverLog() {
    static log::Logger lg = log::Logger::CreateLogger("RECV", "CAN receiver");
    return lg;
}

} // namespace

CanReceiver::CanReceiver(std::shared_ptr<IBusAdapter> adapter, dispatch::MessageDispatcher& dispatcher)
    : adapter_(std::move(adapter)), dispatcher_(dispatcher) {}

CanReceiver::~CanReceiver() {
    Stop();
}

core::Result<void> CanReceiver::Start() {
    std::lock_guard<std::mutex> lk(control_mu_);
    if (!adapter_) return core::ErrorCode(core::Errc::kInvalidArgument, "no bus adapter");
    if (IsRunning()) return core::ErrorCode(core::Errc::kStateError, "receiver already running");
    if (thread_.joinable()) thread_.join();   // loop ended on its own after a bus loss
    if (!adapter_->IsOpen()) return core::ErrorCode(core::Errc::kStateError, "bus adapter not open");

    stop_.store(false, std::memory_order_release);
    running_.store(true, std::memory_order_release);
    thread_ = std::thread([this] { Loop(); });
    CANTRACE_LOGINFO(ReceiverLog(), "receive loop started");
    return {};
}

void CanReceiver::Stop() {
    std::lock_guard<std::mutex> lk(control_mu_);
    stop_.store(true, std::memory_order_release);
    if (thread_.joinable()) {
        thread_.join();
        CANTRACE_LOGINFO(ReceiverLog(), "receive loop stopped ({} frames, {} faults)", Received(), Faults());
    }
}

void CanReceiver::SetFaultHandler(FaultHandler cb) {
    std::lock_guard<std::mutex> lk(fault_mu_);
    on_fault_ = std::move(cb);
}

void CanReceiver::Loop() {
    while (!stop_.load(std::memory_order_acquire)) {
        auto res = adapter_->Receive(kPollInterval);
        if (!res) {
            ReportFault(res.Error());
            if (res.Error().value == core::Errc::kBusError) {
                CANTRACE_LOGERROR(ReceiverLog(), "bus lost, receive loop ends");
                break;
            }
            continue;
        }
        if (!res.Value()) continue;
        received_.fetch_add(1, std::memory_order_relaxed);
        dispatcher_.Dispatch(*res.Value());
    }
    running_.store(false, std::memory_order_release);
}

void CanReceiver::ReportFault(const core::ErrorCode& err) {
    faults_.fetch_add(1, std::memory_order_relaxed);
    CANTRACE_LOGWARN(ReceiverLog(), "bus fault: {}", err.Describe());
    FaultHandler cb;
    {
        std::lock_guard<std::mutex> lk(fault_mu_);
        cb = on_fault_;
    }
    if (!cb) return;
    try {
        cb(err);
    } catch (const std::exception& e) {
        CANTRACE_LOGERROR(ReceiverLog(), "fault handler threw: {}", e.what());
    }
}

} // namespace cantrace::bus
