#pragma once
#include <mutex>
#include <bus/bus_adapter.hpp>

namespace cantrace::bus {

// Linux raw CAN socket. Error frames are enabled; with FD the socket
// accepts canfd_frame. Own transmissions come back as Tx frames when
// receive_own_messages is set.
class SocketCanAdapter : public IBusAdapter {
public:
    SocketCanAdapter() = default;
    ~SocketCanAdapter() override;

    SocketCanAdapter(const SocketCanAdapter&) = delete;
    SocketCanAdapter& operator=(const SocketCanAdapter&) = delete;

    core::Result<void> Open(const BusConfig& config) override;
    core::Result<std::optional<core::Frame>> Receive(std::chrono::milliseconds timeout) override;
    core::Result<void> Send(const core::Frame& frame) override;
    void Close() override;
    bool IsOpen() const override;

private:
    mutable std::mutex mu_;
    int sock_{-1};
    BusConfig cfg_{};
};

} // namespace cantrace::bus
