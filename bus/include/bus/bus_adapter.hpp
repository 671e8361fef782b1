#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <cantrace/core/frame.hpp>
#include <cantrace/core/result.hpp>

namespace cantrace::bus {

struct BusConfig {
    std::string interface{"vcan0"};
    bool fd{false};
    uint32_t bitrate{500000};   // informational, the interface is configured outside
    uint8_t channel{1};
    bool receive_own_messages{true};
};

// Transport seam. Receive returns nullopt when the timeout expires without
// traffic; kBusError means the bus is gone and the caller should stop.
class IBusAdapter {
public:
    virtual ~IBusAdapter() = default;

    virtual core::Result<void> Open(const BusConfig& config) = 0;
    virtual core::Result<std::optional<core::Frame>> Receive(std::chrono::milliseconds timeout) = 0;
    virtual core::Result<void> Send(const core::Frame& frame) = 0;
    virtual void Close() = 0;
    virtual bool IsOpen() const = 0;
};

} // namespace cantrace::bus
