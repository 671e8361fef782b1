#pragma once
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <cantrace/core/result.hpp>

namespace cantrace::core {

enum class Direction : uint8_t { kRx, kTx };

enum class ErrorKind : uint8_t {
    kNone = 0,
    kBit,
    kStuff,
    kForm,
    kAck,
    kCrc,
    kBusOff,
    kErrorPassive,
    kOther
};

inline constexpr std::string_view ToString(Direction d) {
    return d == Direction::kTx ? "Tx" : "Rx";
}

// Token written in the payload column of an error line
std::string_view ToToken(ErrorKind kind);
std::optional<ErrorKind> ErrorKindFromToken(std::string_view token);

inline constexpr uint32_t kMaxStandardId = 0x7FF;
inline constexpr uint32_t kMaxExtendedId = 0x1FFFFFFF;
inline constexpr std::size_t kMaxClassicPayload = 8;
inline constexpr std::size_t kMaxFdPayload = 64;

// CAN FD length code <-> byte count. Lengths that are not an exact FD
// size (e.g. 9) have no code.
std::optional<uint8_t> LengthToDlc(std::size_t length, bool fd);
std::size_t DlcToLength(uint8_t dlc, bool fd);

using WallClock = std::chrono::system_clock::time_point;

struct FrameOptions {
    Direction direction{Direction::kRx};
    bool extended{false};
    bool fd{false};
    bool bitrate_switch{false};
    uint8_t channel{1};
    // monotonic capture instant (steady clock epoch)
    std::chrono::nanoseconds timestamp{0};
    std::optional<WallClock> wall_time{};
};

// One captured or synthesized bus event. Built through the validating
// factories; never mutated afterwards.
class Frame {
public:
    Frame() = default;

    static Result<Frame> MakeData(uint32_t id, const std::vector<uint8_t>& payload,
                                  const FrameOptions& opt = {});
    static Result<Frame> MakeData(uint32_t id, const uint8_t* data, std::size_t length,
                                  const FrameOptions& opt = {});
    static Result<Frame> MakeError(ErrorKind kind, const FrameOptions& opt = {},
                                   const std::vector<uint8_t>& diagnostic = {});

    uint32_t Id() const noexcept { return id_; }
    Direction GetDirection() const noexcept { return direction_; }
    std::chrono::nanoseconds Timestamp() const noexcept { return timestamp_; }
    const std::optional<WallClock>& WallTime() const noexcept { return wall_time_; }
    uint8_t Channel() const noexcept { return channel_; }

    std::size_t Length() const noexcept { return length_; }
    uint8_t Dlc() const noexcept;
    const uint8_t* Data() const noexcept { return data_.data(); }
    std::vector<uint8_t> Payload() const { return {data_.begin(), data_.begin() + length_}; }

    bool IsExtended() const noexcept { return extended_; }
    bool IsFd() const noexcept { return fd_; }
    bool IsBitrateSwitch() const noexcept { return brs_; }
    bool IsError() const noexcept { return error_kind_ != ErrorKind::kNone; }
    ErrorKind GetErrorKind() const noexcept { return error_kind_; }

    // Copies with a different capture instant / direction (replay, loopback)
    Frame WithTimestamp(std::chrono::nanoseconds ts, std::optional<WallClock> wall) const;
    Frame WithDirection(Direction dir) const;

    // "123" for standard ids, "18DB33F1" for extended ones
    std::string IdHex() const;
    std::string_view FrameTypeName() const noexcept;

private:
    uint32_t id_{0};
    Direction direction_{Direction::kRx};
    std::chrono::nanoseconds timestamp_{0};
    std::optional<WallClock> wall_time_{};
    std::array<uint8_t, kMaxFdPayload> data_{};
    uint8_t length_{0};
    bool extended_{false};
    bool fd_{false};
    bool brs_{false};
    ErrorKind error_kind_{ErrorKind::kNone};
    uint8_t channel_{1};
};

bool operator==(const Frame& a, const Frame& b);
inline bool operator!=(const Frame& a, const Frame& b) { return !(a == b); }

// Steady clock reading in the representation Frame uses
inline std::chrono::nanoseconds MonotonicNow() {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now().time_since_epoch());
}

} // namespace cantrace::core
