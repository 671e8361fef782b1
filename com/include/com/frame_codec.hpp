#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>
#include <cantrace/core/frame.hpp>
#include <cantrace/core/result.hpp>

namespace cantrace::com {

// Wire layout of one frame in a SOME/IP notification payload, big-endian:
//   0  u32 identifier
//   4  u8  flags (bit0 extended, bit1 FD, bit2 bitrate switch, bit3 Tx)
//   5  u8  channel
//   6  u8  error kind (0 = data frame)
//   7  u8  payload length
//   8  i64 timestamp, ns
//  16  payload
inline constexpr std::size_t kFrameHeaderSize = 16;

enum FrameFlags : uint8_t {
    kFlagExtended = 0x01,
    kFlagFd = 0x02,
    kFlagBitrateSwitch = 0x04,
    kFlagTx = 0x08,
};

std::vector<uint8_t> EncodeFrame(const core::Frame& frame);

// kCorruption for truncated input, unknown flags or an invalid frame
core::Result<core::Frame> DecodeFrame(const uint8_t* data, std::size_t size);
inline core::Result<core::Frame> DecodeFrame(const std::vector<uint8_t>& bytes) {
    return DecodeFrame(bytes.data(), bytes.size());
}

} // namespace cantrace::com
