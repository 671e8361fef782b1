#include <com/frame_codec.hpp>

namespace cantrace::com {

namespace {

void PutU32(std::vector<uint8_t>& out, uint32_t v) {
    for (int shift = 24; shift >= 0; shift -= 8) out.push_back(static_cast<uint8_t>(v >> shift));
}

void PutU64(std::vector<uint8_t>& out, uint64_t v) {
    for (int shift = 56; shift >= 0; shift -= 8) out.push_back(static_cast<uint8_t>(v >> shift));
}

uint32_t GetU32(const uint8_t* p) {
    return (uint32_t{p[0]} << 24) | (uint32_t{p[1]} << 16) | (uint32_t{p[2]} << 8) | uint32_t{p[3]};
}

uint64_t GetU64(const uint8_t* p) {
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i) v = (v << 8) | p[i];
    return v;
}

constexpr uint8_t kKnownFlags = kFlagExtended | kFlagFd | kFlagBitrateSwitch | kFlagTx;

} // namespace

std::vector<uint8_t> EncodeFrame(const core::Frame& frame) {
    std::vector<uint8_t> out;
    out.reserve(kFrameHeaderSize + frame.Length());
    PutU32(out, frame.Id());
    uint8_t flags = 0;
    if (frame.IsExtended()) flags |= kFlagExtended;
    if (frame.IsFd()) flags |= kFlagFd;
    if (frame.IsBitrateSwitch()) flags |= kFlagBitrateSwitch;
    if (frame.GetDirection() == core::Direction::kTx) flags |= kFlagTx;
    out.push_back(flags);
    out.push_back(frame.Channel());
    out.push_back(static_cast<uint8_t>(frame.GetErrorKind()));
    out.push_back(static_cast<uint8_t>(frame.Length()));
    PutU64(out, static_cast<uint64_t>(frame.Timestamp().count()));
    out.insert(out.end(), frame.Data(), frame.Data() + frame.Length());
    return out;
}

core::Result<core::Frame> DecodeFrame(const uint8_t* data, std::size_t size) {
    if (data == nullptr || size < kFrameHeaderSize) {
        return core::ErrorCode(core::Errc::kCorruption, "frame record shorter than header");
    }
    const uint32_t id = GetU32(data);
    const uint8_t flags = data[4];
    const uint8_t kind = data[6];
    const std::size_t length = data[7];
    if (flags & ~kKnownFlags) {
        return core::ErrorCode(core::Errc::kCorruption, "unknown frame flags");
    }
    if (kind > static_cast<uint8_t>(core::ErrorKind::kOther)) {
        return core::ErrorCode(core::Errc::kCorruption, "unknown error kind " + std::to_string(kind));
    }
    if (size != kFrameHeaderSize + length) {
        return core::ErrorCode(core::Errc::kCorruption,
                               "payload length " + std::to_string(length) + " does not match record size");
    }

    core::FrameOptions opt;
    opt.extended = (flags & kFlagExtended) != 0;
    opt.fd = (flags & kFlagFd) != 0;
    opt.bitrate_switch = (flags & kFlagBitrateSwitch) != 0;
    opt.direction = (flags & kFlagTx) ? core::Direction::kTx : core::Direction::kRx;
    opt.channel = data[5];
    opt.timestamp = std::chrono::nanoseconds(static_cast<int64_t>(GetU64(data + 8)));

    const uint8_t* payload = data + kFrameHeaderSize;
    auto frame = kind == 0
        ? core::Frame::MakeData(id, payload, length, opt)
        : core::Frame::MakeError(static_cast<core::ErrorKind>(kind), opt,
                                 std::vector<uint8_t>(payload, payload + length));
    if (!frame) {
        return core::ErrorCode(core::Errc::kCorruption, frame.Error().message);
    }
    return frame;
}

} // namespace cantrace::com
