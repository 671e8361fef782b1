#include <cantrace/core/frame.hpp>
#include <algorithm>
#include <cstdio>
#include <cstring>

namespace cantrace::core {

namespace {

struct ErrorToken { ErrorKind kind; std::string_view token; };

constexpr ErrorToken kErrorTokens[] = {
    {ErrorKind::kBit,          "BIT"},
    {ErrorKind::kStuff,        "STUFF"},
    {ErrorKind::kForm,         "FORM"},
    {ErrorKind::kAck,          "ACK"},
    {ErrorKind::kCrc,          "CRC"},
    {ErrorKind::kBusOff,       "BUSOFF"},
    {ErrorKind::kErrorPassive, "PASSIVE"},
    {ErrorKind::kOther,        "OTHER"},
};

// Payload sizes reachable through DLC 0..15 on CAN FD
constexpr std::size_t kFdLengths[16] = {0, 1, 2, 3, 4, 5, 6, 7, 8, 12, 16, 20, 24, 32, 48, 64};

Result<void> CheckId(uint32_t id, bool extended) {
    const uint32_t max = extended ? kMaxExtendedId : kMaxStandardId;
    if (id > max) {
        return ErrorCode(Errc::kInvalidArgument, "identifier out of range: " + std::to_string(id));
    }
    return {};
}

} // namespace

std::string_view ToToken(ErrorKind kind) {
    for (const auto& t : kErrorTokens) {
        if (t.kind == kind) return t.token;
    }
    return "NONE";
}

std::optional<ErrorKind> ErrorKindFromToken(std::string_view token) {
    for (const auto& t : kErrorTokens) {
        if (t.token == token) return t.kind;
    }
    return std::nullopt;
}

std::optional<uint8_t> LengthToDlc(std::size_t length, bool fd) {
    if (!fd) {
        if (length > kMaxClassicPayload) return std::nullopt;
        return static_cast<uint8_t>(length);
    }
    for (uint8_t dlc = 0; dlc < 16; ++dlc) {
        if (kFdLengths[dlc] == length) return dlc;
    }
    return std::nullopt;
}

std::size_t DlcToLength(uint8_t dlc, bool fd) {
    if (dlc > 15) dlc = 15;
    if (!fd) return std::min<std::size_t>(dlc, kMaxClassicPayload);
    return kFdLengths[dlc];
}

Result<Frame> Frame::MakeData(uint32_t id, const std::vector<uint8_t>& payload,
                              const FrameOptions& opt) {
    return MakeData(id, payload.data(), payload.size(), opt);
}

Result<Frame> Frame::MakeData(uint32_t id, const uint8_t* data, std::size_t length,
                              const FrameOptions& opt) {
    if (auto r = CheckId(id, opt.extended); !r) return r.Error();
    if (opt.bitrate_switch && !opt.fd) {
        return ErrorCode(Errc::kInvalidArgument, "bitrate switch requires an FD frame");
    }
    if (!LengthToDlc(length, opt.fd)) {
        return ErrorCode(Errc::kInvalidArgument,
                         "payload length " + std::to_string(length) + " has no length code");
    }
    if (length > 0 && data == nullptr) {
        return ErrorCode(Errc::kInvalidArgument, "null payload");
    }

    Frame f;
    f.id_ = id;
    f.direction_ = opt.direction;
    f.timestamp_ = opt.timestamp;
    f.wall_time_ = opt.wall_time;
    f.extended_ = opt.extended;
    f.fd_ = opt.fd;
    f.brs_ = opt.bitrate_switch;
    f.channel_ = opt.channel;
    f.length_ = static_cast<uint8_t>(length);
    if (length > 0) std::memcpy(f.data_.data(), data, length);
    return f;
}

Result<Frame> Frame::MakeError(ErrorKind kind, const FrameOptions& opt,
                               const std::vector<uint8_t>& diagnostic) {
    if (kind == ErrorKind::kNone) {
        return ErrorCode(Errc::kInvalidArgument, "error frame needs an error kind");
    }
    if (diagnostic.size() > kMaxClassicPayload) {
        return ErrorCode(Errc::kInvalidArgument, "diagnostic payload longer than 8 bytes");
    }
    Frame f;
    f.id_ = 0;
    f.direction_ = opt.direction;
    f.timestamp_ = opt.timestamp;
    f.wall_time_ = opt.wall_time;
    f.channel_ = opt.channel;
    f.error_kind_ = kind;
    f.length_ = static_cast<uint8_t>(diagnostic.size());
    std::copy(diagnostic.begin(), diagnostic.end(), f.data_.begin());
    return f;
}

uint8_t Frame::Dlc() const noexcept {
    return LengthToDlc(length_, fd_).value_or(0);
}

Frame Frame::WithTimestamp(std::chrono::nanoseconds ts, std::optional<WallClock> wall) const {
    Frame f = *this;
    f.timestamp_ = ts;
    f.wall_time_ = wall;
    return f;
}

Frame Frame::WithDirection(Direction dir) const {
    Frame f = *this;
    f.direction_ = dir;
    return f;
}

std::string Frame::IdHex() const {
    char buf[16];
    std::snprintf(buf, sizeof(buf), extended_ ? "%08X" : "%03X", static_cast<unsigned>(id_));
    return buf;
}

std::string_view Frame::FrameTypeName() const noexcept {
    if (IsError()) return "Error";
    if (fd_) return "FD";
    return "Data";
}

bool operator==(const Frame& a, const Frame& b) {
    return a.Id() == b.Id()
        && a.GetDirection() == b.GetDirection()
        && a.Timestamp() == b.Timestamp()
        && a.WallTime() == b.WallTime()
        && a.Channel() == b.Channel()
        && a.IsExtended() == b.IsExtended()
        && a.IsFd() == b.IsFd()
        && a.IsBitrateSwitch() == b.IsBitrateSwitch()
        && a.GetErrorKind() == b.GetErrorKind()
        && a.Length() == b.Length()
        && std::equal(a.Data(), a.Data() + a.Length(), b.Data());
}

} // namespace cantrace::core
