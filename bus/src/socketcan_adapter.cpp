#include <bus/socketcan_adapter.hpp>
#include <linux/can.h>
#include <linux/can/error.h>
#include <linux/can/raw.h>
#include <sys/socket.h>
#include <net/if.h>
#include <sys/ioctl.h>
#include <poll.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <vector>
#include <log.hpp>

namespace cantrace::bus {

namespace {

log::Logger& CanLog() {
    static log::Logger lg = log::Logger::CreateLogger("SCAN", "SocketCAN adapter");
    return lg;
}

std::string Errno(const char* what) {
    return std::string(what) + ": " + std::strerror(errno);
}

// Maps the error class bits of an error frame onto one ErrorKind
core::ErrorKind ClassifyError(const canfd_frame& f) {
    const canid_t cls = f.can_id & CAN_ERR_MASK;
    if (cls & CAN_ERR_BUSOFF) return core::ErrorKind::kBusOff;
    if (cls & CAN_ERR_ACK) return core::ErrorKind::kAck;
    if (cls & CAN_ERR_PROT) {
        const uint8_t type = f.len > 2 ? f.data[2] : 0;
        if (type & CAN_ERR_PROT_BIT) return core::ErrorKind::kBit;
        if (type & CAN_ERR_PROT_FORM) return core::ErrorKind::kForm;
        if (type & CAN_ERR_PROT_STUFF) return core::ErrorKind::kStuff;
        const uint8_t loc = f.len > 3 ? f.data[3] : 0;
        if (loc == CAN_ERR_PROT_LOC_CRC_SEQ || loc == CAN_ERR_PROT_LOC_CRC_DEL) return core::ErrorKind::kCrc;
        return core::ErrorKind::kOther;
    }
    if (cls & CAN_ERR_CRTL) {
        const uint8_t ctrl = f.len > 1 ? f.data[1] : 0;
        if (ctrl & (CAN_ERR_CRTL_RX_PASSIVE | CAN_ERR_CRTL_TX_PASSIVE)) return core::ErrorKind::kErrorPassive;
    }
    return core::ErrorKind::kOther;
}

} // namespace

SocketCanAdapter::~SocketCanAdapter() {
    Close();
}

core::Result<void> SocketCanAdapter::Open(const BusConfig& config) {
    std::lock_guard<std::mutex> lk(mu_);
    if (sock_ >= 0) {
        return core::ErrorCode(core::Errc::kStateError, "already open on " + cfg_.interface);
    }
    int s = ::socket(PF_CAN, SOCK_RAW, CAN_RAW);
    if (s < 0) return core::ErrorCode(core::Errc::kBusError, Errno("socket(PF_CAN)"));

    ifreq ifr{};
    std::snprintf(ifr.ifr_name, IFNAMSIZ, "%s", config.interface.c_str());
    if (::ioctl(s, SIOCGIFINDEX, &ifr) < 0) {
        auto err = Errno("SIOCGIFINDEX");
        ::close(s);
        return core::ErrorCode(core::Errc::kNotFound, config.interface + ": " + err);
    }

    const can_err_mask_t err_mask = CAN_ERR_MASK;
    if (::setsockopt(s, SOL_CAN_RAW, CAN_RAW_ERR_FILTER, &err_mask, sizeof(err_mask)) < 0) {
        CANTRACE_LOGWARN(CanLog(), "{}: error frames disabled, {}", config.interface, Errno("CAN_RAW_ERR_FILTER"));
    }
    const int own = config.receive_own_messages ? 1 : 0;
    if (::setsockopt(s, SOL_CAN_RAW, CAN_RAW_RECV_OWN_MSGS, &own, sizeof(own)) < 0) {
        CANTRACE_LOGWARN(CanLog(), "{}: own messages not looped back, {}", config.interface,
                         Errno("CAN_RAW_RECV_OWN_MSGS"));
    }
    if (config.fd) {
        const int on = 1;
        if (::setsockopt(s, SOL_CAN_RAW, CAN_RAW_FD_FRAMES, &on, sizeof(on)) < 0) {
            auto err = Errno("CAN_RAW_FD_FRAMES");
            ::close(s);
            return core::ErrorCode(core::Errc::kBusError, config.interface + ": " + err);
        }
    }

    sockaddr_can addr{};
    addr.can_family = AF_CAN;
    addr.can_ifindex = ifr.ifr_ifindex;
    if (::bind(s, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        auto err = Errno("bind(PF_CAN)");
        ::close(s);
        return core::ErrorCode(core::Errc::kBusError, config.interface + ": " + err);
    }

    sock_ = s;
    cfg_ = config;
    CANTRACE_LOGINFO(CanLog(), "opened {} (fd {}, {} bit/s)", cfg_.interface, cfg_.fd ? "on" : "off", cfg_.bitrate);
    return {};
}

core::Result<std::optional<core::Frame>> SocketCanAdapter::Receive(std::chrono::milliseconds timeout) {
    int s;
    BusConfig cfg;
    {
        std::lock_guard<std::mutex> lk(mu_);
        s = sock_;
        cfg = cfg_;
    }
    if (s < 0) return core::ErrorCode(core::Errc::kBusError, "socket closed");

    pollfd pfd{};
    pfd.fd = s;
    pfd.events = POLLIN;
    const int pr = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (pr < 0) {
        if (errno == EINTR) return std::optional<core::Frame>{};
        return core::ErrorCode(core::Errc::kBusError, Errno("poll"));
    }
    if (pr == 0) return std::optional<core::Frame>{};
    if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
        return core::ErrorCode(core::Errc::kBusError, cfg.interface + " went away");
    }

    canfd_frame raw{};
    iovec iov{&raw, sizeof(raw)};
    msghdr msg{};
    msg.msg_iov = &iov;
    msg.msg_iovlen = 1;
    const ssize_t n = ::recvmsg(s, &msg, 0);
    if (n < 0) {
        if (errno == EAGAIN || errno == EINTR) return std::optional<core::Frame>{};
        if (errno == ENETDOWN || errno == ENODEV || errno == EBADF) {
            return core::ErrorCode(core::Errc::kBusError, Errno("recvmsg"));
        }
        return core::ErrorCode(core::Errc::kIoError, Errno("recvmsg"));
    }
    const bool is_fd = n == static_cast<ssize_t>(CANFD_MTU);
    if (!is_fd && n != static_cast<ssize_t>(CAN_MTU)) {
        return core::ErrorCode(core::Errc::kIoError, "short read of " + std::to_string(n) + " bytes");
    }

    core::FrameOptions opt;
    opt.channel = cfg.channel;
    opt.timestamp = core::MonotonicNow();
    opt.wall_time = std::chrono::system_clock::now();
    opt.direction = (msg.msg_flags & MSG_DONTROUTE) ? core::Direction::kTx : core::Direction::kRx;

    if (raw.can_id & CAN_ERR_FLAG) {
        std::vector<uint8_t> diag(raw.data, raw.data + std::min<std::size_t>(raw.len, CAN_ERR_DLC));
        auto f = core::Frame::MakeError(ClassifyError(raw), opt, diag);
        if (!f) return f.Error();
        return std::optional<core::Frame>(std::move(f.Value()));
    }

    opt.extended = (raw.can_id & CAN_EFF_FLAG) != 0;
    opt.fd = is_fd;
    opt.bitrate_switch = is_fd && (raw.flags & CANFD_BRS);
    const uint32_t id = raw.can_id & (opt.extended ? CAN_EFF_MASK : CAN_SFF_MASK);
    // RTR frames carry no data on the wire
    const std::size_t len = (raw.can_id & CAN_RTR_FLAG) ? 0 : raw.len;
    auto f = core::Frame::MakeData(id, raw.data, len, opt);
    if (!f) return f.Error();
    return std::optional<core::Frame>(std::move(f.Value()));
}

core::Result<void> SocketCanAdapter::Send(const core::Frame& frame) {
    if (frame.IsError()) {
        return core::ErrorCode(core::Errc::kInvalidArgument, "error frames cannot be sent");
    }
    std::lock_guard<std::mutex> lk(mu_);
    if (sock_ < 0) return core::ErrorCode(core::Errc::kStateError, "socket not open");
    if (frame.IsFd() && !cfg_.fd) {
        return core::ErrorCode(core::Errc::kInvalidArgument, "FD frame on a classic CAN socket");
    }

    canfd_frame raw{};
    raw.can_id = frame.Id() | (frame.IsExtended() ? CAN_EFF_FLAG : 0);
    raw.len = static_cast<uint8_t>(frame.Length());
    if (frame.IsBitrateSwitch()) raw.flags |= CANFD_BRS;
    std::memcpy(raw.data, frame.Data(), frame.Length());

    const std::size_t size = frame.IsFd() ? CANFD_MTU : CAN_MTU;
    const ssize_t n = ::write(sock_, &raw, size);
    if (n != static_cast<ssize_t>(size)) {
        return core::ErrorCode(core::Errc::kIoError, Errno("write(PF_CAN)"));
    }
    return {};
}

void SocketCanAdapter::Close() {
    std::lock_guard<std::mutex> lk(mu_);
    if (sock_ < 0) return;
    ::close(sock_);
    sock_ = -1;
    CANTRACE_LOGINFO(CanLog(), "closed {}", cfg_.interface);
}

bool SocketCanAdapter::IsOpen() const {
    std::lock_guard<std::mutex> lk(mu_);
    return sock_ >= 0;
}

} // namespace cantrace::bus
