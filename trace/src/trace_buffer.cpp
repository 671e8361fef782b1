#include <trace/trace_buffer.hpp>
#include <algorithm>
#include <log.hpp>

namespace cantrace::trace {

namespace {

log::Logger& BufferLog() {
    static log::Logger lg = log::Logger::CreateLogger("TRBF", "Trace buffer");
    return lg;
}

int64_t ToEpochNs(const core::WallClock& tp) {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count();
}

} // namespace

TraceBuffer::TraceBuffer(std::size_t capacity)
    : capacity_(std::max<std::size_t>(capacity, 1)),
      slots_(capacity_),
      stripes_(new std::mutex[(capacity_ + kStripeSize - 1) / kStripeSize]) {
    if (capacity == 0) {
        CANTRACE_LOGWARN(BufferLog(), "capacity 0 requested, using 1");
    }
}

uint64_t TraceBuffer::Append(const core::Frame& frame) {
    const uint64_t n = total_.load(std::memory_order_relaxed);
    const uint64_t seq = n + 1;

    if (!has_origin_) {
        has_origin_ = true;
        origin_ = frame.Timestamp();
        last_offset_ = std::chrono::nanoseconds{0};
        const auto wall = frame.WallTime().value_or(std::chrono::system_clock::now());
        start_wall_ns_.store(ToEpochNs(wall), std::memory_order_relaxed);
        has_start_.store(true, std::memory_order_release);
    }
    // arrival order is kept even if a source clock steps back
    auto offset = frame.Timestamp() - origin_;
    if (offset < last_offset_) offset = last_offset_;
    last_offset_ = offset;

    const std::size_t slot = static_cast<std::size_t>(n % capacity_);
    {
        std::lock_guard<std::mutex> lk(StripeFor(slot));
        TraceRecord& rec = slots_[slot];
        rec.sequence = seq;
        rec.offset = offset;
        rec.frame = frame;
    }
    total_.store(seq, std::memory_order_release);
    return seq;
}

std::vector<TraceRecord> TraceBuffer::Snapshot() const {
    const uint64_t end = total_.load(std::memory_order_acquire);
    const uint64_t begin = end > capacity_ ? end - capacity_ : 0;

    std::vector<TraceRecord> out;
    out.reserve(static_cast<std::size_t>(end - begin));

    uint64_t i = begin;
    while (i < end) {
        const std::size_t slot = static_cast<std::size_t>(i % capacity_);
        const std::size_t stripe_end = std::min(capacity_, (slot / kStripeSize + 1) * kStripeSize);
        const uint64_t count = std::min<uint64_t>(stripe_end - slot, end - i);

        std::lock_guard<std::mutex> lk(StripeFor(slot));
        for (uint64_t k = 0; k < count; ++k) {
            const TraceRecord& rec = slots_[slot + static_cast<std::size_t>(k)];
            if (rec.sequence == i + k + 1) {
                out.push_back(rec);
            } else {
                // overwritten while we were copying: everything collected so
                // far is older than a record we can no longer see
                out.clear();
            }
        }
        i += count;
    }
    return out;
}

TraceLog TraceBuffer::SnapshotLog() const {
    TraceLog log;
    log.start_time = StartTime();
    log.records = Snapshot();
    return log;
}

core::Result<void> TraceBuffer::Clear() {
    if (HasWriter()) {
        CANTRACE_LOGWARN(BufferLog(), "clear rejected, writer '{}' active", WriterOwner());
        return core::ErrorCode(core::Errc::kStateError,
                               "trace buffer cleared while writer '" + WriterOwner() + "' is active");
    }
    const std::size_t stripes = (capacity_ + kStripeSize - 1) / kStripeSize;
    for (std::size_t s = 0; s < stripes; ++s) {
        std::lock_guard<std::mutex> lk(stripes_[s]);
        const std::size_t last = std::min(capacity_, (s + 1) * kStripeSize);
        for (std::size_t slot = s * kStripeSize; slot < last; ++slot) {
            slots_[slot] = TraceRecord{};
        }
    }
    total_.store(0, std::memory_order_release);
    has_origin_ = false;
    origin_ = std::chrono::nanoseconds{0};
    last_offset_ = std::chrono::nanoseconds{0};
    has_start_.store(false, std::memory_order_release);
    CANTRACE_LOGDEBUG(BufferLog(), "cleared ({} slots)", capacity_);
    return {};
}

core::Result<void> TraceBuffer::AcquireWriter(std::string_view owner) {
    bool expected = false;
    if (!writer_held_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        const std::string current = WriterOwner();
        CANTRACE_LOGWARN(BufferLog(), "'{}' cannot write, '{}' is the active writer", owner, current);
        return core::ErrorCode(core::Errc::kStateError, "active writer is '" + current + "'");
    }
    std::lock_guard<std::mutex> lk(owner_mu_);
    writer_owner_ = std::string(owner);
    return {};
}

void TraceBuffer::ReleaseWriter() {
    {
        std::lock_guard<std::mutex> lk(owner_mu_);
        writer_owner_.clear();
    }
    writer_held_.store(false, std::memory_order_release);
}

std::string TraceBuffer::WriterOwner() const {
    std::lock_guard<std::mutex> lk(owner_mu_);
    return writer_owner_;
}

std::size_t TraceBuffer::Size() const noexcept {
    return static_cast<std::size_t>(std::min<uint64_t>(TotalWritten(), capacity_));
}

std::optional<core::WallClock> TraceBuffer::StartTime() const {
    if (!has_start_.load(std::memory_order_acquire)) return std::nullopt;
    return core::WallClock(std::chrono::duration_cast<core::WallClock::duration>(
        std::chrono::nanoseconds(start_wall_ns_.load(std::memory_order_relaxed))));
}

} // namespace cantrace::trace
