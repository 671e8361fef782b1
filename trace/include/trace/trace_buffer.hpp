#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <cantrace/core/frame.hpp>
#include <cantrace/core/result.hpp>
#include <trace/trace_record.hpp>

namespace cantrace::trace {

// Fixed-capacity circular log of TraceRecords.
//
// One writer appends; any number of readers take snapshots. Slots are
// guarded in stripes of kStripeSize, so the writer only contends with a
// reader that is copying the very stripe it is about to overwrite. A
// record becomes visible to readers once TotalWritten() covers it.
class TraceBuffer {
public:
    static constexpr std::size_t kDefaultCapacity = 100000;
    static constexpr std::size_t kStripeSize = 256;

    explicit TraceBuffer(std::size_t capacity = kDefaultCapacity);

    TraceBuffer(const TraceBuffer&) = delete;
    TraceBuffer& operator=(const TraceBuffer&) = delete;

    // O(1). Returns the record's sequence number. Overwrites the oldest
    // record once Capacity() records are stored.
    uint64_t Append(const core::Frame& frame);

    // Consistent, ordered copy of the retained records: no partial record,
    // no duplicates, no gaps.
    std::vector<TraceRecord> Snapshot() const;
    TraceLog SnapshotLog() const;

    // Resets cursor, counters and session start. Rejected while a writer
    // holds the buffer.
    core::Result<void> Clear();

    // Single-writer discipline: receiver and player capture take turns.
    core::Result<void> AcquireWriter(std::string_view owner);
    void ReleaseWriter();
    bool HasWriter() const noexcept { return writer_held_.load(std::memory_order_acquire); }
    std::string WriterOwner() const;

    std::size_t Capacity() const noexcept { return capacity_; }
    std::size_t Size() const noexcept;
    uint64_t TotalWritten() const noexcept { return total_.load(std::memory_order_acquire); }
    std::optional<core::WallClock> StartTime() const;
    // Offset of the latest Append; writer thread only
    std::chrono::nanoseconds LastOffset() const noexcept { return last_offset_; }

private:
    std::mutex& StripeFor(std::size_t slot) const { return stripes_[slot / kStripeSize]; }

    const std::size_t capacity_;
    std::vector<TraceRecord> slots_;
    std::unique_ptr<std::mutex[]> stripes_;

    std::atomic<uint64_t> total_{0};

    // session clock, touched by the writer only (and by Clear)
    bool has_origin_{false};
    std::chrono::nanoseconds origin_{0};
    std::chrono::nanoseconds last_offset_{0};

    std::atomic<bool> has_start_{false};
    std::atomic<int64_t> start_wall_ns_{0};

    std::atomic<bool> writer_held_{false};
    mutable std::mutex owner_mu_;
    std::string writer_owner_;
};

} // namespace cantrace::trace
