#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <vector>
#include <cantrace/core/frame.hpp>

namespace cantrace::trace {

// A captured frame positioned in its recording session
struct TraceRecord {
    uint64_t sequence{0};               // 1-based, gapless within a session
    std::chrono::nanoseconds offset{0}; // from the session start instant
    core::Frame frame{};
};

// A loaded or snapshotted recording
struct TraceLog {
    std::optional<core::WallClock> start_time{};
    std::vector<TraceRecord> records{};
    std::size_t skipped_lines{0};

    std::chrono::nanoseconds Duration() const {
        return records.empty() ? std::chrono::nanoseconds{0} : records.back().offset;
    }
};

} // namespace cantrace::trace
