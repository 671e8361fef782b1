#pragma once
#include <filesystem>
#include <istream>
#include <optional>
#include <string_view>
#include <cantrace/core/frame.hpp>
#include <cantrace/core/result.hpp>
#include <trace/trace_record.hpp>

namespace cantrace::trace {

struct ReadOptions {
    // false: the first malformed line fails the whole read
    bool skip_malformed{false};
};

// Parses TRC 1.1 text. Comment lines are skipped except for the file
// version (must be 1.1) and the start time, which becomes the log's
// start_time. Record sequence numbers are the file's message numbers.
core::Result<TraceLog> ReadTrace(std::istream& in, const ReadOptions& options = {});
core::Result<TraceLog> ReadTraceFile(const std::filesystem::path& file, const ReadOptions& options = {});

// "MM/DD/YYYY HH:MM:SS.mmm", local time
std::optional<core::WallClock> ParseStartTime(std::string_view text);

} // namespace cantrace::trace
