#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include <cantrace/core/frame.hpp>
#include <cantrace/core/result.hpp>
#include <trace/trace_record.hpp>

namespace cantrace::trace {

// ---------- TRC 1.1 text grammar ----------

// ";$FILEVERSION=1.1", start time comment and the column banner. Without a
// start time the current clock is written.
std::string FormatHeader(std::optional<core::WallClock> start);

// One data/error line including the trailing newline, e.g.
// "      1)      0.000 1  0123 Rx  d 8  01 02 03 04 05 06 07 08\n"
std::string FormatLine(uint64_t number, std::chrono::nanoseconds offset, const core::Frame& frame);

// "MM/DD/YYYY HH:MM:SS.mmm" in local time
std::string FormatStartTime(core::WallClock t);

// Local-time recording file name: "2026-10-19T14-03-07.trc"
std::string RecordingFileName(core::WallClock start);

// Writes header and records, numbering messages from 1. Nothing is written
// for a record before its whole line is formatted.
core::Result<void> WriteTrace(std::ostream& out, const std::vector<TraceRecord>& records,
                              std::optional<core::WallClock> start);
core::Result<void> WriteTrace(std::ostream& out, const TraceLog& log);

// Export to a file through tmp + rename; the destination is untouched on failure
core::Result<void> SaveTrace(const std::filesystem::path& file, const std::vector<TraceRecord>& records,
                             std::optional<core::WallClock> start);
core::Result<void> SaveTrace(const std::filesystem::path& file, const TraceLog& log);

// ---------- Streaming writer used while recording ----------
//
// Appends records as they are captured. Once the current file would grow
// beyond max_file_size the writer continues in "<base>_001.trc",
// "<base>_002.trc", ...; every file has its own header, numbering and
// time origin.
class TraceFileWriter {
public:
    static constexpr uint64_t kDefaultMaxFileSize = 1000ULL * 1000ULL * 1000ULL;

    explicit TraceFileWriter(uint64_t max_file_size = kDefaultMaxFileSize);
    ~TraceFileWriter();

    TraceFileWriter(const TraceFileWriter&) = delete;
    TraceFileWriter& operator=(const TraceFileWriter&) = delete;

    core::Result<void> Open(const std::filesystem::path& file, core::WallClock start);
    // offset is relative to the recording start given to Open
    core::Result<void> Append(const TraceRecord& rec);
    core::Result<void> Flush();
    void Close();

    bool IsOpen() const noexcept { return out_.is_open(); }
    const std::filesystem::path& CurrentPath() const noexcept { return current_; }
    std::size_t FileIndex() const noexcept { return file_index_; }
    uint64_t MessagesInFile() const noexcept { return messages_; }
    uint64_t BytesInFile() const noexcept { return bytes_; }
    uint64_t MaxFileSize() const noexcept { return max_file_size_; }

private:
    core::Result<void> OpenFile(const std::filesystem::path& file, core::WallClock start);
    core::Result<void> Roll(std::chrono::nanoseconds offset);
    std::filesystem::path RolledPath(std::size_t index) const;

    const uint64_t max_file_size_;
    std::ofstream out_;
    std::filesystem::path first_;
    std::filesystem::path current_;
    core::WallClock start_{};
    std::chrono::nanoseconds file_origin_{0};
    std::size_t file_index_{0};
    uint64_t messages_{0};
    uint64_t bytes_{0};
};

} // namespace cantrace::trace
