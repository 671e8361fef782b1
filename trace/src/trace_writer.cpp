#include <trace/trace_writer.hpp>
#include <cinttypes>
#include <cstdio>
#include <ctime>
#include <sstream>
#include <cantrace/core/atomic_file.hpp>
#include <log.hpp>

namespace fs = std::filesystem;

namespace cantrace::trace {

namespace {

log::Logger& WriterLog() {
    static log::Logger lg = log::Logger::CreateLogger("TRWR", "Trace writer");
    return lg;
}

constexpr const char* kRule =
    ";-------------------------------------------------------------------------------\n";

std::tm LocalTm(core::WallClock t, long& millis) {
    using namespace std::chrono;
    const auto ms = duration_cast<milliseconds>(t.time_since_epoch()).count();
    std::time_t secs = static_cast<std::time_t>(ms / 1000);
    millis = static_cast<long>(ms % 1000);
    if (millis < 0) { millis += 1000; --secs; }
    std::tm tm{};
    localtime_r(&secs, &tm);
    return tm;
}

} // namespace

std::string FormatStartTime(core::WallClock t) {
    long ms = 0;
    const std::tm tm = LocalTm(t, ms);
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%02d/%02d/%04d %02d:%02d:%02d.%03ld",
                  tm.tm_mon + 1, tm.tm_mday, tm.tm_year + 1900,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, ms);
    return buf;
}

std::string RecordingFileName(core::WallClock start) {
    long ms = 0;
    const std::tm tm = LocalTm(start, ms);
    char buf[64];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H-%M-%S.trc", &tm);
    return buf;
}

std::string FormatHeader(std::optional<core::WallClock> start) {
    std::string h;
    h += ";$FILEVERSION=1.1\n";
    h += ";   Start time: " + FormatStartTime(start.value_or(std::chrono::system_clock::now())) + "\n";
    h += kRule;
    h += ";   Message Number) Time Offset   Type   ID    Rx/Tx   d]  Data Bytes ...\n";
    h += kRule;
    return h;
}

std::string FormatLine(uint64_t number, std::chrono::nanoseconds offset, const core::Frame& frame) {
    // integer milliseconds, rounded half up
    const int64_t ns = offset.count() < 0 ? 0 : offset.count();
    const uint64_t ms = static_cast<uint64_t>((ns + 500000) / 1000000);
    char off[32];
    std::snprintf(off, sizeof(off), "%" PRIu64 ".%03" PRIu64, ms / 1000, ms % 1000);

    std::string bytes;
    unsigned length = 0;
    if (frame.IsError()) {
        bytes = std::string(core::ToToken(frame.GetErrorKind()));
    } else {
        length = static_cast<unsigned>(frame.Length());
        bytes.reserve(length * 3);
        char hex[4];
        for (std::size_t i = 0; i < frame.Length(); ++i) {
            std::snprintf(hex, sizeof(hex), i == 0 ? "%02X" : " %02X", frame.Data()[i]);
            bytes += hex;
        }
    }

    char line[512];
    int n = std::snprintf(line, sizeof(line), "%7" PRIu64 ")%11s %s  %04X %s  %s %u",
                          number, off, frame.IsFd() ? "FD" : "1",
                          static_cast<unsigned>(frame.Id()),
                          std::string(core::ToString(frame.GetDirection())).c_str(),
                          frame.IsError() ? "e" : "d", length);
    std::string out(line, static_cast<std::size_t>(n > 0 ? n : 0));
    if (!bytes.empty()) {
        out += "  ";
        out += bytes;
    }
    out += '\n';
    return out;
}

core::Result<void> WriteTrace(std::ostream& out, const std::vector<TraceRecord>& records,
                              std::optional<core::WallClock> start) {
    const std::string header = FormatHeader(start);
    out.write(header.data(), static_cast<std::streamsize>(header.size()));
    if (!out) return core::ErrorCode(core::Errc::kIoError, "header write failed");

    uint64_t number = 0;
    for (const auto& rec : records) {
        const std::string line = FormatLine(++number, rec.offset, rec.frame);
        out.write(line.data(), static_cast<std::streamsize>(line.size()));
        if (!out) {
            CANTRACE_LOGERROR(WriterLog(), "write failed at message {}", number);
            return core::ErrorCode(core::Errc::kIoError,
                                   "write failed at message " + std::to_string(number));
        }
    }
    out.flush();
    if (!out) return core::ErrorCode(core::Errc::kIoError, "flush failed");
    return {};
}

core::Result<void> WriteTrace(std::ostream& out, const TraceLog& log) {
    return WriteTrace(out, log.records, log.start_time);
}

core::Result<void> SaveTrace(const fs::path& file, const std::vector<TraceRecord>& records,
                             std::optional<core::WallClock> start) {
    std::ostringstream oss;
    if (auto r = WriteTrace(oss, records, start); !r) return r;
    if (auto r = core::WriteFileAtomic(file, oss.str()); !r) {
        CANTRACE_LOGERROR(WriterLog(), "saving {} failed: {}", file.string(), r.Error().Describe());
        return r;
    }
    CANTRACE_LOGINFO(WriterLog(), "saved {} messages to {}", records.size(), file.string());
    return {};
}

core::Result<void> SaveTrace(const fs::path& file, const TraceLog& log) {
    return SaveTrace(file, log.records, log.start_time);
}

// ---------- TraceFileWriter ----------

TraceFileWriter::TraceFileWriter(uint64_t max_file_size)
    : max_file_size_(max_file_size == 0 ? kDefaultMaxFileSize : max_file_size) {}

TraceFileWriter::~TraceFileWriter() {
    Close();
}

core::Result<void> TraceFileWriter::Open(const fs::path& file, core::WallClock start) {
    if (IsOpen()) {
        return core::ErrorCode(core::Errc::kStateError, "already writing " + current_.string());
    }
    first_ = file;
    start_ = start;
    file_index_ = 0;
    file_origin_ = std::chrono::nanoseconds{0};
    return OpenFile(file, start);
}

core::Result<void> TraceFileWriter::OpenFile(const fs::path& file, core::WallClock start) {
    std::error_code ec;
    if (file.has_parent_path()) fs::create_directories(file.parent_path(), ec);

    out_.open(file, std::ios::binary | std::ios::trunc);
    if (!out_) {
        CANTRACE_LOGERROR(WriterLog(), "cannot open {}", file.string());
        return core::ErrorCode(core::Errc::kIoError, "cannot open " + file.string());
    }
    current_ = file;
    messages_ = 0;
    const std::string header = FormatHeader(start);
    out_.write(header.data(), static_cast<std::streamsize>(header.size()));
    if (!out_) return core::ErrorCode(core::Errc::kIoError, "header write failed: " + file.string());
    bytes_ = header.size();
    CANTRACE_LOGINFO(WriterLog(), "recording to {}", file.string());
    return {};
}

fs::path TraceFileWriter::RolledPath(std::size_t index) const {
    char suffix[16];
    std::snprintf(suffix, sizeof(suffix), "_%03zu", index);
    fs::path p = first_.parent_path() / first_.stem();
    p += suffix;
    p += first_.has_extension() ? first_.extension() : fs::path(".trc");
    return p;
}

core::Result<void> TraceFileWriter::Roll(std::chrono::nanoseconds offset) {
    out_.flush();
    out_.close();
    ++file_index_;
    file_origin_ = offset;
    const auto start = start_ + std::chrono::duration_cast<core::WallClock::duration>(offset);
    CANTRACE_LOGINFO(WriterLog(), "{} reached {} bytes, rolling over", current_.string(), bytes_);
    return OpenFile(RolledPath(file_index_), start);
}

core::Result<void> TraceFileWriter::Append(const TraceRecord& rec) {
    if (!IsOpen()) return core::ErrorCode(core::Errc::kStateError, "trace file not open");

    auto offset = rec.offset - file_origin_;
    std::string line = FormatLine(messages_ + 1, offset, rec.frame);
    if (messages_ > 0 && bytes_ + line.size() > max_file_size_) {
        if (auto r = Roll(rec.offset); !r) return r;
        line = FormatLine(1, std::chrono::nanoseconds{0}, rec.frame);
    }
    out_.write(line.data(), static_cast<std::streamsize>(line.size()));
    if (!out_) {
        CANTRACE_LOGERROR(WriterLog(), "write to {} failed", current_.string());
        return core::ErrorCode(core::Errc::kIoError, "write failed: " + current_.string());
    }
    ++messages_;
    bytes_ += line.size();
    return {};
}

core::Result<void> TraceFileWriter::Flush() {
    if (!IsOpen()) return {};
    out_.flush();
    if (!out_) return core::ErrorCode(core::Errc::kIoError, "flush failed: " + current_.string());
    return {};
}

void TraceFileWriter::Close() {
    if (!IsOpen()) return;
    out_.flush();
    out_.close();
    core::FsyncFile(current_);
    CANTRACE_LOGDEBUG(WriterLog(), "closed {} ({} messages)", current_.string(), messages_);
}

} // namespace cantrace::trace
