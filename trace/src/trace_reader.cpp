#include <trace/trace_reader.hpp>
#include <cctype>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <string>
#include <variant>
#include <vector>
#include <log.hpp>

namespace cantrace::trace {

namespace {

log::Logger& ReaderLog() {
    static log::Logger lg = log::Logger::CreateLogger("TRRD", "Trace reader");
    return lg;
}

constexpr std::string_view kVersionTag = ";$FILEVERSION=";
constexpr std::string_view kStartTag = "Start time:";

std::string_view Trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

std::vector<std::string_view> Tokenize(std::string_view line) {
    std::vector<std::string_view> out;
    std::size_t i = 0;
    while (i < line.size()) {
        while (i < line.size() && std::isspace(static_cast<unsigned char>(line[i]))) ++i;
        const std::size_t b = i;
        while (i < line.size() && !std::isspace(static_cast<unsigned char>(line[i]))) ++i;
        if (i > b) out.push_back(line.substr(b, i - b));
    }
    return out;
}

bool AllDigits(std::string_view s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

std::optional<uint64_t> ParseDec(std::string_view s) {
    if (!AllDigits(s) || s.size() > 19) return std::nullopt;
    uint64_t v = 0;
    for (char c : s) v = v * 10 + static_cast<uint64_t>(c - '0');
    return v;
}

std::optional<uint32_t> ParseHex(std::string_view s, std::size_t max_digits) {
    if (s.empty() || s.size() > max_digits) return std::nullopt;
    uint32_t v = 0;
    for (char c : s) {
        const auto u = static_cast<unsigned char>(c);
        if (!std::isxdigit(u)) return std::nullopt;
        v = (v << 4) | static_cast<uint32_t>(std::isdigit(u) ? u - '0' : std::toupper(u) - 'A' + 10);
    }
    return v;
}

// "12.345" -> ns; 1..9 fractional digits
std::optional<std::chrono::nanoseconds> ParseOffset(std::string_view s) {
    const auto dot = s.find('.');
    if (dot == std::string_view::npos) return std::nullopt;
    const auto whole = ParseDec(s.substr(0, dot));
    const auto frac_text = s.substr(dot + 1);
    if (!whole || frac_text.empty() || frac_text.size() > 9 || !AllDigits(frac_text)) return std::nullopt;
    int64_t frac = 0;
    for (char c : frac_text) frac = frac * 10 + (c - '0');
    for (std::size_t i = frac_text.size(); i < 9; ++i) frac *= 10;
    constexpr uint64_t kMaxWhole = (std::numeric_limits<int64_t>::max() - 999999999LL) / 1000000000LL;
    if (*whole > kMaxWhole) return std::nullopt;
    return std::chrono::nanoseconds(static_cast<int64_t>(*whole) * 1000000000LL + frac);
}

struct LineError {
    std::string message;
};

// [N)] [offset] [type] [id] [dir] [d|e] [len] [bytes... | error token]
std::variant<TraceRecord, LineError> ParseLine(std::string_view line,
                                               const std::optional<core::WallClock>& start) {
    const auto tok = Tokenize(line);
    if (tok.size() < 7) return LineError{"expected at least 7 columns"};

    std::string_view num = tok[0];
    if (num.size() < 2 || num.back() != ')') return LineError{"message number must end with ')'"};
    const auto number = ParseDec(num.substr(0, num.size() - 1));
    if (!number || *number == 0) return LineError{"invalid message number"};

    const auto offset = ParseOffset(tok[1]);
    if (!offset) return LineError{"invalid time offset"};

    core::FrameOptions opt;
    if (tok[2] == "FD") {
        opt.fd = true;
    } else if (tok[2] != "1") {
        return LineError{"unsupported type code '" + std::string(tok[2]) + "'"};
    }

    const auto id = ParseHex(tok[3], 8);
    if (!id || *id > core::kMaxExtendedId) return LineError{"invalid identifier"};
    opt.extended = *id > core::kMaxStandardId;

    if (tok[4] == "Rx") {
        opt.direction = core::Direction::kRx;
    } else if (tok[4] == "Tx") {
        opt.direction = core::Direction::kTx;
    } else {
        return LineError{"direction must be Rx or Tx"};
    }

    const auto len = ParseDec(tok[6]);
    if (!len) return LineError{"invalid data length"};

    opt.timestamp = *offset;
    if (start) {
        const auto shift = std::chrono::duration_cast<core::WallClock::duration>(*offset);
        if (shift > core::WallClock::max() - *start) return LineError{"time offset past the end of the wall clock"};
        opt.wall_time = *start + shift;
    }

    TraceRecord rec;
    rec.sequence = *number;
    rec.offset = *offset;

    if (tok[5] == "e") {
        if (*len != 0 || tok.size() != 8) return LineError{"error line needs length 0 and one error token"};
        const auto kind = core::ErrorKindFromToken(tok[7]);
        if (!kind) return LineError{"unknown error kind '" + std::string(tok[7]) + "'"};
        opt.fd = false;
        auto f = core::Frame::MakeError(*kind, opt);
        if (!f) return LineError{f.Error().message};
        rec.frame = std::move(f.Value());
        return rec;
    }
    if (tok[5] != "d") return LineError{"frame kind must be d or e"};

    if (tok.size() - 7 != *len) {
        return LineError{"data length " + std::to_string(*len) + " but " +
                         std::to_string(tok.size() - 7) + " data bytes"};
    }
    std::vector<uint8_t> data;
    data.reserve(static_cast<std::size_t>(*len));
    for (std::size_t i = 7; i < tok.size(); ++i) {
        if (tok[i].size() != 2) return LineError{"data byte must be 2 hex digits"};
        const auto b = ParseHex(tok[i], 2);
        if (!b) return LineError{"invalid hex data byte"};
        data.push_back(static_cast<uint8_t>(*b));
    }
    auto f = core::Frame::MakeData(*id, data, opt);
    if (!f) return LineError{f.Error().message};
    rec.frame = std::move(f.Value());
    return rec;
}

} // namespace

std::optional<core::WallClock> ParseStartTime(std::string_view text) {
    text = Trim(text);
    std::string s(text);
    std::istringstream iss(s);
    std::tm tm{};
    iss >> std::get_time(&tm, "%m/%d/%Y %H:%M:%S");
    if (iss.fail()) return std::nullopt;

    long millis = 0;
    if (iss.peek() == '.') {
        iss.get();
        std::string frac;
        while (std::isdigit(iss.peek())) frac.push_back(static_cast<char>(iss.get()));
        if (frac.empty() || frac.size() > 3) return std::nullopt;
        while (frac.size() < 3) frac.push_back('0');
        millis = std::stol(frac);
    }
    tm.tm_isdst = -1;
    const std::time_t secs = std::mktime(&tm);
    if (secs == static_cast<std::time_t>(-1)) return std::nullopt;
    return std::chrono::system_clock::from_time_t(secs) + std::chrono::milliseconds(millis);
}

core::Result<TraceLog> ReadTrace(std::istream& in, const ReadOptions& options) {
    TraceLog out;
    std::string raw;
    std::size_t line_no = 0;
    uint64_t last_number = 0;

    auto reject = [&](const std::string& why) -> std::optional<core::ErrorCode> {
        if (options.skip_malformed) {
            ++out.skipped_lines;
            CANTRACE_LOGWARN(ReaderLog(), "line {} skipped: {}", line_no, why);
            return std::nullopt;
        }
        CANTRACE_LOGERROR(ReaderLog(), "line {}: {}", line_no, why);
        return core::ErrorCode(core::Errc::kParseError, why, line_no, raw);
    };

    while (std::getline(in, raw)) {
        ++line_no;
        if (!raw.empty() && raw.back() == '\r') raw.pop_back();
        const std::string_view line = Trim(raw);
        if (line.empty()) continue;

        if (line.front() == ';') {
            if (line.substr(0, kVersionTag.size()) == kVersionTag) {
                const auto version = Trim(line.substr(kVersionTag.size()));
                if (version != "1.1") {
                    CANTRACE_LOGERROR(ReaderLog(), "unsupported file version {}", version);
                    return core::ErrorCode(core::Errc::kParseError,
                                           "unsupported file version " + std::string(version), line_no, raw);
                }
            } else if (const auto pos = line.find(kStartTag); pos != std::string_view::npos && !out.start_time) {
                out.start_time = ParseStartTime(line.substr(pos + kStartTag.size()));
                if (!out.start_time) {
                    CANTRACE_LOGWARN(ReaderLog(), "line {}: unreadable start time ignored", line_no);
                }
            }
            continue;
        }

        auto parsed = ParseLine(line, out.start_time);
        if (auto* err = std::get_if<LineError>(&parsed)) {
            if (auto e = reject(err->message)) return *e;
            continue;
        }
        auto& rec = std::get<TraceRecord>(parsed);
        if (rec.sequence <= last_number) {
            if (auto e = reject("message number " + std::to_string(rec.sequence) +
                                " does not follow " + std::to_string(last_number))) {
                return *e;
            }
            continue;
        }
        last_number = rec.sequence;
        out.records.push_back(std::move(rec));
    }
    if (in.bad()) {
        return core::ErrorCode(core::Errc::kIoError, "read failed after line " + std::to_string(line_no));
    }
    CANTRACE_LOGDEBUG(ReaderLog(), "parsed {} records from {} lines ({} skipped)",
                      out.records.size(), line_no, out.skipped_lines);
    return out;
}

core::Result<TraceLog> ReadTraceFile(const std::filesystem::path& file, const ReadOptions& options) {
    std::error_code ec;
    if (!std::filesystem::exists(file, ec)) {
        return core::ErrorCode(core::Errc::kNotFound, "no such trace: " + file.string());
    }
    std::ifstream in(file, std::ios::binary);
    if (!in) {
        return core::ErrorCode(core::Errc::kIoError, "cannot open " + file.string());
    }
    auto res = ReadTrace(in, options);
    if (res) {
        CANTRACE_LOGINFO(ReaderLog(), "loaded {} records from {}", res->records.size(), file.string());
    }
    return res;
}

} // namespace cantrace::trace
