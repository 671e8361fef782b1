// include/log.hpp
#pragma once
#include <atomic>
#include <cctype>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <memory>
#include <mutex>
#include <chrono>
#include <utility>
#include <sstream>
#include <optional>

namespace cantrace::log {

// ---------- Log levels ----------
enum class LogLevel : uint8_t { kOff, kFatal, kError, kWarn, kInfo, kDebug, kVerbose };

inline constexpr std::string_view ToString(LogLevel lvl) {
  switch (lvl) {
    case LogLevel::kFatal:   return "FATAL";
    case LogLevel::kError:   return "ERROR";
    case LogLevel::kWarn:    return "WARN";
    case LogLevel::kInfo:    return "INFO";
    case LogLevel::kDebug:   return "DEBUG";
    case LogLevel::kVerbose: return "VERBOSE";
    default:                 return "OFF";
  }
}

// Accepts "info", "INFO", "warn", ... as written in the options file
inline std::optional<LogLevel> LevelFromString(std::string_view s) {
  std::string up(s);
  for (auto& c : up) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  if (up == "OFF")     return LogLevel::kOff;
  if (up == "FATAL")   return LogLevel::kFatal;
  if (up == "ERROR")   return LogLevel::kError;
  if (up == "WARN" || up == "WARNING") return LogLevel::kWarn;
  if (up == "INFO")    return LogLevel::kInfo;
  if (up == "DEBUG")   return LogLevel::kDebug;
  if (up == "VERBOSE") return LogLevel::kVerbose;
  return std::nullopt;
}

// ---------- Record & sink ----------
struct LogRecord {
  // DLT-style tags
  std::string ecu_id;   // e.g., "ECU1"
  std::string app_id;   // e.g., "CTRC"
  std::string ctx_id;   // e.g., "DISP"
  std::string ctx_desc;
  LogLevel    level;
  std::string message;
  // wall-clock timestamp in ns since epoch
  uint64_t    ts_ns;
  const char* file = nullptr;
  uint32_t    line = 0;
};

struct ISink {
  virtual ~ISink() = default;
  virtual void write(const LogRecord& rec) noexcept = 0;
};

using SinkPtr = std::shared_ptr<ISink>;
using SinkList = std::vector<SinkPtr>;

// ---------- Manager (global config & sinks) ----------
class LogManager {
public:
  static LogManager& Instance() {
    static LogManager g;
    return g;
  }

  void SetGlobalIds(std::string ecu, std::string app) {
    std::scoped_lock lk(mu_);
    ecu_id_ = std::move(ecu);
    app_id_ = std::move(app);
  }

  // Level for loggers created without an explicit one; they follow changes
  void SetDefaultLevel(LogLevel lvl) noexcept { default_level_.store(lvl, std::memory_order_relaxed); }
  LogLevel DefaultLevel() const noexcept { return default_level_.load(std::memory_order_relaxed); }

  // Sink list is replaced, never edited in place: emitting threads keep
  // whatever list they loaded.
  void AddSink(SinkPtr s) {
    std::scoped_lock lk(mu_);
    auto next = std::make_shared<SinkList>(*std::atomic_load(&sinks_));
    next->push_back(std::move(s));
    std::atomic_store(&sinks_, std::shared_ptr<const SinkList>(std::move(next)));
  }

  void ClearSinks() {
    std::scoped_lock lk(mu_);
    std::atomic_store(&sinks_, std::make_shared<const SinkList>());
  }

  std::shared_ptr<const SinkList> Sinks() const { return std::atomic_load(&sinks_); }

  void Ids(std::string& ecu, std::string& app) const {
    std::scoped_lock lk(mu_);
    ecu = ecu_id_; app = app_id_;
  }

private:
  LogManager() = default;
  mutable std::mutex mu_;
  std::shared_ptr<const SinkList> sinks_{std::make_shared<const SinkList>()};
  std::string ecu_id_{"ECU1"};
  std::string app_id_{"CTRC"};
  std::atomic<LogLevel> default_level_{LogLevel::kInfo};
};

// ---------- Logger (per-context) ----------
class Logger {
public:
  // ctxId is a 4-char DLT context id ("DISP", "PLAY", ...)
  static Logger CreateLogger(std::string ctxId, std::string ctxDesc = "", std::optional<LogLevel> level = std::nullopt) {
    auto& lm = LogManager::Instance();
    std::string ecu, app;
    lm.Ids(ecu, app);
    Logger lg(std::move(ctxId), std::move(ctxDesc), std::move(ecu), std::move(app),
              level.value_or(lm.DefaultLevel()));
    lg.follow_default_.store(!level.has_value(), std::memory_order_relaxed);
    return lg;
  }

  LogLevel Level() const noexcept {
    if (follow_default_.load(std::memory_order_relaxed)) return LogManager::Instance().DefaultLevel();
    return level_.load(std::memory_order_relaxed);
  }
  void SetLevel(LogLevel lvl) noexcept {
    level_.store(lvl, std::memory_order_relaxed);
    follow_default_.store(false, std::memory_order_relaxed);
  }

  Logger(const Logger& o)
      : ctx_id_(o.ctx_id_), ctx_desc_(o.ctx_desc_), ecu_id_(o.ecu_id_), app_id_(o.app_id_),
        level_(o.level_.load(std::memory_order_relaxed)),
        follow_default_(o.follow_default_.load(std::memory_order_relaxed)) {}
  Logger& operator=(const Logger& o) {
    ctx_id_ = o.ctx_id_; ctx_desc_ = o.ctx_desc_; ecu_id_ = o.ecu_id_; app_id_ = o.app_id_;
    level_.store(o.level_.load(std::memory_order_relaxed), std::memory_order_relaxed);
    follow_default_.store(o.follow_default_.load(std::memory_order_relaxed), std::memory_order_relaxed);
    return *this;
  }

  // Basic logging with preformatted message
  void Log(LogLevel lvl, std::string_view msg, const char* file = nullptr, uint32_t line = 0) const {
    if (!ShouldLog(lvl)) return;
    auto sinks = LogManager::Instance().Sinks();
    if (!sinks || sinks->empty()) return;
    LogRecord r;
    r.ecu_id = ecu_id_;
    r.app_id = app_id_;
    r.ctx_id = ctx_id_;
    r.ctx_desc = ctx_desc_;
    r.level  = lvl;
    r.message = std::string(msg);
    r.file = file;
    r.line = line;
    r.ts_ns = NowNs();
    for (const auto& s : *sinks) if (s) s->write(r);
  }

  void Fatal (std::string_view m, const char* f=nullptr, uint32_t l=0) const { Log(LogLevel::kFatal,   m,f,l); }
  void Error (std::string_view m, const char* f=nullptr, uint32_t l=0) const { Log(LogLevel::kError,   m,f,l); }
  void Warn  (std::string_view m, const char* f=nullptr, uint32_t l=0) const { Log(LogLevel::kWarn,    m,f,l); }
  void Info  (std::string_view m, const char* f=nullptr, uint32_t l=0) const { Log(LogLevel::kInfo,    m,f,l); }
  void Debug (std::string_view m, const char* f=nullptr, uint32_t l=0) const { Log(LogLevel::kDebug,   m,f,l); }
  void Verbose(std::string_view m,const char* f=nullptr, uint32_t l=0) const { Log(LogLevel::kVerbose, m,f,l); }

  template <typename... Args>
  void LogF(LogLevel lvl, const char* file, uint32_t line, std::string_view fmt, Args&&... args) const {
    if (!ShouldLog(lvl)) return;
    std::ostringstream oss;
    FormatInto(oss, fmt, std::forward<Args>(args)...);
    Log(lvl, oss.str(), file, line);
  }

  template <typename... Args> void FatalF (const char* f, uint32_t l, std::string_view fmt, Args&&... a) const { LogF(LogLevel::kFatal,   f,l,fmt,std::forward<Args>(a)...); }
  template <typename... Args> void ErrorF (const char* f, uint32_t l, std::string_view fmt, Args&&... a) const { LogF(LogLevel::kError,   f,l,fmt,std::forward<Args>(a)...); }
  template <typename... Args> void WarnF  (const char* f, uint32_t l, std::string_view fmt, Args&&... a) const { LogF(LogLevel::kWarn,    f,l,fmt,std::forward<Args>(a)...); }
  template <typename... Args> void InfoF  (const char* f, uint32_t l, std::string_view fmt, Args&&... a) const { LogF(LogLevel::kInfo,    f,l,fmt,std::forward<Args>(a)...); }
  template <typename... Args> void DebugF (const char* f, uint32_t l, std::string_view fmt, Args&&... a) const { LogF(LogLevel::kDebug,   f,l,fmt,std::forward<Args>(a)...); }
  template <typename... Args> void VerboseF(const char* f, uint32_t l, std::string_view fmt, Args&&... a) const { LogF(LogLevel::kVerbose, f,l,fmt,std::forward<Args>(a)...); }

  const std::string& ContextId() const noexcept { return ctx_id_; }

private:
  Logger(std::string ctx, std::string desc, std::string ecu, std::string app, LogLevel lvl)
      : ctx_id_(std::move(ctx)), ctx_desc_(std::move(desc)), ecu_id_(std::move(ecu)),
        app_id_(std::move(app)), level_(lvl) {}

  static uint64_t NowNs() {
    using namespace std::chrono;
    return duration_cast<nanoseconds>(system_clock::now().time_since_epoch()).count();
  }

  bool ShouldLog(LogLevel lvl) const noexcept {
    const auto cur = Level();
    if (cur == LogLevel::kOff || lvl == LogLevel::kOff) return false;
    // FATAL(1) .. VERBOSE(6): anything <= current level logs
    return static_cast<uint8_t>(lvl) <= static_cast<uint8_t>(cur);
  }

  // "{}" formatter: replaces each "{}" with next arg via operator<<
  static void ReplaceFirstBrace(std::ostringstream& oss, std::string_view& fmt) {
    auto pos = fmt.find("{}");
    if (pos == std::string_view::npos) { oss << fmt; fmt = {}; return; }
    oss << fmt.substr(0, pos);
    fmt.remove_prefix(pos + 2);
  }
  template <typename T, typename... Rest>
  static void FormatInto(std::ostringstream& oss, std::string_view fmt, T&& value, Rest&&... rest) {
    ReplaceFirstBrace(oss, fmt);
    oss << std::forward<T>(value);
    if constexpr (sizeof...(rest) == 0) { oss << fmt; }
    else { FormatInto(oss, fmt, std::forward<Rest>(rest)...); }
  }
  static void FormatInto(std::ostringstream& oss, std::string_view fmt) { oss << fmt; }

  std::string ctx_id_;
  std::string ctx_desc_;
  std::string ecu_id_;
  std::string app_id_;
  std::atomic<LogLevel> level_;
  std::atomic<bool> follow_default_{false};
};

// ---------- Convenience macros to capture file/line ----------
#define CANTRACE_LOGFATAL(lg, fmt, ...)   (lg).FatalF(__FILE__, __LINE__, (fmt), ##__VA_ARGS__)
#define CANTRACE_LOGERROR(lg, fmt, ...)   (lg).ErrorF(__FILE__, __LINE__, (fmt), ##__VA_ARGS__)
#define CANTRACE_LOGWARN(lg,  fmt, ...)   (lg).WarnF (__FILE__, __LINE__, (fmt), ##__VA_ARGS__)
#define CANTRACE_LOGINFO(lg,  fmt, ...)   (lg).InfoF (__FILE__, __LINE__, (fmt), ##__VA_ARGS__)
#define CANTRACE_LOGDEBUG(lg, fmt, ...)   (lg).DebugF(__FILE__, __LINE__, (fmt), ##__VA_ARGS__)
#define CANTRACE_LOGVERBOSE(lg, fmt, ...) (lg).VerboseF(__FILE__, __LINE__, (fmt), ##__VA_ARGS__)

} // namespace cantrace::log
