#pragma once
#include "log.hpp"
#include <cstdio>
#include <ctime>
#include <iostream>
#include <mutex>

namespace cantrace::log {

// Human-readable sink: "12:00:01.250 [INFO] DISP: message"
// WARN and above go to stderr so a redirected stdout stays clean.
struct ConsoleSink : ISink {
  explicit ConsoleSink(bool split_stderr = true) : split_stderr_(split_stderr) {}

  void write(const LogRecord& r) noexcept override {
    const std::time_t secs = static_cast<std::time_t>(r.ts_ns / 1000000000ull);
    const unsigned ms = static_cast<unsigned>((r.ts_ns / 1000000ull) % 1000ull);
    std::tm tm{};
    localtime_r(&secs, &tm);
    char stamp[16];
    std::snprintf(stamp, sizeof(stamp), "%02d:%02d:%02d.%03u", tm.tm_hour, tm.tm_min, tm.tm_sec, ms);

    const bool to_err = split_stderr_ && r.level != LogLevel::kOff && r.level <= LogLevel::kWarn;
    std::scoped_lock lk(mu_);
    auto& os = to_err ? std::cerr : std::cout;
    os << stamp << " [" << ToString(r.level) << "] "
       << r.ctx_id << ": " << r.message << std::endl;
  }

private:
  bool split_stderr_;
  std::mutex mu_;
};

} // namespace cantrace::log
