#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string_view>
#include <thread>
#include <vector>
#include <cantrace/core/frame.hpp>
#include <cantrace/core/result.hpp>
#include <trace/trace_record.hpp>

namespace cantrace::trace {

enum class PlayerState : uint8_t { kStopped, kPlaying, kPaused };

enum class SpeedPreset : uint8_t { kHalf, kNormal, kDouble, kTen, kMax };

std::string_view ToString(PlayerState s);
std::string_view ToString(SpeedPreset p);

// "0.5x", "1x", "2x", "10x", "Max"
std::optional<SpeedPreset> SpeedFromString(std::string_view s);

// Multiplier for a preset; kMax is +infinity (no inter-frame delay)
double SpeedValue(SpeedPreset p);

// Replays a loaded record sequence on a virtual clock. A record with
// offset o is emitted when (o - anchor_offset) / speed has elapsed since
// the clock was anchored by Play, Seek or resume.
//
// Emission runs on the player's own thread. Stop() and Pause() are
// synchronous: once they return from any other thread the sink is not
// called again until the next Play.
class TracePlayer {
public:
    using FrameSink = std::function<void(const core::Frame&)>;
    using FinishedHandler = std::function<void()>;
    using ErrorHandler = std::function<void(const core::ErrorCode&)>;

    explicit TracePlayer(FrameSink sink);
    ~TracePlayer();

    TracePlayer(const TracePlayer&) = delete;
    TracePlayer& operator=(const TracePlayer&) = delete;

    // Only while stopped
    core::Result<void> Load(std::vector<TraceRecord> records);
    core::Result<void> Load(const TraceLog& log);

    core::Result<void> Play(double speed);
    core::Result<void> Play(SpeedPreset preset);
    core::Result<void> Pause();
    core::Result<void> Seek(std::chrono::nanoseconds target);
    void Stop();

    void SetFinishedHandler(FinishedHandler cb);
    void SetErrorHandler(ErrorHandler cb);

    PlayerState State() const;
    std::size_t Cursor() const;
    std::size_t Size() const;
    double Speed() const;
    // Position on the recorded time axis
    std::chrono::nanoseconds Position() const;
    std::chrono::nanoseconds Duration() const;

private:
    using Clock = std::chrono::steady_clock;

    void Run();
    std::chrono::nanoseconds PositionLocked(Clock::time_point now) const;
    Clock::time_point DueLocked(std::chrono::nanoseconds offset) const;
    void WaitNotEmitting(std::unique_lock<std::mutex>& lk);
    bool OnWorker() const { return std::this_thread::get_id() == worker_.get_id(); }

    const FrameSink sink_;

    mutable std::mutex mu_;
    std::condition_variable cv_;       // wakes the worker
    std::condition_variable idle_cv_;  // emitting_ cleared
    std::vector<TraceRecord> records_;
    PlayerState state_{PlayerState::kStopped};
    std::size_t cursor_{0};
    double speed_{1.0};
    bool max_speed_{false};
    Clock::time_point anchor_real_{};
    std::chrono::nanoseconds anchor_offset_{0};
    std::chrono::nanoseconds paused_position_{0};
    std::chrono::nanoseconds last_emitted_{0};
    uint64_t epoch_{0};        // bumped on every control change
    bool emitting_{false};
    bool needs_reload_{false};
    bool quit_{false};

    FinishedHandler on_finished_{};
    ErrorHandler on_error_{};

    std::thread worker_;
};

} // namespace cantrace::trace
