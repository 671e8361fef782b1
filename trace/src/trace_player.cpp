#include <trace/trace_player.hpp>
#include <algorithm>
#include <cmath>
#include <exception>
#include <limits>
#include <log.hpp>

namespace cantrace::trace {

namespace {

log::Logger& PlayerLog() {
    static log::Logger lg = log::Logger::CreateLogger("PLAY", "Trace player");
    return lg;
}

struct PresetName { SpeedPreset preset; std::string_view name; double value; };

constexpr PresetName kPresets[] = {
    {SpeedPreset::kHalf,   "0.5x", 0.5},
    {SpeedPreset::kNormal, "1x",   1.0},
    {SpeedPreset::kDouble, "2x",   2.0},
    {SpeedPreset::kTen,    "10x",  10.0},
    {SpeedPreset::kMax,    "Max",  std::numeric_limits<double>::infinity()},
};

} // namespace

std::string_view ToString(PlayerState s) {
    switch (s) {
        case PlayerState::kStopped: return "Stopped";
        case PlayerState::kPlaying: return "Playing";
        case PlayerState::kPaused:  return "Paused";
    }
    return "Unknown";
}

std::string_view ToString(SpeedPreset p) {
    for (const auto& e : kPresets) {
        if (e.preset == p) return e.name;
    }
    return "1x";
}

std::optional<SpeedPreset> SpeedFromString(std::string_view s) {
    for (const auto& e : kPresets) {
        if (e.name == s) return e.preset;
    }
    if (s == "max" || s == "MAX") return SpeedPreset::kMax;
    return std::nullopt;
}

double SpeedValue(SpeedPreset p) {
    for (const auto& e : kPresets) {
        if (e.preset == p) return e.value;
    }
    return 1.0;
}

TracePlayer::TracePlayer(FrameSink sink)
    : sink_(std::move(sink)) {
    worker_ = std::thread([this] { Run(); });
}

TracePlayer::~TracePlayer() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        quit_ = true;
        state_ = PlayerState::kStopped;
        ++epoch_;
    }
    cv_.notify_all();
    if (worker_.joinable()) worker_.join();
}

core::Result<void> TracePlayer::Load(std::vector<TraceRecord> records) {
    std::lock_guard<std::mutex> lk(mu_);
    if (state_ != PlayerState::kStopped) {
        return core::ErrorCode(core::Errc::kStateError,
                               "load while " + std::string(ToString(state_)));
    }
    records_ = std::move(records);
    cursor_ = 0;
    last_emitted_ = std::chrono::nanoseconds{0};
    paused_position_ = std::chrono::nanoseconds{0};
    needs_reload_ = false;
    CANTRACE_LOGINFO(PlayerLog(), "loaded {} records", records_.size());
    return {};
}

core::Result<void> TracePlayer::Load(const TraceLog& log) {
    return Load(log.records);
}

core::Result<void> TracePlayer::Play(SpeedPreset preset) {
    return Play(SpeedValue(preset));
}

core::Result<void> TracePlayer::Play(double speed) {
    if (!(speed > 0.0)) {
        return core::ErrorCode(core::Errc::kInvalidArgument, "speed must be positive");
    }
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (state_ == PlayerState::kPlaying) {
            return core::ErrorCode(core::Errc::kStateError, "already playing");
        }
        if (needs_reload_) {
            return core::ErrorCode(core::Errc::kPlaybackError, "playback failed, load the trace again");
        }
        if (records_.empty()) {
            return core::ErrorCode(core::Errc::kStateError, "nothing loaded");
        }
        speed_ = speed;
        max_speed_ = std::isinf(speed);
        if (state_ == PlayerState::kStopped) {
            cursor_ = 0;
            anchor_offset_ = records_.front().offset;
            last_emitted_ = records_.front().offset;
        } else {
            anchor_offset_ = paused_position_;
        }
        anchor_real_ = Clock::now();
        state_ = PlayerState::kPlaying;
        ++epoch_;
        CANTRACE_LOGDEBUG(PlayerLog(), "play at {}x from record {}", speed_, cursor_);
    }
    cv_.notify_all();
    return {};
}

core::Result<void> TracePlayer::Pause() {
    std::unique_lock<std::mutex> lk(mu_);
    if (state_ != PlayerState::kPlaying) {
        return core::ErrorCode(core::Errc::kStateError,
                               "pause while " + std::string(ToString(state_)));
    }
    paused_position_ = PositionLocked(Clock::now());
    state_ = PlayerState::kPaused;
    ++epoch_;
    CANTRACE_LOGDEBUG(PlayerLog(), "paused at record {}", cursor_);
    cv_.notify_all();
    if (!OnWorker()) WaitNotEmitting(lk);
    return {};
}

core::Result<void> TracePlayer::Seek(std::chrono::nanoseconds target) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (state_ == PlayerState::kStopped) {
            return core::ErrorCode(core::Errc::kStateError, "seek while stopped");
        }
        if (target.count() < 0) target = std::chrono::nanoseconds{0};
        auto it = std::lower_bound(records_.begin(), records_.end(), target,
                                   [](const TraceRecord& r, std::chrono::nanoseconds t) { return r.offset < t; });
        cursor_ = static_cast<std::size_t>(it - records_.begin());
        anchor_offset_ = target;
        anchor_real_ = Clock::now();
        paused_position_ = target;
        last_emitted_ = target;
        ++epoch_;
        CANTRACE_LOGDEBUG(PlayerLog(), "seek to {} ns, next record {}", target.count(), cursor_);
    }
    cv_.notify_all();
    return {};
}

void TracePlayer::Stop() {
    std::unique_lock<std::mutex> lk(mu_);
    if (state_ != PlayerState::kStopped) {
        CANTRACE_LOGDEBUG(PlayerLog(), "stopped at record {}", cursor_);
    }
    state_ = PlayerState::kStopped;
    cursor_ = 0;
    paused_position_ = std::chrono::nanoseconds{0};
    ++epoch_;
    cv_.notify_all();
    if (!OnWorker()) WaitNotEmitting(lk);
}

void TracePlayer::WaitNotEmitting(std::unique_lock<std::mutex>& lk) {
    idle_cv_.wait(lk, [this] { return !emitting_; });
}

void TracePlayer::SetFinishedHandler(FinishedHandler cb) {
    std::lock_guard<std::mutex> lk(mu_);
    on_finished_ = std::move(cb);
}

void TracePlayer::SetErrorHandler(ErrorHandler cb) {
    std::lock_guard<std::mutex> lk(mu_);
    on_error_ = std::move(cb);
}

PlayerState TracePlayer::State() const {
    std::lock_guard<std::mutex> lk(mu_);
    return state_;
}

std::size_t TracePlayer::Cursor() const {
    std::lock_guard<std::mutex> lk(mu_);
    return cursor_;
}

std::size_t TracePlayer::Size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return records_.size();
}

double TracePlayer::Speed() const {
    std::lock_guard<std::mutex> lk(mu_);
    return speed_;
}

std::chrono::nanoseconds TracePlayer::Position() const {
    std::lock_guard<std::mutex> lk(mu_);
    return PositionLocked(Clock::now());
}

std::chrono::nanoseconds TracePlayer::Duration() const {
    std::lock_guard<std::mutex> lk(mu_);
    return records_.empty() ? std::chrono::nanoseconds{0} : records_.back().offset;
}

std::chrono::nanoseconds TracePlayer::PositionLocked(Clock::time_point now) const {
    switch (state_) {
        case PlayerState::kStopped: return std::chrono::nanoseconds{0};
        case PlayerState::kPaused:  return paused_position_;
        case PlayerState::kPlaying: break;
    }
    if (max_speed_) return last_emitted_;
    const auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(now - anchor_real_);
    return anchor_offset_ + std::chrono::nanoseconds(static_cast<int64_t>(elapsed.count() * speed_));
}

TracePlayer::Clock::time_point TracePlayer::DueLocked(std::chrono::nanoseconds offset) const {
    const auto delta = offset - anchor_offset_;
    if (max_speed_ || delta.count() <= 0) return anchor_real_;
    return anchor_real_ + std::chrono::nanoseconds(static_cast<int64_t>(delta.count() / speed_));
}

void TracePlayer::Run() {
    std::unique_lock<std::mutex> lk(mu_);
    for (;;) {
        cv_.wait(lk, [this] { return quit_ || state_ == PlayerState::kPlaying; });
        if (quit_) return;

        if (cursor_ >= records_.size()) {
            state_ = PlayerState::kStopped;
            cursor_ = 0;
            ++epoch_;
            CANTRACE_LOGINFO(PlayerLog(), "end of trace, {} records played", records_.size());
            auto finished = on_finished_;
            if (finished) {
                emitting_ = true;
                lk.unlock();
                finished();
                lk.lock();
                emitting_ = false;
                idle_cv_.notify_all();
            }
            continue;
        }

        const TraceRecord& rec = records_[cursor_];
        if (cursor_ > 0 && rec.offset < records_[cursor_ - 1].offset) {
            core::ErrorCode err(core::Errc::kPlaybackError,
                                "record " + std::to_string(rec.sequence) + " goes back in time");
            CANTRACE_LOGERROR(PlayerLog(), "{}, replay stopped", err.message);
            state_ = PlayerState::kStopped;
            cursor_ = 0;
            needs_reload_ = true;
            ++epoch_;
            auto on_error = on_error_;
            if (on_error) {
                emitting_ = true;
                lk.unlock();
                on_error(err);
                lk.lock();
                emitting_ = false;
                idle_cv_.notify_all();
            }
            continue;
        }

        const auto due = DueLocked(rec.offset);
        if (Clock::now() < due) {
            const uint64_t seen = epoch_;
            cv_.wait_until(lk, due, [this, seen] { return quit_ || epoch_ != seen; });
            continue;
        }

        const core::Frame frame = rec.frame.WithTimestamp(core::MonotonicNow(), std::chrono::system_clock::now());
        last_emitted_ = rec.offset;
        ++cursor_;
        emitting_ = true;
        lk.unlock();
        try {
            sink_(frame);
        } catch (const std::exception& e) {
            CANTRACE_LOGERROR(PlayerLog(), "frame sink failed: {}", e.what());
        }
        lk.lock();
        emitting_ = false;
        idle_cv_.notify_all();
    }
}

} // namespace cantrace::trace
