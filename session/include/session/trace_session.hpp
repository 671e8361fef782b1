#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <cantrace/core/result.hpp>
#include <bus/bus_adapter.hpp>
#include <bus/can_receiver.hpp>
#include <config/options.hpp>
#include <dispatch/message_dispatcher.hpp>
#include <trace/trace_buffer.hpp>
#include <trace/trace_player.hpp>
#include <trace/trace_writer.hpp>

namespace cantrace::session {

enum class Producer : uint8_t { kNone, kLive, kReplay };
enum class RecordingState : uint8_t { kStopped, kRecording, kPaused };

std::string_view ToString(Producer p);
std::string_view ToString(RecordingState s);

// The workbench's trace context: one buffer, one dispatcher, one player and
// at most one active producer (live bus or replay). Everything hangs off an
// instance; nothing is global.
//
// A wildcard capture subscription feeds the buffer while recording (or while
// a replay is captured) and, with a record folder configured, streams the
// captured frames to a rolling trace file.
class TraceSession {
public:
    using ReplayFinishedHandler = std::function<void()>;
    using ReplayErrorHandler = std::function<void(const core::ErrorCode&)>;

    explicit TraceSession(const config::WorkbenchOptions& options = {});
    ~TraceSession();

    TraceSession(const TraceSession&) = delete;
    TraceSession& operator=(const TraceSession&) = delete;

    dispatch::MessageDispatcher& Dispatcher() noexcept { return dispatcher_; }
    const trace::TraceBuffer& Buffer() const noexcept { return buffer_; }
    const config::WorkbenchOptions& Options() const noexcept { return options_; }

    // ---------- recording (trace window Start / Pause / Stop) ----------
    core::Result<void> StartRecording();
    core::Result<void> PauseRecording();
    core::Result<void> StopRecording();
    RecordingState Recording() const;
    // Current streaming file, empty before the first captured frame
    std::filesystem::path RecordingFile() const;

    // ---------- live producer ----------
    // Opens the adapter with the configured bus settings if it is not open yet
    core::Result<void> StartLive(std::shared_ptr<bus::IBusAdapter> adapter);
    void StopLive();

    // ---------- replay producer ----------
    core::Result<void> LoadReplay(trace::TraceLog log);
    core::Result<void> LoadReplayFile(const std::filesystem::path& file);
    core::Result<void> StartReplay(double speed, bool capture);
    core::Result<void> StartReplay(trace::SpeedPreset speed, bool capture);
    core::Result<void> PauseReplay();
    core::Result<void> SeekReplay(std::chrono::nanoseconds offset);
    void StopReplay();
    trace::PlayerState ReplayState() const { return player_.State(); }
    std::size_t ReplayCursor() const { return player_.Cursor(); }

    // Called on the player thread; must not call back into the session
    void SetReplayFinishedHandler(ReplayFinishedHandler cb);
    void SetReplayErrorHandler(ReplayErrorHandler cb);

    Producer ActiveProducer() const;

    // ---------- trace content ----------
    // Waits for the capture queue to drain, then exports a snapshot
    core::Result<void> SaveTrace(const std::filesystem::path& file);
    core::Result<void> ClearTrace();
    trace::TraceLog Snapshot() const { return buffer_.SnapshotLog(); }

    static constexpr std::chrono::milliseconds kDrainTimeout{5000};

private:
    void OnCapture(const core::Frame& frame);
    void StreamToFile(uint64_t sequence, std::chrono::nanoseconds offset, const core::Frame& frame);
    void UpdateCapture();   // state_mu_ held
    void OnReplayEnded(uint64_t generation, const core::ErrorCode* error);
    void EndReplayLocked();           // state_mu_ held
    bool RetireEndedReplayLocked();   // state_mu_ held
    void SettleCapture();
    bool DrainCapture();

    const config::WorkbenchOptions options_;
    trace::TraceBuffer buffer_;
    dispatch::MessageDispatcher dispatcher_;
    trace::TracePlayer player_;
    dispatch::SubscriptionHandle capture_{};

    std::mutex control_mu_;            // serializes the public control operations
    mutable std::mutex state_mu_;      // producer_, recording_, replay_capture_, replay_generation_
    Producer producer_{Producer::kNone};
    RecordingState recording_{RecordingState::kStopped};
    bool replay_capture_{false};
    uint64_t replay_generation_{0};   // bumped whenever a replay starts or ends
    std::atomic<bool> capture_enabled_{false};

    std::shared_ptr<bus::IBusAdapter> adapter_;
    bool opened_adapter_{false};
    std::unique_ptr<bus::CanReceiver> receiver_;

    mutable std::mutex file_mu_;
    std::unique_ptr<trace::TraceFileWriter> file_;
    std::chrono::nanoseconds file_origin_{0};
    bool file_failed_{false};

    std::mutex handler_mu_;
    ReplayFinishedHandler on_replay_finished_{};
    ReplayErrorHandler on_replay_error_{};
};

} // namespace cantrace::session
