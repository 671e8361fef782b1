#include <session/trace_session.hpp>
#include <log.hpp>
#include <trace/trace_reader.hpp>

namespace fs = std::filesystem;

namespace cantrace::session {

namespace {

log::Logger& SessionLog() {
    static log::Logger lg = log::Logger::CreateLogger("SESS", "Trace session");
    return lg;
}

constexpr std::string_view kLiveOwner = "live";
constexpr std::string_view kReplayOwner = "replay";

} // namespace

std::string_view ToString(Producer p) {
    switch (p) {
        case Producer::kNone:   return "none";
        case Producer::kLive:   return "live";
        case Producer::kReplay: return "replay";
    }
    return "none";
}

std::string_view ToString(RecordingState s) {
    switch (s) {
        case RecordingState::kStopped:   return "stopped";
        case RecordingState::kRecording: return "recording";
        case RecordingState::kPaused:    return "paused";
    }
    return "stopped";
}

TraceSession::TraceSession(const config::WorkbenchOptions& options)
    : options_(options),
      buffer_(options.tracer.buffer_size),
      dispatcher_(options.dispatcher.queue_capacity, options.dispatcher.overflow),
      player_([this](const core::Frame& f) { dispatcher_.Dispatch(f); }) {
    dispatch::SubscriptionOptions cap;
    cap.name = "capture";
    cap.queue_capacity = options_.tracer.capture_queue_capacity;
    cap.overflow = options_.tracer.capture_queue;
    auto handle = dispatcher_.Subscribe(dispatch::Filter::All(),
                                        [this](const core::Frame& f) { OnCapture(f); }, cap);
    if (handle) {
        capture_ = *handle;
    } else {
        CANTRACE_LOGERROR(SessionLog(), "capture subscription failed: {}", handle.Error().Describe());
    }
}

TraceSession::~TraceSession() {
    StopLive();
    StopReplay();
    if (auto r = StopRecording(); !r) {
        CANTRACE_LOGWARN(SessionLog(), "stopping the recording failed: {}", r.Error().Describe());
    }
    player_.SetFinishedHandler(nullptr);
    player_.SetErrorHandler(nullptr);
    dispatcher_.Shutdown();
}

// ---------- recording ----------

core::Result<void> TraceSession::StartRecording() {
    std::lock_guard<std::mutex> ctl(control_mu_);
    std::lock_guard<std::mutex> lk(state_mu_);
    if (recording_ == RecordingState::kRecording) {
        return core::ErrorCode(core::Errc::kStateError, "already recording");
    }
    if (recording_ == RecordingState::kStopped && !options_.tracer.record_folder.empty()) {
        std::lock_guard<std::mutex> fl(file_mu_);
        file_ = std::make_unique<trace::TraceFileWriter>(options_.tracer.max_file_size);
        file_failed_ = false;
    }
    CANTRACE_LOGINFO(SessionLog(), "recording {}", recording_ == RecordingState::kPaused ? "resumed" : "started");
    recording_ = RecordingState::kRecording;
    UpdateCapture();
    return {};
}

core::Result<void> TraceSession::PauseRecording() {
    std::lock_guard<std::mutex> ctl(control_mu_);
    std::lock_guard<std::mutex> lk(state_mu_);
    if (recording_ != RecordingState::kRecording) {
        return core::ErrorCode(core::Errc::kStateError,
                               "pause while recording is " + std::string(ToString(recording_)));
    }
    recording_ = RecordingState::kPaused;
    UpdateCapture();
    CANTRACE_LOGINFO(SessionLog(), "recording paused");
    return {};
}

core::Result<void> TraceSession::StopRecording() {
    std::lock_guard<std::mutex> ctl(control_mu_);
    {
        std::lock_guard<std::mutex> lk(state_mu_);
        if (recording_ == RecordingState::kStopped) return {};
        recording_ = RecordingState::kStopped;
        UpdateCapture();
    }
    DrainCapture();
    core::Result<void> res;
    std::lock_guard<std::mutex> fl(file_mu_);
    if (file_) {
        res = file_->Flush();
        file_->Close();
        file_.reset();
    }
    CANTRACE_LOGINFO(SessionLog(), "recording stopped, {} frames in buffer", buffer_.Size());
    return res;
}

RecordingState TraceSession::Recording() const {
    std::lock_guard<std::mutex> lk(state_mu_);
    return recording_;
}

fs::path TraceSession::RecordingFile() const {
    std::lock_guard<std::mutex> fl(file_mu_);
    return file_ ? file_->CurrentPath() : fs::path{};
}

void TraceSession::UpdateCapture() {
    const bool on = producer_ == Producer::kReplay ? replay_capture_
                                                   : recording_ == RecordingState::kRecording;
    capture_enabled_.store(on, std::memory_order_release);
}

void TraceSession::OnCapture(const core::Frame& frame) {
    if (!capture_enabled_.load(std::memory_order_acquire)) return;
    const uint64_t seq = buffer_.Append(frame);
    StreamToFile(seq, buffer_.LastOffset(), frame);
}

void TraceSession::StreamToFile(uint64_t sequence, std::chrono::nanoseconds offset, const core::Frame& frame) {
    std::lock_guard<std::mutex> fl(file_mu_);
    if (!file_ || file_failed_) return;
    if (!file_->IsOpen()) {
        const auto start = frame.WallTime().value_or(std::chrono::system_clock::now());
        const fs::path path = fs::path(options_.tracer.record_folder) / trace::RecordingFileName(start);
        file_origin_ = offset;
        if (auto r = file_->Open(path, start); !r) {
            CANTRACE_LOGERROR(SessionLog(), "streaming disabled: {}", r.Error().Describe());
            file_failed_ = true;
            return;
        }
    }
    trace::TraceRecord rec{sequence, offset - file_origin_, frame};
    if (auto r = file_->Append(rec); !r) {
        CANTRACE_LOGERROR(SessionLog(), "streaming stopped: {}", r.Error().Describe());
        file_->Close();
        file_failed_ = true;
    }
}

bool TraceSession::DrainCapture() {
    if (dispatcher_.WaitUntilIdle(kDrainTimeout)) return true;
    CANTRACE_LOGWARN(SessionLog(), "capture queue still busy after {} ms", kDrainTimeout.count());
    return false;
}

// ---------- live ----------

core::Result<void> TraceSession::StartLive(std::shared_ptr<bus::IBusAdapter> adapter) {
    std::lock_guard<std::mutex> ctl(control_mu_);
    if (!adapter) return core::ErrorCode(core::Errc::kInvalidArgument, "no bus adapter");
    bool retired = false;
    {
        std::lock_guard<std::mutex> lk(state_mu_);
        retired = RetireEndedReplayLocked();
        if (producer_ != Producer::kNone) {
            return core::ErrorCode(core::Errc::kStateError,
                                   std::string(ToString(producer_)) + " producer is active");
        }
    }
    if (retired) SettleCapture();
    if (auto r = buffer_.AcquireWriter(kLiveOwner); !r) return r;

    bool opened = false;
    if (!adapter->IsOpen()) {
        if (auto r = adapter->Open(options_.bus); !r) {
            buffer_.ReleaseWriter();
            CANTRACE_LOGERROR(SessionLog(), "cannot open bus: {}", r.Error().Describe());
            return r;
        }
        opened = true;
    }
    auto receiver = std::make_unique<bus::CanReceiver>(adapter, dispatcher_);
    if (auto r = receiver->Start(); !r) {
        if (opened) adapter->Close();
        buffer_.ReleaseWriter();
        return r;
    }
    adapter_ = std::move(adapter);
    opened_adapter_ = opened;
    receiver_ = std::move(receiver);
    {
        std::lock_guard<std::mutex> lk(state_mu_);
        producer_ = Producer::kLive;
        UpdateCapture();
    }
    CANTRACE_LOGINFO(SessionLog(), "live capture on {}", options_.bus.interface);
    return {};
}

void TraceSession::StopLive() {
    std::lock_guard<std::mutex> ctl(control_mu_);
    {
        std::lock_guard<std::mutex> lk(state_mu_);
        if (producer_ != Producer::kLive) return;
    }
    receiver_->Stop();
    receiver_.reset();
    if (opened_adapter_) adapter_->Close();
    adapter_.reset();
    opened_adapter_ = false;
    DrainCapture();
    {
        std::lock_guard<std::mutex> lk(state_mu_);
        producer_ = Producer::kNone;
        UpdateCapture();
    }
    buffer_.ReleaseWriter();
    CANTRACE_LOGINFO(SessionLog(), "live capture stopped");
}

// ---------- replay ----------

core::Result<void> TraceSession::LoadReplay(trace::TraceLog log) {
    std::lock_guard<std::mutex> ctl(control_mu_);
    bool retired = false;
    {
        std::lock_guard<std::mutex> lk(state_mu_);
        retired = RetireEndedReplayLocked();
        if (producer_ == Producer::kReplay) {
            return core::ErrorCode(core::Errc::kStateError, "replay is active, stop it first");
        }
    }
    if (retired) SettleCapture();
    return player_.Load(std::move(log.records));
}

core::Result<void> TraceSession::LoadReplayFile(const fs::path& file) {
    auto log = trace::ReadTraceFile(file);
    if (!log) return log.Error();
    return LoadReplay(std::move(log.Value()));
}

core::Result<void> TraceSession::StartReplay(trace::SpeedPreset speed, bool capture) {
    return StartReplay(trace::SpeedValue(speed), capture);
}

core::Result<void> TraceSession::StartReplay(double speed, bool capture) {
    std::lock_guard<std::mutex> ctl(control_mu_);
    bool retired = false;
    {
        std::lock_guard<std::mutex> lk(state_mu_);
        if (producer_ == Producer::kLive) {
            return core::ErrorCode(core::Errc::kStateError, "live producer is active");
        }
        // the player only leaves kPaused on a control call, and those are
        // serialized by control_mu_
        if (producer_ == Producer::kReplay && player_.State() == trace::PlayerState::kPlaying) {
            return core::ErrorCode(core::Errc::kStateError, "replay is already playing");
        }
        if (producer_ == Producer::kReplay && player_.State() == trace::PlayerState::kPaused) {
            // resume; capture mode stays as started
            return player_.Play(speed);
        }
        retired = RetireEndedReplayLocked();
    }
    if (retired) SettleCapture();

    if (capture) {
        DrainCapture();
        if (auto r = buffer_.Clear(); !r) return r;
        if (auto r = buffer_.AcquireWriter(kReplayOwner); !r) return r;
    }
    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lk(state_mu_);
        producer_ = Producer::kReplay;
        replay_capture_ = capture;
        generation = ++replay_generation_;
        UpdateCapture();
    }
    player_.SetFinishedHandler([this, generation] { OnReplayEnded(generation, nullptr); });
    player_.SetErrorHandler([this, generation](const core::ErrorCode& e) { OnReplayEnded(generation, &e); });
    if (auto r = player_.Play(speed); !r) {
        std::lock_guard<std::mutex> lk(state_mu_);
        EndReplayLocked();
        UpdateCapture();
        return r;
    }
    CANTRACE_LOGINFO(SessionLog(), "replay started at {}x{}", speed, capture ? ", captured" : "");
    return {};
}

core::Result<void> TraceSession::PauseReplay() {
    std::lock_guard<std::mutex> ctl(control_mu_);
    return player_.Pause();
}

core::Result<void> TraceSession::SeekReplay(std::chrono::nanoseconds offset) {
    std::lock_guard<std::mutex> ctl(control_mu_);
    return player_.Seek(offset);
}

void TraceSession::StopReplay() {
    std::lock_guard<std::mutex> ctl(control_mu_);
    player_.Stop();
    {
        std::lock_guard<std::mutex> lk(state_mu_);
        if (producer_ != Producer::kReplay) return;
        EndReplayLocked();
    }
    SettleCapture();
    CANTRACE_LOGINFO(SessionLog(), "replay stopped");
}

void TraceSession::EndReplayLocked() {
    if (replay_capture_) buffer_.ReleaseWriter();
    producer_ = Producer::kNone;
    replay_capture_ = false;
    ++replay_generation_;
}

// The player is already stopped when it reports the end, so a control call
// can see producer_ == kReplay with nothing playing. Such a replay is over:
// end it here and let its late notification find a newer generation.
bool TraceSession::RetireEndedReplayLocked() {
    if (producer_ != Producer::kReplay || player_.State() != trace::PlayerState::kStopped) return false;
    EndReplayLocked();
    CANTRACE_LOGDEBUG(SessionLog(), "replay ended before its notification, retired");
    return true;
}

// Frames already queued for capture still land in the buffer
void TraceSession::SettleCapture() {
    DrainCapture();
    std::lock_guard<std::mutex> lk(state_mu_);
    UpdateCapture();
}

// Runs on the player thread once the sequence ended or failed
void TraceSession::OnReplayEnded(uint64_t generation, const core::ErrorCode* error) {
    bool ended = false;
    {
        std::lock_guard<std::mutex> lk(state_mu_);
        if (producer_ == Producer::kReplay && generation == replay_generation_) {
            EndReplayLocked();
            ended = true;
        }
    }
    if (ended) SettleCapture();

    ReplayFinishedHandler finished;
    ReplayErrorHandler failed;
    {
        std::lock_guard<std::mutex> hl(handler_mu_);
        finished = on_replay_finished_;
        failed = on_replay_error_;
    }
    if (error) {
        CANTRACE_LOGERROR(SessionLog(), "replay failed: {}", error->Describe());
        if (failed) failed(*error);
    } else {
        CANTRACE_LOGINFO(SessionLog(), "replay finished");
        if (finished) finished();
    }
}

void TraceSession::SetReplayFinishedHandler(ReplayFinishedHandler cb) {
    std::lock_guard<std::mutex> hl(handler_mu_);
    on_replay_finished_ = std::move(cb);
}

void TraceSession::SetReplayErrorHandler(ReplayErrorHandler cb) {
    std::lock_guard<std::mutex> hl(handler_mu_);
    on_replay_error_ = std::move(cb);
}

Producer TraceSession::ActiveProducer() const {
    std::lock_guard<std::mutex> lk(state_mu_);
    return producer_;
}

// ---------- content ----------

core::Result<void> TraceSession::SaveTrace(const fs::path& file) {
    DrainCapture();
    const trace::TraceLog log = buffer_.SnapshotLog();
    if (log.records.empty()) {
        CANTRACE_LOGWARN(SessionLog(), "saving an empty trace to {}", file.string());
    }
    return trace::SaveTrace(file, log);
}

core::Result<void> TraceSession::ClearTrace() {
    std::lock_guard<std::mutex> ctl(control_mu_);
    bool retired = false;
    {
        std::lock_guard<std::mutex> lk(state_mu_);
        retired = RetireEndedReplayLocked();
        if (producer_ != Producer::kNone) {
            return core::ErrorCode(core::Errc::kStateError,
                                   std::string(ToString(producer_)) + " producer is active");
        }
    }
    if (retired) SettleCapture();
    DrainCapture();
    return buffer_.Clear();
}

} // namespace cantrace::session
