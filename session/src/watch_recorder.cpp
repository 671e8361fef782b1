#include <session/watch_recorder.hpp>
#include <cstdio>
#include <system_error>
#include <log.hpp>

namespace fs = std::filesystem;

namespace cantrace::session {

namespace {

log::Logger& WatchLog() {
    static log::Logger lg = log::Logger::CreateLogger("WTCH", "Watched id recorder");
    return lg;
}

std::string IdName(uint32_t id) {
    char buf[24];
    std::snprintf(buf, sizeof(buf), "watch-0x%X", id);
    return buf;
}

core::Result<void> CheckId(uint32_t id) {
    if (id > core::kMaxExtendedId) {
        return core::ErrorCode(core::Errc::kInvalidArgument, "identifier out of range: " + std::to_string(id));
    }
    return {};
}

} // namespace

WatchRecorder::WatchRecorder(dispatch::MessageDispatcher& dispatcher, fs::path folder,
                             uint64_t max_file_size)
    : dispatcher_(dispatcher), max_file_size_(max_file_size), folder_(std::move(folder)) {}

WatchRecorder::~WatchRecorder() {
    if (auto r = Stop(); !r) {
        CANTRACE_LOGWARN(WatchLog(), "closing the watch trace failed: {}", r.Error().Describe());
    }
}

core::Result<void> WatchRecorder::SetWatchedIds(const std::set<uint32_t>& ids) {
    for (uint32_t id : ids) {
        if (auto r = CheckId(id); !r) return r;
    }
    std::lock_guard<std::mutex> lk(control_mu_);
    if (recording_) {
        for (uint32_t id : ids_) {
            if (!ids.count(id)) UnwatchLocked(id);
        }
        for (uint32_t id : ids) {
            if (subs_.count(id)) continue;
            if (auto r = WatchLocked(id); !r) {
                ids_.clear();
                for (const auto& sub : subs_) ids_.insert(sub.first);
                return r;
            }
        }
    }
    ids_ = ids;
    CANTRACE_LOGDEBUG(WatchLog(), "watching {} ids", ids_.size());
    return {};
}

core::Result<void> WatchRecorder::AddId(uint32_t id) {
    if (auto r = CheckId(id); !r) return r;
    std::lock_guard<std::mutex> lk(control_mu_);
    if (ids_.count(id)) return {};
    if (recording_) {
        if (auto r = WatchLocked(id); !r) return r;
    }
    ids_.insert(id);
    return {};
}

core::Result<void> WatchRecorder::RemoveId(uint32_t id) {
    std::lock_guard<std::mutex> lk(control_mu_);
    if (!ids_.erase(id)) {
        return core::ErrorCode(core::Errc::kNotFound, "identifier " + std::to_string(id) + " is not watched");
    }
    if (recording_) UnwatchLocked(id);
    return {};
}

std::set<uint32_t> WatchRecorder::WatchedIds() const {
    std::lock_guard<std::mutex> lk(control_mu_);
    return ids_;
}

core::Result<void> WatchRecorder::SetFolder(const fs::path& folder) {
    std::lock_guard<std::mutex> lk(control_mu_);
    if (recording_) return core::ErrorCode(core::Errc::kStateError, "folder change while recording");
    folder_ = folder;
    return {};
}

fs::path WatchRecorder::Folder() const {
    std::lock_guard<std::mutex> lk(control_mu_);
    return folder_;
}

core::Result<void> WatchRecorder::Start() {
    std::lock_guard<std::mutex> lk(control_mu_);
    if (recording_) return core::ErrorCode(core::Errc::kStateError, "already recording");
    if (folder_.empty()) return core::ErrorCode(core::Errc::kInvalidArgument, "no folder for the watch trace");

    std::error_code ec;
    fs::create_directories(folder_, ec);
    if (ec) {
        CANTRACE_LOGERROR(WatchLog(), "cannot create {}: {}", folder_.string(), ec.message());
        return core::ErrorCode(core::Errc::kIoError, "cannot create " + folder_.string() + ": " + ec.message());
    }
    {
        std::lock_guard<std::mutex> fl(file_mu_);
        file_ = std::make_unique<trace::TraceFileWriter>(max_file_size_);
        file_folder_ = folder_;
        origin_ = std::chrono::nanoseconds{0};
        last_offset_ = std::chrono::nanoseconds{0};
        next_sequence_ = 1;
        file_failed_ = false;
    }
    recorded_.store(0, std::memory_order_relaxed);
    recording_ = true;
    for (uint32_t id : ids_) {
        if (auto r = WatchLocked(id); !r) {
            for (const auto& sub : subs_) {
                if (auto u = dispatcher_.Unsubscribe(sub.second); !u) {
                    CANTRACE_LOGWARN(WatchLog(), "{}", u.Error().Describe());
                }
            }
            subs_.clear();
            recording_ = false;
            std::lock_guard<std::mutex> fl(file_mu_);
            file_.reset();
            return r;
        }
    }
    CANTRACE_LOGINFO(WatchLog(), "recording {} watched ids into {}", ids_.size(), folder_.string());
    return {};
}

core::Result<void> WatchRecorder::Stop() {
    std::lock_guard<std::mutex> lk(control_mu_);
    if (!recording_) return {};
    for (const auto& sub : subs_) {
        if (auto r = dispatcher_.Unsubscribe(sub.second); !r) {
            CANTRACE_LOGWARN(WatchLog(), "{}", r.Error().Describe());
        }
    }
    subs_.clear();
    recording_ = false;

    core::Result<void> res;
    bool was_open = false;
    {
        std::lock_guard<std::mutex> fl(file_mu_);
        if (file_) {
            was_open = file_->IsOpen();
            res = file_->Flush();
            file_->Close();
            file_.reset();
        }
    }
    if (was_open) NotifyFileChanged({});
    CANTRACE_LOGINFO(WatchLog(), "watch recording stopped, {} frames", recorded_.load());
    return res;
}

bool WatchRecorder::IsRecording() const {
    std::lock_guard<std::mutex> lk(control_mu_);
    return recording_;
}

fs::path WatchRecorder::CurrentFile() const {
    std::lock_guard<std::mutex> fl(file_mu_);
    return file_ && file_->IsOpen() ? file_->CurrentPath() : fs::path{};
}

void WatchRecorder::SetFileChangedHandler(FileChangedHandler cb) {
    std::lock_guard<std::mutex> fl(file_mu_);
    on_file_changed_ = std::move(cb);
}

core::Result<void> WatchRecorder::WatchLocked(uint32_t id) {
    dispatch::SubscriptionOptions opt;
    opt.name = IdName(id);
    opt.overflow = dispatch::OverflowPolicy::kUnbounded;
    auto handle = dispatcher_.Subscribe(dispatch::Filter::Exact(id),
                                        [this](const core::Frame& f) { OnFrame(f); }, opt);
    if (!handle) {
        CANTRACE_LOGERROR(WatchLog(), "cannot watch {}: {}", opt.name, handle.Error().Describe());
        return handle.Error();
    }
    subs_[id] = *handle;
    return {};
}

void WatchRecorder::UnwatchLocked(uint32_t id) {
    auto it = subs_.find(id);
    if (it == subs_.end()) return;
    if (auto r = dispatcher_.Unsubscribe(it->second); !r) {
        CANTRACE_LOGWARN(WatchLog(), "{}", r.Error().Describe());
    }
    subs_.erase(it);
}

void WatchRecorder::OnFrame(const core::Frame& frame) {
    if (frame.IsError()) return;
    bool changed = false;
    fs::path file;
    {
        std::lock_guard<std::mutex> fl(file_mu_);
        if (!file_ || file_failed_) return;
        if (!file_->IsOpen()) {
            const auto start = frame.WallTime().value_or(std::chrono::system_clock::now());
            const fs::path path = file_folder_ / ("watch_" + trace::RecordingFileName(start));
            if (auto r = file_->Open(path, start); !r) {
                CANTRACE_LOGERROR(WatchLog(), "watch trace disabled: {}", r.Error().Describe());
                file_failed_ = true;
                return;
            }
            origin_ = frame.Timestamp();
            changed = true;
        }

        // one drain thread per id, so arrival order across ids is not
        // timestamp order
        auto offset = frame.Timestamp() - origin_;
        if (offset < last_offset_) offset = last_offset_;
        last_offset_ = offset;

        const std::size_t index = file_->FileIndex();
        if (auto r = file_->Append(trace::TraceRecord{next_sequence_++, offset, frame}); !r) {
            CANTRACE_LOGERROR(WatchLog(), "watch trace stopped: {}", r.Error().Describe());
            file_->Close();
            file_failed_ = true;
            changed = true;
        } else {
            recorded_.fetch_add(1, std::memory_order_relaxed);
            if (file_->FileIndex() != index) changed = true;
            file = file_->CurrentPath();
        }
    }
    if (changed) NotifyFileChanged(file);
}

void WatchRecorder::NotifyFileChanged(const fs::path& file) {
    FileChangedHandler cb;
    {
        std::lock_guard<std::mutex> fl(file_mu_);
        cb = on_file_changed_;
    }
    if (cb) cb(file);
}

} // namespace cantrace::session
